#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "archive/archive_error.hpp"
#include "archive/recording_descriptor.hpp"
#include "persist/segment_store.hpp"
#include "transport/transport_view.hpp"
#include "util/clock.hpp"
#include "util/log.hpp"

namespace archive {

// Length meaning "follow the recording until it stops".
inline constexpr std::int64_t null_length = -1;

enum class ReplayState {
    Init,        // registering the outbound publication
    Connecting,  // waiting for a subscriber, bounded by the connect timeout
    Replaying,
    Completed,
    Aborted,
};

const char* replay_state_name(ReplayState s) noexcept;

struct ReplayOptions {
    std::int32_t block_length{64 * 1024};
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds stall_timeout{0};  // 0 = park indefinitely on back-pressure
};

// Outcome of checking a replay request against the catalog, before any session exists.
struct ReplayValidation {
    ArchiveError error{};
    std::int64_t start_position{null_position};
    // Exclusive end, or null_position to follow a live recording until it stops.
    std::int64_t limit_position{null_position};
};

// `frontier` is the live recording's frontier, or null when the recording is not being recorded.
ReplayValidation validate_replay(const std::optional<RecordingDescriptor>& descriptor,
                                 const FrontierRef& frontier,
                                 std::int64_t recording_id,
                                 std::int64_t position,
                                 std::int64_t length);

// Reads a recorded range and republishes it frame by frame on an exclusive publication
// whose term geometry and session id match the recording.
class ReplaySession {
public:
    ReplaySession(std::int64_t replay_id,
                  std::int64_t correlation_id,
                  std::int64_t control_session_id,
                  RecordingDescriptor descriptor,
                  FrontierRef frontier,
                  const ReplayValidation& range,
                  std::string replay_channel,
                  std::int32_t replay_stream_id,
                  transport::AeronClientView& client,
                  persist::SegmentStore& store,
                  ReplayOptions options,
                  const util::SteadyClock& clock);
    ~ReplaySession();

    ReplaySession(const ReplaySession&) = delete;
    ReplaySession& operator=(const ReplaySession&) = delete;

    int do_work();

    // Applied on the next do_work().
    void request_stop() noexcept { stop_requested_ = true; }

    ReplayState state() const noexcept { return state_; }
    bool is_done() const noexcept { return state_ == ReplayState::Completed || state_ == ReplayState::Aborted; }
    std::int64_t replay_id() const noexcept { return replay_id_; }
    std::int64_t correlation_id() const noexcept { return correlation_id_; }
    std::int64_t control_session_id() const noexcept { return control_session_id_; }
    std::int64_t recording_id() const noexcept { return descriptor_.recording_id; }
    std::int64_t replay_position() const noexcept { return replay_position_; }
    // Bytes left to forward; null_length while following a live recording.
    std::int64_t remaining() const noexcept;
    const ArchiveError& error() const noexcept { return error_; }

private:
    int init();
    int await_connection();
    int replay();
    int send_frames(std::int64_t durable_limit);
    std::int64_t durable_limit() const noexcept;
    bool locate_frame_start();
    bool is_valid_frame_length(std::int32_t length, std::int64_t position) const noexcept;
    bool ensure_segment(std::int64_t position);
    bool handle_offer_failure(std::int64_t result);
    void abort(ArchiveErrorKind kind, std::string message, int error_code = 0);
    void close_segment();

    std::int64_t replay_id_;
    std::int64_t correlation_id_;
    std::int64_t control_session_id_;
    RecordingDescriptor descriptor_;
    FrontierRef frontier_;
    std::int64_t replay_position_;
    std::int64_t limit_position_;
    std::string replay_channel_;
    std::int32_t replay_stream_id_;
    transport::AeronClientView& client_;
    persist::SegmentStore& store_;
    ReplayOptions options_;
    const util::SteadyClock& clock_;

    std::int64_t registration_id_{-1};
    std::shared_ptr<transport::ExclusivePublicationView> publication_;
    std::unique_ptr<persist::SegmentHandle> segment_;
    std::vector<std::byte> buffer_;
    util::SteadyClock::time_point connect_deadline_{};
    std::optional<util::SteadyClock::time_point> stalled_since_;
    util::LogThrottle<util::SteadyClock> stall_log_;

    ReplayState state_{ReplayState::Init};
    ArchiveError error_{};
    bool stop_requested_{false};
};

} // namespace archive
