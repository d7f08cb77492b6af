#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include "archive/archive_error.hpp"
#include "archive/recording_descriptor.hpp"
#include "persist/segment_store.hpp"
#include "transport/transport_view.hpp"
#include "util/clock.hpp"
#include "util/log.hpp"

namespace archive {

enum class RecordingSessionState {
    Init,
    Recording,
    Stopping,
    Stopped,
};

const char* recording_state_name(RecordingSessionState s) noexcept;

// Drains one live image into segment files. The conductor allocates the recording id and
// hands over a PROVISIONAL descriptor; the session proposes ACTIVE after the first durable
// write and CLOSED when it stops. The conductor persists both.
class RecordingSession {
public:
    RecordingSession(RecordingDescriptor descriptor,
                     std::shared_ptr<transport::ImageView> image,
                     persist::SegmentStore& store,
                     std::int32_t block_length,
                     const util::SystemClock& clock);
    ~RecordingSession();

    RecordingSession(const RecordingSession&) = delete;
    RecordingSession& operator=(const RecordingSession&) = delete;

    // One bounded unit of work. Returns bytes recorded plus state transitions.
    int do_work();

    // Applied on the next do_work(); the session performs one final drain first.
    void request_stop() noexcept { stop_requested_ = true; }

    // The ACTIVE descriptor, once, after the first durable write.
    std::optional<RecordingDescriptor> take_activated();

    RecordingSessionState state() const noexcept { return state_; }
    bool is_done() const noexcept { return state_ == RecordingSessionState::Stopped; }
    std::int64_t recording_id() const noexcept { return descriptor_.recording_id; }
    std::int64_t join_position() const noexcept { return descriptor_.join_position; }
    std::int64_t recorded_position() const noexcept { return frontier_->position; }
    std::int64_t image_correlation_id() const noexcept { return image_correlation_id_; }
    const RecordingDescriptor& descriptor() const noexcept { return descriptor_; }
    FrontierRef frontier() const noexcept { return frontier_; }
    const ArchiveError& error() const noexcept { return error_; }

private:
    int poll_block();
    void on_block(std::span<const std::byte> block, std::int32_t term_offset, std::int32_t term_id);
    bool ensure_segment(std::int64_t position);
    void fail(ArchiveErrorKind kind, std::string message, int error_code = 0);
    void finish();

    RecordingDescriptor descriptor_;
    std::shared_ptr<transport::ImageView> image_;
    persist::SegmentStore& store_;
    std::int32_t block_length_;
    const util::SystemClock& clock_;

    int position_bits_to_shift_;
    std::int64_t image_correlation_id_;
    std::shared_ptr<RecordingFrontier> frontier_;
    std::unique_ptr<persist::SegmentHandle> segment_;
    transport::BlockHandler handler_;

    RecordingSessionState state_{RecordingSessionState::Init};
    ArchiveError error_{};
    util::LogThrottle<util::SystemClock> error_log_;
    bool stop_requested_{false};
    bool activation_pending_{false};
};

} // namespace archive
