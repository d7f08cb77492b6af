#pragma once

#include <atomic>
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <set>
#include <span>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "archive/archive_config.hpp"
#include "archive/list_recordings_session.hpp"
#include "archive/recording_session.hpp"
#include "archive/replay_session.hpp"
#include "control/control_codec.hpp"
#include "control/control_session.hpp"
#include "control/recording_events_proxy.hpp"
#include "persist/recording_catalog.hpp"
#include "persist/segment_store.hpp"
#include "transport/transport_view.hpp"
#include "util/clock.hpp"

namespace archive {

// Single cooperative loop that owns the catalog, dispatches control requests and gives
// every recording, replay and listing session one bounded unit of work per turn.
class Conductor {
public:
    Conductor(ArchiveConfig config,
              std::shared_ptr<transport::AeronClientView> client,
              const util::SteadyClock& steady_clock,
              const util::SystemClock& system_clock,
              persist::FileFactory file_factory = persist::default_file_factory());
    ~Conductor();

    Conductor(const Conductor&) = delete;
    Conductor& operator=(const Conductor&) = delete;

    // Opens the catalog, closes recordings left open by a crash and registers the control
    // subscription and the recording events publication. False if the catalog is unusable.
    bool start();

    int do_work();

    // Dedicated threading mode: loops do_work() with a yield-then-sleep idle strategy until
    // `stop_flag` is set or the control plane fails, then closes.
    void run(const std::atomic<bool>& stop_flag);

    // Stops every session, persisting final descriptors.
    void close();

    bool is_failed() const noexcept { return failed_; }
    const ArchiveConfig& config() const noexcept { return config_; }
    const persist::RecordingCatalog& catalog() const noexcept { return catalog_; }
    std::size_t recording_count() const noexcept { return recordings_.size(); }
    std::size_t replay_count() const noexcept { return replays_.size(); }
    std::size_t control_session_count() const noexcept { return control_sessions_.size(); }
    const RecordingSession* find_recording(std::int64_t recording_id) const;
    const ReplaySession* find_replay(std::int64_t replay_id) const;

private:
    using RecordingKey = std::pair<std::string, std::int32_t>;

    struct RecordingSubscription {
        std::int64_t registration_id{-1};
        std::shared_ptr<transport::SubscriptionView> subscription;
        std::string channel;
        std::string stripped_channel;
        std::int32_t stream_id{0};
        std::unordered_set<std::int64_t> known_images;
        std::set<std::int64_t> recording_ids;
    };

    int resolve_registrations();
    int poll_control();
    int poll_images();
    int service_control_sessions();
    int service_recordings();
    int service_replays();
    int service_listings();

    void on_fragment(std::span<const std::byte> message, std::int32_t session_id);
    void on_request(std::int32_t session_id, const control::ConnectRequest& request);
    void on_request(control::ControlSession& session, const control::StartRecordingRequest& request);
    void on_request(control::ControlSession& session, const control::StopRecordingRequest& request);
    void on_request(control::ControlSession& session, const control::ReplayRequest& request);
    void on_request(control::ControlSession& session, const control::StopReplayRequest& request);
    void on_request(control::ControlSession& session, const control::ListRecordingsRequest& request);

    void start_recording_session(RecordingSubscription& subscription, std::shared_ptr<transport::ImageView> image);
    void on_recording_stopped(RecordingSession& session);
    void recover_unfinished_recordings();
    void respond(control::ControlSession& session, const control::ControlResponse& response);
    control::ControlSession* find_control_session(std::int64_t control_session_id);
    // The live session a client reaches through its transport session id on the control stream.
    control::ControlSession* find_connected_session(std::int32_t transport_session_id);

    ArchiveConfig config_;
    std::shared_ptr<transport::AeronClientView> client_;
    const util::SteadyClock& steady_clock_;
    const util::SystemClock& system_clock_;
    persist::SegmentStore store_;
    persist::RecordingCatalog catalog_;
    control::RecordingEventsProxy events_;

    std::int64_t control_registration_id_{-1};
    std::shared_ptr<transport::SubscriptionView> control_subscription_;
    std::int64_t events_registration_id_{-1};
    transport::FragmentHandler control_handler_;

    // Keyed by an archive-assigned id so a reused transport session id never reaches an older session's work.
    std::map<std::int64_t, std::unique_ptr<control::ControlSession>> control_sessions_;
    std::map<std::int32_t, std::int64_t> control_session_by_transport_;
    std::int64_t next_control_session_id_{0};
    std::map<RecordingKey, RecordingSubscription> subscriptions_;
    // Stopped subscriptions stay referenced until their sessions have drained.
    std::list<RecordingSubscription> retired_subscriptions_;
    std::map<std::int64_t, std::unique_ptr<RecordingSession>> recordings_;
    std::map<std::int64_t, std::unique_ptr<ReplaySession>> replays_;
    std::list<std::unique_ptr<ListRecordingsSession>> listings_;
    std::int64_t next_replay_id_{0};

    bool started_{false};
    bool closed_{false};
    bool failed_{false};
};

} // namespace archive
