#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <unordered_map>
#include <vector>

#include "control/control_codec.hpp"
#include "transport/transport_view.hpp"

namespace control {

// Publishes the unacknowledged recording events stream. Progress is coalesced per
// recording: only the last position that was actually offered is remembered, so a retry
// never sends a smaller value. Started/stopped/error events are queued and retried in order.
class RecordingEventsProxy {
public:
    explicit RecordingEventsProxy(std::size_t queue_limit = 1024) : queue_limit_(queue_limit) {}

    void set_publication(std::shared_ptr<transport::PublicationView> publication) {
        publication_ = std::move(publication);
    }
    bool has_publication() const noexcept { return publication_ != nullptr; }

    void started(const RecordingStarted& event);
    void stopped(const RecordingStopped& event);
    void error(const RecordingError& event);

    // Offers progress only when `position` is beyond the last value offered for the
    // recording. Returns true if an event went out.
    bool progress(std::int64_t recording_id, std::int64_t join_position, std::int64_t position);

    // Flushes queued lifecycle events; progress for a recording is dropped once it stopped.
    int do_work();

    std::int64_t last_progress(std::int64_t recording_id) const noexcept;
    std::size_t queued() const noexcept { return queue_.size(); }

private:
    void enqueue(const RecordingEvent& event);
    bool offer(const std::vector<std::byte>& message);

    std::size_t queue_limit_;
    std::shared_ptr<transport::PublicationView> publication_;
    std::deque<std::vector<std::byte>> queue_;
    std::unordered_map<std::int64_t, std::int64_t> last_progress_;
};

} // namespace control
