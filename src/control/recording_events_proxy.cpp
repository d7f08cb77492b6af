#include "control/recording_events_proxy.hpp"

#include "archive/position.hpp"
#include "util/log.hpp"

namespace control {

namespace {
constexpr const char* kComponent = "events";
}

void RecordingEventsProxy::started(const RecordingStarted& event) {
    last_progress_[event.recording_id] = event.join_position;
    enqueue(event);
}

void RecordingEventsProxy::stopped(const RecordingStopped& event) {
    const auto it = last_progress_.find(event.recording_id);
    if (it == last_progress_.end() || event.end_position > it->second) {
        // The final position must reach listeners, so it queues ahead of the stop if it cannot go now.
        enqueue(RecordingProgress{event.recording_id, event.join_position, event.end_position});
    }
    last_progress_.erase(event.recording_id);
    enqueue(event);
}

void RecordingEventsProxy::error(const RecordingError& event) {
    enqueue(event);
}

bool RecordingEventsProxy::progress(std::int64_t recording_id, std::int64_t join_position, std::int64_t position) {
    auto it = last_progress_.find(recording_id);
    if (it != last_progress_.end() && position <= it->second) {
        return false;
    }
    if (!publication_ || !queue_.empty()) {
        return false;
    }
    if (!offer(encode_event(RecordingProgress{recording_id, join_position, position}))) {
        return false;
    }
    last_progress_[recording_id] = position;
    return true;
}

int RecordingEventsProxy::do_work() {
    int work = 0;
    while (publication_ && !queue_.empty()) {
        if (!offer(queue_.front())) {
            break;
        }
        queue_.pop_front();
        ++work;
    }
    return work;
}

std::int64_t RecordingEventsProxy::last_progress(std::int64_t recording_id) const noexcept {
    const auto it = last_progress_.find(recording_id);
    return it == last_progress_.end() ? archive::null_position : it->second;
}

void RecordingEventsProxy::enqueue(const RecordingEvent& event) {
    std::vector<std::byte> message = encode_event(event);
    if (publication_ && queue_.empty() && offer(message)) {
        return;
    }
    if (queue_.size() >= queue_limit_) {
        LOG_SLOW_WARN(kComponent, "event queue full, dropping oldest event");
        queue_.pop_front();
    }
    queue_.push_back(std::move(message));
}

bool RecordingEventsProxy::offer(const std::vector<std::byte>& message) {
    const std::int64_t result = publication_->offer(message);
    // Nobody listening is not a failure for a broadcast stream.
    return result >= 0 || result == transport::not_connected;
}

} // namespace control
