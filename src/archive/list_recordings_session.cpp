#include "archive/list_recordings_session.hpp"

namespace archive {

namespace {

bool listable(const RecordingDescriptor& d) {
    return d.state == RecordingState::Active || d.state == RecordingState::Closed;
}

} // namespace

ListRecordingsSession::ListRecordingsSession(std::int64_t correlation_id,
                                             std::int64_t from_recording_id,
                                             std::int32_t record_count,
                                             const persist::RecordingCatalog& catalog,
                                             control::ControlSession& control_session,
                                             std::size_t batch)
    : correlation_id_(correlation_id),
      record_count_(record_count),
      catalog_(catalog),
      control_session_(control_session),
      batch_(batch),
      cursor_(catalog.list(listable, from_recording_id)) {}

int ListRecordingsSession::do_work() {
    if (done_) {
        return 0;
    }
    if (control_session_.is_closed()) {
        done_ = true;
        return 1;
    }
    int work = 0;
    for (std::size_t i = 0; i < batch_ && !done_; ++i) {
        if (sent_ >= record_count_) {
            done_ = true;
            break;
        }
        // Leave room so the terminating RecordingNotFound can always be queued.
        if (!control_session_.has_capacity(2)) {
            break;
        }
        RecordingDescriptor descriptor;
        bool queued = false;
        if (cursor_.next(descriptor)) {
            queued = control_session_.send(control::RecordingDescriptorMessage{correlation_id_, std::move(descriptor)});
            ++sent_;
        } else {
            queued = control_session_.send(
                control::RecordingNotFound{correlation_id_, cursor_.next_id(), catalog_.highest_assigned_id()});
            done_ = true;
        }
        if (!queued) {
            done_ = true;
        }
        ++work;
    }
    return work;
}

} // namespace archive
