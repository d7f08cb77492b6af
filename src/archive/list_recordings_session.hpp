#pragma once

#include <cstddef>
#include <cstdint>

#include "control/control_session.hpp"
#include "persist/recording_catalog.hpp"

namespace archive {

// Streams ACTIVE and CLOSED descriptors for one ListRecordings request, a bounded batch per
// turn. Ends after `record_count` descriptors, or with RecordingNotFound(nextId, maxId) when
// the catalog runs out first.
class ListRecordingsSession {
public:
    ListRecordingsSession(std::int64_t correlation_id,
                          std::int64_t from_recording_id,
                          std::int32_t record_count,
                          const persist::RecordingCatalog& catalog,
                          control::ControlSession& control_session,
                          std::size_t batch);

    int do_work();

    bool is_done() const noexcept { return done_; }
    std::int64_t correlation_id() const noexcept { return correlation_id_; }
    std::int64_t control_session_id() const noexcept { return control_session_.id(); }
    std::int32_t sent() const noexcept { return sent_; }

private:
    std::int64_t correlation_id_;
    std::int32_t record_count_;
    const persist::RecordingCatalog& catalog_;
    control::ControlSession& control_session_;
    std::size_t batch_;
    persist::RecordingCatalog::Cursor cursor_;
    std::int32_t sent_{0};
    bool done_{false};
};

} // namespace archive
