#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "archive/position.hpp"

namespace archive {

enum class RecordingState : std::uint8_t {
    Provisional = 1,
    Active = 2,
    Closed = 3,
};

inline const char* state_name(RecordingState s) noexcept {
    switch (s) {
    case RecordingState::Provisional: return "PROVISIONAL";
    case RecordingState::Active: return "ACTIVE";
    case RecordingState::Closed: return "CLOSED";
    }
    return "UNKNOWN";
}

struct RecordingDescriptor {
    std::int64_t recording_id{null_value};
    std::int64_t join_timestamp{null_timestamp};
    std::int64_t end_timestamp{null_timestamp};
    std::int64_t join_position{0};
    std::int64_t end_position{null_position};
    std::int32_t initial_term_id{0};
    std::int32_t segment_file_length{0};
    std::int32_t term_buffer_length{0};
    std::int32_t mtu_length{0};
    std::int32_t session_id{0};
    std::int32_t stream_id{0};
    std::string stripped_channel;
    std::string original_channel;
    std::string source_identity;
    RecordingState state{RecordingState::Provisional};

    bool is_closed() const noexcept { return state == RecordingState::Closed; }
};

// Durable write frontier of a live recording. Owned by the recording session and shared
// read-only with replays of the same recording. Conductor-thread only.
struct RecordingFrontier {
    std::int64_t position{0};
    bool stopped{false};
};

using FrontierRef = std::shared_ptr<const RecordingFrontier>;

} // namespace archive
