#pragma once

#include <string>

namespace archive {

enum class ArchiveErrorKind {
    None = 0,
    Protocol,            // malformed or unroutable request
    RecordingNotFound,   // unknown recording id
    ReplayRangeInvalid,  // requested range outside recorded bounds
    Storage,             // disk I/O failure while recording or replaying
    DuplicateRecording,  // channel + stream already being recorded
    DownstreamLost,      // replay subscriber gone, closed or stalled past its bound
};

inline const char* error_kind_name(ArchiveErrorKind k) noexcept {
    switch (k) {
    case ArchiveErrorKind::None: return "none";
    case ArchiveErrorKind::Protocol: return "protocol";
    case ArchiveErrorKind::RecordingNotFound: return "recording_not_found";
    case ArchiveErrorKind::ReplayRangeInvalid: return "replay_range_invalid";
    case ArchiveErrorKind::Storage: return "storage";
    case ArchiveErrorKind::DuplicateRecording: return "duplicate_recording";
    case ArchiveErrorKind::DownstreamLost: return "downstream_lost";
    }
    return "unknown";
}

struct ArchiveError {
    ArchiveErrorKind kind{ArchiveErrorKind::None};
    std::string message;
    int error_code{0};

    explicit operator bool() const noexcept { return kind != ArchiveErrorKind::None; }
};

} // namespace archive
