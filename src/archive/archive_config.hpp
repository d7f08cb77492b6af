#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "persist/segment_store.hpp"
#include "util/log.hpp"

namespace archive {

enum class ThreadingMode {
    Dedicated,  // conductor owns a thread and idles with yield-then-sleep
    Shared,     // caller drives do_work() from its own loop
};

struct ArchiveConfig {
    std::string archive_dir{"./archive"};

    std::string control_channel{"aeron:udp?endpoint=localhost:8010"};
    std::int32_t control_stream_id{10};
    std::string recording_events_channel{"aeron:udp?endpoint=localhost:8011"};
    std::int32_t recording_events_stream_id{11};

    // Rounded up to the term length per recording; must be a power of two.
    std::int32_t segment_file_length{128 * 1024 * 1024};
    persist::FileSyncLevel file_sync_level{persist::FileSyncLevel::None};
    std::uint64_t sync_interval_bytes{16ULL * 1024 * 1024};
    bool catalog_sync{true};

    // Upper bound on bytes moved by one session in one conductor turn.
    std::int32_t recording_block_length{1024 * 1024};
    std::int32_t replay_block_length{64 * 1024};

    std::size_t max_concurrent_recordings{128};
    std::size_t max_concurrent_replays{128};
    std::size_t control_response_queue_limit{1024};
    std::size_t list_recordings_batch{16};
    int control_fragment_limit{10};
    // A control session whose response publication is not connected for this long is closed.
    std::chrono::milliseconds control_session_liveness_timeout{10000};

    std::chrono::milliseconds replay_connect_timeout{5000};
    std::chrono::milliseconds replay_stall_timeout{0};  // 0 = park indefinitely on back-pressure

    ThreadingMode threading_mode{ThreadingMode::Dedicated};
    std::chrono::microseconds idle_sleep{1000};
    util::LogLevel log_level{util::LogLevel::Info};
};

// Empty string when valid, otherwise the first problem found.
[[nodiscard]] std::string validate(const ArchiveConfig& config);

// Applies one `--key value` option. Returns false with `error` set for unknown keys or bad values.
bool apply_option(ArchiveConfig& config, std::string_view key, std::string_view value, std::string& error);

const char* threading_mode_name(ThreadingMode mode) noexcept;

} // namespace archive
