#include "archive/archive_config.hpp"

#include <charconv>

#include "archive/channel.hpp"
#include "archive/position.hpp"

namespace archive {

namespace {

template <typename T>
bool parse_number(std::string_view s, T& out) {
    if (s.empty()) {
        return false;
    }
    auto r = std::from_chars(s.data(), s.data() + s.size(), out);
    return r.ec == std::errc() && r.ptr == s.data() + s.size();
}

bool parse_bool(std::string_view s, bool& out) {
    if (s == "true" || s == "1" || s == "on") {
        out = true;
        return true;
    }
    if (s == "false" || s == "0" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

} // namespace

const char* threading_mode_name(ThreadingMode mode) noexcept {
    switch (mode) {
    case ThreadingMode::Dedicated: return "dedicated";
    case ThreadingMode::Shared: return "shared";
    }
    return "unknown";
}

std::string validate(const ArchiveConfig& config) {
    if (config.archive_dir.empty()) {
        return "archive-dir must not be empty";
    }
    if (!parse_channel(config.control_channel)) {
        return "control-channel is not a valid channel: " + config.control_channel;
    }
    if (!parse_channel(config.recording_events_channel)) {
        return "events-channel is not a valid channel: " + config.recording_events_channel;
    }
    if (!is_power_of_two(config.segment_file_length)) {
        return "segment-file-length must be a positive power of two";
    }
    if (config.file_sync_level == persist::FileSyncLevel::Interval && config.sync_interval_bytes == 0) {
        return "sync-interval-bytes must be positive with interval sync";
    }
    if (config.recording_block_length <= 0 || config.recording_block_length % 32 != 0) {
        return "recording-block-length must be a positive multiple of 32";
    }
    if (config.replay_block_length <= 0 || config.replay_block_length % 32 != 0) {
        return "replay-block-length must be a positive multiple of 32";
    }
    if (config.max_concurrent_recordings == 0 || config.max_concurrent_replays == 0) {
        return "concurrency limits must be positive";
    }
    if (config.control_response_queue_limit == 0) {
        return "control-response-queue-limit must be positive";
    }
    if (config.list_recordings_batch == 0) {
        return "list-recordings-batch must be positive";
    }
    if (config.control_fragment_limit <= 0) {
        return "control-fragment-limit must be positive";
    }
    if (config.control_session_liveness_timeout.count() <= 0) {
        return "control-liveness-timeout-ms must be positive";
    }
    if (config.replay_connect_timeout.count() <= 0) {
        return "replay-connect-timeout-ms must be positive";
    }
    if (config.replay_stall_timeout.count() < 0) {
        return "replay-stall-timeout-ms must not be negative";
    }
    return {};
}

bool apply_option(ArchiveConfig& config, std::string_view key, std::string_view value, std::string& error) {
    bool ok = true;
    if (key == "--archive-dir") {
        config.archive_dir = std::string(value);
    } else if (key == "--control-channel") {
        config.control_channel = std::string(value);
    } else if (key == "--control-stream") {
        ok = parse_number(value, config.control_stream_id);
    } else if (key == "--events-channel") {
        config.recording_events_channel = std::string(value);
    } else if (key == "--events-stream") {
        ok = parse_number(value, config.recording_events_stream_id);
    } else if (key == "--segment-file-length") {
        ok = parse_number(value, config.segment_file_length);
    } else if (key == "--file-sync") {
        if (value == "none") {
            config.file_sync_level = persist::FileSyncLevel::None;
        } else if (value == "every-write") {
            config.file_sync_level = persist::FileSyncLevel::EveryWrite;
        } else if (value == "interval") {
            config.file_sync_level = persist::FileSyncLevel::Interval;
        } else {
            ok = false;
        }
    } else if (key == "--sync-interval-bytes") {
        ok = parse_number(value, config.sync_interval_bytes);
    } else if (key == "--catalog-sync") {
        ok = parse_bool(value, config.catalog_sync);
    } else if (key == "--recording-block-length") {
        ok = parse_number(value, config.recording_block_length);
    } else if (key == "--replay-block-length") {
        ok = parse_number(value, config.replay_block_length);
    } else if (key == "--max-recordings") {
        ok = parse_number(value, config.max_concurrent_recordings);
    } else if (key == "--max-replays") {
        ok = parse_number(value, config.max_concurrent_replays);
    } else if (key == "--control-response-queue-limit") {
        ok = parse_number(value, config.control_response_queue_limit);
    } else if (key == "--list-recordings-batch") {
        ok = parse_number(value, config.list_recordings_batch);
    } else if (key == "--control-liveness-timeout-ms") {
        std::int64_t ms = 0;
        ok = parse_number(value, ms);
        config.control_session_liveness_timeout = std::chrono::milliseconds{ms};
    } else if (key == "--replay-connect-timeout-ms") {
        std::int64_t ms = 0;
        ok = parse_number(value, ms);
        config.replay_connect_timeout = std::chrono::milliseconds{ms};
    } else if (key == "--replay-stall-timeout-ms") {
        std::int64_t ms = 0;
        ok = parse_number(value, ms);
        config.replay_stall_timeout = std::chrono::milliseconds{ms};
    } else if (key == "--threading") {
        if (value == "dedicated") {
            config.threading_mode = ThreadingMode::Dedicated;
        } else if (value == "shared") {
            config.threading_mode = ThreadingMode::Shared;
        } else {
            ok = false;
        }
    } else if (key == "--idle-sleep-us") {
        std::int64_t us = 0;
        ok = parse_number(value, us);
        config.idle_sleep = std::chrono::microseconds{us};
    } else if (key == "--log-level") {
        const auto lvl = util::parse_log_level(value);
        ok = lvl.has_value();
        if (lvl) {
            config.log_level = *lvl;
        }
    } else {
        error = "unknown option " + std::string(key);
        return false;
    }
    if (!ok) {
        error = "bad value for " + std::string(key) + ": " + std::string(value);
    }
    return ok;
}

} // namespace archive
