#pragma once

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>

namespace util {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Fatal };

inline const char* level_name(LogLevel lvl) noexcept {
    switch (lvl) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Fatal: return "FATAL";
    }
    return "UNKNOWN";
}

inline std::optional<LogLevel> parse_log_level(std::string_view s) noexcept {
    if (s == "trace") return LogLevel::Trace;
    if (s == "debug") return LogLevel::Debug;
    if (s == "info") return LogLevel::Info;
    if (s == "warn") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    if (s == "fatal") return LogLevel::Fatal;
    return std::nullopt;
}

namespace detail {
inline std::mutex& log_mutex() {
    static std::mutex mtx;
    return mtx;
}

inline std::atomic<LogLevel>& min_level() {
    static std::atomic<LogLevel> lvl{LogLevel::Info};
    return lvl;
}

inline void log_impl(LogLevel lvl, const char* component, const char* fmt, va_list args) {
    if (lvl < min_level().load(std::memory_order_relaxed)) {
        return;
    }
    const std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%dT%H:%M:%SZ", &tm);

    std::lock_guard<std::mutex> lock(log_mutex());
    std::fprintf(stderr, "%s %s [%s] ", ts, level_name(lvl), component);
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
}
} // namespace detail

inline void set_log_level(LogLevel lvl) noexcept {
    detail::min_level().store(lvl, std::memory_order_relaxed);
}

inline LogLevel log_level() noexcept {
    return detail::min_level().load(std::memory_order_relaxed);
}

inline void log(LogLevel lvl, const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::log_impl(lvl, component, fmt, args);
    va_end(args);
}

// Lets one line per interval through for a single session and counts the rest, so the
// next admitted line can say how many were held back. `Clock` is SteadyClock or SystemClock;
// a clock that steps backwards reopens the interval.
template <typename Clock>
class LogThrottle {
public:
    using time_point = typename Clock::time_point;

    explicit LogThrottle(std::chrono::milliseconds interval) noexcept : interval_(interval) {}

    bool admit(time_point now) noexcept {
        if (last_ && now >= *last_ && now - *last_ < interval_) {
            ++suppressed_;
            return false;
        }
        last_ = now;
        return true;
    }

    // Lines held back since the last admitted one; resets the count.
    std::uint64_t take_suppressed() noexcept { return std::exchange(suppressed_, 0); }
    std::uint64_t suppressed() const noexcept { return suppressed_; }

private:
    std::chrono::milliseconds interval_;
    std::optional<time_point> last_;
    std::uint64_t suppressed_{0};
};

} // namespace util

#define LOG_SLOW_TRACE(COMP, FMT, ...) ::util::log(::util::LogLevel::Trace, (COMP), (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_DEBUG(COMP, FMT, ...) ::util::log(::util::LogLevel::Debug, (COMP), (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_INFO(COMP, FMT, ...)  ::util::log(::util::LogLevel::Info,  (COMP), (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_WARN(COMP, FMT, ...)  ::util::log(::util::LogLevel::Warn,  (COMP), (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_ERROR(COMP, FMT, ...) ::util::log(::util::LogLevel::Error, (COMP), (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_FATAL(COMP, FMT, ...) ::util::log(::util::LogLevel::Fatal, (COMP), (FMT) __VA_OPT__(, __VA_ARGS__))
