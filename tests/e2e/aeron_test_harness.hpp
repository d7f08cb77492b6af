#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include <Aeron.h>

namespace e2e {

namespace chrono = std::chrono;

// RAII guard for an external Aeron media driver process.
class MediaDriverGuard {
public:
    MediaDriverGuard() = default;
    MediaDriverGuard(const MediaDriverGuard&) = delete;
    MediaDriverGuard& operator=(const MediaDriverGuard&) = delete;
    MediaDriverGuard(MediaDriverGuard&& other) noexcept;
    MediaDriverGuard& operator=(MediaDriverGuard&& other) noexcept;
    ~MediaDriverGuard();

    bool valid() const noexcept;
    void stop() noexcept;

    static MediaDriverGuard start(const std::filesystem::path& aeron_dir,
                                  chrono::milliseconds ready_timeout,
                                  std::string& error_out) noexcept;

private:
    explicit MediaDriverGuard(long pid, std::filesystem::path dir) noexcept;

    long pid_{-1};
    std::filesystem::path aeron_dir_{};
};

// Creates a unique Aeron directory for a single test run.
std::filesystem::path make_unique_aeron_dir(const std::string& test_name);

// Waits for cnc.dat to appear, signalling the media driver is ready.
bool wait_for_driver_ready(const std::filesystem::path& aeron_dir, chrono::milliseconds timeout) noexcept;

// Connects an Aeron client pointed at the provided directory.
std::shared_ptr<aeron::Aeron> connect_client(const std::filesystem::path& aeron_dir, std::string& error_out) noexcept;

// Calls `step` until `done` holds or the timeout passes. Returns the final value of `done`.
bool spin_until(const std::function<bool()>& done,
                const std::function<void()>& step,
                chrono::milliseconds timeout);

} // namespace e2e
