#include "e2e/aeron_test_harness.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

#include <sys/wait.h>
#include <unistd.h>

namespace e2e {

namespace {
using Clock = std::chrono::steady_clock;
}

MediaDriverGuard::MediaDriverGuard(long pid, std::filesystem::path dir) noexcept
    : pid_(pid), aeron_dir_(std::move(dir)) {}

MediaDriverGuard::MediaDriverGuard(MediaDriverGuard&& other) noexcept
    : pid_(other.pid_), aeron_dir_(std::move(other.aeron_dir_)) {
    other.pid_ = -1;
}

MediaDriverGuard& MediaDriverGuard::operator=(MediaDriverGuard&& other) noexcept {
    if (this != &other) {
        stop();
        pid_ = other.pid_;
        aeron_dir_ = std::move(other.aeron_dir_);
        other.pid_ = -1;
    }
    return *this;
}

MediaDriverGuard::~MediaDriverGuard() { stop(); }

bool MediaDriverGuard::valid() const noexcept { return pid_ > 0; }

void MediaDriverGuard::stop() noexcept {
    if (pid_ > 0) {
        kill(static_cast<pid_t>(pid_), SIGTERM);
        int status = 0;
        waitpid(static_cast<pid_t>(pid_), &status, 0);
        pid_ = -1;
    }
    if (!aeron_dir_.empty()) {
        std::error_code ec;
        std::filesystem::remove_all(aeron_dir_, ec);
    }
}

MediaDriverGuard MediaDriverGuard::start(const std::filesystem::path& aeron_dir,
                                         chrono::milliseconds ready_timeout,
                                         std::string& error_out) noexcept {
    error_out.clear();
    pid_t pid = fork();
    if (pid == 0) {
        const std::string dir_arg = "-Daeron.dir=" + aeron_dir.string();
        const char* argv[] = {"aeronmd", dir_arg.c_str(), "-Daeron.socket.soReusePort=true", nullptr};
        execvp("aeronmd", const_cast<char* const*>(argv));
        std::cerr << "Failed to exec aeronmd" << std::endl;
        std::_Exit(127);
    }
    if (pid < 0) {
        error_out = "fork() failed launching aeronmd";
        return MediaDriverGuard{};
    }

    if (!wait_for_driver_ready(aeron_dir, ready_timeout)) {
        error_out = "aeronmd did not create cnc.dat in time";
        MediaDriverGuard guard(pid, aeron_dir);
        guard.stop();
        return MediaDriverGuard{};
    }
    return MediaDriverGuard(pid, aeron_dir);
}

std::filesystem::path make_unique_aeron_dir(const std::string& test_name) {
    const auto now = Clock::now().time_since_epoch().count();
    std::ostringstream oss;
    oss << "aeron-archive-e2e-" << test_name << "-" << now << "-" << static_cast<unsigned long>(::getpid());
    const auto dir = std::filesystem::temp_directory_path() / oss.str();
    std::filesystem::create_directories(dir);
    return dir;
}

bool wait_for_driver_ready(const std::filesystem::path& aeron_dir, chrono::milliseconds timeout) noexcept {
    const auto cnc_path = aeron_dir / "cnc.dat";
    const auto deadline = Clock::now() + timeout;
    while (Clock::now() < deadline) {
        if (std::filesystem::exists(cnc_path)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
    }
    return std::filesystem::exists(cnc_path);
}

std::shared_ptr<aeron::Aeron> connect_client(const std::filesystem::path& aeron_dir, std::string& error_out) noexcept {
    aeron::Context ctx;
    ctx.aeronDir(aeron_dir.string());
    try {
        return aeron::Aeron::connect(ctx);
    } catch (const std::exception& ex) {
        error_out = ex.what();
        return nullptr;
    }
}

bool spin_until(const std::function<bool()>& done,
                const std::function<void()>& step,
                chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    while (!done()) {
        if (Clock::now() >= deadline) {
            return done();
        }
        step();
        std::this_thread::yield();
    }
    return true;
}

} // namespace e2e
