#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <Aeron.h>

#include "archive/archive_config.hpp"
#include "archive/conductor.hpp"
#include "transport/aeron_transport.hpp"
#include "util/clock.hpp"
#include "util/log.hpp"

namespace {

constexpr const char* kComponent = "archiverd";

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true, std::memory_order_release); }

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--option value]...\n"
              << "  --archive-dir DIR                 recordings and catalog (default ./archive)\n"
              << "  --aeron-dir DIR                   media driver directory (default: client default)\n"
              << "  --control-channel URI --control-stream ID\n"
              << "  --events-channel URI --events-stream ID\n"
              << "  --segment-file-length BYTES       power of two\n"
              << "  --file-sync none|every-write|interval  --sync-interval-bytes BYTES\n"
              << "  --catalog-sync true|false\n"
              << "  --recording-block-length BYTES    --replay-block-length BYTES\n"
              << "  --max-recordings N                --max-replays N\n"
              << "  --control-response-queue-limit N  --list-recordings-batch N\n"
              << "  --control-liveness-timeout-ms MS\n"
              << "  --replay-connect-timeout-ms MS    --replay-stall-timeout-ms MS\n"
              << "  --threading dedicated|shared      --idle-sleep-us US\n"
              << "  --log-level trace|debug|info|warn|error|fatal\n";
}

} // namespace

int main(int argc, char** argv) {
    archive::ArchiveConfig config;
    std::string aeron_dir;
    for (int i = 1; i < argc; ++i) {
        const std::string key = argv[i];
        if (key == "--help" || key == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (i + 1 >= argc) {
            std::cerr << "missing value for " << key << std::endl;
            print_usage(argv[0]);
            return 1;
        }
        const std::string value = argv[++i];
        if (key == "--aeron-dir") {
            aeron_dir = value;
            continue;
        }
        std::string error;
        if (!archive::apply_option(config, key, value, error)) {
            std::cerr << error << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }
    if (const std::string problem = archive::validate(config); !problem.empty()) {
        std::cerr << "invalid configuration: " << problem << std::endl;
        return 1;
    }
    util::set_log_level(config.log_level);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::shared_ptr<aeron::Aeron> aeron_client;
    try {
        aeron::Context context;
        if (!aeron_dir.empty()) {
            context.aeronDir(aeron_dir);
        }
        aeron_client = aeron::Aeron::connect(context);
    } catch (const std::exception& e) {
        LOG_SLOW_FATAL(kComponent, "cannot connect to media driver: %s", e.what());
        return 1;
    }

    util::SteadyClock steady_clock;
    util::SystemClock system_clock;
    archive::Conductor conductor(config, transport::make_aeron_client_view(aeron_client), steady_clock,
                                 system_clock);
    if (!conductor.start()) {
        return 1;
    }

    LOG_SLOW_INFO(kComponent, "running in %s mode, SIGINT or SIGTERM to stop",
                  archive::threading_mode_name(config.threading_mode));
    if (config.threading_mode == archive::ThreadingMode::Dedicated) {
        std::thread conductor_thread([&] { conductor.run(g_stop); });
        conductor_thread.join();
    } else {
        while (!g_stop.load(std::memory_order_acquire) && !conductor.is_failed()) {
            if (conductor.do_work() == 0) {
                std::this_thread::sleep_for(config.idle_sleep);
            }
        }
        conductor.close();
    }

    LOG_SLOW_INFO(kComponent, "recordings in catalog: %lld",
                  static_cast<long long>(conductor.catalog().next_recording_id()));
    return conductor.is_failed() ? 2 : 0;
}
