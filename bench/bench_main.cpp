#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>

#include "control/control_codec.hpp"
#include "persist/segment_store.hpp"

namespace {

using Clock = std::chrono::steady_clock;

long long elapsed_ns(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count();
}

int bench_segments() {
    const auto dir = std::filesystem::temp_directory_path() / "stream_archiver_bench";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    constexpr std::int32_t term_length = 1024 * 1024;
    constexpr std::int32_t segment_length = 16 * term_length;
    constexpr std::size_t block = 64 * 1024;
    constexpr int segments = 16;
    persist::SegmentStore store(dir, {});
    const persist::SegmentGeometry geometry{segment_length, term_length};
    std::vector<std::byte> bytes(block, std::byte{0x5A});

    auto start = Clock::now();
    for (int s = 0; s < segments; ++s) {
        std::unique_ptr<persist::SegmentHandle> handle;
        if (!store.open(0, s, geometry, handle).ok()) {
            std::cerr << "segment open failed\n";
            return 1;
        }
        for (std::int64_t offset = 0; offset < segment_length; offset += block) {
            if (!store.write(*handle, offset, bytes).ok()) {
                std::cerr << "segment write failed\n";
                return 1;
            }
        }
        if (!store.close(*handle).ok()) {
            std::cerr << "segment close failed\n";
            return 1;
        }
    }
    const auto write_ns = elapsed_ns(start);

    start = Clock::now();
    for (int s = 0; s < segments; ++s) {
        std::unique_ptr<persist::SegmentHandle> handle;
        if (!store.open_for_read(0, s, geometry, handle).ok()) {
            std::cerr << "segment open for read failed\n";
            return 1;
        }
        for (std::int64_t offset = 0; offset < segment_length; offset += block) {
            if (!store.read(*handle, offset, bytes).ok()) {
                std::cerr << "segment read failed\n";
                return 1;
            }
        }
        if (!store.close(*handle).ok()) {
            std::cerr << "segment close failed\n";
            return 1;
        }
    }
    const auto read_ns = elapsed_ns(start);

    const double mib = static_cast<double>(segments) * segment_length / (1024.0 * 1024.0);
    std::cout << "Segment write " << mib << " MiB in " << write_ns << " ns (" << mib / (write_ns / 1e9)
              << " MiB/s)\n";
    std::cout << "Segment read  " << mib << " MiB in " << read_ns << " ns (" << mib / (read_ns / 1e9)
              << " MiB/s)\n";
    std::filesystem::remove_all(dir);
    return 0;
}

void bench_codec() {
    const control::ReplayRequest request{42, 7, 4096, -1, 2002, "aeron:udp?endpoint=localhost:9000"};
    control::ControlRequest decoded;
    constexpr std::size_t iterations = 100000;
    auto start = Clock::now();
    for (std::size_t i = 0; i < iterations; ++i) {
        const auto bytes = control::encode_request(request);
        if (control::decode_request(bytes, decoded) != control::DecodeStatus::Ok) {
            std::cerr << "decode failed\n";
            return;
        }
    }
    const auto ns = elapsed_ns(start);
    std::cout << "Control codec " << iterations << " round trips took " << ns << " ns (" << (ns / iterations)
              << " ns/iter)\n";
}

} // namespace

int main() {
    bench_codec();
    return bench_segments();
}
