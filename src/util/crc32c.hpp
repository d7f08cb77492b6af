#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace util {

namespace detail {

// Reflected Castagnoli polynomial.
inline constexpr std::uint32_t crc32c_poly = 0x82F63B78u;

constexpr std::array<std::uint32_t, 256> make_crc32c_table() noexcept {
    std::array<std::uint32_t, 256> t{};
    for (std::uint32_t i = 0; i < 256; ++i) {
        std::uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1u) ? (crc32c_poly ^ (c >> 1)) : (c >> 1);
        }
        t[i] = c;
    }
    return t;
}

inline constexpr std::array<std::uint32_t, 256> crc32c_table = make_crc32c_table();

} // namespace detail

// Table-driven CRC32C. Used to detect torn or corrupt catalog records.
class Crc32c {
public:
    static constexpr std::uint32_t initial = 0xFFFFFFFFu;

    static std::uint32_t update(std::uint32_t crc, const std::byte* data, std::size_t len) noexcept {
        for (std::size_t i = 0; i < len; ++i) {
            crc = (crc >> 8) ^ detail::crc32c_table[(crc ^ static_cast<std::uint8_t>(data[i])) & 0xFFu];
        }
        return crc;
    }

    static constexpr std::uint32_t finalize(std::uint32_t crc) noexcept { return crc ^ 0xFFFFFFFFu; }

    static std::uint32_t compute(const std::byte* data, std::size_t len) noexcept {
        return finalize(update(initial, data, len));
    }
};

} // namespace util
