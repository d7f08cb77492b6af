#pragma once

#include <cstddef>
#include <cstdint>

namespace util {

// Little-endian load/store helpers. All persisted and wire formats in the archive are
// little-endian regardless of host byte order.

inline void store_le16(std::uint16_t v, std::byte* out) noexcept {
    out[0] = static_cast<std::byte>(v & 0xFFu);
    out[1] = static_cast<std::byte>((v >> 8) & 0xFFu);
}

inline void store_le32(std::uint32_t v, std::byte* out) noexcept {
    for (int i = 0; i < 4; ++i) {
        out[i] = static_cast<std::byte>((v >> (8 * i)) & 0xFFu);
    }
}

inline void store_le64(std::uint64_t v, std::byte* out) noexcept {
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<std::byte>((v >> (8 * i)) & 0xFFu);
    }
}

inline std::uint16_t load_le16(const std::byte* p) noexcept {
    return static_cast<std::uint16_t>(static_cast<std::uint16_t>(p[0]) |
                                      (static_cast<std::uint16_t>(p[1]) << 8));
}

inline std::uint32_t load_le32(const std::byte* p) noexcept {
    std::uint32_t v = 0;
    for (int i = 3; i >= 0; --i) {
        v = (v << 8) | static_cast<std::uint32_t>(p[i]);
    }
    return v;
}

inline std::uint64_t load_le64(const std::byte* p) noexcept {
    std::uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | static_cast<std::uint64_t>(p[i]);
    }
    return v;
}

inline void store_i32(std::int32_t v, std::byte* out) noexcept { store_le32(static_cast<std::uint32_t>(v), out); }
inline void store_i64(std::int64_t v, std::byte* out) noexcept { store_le64(static_cast<std::uint64_t>(v), out); }
inline std::int32_t load_i32(const std::byte* p) noexcept { return static_cast<std::int32_t>(load_le32(p)); }
inline std::int64_t load_i64(const std::byte* p) noexcept { return static_cast<std::int64_t>(load_le64(p)); }

} // namespace util
