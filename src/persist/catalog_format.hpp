#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>

#include "archive/recording_descriptor.hpp"
#include "util/byte_order.hpp"
#include "util/crc32c.hpp"

namespace persist {

// Catalog file layout (little-endian):
//   header (32 bytes)
//     0   4   magic "ARCT"
//     4   2   version
//     6   2   pad
//     8   4   record_length
//    12  20   reserved
//   records, one per recording id, at header + id * record_length:
//     0   4   payload_length
//     4   1   state
//     5   3   pad
//     8   n   payload
//   ...       zero fill
//   L-4   4   crc32c over bytes [0, L-4)
//
// Payload:
//     0   8   recording_id
//     8   8   join_timestamp
//    16   8   end_timestamp
//    24   8   join_position
//    32   8   end_position
//    40   4   initial_term_id
//    44   4   segment_file_length
//    48   4   term_buffer_length
//    52   4   mtu_length
//    56   4   session_id
//    60   4   stream_id
//    64   ..  stripped_channel, original_channel, source_identity as [u32 len][bytes]

inline constexpr std::uint32_t catalog_magic = 0x54435241u; // "ARCT"
inline constexpr std::uint16_t catalog_version = 1;
inline constexpr std::size_t catalog_header_length = 32;
inline constexpr std::size_t catalog_record_length = 1024;

inline constexpr std::size_t record_prefix_length = 8;
inline constexpr std::size_t record_checksum_length = 4;
inline constexpr std::size_t record_fixed_payload_length = 64;
inline constexpr std::size_t max_record_payload_length =
    catalog_record_length - record_prefix_length - record_checksum_length;

struct CatalogHeader {
    std::uint32_t magic{0};
    std::uint16_t version{0};
    std::uint32_t record_length{0};
};

enum class RecordDecodeStatus {
    Ok,
    Empty,             // never written
    ChecksumMismatch,
    Malformed,         // checksum fine, contents inconsistent
};

inline void encode_catalog_header(std::span<std::byte> out) noexcept {
    std::memset(out.data(), 0, catalog_header_length);
    util::store_le32(catalog_magic, out.data());
    util::store_le16(catalog_version, out.data() + 4);
    util::store_le32(static_cast<std::uint32_t>(catalog_record_length), out.data() + 8);
}

inline bool decode_catalog_header(std::span<const std::byte> in, CatalogHeader& out) noexcept {
    if (in.size() < catalog_header_length) {
        return false;
    }
    out.magic = util::load_le32(in.data());
    out.version = util::load_le16(in.data() + 4);
    out.record_length = util::load_le32(in.data() + 8);
    return out.magic == catalog_magic && out.version == catalog_version &&
           out.record_length == catalog_record_length;
}

inline std::size_t encoded_payload_length(const archive::RecordingDescriptor& d) noexcept {
    return record_fixed_payload_length + 12 + d.stripped_channel.size() + d.original_channel.size() +
           d.source_identity.size();
}

namespace detail {

inline std::byte* put_string(std::byte* p, const std::string& s) noexcept {
    util::store_le32(static_cast<std::uint32_t>(s.size()), p);
    if (!s.empty()) {
        std::memcpy(p + 4, s.data(), s.size());
    }
    return p + 4 + s.size();
}

inline bool get_string(const std::byte*& p, const std::byte* end, std::string& out) {
    if (end - p < 4) {
        return false;
    }
    const std::uint32_t len = util::load_le32(p);
    p += 4;
    if (static_cast<std::size_t>(end - p) < len) {
        return false;
    }
    out.assign(reinterpret_cast<const char*>(p), len);
    p += len;
    return true;
}

} // namespace detail

// Returns false if the descriptor's strings do not fit in one record.
inline bool encode_record(const archive::RecordingDescriptor& d, std::span<std::byte> out) noexcept {
    const std::size_t payload_length = encoded_payload_length(d);
    if (out.size() < catalog_record_length || payload_length > max_record_payload_length) {
        return false;
    }
    std::memset(out.data(), 0, catalog_record_length);
    std::byte* base = out.data();
    util::store_le32(static_cast<std::uint32_t>(payload_length), base);
    base[4] = static_cast<std::byte>(d.state);

    std::byte* p = base + record_prefix_length;
    util::store_i64(d.recording_id, p);
    util::store_i64(d.join_timestamp, p + 8);
    util::store_i64(d.end_timestamp, p + 16);
    util::store_i64(d.join_position, p + 24);
    util::store_i64(d.end_position, p + 32);
    util::store_i32(d.initial_term_id, p + 40);
    util::store_i32(d.segment_file_length, p + 44);
    util::store_i32(d.term_buffer_length, p + 48);
    util::store_i32(d.mtu_length, p + 52);
    util::store_i32(d.session_id, p + 56);
    util::store_i32(d.stream_id, p + 60);
    p += record_fixed_payload_length;
    p = detail::put_string(p, d.stripped_channel);
    p = detail::put_string(p, d.original_channel);
    detail::put_string(p, d.source_identity);

    const std::size_t crc_offset = catalog_record_length - record_checksum_length;
    util::store_le32(util::Crc32c::compute(base, crc_offset), base + crc_offset);
    return true;
}

inline RecordDecodeStatus decode_record(std::span<const std::byte> in, archive::RecordingDescriptor& out) {
    if (in.size() < catalog_record_length) {
        return RecordDecodeStatus::Malformed;
    }
    const std::byte* base = in.data();
    const std::size_t crc_offset = catalog_record_length - record_checksum_length;
    const std::uint32_t payload_length = util::load_le32(base);
    const std::uint32_t stored_crc = util::load_le32(base + crc_offset);
    if (payload_length == 0 && stored_crc == 0) {
        return RecordDecodeStatus::Empty;
    }
    if (util::Crc32c::compute(base, crc_offset) != stored_crc) {
        return RecordDecodeStatus::ChecksumMismatch;
    }
    if (payload_length < record_fixed_payload_length || payload_length > max_record_payload_length) {
        return RecordDecodeStatus::Malformed;
    }
    const auto state = static_cast<std::uint8_t>(base[4]);
    if (state < static_cast<std::uint8_t>(archive::RecordingState::Provisional) ||
        state > static_cast<std::uint8_t>(archive::RecordingState::Closed)) {
        return RecordDecodeStatus::Malformed;
    }

    const std::byte* p = base + record_prefix_length;
    const std::byte* end = p + payload_length;
    archive::RecordingDescriptor d;
    d.state = static_cast<archive::RecordingState>(state);
    d.recording_id = util::load_i64(p);
    d.join_timestamp = util::load_i64(p + 8);
    d.end_timestamp = util::load_i64(p + 16);
    d.join_position = util::load_i64(p + 24);
    d.end_position = util::load_i64(p + 32);
    d.initial_term_id = util::load_i32(p + 40);
    d.segment_file_length = util::load_i32(p + 44);
    d.term_buffer_length = util::load_i32(p + 48);
    d.mtu_length = util::load_i32(p + 52);
    d.session_id = util::load_i32(p + 56);
    d.stream_id = util::load_i32(p + 60);
    p += record_fixed_payload_length;
    if (!detail::get_string(p, end, d.stripped_channel) ||
        !detail::get_string(p, end, d.original_channel) ||
        !detail::get_string(p, end, d.source_identity) || p != end) {
        return RecordDecodeStatus::Malformed;
    }
    out = std::move(d);
    return RecordDecodeStatus::Ok;
}

} // namespace persist
