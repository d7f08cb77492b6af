#pragma once

#include <cstddef>
#include <cstdint>

#include <concurrent/logbuffer/DataFrameHeader.h>
#include <concurrent/logbuffer/FrameDescriptor.h>

#include "archive/position.hpp"
#include "util/byte_order.hpp"

namespace archive::frame {

// Accessors over the client's data frame header layout, applied to bytes read back from
// segment files rather than to a mapped term buffer.
namespace hdr = aeron::concurrent::logbuffer::DataFrameHeader;

inline constexpr std::int32_t header_length = hdr::LENGTH;
inline constexpr std::int32_t alignment = aeron::concurrent::logbuffer::FrameDescriptor::FRAME_ALIGNMENT;

inline constexpr std::size_t frame_length_offset = hdr::FRAME_LENGTH_FIELD_OFFSET;
inline constexpr std::size_t version_offset = hdr::VERSION_FIELD_OFFSET;
inline constexpr std::size_t flags_offset = hdr::FLAGS_FIELD_OFFSET;
inline constexpr std::size_t type_offset = hdr::TYPE_FIELD_OFFSET;
inline constexpr std::size_t term_offset_offset = hdr::TERM_OFFSET_FIELD_OFFSET;
inline constexpr std::size_t session_id_offset = hdr::SESSION_ID_FIELD_OFFSET;
inline constexpr std::size_t stream_id_offset = hdr::STREAM_ID_FIELD_OFFSET;
inline constexpr std::size_t term_id_offset = hdr::TERM_ID_FIELD_OFFSET;

inline constexpr std::uint16_t type_pad = hdr::HDR_TYPE_PAD;
inline constexpr std::uint16_t type_data = hdr::HDR_TYPE_DATA;

inline constexpr std::uint8_t current_version = static_cast<std::uint8_t>(hdr::CURRENT_VERSION);
inline constexpr std::uint8_t unfragmented_flags = aeron::concurrent::logbuffer::FrameDescriptor::UNFRAGMENTED;

inline std::int32_t frame_length(const std::byte* frame) noexcept { return util::load_i32(frame + frame_length_offset); }
inline std::uint16_t frame_type(const std::byte* frame) noexcept { return util::load_le16(frame + type_offset); }
inline std::int32_t term_offset(const std::byte* frame) noexcept { return util::load_i32(frame + term_offset_offset); }
inline std::int32_t session_id(const std::byte* frame) noexcept { return util::load_i32(frame + session_id_offset); }
inline std::int32_t stream_id(const std::byte* frame) noexcept { return util::load_i32(frame + stream_id_offset); }
inline std::int32_t term_id(const std::byte* frame) noexcept { return util::load_i32(frame + term_id_offset); }

inline void set_stream_id(std::byte* frame, std::int32_t v) noexcept { util::store_i32(v, frame + stream_id_offset); }
inline void set_session_id(std::byte* frame, std::int32_t v) noexcept { util::store_i32(v, frame + session_id_offset); }

inline bool is_padding(const std::byte* frame) noexcept { return frame_type(frame) == type_pad; }

// Length a frame occupies in the term, including alignment padding. Widened so a corrupt
// length near INT32_MAX cannot wrap negative.
inline std::int64_t aligned_length(std::int32_t frame_length) noexcept {
    return archive::align(frame_length, alignment);
}

} // namespace archive::frame
