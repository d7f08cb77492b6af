#pragma once

#include <cstdint>

#include <concurrent/logbuffer/LogBufferDescriptor.h>
#include <util/BitUtil.h>

namespace archive {

inline constexpr std::int64_t null_position = -1;
inline constexpr std::int64_t null_timestamp = -1;
inline constexpr std::int64_t null_value = -1;

inline constexpr bool is_power_of_two(std::int64_t v) noexcept {
    return v > 0 && (v & (v - 1)) == 0;
}

// Term length must be a power of two.
inline int position_bits_to_shift(std::int32_t term_buffer_length) noexcept {
    return aeron::util::BitUtil::numberOfTrailingZeroes(term_buffer_length);
}

// Term id and position arithmetic is the client's own, so recorded and replayed streams
// agree with the transport including term id wrap.
inline std::int32_t compute_term_id_from_position(std::int64_t position,
                                                  int position_bits_to_shift,
                                                  std::int32_t initial_term_id) noexcept {
    return aeron::concurrent::logbuffer::LogBufferDescriptor::computeTermIdFromPosition(
        position, position_bits_to_shift, initial_term_id);
}

inline std::int32_t compute_term_offset_from_position(std::int64_t position, int position_bits_to_shift) noexcept {
    return aeron::concurrent::logbuffer::LogBufferDescriptor::computeTermOffsetFromPosition(position,
                                                                                            position_bits_to_shift);
}

inline std::int64_t compute_position(std::int32_t term_id,
                                     std::int32_t term_offset,
                                     int position_bits_to_shift,
                                     std::int32_t initial_term_id) noexcept {
    return aeron::concurrent::logbuffer::LogBufferDescriptor::computePosition(term_id, term_offset,
                                                                              position_bits_to_shift, initial_term_id);
}

inline constexpr std::int64_t term_base_position(std::int64_t position, std::int32_t term_buffer_length) noexcept {
    return position - (position & (static_cast<std::int64_t>(term_buffer_length) - 1));
}

// Bytes left before the next term boundary.
inline constexpr std::int64_t term_remaining(std::int64_t position, std::int32_t term_buffer_length) noexcept {
    return static_cast<std::int64_t>(term_buffer_length) - (position & (static_cast<std::int64_t>(term_buffer_length) - 1));
}

inline constexpr std::int64_t segment_index(std::int64_t position, std::int64_t segment_file_length) noexcept {
    return position / segment_file_length;
}

inline constexpr std::int64_t segment_base_position(std::int64_t index, std::int64_t segment_file_length) noexcept {
    return index * segment_file_length;
}

inline std::int64_t align(std::int64_t value, std::int64_t alignment) noexcept {
    return aeron::util::BitUtil::align(value, alignment);
}

inline constexpr std::int64_t align_down(std::int64_t value, std::int64_t alignment) noexcept {
    return value & ~(alignment - 1);
}

} // namespace archive
