#pragma once

// Wire format constants for the terse binary encoding.

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace terse {

// ============================================================================
// Binary format constants and wire layout
// ============================================================================
//
// Stream layout:
// - [dedup table] only when mode::use_dedup is set:
//     varint(count), then count x (varint(byte_length) + UTF-8 bytes)
// - payload: the value tree, fields in declaration order, no names, no tags
//
// Scalars:
// - bool: one byte, BOOL_TRUE or BOOL_FALSE
// - one-byte integers: one raw byte
// - wider integers: little-endian, or (zig-zag) varint under
//   mode::fixed_size_use_varint
// - floating point: little-endian IEEE-754 bit pattern
//
// Lengths, dedup indices and discriminants are always varints.
//
// ============================================================================

namespace binary_format {

constexpr uint8_t BOOL_TRUE  = 0xFF;
constexpr uint8_t BOOL_FALSE = 0x00;

// Varint groups
constexpr uint8_t VARINT_PAYLOAD_MASK = 0x7F;
constexpr uint8_t VARINT_CONTINUATION = 0x80;
constexpr std::size_t VARINT_MAX_BYTES = 10;

// Decoders never trust a length prefix for up-front allocation beyond these.
constexpr std::size_t STRING_READ_CHUNK = 64 * 1024;
constexpr std::size_t MAX_PREALLOCATED_ELEMENTS = 4096;

// A sequence may hold at most this many elements that occupy no bytes on the
// wire; past it, the length prefix is not backed by any input.
constexpr uint64_t MAX_EMPTY_ELEMENTS = uint64_t{1} << 20;

// Integers narrower than this are never varint encoded.
template <typename T>
constexpr bool uses_varint_when_requested() {
    return std::is_integral_v<T> && !std::is_same_v<T, bool> && sizeof(T) > 1;
}

// Unsigned integer carrying a floating point value's bit pattern.
template <typename T>
struct float_bits;

template <>
struct float_bits<float> { using type = uint32_t; };

template <>
struct float_bits<double> { using type = uint64_t; };

} // namespace binary_format

} // namespace terse
