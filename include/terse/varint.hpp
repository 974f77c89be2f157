#pragma once

// Variable-length integer codec: 7-bit groups, least-significant first.

#include <bit>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>

#include "error.hpp"
#include "format.hpp"

namespace terse {

// ============================================================================
// Zig-zag mapping for signed values
// ============================================================================

constexpr auto zigzag_encode(int64_t value) -> uint64_t {
    return (static_cast<uint64_t>(value) << 1) ^ static_cast<uint64_t>(value >> 63);
}

constexpr auto zigzag_decode(uint64_t value) -> int64_t {
    return static_cast<int64_t>((value >> 1) ^ (~(value & 1) + 1));
}

// Number of bytes write_varint emits for value (1 for zero).
constexpr auto varint_size(uint64_t value) -> std::size_t {
    auto bits = static_cast<std::size_t>(std::bit_width(value));
    return bits == 0 ? 1 : (bits + 6) / 7;
}

// ============================================================================
// Stream encode/decode
// ============================================================================

inline void write_varint(std::ostream& os, uint64_t value) {
    while (value >= binary_format::VARINT_CONTINUATION) {
        os.put(static_cast<char>((value & binary_format::VARINT_PAYLOAD_MASK) |
                                 binary_format::VARINT_CONTINUATION));
        value >>= 7;
    }
    os.put(static_cast<char>(value));
    if (!os) {
        throw error::io("failed to write to output stream");
    }
}

inline auto read_varint(std::istream& is) -> uint64_t {
    uint64_t value = 0;
    for (std::size_t group = 0; group < binary_format::VARINT_MAX_BYTES; ++group) {
        auto c = is.get();
        if (c == std::char_traits<char>::eof()) {
            throw error::io("unexpected end of input while reading varint");
        }
        auto byte = static_cast<uint8_t>(c);
        uint64_t digit = byte & binary_format::VARINT_PAYLOAD_MASK;

        // The tenth group only has room for bit 63.
        if (group == binary_format::VARINT_MAX_BYTES - 1 && digit > 1) {
            throw error::size_overflow("varint exceeds 64 bits");
        }
        value |= digit << (7 * group);

        if ((byte & binary_format::VARINT_CONTINUATION) == 0) {
            return value;
        }
    }
    throw error::size_overflow("varint exceeds 64 bits");
}

inline void write_signed_varint(std::ostream& os, int64_t value) {
    write_varint(os, zigzag_encode(value));
}

inline auto read_signed_varint(std::istream& is) -> int64_t {
    return zigzag_decode(read_varint(is));
}

} // namespace terse
