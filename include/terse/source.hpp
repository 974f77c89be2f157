#pragma once

// Source implementation for the terse encoding.
// Provides binary_source, the read side of the payload codec.

#include <bit>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "dedup.hpp"
#include "detail/io.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "format.hpp"
#include "mode.hpp"
#include "varint.hpp"

namespace terse {

// ============================================================================
// binary_source - reads the payload
// ============================================================================
//
// In dedup mode strings arrive as table indices and are resolved through the
// table read from the stream head; the table must outlive the source.
//
// ============================================================================

class binary_source {
public:
    binary_source(std::istream& stream, mode m, const dedup_context* table = nullptr)
        : is(stream), active(m), table(table) {
        if (active.use_dedup && table == nullptr) {
            throw std::invalid_argument("binary_source: dedup mode requires a string table");
        }
    }

    // --- Scalars ---

    void read(bool& value) {
        value = get_byte() != binary_format::BOOL_FALSE;
    }

    template <typename T>
        requires (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>)
    void read(T& value) {
        if constexpr (std::is_floating_point_v<T>) {
            static_assert(sizeof(T) == 4 || sizeof(T) == 8, "only 32 and 64-bit floating point is supported");
            value = std::bit_cast<T>(read_le<typename binary_format::float_bits<T>::type>());
        } else if constexpr (binary_format::uses_varint_when_requested<T>()) {
            if (active.fixed_size_use_varint) {
                value = read_varint_as<T>();
            } else {
                value = static_cast<T>(read_le<std::make_unsigned_t<T>>());
            }
        } else {
            value = static_cast<T>(get_byte());
        }
    }

    // --- Strings ---

    void read_string(std::string& value) {
        if (dedup_active()) {
            value = table->lookup(next_varint());
            return;
        }
        auto length = detail::checked_size(next_varint());
        detail::read_bytes(is, value, length);
        consumed += length;
        detail::require_utf8(value);
    }

    // --- Structure ---

    auto read_len() -> std::size_t {
        return detail::checked_size(next_varint());
    }

    auto read_variant_index() -> uint64_t {
        return next_varint();
    }

    void begin_no_dedup() { ++no_dedup_depth; }
    void end_no_dedup() { --no_dedup_depth; }

    // Grows with every value read; varints count at their minimal width.
    auto position() const -> uint64_t { return consumed; }

private:
    std::istream& is;
    mode active;
    const dedup_context* table;
    uint64_t consumed = 0;
    int no_dedup_depth = 0;

    auto dedup_active() const -> bool {
        return active.use_dedup && no_dedup_depth == 0;
    }

    auto get_byte() -> uint8_t {
        auto c = is.get();
        if (c == std::char_traits<char>::eof()) {
            throw error::io("unexpected end of input");
        }
        consumed += 1;
        return static_cast<uint8_t>(c);
    }

    auto next_varint() -> uint64_t {
        auto v = read_varint(is);
        consumed += varint_size(v);
        return v;
    }

    template <typename U>
    auto read_le() -> U {
        char bytes[sizeof(U)];
        detail::read_bytes(is, bytes, sizeof(U));
        consumed += sizeof(U);
        U value = 0;
        for (std::size_t i = 0; i < sizeof(U); ++i) {
            value |= static_cast<U>(static_cast<U>(static_cast<uint8_t>(bytes[i])) << (8 * i));
        }
        return value;
    }

    template <typename T>
    auto read_varint_as() -> T {
        if constexpr (std::is_signed_v<T>) {
            auto v = zigzag_decode(next_varint());
            if (v < std::numeric_limits<T>::min() || v > std::numeric_limits<T>::max()) {
                throw error::size_overflow("value " + std::to_string(v) + " does not fit " +
                                           std::to_string(sizeof(T) * 8) + "-bit field");
            }
            return static_cast<T>(v);
        } else {
            auto v = next_varint();
            if (v > std::numeric_limits<T>::max()) {
                throw error::size_overflow("value " + std::to_string(v) + " does not fit " +
                                           std::to_string(sizeof(T) * 8) + "-bit field");
            }
            return static_cast<T>(v);
        }
    }
};

} // namespace terse
