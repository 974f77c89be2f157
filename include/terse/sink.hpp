#pragma once

// Sink implementations for the terse encoding.
// Provides binary_sink (writes bytes) and prescan_sink (builds the string
// table and measures the payload without writing anything).

#include <bit>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>
#include <type_traits>
#include <utility>

#include "dedup.hpp"
#include "detail/io.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "format.hpp"
#include "mode.hpp"
#include "varint.hpp"

namespace terse {

namespace detail {

// Wire form of an integer under fixed_size_use_varint.
template <typename T>
constexpr auto varint_value(T value) -> uint64_t {
    if constexpr (std::is_signed_v<T>) {
        return zigzag_encode(static_cast<int64_t>(value));
    } else {
        return static_cast<uint64_t>(value);
    }
}

} // namespace detail

// ============================================================================
// binary_sink - writes the payload
// ============================================================================
//
// In dedup mode the sink interns every string into its own table and writes
// the index. Because it visits strings in exactly the order the prescan did,
// its indices match the table the prescan wrote to the stream head.
//
// ============================================================================

class binary_sink {
public:
    binary_sink(std::ostream& stream, mode m) : os(stream), active(m) {}

    // --- Scalars ---

    void write(bool value) {
        put_byte(value ? binary_format::BOOL_TRUE : binary_format::BOOL_FALSE);
    }

    template <typename T>
        requires (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>)
    void write(T value) {
        if constexpr (std::is_floating_point_v<T>) {
            static_assert(sizeof(T) == 4 || sizeof(T) == 8, "only 32 and 64-bit floating point is supported");
            write_le(std::bit_cast<typename binary_format::float_bits<T>::type>(value));
        } else if constexpr (binary_format::uses_varint_when_requested<T>()) {
            if (active.fixed_size_use_varint) {
                put_varint(detail::varint_value(value));
            } else {
                write_le(static_cast<std::make_unsigned_t<T>>(value));
            }
        } else {
            put_byte(static_cast<uint8_t>(value));
        }
    }

    // --- Strings ---

    void write_string(std::string_view value) {
        detail::require_utf8(value);
        if (dedup_active()) {
            put_varint(strings.intern(value));
        } else {
            put_varint(value.size());
            detail::write_bytes(os, value);
            written += value.size();
        }
    }

    // --- Structure ---

    void write_len(std::size_t length) {
        put_varint(length);
    }

    void write_variant_index(uint64_t index) {
        put_varint(index);
    }

    void begin_no_dedup() { ++no_dedup_depth; }
    void end_no_dedup() { --no_dedup_depth; }

    // Payload bytes written so far.
    auto position() const -> uint64_t { return written; }

private:
    std::ostream& os;
    mode active;
    dedup_context strings;
    uint64_t written = 0;
    int no_dedup_depth = 0;

    auto dedup_active() const -> bool {
        return active.use_dedup && no_dedup_depth == 0;
    }

    void put_byte(uint8_t byte) {
        os.put(static_cast<char>(byte));
        if (!os) {
            throw error::io("failed to write to output stream");
        }
        written += 1;
    }

    void put_varint(uint64_t value) {
        write_varint(os, value);
        written += varint_size(value);
    }

    template <typename U>
    void write_le(U value) {
        char bytes[sizeof(U)];
        for (std::size_t i = 0; i < sizeof(U); ++i) {
            bytes[i] = static_cast<char>((value >> (8 * i)) & 0xFF);
        }
        detail::write_bytes(os, std::string_view(bytes, sizeof(U)));
        written += sizeof(U);
    }
};

// ============================================================================
// prescan_sink - first pass of a dedup encode
// ============================================================================
//
// Visits the value exactly as binary_sink will, interning strings into the
// table that goes to the stream head. It also counts the payload bytes
// binary_sink is going to produce, which makes it usable as a pure size
// measurement in any mode.
//
// ============================================================================

class prescan_sink {
public:
    explicit prescan_sink(mode m) : active(m) {}

    // --- Scalars ---

    void write(bool) {
        payload_bytes += 1;
    }

    template <typename T>
        requires (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>)
    void write(T value) {
        if constexpr (binary_format::uses_varint_when_requested<T>()) {
            if (active.fixed_size_use_varint) {
                payload_bytes += varint_size(detail::varint_value(value));
                return;
            }
        }
        payload_bytes += sizeof(T);
    }

    // --- Strings ---

    void write_string(std::string_view value) {
        detail::require_utf8(value);
        if (dedup_active()) {
            payload_bytes += varint_size(strings.intern(value));
        } else {
            payload_bytes += varint_size(value.size()) + value.size();
        }
    }

    // --- Structure ---

    void write_len(std::size_t length) {
        payload_bytes += varint_size(length);
    }

    void write_variant_index(uint64_t index) {
        payload_bytes += varint_size(index);
    }

    void begin_no_dedup() { ++no_dedup_depth; }
    void end_no_dedup() { --no_dedup_depth; }

    // --- Results ---

    auto dedup() const -> const dedup_context& { return strings; }
    auto take_dedup() -> dedup_context { return std::move(strings); }

    // Bytes binary_sink writes for the same value, table excluded.
    auto payload_size() const -> std::size_t { return payload_bytes; }

    auto position() const -> uint64_t { return payload_bytes; }

private:
    mode active;
    dedup_context strings;
    std::size_t payload_bytes = 0;
    int no_dedup_depth = 0;

    auto dedup_active() const -> bool {
        return active.use_dedup && no_dedup_depth == 0;
    }
};

} // namespace terse
