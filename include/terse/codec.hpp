#pragma once

// Entry points: encode a value to a buffer or stream, decode it back.

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <span>
#include <vector>

#include "dedup.hpp"
#include "detail/membuf.hpp"
#include "mode.hpp"
#include "protocol.hpp"
#include "sink.hpp"
#include "source.hpp"

namespace terse {

// ============================================================================
// Encode
// ============================================================================
//
// Dedup mode: prescan pass -> string table -> payload pass.
// Otherwise:  payload pass only.
//
// ============================================================================

template <typename T>
void encode_to(std::ostream& os, const T& value, mode m = {}) {
    if (m.use_dedup) {
        auto prescan = prescan_sink(m);
        write(prescan, value);
        prescan.dedup().write_to(os);
    }
    auto sink = binary_sink(os, m);
    write(sink, value);
}

template <typename T>
auto encode(const T& value, mode m = {}) -> std::vector<uint8_t> {
    auto bytes = std::vector<uint8_t>{};
    auto buf = detail::vector_outbuf(bytes);
    auto os = std::ostream(&buf);

    if (m.use_dedup) {
        auto prescan = prescan_sink(m);
        write(prescan, value);
        auto table = prescan.take_dedup();
        bytes.reserve(table.encoded_size() + prescan.payload_size());
        table.write_to(os);
    }
    auto sink = binary_sink(os, m);
    write(sink, value);
    return bytes;
}

// Exact number of bytes encode() produces, computed without encoding.
template <typename T>
auto encoded_size(const T& value, mode m = {}) -> std::size_t {
    auto prescan = prescan_sink(m);
    write(prescan, value);
    auto table_size = m.use_dedup ? prescan.dedup().encoded_size() : std::size_t{0};
    return table_size + prescan.payload_size();
}

// ============================================================================
// Decode
// ============================================================================
//
// decode_into() overwrites an existing value and reuses its storage, which
// saves allocations when the same object is decoded into repeatedly. Bytes
// after the encoded value are left unread.
//
// ============================================================================

template <typename T>
void decode_into(T& target, std::istream& is, mode m = {}) {
    auto table = m.use_dedup ? dedup_context::read_from(is) : dedup_context{};
    auto source = binary_source(is, m, &table);
    read(source, target);
}

template <typename T>
void decode_into(T& target, std::span<const uint8_t> bytes, mode m = {}) {
    auto buf = detail::span_inbuf(bytes);
    auto is = std::istream(&buf);
    decode_into(target, is, m);
}

template <typename T>
auto decode_from(std::istream& is, mode m = {}) -> T {
    auto value = T{};
    decode_into(value, is, m);
    return value;
}

template <typename T>
auto decode(std::span<const uint8_t> bytes, mode m = {}) -> T {
    auto value = T{};
    decode_into(value, bytes, m);
    return value;
}

} // namespace terse
