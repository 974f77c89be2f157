#pragma once

// Checked raw byte transfer shared by sinks, sources and the dedup table.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>

#include "../error.hpp"
#include "../format.hpp"

namespace terse::detail {

inline auto checked_size(uint64_t value) -> std::size_t {
    if (value > std::numeric_limits<std::size_t>::max()) {
        throw error::size_overflow("length " + std::to_string(value) + " exceeds addressable range");
    }
    return static_cast<std::size_t>(value);
}

inline void write_bytes(std::ostream& os, std::string_view bytes) {
    if (!bytes.empty()) {
        os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }
    if (!os) {
        throw error::io("failed to write to output stream");
    }
}

inline void read_bytes(std::istream& is, char* out, std::size_t count) {
    is.read(out, static_cast<std::streamsize>(count));
    if (static_cast<std::size_t>(is.gcount()) != count) {
        throw error::io("unexpected end of input");
    }
}

// Replaces the contents of out with the next count bytes. The string grows
// in chunks so a corrupt length fails on end of input instead of allocating
// the claimed size up front; existing capacity is reused.
inline void read_bytes(std::istream& is, std::string& out, std::size_t count) {
    out.clear();
    while (out.size() < count) {
        auto offset = out.size();
        auto chunk = std::min(count - offset, binary_format::STRING_READ_CHUNK);
        out.resize(offset + chunk);
        read_bytes(is, out.data() + offset, chunk);
    }
}

} // namespace terse::detail
