#pragma once

// String table for deduplicated encoding.

#include <cstddef>
#include <cstdint>
#include <deque>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>

#include "detail/io.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "varint.hpp"

namespace terse {

// ============================================================================
// dedup_context - ordered pool of unique strings
// ============================================================================
//
// Build form (encode): intern() assigns indices 0, 1, 2, ... in order of first
// occurrence, then write_to() emits the table.
//
// Read form (decode): read_from() loads a table from the stream head, then
// lookup() resolves indices found in the payload. intern() is not meaningful
// on a context obtained from read_from().
//
// Table layout: varint(count), then count x (varint(byte_length) + bytes).
//
// ============================================================================

class dedup_context {
public:
    dedup_context() = default;
    dedup_context(dedup_context&&) = default;
    auto operator=(dedup_context&&) -> dedup_context& = default;

    // index holds views into strings; a copy would dangle
    dedup_context(const dedup_context&) = delete;
    auto operator=(const dedup_context&) -> dedup_context& = delete;

    // --- Build side ---

    auto intern(std::string_view s) -> uint64_t {
        auto it = index.find(s);
        if (it != index.end()) {
            return it->second;
        }
        auto next = static_cast<uint64_t>(strings.size());
        strings.emplace_back(s);
        index.emplace(strings.back(), next);
        return next;
    }

    void write_to(std::ostream& os) const {
        write_varint(os, strings.size());
        for (const auto& s : strings) {
            write_varint(os, s.size());
            detail::write_bytes(os, s);
        }
    }

    // Bytes write_to() emits.
    auto encoded_size() const -> std::size_t {
        auto total = varint_size(strings.size());
        for (const auto& s : strings) {
            total += varint_size(s.size()) + s.size();
        }
        return total;
    }

    // --- Read side ---

    static auto read_from(std::istream& is) -> dedup_context {
        auto ctx = dedup_context{};
        auto count = detail::checked_size(read_varint(is));
        for (std::size_t i = 0; i < count; ++i) {
            auto length = detail::checked_size(read_varint(is));
            auto& s = ctx.strings.emplace_back();
            detail::read_bytes(is, s, length);
            detail::require_utf8(s);
        }
        return ctx;
    }

    auto lookup(uint64_t i) const -> const std::string& {
        if (i >= strings.size()) {
            throw error::string_index_out_of_range(i);
        }
        return strings[static_cast<std::size_t>(i)];
    }

    // --- Query ---

    auto size() const -> std::size_t { return strings.size(); }
    auto empty() const -> bool { return strings.empty(); }

    auto begin() const { return strings.begin(); }
    auto end() const { return strings.end(); }

private:
    // deque keeps element addresses stable for the views in index
    std::deque<std::string> strings;
    std::unordered_map<std::string_view, uint64_t> index;
};

} // namespace terse
