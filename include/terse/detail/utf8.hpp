#pragma once

// UTF-8 validation for decoded string bytes.

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "../error.hpp"

namespace terse::detail {

// Rejects overlong forms, surrogates (U+D800..U+DFFF) and code points above
// U+10FFFF, matching what a strict UTF-8 decoder accepts.
inline auto is_valid_utf8(std::string_view s) -> bool {
    auto n = s.size();
    std::size_t i = 0;
    while (i < n) {
        auto c = static_cast<uint8_t>(s[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        uint8_t lo = 0x80;
        uint8_t hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            return false;
        }

        if (n - i < len) return false;

        // Only the first continuation byte has a narrowed range.
        auto c1 = static_cast<uint8_t>(s[i + 1]);
        if (c1 < lo || c1 > hi) return false;
        for (std::size_t k = 2; k < len; ++k) {
            auto ck = static_cast<uint8_t>(s[i + k]);
            if ((ck & 0xC0) != 0x80) return false;
        }
        i += len;
    }
    return true;
}

inline void require_utf8(std::string_view s) {
    if (!is_valid_utf8(s)) {
        throw error::invalid_utf8();
    }
}

} // namespace terse::detail
