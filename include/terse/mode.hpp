#pragma once

// Encoding mode: which optional wire-format features are active.

namespace terse {

// ============================================================================
// mode - immutable configuration, passed by value to every sink and source
// ============================================================================
//
//   auto m = terse::mode::dedup().with_fixed_size_use_varint(true);
//   auto bytes = terse::encode(value, m);
//
// The same mode must be used to decode.
//
// ============================================================================

struct mode {
    // Prefix the payload with a string table and replace strings with indices.
    bool use_dedup = false;

    // Write integers wider than one byte as (zig-zag) varints.
    bool fixed_size_use_varint = false;

    static constexpr auto dedup() -> mode {
        return mode{true, false};
    }

    constexpr auto with_fixed_size_use_varint(bool enabled) const -> mode {
        return mode{use_dedup, enabled};
    }

    friend constexpr auto operator==(const mode&, const mode&) -> bool = default;
};

} // namespace terse
