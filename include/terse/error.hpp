#pragma once

// Error type thrown by every terse component.

#include <cstdint>
#include <stdexcept>
#include <string>

namespace terse {

enum class errc {
    io,
    size_overflow,
    invalid_utf8,
    string_index_out_of_range,
    custom,
};

inline const char* to_string(errc kind) {
    switch (kind) {
        case errc::io: return "io";
        case errc::size_overflow: return "size_overflow";
        case errc::invalid_utf8: return "invalid_utf8";
        case errc::string_index_out_of_range: return "string_index_out_of_range";
        case errc::custom: return "custom";
    }
    return "unknown";
}

// ============================================================================
// error - the single exception type surfaced to callers
// ============================================================================
//
// Any error aborts the whole encode or decode call; there is no partial
// result. Custom errors are how fields() types and user read/write overloads
// reject values:
//
//   throw terse::error::custom("port must be nonzero");
//
// ============================================================================

class error : public std::runtime_error {
public:
    error(errc kind, const std::string& message, uint64_t index = 0)
        : std::runtime_error(message), kind_(kind), index_(index) {}

    static auto io(const std::string& what) -> error {
        return error(errc::io, "I/O error: " + what);
    }

    static auto size_overflow(const std::string& what) -> error {
        return error(errc::size_overflow, "size overflow: " + what);
    }

    static auto invalid_utf8() -> error {
        return error(errc::invalid_utf8, "invalid UTF-8 string");
    }

    static auto string_index_out_of_range(uint64_t index) -> error {
        return error(errc::string_index_out_of_range,
                     "indexed string out of range: " + std::to_string(index), index);
    }

    static auto custom(const std::string& message) -> error {
        return error(errc::custom, message);
    }

    auto kind() const noexcept -> errc { return kind_; }

    // Offending table index for string_index_out_of_range, 0 otherwise.
    auto index() const noexcept -> uint64_t { return index_; }

private:
    errc kind_;
    uint64_t index_;
};

} // namespace terse
