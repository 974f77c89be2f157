#pragma once

// Minimal std::streambuf adapters over in-memory byte buffers.

#include <cstdint>
#include <span>
#include <streambuf>
#include <vector>

namespace terse::detail {

// Appends everything written to a caller-owned byte vector.
class vector_outbuf : public std::streambuf {
public:
    explicit vector_outbuf(std::vector<uint8_t>& bytes) : bytes(bytes) {}

protected:
    auto overflow(int_type ch) -> int_type override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        bytes.push_back(static_cast<uint8_t>(ch));
        return ch;
    }

    auto xsputn(const char_type* s, std::streamsize count) -> std::streamsize override {
        auto* first = reinterpret_cast<const uint8_t*>(s);
        bytes.insert(bytes.end(), first, first + count);
        return count;
    }

private:
    std::vector<uint8_t>& bytes;
};

// Read-only view of a caller-owned byte span; no copy is made.
class span_inbuf : public std::streambuf {
public:
    explicit span_inbuf(std::span<const uint8_t> bytes) {
        // The get area is never written through.
        auto* first = const_cast<char*>(reinterpret_cast<const char*>(bytes.data()));
        setg(first, first, first + bytes.size());
    }
};

} // namespace terse::detail
