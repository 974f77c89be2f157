#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>
#include "terse/varint.hpp"

using namespace terse;

// =============================================================================
// Helpers
// =============================================================================

auto encode_bytes(uint64_t value) -> std::vector<uint8_t> {
    auto os = std::ostringstream(std::ios::binary);
    write_varint(os, value);
    auto s = os.str();
    return {s.begin(), s.end()};
}

auto decode_bytes(const std::vector<uint8_t>& bytes) -> uint64_t {
    auto is = std::istringstream(std::string(bytes.begin(), bytes.end()), std::ios::binary);
    return read_varint(is);
}

template<typename F>
auto throws_kind(F&& f, errc kind) -> bool {
    try {
        f();
    } catch (const error& e) {
        return e.kind() == kind;
    }
    return false;
}

// =============================================================================
// Tests
// =============================================================================

void test_known_encodings() {
    std::cout << "Testing known encodings... ";

    assert(encode_bytes(0) == (std::vector<uint8_t>{0x00}));
    assert(encode_bytes(1) == (std::vector<uint8_t>{0x01}));
    assert(encode_bytes(127) == (std::vector<uint8_t>{0x7F}));
    assert(encode_bytes(128) == (std::vector<uint8_t>{0x80, 0x01}));
    assert(encode_bytes(300) == (std::vector<uint8_t>{0xAC, 0x02}));
    assert(encode_bytes(16384) == (std::vector<uint8_t>{0x80, 0x80, 0x01}));
    assert(encode_bytes(std::numeric_limits<uint64_t>::max()) ==
           (std::vector<uint8_t>{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x01}));

    std::cout << "PASSED\n";
}

void test_round_trip_boundaries() {
    std::cout << "Testing round trip at group boundaries... ";

    auto values = std::vector<uint64_t>{0, 1, 2, 0x3FFF, 0xDEADBEEF, std::numeric_limits<uint64_t>::max()};
    for (auto k = 1; k < 10; ++k) {
        auto edge = uint64_t{1} << (7 * k);
        values.push_back(edge - 1);
        values.push_back(edge);
        values.push_back(edge + 1);
    }
    for (auto v : values) {
        assert(decode_bytes(encode_bytes(v)) == v);
    }

    std::cout << "PASSED\n";
}

void test_encoded_length() {
    std::cout << "Testing encoded length is ceil(bits / 7)... ";

    assert(varint_size(0) == 1);
    assert(encode_bytes(0).size() == 1);

    for (auto bits = 1; bits <= 64; ++bits) {
        auto v = uint64_t{1} << (bits - 1);
        auto expected = static_cast<std::size_t>((bits + 6) / 7);
        assert(varint_size(v) == expected);
        assert(encode_bytes(v).size() == expected);

        // All bits set at this width needs the same number of groups
        auto all = bits == 64 ? std::numeric_limits<uint64_t>::max() : (uint64_t{1} << bits) - 1;
        assert(varint_size(all) == expected);
        assert(encode_bytes(all).size() == expected);
    }

    std::cout << "PASSED\n";
}

void test_zigzag() {
    std::cout << "Testing zig-zag mapping... ";

    assert(zigzag_encode(0) == 0);
    assert(zigzag_encode(-1) == 1);
    assert(zigzag_encode(1) == 2);
    assert(zigzag_encode(-2) == 3);
    assert(zigzag_encode(-3) == 5);
    assert(zigzag_encode(-35) == 69);
    assert(zigzag_encode(std::numeric_limits<int64_t>::max()) == std::numeric_limits<uint64_t>::max() - 1);
    assert(zigzag_encode(std::numeric_limits<int64_t>::min()) == std::numeric_limits<uint64_t>::max());

    auto values = std::vector<int64_t>{
        0, 1, -1, 63, -64, 64, -65, 1000000, -1000000,
        std::numeric_limits<int64_t>::max(), std::numeric_limits<int64_t>::min()
    };
    for (auto v : values) {
        assert(zigzag_decode(zigzag_encode(v)) == v);

        auto os = std::ostringstream(std::ios::binary);
        write_signed_varint(os, v);
        auto is = std::istringstream(os.str(), std::ios::binary);
        assert(read_signed_varint(is) == v);
    }

    std::cout << "PASSED\n";
}

void test_overflow() {
    std::cout << "Testing overlong varints fail... ";

    // Eleven groups
    auto eleven = std::vector<uint8_t>(10, 0x80);
    eleven.push_back(0x01);
    assert(throws_kind([&] { decode_bytes(eleven); }, errc::size_overflow));

    // Ten groups, but the last carries bits above 63
    auto too_wide = std::vector<uint8_t>(9, 0xFF);
    too_wide.push_back(0x02);
    assert(throws_kind([&] { decode_bytes(too_wide); }, errc::size_overflow));

    // Ten groups, still continuing
    auto unterminated = std::vector<uint8_t>(9, 0xFF);
    unterminated.push_back(0x81);
    assert(throws_kind([&] { decode_bytes(unterminated); }, errc::size_overflow));

    std::cout << "PASSED\n";
}

void test_truncated() {
    std::cout << "Testing truncated input fails with I/O error... ";

    assert(throws_kind([] { decode_bytes({}); }, errc::io));
    assert(throws_kind([] { decode_bytes({0x80}); }, errc::io));
    assert(throws_kind([] { decode_bytes({0xFF, 0xFF}); }, errc::io));

    std::cout << "PASSED\n";
}

void test_consumes_exactly_one_value() {
    std::cout << "Testing decoder stops after the final group... ";

    auto is = std::istringstream(std::string("\xAC\x02\x05", 3), std::ios::binary);
    assert(read_varint(is) == 300);
    assert(read_varint(is) == 5);

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Varint ===\n\n";

    test_known_encodings();
    test_round_trip_boundaries();
    test_encoded_length();
    test_consumes_exactly_one_value();

    std::cout << "\n=== Zig-Zag ===\n\n";

    test_zigzag();

    std::cout << "\n=== Errors ===\n\n";

    test_overflow();
    test_truncated();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
