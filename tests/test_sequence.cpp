#include <cassert>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>
// sequence.hpp first: it must stand on its own
#include "terse/sequence.hpp"
#include "terse/codec.hpp"

// =============================================================================
// Test structures
// =============================================================================

struct sample_t {
    std::string station;
    double reading = 0.0;

    auto operator==(const sample_t&) const -> bool = default;
};

auto fields(sample_t& s) {
    return std::make_tuple(terse::field(s.station), terse::field(s.reading));
}

auto fields(const sample_t& s) {
    return std::make_tuple(terse::field(s.station), terse::field(s.reading));
}

// =============================================================================
// Helpers
// =============================================================================

template<typename T>
auto encoded_stream(const T& value, terse::mode m = {}) -> std::istringstream {
    auto bytes = terse::encode(value, m);
    return std::istringstream(std::string(bytes.begin(), bytes.end()), std::ios::binary);
}

auto raw_stream(const std::vector<uint8_t>& bytes) -> std::istringstream {
    return std::istringstream(std::string(bytes.begin(), bytes.end()), std::ios::binary);
}

template<typename F>
auto throws_kind(F&& f, terse::errc kind) -> bool {
    try {
        f();
    } catch (const terse::error& e) {
        return e.kind() == kind;
    }
    return false;
}

// =============================================================================
// Tests
// =============================================================================

void test_range_for() {
    std::cout << "Testing range-for over a sequence... ";

    auto values = std::vector<int32_t>{5, -8, 1 << 24, 0};
    auto is = encoded_stream(values);
    auto source = terse::binary_source(is, terse::mode{});

    auto seq = terse::read_sequence<int32_t>(source);
    assert(seq.remaining() == 4);

    auto seen = std::vector<int32_t>{};
    for (const auto& v : seq) {
        seen.push_back(v);
    }
    assert(seen == values);
    assert(seq.remaining() == 0);

    std::cout << "PASSED\n";
}

void test_next_counts_down() {
    std::cout << "Testing next() counts down and then stops... ";

    auto samples = std::vector<sample_t>{{"north", 1.5}, {"south", -2.25}};
    auto is = encoded_stream(samples);
    auto source = terse::binary_source(is, terse::mode{});
    auto seq = terse::read_sequence<sample_t>(source);

    auto s = sample_t{};
    assert(seq.next(s) && s == samples[0]);
    assert(seq.remaining() == 1);
    assert(seq.next(s) && s == samples[1]);
    assert(seq.remaining() == 0);
    assert(!seq.next(s));
    assert(!seq.next(s));
    assert(s == samples[1]);

    std::cout << "PASSED\n";
}

void test_lazy_decoding() {
    std::cout << "Testing elements are decoded only on demand... ";

    // Sequence followed by an unrelated byte, written by one sink
    auto os = std::ostringstream(std::ios::binary);
    auto sink = terse::binary_sink(os, terse::mode{});
    terse::write(sink, std::vector<std::string>{"a", "b", "c"});
    terse::write(sink, uint8_t{42});

    auto is = std::istringstream(os.str(), std::ios::binary);
    auto source = terse::binary_source(is, terse::mode{});
    auto seq = terse::read_sequence<std::string>(source);

    for (const auto& s : seq) {
        assert(s == "a");
        break;
    }
    assert(seq.remaining() == 2);

    // The next bytes on the stream are still the second element
    auto next = std::string{};
    terse::read(source, next);
    assert(next == "b");

    std::cout << "PASSED\n";
}

void test_error_stops_iteration() {
    std::cout << "Testing a decode error ends the sequence... ";

    // "a", then an invalid UTF-8 string, then "c"
    auto is = raw_stream({0x03, 0x01, 'a', 0x02, 0xC3, 0x28, 0x01, 'c'});
    auto source = terse::binary_source(is, terse::mode{});
    auto seq = terse::read_sequence<std::string>(source);

    auto s = std::string{};
    assert(seq.next(s) && s == "a");
    assert(throws_kind([&] { seq.next(s); }, terse::errc::invalid_utf8));
    assert(seq.remaining() == 0);
    assert(!seq.next(s));

    // Nothing past the failed element was consumed
    auto rest = std::string{};
    terse::read(source, rest);
    assert(rest == "c");

    std::cout << "PASSED\n";
}

void test_error_propagates_from_range_for() {
    std::cout << "Testing a decode error escapes range-for... ";

    auto is = raw_stream({0x04, 0x01, 'x', 0x01, 'y', 0x05, 'z'});
    auto source = terse::binary_source(is, terse::mode{});
    auto seq = terse::read_sequence<std::string>(source);

    auto seen = std::vector<std::string>{};
    auto failed = throws_kind([&] {
        for (const auto& s : seq) {
            seen.push_back(s);
        }
    }, terse::errc::io);

    assert(failed);
    assert((seen == std::vector<std::string>{"x", "y"}));
    assert(seq.remaining() == 0);

    std::cout << "PASSED\n";
}

void test_not_restartable() {
    std::cout << "Testing an exhausted sequence stays exhausted... ";

    auto is = encoded_stream(std::vector<uint8_t>{1, 2, 3});
    auto source = terse::binary_source(is, terse::mode{});
    auto seq = terse::read_sequence<uint8_t>(source);

    auto total = 0;
    for (auto v : seq) {
        total += v;
    }
    assert(total == 6);

    auto again = 0;
    for (auto v : seq) {
        again += v;
    }
    assert(again == 0);
    assert(seq.begin() == seq.end());

    std::cout << "PASSED\n";
}

void test_dedup_source() {
    std::cout << "Testing sequences over a dedup-mode payload... ";

    auto names = std::vector<std::string>{"fox", "owl", "fox", "fox"};
    auto m = terse::mode::dedup();
    auto is = encoded_stream(names, m);

    auto table = terse::dedup_context::read_from(is);
    assert(table.size() == 2);

    auto source = terse::binary_source(is, m, &table);
    auto seen = std::vector<std::string>{};
    for (const auto& name : terse::read_sequence<std::string>(source)) {
        seen.push_back(name);
    }
    assert(seen == names);

    std::cout << "PASSED\n";
}

void test_missing_length_prefix() {
    std::cout << "Testing construction reads the length prefix... ";

    auto is = raw_stream({});
    auto source = terse::binary_source(is, terse::mode{});
    assert(throws_kind([&] { terse::read_sequence<int32_t>(source); }, terse::errc::io));

    auto huge = raw_stream({0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x01});
    auto huge_source = terse::binary_source(huge, terse::mode{});
    assert(throws_kind([&] { terse::read_sequence<int32_t>(huge_source); }, terse::errc::size_overflow));

    std::cout << "PASSED\n";
}

void test_empty_elements_bounded() {
    std::cout << "Testing elements that read no input are capped... ";

    // Length 2^40, no element bytes behind it
    auto is = raw_stream({0x80, 0x80, 0x80, 0x80, 0x80, 0x20});
    auto source = terse::binary_source(is, terse::mode{});
    auto seq = terse::read_sequence<std::monostate>(source);

    auto unit = std::monostate{};
    uint64_t decoded = 0;
    auto failed = throws_kind([&] {
        while (seq.next(unit)) {
            ++decoded;
        }
    }, terse::errc::size_overflow);

    assert(failed);
    assert(decoded == terse::binary_format::MAX_EMPTY_ELEMENTS);
    assert(seq.remaining() == 0);

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Iteration ===\n\n";

    test_range_for();
    test_next_counts_down();
    test_lazy_decoding();
    test_not_restartable();
    test_dedup_source();

    std::cout << "\n=== Errors ===\n\n";

    test_error_stops_iteration();
    test_error_propagates_from_range_for();
    test_missing_length_prefix();
    test_empty_elements_bounded();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
