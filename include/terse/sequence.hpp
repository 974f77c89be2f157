#pragma once

// Lazy element-by-element decoding of length-prefixed sequences.

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <utility>

#include "error.hpp"
#include "format.hpp"

namespace terse {

namespace detail {

// Defined in protocol.hpp once every read() overload is declared.
template <typename Source, typename T>
void read_element(Source& source, T& value);

} // namespace detail

// ============================================================================
// sequence_reader - fallible, single-pass iteration over a decoded sequence
// ============================================================================
//
// The length prefix is read on construction; elements are decoded only when
// asked for. A decode error propagates to the caller and leaves the reader
// exhausted, so nothing after a bad element is ever consumed. Elements that
// consume no input are capped at binary_format::MAX_EMPTY_ELEMENTS, which
// bounds the work a bare length prefix can demand.
//
//   auto items = terse::read_sequence<record_t>(source);
//   for (const auto& item : items) {
//       if (done(item)) break;   // the rest stays undecoded
//   }
//
// ============================================================================

template <typename T, typename Source>
class sequence_reader {
public:
    explicit sequence_reader(Source& source)
        : source(&source), left(source.read_len()) {}

    sequence_reader(const sequence_reader&) = delete;
    auto operator=(const sequence_reader&) -> sequence_reader& = delete;

    auto remaining() const -> std::size_t { return left; }

    // Decodes the next element into out, reusing its storage. Returns false
    // once every element has been decoded.
    auto next(T& out) -> bool {
        return next_into(out);
    }

    // As next(), for a view whose parts alias the storage of a T (used to
    // decode map entries straight into recycled nodes).
    template <typename View>
    auto next_into(View&& out) -> bool {
        if (left == 0) {
            return false;
        }
        auto pending = left;
        left = 0;
        auto start = source->position();
        detail::read_element(*source, out);
        if (source->position() == start && ++empty > binary_format::MAX_EMPTY_ELEMENTS) {
            throw error::size_overflow("more than " + std::to_string(binary_format::MAX_EMPTY_ELEMENTS) +
                                       " zero-size elements in one sequence");
        }
        left = pending - 1;
        return true;
    }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        iterator() = default;

        explicit iterator(sequence_reader* owner) : owner(owner) {
            advance();
        }

        auto operator*() const -> const T& { return current; }
        auto operator->() const -> const T* { return &current; }

        auto operator++() -> iterator& {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        friend auto operator==(const iterator& it, std::default_sentinel_t) -> bool {
            return it.owner == nullptr;
        }

    private:
        sequence_reader* owner = nullptr;
        T current{};

        void advance() {
            if (!owner->next(current)) {
                owner = nullptr;
            }
        }
    };

    // Single pass: begin() decodes the first element.
    auto begin() -> iterator { return iterator(this); }
    auto end() const -> std::default_sentinel_t { return {}; }

private:
    Source* source;
    std::size_t left;
    uint64_t empty = 0;
};

template <typename T, typename Source>
auto read_sequence(Source& source) -> sequence_reader<T, Source> {
    return sequence_reader<T, Source>(source);
}

} // namespace terse

// read_element() needs every read() overload
#include "protocol.hpp"
