#pragma once

// Generic traversal: write/read free functions for every encodable type.
// The same write() walk drives both the prescan pass and the real encode.

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include "error.hpp"
#include "format.hpp"
#include "sequence.hpp"
#include "sink.hpp"
#include "source.hpp"

namespace terse {

// ============================================================================
// Capability contract - what every sink and source provides
// ============================================================================

template <typename S>
concept EncodeSink = requires(S& s, std::string_view str, std::size_t n, uint64_t i) {
    { s.write(bool{}) } -> std::same_as<void>;
    { s.write(int32_t{}) } -> std::same_as<void>;
    { s.write(double{}) } -> std::same_as<void>;
    { s.write_string(str) } -> std::same_as<void>;
    { s.write_len(n) } -> std::same_as<void>;
    { s.write_variant_index(i) } -> std::same_as<void>;
    { s.begin_no_dedup() } -> std::same_as<void>;
    { s.end_no_dedup() } -> std::same_as<void>;
    { s.position() } -> std::same_as<uint64_t>;
};

template <typename S>
concept DecodeSource = requires(S& s, bool& b, int32_t& i, double& d, std::string& str) {
    { s.read(b) } -> std::same_as<void>;
    { s.read(i) } -> std::same_as<void>;
    { s.read(d) } -> std::same_as<void>;
    { s.read_string(str) } -> std::same_as<void>;
    { s.read_len() } -> std::same_as<std::size_t>;
    { s.read_variant_index() } -> std::same_as<uint64_t>;
    { s.begin_no_dedup() } -> std::same_as<void>;
    { s.end_no_dedup() } -> std::same_as<void>;
    { s.position() } -> std::same_as<uint64_t>;
};

// ============================================================================
// Field helpers - build the tuple returned by an ADL fields() function
// ============================================================================
//
//   struct entry_t {
//       std::string key;
//       std::string checksum;
//       int cache_slot = 0;
//   };
//
//   auto fields(entry_t& e) {
//       return std::make_tuple(
//           terse::field(e.key),
//           terse::no_dedup(e.checksum),
//           terse::skip(e.cache_slot)
//       );
//   }
//   auto fields(const entry_t& e) { ...same, on const members... }
//
// Fields are visited left to right. A skipped field is never visited on
// encode and is reset to its default on decode. A no_dedup field and
// everything below it is encoded inline even in dedup mode.
//
// ============================================================================

enum class field_attr {
    none,
    skip,
    no_dedup,
};

template <typename T, field_attr Attr = field_attr::none>
struct field_ref {
    T& value;
};

template <typename T>
constexpr auto field(T& value) {
    return field_ref<T>{value};
}

template <typename T>
constexpr auto skip(T& value) {
    return field_ref<T, field_attr::skip>{value};
}

template <typename T>
constexpr auto no_dedup(T& value) {
    return field_ref<T, field_attr::no_dedup>{value};
}

template <typename T>
concept HasFields = requires(T& t) {
    { fields(t) };
};

template <typename T>
concept HasConstFields = requires(const T& t) {
    { fields(t) };
};

// ============================================================================
// Write declarations
// ============================================================================

template <EncodeSink Sink, typename T>
    requires std::is_arithmetic_v<T>
void write(Sink& sink, const T& value);

template <EncodeSink Sink>
void write(Sink& sink, const std::string& value);

template <EncodeSink Sink>
void write(Sink& sink, std::string_view value);

template <EncodeSink Sink>
void write(Sink& sink, const char* value);

template <EncodeSink Sink, typename E>
    requires std::is_enum_v<E>
void write(Sink& sink, const E& value);

template <EncodeSink Sink, typename T>
void write(Sink& sink, const std::optional<T>& value);

template <EncodeSink Sink, typename T1, typename T2>
void write(Sink& sink, const std::pair<T1, T2>& value);

template <EncodeSink Sink, typename... Ts>
void write(Sink& sink, const std::tuple<Ts...>& value);

template <EncodeSink Sink, typename T, typename A>
void write(Sink& sink, const std::vector<T, A>& value);

template <EncodeSink Sink, typename T, typename A>
void write(Sink& sink, const std::deque<T, A>& value);

template <EncodeSink Sink, typename T, typename A>
void write(Sink& sink, const std::list<T, A>& value);

template <EncodeSink Sink, typename T, std::size_t Extent>
void write(Sink& sink, std::span<T, Extent> value);

template <EncodeSink Sink, typename T, std::size_t N>
void write(Sink& sink, const std::array<T, N>& value);

template <EncodeSink Sink, typename K, typename V, typename C, typename A>
void write(Sink& sink, const std::map<K, V, C, A>& value);

template <EncodeSink Sink, typename K, typename V, typename H, typename E, typename A>
void write(Sink& sink, const std::unordered_map<K, V, H, E, A>& value);

template <EncodeSink Sink, typename K, typename C, typename A>
void write(Sink& sink, const std::set<K, C, A>& value);

template <EncodeSink Sink, typename K, typename H, typename E, typename A>
void write(Sink& sink, const std::unordered_set<K, H, E, A>& value);

template <EncodeSink Sink, typename... Ts>
void write(Sink& sink, const std::variant<Ts...>& value);

template <EncodeSink Sink>
void write(Sink& sink, const std::monostate& value);

template <EncodeSink Sink, typename T, typename D>
void write(Sink& sink, const std::unique_ptr<T, D>& value);

template <EncodeSink Sink, typename T>
    requires HasConstFields<T>
void write(Sink& sink, const T& value);

// ============================================================================
// Read declarations
// ============================================================================
//
// Every read() decodes into an existing value and reuses its storage where
// the type allows; a fresh decode is a read into a value-initialized object.
//
// ============================================================================

template <DecodeSource Source, typename T>
    requires std::is_arithmetic_v<T>
void read(Source& source, T& value);

template <DecodeSource Source>
void read(Source& source, std::string& value);

template <DecodeSource Source, typename E>
    requires std::is_enum_v<E>
void read(Source& source, E& value);

template <DecodeSource Source, typename T>
void read(Source& source, std::optional<T>& value);

template <DecodeSource Source, typename T1, typename T2>
void read(Source& source, std::pair<T1, T2>& value);

template <DecodeSource Source, typename... Ts>
void read(Source& source, std::tuple<Ts...>& value);

template <DecodeSource Source, typename T, typename A>
void read(Source& source, std::vector<T, A>& value);

template <DecodeSource Source, typename A>
void read(Source& source, std::vector<bool, A>& value);

template <DecodeSource Source, typename T, typename A>
void read(Source& source, std::deque<T, A>& value);

template <DecodeSource Source, typename T, typename A>
void read(Source& source, std::list<T, A>& value);

template <DecodeSource Source, typename T, std::size_t N>
void read(Source& source, std::array<T, N>& value);

template <DecodeSource Source, typename K, typename V, typename C, typename A>
void read(Source& source, std::map<K, V, C, A>& value);

template <DecodeSource Source, typename K, typename V, typename H, typename E, typename A>
void read(Source& source, std::unordered_map<K, V, H, E, A>& value);

template <DecodeSource Source, typename K, typename C, typename A>
void read(Source& source, std::set<K, C, A>& value);

template <DecodeSource Source, typename K, typename H, typename E, typename A>
void read(Source& source, std::unordered_set<K, H, E, A>& value);

template <DecodeSource Source, typename... Ts>
void read(Source& source, std::variant<Ts...>& value);

template <DecodeSource Source>
void read(Source& source, std::monostate& value);

template <DecodeSource Source, typename T, typename D>
void read(Source& source, std::unique_ptr<T, D>& value);

template <DecodeSource Source, typename T>
    requires HasFields<T>
void read(Source& source, T& value);

// ============================================================================
// Helpers
// ============================================================================

namespace detail {

// Suspends deduplication for the lifetime of a no_dedup field.
template <typename Codec>
class no_dedup_scope {
public:
    explicit no_dedup_scope(Codec& codec) : codec(codec) {
        codec.begin_no_dedup();
    }
    ~no_dedup_scope() {
        codec.end_no_dedup();
    }

    no_dedup_scope(const no_dedup_scope&) = delete;
    auto operator=(const no_dedup_scope&) -> no_dedup_scope& = delete;

private:
    Codec& codec;
};

template <typename Sink, typename T, field_attr Attr>
void write_field(Sink& sink, const field_ref<T, Attr>& f) {
    if constexpr (Attr == field_attr::skip) {
        return;
    } else if constexpr (Attr == field_attr::no_dedup) {
        auto scope = no_dedup_scope<Sink>(sink);
        write(sink, f.value);
    } else {
        write(sink, f.value);
    }
}

template <typename Source, typename T, field_attr Attr>
void read_field(Source& source, const field_ref<T, Attr>& f) {
    if constexpr (Attr == field_attr::skip) {
        f.value = T{};
    } else if constexpr (Attr == field_attr::no_dedup) {
        auto scope = no_dedup_scope<Source>(source);
        read(source, f.value);
    } else {
        read(source, f.value);
    }
}

template <typename Source, typename T>
void read_element(Source& source, T& value) {
    read(source, value);
}

template <typename Sink, typename Range>
void write_sequence(Sink& sink, const Range& range) {
    sink.write_len(range.size());
    uint64_t empty = 0;
    for (const auto& elem : range) {
        auto start = sink.position();
        write(sink, elem);
        if (sink.position() == start && ++empty > binary_format::MAX_EMPTY_ELEMENTS) {
            throw error::size_overflow("more than " + std::to_string(binary_format::MAX_EMPTY_ELEMENTS) +
                                       " zero-size elements in one sequence");
        }
    }
}

template <typename Container>
void check_length(const Container& value, std::size_t length) {
    if (length > value.max_size()) {
        throw error::size_overflow("length " + std::to_string(length) + " exceeds container capacity");
    }
}

// Decodes into the existing elements first, then truncates or grows.
template <typename Source, typename Container>
void read_sequence_into(Source& source, Container& value) {
    using T = typename Container::value_type;
    auto seq = sequence_reader<T, Source>(source);
    check_length(value, seq.remaining());

    auto it = value.begin();
    while (it != value.end() && seq.next(*it)) {
        ++it;
    }
    value.erase(it, value.end());

    if constexpr (requires { value.reserve(std::size_t{}); }) {
        value.reserve(value.size() + std::min(seq.remaining(), binary_format::MAX_PREALLOCATED_ELEMENTS));
    }
    while (seq.remaining() > 0) {
        seq.next(value.emplace_back());
    }
}

// Recycles the map's existing nodes for the decoded entries. A key that
// appears twice keeps the later value.
template <typename Source, typename Map>
void read_map_into(Source& source, Map& value) {
    using K = typename Map::key_type;
    using V = typename Map::mapped_type;
    auto seq = sequence_reader<std::pair<K, V>, Source>(source);
    check_length(value, seq.remaining());

    auto spare = std::vector<typename Map::node_type>{};
    spare.reserve(value.size());
    while (!value.empty()) {
        spare.push_back(value.extract(value.begin()));
    }

    while (seq.remaining() > 0) {
        if (spare.empty()) {
            auto entry = std::pair<K, V>{};
            seq.next(entry);
            value.insert_or_assign(std::move(entry.first), std::move(entry.second));
        } else {
            auto node = std::move(spare.back());
            spare.pop_back();
            seq.next_into(std::pair<K&, V&>(node.key(), node.mapped()));
            auto result = value.insert(std::move(node));
            if (!result.inserted) {
                result.position->second = std::move(result.node.mapped());
            }
        }
    }
}

template <typename Source, typename Set>
void read_set_into(Source& source, Set& value) {
    using K = typename Set::key_type;
    auto seq = sequence_reader<K, Source>(source);
    check_length(value, seq.remaining());

    auto spare = std::vector<typename Set::node_type>{};
    spare.reserve(value.size());
    while (!value.empty()) {
        spare.push_back(value.extract(value.begin()));
    }

    while (seq.remaining() > 0) {
        if (spare.empty()) {
            auto key = K{};
            seq.next(key);
            value.insert(std::move(key));
        } else {
            auto node = std::move(spare.back());
            spare.pop_back();
            seq.next(node.value());
            value.insert(std::move(node));
        }
    }
}

template <typename Source, typename Variant, std::size_t I = 0>
void read_variant_by_index(Source& source, Variant& value, uint64_t index) {
    if constexpr (I < std::variant_size_v<Variant>) {
        if (I == index) {
            if (value.index() != I) {
                value.template emplace<I>();
            }
            read(source, std::get<I>(value));
            return;
        }
        read_variant_by_index<Source, Variant, I + 1>(source, value, index);
    }
}

} // namespace detail

// ============================================================================
// Write implementations
// ============================================================================

// Scalar types
template <EncodeSink Sink, typename T>
    requires std::is_arithmetic_v<T>
void write(Sink& sink, const T& value) {
    sink.write(value);
}

// Strings
template <EncodeSink Sink>
void write(Sink& sink, const std::string& value) {
    sink.write_string(value);
}

template <EncodeSink Sink>
void write(Sink& sink, std::string_view value) {
    sink.write_string(value);
}

template <EncodeSink Sink>
void write(Sink& sink, const char* value) {
    sink.write_string(std::string_view(value));
}

// Enums: the enumerator value is the discriminant
template <EncodeSink Sink, typename E>
    requires std::is_enum_v<E>
void write(Sink& sink, const E& value) {
    using U = std::underlying_type_t<E>;
    auto raw = static_cast<U>(value);
    if constexpr (std::is_signed_v<U>) {
        if (raw < 0) {
            throw error::custom("negative enum discriminant " + std::to_string(raw));
        }
    }
    sink.write_variant_index(static_cast<uint64_t>(raw));
}

// std::optional<T>: presence tag, then the value
template <EncodeSink Sink, typename T>
void write(Sink& sink, const std::optional<T>& value) {
    sink.write(value.has_value());
    if (value) {
        write(sink, *value);
    }
}

// std::pair and std::tuple: members in order, no prefix
template <EncodeSink Sink, typename T1, typename T2>
void write(Sink& sink, const std::pair<T1, T2>& value) {
    write(sink, value.first);
    write(sink, value.second);
}

template <EncodeSink Sink, typename... Ts>
void write(Sink& sink, const std::tuple<Ts...>& value) {
    std::apply([&sink](const auto&... elems) {
        (write(sink, elems), ...);
    }, value);
}

// Sequences: length prefix, then each element
template <EncodeSink Sink, typename T, typename A>
void write(Sink& sink, const std::vector<T, A>& value) {
    detail::write_sequence(sink, value);
}

template <EncodeSink Sink, typename T, typename A>
void write(Sink& sink, const std::deque<T, A>& value) {
    detail::write_sequence(sink, value);
}

template <EncodeSink Sink, typename T, typename A>
void write(Sink& sink, const std::list<T, A>& value) {
    detail::write_sequence(sink, value);
}

template <EncodeSink Sink, typename T, std::size_t Extent>
void write(Sink& sink, std::span<T, Extent> value) {
    detail::write_sequence(sink, value);
}

// std::array<T, N>: arity is static, so no prefix
template <EncodeSink Sink, typename T, std::size_t N>
void write(Sink& sink, const std::array<T, N>& value) {
    for (const auto& elem : value) {
        write(sink, elem);
    }
}

// Maps: length prefix, then key and value per entry
template <EncodeSink Sink, typename K, typename V, typename C, typename A>
void write(Sink& sink, const std::map<K, V, C, A>& value) {
    detail::write_sequence(sink, value);
}

template <EncodeSink Sink, typename K, typename V, typename H, typename E, typename A>
void write(Sink& sink, const std::unordered_map<K, V, H, E, A>& value) {
    detail::write_sequence(sink, value);
}

// Sets: length prefix, then each key
template <EncodeSink Sink, typename K, typename C, typename A>
void write(Sink& sink, const std::set<K, C, A>& value) {
    detail::write_sequence(sink, value);
}

template <EncodeSink Sink, typename K, typename H, typename E, typename A>
void write(Sink& sink, const std::unordered_set<K, H, E, A>& value) {
    detail::write_sequence(sink, value);
}

// std::variant<Ts...>: alternative index, then the held value
template <EncodeSink Sink, typename... Ts>
void write(Sink& sink, const std::variant<Ts...>& value) {
    if (value.valueless_by_exception()) {
        throw error::custom("cannot encode a valueless variant");
    }
    sink.write_variant_index(value.index());
    std::visit([&sink](const auto& v) { write(sink, v); }, value);
}

template <EncodeSink Sink>
void write(Sink&, const std::monostate&) {}

// std::unique_ptr<T>: transparent
template <EncodeSink Sink, typename T, typename D>
void write(Sink& sink, const std::unique_ptr<T, D>& value) {
    if (!value) {
        throw error::custom("cannot encode a null unique_ptr");
    }
    write(sink, *value);
}

// Compound types with fields()
template <EncodeSink Sink, typename T>
    requires HasConstFields<T>
void write(Sink& sink, const T& value) {
    std::apply([&sink](const auto&... f) {
        (detail::write_field(sink, f), ...);
    }, fields(value));
}

// ============================================================================
// Read implementations
// ============================================================================

// Scalar types
template <DecodeSource Source, typename T>
    requires std::is_arithmetic_v<T>
void read(Source& source, T& value) {
    source.read(value);
}

// std::string
template <DecodeSource Source>
void read(Source& source, std::string& value) {
    source.read_string(value);
}

// Enums
template <DecodeSource Source, typename E>
    requires std::is_enum_v<E>
void read(Source& source, E& value) {
    using U = std::underlying_type_t<E>;
    auto raw = source.read_variant_index();
    if (raw > static_cast<uint64_t>(std::numeric_limits<U>::max())) {
        throw error::size_overflow("enum discriminant " + std::to_string(raw) + " does not fit underlying type");
    }
    value = static_cast<E>(static_cast<U>(raw));
}

// std::optional<T>
template <DecodeSource Source, typename T>
void read(Source& source, std::optional<T>& value) {
    bool has_value = false;
    source.read(has_value);
    if (has_value) {
        if (!value) {
            value.emplace();
        }
        read(source, *value);
    } else {
        value.reset();
    }
}

// std::pair and std::tuple
template <DecodeSource Source, typename T1, typename T2>
void read(Source& source, std::pair<T1, T2>& value) {
    read(source, value.first);
    read(source, value.second);
}

template <DecodeSource Source, typename... Ts>
void read(Source& source, std::tuple<Ts...>& value) {
    std::apply([&source](auto&... elems) {
        (read(source, elems), ...);
    }, value);
}

// Sequences
template <DecodeSource Source, typename T, typename A>
void read(Source& source, std::vector<T, A>& value) {
    detail::read_sequence_into(source, value);
}

// std::vector<bool> elements are proxies and cannot be decoded in place
template <DecodeSource Source, typename A>
void read(Source& source, std::vector<bool, A>& value) {
    auto seq = sequence_reader<bool, Source>(source);
    detail::check_length(value, seq.remaining());
    value.clear();
    value.reserve(std::min(seq.remaining(), binary_format::MAX_PREALLOCATED_ELEMENTS));
    auto elem = false;
    while (seq.next(elem)) {
        value.push_back(elem);
    }
}

template <DecodeSource Source, typename T, typename A>
void read(Source& source, std::deque<T, A>& value) {
    detail::read_sequence_into(source, value);
}

template <DecodeSource Source, typename T, typename A>
void read(Source& source, std::list<T, A>& value) {
    detail::read_sequence_into(source, value);
}

// std::array<T, N>
template <DecodeSource Source, typename T, std::size_t N>
void read(Source& source, std::array<T, N>& value) {
    for (auto& elem : value) {
        read(source, elem);
    }
}

// Maps
template <DecodeSource Source, typename K, typename V, typename C, typename A>
void read(Source& source, std::map<K, V, C, A>& value) {
    detail::read_map_into(source, value);
}

template <DecodeSource Source, typename K, typename V, typename H, typename E, typename A>
void read(Source& source, std::unordered_map<K, V, H, E, A>& value) {
    detail::read_map_into(source, value);
}

// Sets
template <DecodeSource Source, typename K, typename C, typename A>
void read(Source& source, std::set<K, C, A>& value) {
    detail::read_set_into(source, value);
}

template <DecodeSource Source, typename K, typename H, typename E, typename A>
void read(Source& source, std::unordered_set<K, H, E, A>& value) {
    detail::read_set_into(source, value);
}

// std::variant<Ts...>
template <DecodeSource Source, typename... Ts>
void read(Source& source, std::variant<Ts...>& value) {
    auto index = source.read_variant_index();
    if (index >= sizeof...(Ts)) {
        throw error::custom("variant index " + std::to_string(index) + " out of range for " +
                            std::to_string(sizeof...(Ts)) + " alternatives");
    }
    detail::read_variant_by_index(source, value, index);
}

template <DecodeSource Source>
void read(Source&, std::monostate&) {}

// std::unique_ptr<T>: decodes into the existing pointee if there is one
template <DecodeSource Source, typename T, typename D>
void read(Source& source, std::unique_ptr<T, D>& value) {
    if (!value) {
        value.reset(new T());
    }
    read(source, *value);
}

// Compound types with fields()
template <DecodeSource Source, typename T>
    requires HasFields<T>
void read(Source& source, T& value) {
    std::apply([&source](const auto&... f) {
        (detail::read_field(source, f), ...);
    }, fields(value));
}

} // namespace terse
