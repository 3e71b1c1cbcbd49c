#pragma once

#include <tsx/core/index.hpp>
#include <tsx/core/series.hpp>

#include <robin_hood.h>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>

namespace tsx {

/// Values that can take part in content hashing.
template <typename T>
concept Hashable = requires(const T& value) {
    { robin_hood::hash<T>{}(value) } -> std::convertible_to<std::size_t>;
};

namespace detail {

inline auto hash_mix(std::uint64_t seed, std::uint64_t value) noexcept -> std::uint64_t {
    return robin_hood::hash_int(seed ^
                                (value + 0x9e3779b97f4a7c15ULL + (seed << 6U) + (seed >> 2U)));
}

}  // namespace detail

/// Hash of a key sequence. Equal sequences always hash equal.
template <HashableKey K>
[[nodiscard]] auto index_hash(std::span<const K> keys) -> std::uint64_t {
    robin_hood::hash<K> hasher;
    std::uint64_t seed = keys.size();
    for (const auto& key : keys) {
        seed = detail::hash_mix(seed, hasher(key));
    }
    return seed;
}

/// Hash of every key and value of a Series. Equal Series always hash equal.
template <HashableKey K, Hashable V>
[[nodiscard]] auto content_hash(const Series<K, V>& series) -> std::uint64_t {
    robin_hood::hash<V> value_hasher;
    std::uint64_t seed = index_hash(series.keys());
    for (const auto& value : series.values()) {
        seed = detail::hash_mix(seed, value_hasher(value));
    }
    return seed;
}

/// Equality with a cheap rejection step: differing sizes or content hashes
/// mean not equal; equal hashes fall through to full comparison, so a hash
/// collision never reports a false "equal".
template <HashableKey K, Hashable V>
    requires std::equality_comparable<V>
[[nodiscard]] auto equal_with_precompare(const Series<K, V>& a, const Series<K, V>& b) -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    if (content_hash(a) != content_hash(b)) {
        return false;
    }
    return a == b;
}

}  // namespace tsx
