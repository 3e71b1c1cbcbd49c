#pragma once

#include <tsx/core/error.hpp>
#include <tsx/core/time.hpp>

#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace tsx {

/// Concept constraining valid Series key types.
template <typename K>
concept SeriesKey = std::totally_ordered<K> && std::copyable<K>;

/// Keys usable by the hash join and content hashing.
template <typename K>
concept HashableKey = SeriesKey<K> && requires(const K& key) {
    { std::hash<K>{}(key) } -> std::convertible_to<std::size_t>;
};

/// Keys with a step type, which sample-rate inference and as-of tolerances need.
template <typename K>
concept SteppedKey = SeriesKey<K> && requires(const K& a, const K& b) {
    { key_diff(a, b) } -> std::totally_ordered;
};

/// True when operations check their ordering preconditions at runtime.
#if defined(TSX_VALIDATE_INPUTS) && TSX_VALIDATE_INPUTS
inline constexpr bool kValidateInputs = true;
#else
inline constexpr bool kValidateInputs = false;
#endif

/// kValidateInputs as seen when the tsx library itself was compiled.
[[nodiscard]] auto library_validates_inputs() noexcept -> bool;

/// First position breaking strict ascending order, or nullopt when ordered.
template <SeriesKey K>
[[nodiscard]] auto first_order_violation(std::span<const K> keys) -> std::optional<SeriesError> {
    for (std::size_t i = 1; i < keys.size(); ++i) {
        if (keys[i] < keys[i - 1]) {
            return unordered_input(i);
        }
        if (keys[i] == keys[i - 1]) {
            return duplicate_key(i);
        }
    }
    return std::nullopt;
}

/// Every key strictly greater than its predecessor.
template <SeriesKey K>
[[nodiscard]] auto is_strictly_ascending(std::span<const K> keys) -> bool {
    return std::ranges::adjacent_find(keys, std::greater_equal<>{}) == keys.end();
}

/// No key occurs twice, regardless of order.
template <SeriesKey K>
[[nodiscard]] auto is_unique(std::span<const K> keys) -> bool {
    if constexpr (HashableKey<K>) {
        robin_hood::unordered_flat_set<K> seen;
        seen.reserve(keys.size());
        for (const auto& key : keys) {
            if (!seen.insert(key).second) {
                return false;
            }
        }
        return true;
    } else {
        std::vector<K> sorted(keys.begin(), keys.end());
        std::ranges::sort(sorted);
        return std::ranges::adjacent_find(sorted) == sorted.end();
    }
}

/// How often a given step between consecutive keys occurs.
template <typename Step>
struct SampleRate {
    std::size_t count = 0;
    Step step{};

    auto operator==(const SampleRate&) const -> bool = default;
};

/// Infer the sampling interval(s) of an index.
///
/// Returns each distinct step between consecutive keys with the number of
/// times it occurs, most frequent first (ties: larger step first).
template <SteppedKey K>
[[nodiscard]] auto sample_rates(std::span<const K> keys) -> std::vector<SampleRate<key_step_t<K>>> {
    using Step = key_step_t<K>;
    std::map<Step, std::size_t> counts;
    for (std::size_t i = 1; i < keys.size(); ++i) {
        ++counts[key_diff(keys[i - 1], keys[i])];
    }
    std::vector<SampleRate<Step>> rates;
    rates.reserve(counts.size());
    for (const auto& [step, count] : counts) {
        rates.push_back(SampleRate<Step>{count, step});
    }
    std::ranges::sort(rates, [](const auto& a, const auto& b) {
        return a.count != b.count ? a.count > b.count : a.step > b.step;
    });
    return rates;
}

/// True when every pair of consecutive keys is the same step apart.
template <SteppedKey K>
[[nodiscard]] auto is_mono_intervaled(std::span<const K> keys) -> bool {
    return sample_rates(keys).size() == 1;
}

namespace detail {

/// Throw OrderViolation for an unordered input in validating builds; a no-op
/// otherwise.
template <SeriesKey K>
void require_ordered(std::span<const K> keys, std::string_view operation) {
    if constexpr (kValidateInputs) {
        if (auto violation = first_order_violation(keys)) {
            spdlog::error("{}: input is not strictly ascending ({})", operation,
                          violation->format());
            throw OrderViolation(operation, std::move(*violation));
        }
    }
}

}  // namespace detail

}  // namespace tsx
