#pragma once

#include <tsx/core/index.hpp>
#include <tsx/core/series.hpp>
#include <tsx/core/time.hpp>
#include <tsx/ops/join.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace tsx::ops {

/// Which right-hand key an as-of join falls back to when there is no exact
/// match.
enum class MergeAsofMode : std::uint8_t {
    NoRoll,     ///< exact matches only
    RollPrior,  ///< greatest right key <= left key
    RollNext,   ///< least right key >= left key
};

/// Decides whether a non-exact candidate is close enough to the left key.
/// Called as matcher(left_key, candidate_key). An empty function accepts
/// every candidate.
template <typename K>
using AsofMatcher = std::function<bool(const K& left, const K& candidate)>;

/// Matcher accepting candidates at most `tolerance` away (inclusive).
template <SteppedKey K, typename Tolerance>
    requires requires(key_step_t<K> distance, Tolerance tolerance) {
        { distance <= tolerance } -> std::convertible_to<bool>;
    }
[[nodiscard]] auto within(Tolerance tolerance) -> AsofMatcher<K> {
    return [tolerance](const K& left, const K& candidate) {
        return key_distance(left, candidate) <= tolerance;
    };
}

/// Position pairs of an as-of join; one entry per left key, in order.
///
/// A forward scan with one trailing pointer into `right`, so the cost is
/// O(n + m). Throws std::invalid_argument when a matcher is supplied with
/// MergeAsofMode::NoRoll.
template <SeriesKey K>
[[nodiscard]] auto asof_pairs(std::span<const K> left, std::span<const K> right,
                              const std::type_identity_t<AsofMatcher<K>>& matcher,
                              MergeAsofMode mode)
    -> std::vector<LeftIndexPair> {
    if (mode == MergeAsofMode::NoRoll && matcher) {
        throw std::invalid_argument("merge_apply_asof: NoRoll does not take a matcher");
    }
    std::vector<LeftIndexPair> pairs;
    pairs.reserve(left.size());
    std::size_t j = 0;
    for (std::size_t i = 0; i < left.size(); ++i) {
        const K& key = left[i];
        std::optional<std::size_t> candidate;
        if (mode == MergeAsofMode::RollPrior) {
            while (j < right.size() && right[j] <= key) {
                ++j;
            }
            if (j > 0) {
                candidate = j - 1;
            }
        } else {
            while (j < right.size() && right[j] < key) {
                ++j;
            }
            if (j < right.size()) {
                candidate = j;
            }
        }

        std::optional<std::size_t> matched;
        if (candidate) {
            const K& found = right[*candidate];
            if (found == key) {
                matched = candidate;
            } else if (mode != MergeAsofMode::NoRoll && (!matcher || matcher(key, found))) {
                matched = candidate;
            }
        }
        pairs.push_back(LeftIndexPair{i, matched});
    }
    return pairs;
}

/// As-of join: every left point is combined with func(lv, rv), where rv
/// points at the right value chosen by `mode` and accepted by `matcher`, or
/// is null when there is none.
template <SeriesKey K, typename V1, typename V2, typename F>
    requires std::invocable<F&, const V1&, const V2*>
[[nodiscard]] auto merge_apply_asof(const Series<K, V1>& left, const Series<K, V2>& right,
                                    const std::type_identity_t<AsofMatcher<K>>& matcher, F func,
                                    MergeAsofMode mode)
    -> Series<K, std::invoke_result_t<F&, const V1&, const V2*>> {
    using V3 = std::invoke_result_t<F&, const V1&, const V2*>;
    tsx::detail::require_ordered(left.keys(), "merge_apply_asof(left)");
    tsx::detail::require_ordered(right.keys(), "merge_apply_asof(right)");

    const auto pairs = asof_pairs(left.keys(), right.keys(), matcher, mode);
    std::vector<V3> values;
    values.reserve(pairs.size());
    for (const auto& pair : pairs) {
        const V2* matched = pair.right ? &right.values()[*pair.right] : nullptr;
        values.push_back(func(left.values()[pair.left], matched));
    }
    return Series<K, V3>::from_parallel_unchecked(
        std::vector<K>(left.keys().begin(), left.keys().end()), std::move(values));
}

}  // namespace tsx::ops
