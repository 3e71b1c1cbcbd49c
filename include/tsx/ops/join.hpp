#pragma once

#include <tsx/core/index.hpp>
#include <tsx/core/series.hpp>

#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace tsx::ops {

/// How matching keys are found.
enum class JoinStrategy : std::uint8_t {
    Auto,   ///< hash when one side is small relative to the other, merge otherwise
    Merge,  ///< two-pointer walk over both ordered inputs
    Hash,   ///< lookup table over one input, single scan of the other
};

[[nodiscard]] auto to_string(JoinStrategy strategy) noexcept -> std::string_view;

struct JoinOptions {
    JoinStrategy strategy = JoinStrategy::Auto;
    /// Auto picks Hash when min(n, m) <= hash_size_ratio * max(n, m).
    double hash_size_ratio = 0.1;
    /// Short-circuit to positional pairs when both key indexes are equal.
    bool precompare = true;
};

/// Resolve Auto (and an unusable Hash request) to a concrete strategy.
[[nodiscard]] auto choose_strategy(std::size_t left_rows, std::size_t right_rows,
                                   const JoinOptions& options, bool hashable_key) -> JoinStrategy;

struct IndexPair {
    std::size_t left = 0;
    std::size_t right = 0;

    auto operator==(const IndexPair&) const -> bool = default;
};

struct LeftIndexPair {
    std::size_t left = 0;
    std::optional<std::size_t> right;

    auto operator==(const LeftIndexPair&) const -> bool = default;
};

/// Index-level join over two strictly ascending key sequences.
///
/// Produces position pairs in ascending key order; the Series-level joins
/// below turn them into output points. The engine holds spans and must not
/// outlive the keys it was built from.
template <SeriesKey K>
class JoinEngine {
   public:
    JoinEngine(std::span<const K> left, std::span<const K> right) noexcept
        : left_(left), right_(right) {}

    /// Both indexes hold the same keys.
    [[nodiscard]] auto same_index() const -> bool { return std::ranges::equal(left_, right_); }

    [[nodiscard]] auto inner(const JoinOptions& options = {}) const -> std::vector<IndexPair> {
        if (options.precompare && same_index()) {
            spdlog::debug("join: identical indexes ({} rows), skipping key matching",
                          left_.size());
            return identity_pairs();
        }
        if (choose_strategy(left_.size(), right_.size(), options, HashableKey<K>) ==
            JoinStrategy::Hash) {
            if constexpr (HashableKey<K>) {
                return inner_hash();
            }
        }
        return inner_merge();
    }

    [[nodiscard]] auto left_outer(const JoinOptions& options = {}) const
        -> std::vector<LeftIndexPair> {
        if (options.precompare && same_index()) {
            spdlog::debug("join: identical indexes ({} rows), skipping key matching",
                          left_.size());
            std::vector<LeftIndexPair> pairs;
            pairs.reserve(left_.size());
            for (std::size_t i = 0; i < left_.size(); ++i) {
                pairs.push_back(LeftIndexPair{i, i});
            }
            return pairs;
        }
        if (choose_strategy(left_.size(), right_.size(), options, HashableKey<K>) ==
            JoinStrategy::Hash) {
            if constexpr (HashableKey<K>) {
                return left_hash();
            }
        }
        return left_merge();
    }

    [[nodiscard]] auto inner_merge() const -> std::vector<IndexPair> {
        std::vector<IndexPair> pairs;
        pairs.reserve(std::min(left_.size(), right_.size()));
        std::size_t i = 0;
        std::size_t j = 0;
        while (i < left_.size() && j < right_.size()) {
            if (left_[i] < right_[j]) {
                ++i;
            } else if (right_[j] < left_[i]) {
                ++j;
            } else {
                pairs.push_back(IndexPair{i, j});
                ++i;
                ++j;
            }
        }
        return pairs;
    }

    [[nodiscard]] auto left_merge() const -> std::vector<LeftIndexPair> {
        std::vector<LeftIndexPair> pairs;
        pairs.reserve(left_.size());
        std::size_t j = 0;
        for (std::size_t i = 0; i < left_.size(); ++i) {
            while (j < right_.size() && right_[j] < left_[i]) {
                ++j;
            }
            if (j < right_.size() && right_[j] == left_[i]) {
                pairs.push_back(LeftIndexPair{i, j});
            } else {
                pairs.push_back(LeftIndexPair{i, std::nullopt});
            }
        }
        return pairs;
    }

    /// Builds the table over the smaller input and scans the larger one.
    /// Scanning an ordered input keeps the output in key order.
    [[nodiscard]] auto inner_hash() const -> std::vector<IndexPair>
        requires HashableKey<K>
    {
        std::vector<IndexPair> pairs;
        const bool build_left = left_.size() <= right_.size();
        const auto build = build_left ? left_ : right_;
        const auto probe = build_left ? right_ : left_;
        auto index = build_index(build);
        pairs.reserve(build.size());
        for (std::size_t p = 0; p < probe.size(); ++p) {
            auto it = index.find(probe[p]);
            if (it == index.end()) {
                continue;
            }
            pairs.push_back(build_left ? IndexPair{it->second, p} : IndexPair{p, it->second});
        }
        return pairs;
    }

    [[nodiscard]] auto left_hash() const -> std::vector<LeftIndexPair>
        requires HashableKey<K>
    {
        auto index = build_index(right_);
        std::vector<LeftIndexPair> pairs;
        pairs.reserve(left_.size());
        for (std::size_t i = 0; i < left_.size(); ++i) {
            auto it = index.find(left_[i]);
            if (it == index.end()) {
                pairs.push_back(LeftIndexPair{i, std::nullopt});
            } else {
                pairs.push_back(LeftIndexPair{i, it->second});
            }
        }
        return pairs;
    }

   private:
    [[nodiscard]] static auto build_index(std::span<const K> keys)
        -> robin_hood::unordered_flat_map<K, std::size_t>
        requires HashableKey<K>
    {
        robin_hood::unordered_flat_map<K, std::size_t> index;
        index.reserve(keys.size());
        for (std::size_t i = 0; i < keys.size(); ++i) {
            index.emplace(keys[i], i);
        }
        return index;
    }

    [[nodiscard]] auto identity_pairs() const -> std::vector<IndexPair> {
        std::vector<IndexPair> pairs;
        pairs.reserve(left_.size());
        for (std::size_t i = 0; i < left_.size(); ++i) {
            pairs.push_back(IndexPair{i, i});
        }
        return pairs;
    }

    std::span<const K> left_;
    std::span<const K> right_;
};

// ─── Series joins ─────────────────────────────────────────────────────────────

/// Points whose key is present in both inputs, combined with func(lv, rv).
template <SeriesKey K, typename V1, typename V2, typename F>
    requires std::invocable<F&, const V1&, const V2&>
[[nodiscard]] auto cross_apply_inner(const Series<K, V1>& left, const Series<K, V2>& right, F func,
                                     const JoinOptions& options = {})
    -> Series<K, std::invoke_result_t<F&, const V1&, const V2&>> {
    using V3 = std::invoke_result_t<F&, const V1&, const V2&>;
    tsx::detail::require_ordered(left.keys(), "cross_apply_inner(left)");
    tsx::detail::require_ordered(right.keys(), "cross_apply_inner(right)");

    const auto pairs = JoinEngine<K>(left.keys(), right.keys()).inner(options);
    std::vector<K> keys;
    std::vector<V3> values;
    keys.reserve(pairs.size());
    values.reserve(pairs.size());
    for (const auto& pair : pairs) {
        keys.push_back(left.keys()[pair.left]);
        values.push_back(func(left.values()[pair.left], right.values()[pair.right]));
    }
    return Series<K, V3>::from_parallel_unchecked(std::move(keys), std::move(values));
}

/// One point per left key, combined with func(lv, rv) where rv points at the
/// matching right value or is null when the key is absent on the right.
template <SeriesKey K, typename V1, typename V2, typename F>
    requires std::invocable<F&, const V1&, const V2*>
[[nodiscard]] auto cross_apply_left(const Series<K, V1>& left, const Series<K, V2>& right, F func,
                                    const JoinOptions& options = {})
    -> Series<K, std::invoke_result_t<F&, const V1&, const V2*>> {
    using V3 = std::invoke_result_t<F&, const V1&, const V2*>;
    tsx::detail::require_ordered(left.keys(), "cross_apply_left(left)");
    tsx::detail::require_ordered(right.keys(), "cross_apply_left(right)");

    const auto pairs = JoinEngine<K>(left.keys(), right.keys()).left_outer(options);
    std::vector<V3> values;
    values.reserve(pairs.size());
    for (const auto& pair : pairs) {
        const V2* matched = pair.right ? &right.values()[*pair.right] : nullptr;
        values.push_back(func(left.values()[pair.left], matched));
    }
    return Series<K, V3>::from_parallel_unchecked(
        std::vector<K>(left.keys().begin(), left.keys().end()), std::move(values));
}

namespace detail {

template <SeriesKey K, typename... Ts>
auto join_fold(Series<K, std::tuple<Ts...>> acc) -> Series<K, std::tuple<Ts...>> {
    return acc;
}

template <SeriesKey K, typename... Ts, typename V, typename... Rest>
auto join_fold(Series<K, std::tuple<Ts...>> acc, const Series<K, V>& next,
               const Series<K, Rest>&... rest) -> Series<K, std::tuple<Ts..., V, Rest...>> {
    auto joined = cross_apply_inner(acc, next, [](const std::tuple<Ts...>& row, const V& value) {
        return std::tuple_cat(row, std::tuple<V>(value));
    });
    return join_fold(std::move(joined), rest...);
}

}  // namespace detail

/// Inner join of any number of Series on their common keys. Each output value
/// is a tuple holding one value per input, in argument order.
template <SeriesKey K, typename V1, typename... Vs>
[[nodiscard]] auto inner_join_all(const Series<K, V1>& first, const Series<K, Vs>&... rest)
    -> Series<K, std::tuple<V1, Vs...>> {
    auto seed = first.map([](const V1& value) { return std::tuple<V1>(value); });
    return detail::join_fold(std::move(seed), rest...);
}

/// Ordered union of two Series. Where both hold a key, select(a_value,
/// b_value) decides the value kept.
template <SeriesKey K, typename V, typename F>
    requires std::invocable<F&, const V&, const V&>
[[nodiscard]] auto interweave(const Series<K, V>& a, const Series<K, V>& b, F select)
    -> Series<K, V> {
    tsx::detail::require_ordered(a.keys(), "interweave(a)");
    tsx::detail::require_ordered(b.keys(), "interweave(b)");

    const auto ak = a.keys();
    const auto bk = b.keys();
    std::vector<K> keys;
    std::vector<V> values;
    keys.reserve(ak.size() + bk.size());
    values.reserve(ak.size() + bk.size());
    std::size_t i = 0;
    std::size_t j = 0;
    while (i < ak.size() || j < bk.size()) {
        if (j == bk.size() || (i < ak.size() && ak[i] < bk[j])) {
            keys.push_back(ak[i]);
            values.push_back(a.values()[i]);
            ++i;
        } else if (i == ak.size() || bk[j] < ak[i]) {
            keys.push_back(bk[j]);
            values.push_back(b.values()[j]);
            ++j;
        } else {
            keys.push_back(ak[i]);
            values.push_back(select(a.values()[i], b.values()[j]));
            ++i;
            ++j;
        }
    }
    return Series<K, V>::from_parallel_unchecked(std::move(keys), std::move(values));
}

}  // namespace tsx::ops
