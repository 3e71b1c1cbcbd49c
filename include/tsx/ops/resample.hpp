#pragma once

#include <tsx/core/index.hpp>
#include <tsx/core/series.hpp>
#include <tsx/core/time.hpp>

#include <concepts>
#include <cstddef>
#include <numeric>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace tsx::ops {

/// Group consecutive points by bucket key and aggregate each group.
///
/// Points are scanned once in order; a group ends whenever bucket(key)
/// differs from the previous point's bucket. Each group produces one point
/// keyed by its bucket with value agg(view of the group). The output stays
/// ordered when `bucket` is monotonic non-decreasing; a non-monotonic bucket
/// function yields repeated bucket keys, which are kept as they come.
template <SeriesKey K, typename V, typename BucketFn, typename AggFn>
    requires std::invocable<BucketFn&, const K&> &&
             SeriesKey<std::invoke_result_t<BucketFn&, const K&>> &&
             std::invocable<AggFn&, const SeriesView<K, V>&>
[[nodiscard]] auto resample_and_agg(const Series<K, V>& series, BucketFn bucket, AggFn agg)
    -> Series<std::invoke_result_t<BucketFn&, const K&>,
              std::invoke_result_t<AggFn&, const SeriesView<K, V>&>> {
    using K2 = std::invoke_result_t<BucketFn&, const K&>;
    using V2 = std::invoke_result_t<AggFn&, const SeriesView<K, V>&>;
    tsx::detail::require_ordered(series.keys(), "resample_and_agg");

    std::vector<K2> keys;
    std::vector<V2> values;
    const auto input = series.keys();
    std::optional<K2> current;
    std::size_t start = 0;
    auto flush = [&](std::size_t end) {
        keys.push_back(*current);
        values.push_back(agg(series.slice(start, end)));
        start = end;
    };
    for (std::size_t i = 0; i < input.size(); ++i) {
        K2 bucket_key = bucket(input[i]);
        if (current && bucket_key != *current) {
            flush(i);
        }
        current = std::move(bucket_key);
    }
    if (current) {
        flush(input.size());
    }
    return Series<K2, V2>::from_parallel_unchecked(std::move(keys), std::move(values));
}

// ─── Bucket functions ─────────────────────────────────────────────────────────

/// Bucket keyed by the start of its interval.
template <typename Step>
[[nodiscard]] auto bucket_by_floor(Step step) {
    return [step](const auto& key) { return floor_to(key, step); };
}

/// Bucket [start, start + step) keyed by its end, the usual bar-close label.
template <typename Step>
[[nodiscard]] auto bucket_by_end(Step step) {
    return [step](const auto& key) { return bucket_end(key, step); };
}

/// Bucket keyed by the nearest multiple of `step`.
template <typename Step>
[[nodiscard]] auto bucket_by_nearest(Step step) {
    return [step](const auto& key) { return round_to(key, step); };
}

// ─── Aggregations ─────────────────────────────────────────────────────────────

struct First {
    template <typename K, typename V>
    auto operator()(const SeriesView<K, V>& group) const -> V {
        return group.values().front();
    }
};

struct Last {
    template <typename K, typename V>
    auto operator()(const SeriesView<K, V>& group) const -> V {
        return group.values().back();
    }
};

struct Sum {
    template <typename K, typename V>
    auto operator()(const SeriesView<K, V>& group) const -> V {
        return std::accumulate(group.values().begin(), group.values().end(), V{});
    }
};

struct Mean {
    template <typename K, typename V>
    auto operator()(const SeriesView<K, V>& group) const -> double {
        return static_cast<double>(Sum{}(group)) / static_cast<double>(group.size());
    }
};

struct Count {
    template <typename K, typename V>
    auto operator()(const SeriesView<K, V>& group) const -> std::size_t {
        return group.size();
    }
};

}  // namespace tsx::ops
