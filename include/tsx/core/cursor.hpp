#pragma once

#include <tsx/core/data_point.hpp>
#include <tsx/core/error.hpp>
#include <tsx/core/series.hpp>

#include <algorithm>
#include <concepts>
#include <expected>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace tsx {

/// A single-pass, pull-based source of DataPoints.
///
/// next() yields points until it returns nullopt; it is not restartable.
template <typename C>
concept PointCursor = requires(C& cursor) {
    typename C::point_type;
    { cursor.next() } -> std::same_as<std::optional<typename C::point_type>>;
};

template <PointCursor C>
using cursor_key_t = typename C::point_type::key_type;

template <PointCursor C>
using cursor_value_t = typename C::point_type::value_type;

template <PointCursor C>
using cursor_series_t = Series<cursor_key_t<C>, cursor_value_t<C>>;

/// Cursor draining an owned vector of points.
template <typename K, typename V>
class VectorCursor {
   public:
    using point_type = DataPoint<K, V>;

    explicit VectorCursor(std::vector<point_type> points) noexcept : points_(std::move(points)) {}

    auto next() -> std::optional<point_type> {
        if (pos_ >= points_.size()) {
            return std::nullopt;
        }
        return std::move(points_[pos_++]);
    }

   private:
    std::vector<point_type> points_;
    std::size_t pos_ = 0;
};

/// Cursor over a callable returning std::optional<DataPoint<K, V>>.
template <typename F>
class FunctionCursor {
   public:
    using point_type = typename std::invoke_result_t<F&>::value_type;

    explicit FunctionCursor(F func) : func_(std::move(func)) {}

    auto next() -> std::optional<point_type> {
        if (done_) {
            return std::nullopt;
        }
        auto point = func_();
        done_ = !point.has_value();
        return point;
    }

   private:
    F func_;
    bool done_ = false;
};

/// Wrap a generator-style callable as a cursor.
template <typename F>
[[nodiscard]] auto make_cursor(F func) -> FunctionCursor<F> {
    return FunctionCursor<F>(std::move(func));
}

/// Materialize a cursor trusting its order. O(n), no validation.
template <PointCursor C>
[[nodiscard]] auto collect_unchecked(C cursor) -> cursor_series_t<C> {
    using K = cursor_key_t<C>;
    using V = cursor_value_t<C>;
    std::vector<K> keys;
    std::vector<V> values;
    while (auto point = cursor.next()) {
        keys.push_back(std::move(point->key));
        values.push_back(std::move(point->value));
    }
    return Series<K, V>::from_parallel_unchecked(std::move(keys), std::move(values));
}

/// Materialize a cursor into a valid Series.
///
/// Points are stably sorted by key when they arrive out of order; equal keys
/// are rejected with ErrorKind::DuplicateKey at their position in key order.
template <PointCursor C>
[[nodiscard]] auto collect_checked(C cursor) -> std::expected<cursor_series_t<C>, SeriesError> {
    using K = cursor_key_t<C>;
    using V = cursor_value_t<C>;
    std::vector<DataPoint<K, V>> points;
    while (auto point = cursor.next()) {
        points.push_back(std::move(*point));
    }
    const auto by_key = [](const DataPoint<K, V>& a, const DataPoint<K, V>& b) {
        return a.key < b.key;
    };
    if (!std::ranges::is_sorted(points, by_key)) {
        std::ranges::stable_sort(points, by_key);
    }
    return Series<K, V>::from_points(std::move(points));
}

}  // namespace tsx
