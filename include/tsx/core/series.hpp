#pragma once

#include <tsx/core/data_point.hpp>
#include <tsx/core/error.hpp>
#include <tsx/core/index.hpp>
#include <tsx/core/value_storage.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <expected>
#include <iterator>
#include <optional>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace tsx {

template <SeriesKey K, typename V>
class Series;

/// Non-owning view over a contiguous run of a Series.
///
/// Valid only while the viewed Series is alive and unmodified.
template <SeriesKey K, typename V>
class SeriesView {
   public:
    using key_type = K;
    using value_type = V;
    using size_type = std::size_t;

    SeriesView() = default;
    SeriesView(std::span<const K> keys, std::span<const V> values) noexcept
        : keys_(keys), values_(values) {}

    [[nodiscard]] auto size() const noexcept -> size_type { return keys_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return keys_.empty(); }

    [[nodiscard]] auto keys() const noexcept -> std::span<const K> { return keys_; }
    [[nodiscard]] auto values() const noexcept -> std::span<const V> { return values_; }

    [[nodiscard]] auto key(size_type pos) const noexcept -> const K& { return keys_[pos]; }
    [[nodiscard]] auto value(size_type pos) const noexcept -> const V& { return values_[pos]; }

    /// Copy of the point at `pos` (unchecked).
    [[nodiscard]] auto operator[](size_type pos) const -> DataPoint<K, V> {
        return DataPoint<K, V>{keys_[pos], values_[pos]};
    }

   private:
    std::span<const K> keys_;
    std::span<const V> values_;
};

/// Cursor over every point of a Series in storage order.
template <SeriesKey K, typename V>
class SeriesCursor {
   public:
    using point_type = DataPoint<K, V>;

    explicit SeriesCursor(const Series<K, V>& series) noexcept : series_(&series) {}

    auto next() -> std::optional<point_type> {
        if (pos_ >= series_->size()) {
            return std::nullopt;
        }
        auto point = point_type{series_->keys()[pos_], series_->values()[pos_]};
        ++pos_;
        return point;
    }

   private:
    const Series<K, V>* series_;
    std::size_t pos_ = 0;
};

/// Cursor that ends at the first key lower than its predecessor.
///
/// Equal keys are passed through. Once the cursor has stopped it stays
/// exhausted, which makes it a way to salvage the ordered prefix of a Series
/// built through an unchecked path.
template <SeriesKey K, typename V>
class OrderedCursor {
   public:
    using point_type = DataPoint<K, V>;

    explicit OrderedCursor(const Series<K, V>& series) noexcept : series_(&series) {}

    auto next() -> std::optional<point_type> {
        if (done_ || pos_ >= series_->size()) {
            done_ = true;
            return std::nullopt;
        }
        const auto keys = series_->keys();
        if (pos_ > 0 && keys[pos_] < keys[pos_ - 1]) {
            done_ = true;
            return std::nullopt;
        }
        auto point = point_type{keys[pos_], series_->values()[pos_]};
        ++pos_;
        return point;
    }

   private:
    const Series<K, V>* series_;
    std::size_t pos_ = 0;
    bool done_ = false;
};

/// An ordered, time-indexed sequence of (key, value) points.
///
/// Series<K, V> owns parallel key and value vectors. Keys are strictly
/// ascending when the Series was built through a checked path; the unchecked
/// constructors trust the caller. A Series is immutable after construction:
/// every transform returns a new Series or a lazy cursor.
template <SeriesKey K, typename V>
class Series {
   public:
    using key_type = K;
    using value_type = V;
    using point_type = DataPoint<K, V>;
    using size_type = std::size_t;
    using result_type = std::expected<Series, SeriesError>;

    Series() = default;

    // ─── Construction ─────────────────────────────────────────────────────────

    [[nodiscard]] static auto empty_series() -> Series { return Series{}; }

    /// Build from parallel key/value vectors. Checks lengths only; key order
    /// is the caller's responsibility.
    [[nodiscard]] static auto from_parallel(std::vector<K> keys, std::vector<V> values)
        -> result_type {
        if (keys.size() != values.size()) {
            return std::unexpected(length_mismatch(keys.size(), values.size()));
        }
        return Series(std::move(keys), std::move(values));
    }

    /// Build from parallel key/value vectors, rejecting mismatched lengths and
    /// keys that are not strictly ascending.
    [[nodiscard]] static auto from_parallel_checked(std::vector<K> keys, std::vector<V> values)
        -> result_type {
        if (keys.size() != values.size()) {
            return std::unexpected(length_mismatch(keys.size(), values.size()));
        }
        if (auto violation = first_order_violation(std::span<const K>(keys))) {
            return std::unexpected(std::move(*violation));
        }
        return Series(std::move(keys), std::move(values));
    }

    /// Build from parallel vectors without any check. Lengths must match.
    [[nodiscard]] static auto from_parallel_unchecked(std::vector<K> keys, std::vector<V> values)
        -> Series {
        return Series(std::move(keys), std::move(values));
    }

    /// Build from points, reporting the first ordering violation.
    [[nodiscard]] static auto from_points(std::vector<point_type> points) -> result_type {
        for (std::size_t i = 1; i < points.size(); ++i) {
            if (points[i].key < points[i - 1].key) {
                return std::unexpected(unordered_input(i));
            }
            if (points[i].key == points[i - 1].key) {
                return std::unexpected(duplicate_key(i));
            }
        }
        return from_points_unchecked(std::move(points));
    }

    /// Build from points in the given order without validation.
    [[nodiscard]] static auto from_points_unchecked(std::vector<point_type> points) -> Series {
        std::vector<K> keys;
        std::vector<V> values;
        keys.reserve(points.size());
        values.reserve(points.size());
        for (auto& point : points) {
            keys.push_back(std::move(point.key));
            values.push_back(std::move(point.value));
        }
        return Series(std::move(keys), std::move(values));
    }

    // ─── Inspection ───────────────────────────────────────────────────────────

    [[nodiscard]] auto size() const noexcept -> size_type { return keys_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return keys_.empty(); }

    /// Zero-copy view of the keys.
    [[nodiscard]] auto keys() const noexcept -> std::span<const K> { return keys_; }
    /// Zero-copy view of the values.
    [[nodiscard]] auto values() const noexcept -> std::span<const V> {
        return {values_.data(), values_.size()};
    }

    /// First and last key, or nullopt when empty.
    [[nodiscard]] auto front_key() const -> std::optional<K> {
        if (keys_.empty()) {
            return std::nullopt;
        }
        return keys_.front();
    }
    [[nodiscard]] auto back_key() const -> std::optional<K> {
        if (keys_.empty()) {
            return std::nullopt;
        }
        return keys_.back();
    }

    // ─── Lookup ───────────────────────────────────────────────────────────────

    /// Value stored under exactly `key`, by binary search.
    [[nodiscard]] auto at(const K& key) const -> std::optional<V> {
        auto it = std::ranges::lower_bound(keys_, key);
        if (it == keys_.end() || *it != key) {
            return std::nullopt;
        }
        return values_[static_cast<size_type>(it - keys_.begin())];
    }

    /// Value under the greatest key <= `key`.
    [[nodiscard]] auto at_or_first_prior(const K& key) const -> std::optional<V> {
        auto it = std::ranges::upper_bound(keys_, key);
        if (it == keys_.begin()) {
            return std::nullopt;
        }
        return values_[static_cast<size_type>(it - keys_.begin()) - 1];
    }

    /// Point at position `pos`, or nullopt past the end.
    [[nodiscard]] auto at_index(size_type pos) const -> std::optional<point_type> {
        if (pos >= keys_.size()) {
            return std::nullopt;
        }
        return point_type{keys_[pos], values_[pos]};
    }

    /// Points with start <= key <= end.
    [[nodiscard]] auto between(const K& start, const K& end) const -> Series {
        if (end < start) {
            return Series{};
        }
        auto first = static_cast<size_type>(std::ranges::lower_bound(keys_, start) - keys_.begin());
        auto last = static_cast<size_type>(std::ranges::upper_bound(keys_, end) - keys_.begin());
        return Series(std::vector<K>(keys_.begin() + first, keys_.begin() + last),
                      std::vector<V>(values_.begin() + first, values_.begin() + last));
    }

    /// Positions [first, last) as a view. Throws std::out_of_range.
    [[nodiscard]] auto slice(size_type first, size_type last) const -> SeriesView<K, V> {
        if (first > last || last > keys_.size()) {
            throw std::out_of_range("Series::slice: range out of bounds");
        }
        return SeriesView<K, V>(std::span<const K>(keys_).subspan(first, last - first),
                                values().subspan(first, last - first));
    }

    [[nodiscard]] auto view() const noexcept -> SeriesView<K, V> {
        return SeriesView<K, V>(keys_, values());
    }

    /// Copy of every point, in storage order.
    [[nodiscard]] auto to_points() const -> std::vector<point_type> {
        std::vector<point_type> points;
        points.reserve(keys_.size());
        for (size_type i = 0; i < keys_.size(); ++i) {
            points.push_back(point_type{keys_[i], values_[i]});
        }
        return points;
    }

    // ─── Transforms ───────────────────────────────────────────────────────────

    /// Apply `func` to every value; keys are carried over unchanged.
    template <typename F>
        requires std::invocable<F&, const V&>
    [[nodiscard]] auto map(F func) const -> Series<K, std::invoke_result_t<F&, const V&>> {
        using U = std::invoke_result_t<F&, const V&>;
        std::vector<U> result;
        result.reserve(values_.size());
        std::ranges::transform(values(), std::back_inserter(result), func);
        return Series<K, U>::from_parallel_unchecked(keys_, std::move(result));
    }

    /// Apply `func(key, value)` to every point; keys are carried over unchanged.
    template <typename F>
        requires std::invocable<F&, const K&, const V&>
    [[nodiscard]] auto map_with_key(F func) const
        -> Series<K, std::invoke_result_t<F&, const K&, const V&>> {
        using U = std::invoke_result_t<F&, const K&, const V&>;
        std::vector<U> result;
        result.reserve(values_.size());
        for (size_type i = 0; i < keys_.size(); ++i) {
            result.push_back(func(keys_[i], values_[i]));
        }
        return Series<K, U>::from_parallel_unchecked(keys_, std::move(result));
    }

    // ─── Sequences ────────────────────────────────────────────────────────────

    /// Cursors borrow the series, so they cannot be taken from a temporary.
    [[nodiscard]] auto cursor() const& noexcept -> SeriesCursor<K, V> {
        return SeriesCursor<K, V>(*this);
    }
    auto cursor() const&& -> SeriesCursor<K, V> = delete;

    [[nodiscard]] auto ordered_cursor() const& noexcept -> OrderedCursor<K, V> {
        return OrderedCursor<K, V>(*this);
    }
    auto ordered_cursor() const&& -> OrderedCursor<K, V> = delete;

    /// Input iterator yielding copies of each point.
    class const_iterator {
       public:
        using iterator_concept = std::input_iterator_tag;
        using iterator_category = std::input_iterator_tag;
        using value_type = point_type;
        using difference_type = std::ptrdiff_t;
        using reference = point_type;

        const_iterator() = default;
        const_iterator(const Series* series, size_type pos) noexcept
            : series_(series), pos_(pos) {}

        auto operator*() const -> point_type {
            return point_type{series_->keys_[pos_], series_->values_[pos_]};
        }
        auto operator++() -> const_iterator& {
            ++pos_;
            return *this;
        }
        auto operator++(int) -> const_iterator {
            auto copy = *this;
            ++pos_;
            return copy;
        }
        auto operator==(const const_iterator& other) const noexcept -> bool {
            return pos_ == other.pos_;
        }

       private:
        const Series* series_ = nullptr;
        size_type pos_ = 0;
    };

    [[nodiscard]] auto begin() const noexcept -> const_iterator { return {this, 0}; }
    [[nodiscard]] auto end() const noexcept -> const_iterator { return {this, keys_.size()}; }

    auto operator==(const Series&) const -> bool = default;

   private:
    Series(std::vector<K> keys, std::vector<V> values)
        : keys_(std::move(keys)), values_(detail::make_value_storage<V>(std::move(values))) {}

    std::vector<K> keys_;
    detail::value_storage_t<V> values_;
};

}  // namespace tsx
