#pragma once

#include <tsx/core/data_point.hpp>
#include <tsx/core/series.hpp>

#include <concepts>
#include <cstddef>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>

namespace tsx::ops {

// All cursors in this header read the Series they were built from and must
// not outlive it. Each one is single-pass and yields points in key order.

/// Positional shift: keys stay in place, values move by `offset` positions.
///
/// A positive offset leads: the point at key[i] carries value[i + offset].
/// A negative offset lags: the point at key[i] carries value[i - |offset|].
/// Positions without a source value are dropped, so n - |offset| points are
/// produced (none when |offset| >= n).
template <SeriesKey K, typename V>
class ShiftCursor {
   public:
    using point_type = DataPoint<K, V>;

    ShiftCursor(const Series<K, V>& series, std::ptrdiff_t offset) noexcept : series_(&series) {
        const auto n = static_cast<std::ptrdiff_t>(series.size());
        const auto magnitude = offset < 0 ? -offset : offset;
        if (magnitude >= n) {
            return;
        }
        source_delta_ = offset;
        pos_ = offset < 0 ? static_cast<std::size_t>(magnitude) : 0;
        end_ = offset < 0 ? series.size() : static_cast<std::size_t>(n - magnitude);
    }

    auto next() -> std::optional<point_type> {
        if (pos_ >= end_) {
            return std::nullopt;
        }
        const auto source =
            static_cast<std::size_t>(static_cast<std::ptrdiff_t>(pos_) + source_delta_);
        auto point = point_type{series_->keys()[pos_], series_->values()[source]};
        ++pos_;
        return point;
    }

   private:
    const Series<K, V>* series_;
    std::ptrdiff_t source_delta_ = 0;
    std::size_t pos_ = 0;
    std::size_t end_ = 0;
};

/// Emits (key[i], func(value[i - n], value[i])) for every i >= n.
template <SeriesKey K, typename V, typename F>
    requires std::invocable<F&, const V&, const V&>
class SkipApplyCursor {
   public:
    using point_type = DataPoint<K, std::invoke_result_t<F&, const V&, const V&>>;

    SkipApplyCursor(const Series<K, V>& series, std::size_t n, F func)
        : series_(&series), n_(n), pos_(n), func_(std::move(func)) {}

    auto next() -> std::optional<point_type> {
        if (pos_ >= series_->size()) {
            return std::nullopt;
        }
        const auto values = series_->values();
        auto point = point_type{series_->keys()[pos_], func_(values[pos_ - n_], values[pos_])};
        ++pos_;
        return point;
    }

   private:
    const Series<K, V>* series_;
    std::size_t n_;
    std::size_t pos_;
    F func_;
};

/// Fixed-count rolling window in buffer mode.
///
/// The window fills over the first `window` values, then slides one position
/// per step; once full, each step emits (key[i], func(last `window` values)).
/// The buffer handed to `func` is a span over the Series storage, oldest
/// value first. A zero window, or one longer than the Series, emits nothing.
template <SeriesKey K, typename V, typename F>
    requires std::invocable<F&, std::span<const V>>
class RollingCursor {
   public:
    using point_type = DataPoint<K, std::invoke_result_t<F&, std::span<const V>>>;

    RollingCursor(const Series<K, V>& series, std::size_t window, F func)
        : series_(&series),
          window_(window),
          pos_(window == 0 ? series.size() : window - 1),
          func_(std::move(func)) {}

    auto next() -> std::optional<point_type> {
        if (pos_ >= series_->size()) {
            return std::nullopt;
        }
        auto buffer = series_->values().subspan(pos_ + 1 - window_, window_);
        auto point = point_type{series_->keys()[pos_], func_(buffer)};
        ++pos_;
        return point;
    }

   private:
    const Series<K, V>* series_;
    std::size_t window_;
    std::size_t pos_;
    F func_;
};

/// Accumulator type of an incremental rolling window: `add` is called as
/// add(std::optional<Acc>, const V&) and returns std::optional<Acc>.
template <typename Add, typename V>
using rolling_acc_t = typename std::invoke_result_t<Add&, std::nullopt_t, const V&>::value_type;

/// Fixed-count rolling window in incremental mode.
///
/// Each step folds the incoming value in with `add`; once the window has
/// filled, the value leaving it is folded out with `remove`. From position
/// window - 1 on, a point is emitted whenever the accumulator holds a value.
/// `add` and `remove` are trusted to be inverse; the cursor does not check.
template <SeriesKey K, typename V, typename Add, typename Remove>
class UpdatingRollingCursor {
   public:
    using acc_type = rolling_acc_t<Add, V>;
    using point_type = DataPoint<K, acc_type>;

    UpdatingRollingCursor(const Series<K, V>& series, std::size_t window, Add add, Remove remove)
        : series_(&series),
          window_(window),
          pos_(window == 0 ? series.size() : 0),
          add_(std::move(add)),
          remove_(std::move(remove)) {}

    auto next() -> std::optional<point_type> {
        const auto values = series_->values();
        while (pos_ < values.size()) {
            const std::size_t i = pos_++;
            acc_ = add_(std::move(acc_), values[i]);
            if (i >= window_) {
                acc_ = remove_(std::move(acc_), values[i - window_]);
            }
            if (i + 1 >= window_ && acc_.has_value()) {
                return point_type{series_->keys()[i], *acc_};
            }
        }
        return std::nullopt;
    }

   private:
    const Series<K, V>* series_;
    std::size_t window_;
    std::size_t pos_;
    std::optional<acc_type> acc_;
    Add add_;
    Remove remove_;
};

// ─── Entry points ─────────────────────────────────────────────────────────────

template <SeriesKey K, typename V>
[[nodiscard]] auto shift(const Series<K, V>& series, std::ptrdiff_t offset) -> ShiftCursor<K, V> {
    return ShiftCursor<K, V>(series, offset);
}

template <SeriesKey K, typename V, typename F>
    requires std::invocable<F&, const V&, const V&>
[[nodiscard]] auto skip_apply(const Series<K, V>& series, std::size_t n, F func)
    -> SkipApplyCursor<K, V, F> {
    return SkipApplyCursor<K, V, F>(series, n, std::move(func));
}

template <SeriesKey K, typename V, typename F>
    requires std::invocable<F&, std::span<const V>>
[[nodiscard]] auto apply_rolling(const Series<K, V>& series, std::size_t window, F func)
    -> RollingCursor<K, V, F> {
    return RollingCursor<K, V, F>(series, window, std::move(func));
}

template <SeriesKey K, typename V, typename Add, typename Remove>
[[nodiscard]] auto apply_updating_rolling(const Series<K, V>& series, std::size_t window, Add add,
                                          Remove remove)
    -> UpdatingRollingCursor<K, V, Add, Remove> {
    return UpdatingRollingCursor<K, V, Add, Remove>(series, window, std::move(add),
                                                    std::move(remove));
}

// Window cursors borrow their input; a temporary series would dangle.

template <SeriesKey K, typename V>
auto shift(const Series<K, V>&&, std::ptrdiff_t) -> void = delete;

template <SeriesKey K, typename V, typename F>
auto skip_apply(const Series<K, V>&&, std::size_t, F) -> void = delete;

template <SeriesKey K, typename V, typename F>
auto apply_rolling(const Series<K, V>&&, std::size_t, F) -> void = delete;

template <SeriesKey K, typename V, typename Add, typename Remove>
auto apply_updating_rolling(const Series<K, V>&&, std::size_t, Add, Remove) -> void = delete;

}  // namespace tsx::ops
