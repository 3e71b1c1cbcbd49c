#pragma once

#include <fmt/format.h>

#include <chrono>
#include <compare>
#include <concepts>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace tsx {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Instant in nanoseconds since 1970-01-01T00:00:00Z (Unix epoch).
struct Timestamp {
    std::int64_t nanos = 0;
    auto operator<=>(const Timestamp&) const = default;
};

using Duration = std::chrono::nanoseconds;

[[nodiscard]] constexpr auto from_millis(std::int64_t millis) noexcept -> Timestamp {
    return Timestamp{millis * 1'000'000};
}

[[nodiscard]] constexpr auto from_seconds(std::int64_t seconds) noexcept -> Timestamp {
    return Timestamp{seconds * 1'000'000'000};
}

[[nodiscard]] constexpr auto operator+(Timestamp ts, Duration d) noexcept -> Timestamp {
    return Timestamp{ts.nanos + d.count()};
}

[[nodiscard]] constexpr auto operator-(Timestamp ts, Duration d) noexcept -> Timestamp {
    return Timestamp{ts.nanos - d.count()};
}

[[nodiscard]] constexpr auto operator+(Date date, std::chrono::days d) noexcept -> Date {
    return Date{date.days + static_cast<std::int32_t>(d.count())};
}

// ─── Key arithmetic ───────────────────────────────────────────────────────────

/// Signed step from `from` to `to`.
[[nodiscard]] constexpr auto key_diff(Timestamp from, Timestamp to) noexcept -> Duration {
    return Duration{to.nanos - from.nanos};
}

[[nodiscard]] constexpr auto key_diff(Date from, Date to) noexcept -> std::chrono::days {
    return std::chrono::days{to.days - from.days};
}

template <typename T>
    requires std::integral<T> || std::floating_point<T>
[[nodiscard]] constexpr auto key_diff(T from, T to) noexcept -> T {
    return static_cast<T>(to - from);
}

/// Absolute distance between two keys.
template <typename K>
[[nodiscard]] constexpr auto key_distance(const K& a, const K& b) noexcept {
    return a < b ? key_diff(a, b) : key_diff(b, a);
}

/// Step type produced by key_diff for key type K.
template <typename K>
using key_step_t = decltype(key_diff(std::declval<K>(), std::declval<K>()));

// ─── Bucket rounding ──────────────────────────────────────────────────────────
//
// All rounding is floor-based with a non-negative remainder, so keys before
// the epoch land in the bucket below them. Steps must be positive.

/// Largest multiple of `step` that is <= ts.
[[nodiscard]] auto floor_to(Timestamp ts, Duration step) -> Timestamp;
/// Smallest multiple of `step` that is >= ts.
[[nodiscard]] auto ceil_to(Timestamp ts, Duration step) -> Timestamp;
/// floor_to(ts, step) + step. Labels the half-open bucket [start, start + step)
/// by its end, so a key sitting exactly on a boundary opens the next bucket.
[[nodiscard]] auto bucket_end(Timestamp ts, Duration step) -> Timestamp;
/// Nearest multiple of `step`; a key exactly halfway rounds down.
[[nodiscard]] auto round_to(Timestamp ts, Duration step) -> Timestamp;

[[nodiscard]] auto floor_to(Date date, std::chrono::days step) -> Date;
[[nodiscard]] auto ceil_to(Date date, std::chrono::days step) -> Date;
[[nodiscard]] auto bucket_end(Date date, std::chrono::days step) -> Date;
[[nodiscard]] auto round_to(Date date, std::chrono::days step) -> Date;

namespace detail {

/// Remainder in [0, step). Throws std::invalid_argument for a non-positive step.
template <std::integral T>
[[nodiscard]] constexpr auto floor_mod(T value, T step) -> T {
    if (step <= 0) {
        throw std::invalid_argument("bucket step must be positive");
    }
    return static_cast<T>(((value % step) + step) % step);
}

}  // namespace detail

template <std::integral T>
[[nodiscard]] constexpr auto floor_to(T value, T step) -> T {
    return static_cast<T>(value - detail::floor_mod(value, step));
}

template <std::integral T>
[[nodiscard]] constexpr auto ceil_to(T value, T step) -> T {
    const T rem = detail::floor_mod(value, step);
    return rem == 0 ? value : static_cast<T>(value + (step - rem));
}

template <std::integral T>
[[nodiscard]] constexpr auto bucket_end(T value, T step) -> T {
    return static_cast<T>(floor_to(value, step) + step);
}

template <std::integral T>
[[nodiscard]] constexpr auto round_to(T value, T step) -> T {
    const T rem = detail::floor_mod(value, step);
    return rem > step / 2 ? static_cast<T>(value + (step - rem)) : static_cast<T>(value - rem);
}

// ─── Formatting ───────────────────────────────────────────────────────────────

/// "YYYY-MM-DD".
[[nodiscard]] auto format_date(Date date) -> std::string;
/// "YYYY-MM-DD HH:MM:SS.nnnnnnnnn" (UTC).
[[nodiscard]] auto format_timestamp(Timestamp ts) -> std::string;

}  // namespace tsx

namespace std {

template <>
struct hash<tsx::Date> {
    auto operator()(const tsx::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

template <>
struct hash<tsx::Timestamp> {
    auto operator()(const tsx::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.nanos);
    }
};

}  // namespace std

template <>
struct fmt::formatter<tsx::Date> : fmt::formatter<std::string> {
    auto format(const tsx::Date& d, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(tsx::format_date(d), ctx);
    }
};

template <>
struct fmt::formatter<tsx::Timestamp> : fmt::formatter<std::string> {
    auto format(const tsx::Timestamp& ts, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(tsx::format_timestamp(ts), ctx);
    }
};
