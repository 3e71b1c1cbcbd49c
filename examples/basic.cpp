#include <tsx/tsx.hpp>

#include <fmt/core.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <vector>

auto main() -> int {
    // A price series keyed by minute
    std::vector<tsx::Timestamp> keys;
    std::vector<double> prices{100.5, 101.0, 100.25, 102.0, 103.5, 103.0, 104.25, 105.0};
    for (std::int64_t i = 0; i < static_cast<std::int64_t>(prices.size()); ++i) {
        keys.push_back(tsx::from_seconds(60 * i));
    }
    auto built = tsx::Series<tsx::Timestamp, double>::from_parallel_checked(keys, prices);
    if (!built) {
        fmt::print("error: {}\n", built.error().format());
        return 1;
    }
    const auto& series = *built;

    fmt::print("=== Series ===\n");
    tsx::print(series, std::cout);

    // Lookup
    if (auto price = series.at_or_first_prior(tsx::from_seconds(150))) {
        fmt::print("\nprice as of 00:02:30: {}\n", *price);
    }

    // One-period returns
    fmt::print("\n=== Returns ===\n");
    auto returns = tsx::collect_unchecked(
        tsx::ops::skip_apply(series, 1, [](double prev, double cur) { return cur / prev - 1.0; }));
    tsx::print(returns, std::cout);

    // Three-point moving average
    fmt::print("\n=== Moving average ===\n");
    auto moving = tsx::collect_unchecked(
        tsx::ops::apply_rolling(series, 3, [](std::span<const double> window) {
            double total = 0.0;
            for (double v : window) {
                total += v;
            }
            return total / static_cast<double>(window.size());
        }));
    tsx::print(moving, std::cout);

    // Five-minute bars labelled by their close
    fmt::print("\n=== 5 minute bars ===\n");
    auto bars = tsx::ops::resample_and_agg(
        series, tsx::ops::bucket_by_end(tsx::Duration{std::chrono::minutes{5}}), tsx::ops::Last{});
    tsx::print(bars, std::cout);

    // Join with a sparser reference series
    fmt::print("\n=== Spread vs reference ===\n");
    auto reference = tsx::Series<tsx::Timestamp, double>::from_parallel_unchecked(
        {tsx::from_seconds(0), tsx::from_seconds(180), tsx::from_seconds(360)},
        {100.0, 101.0, 102.0});
    auto spread = tsx::ops::merge_apply_asof(
        series, reference, tsx::ops::within<tsx::Timestamp>(tsx::Duration{std::chrono::minutes{2}}),
        [](double price, const double* ref) -> std::optional<double> {
            if (ref == nullptr) {
                return std::nullopt;
            }
            return price - *ref;
        },
        tsx::ops::MergeAsofMode::RollPrior);
    for (const auto& point : spread) {
        fmt::print("{}\t{}\n", point.key,
                   point.value ? fmt::format("{:.2f}", *point.value) : std::string("-"));
    }

    return 0;
}
