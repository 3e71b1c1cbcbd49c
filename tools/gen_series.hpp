#pragma once
// gen_series — synthetic price series for the benchmark harness.

#include <tsx/core/series.hpp>
#include <tsx/core/time.hpp>

#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tsx::tools {

/// `n` points one `step_seconds` apart starting at the epoch, priced
/// 100 + (i % 100).
inline auto gen_series(std::int64_t n, std::int64_t step_seconds = 1)
    -> Series<Timestamp, double> {
    if (n < 0)
        throw std::invalid_argument("gen_series: n must be non-negative");
    if (step_seconds <= 0)
        throw std::invalid_argument("gen_series: step_seconds must be positive");
    auto rows = static_cast<std::size_t>(n);

    std::vector<Timestamp> keys;
    std::vector<double> prices;
    keys.reserve(rows);
    prices.reserve(rows);

    for (std::size_t i = 0; i < rows; ++i) {
        keys.push_back(from_seconds(static_cast<std::int64_t>(i) * step_seconds));
        prices.push_back(100.0 + static_cast<double>(i % 100));
    }
    return Series<Timestamp, double>::from_parallel_unchecked(std::move(keys), std::move(prices));
}

}  // namespace tsx::tools
