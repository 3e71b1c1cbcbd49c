#pragma once

#include <tsx/core/series.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <iterator>
#include <ostream>
#include <string>

namespace tsx {

/// Render a Series as a two-column table.
///
/// Up to `max_rows` points are printed in full; longer series show the first
/// and last max_rows / 2 points around an ellipsis row.
template <typename K, typename V>
[[nodiscard]] auto format_series(const Series<K, V>& series, std::size_t max_rows = 10)
    -> std::string {
    std::string out;
    auto append_row = [&](std::size_t i) {
        fmt::format_to(std::back_inserter(out), "{}\t{}\n", series.keys()[i], series.values()[i]);
    };
    const std::size_t n = series.size();
    if (n <= max_rows) {
        for (std::size_t i = 0; i < n; ++i) {
            append_row(i);
        }
    } else {
        const std::size_t half = max_rows / 2;
        for (std::size_t i = 0; i < half; ++i) {
            append_row(i);
        }
        out += "...\n";
        for (std::size_t i = n - half; i < n; ++i) {
            append_row(i);
        }
    }
    fmt::format_to(std::back_inserter(out), "Length: {}\n", n);
    return out;
}

template <typename K, typename V>
void print(const Series<K, V>& series, std::ostream& out, std::size_t max_rows = 10) {
    out << format_series(series, max_rows);
}

}  // namespace tsx
