// Parallel value transform composed outside the library.
//
// The library itself is single-threaded. A caller that wants to spread an
// expensive per-value transform over several threads splits the value span
// into chunks, transforms each chunk on its own thread, and rebuilds the
// Series from the original keys. Rebuilding without re-validation is sound
// because every value stays at its original position.

#include <tsx/core/print.hpp>
#include <tsx/core/series.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <span>
#include <thread>
#include <utility>
#include <vector>

namespace {

auto expensive(double x) -> double {
    double acc = x;
    for (int i = 0; i < 1000; ++i) {
        acc = std::sqrt(acc * acc + 1.0);
    }
    return acc;
}

template <typename K>
auto parallel_map(const tsx::Series<K, double>& series, std::size_t threads)
    -> tsx::Series<K, double> {
    const auto input = series.values();
    std::vector<double> output(input.size());
    const std::size_t chunk = (input.size() + threads - 1) / std::max<std::size_t>(threads, 1);

    std::vector<std::jthread> workers;
    for (std::size_t begin = 0; begin < input.size(); begin += chunk) {
        const std::size_t end = std::min(begin + chunk, input.size());
        workers.emplace_back([input, &output, begin, end] {
            for (std::size_t i = begin; i < end; ++i) {
                output[i] = expensive(input[i]);
            }
        });
    }
    workers.clear();  // joins

    auto keys = series.keys();
    return tsx::Series<K, double>::from_parallel_unchecked(
        std::vector<K>(keys.begin(), keys.end()), std::move(output));
}

}  // namespace

auto main() -> int {
    std::vector<std::int64_t> keys(100'000);
    std::vector<double> values(keys.size());
    for (std::size_t i = 0; i < keys.size(); ++i) {
        keys[i] = static_cast<std::int64_t>(i);
        values[i] = static_cast<double>(i % 17);
    }
    auto series = tsx::Series<std::int64_t, double>::from_parallel(keys, values);
    if (!series) {
        fmt::print("error: {}\n", series.error().format());
        return 1;
    }

    const std::size_t threads = std::max(1U, std::thread::hardware_concurrency());
    spdlog::info("transforming {} values on {} threads", series->size(), threads);

    auto mapped = parallel_map(*series, threads);
    auto reference = series->map(expensive);
    fmt::print("parallel result matches sequential map: {}\n", mapped == reference);
    tsx::print(mapped, std::cout);
    return 0;
}
