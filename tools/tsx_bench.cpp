#include <tsx/core/cursor.hpp>
#include <tsx/ops/join.hpp>
#include <tsx/ops/resample.hpp>
#include <tsx/ops/window.hpp>

#include "gen_series.hpp"

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace {

using PriceSeries = tsx::Series<tsx::Timestamp, double>;

struct BenchCase {
    std::string name;
    /// Runs the operation once and returns the number of output rows.
    std::function<std::size_t()> run;
};

auto run_benchmark(const BenchCase& bench, std::size_t warmup_iters, std::size_t iters) -> int {
    try {
        for (std::size_t i = 0; i < warmup_iters; ++i) {
            (void)bench.run();
        }

        std::size_t last_rows = 0;
        auto start = std::chrono::steady_clock::now();
        for (std::size_t i = 0; i < iters; ++i) {
            last_rows = bench.run();
        }
        auto end = std::chrono::steady_clock::now();

        auto total_ms =
            std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(end - start)
                .count();
        auto avg_ms = total_ms / static_cast<double>(iters);

        fmt::print("bench {}: iters={}, total_ms={:.3f}, avg_ms={:.3f}, rows={}\n", bench.name,
                   iters, total_ms, avg_ms, last_rows);
    } catch (const std::exception& e) {
        fmt::print("error: {} failed: {}\n", bench.name, e.what());
        return 1;
    }
    return 0;
}

auto make_cases(const PriceSeries& dense, const PriceSeries& sparse, std::size_t window,
                std::int64_t bar_minutes) -> std::vector<BenchCase> {
    const tsx::Duration bar = std::chrono::minutes{bar_minutes};
    return {
        {
            "map",
            [&dense] { return dense.map([](double p) { return p * 2.0; }).size(); },
        },
        {
            "lag",
            [&dense] { return tsx::collect_unchecked(tsx::ops::shift(dense, -1)).size(); },
        },
        {
            "inner_join_merge",
            [&dense, &sparse] {
                tsx::ops::JoinOptions options{.strategy = tsx::ops::JoinStrategy::Merge};
                return tsx::ops::cross_apply_inner(
                           dense, sparse, [](double a, double b) { return a - b; }, options)
                    .size();
            },
        },
        {
            "inner_join_hash",
            [&dense, &sparse] {
                tsx::ops::JoinOptions options{.strategy = tsx::ops::JoinStrategy::Hash};
                return tsx::ops::cross_apply_inner(
                           dense, sparse, [](double a, double b) { return a - b; }, options)
                    .size();
            },
        },
        {
            "left_join",
            [&dense, &sparse] {
                return tsx::ops::cross_apply_left(dense, sparse,
                                                  [](double a, const double* b) {
                                                      return b != nullptr ? a - *b : a;
                                                  })
                    .size();
            },
        },
        {
            "rolling_sum_buffer",
            [&dense, window] {
                auto cursor = tsx::ops::apply_rolling(dense, window, [](std::span<const double> w) {
                    double total = 0.0;
                    for (double v : w) {
                        total += v;
                    }
                    return total;
                });
                return tsx::collect_unchecked(std::move(cursor)).size();
            },
        },
        {
            "rolling_sum_updating",
            [&dense, window] {
                auto cursor = tsx::ops::apply_updating_rolling(
                    dense, window,
                    [](std::optional<double> acc, const double& v) -> std::optional<double> {
                        return acc.value_or(0.0) + v;
                    },
                    [](std::optional<double> acc, const double& v) -> std::optional<double> {
                        return acc.value_or(0.0) - v;
                    });
                return tsx::collect_unchecked(std::move(cursor)).size();
            },
        },
        {
            "resample_bars",
            [&dense, bar] {
                return tsx::ops::resample_and_agg(dense, tsx::ops::bucket_by_end(bar),
                                                  tsx::ops::Last{})
                    .size();
            },
        },
    };
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"tsx benchmark harness"};

    std::int64_t rows = 1'000'000;
    std::int64_t sparse_every = 100;
    std::size_t window = 20;
    std::int64_t bar_minutes = 15;
    std::size_t warmup_iters = 1;
    std::size_t iters = 5;
    bool verbose = false;

    app.add_option("--rows", rows, "Points in the generated series")->check(CLI::PositiveNumber);
    app.add_option("--sparse-every", sparse_every,
                   "Keep every n-th point in the right-hand join input")
        ->check(CLI::PositiveNumber);
    app.add_option("--window", window, "Rolling window length")->check(CLI::PositiveNumber);
    app.add_option("--bar-minutes", bar_minutes, "Resample bucket width in minutes")
        ->check(CLI::PositiveNumber);
    app.add_option("--warmup", warmup_iters, "Warmup iterations")->check(CLI::NonNegativeNumber);
    app.add_option("--iters", iters, "Measured iterations")->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    CLI11_PARSE(app, argc, argv);

    // SPDLOG_LEVEL wins over the default; --verbose wins over both.
    spdlog::set_level(spdlog::level::info);
    spdlog::cfg::load_env_levels();
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    PriceSeries dense;
    PriceSeries sparse;
    try {
        dense = tsx::tools::gen_series(rows);
        sparse = tsx::tools::gen_series(rows / sparse_every, sparse_every);
    } catch (const std::exception& e) {
        fmt::print("error: failed to generate data: {}\n", e.what());
        return 1;
    }
    spdlog::info("generated {} dense and {} sparse points", dense.size(), sparse.size());

    int status = 0;
    for (const auto& bench : make_cases(dense, sparse, window, bar_minutes)) {
        status = run_benchmark(bench, warmup_iters, iters);
        if (status != 0) {
            break;
        }
    }
    return status;
}
