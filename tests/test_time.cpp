#include <tsx/core/time.hpp>

#include <catch2/catch_test_macros.hpp>

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <stdexcept>

using namespace tsx;
using namespace std::chrono_literals;

TEST_CASE("timestamp arithmetic", "[core][time]") {
    REQUIRE(from_seconds(2) == from_millis(2000));
    REQUIRE(from_seconds(1) + Duration{500ms} == from_millis(1500));
    REQUIRE(from_seconds(1) - Duration{1s} == Timestamp{0});
    REQUIRE(Date{10} + std::chrono::days{5} == Date{15});
    REQUIRE(key_diff(from_seconds(1), from_seconds(3)) == Duration{2s});
    REQUIRE(key_distance(from_seconds(3), from_seconds(1)) == Duration{2s});
    REQUIRE(key_diff(Date{3}, Date{1}) == std::chrono::days{-2});
    REQUIRE(key_distance(std::int64_t{3}, std::int64_t{8}) == 5);
}

TEST_CASE("integral rounding", "[core][time]") {
    SECTION("floor_to handles negatives") {
        REQUIRE(floor_to(17, 5) == 15);
        REQUIRE(floor_to(-3, 5) == -5);
        REQUIRE(floor_to(15, 5) == 15);
    }

    SECTION("ceil_to leaves exact multiples") {
        REQUIRE(ceil_to(15, 5) == 15);
        REQUIRE(ceil_to(16, 5) == 20);
        REQUIRE(ceil_to(-3, 5) == 0);
    }

    SECTION("bucket_end is always past the floor") {
        REQUIRE(bucket_end(15, 5) == 20);
        REQUIRE(bucket_end(16, 5) == 20);
    }

    SECTION("round_to rounds ties down") {
        REQUIRE(round_to(12, 5) == 10);
        REQUIRE(round_to(13, 5) == 15);
        REQUIRE(round_to(5, 10) == 0);
        REQUIRE(round_to(6, 10) == 10);
    }

    SECTION("non-positive step throws") {
        REQUIRE_THROWS_AS(floor_to(1, 0), std::invalid_argument);
        REQUIRE_THROWS_AS(round_to(1, -5), std::invalid_argument);
    }
}

TEST_CASE("timestamp rounding", "[core][time]") {
    const Duration step = 15min;
    const auto ts = from_seconds(16 * 60 + 30);
    REQUIRE(floor_to(ts, step) == from_seconds(15 * 60));
    REQUIRE(ceil_to(ts, step) == from_seconds(30 * 60));
    REQUIRE(bucket_end(ts, step) == from_seconds(30 * 60));
    REQUIRE(round_to(ts, step) == from_seconds(15 * 60));
    REQUIRE(bucket_end(from_seconds(15 * 60), step) == from_seconds(30 * 60));
    REQUIRE_THROWS_AS(floor_to(ts, Duration{0}), std::invalid_argument);
}

TEST_CASE("date rounding", "[core][time]") {
    REQUIRE(floor_to(Date{9}, std::chrono::days{7}) == Date{7});
    REQUIRE(bucket_end(Date{7}, std::chrono::days{7}) == Date{14});
    REQUIRE_THROWS_AS(ceil_to(Date{9}, std::chrono::days{0}), std::invalid_argument);
}

TEST_CASE("time formatting", "[core][time]") {
    REQUIRE(format_date(Date{0}) == "1970-01-01");
    REQUIRE(format_date(Date{19723}) == "2024-01-01");
    REQUIRE(format_timestamp(from_seconds(3661)) == "1970-01-01 01:01:01.000000000");
    REQUIRE(fmt::format("{}", Timestamp{1}) == "1970-01-01 00:00:00.000000001");
    REQUIRE(fmt::format("{}", Date{1}) == "1970-01-02");
}
