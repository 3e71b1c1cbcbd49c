// Built with TSX_VALIDATE_INPUTS=1: operations check their inputs are
// strictly ascending before running.

#include <tsx/ops/asof.hpp>
#include <tsx/ops/join.hpp>
#include <tsx/ops/resample.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>

using namespace tsx;
using namespace tsx::ops;

namespace {

using IntSeries = Series<std::int64_t, double>;

auto ordered() -> IntSeries {
    return IntSeries::from_parallel_unchecked({1, 2, 3}, {1.0, 2.0, 3.0});
}

auto unordered() -> IntSeries {
    return IntSeries::from_parallel_unchecked({1, 3, 2}, {1.0, 2.0, 3.0});
}

auto duplicated() -> IntSeries {
    return IntSeries::from_parallel_unchecked({1, 1, 2}, {1.0, 2.0, 3.0});
}

auto add = [](double a, double b) { return a + b; };

}  // namespace

TEST_CASE("validation is enabled in the test build", "[validation]") {
    STATIC_REQUIRE(kValidateInputs);
    REQUIRE(library_validates_inputs());
}

TEST_CASE("joins reject unordered inputs", "[validation]") {
    REQUIRE_THROWS_AS(cross_apply_inner(unordered(), ordered(), add), OrderViolation);
    REQUIRE_THROWS_AS(cross_apply_inner(ordered(), duplicated(), add), OrderViolation);
    REQUIRE_THROWS_AS(
        cross_apply_left(unordered(), ordered(), [](double a, const double*) { return a; }),
        OrderViolation);
    REQUIRE_THROWS_AS(interweave(ordered(), unordered(), add), OrderViolation);
    REQUIRE_NOTHROW(cross_apply_inner(ordered(), ordered(), add));
}

TEST_CASE("OrderViolation names the operation and position", "[validation]") {
    try {
        auto joined = cross_apply_inner(ordered(), unordered(), add);
        FAIL("expected OrderViolation, got " << joined.size() << " rows");
    } catch (const OrderViolation& e) {
        REQUIRE(e.operation() == "cross_apply_inner(right)");
        REQUIRE(e.error().kind == ErrorKind::UnorderedInput);
        REQUIRE(e.error().position == 2);
    }
}

TEST_CASE("asof and resample reject unordered inputs", "[validation]") {
    auto first = [](double a, const double*) { return a; };
    REQUIRE_THROWS_AS(
        merge_apply_asof(ordered(), duplicated(), nullptr, first, MergeAsofMode::RollPrior),
        OrderViolation);
    REQUIRE_THROWS_AS(resample_and_agg(unordered(), bucket_by_floor(std::int64_t{2}), Last{}),
                      OrderViolation);
}
