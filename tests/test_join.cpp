#include <tsx/ops/join.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <tuple>
#include <utility>
#include <vector>

using namespace tsx;
using namespace tsx::ops;

namespace {

using IntSeries = Series<std::int64_t, double>;
using Pair = std::pair<double, std::optional<double>>;

auto left_input() -> IntSeries {
    return IntSeries::from_parallel_unchecked({0, 1, 2, 3, 4}, {1.0, 2.0, 3.0, 4.0, 5.0});
}

auto right_input() -> IntSeries {
    return IntSeries::from_parallel_unchecked({0, 1, 2}, {1.0, 2.0, 4.0});
}

auto as_pair = [](double l, double r) { return std::pair<double, double>(l, r); };

auto as_optional_pair = [](double l, const double* r) {
    return Pair(l, r ? std::optional<double>(*r) : std::nullopt);
};

struct PlainKey {
    int v = 0;
    auto operator<=>(const PlainKey&) const = default;
};

}  // namespace

TEST_CASE("cross_apply_inner keeps common keys", "[ops][join]") {
    const auto left = left_input();
    const auto right = right_input();
    for (auto strategy : {JoinStrategy::Auto, JoinStrategy::Merge, JoinStrategy::Hash}) {
        auto joined = cross_apply_inner(left, right, as_pair, JoinOptions{.strategy = strategy});
        REQUIRE(joined.size() == 3);
        REQUIRE(joined.keys()[2] == 2);
        REQUIRE(joined.values()[0] == std::pair<double, double>(1.0, 1.0));
        REQUIRE(joined.values()[2] == std::pair<double, double>(3.0, 4.0));
    }
}

TEST_CASE("cross_apply_left keeps every left row", "[ops][join]") {
    const auto left = left_input();
    const auto right = right_input();
    for (auto strategy : {JoinStrategy::Merge, JoinStrategy::Hash}) {
        auto joined =
            cross_apply_left(left, right, as_optional_pair, JoinOptions{.strategy = strategy});
        REQUIRE(joined.size() == 5);
        REQUIRE(joined.values()[2] == Pair(3.0, 4.0));
        REQUIRE(joined.values()[3] == Pair(4.0, std::nullopt));
        REQUIRE(joined.values()[4] == Pair(5.0, std::nullopt));
    }
}

TEST_CASE("joins with an empty side", "[ops][join]") {
    const auto left = left_input();
    const IntSeries empty;
    REQUIRE(cross_apply_inner(left, empty, as_pair).empty());
    auto outer = cross_apply_left(left, empty, as_optional_pair);
    REQUIRE(outer.size() == left.size());
    REQUIRE_FALSE(outer.values()[0].second.has_value());
}

TEST_CASE("choose_strategy", "[ops][join]") {
    const JoinOptions automatic;
    REQUIRE(choose_strategy(10, 100, automatic, true) == JoinStrategy::Hash);
    REQUIRE(choose_strategy(11, 100, automatic, true) == JoinStrategy::Merge);
    REQUIRE(choose_strategy(10, 100, automatic, false) == JoinStrategy::Merge);
    REQUIRE(choose_strategy(0, 0, automatic, true) == JoinStrategy::Merge);
    REQUIRE(choose_strategy(1000, 1, JoinOptions{.strategy = JoinStrategy::Merge}, true) ==
            JoinStrategy::Merge);
    REQUIRE(choose_strategy(5, 5, JoinOptions{.strategy = JoinStrategy::Hash}, true) ==
            JoinStrategy::Hash);
    REQUIRE(choose_strategy(5, 5, JoinOptions{.strategy = JoinStrategy::Hash}, false) ==
            JoinStrategy::Merge);
    REQUIRE(to_string(JoinStrategy::Hash) == "hash");
}

TEST_CASE("JoinEngine strategies agree", "[ops][join]") {
    std::vector<std::int64_t> left{1, 3, 5, 7, 9, 11};
    std::vector<std::int64_t> right{0, 3, 4, 9, 12};
    JoinEngine<std::int64_t> engine(left, right);

    const std::vector<IndexPair> expected{{1, 1}, {4, 3}};
    REQUIRE(engine.inner_merge() == expected);
    REQUIRE(engine.inner_hash() == expected);
    REQUIRE(engine.left_merge() == engine.left_hash());
    REQUIRE(engine.left_merge().size() == left.size());

    JoinEngine<std::int64_t> swapped(right, left);
    REQUIRE(swapped.inner_hash() == std::vector<IndexPair>{{1, 1}, {3, 4}});
}

TEST_CASE("identical indexes short-circuit", "[ops][join]") {
    std::vector<std::int64_t> keys{1, 2, 3};
    JoinEngine<std::int64_t> engine(keys, keys);
    REQUIRE(engine.same_index());
    REQUIRE(engine.inner() == std::vector<IndexPair>{{0, 0}, {1, 1}, {2, 2}});
    REQUIRE(engine.inner(JoinOptions{.precompare = false}) == engine.inner());
    REQUIRE(engine.left_outer().size() == 3);
    REQUIRE(engine.left_outer()[2].right == std::optional<std::size_t>(2));
}

TEST_CASE("join on a key type without std::hash", "[ops][join]") {
    using PlainSeries = Series<PlainKey, int>;
    auto left = PlainSeries::from_parallel_unchecked({{1}, {2}, {3}}, {1, 2, 3});
    auto right = PlainSeries::from_parallel_unchecked({{2}, {3}, {4}}, {20, 30, 40});
    auto joined = cross_apply_inner(left, right, [](int a, int b) { return a + b; },
                                    JoinOptions{.strategy = JoinStrategy::Hash});
    REQUIRE(joined.size() == 2);
    REQUIRE(joined.values()[0] == 22);
    REQUIRE(joined.values()[1] == 33);
}

TEST_CASE("inner_join_all gathers one value per input", "[ops][join]") {
    auto a = IntSeries::from_parallel_unchecked({1, 2, 3, 4}, {1.0, 2.0, 3.0, 4.0});
    auto b = Series<std::int64_t, std::int64_t>::from_parallel_unchecked({2, 3, 4}, {20, 30, 40});
    auto c = IntSeries::from_parallel_unchecked({1, 3, 4}, {0.1, 0.3, 0.4});

    auto joined = inner_join_all(a, b, c);
    REQUIRE(joined.size() == 2);
    REQUIRE(joined.keys()[0] == 3);
    REQUIRE(joined.values()[0] == std::tuple<double, std::int64_t, double>(3.0, 30, 0.3));
    REQUIRE(joined.values()[1] == std::tuple<double, std::int64_t, double>(4.0, 40, 0.4));

    auto single = inner_join_all(a);
    REQUIRE(single.size() == a.size());
    REQUIRE(std::get<0>(single.values()[3]) == 4.0);
}

TEST_CASE("interweave merges two series", "[ops][join]") {
    auto a = IntSeries::from_parallel_unchecked({1, 3, 5}, {1.0, 3.0, 5.0});
    auto b = IntSeries::from_parallel_unchecked({2, 3, 6}, {2.0, 30.0, 6.0});
    auto merged = interweave(a, b, [](double, double bv) { return bv; });
    REQUIRE(std::vector<std::int64_t>(merged.keys().begin(), merged.keys().end()) ==
            std::vector<std::int64_t>{1, 2, 3, 5, 6});
    REQUIRE(merged.values()[2] == 30.0);
    REQUIRE(merged.values()[4] == 6.0);
}

TEST_CASE("joins over bool values", "[ops][join]") {
    const auto left = left_input().map([](double v) { return v > 2.0; });
    const auto right = right_input().map([](double v) { return v > 1.0; });

    auto both = cross_apply_inner(left, right, [](bool l, bool r) { return l && r; });
    REQUIRE(std::vector<std::int64_t>(both.keys().begin(), both.keys().end()) ==
            std::vector<std::int64_t>{0, 1, 2});
    REQUIRE(std::vector<bool>(both.values().begin(), both.values().end()) ==
            std::vector<bool>{false, false, true});

    auto matched = cross_apply_left(left, right, [](bool, const bool* r) { return r != nullptr && *r; });
    REQUIRE(matched.size() == 5);
    REQUIRE(std::vector<bool>(matched.values().begin(), matched.values().end()) ==
            std::vector<bool>{false, true, true, false, false});
}
