#include <json.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tsx;

namespace {

auto tmp(const char* name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / name;
}

auto write_file(const std::filesystem::path& path, const char* content) {
    std::ofstream out(path);
    out << content;
}

struct Quote {
    std::int64_t size = 0;
    std::string venue;

    auto operator==(const Quote&) const -> bool = default;
};

void to_json(nlohmann::json& j, const Quote& q) { j = {{"size", q.size}, {"venue", q.venue}}; }

void from_json(const nlohmann::json& j, Quote& q) {
    j.at("size").get_to(q.size);
    j.at("venue").get_to(q.venue);
}

}  // namespace

TEST_CASE("write_json then read_json restores the series", "[io][json]") {
    auto path = tmp("tsx_test_roundtrip.json");
    auto series = Series<Timestamp, double>::from_parallel_unchecked(
        {from_seconds(1), from_seconds(2), from_seconds(60)}, {1.5, -2.25, 1e9});

    SECTION("compact") {
        REQUIRE(io::write_json(path.string(), series) == 3);
        REQUIRE((io::read_json<Timestamp, double>(path.string())) == series);
    }

    SECTION("pretty") {
        REQUIRE(io::write_json(path.string(), series, io::JsonStyle::Pretty) == 3);
        REQUIRE((io::read_json<Timestamp, double>(path.string())) == series);
    }

    std::filesystem::remove(path);
}

TEST_CASE("format_json layout", "[io][json]") {
    auto series = Series<std::int64_t, std::int64_t>::from_parallel_unchecked({1, 2}, {10, 20});

    REQUIRE(io::format_json(series) ==
            R"([{"timestamp":1,"value":10},{"timestamp":2,"value":20}])");

    const auto pretty = io::format_json(series, io::JsonStyle::Pretty);
    REQUIRE(pretty.find('\n') != std::string::npos);
    REQUIRE(pretty.find("    {") != std::string::npos);
    REQUIRE(nlohmann::json::parse(pretty) == nlohmann::json::parse(io::format_json(series)));
}

TEST_CASE("parse_json sorts records by key", "[io][json]") {
    auto series = io::parse_json<Date, double>(
        R"([{"timestamp": 3, "value": 3.0}, {"timestamp": 1, "value": 1.0}])");
    REQUIRE(series.size() == 2);
    REQUIRE(series.keys()[0] == Date{1});
    REQUIRE(series.values()[1] == 3.0);
}

TEST_CASE("json values of user types and bool", "[io][json]") {
    SECTION("struct values use their to_json and from_json") {
        auto series = Series<std::int64_t, Quote>::from_parallel_unchecked(
            {5, 9}, {Quote{100, "XNAS"}, Quote{250, "XLON"}});
        auto back = io::parse_json<std::int64_t, Quote>(io::format_json(series));
        REQUIRE(back == series);
    }

    SECTION("bool values") {
        auto flags = io::parse_json<std::int64_t, bool>(
            R"([{"timestamp": 1, "value": true}, {"timestamp": 2, "value": false}])");
        REQUIRE(flags.values()[0]);
        REQUIRE_FALSE(flags.values()[1]);
        REQUIRE(io::format_json(flags) ==
                R"([{"timestamp":1,"value":true},{"timestamp":2,"value":false}])");
    }
}

TEST_CASE("read_json errors", "[io][json]") {
    SECTION("duplicate keys") {
        REQUIRE_THROWS_AS((io::parse_json<std::int64_t, double>(
                              R"([{"timestamp": 1, "value": 1.0}, {"timestamp": 1, "value": 2.0}])")),
                          std::runtime_error);
    }

    SECTION("missing field") {
        REQUIRE_THROWS_AS((io::parse_json<std::int64_t, double>(R"([{"timestamp": 1}])")),
                          std::runtime_error);
    }

    SECTION("not an array") {
        REQUIRE_THROWS_AS((io::parse_json<std::int64_t, double>(R"({"timestamp": 1})")),
                          std::runtime_error);
    }

    SECTION("malformed document names the file") {
        auto path = tmp("tsx_test_malformed.json");
        write_file(path, "[{\"timestamp\": 1,");
        try {
            (void)io::read_json<std::int64_t, double>(path.string());
            FAIL("expected read_json to throw");
        } catch (const std::runtime_error& e) {
            REQUIRE(std::string(e.what()).find(path.string()) != std::string::npos);
        }
        std::filesystem::remove(path);
    }

    SECTION("missing file") {
        REQUIRE_THROWS_AS((io::read_json<std::int64_t, double>("/nonexistent/tsx.json")),
                          std::runtime_error);
    }
}
