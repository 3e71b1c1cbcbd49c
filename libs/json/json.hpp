#pragma once
// tsx JSON codec — a Series as an array of {"timestamp": key, "value": value}
// records, via nlohmann/json.
//
//   tsx::io::write_json("prices.json", prices, tsx::io::JsonStyle::Pretty);
//   auto back = tsx::io::read_json<tsx::Timestamp, double>("prices.json");
//
// Keys and values convert through nlohmann's to_json/from_json, so any type
// with those overloads can be stored. Timestamp is written as integer
// nanoseconds since the epoch and Date as integer days.

#include <tsx/core/cursor.hpp>
#include <tsx/core/data_point.hpp>
#include <tsx/core/series.hpp>
#include <tsx/core/time.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tsx {

inline void to_json(nlohmann::json& j, const Timestamp& ts) { j = ts.nanos; }
inline void from_json(const nlohmann::json& j, Timestamp& ts) { ts.nanos = j.get<std::int64_t>(); }

inline void to_json(nlohmann::json& j, const Date& date) { j = date.days; }
inline void from_json(const nlohmann::json& j, Date& date) { date.days = j.get<std::int32_t>(); }

}  // namespace tsx

namespace tsx::io {

enum class JsonStyle : std::uint8_t {
    Compact,
    /// Four-space indentation, one field per line.
    Pretty,
};

inline constexpr const char* kJsonKeyField = "timestamp";
inline constexpr const char* kJsonValueField = "value";

/// Decode a JSON document held in `text`. `source` names it in error messages.
/// Throws std::runtime_error on malformed JSON, a missing field, a value of
/// the wrong type, or two records sharing a key.
template <typename K, typename V>
[[nodiscard]] auto parse_json(std::string_view text, std::string_view source = "<string>")
    -> Series<K, V> {
    std::vector<DataPoint<K, V>> points;
    try {
        const auto doc = nlohmann::json::parse(text);
        if (!doc.is_array()) {
            throw std::runtime_error("expected an array of records");
        }
        points.reserve(doc.size());
        for (const auto& record : doc) {
            points.push_back(DataPoint<K, V>{record.at(kJsonKeyField).template get<K>(),
                                             record.at(kJsonValueField).template get<V>()});
        }
    } catch (const std::exception& e) {
        throw std::runtime_error(fmt::format("read_json: {}: {}", source, e.what()));
    }

    auto series = collect_checked(VectorCursor<K, V>(std::move(points)));
    if (!series) {
        throw std::runtime_error(fmt::format("read_json: {}: {}", source, series.error().format()));
    }
    return std::move(*series);
}

/// Read `path` into a Series; the records may appear in any key order.
template <typename K, typename V>
[[nodiscard]] auto read_json(std::string_view path) -> Series<K, V> {
    std::ifstream in{std::string(path)};
    if (!in) {
        throw std::runtime_error(fmt::format("read_json: {}: cannot open file", path));
    }
    const std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    auto series = parse_json<K, V>(text, path);
    spdlog::debug("read_json: {} records from {}", series.size(), path);
    return series;
}

/// Encode `series` as a JSON document.
template <typename K, typename V>
[[nodiscard]] auto format_json(const Series<K, V>& series, JsonStyle style = JsonStyle::Compact)
    -> std::string {
    auto doc = nlohmann::json::array();
    const auto keys = series.keys();
    const auto values = series.values();
    for (std::size_t i = 0; i < series.size(); ++i) {
        nlohmann::json record;
        record[kJsonKeyField] = keys[i];
        record[kJsonValueField] = values[i];
        doc.push_back(std::move(record));
    }
    return doc.dump(style == JsonStyle::Pretty ? 4 : -1);
}

/// Write `series` to `path`. Returns records written.
template <typename K, typename V>
auto write_json(std::string_view path, const Series<K, V>& series,
                JsonStyle style = JsonStyle::Compact) -> std::size_t {
    const auto text = format_json(series, style);
    std::ofstream out{std::string(path)};
    out << text;
    if (!out) {
        throw std::runtime_error(fmt::format("write_json: {}: cannot write file", path));
    }
    spdlog::debug("write_json: {} records to {}", series.size(), path);
    return series.size();
}

}  // namespace tsx::io
