#pragma once
// tsx Parquet codec — a Series as a two-column Parquet file via Apache Arrow.
//
// Reading:
//   auto s = tsx::io::read_parquet<tsx::Timestamp, double>("bars.parquet", "ts", "close");
//
// Writing:
//   auto rows = tsx::io::write_parquet("bars.parquet", s, "ts", "close");
//
// Column type mappings:
//   std::int64_t    → Parquet INT64
//   double          → Parquet DOUBLE
//   tsx::Date       → Parquet DATE32
//   tsx::Timestamp  → Parquet TIMESTAMP (nanoseconds, UTC)
//
// Decoded points go through the checked collection path, so a file whose key
// column is unsorted is sorted on read and duplicate keys are rejected.

#include <tsx/core/cursor.hpp>
#include <tsx/core/series.hpp>
#include <tsx/core/time.hpp>

#include <arrow/api.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tsx::io {

/// Arrow mapping for one Series element type.
template <typename T>
struct ParquetColumn;

template <>
struct ParquetColumn<std::int64_t> {
    static auto type() -> std::shared_ptr<arrow::DataType>;
    static auto build(std::span<const std::int64_t> values) -> std::shared_ptr<arrow::Array>;
    static void read(const arrow::ChunkedArray& column, std::vector<std::int64_t>& out);
};

template <>
struct ParquetColumn<double> {
    static auto type() -> std::shared_ptr<arrow::DataType>;
    static auto build(std::span<const double> values) -> std::shared_ptr<arrow::Array>;
    static void read(const arrow::ChunkedArray& column, std::vector<double>& out);
};

template <>
struct ParquetColumn<Timestamp> {
    static auto type() -> std::shared_ptr<arrow::DataType>;
    static auto build(std::span<const Timestamp> values) -> std::shared_ptr<arrow::Array>;
    static void read(const arrow::ChunkedArray& column, std::vector<Timestamp>& out);
};

template <>
struct ParquetColumn<Date> {
    static auto type() -> std::shared_ptr<arrow::DataType>;
    static auto build(std::span<const Date> values) -> std::shared_ptr<arrow::Array>;
    static void read(const arrow::ChunkedArray& column, std::vector<Date>& out);
};

/// Load every row group of a Parquet file. Throws std::runtime_error.
[[nodiscard]] auto read_parquet_table(std::string_view path) -> std::shared_ptr<arrow::Table>;

/// Write a table as a Parquet file. Throws std::runtime_error.
void write_parquet_table(std::string_view path, const arrow::Table& table);

/// Column `name` of `table`. Throws std::runtime_error when it is missing.
[[nodiscard]] auto require_column(const arrow::Table& table, std::string_view name)
    -> std::shared_ptr<arrow::ChunkedArray>;

/// Read the key and value columns of a Parquet file into a Series.
///
/// Nulls are rejected; a Series has no missing-value representation.
template <typename K, typename V>
[[nodiscard]] auto read_parquet(std::string_view path, std::string_view key_column,
                                std::string_view value_column) -> Series<K, V> {
    auto table = read_parquet_table(path);

    std::vector<K> keys;
    std::vector<V> values;
    keys.reserve(static_cast<std::size_t>(table->num_rows()));
    values.reserve(static_cast<std::size_t>(table->num_rows()));
    ParquetColumn<K>::read(*require_column(*table, key_column), keys);
    ParquetColumn<V>::read(*require_column(*table, value_column), values);

    std::vector<DataPoint<K, V>> points;
    points.reserve(keys.size());
    for (std::size_t i = 0; i < keys.size(); ++i) {
        points.push_back(DataPoint<K, V>{keys[i], std::move(values[i])});
    }
    spdlog::debug("read_parquet: {} rows from {}", points.size(), path);

    auto series = collect_checked(VectorCursor<K, V>(std::move(points)));
    if (!series) {
        throw std::runtime_error(
            fmt::format("read_parquet: {}: {}", path, series.error().format()));
    }
    return std::move(*series);
}

/// Write `series` as a two-column Parquet file. Returns the number of rows.
template <typename K, typename V>
auto write_parquet(std::string_view path, const Series<K, V>& series, std::string_view key_column,
                   std::string_view value_column) -> std::int64_t {
    auto schema = arrow::schema({
        arrow::field(std::string(key_column), ParquetColumn<K>::type(), /*nullable=*/false),
        arrow::field(std::string(value_column), ParquetColumn<V>::type(), /*nullable=*/false),
    });
    auto table = arrow::Table::Make(
        schema, {ParquetColumn<K>::build(series.keys()), ParquetColumn<V>::build(series.values())});
    write_parquet_table(path, *table);
    spdlog::debug("write_parquet: {} rows to {}", series.size(), path);
    return static_cast<std::int64_t>(series.size());
}

}  // namespace tsx::io
