#pragma once
// tsx CSV codec — RFC 4180 delimited text in and out of a Series via rapidcsv.
//
// Reading maps every record through a caller-supplied extractor:
//
//   auto prices = tsx::io::read_csv<tsx::Timestamp, double>(
//       "prices.csv", [](const tsx::io::CsvRecord& row) {
//           return tsx::DataPoint{tsx::from_millis(row.get<std::int64_t>("ts")),
//                                 row.get<double>("price")};
//       });
//
// The decoded points go through the checked collection path, so the result
// is sorted and free of duplicate keys.

#include <tsx/core/cursor.hpp>
#include <tsx/core/data_point.hpp>
#include <tsx/core/series.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace tsx::io {

/// One record of an open CSV document.
class CsvRecord {
   public:
    CsvRecord(const rapidcsv::Document& doc, std::size_t row) noexcept : doc_(&doc), row_(row) {}

    /// Cell in column `name`, converted with rapidcsv's converters.
    template <typename T>
    [[nodiscard]] auto get(const std::string& name) const -> T {
        return doc_->GetCell<T>(name, row_);
    }

    /// Cell in column `index`.
    template <typename T>
    [[nodiscard]] auto get(std::size_t index) const -> T {
        return doc_->GetCell<T>(index, row_);
    }

    [[nodiscard]] auto row() const noexcept -> std::size_t { return row_; }

   private:
    const rapidcsv::Document* doc_;
    std::size_t row_;
};

struct CsvOptions {
    char separator = ',';
    /// Header row index; -1 when the file has no header.
    int header_row = 0;
};

/// Read `path` into a Series. Throws std::runtime_error when the file cannot
/// be read, a cell cannot be converted, or two records share a key.
template <typename K, typename V, typename Extract>
    requires std::is_invocable_r_v<DataPoint<K, V>, Extract&, const CsvRecord&>
[[nodiscard]] auto read_csv(std::string_view path, Extract extract, const CsvOptions& options = {})
    -> Series<K, V> {
    std::vector<DataPoint<K, V>> points;
    try {
        rapidcsv::Document doc(std::string(path), rapidcsv::LabelParams(options.header_row, -1),
                               rapidcsv::SeparatorParams(options.separator));
        const std::size_t rows = doc.GetRowCount();
        points.reserve(rows);
        for (std::size_t row = 0; row < rows; ++row) {
            points.push_back(extract(CsvRecord(doc, row)));
        }
    } catch (const std::exception& e) {
        throw std::runtime_error(fmt::format("read_csv: {}: {}", path, e.what()));
    }
    spdlog::debug("read_csv: {} records from {}", points.size(), path);

    auto series = collect_checked(VectorCursor<K, V>(std::move(points)));
    if (!series) {
        throw std::runtime_error(fmt::format("read_csv: {}: {}", path, series.error().format()));
    }
    return std::move(*series);
}

/// Write `series` to `path` with the given header. `format_row` renders one
/// point as its cells, one string per header column. Returns rows written.
template <typename K, typename V, typename Format>
    requires std::is_invocable_r_v<std::vector<std::string>, Format&, const K&, const V&>
auto write_csv(std::string_view path, const Series<K, V>& series,
               const std::vector<std::string>& header, Format format_row,
               const CsvOptions& options = {}) -> std::size_t {
    rapidcsv::Document doc(std::string(), rapidcsv::LabelParams(0, -1),
                           rapidcsv::SeparatorParams(options.separator));
    for (std::size_t col = 0; col < header.size(); ++col) {
        doc.SetColumnName(col, header[col]);
    }
    const auto keys = series.keys();
    const auto values = series.values();
    for (std::size_t row = 0; row < series.size(); ++row) {
        auto cells = format_row(keys[row], values[row]);
        if (cells.size() != header.size()) {
            throw std::runtime_error(fmt::format(
                "write_csv: row {} has {} cells, header has {}", row, cells.size(), header.size()));
        }
        doc.SetRow<std::string>(row, cells);
    }
    try {
        doc.Save(std::string(path));
    } catch (const std::exception& e) {
        throw std::runtime_error(fmt::format("write_csv: {}: {}", path, e.what()));
    }
    spdlog::debug("write_csv: {} records to {}", series.size(), path);
    return series.size();
}

/// Default row formatter: key and value through fmt.
template <typename K, typename V>
[[nodiscard]] auto format_cells(const K& key, const V& value) -> std::vector<std::string> {
    return {fmt::format("{}", key), fmt::format("{}", value)};
}

}  // namespace tsx::io
