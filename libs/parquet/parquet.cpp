#include "parquet.hpp"

#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

namespace tsx::io {

namespace {

void check(const arrow::Status& st, std::string_view what) {
    if (!st.ok()) {
        throw std::runtime_error(fmt::format("{} ({})", what, st.ToString()));
    }
}

void reject_nulls(const arrow::Array& chunk, std::string_view what) {
    if (chunk.null_count() > 0) {
        throw std::runtime_error(fmt::format("read_parquet: {} column contains nulls", what));
    }
}

template <typename ArrowArray, typename T>
void append_values(const std::shared_ptr<arrow::Array>& chunk, std::vector<T>& out) {
    auto arr = std::static_pointer_cast<ArrowArray>(chunk);
    for (int64_t i = 0; i < arr->length(); ++i) {
        out.push_back(static_cast<T>(arr->Value(i)));
    }
}

auto nanos_per_unit(arrow::TimeUnit::type unit) -> std::int64_t {
    switch (unit) {
        case arrow::TimeUnit::SECOND:
            return 1'000'000'000;
        case arrow::TimeUnit::MILLI:
            return 1'000'000;
        case arrow::TimeUnit::MICRO:
            return 1'000;
        case arrow::TimeUnit::NANO:
            return 1;
    }
    throw std::runtime_error("read_parquet: unsupported timestamp unit");
}

template <typename Builder, typename T, typename Project>
auto build_array(Builder& builder, std::span<const T> values, Project project,
                 std::string_view what) -> std::shared_ptr<arrow::Array> {
    check(builder.Reserve(static_cast<int64_t>(values.size())), "write_parquet: reserve failed");
    for (const auto& value : values) {
        auto st = builder.Append(project(value));
        if (!st.ok()) {
            check(st, fmt::format("write_parquet: append {} failed", what));
        }
    }
    std::shared_ptr<arrow::Array> arr;
    check(builder.Finish(&arr), fmt::format("write_parquet: finish {} failed", what));
    return arr;
}

}  // namespace

// ─── int64 ────────────────────────────────────────────────────────────────────

auto ParquetColumn<std::int64_t>::type() -> std::shared_ptr<arrow::DataType> {
    return arrow::int64();
}

auto ParquetColumn<std::int64_t>::build(std::span<const std::int64_t> values)
    -> std::shared_ptr<arrow::Array> {
    arrow::Int64Builder builder;
    return build_array(builder, values, [](std::int64_t v) { return v; }, "int64");
}

void ParquetColumn<std::int64_t>::read(const arrow::ChunkedArray& column,
                                       std::vector<std::int64_t>& out) {
    for (const auto& chunk : column.chunks()) {
        reject_nulls(*chunk, "int64");
        switch (chunk->type_id()) {
            case arrow::Type::INT64:
                append_values<arrow::Int64Array>(chunk, out);
                break;
            case arrow::Type::INT32:
                append_values<arrow::Int32Array>(chunk, out);
                break;
            case arrow::Type::INT16:
                append_values<arrow::Int16Array>(chunk, out);
                break;
            case arrow::Type::INT8:
                append_values<arrow::Int8Array>(chunk, out);
                break;
            case arrow::Type::UINT32:
                append_values<arrow::UInt32Array>(chunk, out);
                break;
            case arrow::Type::UINT16:
                append_values<arrow::UInt16Array>(chunk, out);
                break;
            case arrow::Type::UINT8:
                append_values<arrow::UInt8Array>(chunk, out);
                break;
            default:
                throw std::runtime_error("read_parquet: unsupported integer column type " +
                                         chunk->type()->ToString());
        }
    }
}

// ─── double ───────────────────────────────────────────────────────────────────

auto ParquetColumn<double>::type() -> std::shared_ptr<arrow::DataType> {
    return arrow::float64();
}

auto ParquetColumn<double>::build(std::span<const double> values)
    -> std::shared_ptr<arrow::Array> {
    arrow::DoubleBuilder builder;
    return build_array(builder, values, [](double v) { return v; }, "double");
}

void ParquetColumn<double>::read(const arrow::ChunkedArray& column, std::vector<double>& out) {
    for (const auto& chunk : column.chunks()) {
        reject_nulls(*chunk, "double");
        switch (chunk->type_id()) {
            case arrow::Type::DOUBLE:
                append_values<arrow::DoubleArray>(chunk, out);
                break;
            case arrow::Type::FLOAT:
                append_values<arrow::FloatArray>(chunk, out);
                break;
            default:
                throw std::runtime_error("read_parquet: unsupported float column type " +
                                         chunk->type()->ToString());
        }
    }
}

// ─── Timestamp ────────────────────────────────────────────────────────────────

auto ParquetColumn<Timestamp>::type() -> std::shared_ptr<arrow::DataType> {
    return arrow::timestamp(arrow::TimeUnit::NANO);
}

auto ParquetColumn<Timestamp>::build(std::span<const Timestamp> values)
    -> std::shared_ptr<arrow::Array> {
    arrow::TimestampBuilder builder(type(), arrow::default_memory_pool());
    return build_array(builder, values, [](Timestamp ts) { return ts.nanos; }, "timestamp");
}

void ParquetColumn<Timestamp>::read(const arrow::ChunkedArray& column,
                                    std::vector<Timestamp>& out) {
    for (const auto& chunk : column.chunks()) {
        reject_nulls(*chunk, "timestamp");
        if (chunk->type_id() == arrow::Type::TIMESTAMP) {
            const auto& ts_type = static_cast<const arrow::TimestampType&>(*chunk->type());
            const std::int64_t scale = nanos_per_unit(ts_type.unit());
            auto arr = std::static_pointer_cast<arrow::TimestampArray>(chunk);
            for (int64_t i = 0; i < arr->length(); ++i) {
                out.push_back(Timestamp{arr->Value(i) * scale});
            }
        } else if (chunk->type_id() == arrow::Type::INT64) {
            auto arr = std::static_pointer_cast<arrow::Int64Array>(chunk);
            for (int64_t i = 0; i < arr->length(); ++i) {
                out.push_back(Timestamp{arr->Value(i)});
            }
        } else {
            throw std::runtime_error("read_parquet: unsupported timestamp column type " +
                                     chunk->type()->ToString());
        }
    }
}

// ─── Date ─────────────────────────────────────────────────────────────────────

auto ParquetColumn<Date>::type() -> std::shared_ptr<arrow::DataType> {
    return arrow::date32();
}

auto ParquetColumn<Date>::build(std::span<const Date> values) -> std::shared_ptr<arrow::Array> {
    arrow::Date32Builder builder;
    return build_array(builder, values, [](Date d) { return d.days; }, "date");
}

void ParquetColumn<Date>::read(const arrow::ChunkedArray& column, std::vector<Date>& out) {
    static constexpr std::int64_t kMillisPerDay = 86'400'000;
    for (const auto& chunk : column.chunks()) {
        reject_nulls(*chunk, "date");
        if (chunk->type_id() == arrow::Type::DATE32) {
            auto arr = std::static_pointer_cast<arrow::Date32Array>(chunk);
            for (int64_t i = 0; i < arr->length(); ++i) {
                out.push_back(Date{arr->Value(i)});
            }
        } else if (chunk->type_id() == arrow::Type::DATE64) {
            auto arr = std::static_pointer_cast<arrow::Date64Array>(chunk);
            for (int64_t i = 0; i < arr->length(); ++i) {
                const std::int64_t millis = arr->Value(i);
                out.push_back(
                    Date{static_cast<std::int32_t>(floor_to(millis, kMillisPerDay) / kMillisPerDay)});
            }
        } else {
            throw std::runtime_error("read_parquet: unsupported date column type " +
                                     chunk->type()->ToString());
        }
    }
}

// ─── Files ────────────────────────────────────────────────────────────────────

auto read_parquet_table(std::string_view path) -> std::shared_ptr<arrow::Table> {
    auto input_result = arrow::io::ReadableFile::Open(std::string(path));
    if (!input_result.ok()) {
        throw std::runtime_error("read_parquet: failed to open: " + std::string(path) + " (" +
                                 input_result.status().ToString() + ")");
    }

    std::unique_ptr<parquet::arrow::FileReader> reader;
    check(parquet::arrow::OpenFile(input_result.ValueOrDie(), arrow::default_memory_pool(),
                                   &reader),
          "read_parquet: failed to read: " + std::string(path));

    std::shared_ptr<arrow::Table> table;
    check(reader->ReadTable(&table), "read_parquet: failed to load table: " + std::string(path));
    return table;
}

void write_parquet_table(std::string_view path, const arrow::Table& table) {
    auto sink_result = arrow::io::FileOutputStream::Open(std::string(path));
    if (!sink_result.ok()) {
        throw std::runtime_error("write_parquet: cannot open for writing: " + std::string(path) +
                                 " (" + sink_result.status().ToString() + ")");
    }
    check(parquet::arrow::WriteTable(table, arrow::default_memory_pool(),
                                     sink_result.ValueOrDie(),
                                     /*chunk_size=*/static_cast<int64_t>(64) * 1024 * 1024),
          "write_parquet: failed to write: " + std::string(path));
}

auto require_column(const arrow::Table& table, std::string_view name)
    -> std::shared_ptr<arrow::ChunkedArray> {
    auto column = table.GetColumnByName(std::string(name));
    if (column == nullptr) {
        throw std::runtime_error(fmt::format("read_parquet: no column named '{}'", name));
    }
    return column;
}

}  // namespace tsx::io
