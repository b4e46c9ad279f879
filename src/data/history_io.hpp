#pragma once

#include "data/price_history.hpp"
#include "research/errors.hpp"
#include "time_utils.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <array>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// History loading. Columns: date, symbol, open, high, low, close, volume,
// trust_score, forecast_confidence. Dates are ISO strings or YYYYMMDD ints.
// open/high/low default to close and volume to 0 when absent.
// ---------------------------------------------------------------------------
namespace history_io {

inline int parse_date_cell(const std::string& cell) {
    if (cell.size() == 10) return time_utils::parse_iso_date(cell);
    if (cell.size() == 8) {
        int v = 0;
        for (char c : cell) {
            if (c < '0' || c > '9') throw InvalidRangeError("malformed date '" + cell + "'");
            v = v * 10 + (c - '0');
        }
        if (!time_utils::is_valid_date(v)) throw InvalidRangeError("invalid date '" + cell + "'");
        return v;
    }
    throw InvalidRangeError("malformed date '" + cell + "'");
}

// ===========================================================================
// Parquet
// ===========================================================================

inline std::shared_ptr<arrow::ChunkedArray> find_column(const arrow::Table& table,
                                                        const std::string& name,
                                                        bool required) {
    auto col = table.GetColumnByName(name);
    if (!col && required) {
        throw DataStoreUnavailableError("history is missing required column '" + name + "'");
    }
    if (col && col->null_count() > 0) {
        int64_t row = 0;
        for (int chunk = 0; chunk < col->num_chunks(); ++chunk) {
            auto arr = col->chunk(chunk);
            for (int64_t i = 0; i < arr->length(); ++i, ++row) {
                if (arr->IsNull(i)) {
                    throw DataStoreUnavailableError("history column '" + name
                                                    + "' has a null value at row "
                                                    + std::to_string(row));
                }
            }
        }
    }
    return col;
}

inline std::vector<double> extract_doubles(const std::shared_ptr<arrow::ChunkedArray>& col) {
    std::vector<double> values;
    values.reserve(static_cast<size_t>(col->length()));
    for (int chunk = 0; chunk < col->num_chunks(); ++chunk) {
        auto arr = col->chunk(chunk);
        switch (arr->type_id()) {
            case arrow::Type::DOUBLE: {
                auto a = std::static_pointer_cast<arrow::DoubleArray>(arr);
                for (int64_t i = 0; i < a->length(); ++i) values.push_back(a->Value(i));
                break;
            }
            case arrow::Type::FLOAT: {
                auto a = std::static_pointer_cast<arrow::FloatArray>(arr);
                for (int64_t i = 0; i < a->length(); ++i) values.push_back(a->Value(i));
                break;
            }
            case arrow::Type::INT64: {
                auto a = std::static_pointer_cast<arrow::Int64Array>(arr);
                for (int64_t i = 0; i < a->length(); ++i)
                    values.push_back(static_cast<double>(a->Value(i)));
                break;
            }
            default:
                throw DataStoreUnavailableError("unsupported numeric column type "
                                                + arr->type()->ToString());
        }
    }
    return values;
}

inline std::vector<std::string> extract_strings(const std::shared_ptr<arrow::ChunkedArray>& col) {
    std::vector<std::string> values;
    values.reserve(static_cast<size_t>(col->length()));
    for (int chunk = 0; chunk < col->num_chunks(); ++chunk) {
        auto arr = std::dynamic_pointer_cast<arrow::StringArray>(col->chunk(chunk));
        if (!arr) throw DataStoreUnavailableError("expected a utf8 column");
        for (int64_t i = 0; i < arr->length(); ++i) values.push_back(arr->GetString(i));
    }
    return values;
}

inline std::vector<int> extract_dates(const std::shared_ptr<arrow::ChunkedArray>& col) {
    std::vector<int> dates;
    if (col->type()->id() == arrow::Type::STRING) {
        for (const auto& s : extract_strings(col)) dates.push_back(parse_date_cell(s));
        return dates;
    }
    if (col->type()->id() == arrow::Type::INT32) {
        for (int chunk = 0; chunk < col->num_chunks(); ++chunk) {
            auto a = std::static_pointer_cast<arrow::Int32Array>(col->chunk(chunk));
            for (int64_t i = 0; i < a->length(); ++i) dates.push_back(a->Value(i));
        }
        return dates;
    }
    for (double v : extract_doubles(col)) dates.push_back(static_cast<int>(v));
    return dates;
}

inline PriceHistoryStore load_parquet_history(const std::string& path) {
    auto open_result = arrow::io::ReadableFile::Open(path);
    if (!open_result.ok()) {
        throw DataStoreUnavailableError("cannot open history " + path + ": "
                                        + open_result.status().ToString());
    }
    auto file_reader_result = parquet::arrow::OpenFile(
        open_result.ValueOrDie(), arrow::default_memory_pool());
    if (!file_reader_result.ok()) {
        throw DataStoreUnavailableError("not a parquet file " + path + ": "
                                        + file_reader_result.status().ToString());
    }
    auto reader = file_reader_result.MoveValueUnsafe();

    std::shared_ptr<arrow::Table> table;
    auto status = reader->ReadTable(&table);
    if (!status.ok()) {
        throw DataStoreUnavailableError("failed to read " + path + ": " + status.ToString());
    }

    auto dates = extract_dates(find_column(*table, "date", true));
    auto symbols = extract_strings(find_column(*table, "symbol", true));
    auto close = extract_doubles(find_column(*table, "close", true));
    auto trust = extract_doubles(find_column(*table, "trust_score", true));
    auto conf = extract_doubles(find_column(*table, "forecast_confidence", true));

    auto optional_doubles = [&](const std::string& name, const std::vector<double>& fallback) {
        auto col = find_column(*table, name, false);
        return col ? extract_doubles(col) : fallback;
    };
    auto open = optional_doubles("open", close);
    auto high = optional_doubles("high", close);
    auto low = optional_doubles("low", close);
    auto volume = optional_doubles("volume", std::vector<double>(close.size(), 0.0));

    PriceHistoryStore store;
    for (size_t i = 0; i < dates.size(); ++i) {
        PriceBar bar;
        bar.date = dates[i];
        bar.open = open[i];
        bar.high = high[i];
        bar.low = low[i];
        bar.close = close[i];
        bar.volume = volume[i];
        bar.trust_score = trust[i];
        bar.forecast_confidence = conf[i];
        store.add(symbols[i], bar);
    }
    store.finalize();
    return store;
}

// Write a store as a ZSTD-compressed Parquet file in the loader's schema.
inline void write_parquet_history(const std::string& path, const PriceHistoryStore& store) {
    arrow::FieldVector fields = {
        arrow::field("date", arrow::int64()),
        arrow::field("symbol", arrow::utf8()),
        arrow::field("open", arrow::float64()),
        arrow::field("high", arrow::float64()),
        arrow::field("low", arrow::float64()),
        arrow::field("close", arrow::float64()),
        arrow::field("volume", arrow::float64()),
        arrow::field("trust_score", arrow::float64()),
        arrow::field("forecast_confidence", arrow::float64()),
    };
    auto schema = arrow::schema(fields);

    arrow::Int64Builder date_b;
    arrow::StringBuilder symbol_b;
    std::array<arrow::DoubleBuilder, 7> double_b;
    int64_t num_rows = 0;
    for (const auto& [symbol, series] : store.all()) {
        for (const auto& bar : series) {
            (void)date_b.Append(bar.date);
            (void)symbol_b.Append(symbol);
            double vals[7] = {bar.open, bar.high, bar.low, bar.close, bar.volume,
                              bar.trust_score, bar.forecast_confidence};
            for (int c = 0; c < 7; ++c) (void)double_b[c].Append(vals[c]);
            ++num_rows;
        }
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    std::shared_ptr<arrow::Array> arr;
    (void)date_b.Finish(&arr);
    arrays.push_back(arr);
    (void)symbol_b.Finish(&arr);
    arrays.push_back(arr);
    for (auto& b : double_b) {
        (void)b.Finish(&arr);
        arrays.push_back(arr);
    }

    auto table = arrow::Table::Make(schema, arrays);

    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("cannot open parquet output file: " + path);
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    auto status = parquet::arrow::WriteTable(
        *table, arrow::default_memory_pool(), outfile,
        /*chunk_size=*/std::max<int64_t>(num_rows, 1), props);
    if (!status.ok()) {
        throw std::runtime_error("failed to write parquet: " + status.ToString());
    }
}

// ===========================================================================
// CSV
// ===========================================================================

inline std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    std::istringstream ss(line);
    while (std::getline(ss, cell, ',')) {
        if (!cell.empty() && cell.back() == '\r') cell.pop_back();
        cells.push_back(cell);
    }
    if (!line.empty() && line.back() == ',') cells.emplace_back();
    return cells;
}

inline PriceHistoryStore load_csv_history(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw DataStoreUnavailableError("cannot open history " + path);

    std::string line;
    if (!std::getline(in, line)) throw DataStoreUnavailableError("empty history file " + path);
    std::map<std::string, size_t> index;
    auto header = split_csv_line(line);
    for (size_t i = 0; i < header.size(); ++i) index[header[i]] = i;
    for (const char* req : {"date", "symbol", "close", "trust_score", "forecast_confidence"}) {
        if (!index.count(req)) {
            throw DataStoreUnavailableError("history is missing required column '"
                                            + std::string(req) + "'");
        }
    }

    PriceHistoryStore store;
    int line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty() || line == "\r") continue;
        auto cells = split_csv_line(line);
        if (cells.size() < header.size()) {
            throw DataStoreUnavailableError(path + ":" + std::to_string(line_no)
                                            + ": expected " + std::to_string(header.size())
                                            + " columns");
        }
        auto num = [&](const std::string& name, double fallback) {
            auto it = index.find(name);
            if (it == index.end() || cells[it->second].empty()) return fallback;
            try {
                return std::stod(cells[it->second]);
            } catch (const std::exception&) {
                throw DataStoreUnavailableError(path + ":" + std::to_string(line_no)
                                                + ": bad number in column " + name);
            }
        };
        PriceBar bar;
        bar.date = parse_date_cell(cells[index["date"]]);
        bar.close = num("close", 0.0);
        bar.open = num("open", bar.close);
        bar.high = num("high", bar.close);
        bar.low = num("low", bar.close);
        bar.volume = num("volume", 0.0);
        bar.trust_score = num("trust_score", 0.0);
        bar.forecast_confidence = num("forecast_confidence", 0.0);
        store.add(cells[index["symbol"]], bar);
    }
    store.finalize();
    return store;
}

// Dispatch on extension. A missing path raises DataStoreUnavailableError.
inline PriceHistoryStore load_history(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw DataStoreUnavailableError("history store not found: " + path);
    }
    auto ext = std::filesystem::path(path).extension().string();
    if (ext == ".parquet") return load_parquet_history(path);
    if (ext == ".csv") return load_csv_history(path);
    throw DataStoreUnavailableError("unsupported history format '" + ext
                                    + "' (use .parquet or .csv)");
}

}  // namespace history_io
