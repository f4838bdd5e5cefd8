#pragma once

#include "data/trajectory_table.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace bfda_io {

// Column names written by the simulation stage, plus accepted aliases.
inline const std::vector<std::string> ID_COLUMNS = {"id"};
inline const std::vector<std::string> N_COLUMNS = {"n"};
inline const std::vector<std::string> LOG_BF_COLUMNS = {"logBF", "log_bf"};
inline const std::vector<std::string> BOUNDARY_COLUMNS = {"boundary"};
inline const std::vector<std::string> P_VALUE_COLUMNS = {"p.value", "p_value"};

namespace detail {

inline std::string trim_cell(std::string cell) {
    while (!cell.empty() && (cell.back() == '\r' || cell.back() == '\n' ||
                             cell.back() == ' ' || cell.back() == '\t'))
        cell.pop_back();
    size_t start = cell.find_first_not_of(" \t");
    cell = (start == std::string::npos) ? std::string() : cell.substr(start);
    if (cell.size() >= 2 && cell.front() == '"' && cell.back() == '"') {
        cell = cell.substr(1, cell.size() - 2);
    }
    return cell;
}

inline std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> cells;
    std::istringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) cells.push_back(trim_cell(cell));
    if (!line.empty() && line.back() == ',') cells.push_back("");
    return cells;
}

inline int find_column(const std::map<std::string, int>& header,
                       const std::vector<std::string>& names, bool required,
                       const std::string& path) {
    for (const auto& name : names) {
        auto it = header.find(name);
        if (it != header.end()) return it->second;
    }
    if (required) {
        throw std::runtime_error("Missing column '" + names.front() + "' in " + path);
    }
    return -1;
}

inline bool is_missing(const std::string& cell) {
    return cell.empty() || cell == "NA" || cell == "NaN" || cell == "nan";
}

inline double parse_double(const std::string& cell, const std::string& where) {
    try {
        size_t pos = 0;
        double v = std::stod(cell, &pos);
        if (pos != cell.size()) throw std::invalid_argument(cell);
        return v;
    } catch (const std::exception&) {
        throw std::runtime_error("Cannot parse number '" + cell + "' at " + where);
    }
}

// Exact for plain integer cells; "40.0" style cells go through parse_double.
inline int64_t parse_int(const std::string& cell, const std::string& where) {
    try {
        size_t pos = 0;
        long long exact = std::stoll(cell, &pos);
        if (pos == cell.size()) return static_cast<int64_t>(exact);
    } catch (const std::out_of_range&) {
        throw std::runtime_error("Integer out of range '" + cell + "' at " + where);
    } catch (const std::invalid_argument&) {
        // not an integer literal; reported by parse_double below
    }
    double v = parse_double(cell, where);
    if (!std::isfinite(v) || v != std::floor(v)) {
        throw std::runtime_error("Expected an integer, got '" + cell + "' at " + where);
    }
    return static_cast<int64_t>(v);
}

inline void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

// Read one numeric column as doubles. Nulls become NaN when allowed.
inline std::vector<double> column_as_double(const arrow::Table& table, const std::string& name,
                                            bool allow_null, const std::string& path) {
    auto col = table.GetColumnByName(name);
    if (!col) {
        throw std::runtime_error("Missing column '" + name + "' in " + path);
    }
    std::vector<double> values;
    values.reserve(static_cast<size_t>(col->length()));

    for (int c = 0; c < col->num_chunks(); ++c) {
        auto chunk = col->chunk(c);
        for (int64_t i = 0; i < chunk->length(); ++i) {
            if (chunk->IsNull(i)) {
                if (!allow_null) {
                    throw std::runtime_error("Null value in column '" + name + "' in " + path);
                }
                values.push_back(std::numeric_limits<double>::quiet_NaN());
                continue;
            }
            if (auto d = std::dynamic_pointer_cast<arrow::DoubleArray>(chunk)) {
                values.push_back(d->Value(i));
            } else if (auto f = std::dynamic_pointer_cast<arrow::FloatArray>(chunk)) {
                values.push_back(static_cast<double>(f->Value(i)));
            } else if (auto l = std::dynamic_pointer_cast<arrow::Int64Array>(chunk)) {
                values.push_back(static_cast<double>(l->Value(i)));
            } else if (auto n = std::dynamic_pointer_cast<arrow::Int32Array>(chunk)) {
                values.push_back(static_cast<double>(n->Value(i)));
            } else {
                throw std::runtime_error("Unsupported type " + chunk->type()->ToString() +
                                         " for column '" + name + "' in " + path);
            }
        }
    }
    return values;
}

// Read one integer column exactly. Floating columns must hold whole numbers.
inline std::vector<int64_t> column_as_int64(const arrow::Table& table, const std::string& name,
                                            const std::string& path) {
    auto col = table.GetColumnByName(name);
    if (!col) {
        throw std::runtime_error("Missing column '" + name + "' in " + path);
    }
    std::vector<int64_t> values;
    values.reserve(static_cast<size_t>(col->length()));

    int64_t row = 0;
    for (int c = 0; c < col->num_chunks(); ++c) {
        auto chunk = col->chunk(c);
        for (int64_t i = 0; i < chunk->length(); ++i, ++row) {
            std::string where = path + " column '" + name + "' row " + std::to_string(row);
            if (chunk->IsNull(i)) {
                throw std::runtime_error("Null value at " + where);
            }
            if (auto l = std::dynamic_pointer_cast<arrow::Int64Array>(chunk)) {
                values.push_back(l->Value(i));
            } else if (auto n = std::dynamic_pointer_cast<arrow::Int32Array>(chunk)) {
                values.push_back(static_cast<int64_t>(n->Value(i)));
            } else if (auto d = std::dynamic_pointer_cast<arrow::DoubleArray>(chunk)) {
                double v = d->Value(i);
                if (!std::isfinite(v) || v != std::floor(v)) {
                    throw std::runtime_error("Expected an integer, got " +
                                             std::to_string(v) + " at " + where);
                }
                values.push_back(static_cast<int64_t>(v));
            } else {
                throw std::runtime_error("Unsupported type " + chunk->type()->ToString() +
                                         " for column '" + name + "' in " + path);
            }
        }
    }
    return values;
}

inline std::string first_present(const arrow::Table& table,
                                 const std::vector<std::string>& names, const std::string& path) {
    for (const auto& name : names) {
        if (table.GetColumnByName(name)) return name;
    }
    throw std::runtime_error("Missing column '" + names.front() + "' in " + path);
}

}  // namespace detail

// ---------------------------------------------------------------------------
// CSV — header-driven; extra columns (e.g. R row names) are ignored
// ---------------------------------------------------------------------------
inline TrajectoryTable read_trajectory_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }

    std::string line;
    if (!std::getline(file, line)) {
        throw std::runtime_error("Empty CSV file: " + path);
    }
    std::map<std::string, int> header;
    auto names = detail::split_csv_line(line);
    for (size_t i = 0; i < names.size(); ++i) header.emplace(names[i], static_cast<int>(i));

    int id_col = detail::find_column(header, ID_COLUMNS, true, path);
    int n_col = detail::find_column(header, N_COLUMNS, true, path);
    int lbf_col = detail::find_column(header, LOG_BF_COLUMNS, true, path);
    int bnd_col = detail::find_column(header, BOUNDARY_COLUMNS, true, path);
    int p_col = detail::find_column(header, P_VALUE_COLUMNS, false, path);

    TrajectoryTable table;
    int line_no = 1;
    while (std::getline(file, line)) {
        ++line_no;
        if (detail::trim_cell(line).empty()) continue;
        auto cells = detail::split_csv_line(line);
        std::string where = path + ":" + std::to_string(line_no);
        if (cells.size() < names.size()) {
            throw std::runtime_error("Expected " + std::to_string(names.size()) +
                                     " columns, got " + std::to_string(cells.size()) +
                                     " at " + where);
        }

        TrajectoryRow row;
        row.id = detail::parse_int(cells[id_col], where);
        row.n = static_cast<int>(detail::parse_int(cells[n_col], where));
        row.log_bf = detail::parse_double(cells[lbf_col], where);
        row.boundary = detail::parse_double(cells[bnd_col], where);
        if (p_col >= 0 && !detail::is_missing(cells[p_col])) {
            row.p_value = detail::parse_double(cells[p_col], where);
        } else {
            row.p_value = std::numeric_limits<double>::quiet_NaN();
        }
        table.add_row(row);
    }
    return table;
}

// ---------------------------------------------------------------------------
// Parquet — via Arrow
// ---------------------------------------------------------------------------
inline TrajectoryTable read_trajectory_parquet(const std::string& path) {
    auto open_result = arrow::io::ReadableFile::Open(path);
    if (!open_result.ok()) {
        throw std::runtime_error("Cannot open input file: " + path + " (" +
                                 open_result.status().ToString() + ")");
    }

    auto file_reader_result = parquet::arrow::OpenFile(
        open_result.ValueOrDie(), arrow::default_memory_pool());
    detail::check(file_reader_result.status(), "Cannot read Parquet file " + path);
    auto reader = file_reader_result.MoveValueUnsafe();

    std::shared_ptr<arrow::Table> arrow_table;
    detail::check(reader->ReadTable(&arrow_table), "Cannot read Parquet table " + path);

    const auto& t = *arrow_table;
    auto ids = detail::column_as_int64(t, detail::first_present(t, ID_COLUMNS, path), path);
    auto ns = detail::column_as_int64(t, detail::first_present(t, N_COLUMNS, path), path);
    auto lbfs = detail::column_as_double(t, detail::first_present(t, LOG_BF_COLUMNS, path),
                                         false, path);
    auto bnds = detail::column_as_double(t, detail::first_present(t, BOUNDARY_COLUMNS, path),
                                         false, path);

    std::vector<double> ps;
    bool has_p = false;
    for (const auto& name : P_VALUE_COLUMNS) {
        if (t.GetColumnByName(name)) {
            ps = detail::column_as_double(t, name, true, path);
            has_p = true;
            break;
        }
    }

    TrajectoryTable table;
    for (size_t i = 0; i < ids.size(); ++i) {
        TrajectoryRow row;
        row.id = ids[i];
        row.n = static_cast<int>(ns[i]);
        row.log_bf = lbfs[i];
        row.boundary = bnds[i];
        row.p_value = has_p ? ps[i] : std::numeric_limits<double>::quiet_NaN();
        table.add_row(row);
    }
    return table;
}

// ZSTD-compressed Parquet with columns id, n, logBF, boundary, p.value.
inline void write_trajectory_parquet(const TrajectoryTable& table, const std::string& path) {
    arrow::Int64Builder id_b;
    arrow::Int64Builder n_b;
    arrow::DoubleBuilder lbf_b;
    arrow::DoubleBuilder bnd_b;
    arrow::DoubleBuilder p_b;

    for (const auto& r : table.rows()) {
        detail::check(id_b.Append(r.id), "append id");
        detail::check(n_b.Append(r.n), "append n");
        detail::check(lbf_b.Append(r.log_bf), "append logBF");
        detail::check(bnd_b.Append(r.boundary), "append boundary");
        if (std::isnan(r.p_value)) {
            detail::check(p_b.AppendNull(), "append p.value");
        } else {
            detail::check(p_b.Append(r.p_value), "append p.value");
        }
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays(5);
    detail::check(id_b.Finish(&arrays[0]), "finish id");
    detail::check(n_b.Finish(&arrays[1]), "finish n");
    detail::check(lbf_b.Finish(&arrays[2]), "finish logBF");
    detail::check(bnd_b.Finish(&arrays[3]), "finish boundary");
    detail::check(p_b.Finish(&arrays[4]), "finish p.value");

    auto schema = arrow::schema({
        arrow::field("id", arrow::int64()),
        arrow::field("n", arrow::int64()),
        arrow::field("logBF", arrow::float64()),
        arrow::field("boundary", arrow::float64()),
        arrow::field("p.value", arrow::float64()),
    });
    auto arrow_table = arrow::Table::Make(schema, arrays);

    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file: " + path);
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    int64_t chunk_size = std::max<int64_t>(1, static_cast<int64_t>(table.size()));
    detail::check(parquet::arrow::WriteTable(*arrow_table, arrow::default_memory_pool(),
                                             outfile, chunk_size, props),
                  "Failed to write Parquet " + path);
    detail::check(outfile->Close(), "Failed to close " + path);
}

// Dispatch on file extension (.csv or .parquet).
inline TrajectoryTable read_trajectory_table(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    if (ext == ".csv") return read_trajectory_csv(path);
    if (ext == ".parquet") return read_trajectory_parquet(path);
    throw std::runtime_error("Unsupported input format '" + ext +
                             "'. Use .csv or .parquet extension.");
}

}  // namespace bfda_io
