#pragma once

#include "table.hpp"
#include <memory>
#include <string>

namespace pipeforge {
namespace columnar {

/**
 * CSV reader on top of arrow::csv::TableReader
 *
 * First record is the header. Empty fields and pandas' NA spellings
 * (NA, NaN, null, None, ...) are nulls, True/TRUE/true and their False
 * counterparts are booleans. Arrow infers each column's type; dates, times
 * and other types the tables do not hold arrive as strings, an all-null
 * column as FLOAT64. Repeated header names get ".1", ".2" suffixes.
 * Malformed input (ragged rows, empty text) throws std::runtime_error.
 */
std::shared_ptr<Table> read_csv_text(const std::string& text);
std::shared_ptr<Table> read_csv_file(const std::string& path);

// Canonical text of the first max_rows rows (all by default): each cell
// as format_value() prints it, written by Arrow's CSV writer
std::string to_csv_text(const Table& table, size_t max_rows = static_cast<size_t>(-1));

// Writes the table with its column types through Arrow's CSV writer
void write_csv_file(const Table& table, const std::string& path);

} // namespace columnar
} // namespace pipeforge
