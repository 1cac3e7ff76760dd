#include "pipeforge_ir/columnar/csv.hpp"
#include <arrow/buffer.h>
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <arrow/result.h>
#include <arrow/table.h>
#include <algorithm>
#include <stdexcept>
#include <unordered_map>

namespace pipeforge {
namespace columnar {

namespace {

// pandas' default missing-value spellings
const std::vector<std::string> kNullTokens = {
    "", "#N/A", "#N/A N/A", "#NA", "-1.#IND", "-1.#QNAN", "-NaN", "-nan",
    "1.#IND", "1.#QNAN", "<NA>", "N/A", "NA", "NULL", "NaN", "None",
    "n/a", "nan", "null"
};

template <typename T>
T unwrap(arrow::Result<T> result, const std::string& context) {
    if (!result.ok()) {
        throw std::runtime_error(context + ": " + result.status().ToString());
    }
    return result.MoveValueUnsafe();
}

void check(const arrow::Status& status, const std::string& context) {
    if (!status.ok()) {
        throw std::runtime_error(context + ": " + status.ToString());
    }
}

// Blank header cells become "Unnamed: <i>", repeats get ".1", ".2"
std::vector<std::string> header_names(const arrow::Schema& schema) {
    std::vector<std::string> names;
    std::unordered_map<std::string, int> seen;
    for (int i = 0; i < schema.num_fields(); ++i) {
        std::string name = schema.field(i)->name();
        if (name.empty()) name = "Unnamed: " + std::to_string(i);
        int& count = seen[name];
        names.push_back(count == 0 ? name : name + "." + std::to_string(count));
        ++count;
    }
    return names;
}

arrow::Result<std::shared_ptr<arrow::Table>> read_arrow(std::shared_ptr<arrow::io::InputStream> input) {
    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    parse_options.newlines_in_values = true;

    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    convert_options.null_values = kNullTokens;
    convert_options.true_values = {"True", "TRUE", "true"};
    convert_options.false_values = {"False", "FALSE", "false"};
    convert_options.strings_can_be_null = true;

    ARROW_ASSIGN_OR_RAISE(
        auto reader,
        arrow::csv::TableReader::Make(
            arrow::io::default_io_context(),
            std::move(input),
            read_options,
            parse_options,
            convert_options));

    ARROW_ASSIGN_OR_RAISE(auto table, reader->Read());
    return table->RenameColumns(header_names(*table->schema()));
}

arrow::Status write_arrow(const Table& table, arrow::io::OutputStream* out) {
    if (table.num_columns() == 0) {
        return arrow::Status::OK();
    }
    return arrow::csv::WriteCSV(*table.to_arrow(), arrow::csv::WriteOptions::Defaults(), out);
}

} // namespace

std::shared_ptr<Table> read_csv_text(const std::string& text) {
    auto input = std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(text));
    return Table::from_arrow(unwrap(read_arrow(input), "CSV parse error"));
}

std::shared_ptr<Table> read_csv_file(const std::string& path) {
    auto input = unwrap(arrow::io::ReadableFile::Open(path), "Cannot open CSV file '" + path + "'");
    return Table::from_arrow(unwrap(read_arrow(input), "CSV parse error in '" + path + "'"));
}

std::string to_csv_text(const Table& table, size_t max_rows) {
    // Every cell goes out as its format_value text so that 1 and 1.0 agree
    Table canonical;
    size_t rows = std::min(table.num_rows(), max_rows);
    for (const auto& name : table.column_names()) {
        auto column = table.get_column(name);
        auto text = std::make_shared<StringColumn>();
        for (size_t r = 0; r < rows; ++r) {
            Value v = column->value_at(r);
            std::string cell = format_value(v);
            // NaN prints empty and counts as missing
            if (column->is_null(r) || (cell.empty() && std::holds_alternative<double>(v))) {
                text->append_null();
            } else {
                text->append(cell);
            }
        }
        canonical.add_column(name, text);
    }

    auto out = unwrap(arrow::io::BufferOutputStream::Create(), "CSV write error");
    check(write_arrow(canonical, out.get()), "CSV write error");
    return unwrap(out->Finish(), "CSV write error")->ToString();
}

void write_csv_file(const Table& table, const std::string& path) {
    auto out = unwrap(arrow::io::FileOutputStream::Open(path), "Cannot open '" + path + "' for writing");
    check(write_arrow(table, out.get()), "Failed writing CSV to '" + path + "'");
    check(out->Close(), "Failed writing CSV to '" + path + "'");
}

} // namespace columnar
} // namespace pipeforge
