#include "pipeforge_ir/columnar/table.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <arrow/array/concatenate.h>
#include <arrow/array/util.h>
#include <arrow/chunked_array.h>
#include <arrow/scalar.h>

namespace pipeforge {
namespace columnar {

void Table::add_column(const std::string& name, std::shared_ptr<Column> column) {
    if (!column) {
        throw std::invalid_argument("Cannot add null column");
    }

    if (column_order_.empty()) {
        num_rows_ = column->size();
    } else if (column->size() != num_rows_) {
        throw std::invalid_argument(
            "Column size (" + std::to_string(column->size()) +
            ") does not match table rows (" + std::to_string(num_rows_) + ")"
        );
    }

    if (columns_.find(name) != columns_.end()) {
        throw std::invalid_argument("Column '" + name + "' already exists");
    }

    columns_[name] = std::move(column);
    column_order_.push_back(name);
}

void Table::set_column(const std::string& name, std::shared_ptr<Column> column) {
    auto it = columns_.find(name);
    if (it == columns_.end()) {
        add_column(name, std::move(column));
        return;
    }
    if (!column) {
        throw std::invalid_argument("Cannot add null column");
    }
    if (column->size() != num_rows_) {
        throw std::invalid_argument(
            "Column size (" + std::to_string(column->size()) +
            ") does not match table rows (" + std::to_string(num_rows_) + ")"
        );
    }
    it->second = std::move(column);
}

std::shared_ptr<Column> Table::get_column(const std::string& name) const {
    auto it = columns_.find(name);
    if (it == columns_.end()) {
        throw std::invalid_argument("Column '" + name + "' not found");
    }
    return it->second;
}

bool Table::has_column(const std::string& name) const {
    return columns_.find(name) != columns_.end();
}

std::vector<std::string> Table::column_names() const {
    return column_order_;
}

size_t Table::num_rows() const {
    return num_rows_;
}

size_t Table::num_columns() const {
    return column_order_.size();
}

std::shared_ptr<Table> Table::select(const std::vector<std::string>& columns) const {
    auto result = std::make_shared<Table>();

    for (const auto& col_name : columns) {
        auto col = get_column(col_name);
        result->add_column(col_name, col);
    }

    return result;
}

std::shared_ptr<Table> Table::take(const std::vector<size_t>& rows) const {
    auto result = std::make_shared<Table>();

    for (const auto& col_name : column_order_) {
        result->add_column(col_name, columns_.at(col_name)->take(rows));
    }

    return result;
}

std::shared_ptr<Table> Table::copy() const {
    return std::make_shared<Table>(*this);
}

std::string Table::to_string(size_t max_rows) const {
    std::ostringstream oss;

    oss << "Table(" << num_rows_ << " rows x " << num_columns() << " columns)\n";

    if (column_order_.empty()) {
        oss << "(empty table)\n";
        return oss.str();
    }

    auto rule = [&](const char* left, const char* mid, const char* right) {
        oss << left;
        for (size_t i = 0; i < column_order_.size(); ++i) {
            oss << "────────────────";
            if (i < column_order_.size() - 1) oss << mid;
        }
        oss << right << "\n";
    };

    rule("┌", "┬", "┐");
    oss << "│";
    for (const auto& col_name : column_order_) {
        oss << std::setw(15) << col_name << " │";
    }
    oss << "\n";
    rule("├", "┼", "┤");

    size_t rows_to_print = std::min(num_rows_, max_rows);
    for (size_t row = 0; row < rows_to_print; ++row) {
        oss << "│";
        for (const auto& col_name : column_order_) {
            auto col = columns_.at(col_name);
            oss << std::setw(15) << (col->is_null(row) ? "NULL" : format_value(col->value_at(row)))
                << " │";
        }
        oss << "\n";
    }

    if (num_rows_ > max_rows) {
        oss << "│ ... (" << (num_rows_ - max_rows) << " more rows)\n";
    }

    rule("└", "┴", "┘");

    return oss.str();
}

std::shared_ptr<Table> Table::from_arrow(const std::shared_ptr<arrow::Table>& arrow_table) {
    auto result = std::make_shared<Table>();
    auto num_rows = static_cast<size_t>(arrow_table->num_rows());

    for (int i = 0; i < arrow_table->num_columns(); ++i) {
        const auto& field = arrow_table->field(i);
        const auto& chunks = arrow_table->column(i)->chunks();
        auto concatenated = chunks.empty() ? arrow::MakeEmptyArray(field->type())
                                           : arrow::Concatenate(chunks);
        if (!concatenated.ok()) {
            throw std::runtime_error(concatenated.status().ToString());
        }
        auto array = *concatenated;

        std::shared_ptr<Column> column;
        switch (field->type()->id()) {
            case arrow::Type::INT64: column = Int64Column::from_arrow(array); break;
            case arrow::Type::DOUBLE: column = Float64Column::from_arrow(array); break;
            case arrow::Type::STRING: column = StringColumn::from_arrow(array); break;
            case arrow::Type::BOOL: column = BoolColumn::from_arrow(array); break;
            case arrow::Type::NA: column = null_column(num_rows); break;
            default: {
                // Dates, times and the rest are kept as their text
                auto text = std::make_shared<StringColumn>();
                for (int64_t row = 0; row < array->length(); ++row) {
                    if (array->IsNull(row)) {
                        text->append_null();
                        continue;
                    }
                    auto scalar = array->GetScalar(row);
                    if (!scalar.ok()) {
                        throw std::runtime_error(scalar.status().ToString());
                    }
                    text->append((*scalar)->ToString());
                }
                column = text;
                break;
            }
        }
        result->add_column(field->name(), column);
    }

    return result;
}

std::shared_ptr<arrow::Table> Table::to_arrow() const {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;

    for (const auto& col_name : column_order_) {
        auto array = columns_.at(col_name)->to_arrow();
        fields.push_back(arrow::field(col_name, array->type()));
        arrays.push_back(std::move(array));
    }

    return arrow::Table::Make(arrow::schema(fields), arrays, static_cast<int64_t>(num_rows_));
}

} // namespace columnar
} // namespace pipeforge
