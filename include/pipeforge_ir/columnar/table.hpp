#pragma once

#include "column.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <arrow/table.h>

namespace pipeforge {
namespace columnar {

/**
 * Columnar table representation
 * Column order is significant: it is part of a result's signature.
 */
class Table {
public:
    Table() = default;

    // Construction
    void add_column(const std::string& name, std::shared_ptr<Column> column);
    // Replaces an existing column in place, or appends a new one
    void set_column(const std::string& name, std::shared_ptr<Column> column);

    // Access
    std::shared_ptr<Column> get_column(const std::string& name) const;
    bool has_column(const std::string& name) const;
    std::vector<std::string> column_names() const;

    size_t num_rows() const;
    size_t num_columns() const;

    // Operations
    std::shared_ptr<Table> select(const std::vector<std::string>& columns) const;
    std::shared_ptr<Table> take(const std::vector<size_t>& rows) const;
    std::shared_ptr<Table> copy() const;

    // Arrow interop
    static std::shared_ptr<Table> from_arrow(const std::shared_ptr<arrow::Table>& arrow_table);
    std::shared_ptr<arrow::Table> to_arrow() const;

    // Debugging
    std::string to_string(size_t max_rows = 10) const;

private:
    std::unordered_map<std::string, std::shared_ptr<Column>> columns_;
    std::vector<std::string> column_order_;
    size_t num_rows_ = 0;
};

} // namespace columnar
} // namespace pipeforge
