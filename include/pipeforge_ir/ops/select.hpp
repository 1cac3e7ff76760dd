#pragma once

#include "../dag/node.hpp"
#include "../columnar/table.hpp"
#include <memory>
#include <string>

namespace pipeforge {
namespace ops {

using columnar::Table;

/**
 * Projection - wildcard copies the input, otherwise exactly the listed
 * columns in listed order. Schema casts run afterwards; casts naming a
 * column the result does not have are skipped.
 *
 * Throws std::invalid_argument for a missing column.
 */
std::shared_ptr<Table> select(const Table& input, const dag::SelectSpec& spec);

/**
 * Cast one column to integer | float | boolean | string (anything else
 * means string). Values that do not convert become null.
 */
std::shared_ptr<columnar::Column> cast_column(const columnar::Column& column, const std::string& dtype);

} // namespace ops
} // namespace pipeforge
