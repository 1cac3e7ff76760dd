#pragma once

#include "../columnar/table.hpp"
#include "../expr/evaluator.hpp"
#include <memory>
#include <string>

namespace pipeforge {
namespace ops {

using columnar::Table;

/**
 * Derive - copies the input and adds one computed column. Assigning an
 * existing name replaces that column in place.
 */
std::shared_ptr<Table> derive(const Table& input, const std::string& output_col,
                              const expr::Expression& expression);

// Copy of the input with output_col set to all nulls
std::shared_ptr<Table> derive_nulls(const Table& input, const std::string& output_col);

} // namespace ops
} // namespace pipeforge
