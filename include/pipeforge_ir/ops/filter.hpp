#pragma once

#include "../columnar/table.hpp"
#include "../expr/evaluator.hpp"
#include <memory>
#include <vector>

namespace pipeforge {
namespace ops {

using columnar::Table;

/**
 * Row filter - keeps the rows whose predicate is true, in input order.
 * An empty predicate text is the identity.
 */
std::shared_ptr<Table> filter(const Table& input, const expr::Expression& predicate);

// Keeps rows where mask[i] is set; mask must have one entry per row
std::shared_ptr<Table> filter_rows(const Table& input, const std::vector<bool>& mask);

} // namespace ops
} // namespace pipeforge
