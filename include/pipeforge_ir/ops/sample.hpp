#pragma once

#include "../dag/node.hpp"
#include "../columnar/table.hpp"
#include <memory>

namespace pipeforge {
namespace ops {

using columnar::Table;

/**
 * Random sample, keeping the chosen rows in input order.
 *
 *   ROWS      exactly min(n, rows) rows, chosen uniformly
 *   FRACTION  each row kept independently with probability frac
 *
 * A seed makes the choice reproducible. Throws std::invalid_argument
 * for a negative n or a fraction outside [0, 1].
 */
std::shared_ptr<Table> sample(const Table& input, const dag::SampleSpec& spec);

} // namespace ops
} // namespace pipeforge
