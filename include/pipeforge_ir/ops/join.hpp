#pragma once

#include "../dag/node.hpp"
#include "../columnar/table.hpp"
#include <memory>

namespace pipeforge {
namespace ops {

using columnar::Table;

/**
 * Equi-join on JoinSpec::key_pairs() (right keys wrap to their first
 * element when the list is shorter).
 *
 * Output columns: left columns, then right columns. A right key with the
 * same name as its paired left key is merged into the left key column;
 * any other name present on both sides gets "_x" (left) / "_y" (right).
 *
 * Row order: inner and left follow the left input, each left row
 * followed by its matches in right order; right follows the right input;
 * outer is the left-join order followed by the unmatched right rows.
 * Keys containing a null never match.
 *
 * Throws std::invalid_argument for an unknown join type or key column.
 */
std::shared_ptr<Table> join(const Table& left, const Table& right, const dag::JoinSpec& spec);

} // namespace ops
} // namespace pipeforge
