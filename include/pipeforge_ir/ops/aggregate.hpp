#pragma once

#include "../dag/node.hpp"
#include "../columnar/table.hpp"
#include <memory>
#include <string>
#include <vector>

namespace pipeforge {
namespace ops {

using columnar::Table;

enum class AggregateFunction {
    SUM,
    MEAN,
    MIN,
    MAX,
    COUNT,
    MEDIAN,
    STDDEV,
    VARIANCE,
    NUNIQUE,
    FIRST,
    LAST
};

// "avg" is accepted as an alias of "mean". Throws std::invalid_argument
// for anything else not listed above.
AggregateFunction parse_aggregate_function(const std::string& op);

/**
 * Folds the non-null cells of `rows` in one column. Nulls are skipped
 * by every function; COUNT and NUNIQUE count non-null cells only.
 */
columnar::Value reduce(AggregateFunction function, const columnar::Column& column,
                       const std::vector<size_t>& rows);

/**
 * Aggregate operation - group by + measures
 *
 * Groups come out ordered by their keys ascending, with null keys
 * forming their own group after all others. Without group keys the
 * result is a single row. Group keys with no usable measure give the
 * distinct key rows; neither gives a copy of the input.
 */
std::shared_ptr<Table> aggregate(const Table& input, const dag::AggregateSpec& spec);

} // namespace ops
} // namespace pipeforge
