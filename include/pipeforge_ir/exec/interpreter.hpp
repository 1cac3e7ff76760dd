#pragma once

#include "../columnar/table.hpp"
#include "../dag/graph.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace pipeforge {
namespace exec {

using columnar::Table;

// node id -> "<kind>: <message>", ordered by id
using NodeErrors = std::map<std::string, std::string>;

struct RunResult {
    std::shared_ptr<Table> table;  // never null
    NodeErrors node_errors;
};

/**
 * Ground-truth executor: runs the graph directly on the columnar engine,
 * one materialized table per node, in topological order.
 *
 * A failing node never stops the run. Its error is recorded and it
 * produces:
 *   transform.filter   the unchanged parent table
 *   transform.derive   the parent rows with the new column all null
 *   anything else      an empty table
 *
 * The result is the table of the last node in topological order, or an
 * empty table for an empty graph.
 */
class Interpreter {
public:
    // preview_id restricts the run to that node's ancestors. Throws
    // GraphError for a malformed graph or an unknown preview id.
    RunResult run(const dag::Graph& graph,
                  const std::optional<std::string>& preview_id = std::nullopt) const;
};

} // namespace exec
} // namespace pipeforge
