#pragma once

#include "graph.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace pipeforge {
namespace dag {

// id -> identifier used as variable / view name in generated programs
using NameTable = std::unordered_map<std::string, std::string>;

// Lowercase, collapse non-alphanumeric runs to "_", trim "_", "node" if empty
std::string sanitize_label(const std::string& label);

/**
 * Assigns collision-free identifiers, visiting ids in the given order.
 * Repeats of a base name become base_2, base_3, ... in first-seen order.
 * Every code generator calls this with the same topological order so
 * cross references agree.
 */
NameTable assign_names(const Graph& graph, const std::vector<std::string>& order);

} // namespace dag
} // namespace pipeforge
