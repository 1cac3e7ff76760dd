#pragma once

#include "../dag/node.hpp"
#include "../columnar/table.hpp"
#include <memory>

namespace pipeforge {
namespace ops {

using columnar::Table;

// Stable multi-key sort; nulls go last whatever the direction
std::shared_ptr<Table> sort(const Table& input, const dag::SortSpec& spec);

} // namespace ops
} // namespace pipeforge
