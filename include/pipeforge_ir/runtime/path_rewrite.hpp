#pragma once

#include "../codegen/lowerer.hpp"
#include "staging.hpp"
#include <string>

namespace pipeforge {
namespace runtime {

/**
 * Points reader calls at staged files. Only calls whose path literal is
 * exactly an original name in the mapping are rewritten:
 *
 *   pandas   pd.read_csv("name") / pd.read_csv(r'name')
 *   SQL      read_csv_auto('name'[, header=true])   (any case)
 *   Spark    spark.read[.option(...)...].csv("name")
 *
 * Everything else in the text is left alone.
 */
std::string rewrite_paths(codegen::Backend backend, const std::string& text, const PathMapping& mapping);

} // namespace runtime
} // namespace pipeforge
