#include "pipeforge_ir/ops/filter.hpp"
#include <stdexcept>

namespace pipeforge {
namespace ops {

std::shared_ptr<Table> filter_rows(const Table& input, const std::vector<bool>& mask) {
    if (mask.size() != input.num_rows()) {
        throw std::invalid_argument("Filter mask has " + std::to_string(mask.size()) +
                                    " entries for " + std::to_string(input.num_rows()) + " rows");
    }

    // Collect row indices that pass
    std::vector<size_t> passing_rows;
    passing_rows.reserve(mask.size());
    for (size_t row = 0; row < mask.size(); ++row) {
        if (mask[row]) {
            passing_rows.push_back(row);
        }
    }

    return input.take(passing_rows);
}

std::shared_ptr<Table> filter(const Table& input, const expr::Expression& predicate) {
    return filter_rows(input, predicate.evaluate_mask(input));
}

} // namespace ops
} // namespace pipeforge
