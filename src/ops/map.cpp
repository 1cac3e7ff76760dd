#include "pipeforge_ir/ops/map.hpp"

namespace pipeforge {
namespace ops {

std::shared_ptr<Table> derive(const Table& input, const std::string& output_col,
                              const expr::Expression& expression) {
    // Evaluate before copying so a failure leaves nothing half-built
    auto values = expression.evaluate_all(input);

    auto result = input.copy();
    result->set_column(output_col, columnar::column_from_values(values));
    return result;
}

std::shared_ptr<Table> derive_nulls(const Table& input, const std::string& output_col) {
    auto result = input.copy();
    result->set_column(output_col, columnar::null_column(input.num_rows()));
    return result;
}

} // namespace ops
} // namespace pipeforge
