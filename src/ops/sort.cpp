#include "pipeforge_ir/ops/sort.hpp"
#include <algorithm>
#include <numeric>

namespace pipeforge {
namespace ops {

std::shared_ptr<Table> sort(const Table& input, const dag::SortSpec& spec) {
    if (spec.keys.empty()) {
        return input.copy();
    }

    std::vector<std::pair<std::shared_ptr<columnar::Column>, bool>> keys;
    for (const auto& key : spec.keys) {
        keys.emplace_back(input.get_column(key.column), key.descending);
    }

    std::vector<size_t> rows(input.num_rows());
    std::iota(rows.begin(), rows.end(), 0);

    std::stable_sort(rows.begin(), rows.end(), [&keys](size_t a, size_t b) {
        for (const auto& key : keys) {
            const auto& col = *key.first;
            bool a_null = col.is_null(a);
            bool b_null = col.is_null(b);
            if (a_null || b_null) {
                if (a_null == b_null) continue;
                return b_null;
            }
            int c = columnar::compare_values(col.value_at(a), col.value_at(b));
            if (c != 0) {
                return key.second ? c > 0 : c < 0;
            }
        }
        return false;
    });

    return input.take(rows);
}

} // namespace ops
} // namespace pipeforge
