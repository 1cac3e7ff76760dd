#include "pipeforge_ir/ops/sample.hpp"
#include <algorithm>
#include <iterator>
#include <numeric>
#include <random>
#include <stdexcept>

namespace pipeforge {
namespace ops {

std::shared_ptr<Table> sample(const Table& input, const dag::SampleSpec& spec) {
    std::mt19937_64 rng(spec.seed ? *spec.seed : std::random_device{}());

    std::vector<size_t> rows(input.num_rows());
    std::iota(rows.begin(), rows.end(), 0);

    std::vector<size_t> chosen;
    if (spec.mode == dag::SampleSpec::Mode::FRACTION) {
        if (spec.frac < 0.0 || spec.frac > 1.0) {
            throw std::invalid_argument("Sample fraction must be within [0, 1], got " +
                                        std::to_string(spec.frac));
        }
        std::bernoulli_distribution keep(spec.frac);
        for (size_t row : rows) {
            if (keep(rng)) chosen.push_back(row);
        }
    } else {
        if (spec.n < 0) {
            throw std::invalid_argument("Sample size must be non-negative, got " + std::to_string(spec.n));
        }
        size_t count = std::min(static_cast<size_t>(spec.n), rows.size());
        std::sample(rows.begin(), rows.end(), std::back_inserter(chosen), count, rng);
    }

    return input.take(chosen);
}

} // namespace ops
} // namespace pipeforge
