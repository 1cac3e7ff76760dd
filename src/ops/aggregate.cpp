#include "pipeforge_ir/ops/aggregate.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <stdexcept>

namespace pipeforge {
namespace ops {

using columnar::Column;
using columnar::DataType;
using columnar::Value;

AggregateFunction parse_aggregate_function(const std::string& op) {
    if (op == "sum") return AggregateFunction::SUM;
    if (op == "mean" || op == "avg") return AggregateFunction::MEAN;
    if (op == "min") return AggregateFunction::MIN;
    if (op == "max") return AggregateFunction::MAX;
    if (op == "count") return AggregateFunction::COUNT;
    if (op == "median") return AggregateFunction::MEDIAN;
    if (op == "std") return AggregateFunction::STDDEV;
    if (op == "var") return AggregateFunction::VARIANCE;
    if (op == "nunique") return AggregateFunction::NUNIQUE;
    if (op == "first") return AggregateFunction::FIRST;
    if (op == "last") return AggregateFunction::LAST;
    throw std::invalid_argument("Unknown aggregation function '" + op + "'");
}

namespace {

// Lexicographic over key tuples; a null sorts after every value
struct KeyLess {
    bool operator()(const std::vector<Value>& a, const std::vector<Value>& b) const {
        for (size_t i = 0; i < a.size(); ++i) {
            bool a_null = columnar::is_null(a[i]);
            bool b_null = columnar::is_null(b[i]);
            if (a_null || b_null) {
                if (a_null == b_null) continue;
                return b_null;
            }
            int c = columnar::compare_values(a[i], b[i]);
            if (c != 0) return c < 0;
        }
        return false;
    }
};

bool numeric_column(const Column& column) {
    return column.type() != DataType::STRING;
}

std::vector<double> numeric_values(const Column& column, const std::vector<size_t>& rows,
                                   const char* function) {
    if (!numeric_column(column)) {
        throw std::invalid_argument(std::string("Cannot compute ") + function +
                                    " of a non-numeric column");
    }
    std::vector<double> values;
    values.reserve(rows.size());
    for (size_t row : rows) {
        if (!column.is_null(row)) {
            values.push_back(columnar::as_double(column.value_at(row)));
        }
    }
    return values;
}

Value sum(const Column& column, const std::vector<size_t>& rows) {
    switch (column.type()) {
        case DataType::INT64:
        case DataType::BOOL: {
            // Exact, wrapping on overflow like numpy's int64 sum
            uint64_t total = 0;
            for (size_t row : rows) {
                if (column.is_null(row)) continue;
                Value v = column.value_at(row);
                if (auto b = std::get_if<bool>(&v)) total += *b ? 1 : 0;
                else total += static_cast<uint64_t>(std::get<int64_t>(v));
            }
            return Value{std::in_place_type<int64_t>, static_cast<int64_t>(total)};
        }
        case DataType::FLOAT64: {
            double total = 0.0;
            for (size_t row : rows) {
                if (!column.is_null(row)) total += columnar::as_double(column.value_at(row));
            }
            return Value{total};
        }
        case DataType::STRING: {
            std::string total;
            for (size_t row : rows) {
                if (!column.is_null(row)) total += std::get<std::string>(column.value_at(row));
            }
            return Value{total};
        }
    }
    return Value{};
}

double mean_of(const std::vector<double>& values) {
    double total = 0.0;
    for (double v : values) total += v;
    return total / static_cast<double>(values.size());
}

// Sample variance (ddof = 1)
Value variance(const std::vector<double>& values) {
    if (values.size() < 2) return Value{};
    double mean = mean_of(values);
    double acc = 0.0;
    for (double v : values) acc += (v - mean) * (v - mean);
    return Value{acc / static_cast<double>(values.size() - 1)};
}

Value extreme(const Column& column, const std::vector<size_t>& rows, bool want_max) {
    Value best;
    for (size_t row : rows) {
        if (column.is_null(row)) continue;
        Value v = column.value_at(row);
        if (columnar::is_null(best)) {
            best = v;
            continue;
        }
        int c = columnar::compare_values(v, best);
        if (want_max ? c > 0 : c < 0) best = v;
    }
    return best;
}

} // namespace

Value reduce(AggregateFunction function, const Column& column, const std::vector<size_t>& rows) {
    switch (function) {
        case AggregateFunction::SUM:
            return sum(column, rows);

        case AggregateFunction::MEAN: {
            auto values = numeric_values(column, rows, "mean");
            if (values.empty()) return Value{};
            return Value{mean_of(values)};
        }

        case AggregateFunction::MIN:
            return extreme(column, rows, false);

        case AggregateFunction::MAX:
            return extreme(column, rows, true);

        case AggregateFunction::COUNT: {
            int64_t count = 0;
            for (size_t row : rows) {
                if (!column.is_null(row)) count++;
            }
            return Value{std::in_place_type<int64_t>, count};
        }

        case AggregateFunction::MEDIAN: {
            auto values = numeric_values(column, rows, "median");
            if (values.empty()) return Value{};
            std::sort(values.begin(), values.end());
            size_t mid = values.size() / 2;
            double median = values.size() % 2 ? values[mid] : (values[mid - 1] + values[mid]) / 2.0;
            return Value{median};
        }

        case AggregateFunction::STDDEV: {
            Value var = variance(numeric_values(column, rows, "std"));
            if (columnar::is_null(var)) return var;
            return Value{std::sqrt(std::get<double>(var))};
        }

        case AggregateFunction::VARIANCE:
            return variance(numeric_values(column, rows, "var"));

        case AggregateFunction::NUNIQUE: {
            std::set<std::string> seen;
            for (size_t row : rows) {
                if (!column.is_null(row)) seen.insert(columnar::format_value(column.value_at(row)));
            }
            return Value{std::in_place_type<int64_t>, static_cast<int64_t>(seen.size())};
        }

        case AggregateFunction::FIRST:
            for (size_t row : rows) {
                if (!column.is_null(row)) return column.value_at(row);
            }
            return Value{};

        case AggregateFunction::LAST:
            for (auto it = rows.rbegin(); it != rows.rend(); ++it) {
                if (!column.is_null(*it)) return column.value_at(*it);
            }
            return Value{};
    }
    return Value{};
}

std::shared_ptr<Table> aggregate(const Table& input, const dag::AggregateSpec& spec) {
    auto measures = spec.usable_measures();
    if (spec.group_by.empty() && measures.empty()) {
        return input.copy();
    }

    // Resolve everything up front so a bad column or operator fails early
    std::vector<std::shared_ptr<Column>> key_columns;
    for (const auto& key : spec.group_by) {
        key_columns.push_back(input.get_column(key));
    }
    std::vector<std::pair<std::shared_ptr<Column>, AggregateFunction>> plan;
    for (const auto& m : measures) {
        plan.emplace_back(input.get_column(m.col), parse_aggregate_function(m.op));
    }

    auto result = std::make_shared<Table>();

    if (spec.group_by.empty()) {
        std::vector<size_t> all_rows(input.num_rows());
        for (size_t i = 0; i < all_rows.size(); ++i) all_rows[i] = i;

        for (size_t i = 0; i < measures.size(); ++i) {
            Value v = reduce(plan[i].second, *plan[i].first, all_rows);
            result->add_column(measures[i].output_name(), columnar::column_from_values({v}));
        }
        return result;
    }

    // Groups in key order
    std::map<std::vector<Value>, std::vector<size_t>, KeyLess> groups;
    for (size_t row = 0; row < input.num_rows(); ++row) {
        std::vector<Value> key;
        key.reserve(key_columns.size());
        for (const auto& col : key_columns) {
            key.push_back(col->value_at(row));
        }
        groups[std::move(key)].push_back(row);
    }

    // Key columns keep their input type: gather each group's first row
    std::vector<size_t> first_rows;
    first_rows.reserve(groups.size());
    for (const auto& group : groups) {
        first_rows.push_back(group.second.front());
    }
    for (size_t k = 0; k < key_columns.size(); ++k) {
        result->add_column(spec.group_by[k], key_columns[k]->take(first_rows));
    }

    for (size_t i = 0; i < measures.size(); ++i) {
        std::vector<Value> values;
        values.reserve(groups.size());
        for (const auto& group : groups) {
            values.push_back(reduce(plan[i].second, *plan[i].first, group.second));
        }
        result->add_column(measures[i].output_name(), columnar::column_from_values(values));
    }

    return result;
}

} // namespace ops
} // namespace pipeforge
