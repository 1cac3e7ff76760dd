#include "pipeforge_ir/ops/join.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>
#include <unordered_set>

namespace pipeforge {
namespace ops {

using columnar::Column;
using columnar::kNullRow;
using columnar::Value;

namespace {

enum class JoinType { INNER, LEFT, RIGHT, OUTER };

JoinType parse_join_type(const std::string& how) {
    if (how == "inner") return JoinType::INNER;
    if (how == "left") return JoinType::LEFT;
    if (how == "right") return JoinType::RIGHT;
    if (how == "outer") return JoinType::OUTER;
    throw std::invalid_argument("Unknown join type '" + how + "'");
}

struct TupleLess {
    bool operator()(const std::vector<Value>& a, const std::vector<Value>& b) const {
        for (size_t i = 0; i < a.size(); ++i) {
            int c = columnar::compare_values(a[i], b[i]);
            if (c != 0) return c < 0;
        }
        return false;
    }
};

using KeyIndex = std::map<std::vector<Value>, std::vector<size_t>, TupleLess>;

// Key tuple of one row; false when any part is null
bool row_key(const std::vector<std::shared_ptr<Column>>& columns, size_t row, std::vector<Value>& key) {
    key.clear();
    for (const auto& col : columns) {
        if (col->is_null(row)) return false;
        key.push_back(col->value_at(row));
    }
    return true;
}

KeyIndex build_index(const std::vector<std::shared_ptr<Column>>& columns, size_t num_rows) {
    KeyIndex index;
    std::vector<Value> key;
    for (size_t row = 0; row < num_rows; ++row) {
        if (row_key(columns, row, key)) {
            index[key].push_back(row);
        }
    }
    return index;
}

} // namespace

std::shared_ptr<Table> join(const Table& left, const Table& right, const dag::JoinSpec& spec) {
    JoinType type = parse_join_type(spec.how);
    auto pairs = spec.key_pairs();

    std::vector<std::shared_ptr<Column>> left_keys, right_keys;
    std::unordered_set<std::string> merged;  // key names shared by both sides
    for (const auto& pair : pairs) {
        left_keys.push_back(left.get_column(pair.first));
        right_keys.push_back(right.get_column(pair.second));
        if (pair.first == pair.second) {
            merged.insert(pair.first);
        }
    }

    // Row pairing
    std::vector<size_t> left_rows, right_rows;
    std::vector<Value> key;

    if (type == JoinType::RIGHT) {
        KeyIndex index = build_index(left_keys, left.num_rows());
        for (size_t r = 0; r < right.num_rows(); ++r) {
            auto it = row_key(right_keys, r, key) ? index.find(key) : index.end();
            if (it == index.end()) {
                left_rows.push_back(kNullRow);
                right_rows.push_back(r);
                continue;
            }
            for (size_t l : it->second) {
                left_rows.push_back(l);
                right_rows.push_back(r);
            }
        }
    } else {
        KeyIndex index = build_index(right_keys, right.num_rows());
        std::vector<bool> right_matched(right.num_rows(), false);
        for (size_t l = 0; l < left.num_rows(); ++l) {
            auto it = row_key(left_keys, l, key) ? index.find(key) : index.end();
            if (it == index.end()) {
                if (type != JoinType::INNER) {
                    left_rows.push_back(l);
                    right_rows.push_back(kNullRow);
                }
                continue;
            }
            for (size_t r : it->second) {
                left_rows.push_back(l);
                right_rows.push_back(r);
                right_matched[r] = true;
            }
        }
        if (type == JoinType::OUTER) {
            for (size_t r = 0; r < right.num_rows(); ++r) {
                if (!right_matched[r]) {
                    left_rows.push_back(kNullRow);
                    right_rows.push_back(r);
                }
            }
        }
    }

    // Output columns
    auto left_names = left.column_names();
    auto right_names = right.column_names();
    std::unordered_set<std::string> left_set(left_names.begin(), left_names.end());
    std::unordered_set<std::string> right_set(right_names.begin(), right_names.end());

    bool padded = std::find(left_rows.begin(), left_rows.end(), kNullRow) != left_rows.end();
    auto result = std::make_shared<Table>();

    for (const auto& name : left_names) {
        auto column = left.get_column(name);
        if (merged.count(name) && padded) {
            // Unmatched right rows carry the key value from the right side
            auto right_column = right.get_column(name);
            std::vector<Value> values;
            values.reserve(left_rows.size());
            for (size_t i = 0; i < left_rows.size(); ++i) {
                values.push_back(left_rows[i] != kNullRow ? column->value_at(left_rows[i])
                                                          : right_column->value_at(right_rows[i]));
            }
            result->add_column(name, columnar::column_from_values(values));
            continue;
        }
        std::string out_name = (right_set.count(name) && !merged.count(name)) ? name + "_x" : name;
        result->add_column(out_name, column->take(left_rows));
    }

    for (const auto& name : right_names) {
        if (merged.count(name)) continue;
        std::string out_name = left_set.count(name) ? name + "_y" : name;
        result->add_column(out_name, right.get_column(name)->take(right_rows));
    }

    return result;
}

} // namespace ops
} // namespace pipeforge
