#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace pipeforge {
namespace columnar {

enum class DataType {
    INT64,
    FLOAT64,
    STRING,
    BOOL
};

/**
 * A single cell. std::monostate is the null/missing marker.
 */
using Value = std::variant<std::monostate, int64_t, double, bool, std::string>;

inline bool is_null(const Value& v) { return std::holds_alternative<std::monostate>(v); }
inline bool is_numeric(const Value& v) {
    return std::holds_alternative<int64_t>(v) || std::holds_alternative<double>(v);
}

// Numeric view of an int64/double/bool value; throws std::invalid_argument otherwise
double as_double(const Value& v);

// Canonical text form: nulls empty, floats in shortest round-trip form,
// booleans True/False. Strings are returned unquoted.
std::string format_value(const Value& v);

// Three-way ordering used by sort and group-by. Numbers compare numerically,
// strings lexicographically; mixed kinds order by kind. Callers handle nulls.
int compare_values(const Value& a, const Value& b);

std::string type_name(DataType type);

} // namespace columnar
} // namespace pipeforge
