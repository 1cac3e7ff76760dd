#include "pipeforge_ir/ops/select.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace pipeforge {
namespace ops {

using columnar::Column;
using columnar::Value;

namespace {

bool parse_number(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end != text.c_str() && *end == '\0';
}

// Truncates toward zero; false when the result does not fit in int64
bool truncate_to_int64(double d, int64_t& out) {
    if (!std::isfinite(d)) return false;
    double t = std::trunc(d);
    if (t < -9223372036854775808.0 || t >= 9223372036854775808.0) return false;
    out = static_cast<int64_t>(t);
    return true;
}

std::shared_ptr<Column> to_integer(const Column& column) {
    auto out = std::make_shared<columnar::Int64Column>();
    for (size_t i = 0; i < column.size(); ++i) {
        Value v = column.value_at(i);
        double d;
        int64_t n;
        if (auto i = std::get_if<int64_t>(&v)) {
            out->append(*i);
        } else if (auto b = std::get_if<bool>(&v)) {
            out->append(*b ? 1 : 0);
        } else if (std::holds_alternative<double>(v) && truncate_to_int64(std::get<double>(v), n)) {
            out->append(n);
        } else if (std::holds_alternative<std::string>(v) &&
                   parse_number(std::get<std::string>(v), d) && truncate_to_int64(d, n)) {
            out->append(n);
        } else {
            out->append_null();
        }
    }
    return out;
}

std::shared_ptr<Column> to_float(const Column& column) {
    auto out = std::make_shared<columnar::Float64Column>();
    for (size_t i = 0; i < column.size(); ++i) {
        Value v = column.value_at(i);
        double d;
        if (columnar::is_numeric(v) || std::holds_alternative<bool>(v)) {
            out->append(columnar::as_double(v));
        } else if (std::holds_alternative<std::string>(v) && parse_number(std::get<std::string>(v), d)) {
            out->append(d);
        } else {
            out->append_null();
        }
    }
    return out;
}

std::shared_ptr<Column> to_boolean(const Column& column) {
    auto out = std::make_shared<columnar::BoolColumn>();
    for (size_t i = 0; i < column.size(); ++i) {
        Value v = column.value_at(i);
        if (auto b = std::get_if<bool>(&v)) {
            out->append(*b);
        } else if (columnar::is_numeric(v)) {
            out->append(columnar::as_double(v) != 0.0);
        } else if (auto s = std::get_if<std::string>(&v)) {
            std::string lower = *s;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (lower == "true" || lower == "1") out->append(true);
            else if (lower == "false" || lower == "0") out->append(false);
            else out->append_null();
        } else {
            out->append_null();
        }
    }
    return out;
}

std::shared_ptr<Column> to_string_column(const Column& column) {
    auto out = std::make_shared<columnar::StringColumn>();
    for (size_t i = 0; i < column.size(); ++i) {
        if (column.is_null(i)) {
            out->append_null();
        } else {
            out->append(columnar::format_value(column.value_at(i)));
        }
    }
    return out;
}

} // namespace

std::shared_ptr<Column> cast_column(const Column& column, const std::string& dtype) {
    if (dtype == "integer") return to_integer(column);
    if (dtype == "float") return to_float(column);
    if (dtype == "boolean") return to_boolean(column);
    return to_string_column(column);
}

std::shared_ptr<Table> select(const Table& input, const dag::SelectSpec& spec) {
    auto result = spec.is_wildcard() ? input.copy() : input.select(spec.columns);

    for (const auto& cast : spec.schema) {
        if (!result->has_column(cast.name)) continue;
        result->set_column(cast.name, cast_column(*result->get_column(cast.name), cast.dtype));
    }
    return result;
}

} // namespace ops
} // namespace pipeforge
