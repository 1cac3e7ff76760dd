#include "pipeforge_ir/columnar/column.hpp"
#include <fmt/format.h>
#include <cmath>
#include <stdexcept>
#include <type_traits>

#include <arrow/builder.h>

namespace pipeforge {
namespace columnar {

// Value helpers

double as_double(const Value& v) {
    if (auto i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
    if (auto d = std::get_if<double>(&v)) return *d;
    if (auto b = std::get_if<bool>(&v)) return *b ? 1.0 : 0.0;
    throw std::invalid_argument("Value is not numeric");
}

std::string format_value(const Value& v) {
    if (auto i = std::get_if<int64_t>(&v)) return std::to_string(*i);
    if (auto d = std::get_if<double>(&v)) {
        if (std::isnan(*d)) return "";
        if (std::isinf(*d)) return *d > 0 ? "inf" : "-inf";
        return fmt::format("{}", *d);
    }
    if (auto b = std::get_if<bool>(&v)) return *b ? "True" : "False";
    if (auto s = std::get_if<std::string>(&v)) return *s;
    return "";
}

int compare_values(const Value& a, const Value& b) {
    if (is_numeric(a) && is_numeric(b)) {
        if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
            int64_t x = std::get<int64_t>(a), y = std::get<int64_t>(b);
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        double x = as_double(a), y = as_double(b);
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.index() != b.index()) {
        return a.index() < b.index() ? -1 : 1;
    }
    if (auto s = std::get_if<std::string>(&a)) {
        int c = s->compare(std::get<std::string>(b));
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (auto x = std::get_if<bool>(&a)) {
        bool y = std::get<bool>(b);
        return *x == y ? 0 : (*x ? 1 : -1);
    }
    return 0;
}

std::string type_name(DataType type) {
    switch (type) {
        case DataType::INT64: return "int64";
        case DataType::FLOAT64: return "float64";
        case DataType::STRING: return "string";
        case DataType::BOOL: return "bool";
    }
    return "unknown";
}

// TypedColumn implementation

template<typename T>
TypedColumn<T>::TypedColumn(std::vector<T> data, std::vector<bool> null_bitmap)
    : data_(std::move(data))
    , null_bitmap_(std::move(null_bitmap)) {
    if (!null_bitmap_.empty() && null_bitmap_.size() != data_.size()) {
        throw std::invalid_argument("Null bitmap size must match data size");
    }
}

template<typename T>
DataType TypedColumn<T>::type() const {
    if constexpr (std::is_same_v<T, int64_t>) return DataType::INT64;
    else if constexpr (std::is_same_v<T, double>) return DataType::FLOAT64;
    else if constexpr (std::is_same_v<T, std::string>) return DataType::STRING;
    else if constexpr (std::is_same_v<T, bool>) return DataType::BOOL;
    else throw std::runtime_error("Unsupported column type");
}

template<typename T>
bool TypedColumn<T>::is_null(size_t index) const {
    if (index >= data_.size()) {
        throw std::out_of_range("Column index out of range");
    }
    return !null_bitmap_.empty() && null_bitmap_[index];
}

template<typename T>
Value TypedColumn<T>::value_at(size_t index) const {
    if (is_null(index)) {
        return Value{};
    }
    return Value{std::in_place_type<T>, data_[index]};
}

template<typename T>
void TypedColumn<T>::append(const T& value, bool is_null) {
    data_.push_back(value);
    if (!null_bitmap_.empty() || is_null) {
        if (null_bitmap_.empty()) {
            null_bitmap_.resize(data_.size() - 1, false);
        }
        null_bitmap_.push_back(is_null);
    }
}

template<typename T>
void TypedColumn<T>::append_null() {
    append(T{}, true);
}

template<typename T>
std::shared_ptr<Column> TypedColumn<T>::take(const std::vector<size_t>& indices) const {
    auto result = std::make_shared<TypedColumn<T>>();
    for (size_t idx : indices) {
        if (idx == kNullRow) {
            result->append_null();
        } else {
            result->append(data_.at(idx), is_null(idx));
        }
    }
    return result;
}

template<typename T>
std::shared_ptr<arrow::Array> TypedColumn<T>::to_arrow() const {
    std::shared_ptr<arrow::Array> out;
    auto build = [&](auto& builder) {
        for (size_t i = 0; i < data_.size(); ++i) {
            auto st = is_null(i) ? builder.AppendNull() : builder.Append(data_[i]);
            if (!st.ok()) throw std::runtime_error(st.ToString());
        }
        auto st = builder.Finish(&out);
        if (!st.ok()) throw std::runtime_error(st.ToString());
    };

    if constexpr (std::is_same_v<T, int64_t>) {
        arrow::Int64Builder builder;
        build(builder);
    } else if constexpr (std::is_same_v<T, double>) {
        arrow::DoubleBuilder builder;
        build(builder);
    } else if constexpr (std::is_same_v<T, std::string>) {
        arrow::StringBuilder builder;
        build(builder);
    } else {
        arrow::BooleanBuilder builder;
        build(builder);
    }
    return out;
}

template<typename T>
std::shared_ptr<TypedColumn<T>> TypedColumn<T>::from_arrow(const std::shared_ptr<arrow::Array>& array) {
    auto result = std::make_shared<TypedColumn<T>>();
    using ArrayType = std::conditional_t<std::is_same_v<T, int64_t>, arrow::Int64Array,
                      std::conditional_t<std::is_same_v<T, double>, arrow::DoubleArray,
                      std::conditional_t<std::is_same_v<T, std::string>, arrow::StringArray,
                                         arrow::BooleanArray>>>;
    auto typed = std::dynamic_pointer_cast<ArrayType>(array);
    if (!typed) {
        throw std::invalid_argument("Arrow array type does not match column type");
    }
    for (int64_t i = 0; i < typed->length(); ++i) {
        if (typed->IsNull(i)) {
            result->append_null();
        } else if constexpr (std::is_same_v<T, std::string>) {
            result->append(typed->GetString(i));
        } else {
            result->append(typed->Value(i));
        }
    }
    return result;
}

// Explicit template instantiations
template class TypedColumn<int64_t>;
template class TypedColumn<double>;
template class TypedColumn<std::string>;
template class TypedColumn<bool>;

// Builders

std::shared_ptr<Column> column_from_values(const std::vector<Value>& values) {
    bool any_int = false, any_float = false, any_bool = false, any_string = false;
    for (const auto& v : values) {
        if (std::holds_alternative<int64_t>(v)) any_int = true;
        else if (std::holds_alternative<double>(v)) any_float = true;
        else if (std::holds_alternative<bool>(v)) any_bool = true;
        else if (std::holds_alternative<std::string>(v)) any_string = true;
    }

    if (any_string || (any_bool && (any_int || any_float))) {
        auto col = std::make_shared<StringColumn>();
        for (const auto& v : values) {
            if (is_null(v)) col->append_null();
            else col->append(format_value(v));
        }
        return col;
    }
    if (any_bool) {
        auto col = std::make_shared<BoolColumn>();
        for (const auto& v : values) {
            if (is_null(v)) col->append_null();
            else col->append(std::get<bool>(v));
        }
        return col;
    }
    if (any_int && !any_float) {
        auto col = std::make_shared<Int64Column>();
        for (const auto& v : values) {
            if (is_null(v)) col->append_null();
            else col->append(std::get<int64_t>(v));
        }
        return col;
    }

    auto col = std::make_shared<Float64Column>();
    for (const auto& v : values) {
        if (is_null(v)) col->append_null();
        else col->append(as_double(v));
    }
    return col;
}

std::shared_ptr<Column> null_column(size_t length) {
    auto col = std::make_shared<Float64Column>();
    for (size_t i = 0; i < length; ++i) {
        col->append_null();
    }
    return col;
}

} // namespace columnar
} // namespace pipeforge
