#pragma once

#include "value.hpp"
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <arrow/array.h>
#include <arrow/type.h>

namespace pipeforge {
namespace columnar {

// Row index that take() turns into a null cell (outer-join padding)
constexpr size_t kNullRow = std::numeric_limits<size_t>::max();

/**
 * Type-erased columnar storage
 * Stores data in contiguous memory for cache-friendly access
 */
class Column {
public:
    virtual ~Column() = default;

    virtual DataType type() const = 0;
    virtual size_t size() const = 0;
    virtual bool is_null(size_t index) const = 0;

    // Boxed access, used by the expression evaluator and the kernels
    virtual Value value_at(size_t index) const = 0;

    // Gather rows in the given order; kNullRow yields a null cell
    virtual std::shared_ptr<Column> take(const std::vector<size_t>& indices) const = 0;

    virtual std::shared_ptr<arrow::Array> to_arrow() const = 0;
};

/**
 * Typed column implementation
 */
template<typename T>
class TypedColumn : public Column {
public:
    TypedColumn() = default;
    explicit TypedColumn(std::vector<T> data, std::vector<bool> null_bitmap = {});

    DataType type() const override;
    size_t size() const override { return data_.size(); }
    bool is_null(size_t index) const override;
    Value value_at(size_t index) const override;

    T at(size_t index) const { return data_[index]; }

    const std::vector<T>& data() const { return data_; }

    void append(const T& value, bool is_null = false);
    void append_null();

    std::shared_ptr<Column> take(const std::vector<size_t>& indices) const override;

    std::shared_ptr<arrow::Array> to_arrow() const override;
    static std::shared_ptr<TypedColumn<T>> from_arrow(const std::shared_ptr<arrow::Array>& array);

private:
    std::vector<T> data_;
    std::vector<bool> null_bitmap_;  // true = null
};

using Int64Column = TypedColumn<int64_t>;
using Float64Column = TypedColumn<double>;
using StringColumn = TypedColumn<std::string>;
using BoolColumn = TypedColumn<bool>;

/**
 * Builds a column from boxed values, inferring the narrowest type:
 * all int -> INT64, ints and floats -> FLOAT64, all bool -> BOOL,
 * anything else -> STRING. An all-null input becomes FLOAT64.
 */
std::shared_ptr<Column> column_from_values(const std::vector<Value>& values);

// Column of `length` nulls
std::shared_ptr<Column> null_column(size_t length);

} // namespace columnar
} // namespace pipeforge
