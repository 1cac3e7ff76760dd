#pragma once

#include "../columnar/table.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace pipeforge {
namespace expr {

using columnar::Table;
using columnar::Value;

/**
 * Parse or evaluation failure of a filter / derive expression
 */
class EvalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Parsed row expression in the dataframe-query dialect the interpreter
 * speaks:
 *
 *   literals     12  1.5  'text'  "text"  True  False  None
 *   columns      age  `first name`
 *   arithmetic   + - * / // % **  (unary - +)
 *   comparison   == = != <> < <= > >=   (chainable: 1 < x < 5)
 *   membership   x in [1, 2]   x not in ('a', 'b')
 *   null tests   x is null   x is not null
 *   logic        and or not  & | ~  (keywords in any case)
 *
 * & and | bind like and/or, as in pandas.query.
 */
class ExprNode {
public:
    virtual ~ExprNode() = default;
    virtual Value evaluate(const Table& table, size_t row) const = 0;
};

class Expression {
public:
    // Throws EvalError on a syntax error
    static Expression parse(const std::string& text);

    Value evaluate(const Table& table, size_t row) const { return root_->evaluate(table, row); }

    // One value per row of the table
    std::vector<Value> evaluate_all(const Table& table) const;

    // Row mask; null counts as false, non-boolean results throw EvalError
    std::vector<bool> evaluate_mask(const Table& table) const;

private:
    explicit Expression(std::shared_ptr<const ExprNode> root) : root_(std::move(root)) {}

    std::shared_ptr<const ExprNode> root_;
};

} // namespace expr
} // namespace pipeforge
