#include "pipeforge_ir/expr/evaluator.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace pipeforge {
namespace expr {

using columnar::is_null;

namespace {

// ---------------------------------------------------------------------------
// Tokenizer
// ---------------------------------------------------------------------------

enum class Tok { NUMBER, STRING, IDENT, QUOTED_IDENT, OP, LPAREN, RPAREN, LBRACKET, RBRACKET, COMMA, END };

struct Token {
    Tok type;
    std::string text;
    size_t pos;
};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<Token> tokenize(const std::string& src) {
    static const char* kOps[] = {
        "**", "//", "==", "!=", "<>", "<=", ">=", "&&", "||",
        "<", ">", "=", "+", "-", "*", "/", "%", "&", "|", "~", "!"
    };

    std::vector<Token> tokens;
    size_t i = 0;
    while (i < src.size()) {
        char c = src[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        size_t start = i;
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && i + 1 < src.size() && std::isdigit(static_cast<unsigned char>(src[i + 1])))) {
            while (i < src.size() && (std::isalnum(static_cast<unsigned char>(src[i])) || src[i] == '.' ||
                   ((src[i] == '+' || src[i] == '-') && (src[i - 1] == 'e' || src[i - 1] == 'E')))) {
                ++i;
            }
            tokens.push_back({Tok::NUMBER, src.substr(start, i - start), start});
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            while (i < src.size() && (std::isalnum(static_cast<unsigned char>(src[i])) || src[i] == '_')) {
                ++i;
            }
            tokens.push_back({Tok::IDENT, src.substr(start, i - start), start});
            continue;
        }

        if (c == '\'' || c == '"' || c == '`') {
            char quote = c;
            std::string text;
            ++i;
            bool closed = false;
            while (i < src.size()) {
                if (src[i] == '\\' && quote != '`' && i + 1 < src.size()) {
                    char e = src[i + 1];
                    text.push_back(e == 'n' ? '\n' : e == 't' ? '\t' : e);
                    i += 2;
                    continue;
                }
                if (src[i] == quote) {
                    closed = true;
                    ++i;
                    break;
                }
                text.push_back(src[i++]);
            }
            if (!closed) {
                throw EvalError("unterminated quote at position " + std::to_string(start));
            }
            tokens.push_back({quote == '`' ? Tok::QUOTED_IDENT : Tok::STRING, text, start});
            continue;
        }

        switch (c) {
            case '(': tokens.push_back({Tok::LPAREN, "(", start}); ++i; continue;
            case ')': tokens.push_back({Tok::RPAREN, ")", start}); ++i; continue;
            case '[': tokens.push_back({Tok::LBRACKET, "[", start}); ++i; continue;
            case ']': tokens.push_back({Tok::RBRACKET, "]", start}); ++i; continue;
            case ',': tokens.push_back({Tok::COMMA, ",", start}); ++i; continue;
            default: break;
        }

        bool matched = false;
        for (const char* op : kOps) {
            size_t len = std::char_traits<char>::length(op);
            if (src.compare(i, len, op) == 0) {
                tokens.push_back({Tok::OP, op, start});
                i += len;
                matched = true;
                break;
            }
        }
        if (!matched) {
            throw EvalError(std::string("unexpected character '") + c + "' at position " +
                            std::to_string(start));
        }
    }
    tokens.push_back({Tok::END, "", src.size()});
    return tokens;
}

// ---------------------------------------------------------------------------
// Value semantics
// ---------------------------------------------------------------------------

std::string kind_of(const Value& v) {
    if (std::holds_alternative<int64_t>(v)) return "int";
    if (std::holds_alternative<double>(v)) return "float";
    if (std::holds_alternative<bool>(v)) return "bool";
    if (std::holds_alternative<std::string>(v)) return "str";
    return "None";
}

bool numeric_like(const Value& v) {
    return std::holds_alternative<int64_t>(v) || std::holds_alternative<double>(v) ||
           std::holds_alternative<bool>(v);
}

// bool -> int64 so arithmetic and comparison see plain numbers
Value promote(const Value& v) {
    if (auto b = std::get_if<bool>(&v)) return Value{std::in_place_type<int64_t>, *b ? 1 : 0};
    return v;
}

bool truthy(const Value& v) {
    if (is_null(v)) return false;
    if (auto b = std::get_if<bool>(&v)) return *b;
    if (auto i = std::get_if<int64_t>(&v)) return *i != 0;
    if (auto d = std::get_if<double>(&v)) return *d != 0.0 && !std::isnan(*d);
    return !std::get<std::string>(v).empty();
}

enum class ArithOp { ADD, SUB, MUL, DIV, FLOORDIV, MOD, POW };

const char* arith_symbol(ArithOp op) {
    switch (op) {
        case ArithOp::ADD: return "+";
        case ArithOp::SUB: return "-";
        case ArithOp::MUL: return "*";
        case ArithOp::DIV: return "/";
        case ArithOp::FLOORDIV: return "//";
        case ArithOp::MOD: return "%";
        case ArithOp::POW: return "**";
    }
    return "?";
}

// int64 arithmetic wraps around on overflow, as numpy's does
int64_t wrapping_add(int64_t x, int64_t y) {
    return static_cast<int64_t>(static_cast<uint64_t>(x) + static_cast<uint64_t>(y));
}

int64_t wrapping_sub(int64_t x, int64_t y) {
    return static_cast<int64_t>(static_cast<uint64_t>(x) - static_cast<uint64_t>(y));
}

int64_t wrapping_mul(int64_t x, int64_t y) {
    return static_cast<int64_t>(static_cast<uint64_t>(x) * static_cast<uint64_t>(y));
}

// Exponentiation by squaring, y >= 0
int64_t wrapping_pow(int64_t x, int64_t y) {
    int64_t result = 1;
    while (y > 0) {
        if (y & 1) result = wrapping_mul(result, x);
        x = wrapping_mul(x, x);
        y >>= 1;
    }
    return result;
}

Value arithmetic(ArithOp op, const Value& lhs, const Value& rhs) {
    if (is_null(lhs) || is_null(rhs)) return Value{};

    if (op == ArithOp::ADD && std::holds_alternative<std::string>(lhs) &&
        std::holds_alternative<std::string>(rhs)) {
        return Value{std::get<std::string>(lhs) + std::get<std::string>(rhs)};
    }
    if (!numeric_like(lhs) || !numeric_like(rhs)) {
        throw EvalError(std::string("unsupported operand type(s) for ") + arith_symbol(op) +
                        ": '" + kind_of(lhs) + "' and '" + kind_of(rhs) + "'");
    }

    Value a = promote(lhs), b = promote(rhs);
    if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
        int64_t x = std::get<int64_t>(a), y = std::get<int64_t>(b);
        switch (op) {
            case ArithOp::ADD: return Value{std::in_place_type<int64_t>, wrapping_add(x, y)};
            case ArithOp::SUB: return Value{std::in_place_type<int64_t>, wrapping_sub(x, y)};
            case ArithOp::MUL: return Value{std::in_place_type<int64_t>, wrapping_mul(x, y)};
            case ArithOp::DIV: break;  // true division below
            case ArithOp::FLOORDIV: {
                if (y == 0) return Value{};
                // INT64_MIN / -1 traps in hardware
                if (y == -1) return Value{std::in_place_type<int64_t>, wrapping_sub(0, x)};
                int64_t q = x / y;
                if ((x % y != 0) && ((x < 0) != (y < 0))) --q;
                return Value{std::in_place_type<int64_t>, q};
            }
            case ArithOp::MOD: {
                if (y == 0) return Value{};
                if (y == -1) return Value{std::in_place_type<int64_t>, 0};
                int64_t r = x % y;
                if (r != 0 && ((r < 0) != (y < 0))) r += y;
                return Value{std::in_place_type<int64_t>, r};
            }
            case ArithOp::POW: {
                if (y < 0) break;
                return Value{std::in_place_type<int64_t>, wrapping_pow(x, y)};
            }
        }
    }

    double x = columnar::as_double(a), y = columnar::as_double(b);
    switch (op) {
        case ArithOp::ADD: return Value{x + y};
        case ArithOp::SUB: return Value{x - y};
        case ArithOp::MUL: return Value{x * y};
        case ArithOp::DIV: return Value{x / y};
        case ArithOp::FLOORDIV: return Value{std::floor(x / y)};
        case ArithOp::MOD: {
            double r = std::fmod(x, y);
            if (r != 0.0 && ((r < 0) != (y < 0))) r += y;
            return Value{r};
        }
        case ArithOp::POW: return Value{std::pow(x, y)};
    }
    return Value{};
}

enum class CmpOp { EQ, NE, LT, LE, GT, GE };

bool compare(CmpOp op, const Value& lhs, const Value& rhs, const std::string& symbol) {
    // Missing values compare unequal to everything
    if (is_null(lhs) || is_null(rhs)) return op == CmpOp::NE;

    int c;
    if (numeric_like(lhs) && numeric_like(rhs)) {
        c = columnar::compare_values(promote(lhs), promote(rhs));
    } else if (std::holds_alternative<std::string>(lhs) && std::holds_alternative<std::string>(rhs)) {
        c = columnar::compare_values(lhs, rhs);
    } else {
        if (op == CmpOp::EQ) return false;
        if (op == CmpOp::NE) return true;
        throw EvalError("'" + symbol + "' not supported between '" + kind_of(lhs) +
                        "' and '" + kind_of(rhs) + "'");
    }

    switch (op) {
        case CmpOp::EQ: return c == 0;
        case CmpOp::NE: return c != 0;
        case CmpOp::LT: return c < 0;
        case CmpOp::LE: return c <= 0;
        case CmpOp::GT: return c > 0;
        case CmpOp::GE: return c >= 0;
    }
    return false;
}

// ---------------------------------------------------------------------------
// AST
// ---------------------------------------------------------------------------

using NodePtr = std::shared_ptr<const ExprNode>;

class LiteralNode : public ExprNode {
public:
    explicit LiteralNode(Value value) : value_(std::move(value)) {}
    Value evaluate(const Table&, size_t) const override { return value_; }

private:
    Value value_;
};

class ColumnNode : public ExprNode {
public:
    explicit ColumnNode(std::string name) : name_(std::move(name)) {}

    Value evaluate(const Table& table, size_t row) const override {
        if (!table.has_column(name_)) {
            throw EvalError("name '" + name_ + "' is not defined");
        }
        return table.get_column(name_)->value_at(row);
    }

private:
    std::string name_;
};

class NegateNode : public ExprNode {
public:
    NegateNode(NodePtr child, bool negative) : child_(std::move(child)), negative_(negative) {}

    Value evaluate(const Table& table, size_t row) const override {
        Value v = child_->evaluate(table, row);
        if (is_null(v)) return v;
        if (!numeric_like(v)) {
            throw EvalError("bad operand type for unary " + std::string(negative_ ? "-" : "+") +
                            ": '" + kind_of(v) + "'");
        }
        v = promote(v);
        if (!negative_) return v;
        if (auto i = std::get_if<int64_t>(&v)) return Value{std::in_place_type<int64_t>, wrapping_sub(0, *i)};
        return Value{-std::get<double>(v)};
    }

private:
    NodePtr child_;
    bool negative_;
};

class NotNode : public ExprNode {
public:
    explicit NotNode(NodePtr child) : child_(std::move(child)) {}

    Value evaluate(const Table& table, size_t row) const override {
        return Value{!truthy(child_->evaluate(table, row))};
    }

private:
    NodePtr child_;
};

class ArithmeticNode : public ExprNode {
public:
    ArithmeticNode(ArithOp op, NodePtr lhs, NodePtr rhs)
        : op_(op), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

    Value evaluate(const Table& table, size_t row) const override {
        return arithmetic(op_, lhs_->evaluate(table, row), rhs_->evaluate(table, row));
    }

private:
    ArithOp op_;
    NodePtr lhs_, rhs_;
};

class CompareNode : public ExprNode {
public:
    CompareNode(CmpOp op, std::string symbol, NodePtr lhs, NodePtr rhs)
        : op_(op), symbol_(std::move(symbol)), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

    Value evaluate(const Table& table, size_t row) const override {
        return Value{compare(op_, lhs_->evaluate(table, row), rhs_->evaluate(table, row), symbol_)};
    }

private:
    CmpOp op_;
    std::string symbol_;
    NodePtr lhs_, rhs_;
};

class LogicNode : public ExprNode {
public:
    LogicNode(bool is_and, NodePtr lhs, NodePtr rhs)
        : is_and_(is_and), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

    Value evaluate(const Table& table, size_t row) const override {
        bool left = truthy(lhs_->evaluate(table, row));
        if (is_and_ && !left) return Value{false};
        if (!is_and_ && left) return Value{true};
        return Value{truthy(rhs_->evaluate(table, row))};
    }

private:
    bool is_and_;
    NodePtr lhs_, rhs_;
};

class InNode : public ExprNode {
public:
    InNode(NodePtr needle, std::vector<NodePtr> items, bool negated)
        : needle_(std::move(needle)), items_(std::move(items)), negated_(negated) {}

    Value evaluate(const Table& table, size_t row) const override {
        Value v = needle_->evaluate(table, row);
        bool found = false;
        for (const auto& item : items_) {
            if (compare(CmpOp::EQ, v, item->evaluate(table, row), "==")) {
                found = true;
                break;
            }
        }
        return Value{found != negated_};
    }

private:
    NodePtr needle_;
    std::vector<NodePtr> items_;
    bool negated_;
};

class IsNullNode : public ExprNode {
public:
    IsNullNode(NodePtr child, bool negated) : child_(std::move(child)), negated_(negated) {}

    Value evaluate(const Table& table, size_t row) const override {
        Value v = child_->evaluate(table, row);
        bool missing = is_null(v) || (std::holds_alternative<double>(v) && std::isnan(std::get<double>(v)));
        return Value{missing != negated_};
    }

private:
    NodePtr child_;
    bool negated_;
};

// ---------------------------------------------------------------------------
// Recursive-descent parser
// ---------------------------------------------------------------------------

class Parser {
public:
    explicit Parser(const std::string& text) : tokens_(tokenize(text)) {}

    NodePtr parse() {
        if (peek().type == Tok::END) {
            throw EvalError("empty expression");
        }
        NodePtr node = parse_or();
        if (peek().type != Tok::END) {
            fail("unexpected '" + peek().text + "'");
        }
        return node;
    }

private:
    const Token& peek(size_t ahead = 0) const {
        return tokens_[std::min(pos_ + ahead, tokens_.size() - 1)];
    }
    const Token& next() { return tokens_[std::min(pos_++, tokens_.size() - 1)]; }

    bool is_keyword(const Token& tok, const char* word) const {
        return tok.type == Tok::IDENT && lower(tok.text) == word;
    }
    bool is_op(const Token& tok, const char* op) const {
        return tok.type == Tok::OP && tok.text == op;
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw EvalError("syntax error at position " + std::to_string(peek().pos) + ": " + message);
    }

    void expect(Tok type, const char* what) {
        if (peek().type != type) fail(std::string("expected ") + what);
        next();
    }

    NodePtr parse_or() {
        NodePtr lhs = parse_and();
        while (is_keyword(peek(), "or") || is_op(peek(), "|") || is_op(peek(), "||")) {
            next();
            lhs = std::make_shared<LogicNode>(false, lhs, parse_and());
        }
        return lhs;
    }

    NodePtr parse_and() {
        NodePtr lhs = parse_not();
        while (is_keyword(peek(), "and") || is_op(peek(), "&") || is_op(peek(), "&&")) {
            next();
            lhs = std::make_shared<LogicNode>(true, lhs, parse_not());
        }
        return lhs;
    }

    NodePtr parse_not() {
        if (is_keyword(peek(), "not") || is_op(peek(), "~") || is_op(peek(), "!")) {
            next();
            return std::make_shared<NotNode>(parse_not());
        }
        return parse_comparison();
    }

    bool comparison_op(const Token& tok, CmpOp& op) const {
        if (tok.type != Tok::OP) return false;
        const std::string& t = tok.text;
        if (t == "==" || t == "=") op = CmpOp::EQ;
        else if (t == "!=" || t == "<>") op = CmpOp::NE;
        else if (t == "<") op = CmpOp::LT;
        else if (t == "<=") op = CmpOp::LE;
        else if (t == ">") op = CmpOp::GT;
        else if (t == ">=") op = CmpOp::GE;
        else return false;
        return true;
    }

    NodePtr parse_comparison() {
        NodePtr lhs = parse_additive();

        if (is_keyword(peek(), "is")) {
            next();
            bool negated = false;
            if (is_keyword(peek(), "not")) {
                next();
                negated = true;
            }
            if (!is_keyword(peek(), "null") && !is_keyword(peek(), "none")) {
                fail("expected NULL after IS");
            }
            next();
            return std::make_shared<IsNullNode>(lhs, negated);
        }

        if (is_keyword(peek(), "in") || (is_keyword(peek(), "not") && is_keyword(peek(1), "in"))) {
            bool negated = is_keyword(peek(), "not");
            if (negated) next();
            next();
            return std::make_shared<InNode>(lhs, parse_list(), negated);
        }

        // Chained comparisons: a < b < c means (a < b) and (b < c)
        NodePtr result;
        CmpOp op;
        while (comparison_op(peek(), op)) {
            std::string symbol = next().text;
            NodePtr rhs = parse_additive();
            NodePtr cmp = std::make_shared<CompareNode>(op, symbol, lhs, rhs);
            result = result ? std::make_shared<LogicNode>(true, result, cmp) : cmp;
            lhs = rhs;
        }
        return result ? result : lhs;
    }

    std::vector<NodePtr> parse_list() {
        Tok close;
        if (peek().type == Tok::LBRACKET) close = Tok::RBRACKET;
        else if (peek().type == Tok::LPAREN) close = Tok::RPAREN;
        else fail("expected a list after IN");
        next();

        std::vector<NodePtr> items;
        if (peek().type != close) {
            items.push_back(parse_additive());
            while (peek().type == Tok::COMMA) {
                next();
                if (peek().type == close) break;
                items.push_back(parse_additive());
            }
        }
        expect(close, "closing bracket");
        return items;
    }

    NodePtr parse_additive() {
        NodePtr lhs = parse_term();
        while (is_op(peek(), "+") || is_op(peek(), "-")) {
            ArithOp op = next().text == "+" ? ArithOp::ADD : ArithOp::SUB;
            lhs = std::make_shared<ArithmeticNode>(op, lhs, parse_term());
        }
        return lhs;
    }

    NodePtr parse_term() {
        NodePtr lhs = parse_unary();
        while (is_op(peek(), "*") || is_op(peek(), "/") || is_op(peek(), "//") || is_op(peek(), "%")) {
            const std::string& t = next().text;
            ArithOp op = t == "*" ? ArithOp::MUL : t == "/" ? ArithOp::DIV
                       : t == "//" ? ArithOp::FLOORDIV : ArithOp::MOD;
            lhs = std::make_shared<ArithmeticNode>(op, lhs, parse_unary());
        }
        return lhs;
    }

    NodePtr parse_unary() {
        if (is_op(peek(), "-") || is_op(peek(), "+")) {
            bool negative = next().text == "-";
            return std::make_shared<NegateNode>(parse_unary(), negative);
        }
        return parse_power();
    }

    NodePtr parse_power() {
        NodePtr base = parse_primary();
        if (is_op(peek(), "**")) {
            next();
            return std::make_shared<ArithmeticNode>(ArithOp::POW, base, parse_unary());
        }
        return base;
    }

    NodePtr parse_primary() {
        const Token& tok = peek();
        switch (tok.type) {
            case Tok::NUMBER: {
                std::string text = next().text;
                bool is_float = text.find_first_of(".eE") != std::string::npos;
                char* end = nullptr;
                if (!is_float) {
                    errno = 0;
                    long long v = std::strtoll(text.c_str(), &end, 10);
                    // Literals past the int64 range are read as floats
                    if (*end == '\0' && errno != ERANGE) {
                        return std::make_shared<LiteralNode>(Value{std::in_place_type<int64_t>, v});
                    }
                }
                double d = std::strtod(text.c_str(), &end);
                if (*end != '\0') fail("malformed number '" + text + "'");
                return std::make_shared<LiteralNode>(Value{d});
            }
            case Tok::STRING:
                return std::make_shared<LiteralNode>(Value{next().text});
            case Tok::QUOTED_IDENT:
                return std::make_shared<ColumnNode>(next().text);
            case Tok::IDENT: {
                std::string word = lower(tok.text);
                if (word == "true") { next(); return std::make_shared<LiteralNode>(Value{true}); }
                if (word == "false") { next(); return std::make_shared<LiteralNode>(Value{false}); }
                if (word == "none" || word == "null") { next(); return std::make_shared<LiteralNode>(Value{}); }
                if (peek(1).type == Tok::LPAREN) {
                    fail("function calls are not supported ('" + tok.text + "')");
                }
                return std::make_shared<ColumnNode>(next().text);
            }
            case Tok::LPAREN: {
                next();
                NodePtr inner = parse_or();
                expect(Tok::RPAREN, "')'");
                return inner;
            }
            default:
                fail(tok.type == Tok::END ? "unexpected end of expression"
                                          : "unexpected '" + tok.text + "'");
        }
    }

    std::vector<Token> tokens_;
    size_t pos_ = 0;
};

} // namespace

Expression Expression::parse(const std::string& text) {
    return Expression(Parser(text).parse());
}

std::vector<Value> Expression::evaluate_all(const Table& table) const {
    std::vector<Value> out;
    out.reserve(table.num_rows());
    for (size_t row = 0; row < table.num_rows(); ++row) {
        out.push_back(root_->evaluate(table, row));
    }
    return out;
}

std::vector<bool> Expression::evaluate_mask(const Table& table) const {
    std::vector<bool> mask;
    mask.reserve(table.num_rows());
    for (size_t row = 0; row < table.num_rows(); ++row) {
        Value v = root_->evaluate(table, row);
        if (is_null(v)) {
            mask.push_back(false);
        } else if (auto b = std::get_if<bool>(&v)) {
            mask.push_back(*b);
        } else {
            throw EvalError("filter expression must evaluate to booleans, got '" + kind_of(v) + "'");
        }
    }
    return mask;
}

} // namespace expr
} // namespace pipeforge
