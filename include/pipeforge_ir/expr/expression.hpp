#pragma once

#include <string>

namespace pipeforge {
namespace expr {

/**
 * Opaque filter / derive expression text.
 *
 * The text is never parsed or translated for the code generators; each
 * backend only gets the escaping its literal syntax needs. Whether the
 * same text means the same thing in pandas, DuckDB and Spark is up to
 * whoever wrote it.
 */
class PassthroughExpr {
public:
    PassthroughExpr() = default;
    explicit PassthroughExpr(std::string text);

    const std::string& text() const { return text_; }
    bool empty() const { return text_.empty(); }

    // Double-quoted Python string literal: "a \"b\""
    std::string as_python_literal() const;

    // Raw text for inlining into SQL
    std::string as_sql() const { return text_; }

    bool operator==(const PassthroughExpr& other) const { return text_ == other.text_; }

private:
    std::string text_;  // trimmed
};

// Quoting helpers shared by the code generators
std::string python_string_literal(const std::string& s);
std::string sql_string_literal(const std::string& s);
std::string sql_identifier(const std::string& s);

} // namespace expr
} // namespace pipeforge
