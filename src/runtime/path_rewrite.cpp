#include "pipeforge_ir/runtime/path_rewrite.hpp"
#include "pipeforge_ir/expr/expression.hpp"
#include <regex>
#include <set>

namespace pipeforge {
namespace runtime {

namespace {

std::string regex_escape(const std::string& s) {
    static const std::string kSpecial = "\\^$.|?*+()[]{}";
    std::string out;
    for (char c : s) {
        if (kSpecial.find(c) != std::string::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

// regex_replace treats '$' as a group reference
std::string replacement_escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '$') out += "$$";
        else out.push_back(c);
    }
    return out;
}

// The ways a name can be spelled inside a quoted literal
std::string literal_forms(const std::string& raw, const std::string& escaped) {
    std::set<std::string> forms{regex_escape(raw), regex_escape(escaped)};
    std::string out = "(?:";
    bool first = true;
    for (const auto& form : forms) {
        if (!first) out += "|";
        out += form;
        first = false;
    }
    return out + ")";
}

std::string unquote(const std::string& literal) {
    return literal.substr(1, literal.size() - 2);
}

} // namespace

std::string rewrite_paths(codegen::Backend backend, const std::string& text, const PathMapping& mapping) {
    std::string out = text;

    for (const auto& entry : mapping) {
        const std::string& orig = entry.first;
        const std::string& staged = entry.second;

        switch (backend) {
            case codegen::Backend::PANDAS: {
                std::regex pattern(
                    R"(pd\.read_csv\(\s*r?(["']))" +
                    literal_forms(orig, unquote(expr::python_string_literal(orig))) + R"(\1\s*\))");
                out = std::regex_replace(
                    out, pattern,
                    replacement_escape("pd.read_csv(" + expr::python_string_literal(staged) + ")"));
                break;
            }
            case codegen::Backend::DUCKDB: {
                std::regex pattern(
                    R"(read_csv_auto\(\s*(['"]))" +
                    literal_forms(orig, unquote(expr::sql_string_literal(orig))) +
                    R"(\1\s*(?:,\s*header\s*=\s*true\s*)?\))",
                    std::regex::ECMAScript | std::regex::icase);
                out = std::regex_replace(
                    out, pattern,
                    replacement_escape("read_csv_auto(" + expr::sql_string_literal(staged) + ", header=true)"));
                break;
            }
            case codegen::Backend::SPARK: {
                std::regex pattern(
                    R"(spark\.read((?:\.option\([^()]*\))*)\.csv\(\s*r?(["']))" +
                    literal_forms(orig, unquote(expr::python_string_literal(orig))) + R"(\2\s*\))");
                out = std::regex_replace(
                    out, pattern,
                    "spark.read$1.csv(" + replacement_escape(expr::python_string_literal(staged)) + ")");
                break;
            }
        }
    }
    return out;
}

} // namespace runtime
} // namespace pipeforge
