#pragma once

#include "../expr/expression.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace pipeforge {
namespace dag {

enum class NodeKind {
    LOAD,        // source.load: read a CSV file or an inline upload
    SELECT,      // transform.select: project (and optionally cast) columns
    FILTER,      // transform.filter: keep rows matching a predicate
    AGGREGATE,   // transform.aggregate: group by + measures
    DERIVE,      // transform.derive: add one computed column
    SORT,        // transform.sort
    SAMPLE,      // transform.sample
    JOIN,        // transform.join: two inputs
    WRITE,       // sink.write
    UNKNOWN      // any other kind string; copies its input through
};

/**
 * Malformed graph: duplicate ids, dangling edge endpoints, wrong arity.
 * Fatal to the whole request.
 */
class GraphError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Parses a kind string, accepting the legacy source.csv / sink.csv /
// transform.summarize / transform.formula spellings. Never throws.
NodeKind parse_kind(const std::string& kind);
std::string kind_name(NodeKind kind);

// Splits "a, b,,c" into {"a","b","c"}
std::vector<std::string> split_list(const std::string& text);
std::string join_list(const std::vector<std::string>& items);

struct LoadSpec {
    std::string path = "uploaded.csv";
    std::optional<std::string> inline_text;  // uploaded content held in memory
};

struct ColumnCast {
    std::string name;
    std::string dtype;  // integer | float | boolean | string
};

struct SelectSpec {
    std::vector<std::string> columns;  // empty = wildcard "*"
    std::vector<ColumnCast> schema;

    bool is_wildcard() const { return columns.empty(); }
    static SelectSpec parse(const std::string& columns);
};

struct FilterSpec {
    expr::PassthroughExpr expr;
};

struct Measure {
    std::string col;
    std::string op;
    std::string alias;  // empty = "<op>_<col>"

    std::string output_name() const { return alias.empty() ? op + "_" + col : alias; }
};

struct AggregateSpec {
    std::vector<std::string> group_by;
    std::vector<Measure> measures;

    // Measures with both a column and an operator; the rest are ignored
    std::vector<Measure> usable_measures() const;
};

struct DeriveSpec {
    std::string new_col = "new_column";
    expr::PassthroughExpr expr{"0"};
};

struct SortKey {
    std::string column;
    bool descending = false;
};

struct SortSpec {
    std::vector<SortKey> keys;  // empty = identity

    // "a, b desc, c ASC" -> keys
    static SortSpec parse(const std::string& spec);
};

struct SampleSpec {
    enum class Mode { ROWS, FRACTION };
    Mode mode = Mode::ROWS;
    int64_t n = 100;
    double frac = 0.1;
    std::optional<uint64_t> seed;
};

struct JoinSpec {
    std::string how = "inner";  // inner | left | right | outer
    std::vector<std::string> left_keys{"id"};
    std::vector<std::string> right_keys{"id"};

    // Pairs left key i with right key i; a right list shorter than the
    // left one wraps back to its first element.
    std::vector<std::pair<std::string, std::string>> key_pairs() const;
};

struct WriteSpec {
    std::string path = "out.csv";
};

struct PassthroughSpec {
    std::string kind;  // the unrecognised kind string
};

using Payload = std::variant<
    LoadSpec, SelectSpec, FilterSpec, AggregateSpec, DeriveSpec,
    SortSpec, SampleSpec, JoinSpec, WriteSpec, PassthroughSpec>;

/**
 * One operation of the pipeline IR. Immutable once part of a Graph; the
 * optimizer builds new payloads instead of editing shared nodes.
 */
struct Node {
    std::string id;
    std::string label;
    Payload payload;

    NodeKind kind() const;
    std::string kind_string() const;

    // Number of incoming edges the kind requires
    size_t expected_inputs() const;
};

} // namespace dag
} // namespace pipeforge
