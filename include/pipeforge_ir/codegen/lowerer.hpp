#pragma once

#include "../dag/graph.hpp"
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pipeforge {
namespace codegen {

enum class Backend {
    PANDAS,   // eager in-process dataframes
    DUCKDB,   // embedded analytical SQL
    SPARK     // distributed lazy dataframes
};

// "python"/"pandas", "sql"/"duckdb", "spark"/"pyspark"; nullopt otherwise
std::optional<Backend> parse_backend(const std::string& lang);
std::string backend_name(Backend backend);

/**
 * A payload that cannot be turned into program text (for example an
 * aggregation operator that is not a plain identifier)
 */
class LoweringError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * What a lowerer knows about the node being emitted
 */
struct LoweringContext {
    const dag::Node& node;
    std::string name;                 // identifier bound to this node's result
    std::vector<std::string> inputs;  // parent identifiers, edge order

    const std::string& input(size_t i = 0) const { return inputs.at(i); }
};

/**
 * Base class of the three code generators.
 *
 * lower() walks the graph in topological order, assigns names once and
 * hands every node to the emit() overload for its payload type. Each
 * payload type has a pure virtual overload, so a new node kind does not
 * build until every backend handles it.
 */
class Lowerer {
public:
    virtual ~Lowerer() = default;

    virtual Backend backend() const = 0;

    // Throws GraphError on a malformed graph, LoweringError on a bad payload
    std::string lower(const dag::Graph& graph);

protected:
    virtual void begin(std::ostream& out) = 0;
    virtual void finish(std::ostream& out, const std::optional<std::string>& last) = 0;

    virtual void emit(std::ostream& out, const LoweringContext& ctx, const dag::LoadSpec& spec) = 0;
    virtual void emit(std::ostream& out, const LoweringContext& ctx, const dag::SelectSpec& spec) = 0;
    virtual void emit(std::ostream& out, const LoweringContext& ctx, const dag::FilterSpec& spec) = 0;
    virtual void emit(std::ostream& out, const LoweringContext& ctx, const dag::AggregateSpec& spec) = 0;
    virtual void emit(std::ostream& out, const LoweringContext& ctx, const dag::DeriveSpec& spec) = 0;
    virtual void emit(std::ostream& out, const LoweringContext& ctx, const dag::SortSpec& spec) = 0;
    virtual void emit(std::ostream& out, const LoweringContext& ctx, const dag::SampleSpec& spec) = 0;
    virtual void emit(std::ostream& out, const LoweringContext& ctx, const dag::JoinSpec& spec) = 0;
    virtual void emit(std::ostream& out, const LoweringContext& ctx, const dag::WriteSpec& spec) = 0;
    virtual void emit(std::ostream& out, const LoweringContext& ctx, const dag::PassthroughSpec& spec) = 0;
};

// Throws LoweringError unless op is [A-Za-z_][A-Za-z0-9_]*
void check_operator_name(const std::string& op);

// Python float literal: shortest round-trip digits, always with a '.' or exponent
std::string python_float(double value);

// Rejects a join type other than inner/left/right/outer with LoweringError
void check_join_type(const std::string& how);

std::unique_ptr<Lowerer> make_lowerer(Backend backend);

// Convenience: make_lowerer(backend)->lower(graph)
std::string lower(const dag::Graph& graph, Backend backend);

} // namespace codegen
} // namespace pipeforge
