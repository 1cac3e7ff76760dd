#include "pipeforge_ir/codegen/lowerer.hpp"
#include "pipeforge_ir/codegen/pandas_lowerer.hpp"
#include "pipeforge_ir/codegen/spark_lowerer.hpp"
#include "pipeforge_ir/codegen/sql_lowerer.hpp"
#include "pipeforge_ir/dag/naming.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cctype>

namespace pipeforge {
namespace codegen {

std::optional<Backend> parse_backend(const std::string& lang) {
    if (lang == "python" || lang == "pandas") return Backend::PANDAS;
    if (lang == "sql" || lang == "duckdb") return Backend::DUCKDB;
    if (lang == "spark" || lang == "pyspark") return Backend::SPARK;
    return std::nullopt;
}

std::string backend_name(Backend backend) {
    switch (backend) {
        case Backend::PANDAS: return "python";
        case Backend::DUCKDB: return "sql";
        case Backend::SPARK: return "spark";
    }
    return "unknown";
}

void check_operator_name(const std::string& op) {
    bool ok = !op.empty() && (std::isalpha(static_cast<unsigned char>(op[0])) || op[0] == '_');
    for (unsigned char c : op) {
        ok = ok && (std::isalnum(c) || c == '_');
    }
    if (!ok) {
        throw LoweringError("Aggregation operator '" + op + "' is not a plain identifier");
    }
}

std::string python_float(double value) {
    std::string text = fmt::format("{}", value);
    if (text.find_first_of(".en") == std::string::npos) {
        text += ".0";
    }
    return text;
}

void check_join_type(const std::string& how) {
    if (how != "inner" && how != "left" && how != "right" && how != "outer") {
        throw LoweringError("Unknown join type '" + how + "'");
    }
}

std::string Lowerer::lower(const dag::Graph& graph) {
    graph.check_arity();

    auto order = graph.topological_order().ids;
    auto names = dag::assign_names(graph, order);

    std::ostringstream out;
    begin(out);

    for (const auto& id : order) {
        const auto& node = graph.node(id);
        LoweringContext ctx{node, names.at(id), {}};
        for (const auto& parent : graph.parents_of(id)) {
            ctx.inputs.push_back(names.at(parent));
        }

        std::visit([&](const auto& spec) { this->emit(out, ctx, spec); }, node.payload);
    }

    finish(out, order.empty() ? std::nullopt : std::optional<std::string>(names.at(order.back())));

    SPDLOG_DEBUG("Lowered {} node(s) for {}", order.size(), backend_name(backend()));
    return out.str();
}

std::unique_ptr<Lowerer> make_lowerer(Backend backend) {
    switch (backend) {
        case Backend::PANDAS: return std::make_unique<PandasLowerer>();
        case Backend::DUCKDB: return std::make_unique<SqlLowerer>();
        case Backend::SPARK: return std::make_unique<SparkLowerer>();
    }
    throw LoweringError("Unknown backend");
}

std::string lower(const dag::Graph& graph, Backend backend) {
    return make_lowerer(backend)->lower(graph);
}

} // namespace codegen
} // namespace pipeforge
