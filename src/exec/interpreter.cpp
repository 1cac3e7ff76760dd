#include "pipeforge_ir/exec/interpreter.hpp"
#include "pipeforge_ir/columnar/csv.hpp"
#include "pipeforge_ir/expr/evaluator.hpp"
#include "pipeforge_ir/ops/aggregate.hpp"
#include "pipeforge_ir/ops/filter.hpp"
#include "pipeforge_ir/ops/join.hpp"
#include "pipeforge_ir/ops/map.hpp"
#include "pipeforge_ir/ops/sample.hpp"
#include "pipeforge_ir/ops/select.hpp"
#include "pipeforge_ir/ops/sort.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace pipeforge {
namespace exec {

namespace {

using TablePtr = std::shared_ptr<Table>;

bool blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

/**
 * Evaluates one node's payload against its materialized inputs
 */
struct NodeEvaluator {
    const std::vector<TablePtr>& inputs;

    const Table& input(size_t i = 0) const { return *inputs.at(i); }

    TablePtr operator()(const dag::LoadSpec& spec) const {
        if (spec.inline_text && !blank(*spec.inline_text)) {
            return columnar::read_csv_text(*spec.inline_text);
        }
        return columnar::read_csv_file(spec.path);
    }

    TablePtr operator()(const dag::SelectSpec& spec) const {
        return ops::select(input(), spec);
    }

    TablePtr operator()(const dag::FilterSpec& spec) const {
        if (spec.expr.empty()) {
            return input().copy();
        }
        return ops::filter(input(), expr::Expression::parse(spec.expr.text()));
    }

    TablePtr operator()(const dag::AggregateSpec& spec) const {
        return ops::aggregate(input(), spec);
    }

    TablePtr operator()(const dag::DeriveSpec& spec) const {
        return ops::derive(input(), spec.new_col, expr::Expression::parse(spec.expr.text()));
    }

    TablePtr operator()(const dag::SortSpec& spec) const {
        return ops::sort(input(), spec);
    }

    TablePtr operator()(const dag::SampleSpec& spec) const {
        return ops::sample(input(), spec);
    }

    TablePtr operator()(const dag::JoinSpec& spec) const {
        return ops::join(input(0), input(1), spec);
    }

    TablePtr operator()(const dag::WriteSpec& spec) const {
        columnar::write_csv_file(input(), spec.path);
        return inputs.at(0);
    }

    TablePtr operator()(const dag::PassthroughSpec&) const {
        return input().copy();
    }
};

} // namespace

RunResult Interpreter::run(const dag::Graph& graph, const std::optional<std::string>& preview_id) const {
    dag::Graph scoped = (preview_id && !preview_id->empty())
        ? graph.subgraph(graph.ancestors_of(*preview_id))
        : graph;
    scoped.check_arity();

    auto order = scoped.topological_order().ids;
    std::unordered_map<std::string, TablePtr> frames;
    RunResult result;

    for (const auto& id : order) {
        const auto& node = scoped.node(id);

        // With a cycle a parent may not have run yet; it reads as empty
        std::vector<TablePtr> inputs;
        for (const auto& parent : scoped.parents_of(id)) {
            auto it = frames.find(parent);
            inputs.push_back(it != frames.end() ? it->second : std::make_shared<Table>());
        }

        try {
            frames[id] = std::visit(NodeEvaluator{inputs}, node.payload);
        } catch (const std::exception& e) {
            std::string message = node.kind_string() + ": " + e.what();
            spdlog::warn("Node '{}' failed, continuing with a fallback table: {}", id, message);
            result.node_errors[id] = message;

            if (node.kind() == dag::NodeKind::FILTER) {
                frames[id] = inputs.at(0);
            } else if (const auto* derive = std::get_if<dag::DeriveSpec>(&node.payload)) {
                frames[id] = ops::derive_nulls(*inputs.at(0), derive->new_col);
            } else {
                frames[id] = std::make_shared<Table>();
            }
        }

        if (spdlog::should_log(spdlog::level::trace)) {
            spdlog::trace("Node '{}':\n{}", id, frames[id]->to_string(5));
        }
    }

    result.table = order.empty() ? std::make_shared<Table>() : frames.at(order.back());
    spdlog::debug("Interpreted {} node(s), {} error(s)", order.size(), result.node_errors.size());
    return result;
}

} // namespace exec
} // namespace pipeforge
