#include "pipeforge_ir/dag/optimizer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

namespace pipeforge {
namespace dag {

// RewriteGraph implementation

RewriteGraph::RewriteGraph(const Graph& graph)
    : edges_(graph.edges()) {
    for (const auto& node : graph.nodes()) {
        nodes_.emplace(node.id, node);
    }
}

Node& RewriteGraph::node(const std::string& id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw GraphError("Node '" + id + "' not found");
    }
    return it->second;
}

std::vector<std::string> RewriteGraph::parents_of(const std::string& id) const {
    std::vector<std::string> parents;
    for (const auto& edge : edges_) {
        if (edge.target == id) parents.push_back(edge.source);
    }
    return parents;
}

std::vector<std::string> RewriteGraph::children_of(const std::string& id) const {
    std::vector<std::string> children;
    for (const auto& edge : edges_) {
        if (edge.source == id) children.push_back(edge.target);
    }
    return children;
}

bool RewriteGraph::can_splice(const std::string& id) const {
    if (!alive(id)) return false;

    auto parents = parents_of(id);
    auto children = children_of(id);
    if (parents.size() != 1 || children.size() > 1) {
        return false;
    }
    if (children.empty()) {
        return true;
    }

    Edge bypass{parents[0], children[0]};
    return std::find(edges_.begin(), edges_.end(), bypass) == edges_.end();
}

bool RewriteGraph::splice(const std::string& id) {
    if (!can_splice(id)) {
        return false;
    }

    auto parents = parents_of(id);
    auto children = children_of(id);

    // The bypass edge takes the removed node's slot in the child's input
    // list so a join keeps its left/right order.
    std::vector<Edge> rewired;
    rewired.reserve(edges_.size());
    for (const auto& edge : edges_) {
        if (edge.target == id) continue;
        if (edge.source == id) {
            rewired.push_back(Edge{parents[0], edge.target});
            continue;
        }
        rewired.push_back(edge);
    }
    edges_ = std::move(rewired);
    nodes_.erase(id);
    return true;
}

Graph RewriteGraph::finish(const std::vector<std::string>& order) const {
    std::vector<Node> nodes;
    for (const auto& id : order) {
        auto it = nodes_.find(id);
        if (it != nodes_.end()) nodes.push_back(it->second);
    }

    std::vector<Edge> edges;
    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& edge : edges_) {
        if (!alive(edge.source) || !alive(edge.target)) continue;
        if (seen.emplace(edge.source, edge.target).second) {
            edges.push_back(edge);
        }
    }
    return Graph(std::move(nodes), std::move(edges));
}

namespace {

// The single parent when it has the same kind as the node
template<typename Spec>
std::optional<std::string> same_kind_parent(RewriteGraph& graph, const std::string& node_id) {
    if (!std::holds_alternative<Spec>(graph.node(node_id).payload)) return std::nullopt;
    auto parents = graph.parents_of(node_id);
    if (parents.size() != 1) return std::nullopt;
    if (!std::holds_alternative<Spec>(graph.node(parents[0]).payload)) return std::nullopt;
    return parents[0];
}

} // namespace

// SelectFusionRule implementation

bool SelectFusionRule::apply(RewriteGraph& graph, const std::string& node_id) {
    auto parent_id = same_kind_parent<SelectSpec>(graph, node_id);
    if (!parent_id) return false;

    const auto& parent = std::get<SelectSpec>(graph.node(*parent_id).payload);
    const auto& child = std::get<SelectSpec>(graph.node(node_id).payload);

    // Casts are not merged
    if (!parent.schema.empty() || !child.schema.empty()) return false;

    if (parent.is_wildcard() && !child.is_wildcard()) {
        return graph.splice(*parent_id);
    }
    if (!parent.is_wildcard() && child.is_wildcard()) {
        return graph.splice(node_id);
    }
    if (parent.is_wildcard() && child.is_wildcard()) {
        return false;
    }

    // The parent's payload changes, so nobody else may be reading it
    if (graph.children_of(*parent_id).size() != 1 || !graph.can_splice(node_id)) {
        SPDLOG_DEBUG("SelectFusion skipped at '{}': parent '{}' fans out or node cannot be spliced",
                     node_id, *parent_id);
        return false;
    }

    SelectSpec merged;
    for (const auto& col : parent.columns) {
        if (std::find(child.columns.begin(), child.columns.end(), col) != child.columns.end()) {
            merged.columns.push_back(col);
        }
    }
    // Empty intersection degenerates to "*"

    graph.node(*parent_id).payload = merged;
    return graph.splice(node_id);
}

// FilterFusionRule implementation

bool FilterFusionRule::apply(RewriteGraph& graph, const std::string& node_id) {
    auto parent_id = same_kind_parent<FilterSpec>(graph, node_id);
    if (!parent_id) return false;

    if (graph.children_of(*parent_id).size() != 1 || !graph.can_splice(node_id)) {
        SPDLOG_DEBUG("FilterFusion skipped at '{}': parent '{}' fans out or node cannot be spliced",
                     node_id, *parent_id);
        return false;
    }

    const auto& first = std::get<FilterSpec>(graph.node(*parent_id).payload).expr;
    const auto& second = std::get<FilterSpec>(graph.node(node_id).payload).expr;

    std::string combined;
    if (first.empty()) {
        combined = second.text();
    } else if (second.empty()) {
        combined = first.text();
    } else {
        combined = "(" + first.text() + ") AND (" + second.text() + ")";
    }

    graph.node(*parent_id).payload = FilterSpec{expr::PassthroughExpr(combined)};
    return graph.splice(node_id);
}

// IdentitySelectRule implementation

bool IdentitySelectRule::apply(RewriteGraph& graph, const std::string& node_id) {
    const auto* select = std::get_if<SelectSpec>(&graph.node(node_id).payload);
    if (!select || !select->is_wildcard() || !select->schema.empty()) return false;

    if (graph.parents_of(node_id).size() != 1 || graph.children_of(node_id).size() != 1) {
        return false;
    }
    return graph.splice(node_id);
}

// Dead-node elimination

Graph prune_dead(const Graph& graph, const std::optional<std::string>& target_id) {
    if (!target_id || target_id->empty()) {
        return graph;
    }
    return graph.subgraph(graph.ancestors_of(*target_id));
}

// Optimizer implementation

Optimizer::Optimizer() {
    add_rule(std::make_unique<SelectFusionRule>());
    add_rule(std::make_unique<FilterFusionRule>());
    add_rule(std::make_unique<IdentitySelectRule>());
}

void Optimizer::add_rule(std::unique_ptr<OptimizationRule> rule) {
    rules_.push_back(std::move(rule));
}

Graph Optimizer::fuse(const Graph& graph, bool* changed) {
    auto order = graph.topological_order().ids;
    RewriteGraph working(graph);
    bool modified = false;

    for (const auto& id : order) {
        for (const auto& rule : rules_) {
            if (!working.alive(id)) break;
            if (rule->apply(working, id)) {
                SPDLOG_DEBUG("[{}] rewrote at node '{}'", rule->name(), id);
                applied_rules_.push_back(rule->name());
                modified = true;
            }
        }
    }

    if (changed) *changed = modified;
    return working.finish(order);
}

Graph Optimizer::optimize(const Graph& graph, const std::optional<std::string>& target_id,
                          int max_passes) {
    applied_rules_.clear();

    Graph current = prune_dead(graph, target_id);
    if (current.nodes().size() != graph.nodes().size()) {
        spdlog::debug("Pruned {} dead node(s)", graph.nodes().size() - current.nodes().size());
    }

    for (int pass = 0; pass < max_passes; ++pass) {
        bool changed = false;
        current = fuse(current, &changed);
        if (!changed) {
            break;
        }
    }

    spdlog::debug("Optimization complete: {} rewrite(s), {} node(s) left",
                  applied_rules_.size(), current.nodes().size());
    return current;
}

} // namespace dag
} // namespace pipeforge
