#pragma once

#include "graph.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pipeforge {
namespace dag {

/**
 * Mutable working copy used while rewriting: node arena keyed by id plus
 * the live edge list. Degrees are always read off the current edges.
 */
class RewriteGraph {
public:
    explicit RewriteGraph(const Graph& graph);

    bool alive(const std::string& id) const { return nodes_.count(id) > 0; }
    Node& node(const std::string& id);

    std::vector<std::string> parents_of(const std::string& id) const;
    std::vector<std::string> children_of(const std::string& id) const;

    /**
     * Removes a node with exactly one parent and at most one child,
     * reconnecting parent -> child. Refuses (returns false) when the
     * precondition fails or the parent -> child edge already exists.
     */
    bool can_splice(const std::string& id) const;
    bool splice(const std::string& id);

    // Nodes listed in `order` that are still alive; edges deduplicated
    Graph finish(const std::vector<std::string>& order) const;

private:
    std::unordered_map<std::string, Node> nodes_;
    std::vector<Edge> edges_;
};

/**
 * Peephole rewrite applied to one node during a forward sweep
 */
class OptimizationRule {
public:
    virtual ~OptimizationRule() = default;

    virtual std::string name() const = 0;
    virtual bool apply(RewriteGraph& graph, const std::string& node_id) = 0;  // true if modified
};

/**
 * select(P) -> select(N) collapses into one select
 *   P=* , N=cols   drop P
 *   P=cols, N=*    drop N
 *   both explicit  P keeps its columns that N also lists, in P's order;
 *                  an empty intersection becomes "*"; drop N
 */
class SelectFusionRule : public OptimizationRule {
public:
    std::string name() const override { return "SelectFusion"; }
    bool apply(RewriteGraph& graph, const std::string& node_id) override;
};

/**
 * filter(p) -> filter(q) becomes filter((p) AND (q))
 */
class FilterFusionRule : public OptimizationRule {
public:
    std::string name() const override { return "FilterFusion"; }
    bool apply(RewriteGraph& graph, const std::string& node_id) override;
};

/**
 * select(*) with one parent and one child is spliced out
 */
class IdentitySelectRule : public OptimizationRule {
public:
    std::string name() const override { return "IdentitySelect"; }
    bool apply(RewriteGraph& graph, const std::string& node_id) override;
};

// Keeps only the ancestors of target_id; identity when no target is given
Graph prune_dead(const Graph& graph, const std::optional<std::string>& target_id);

/**
 * Main optimizer - dead-node pruning followed by peephole fusion
 *
 * One fusion pass is a single forward sweep in topological order, each
 * rule tried once per node. A chain of three or more fusible nodes may
 * need another pass; optimize() runs up to max_passes sweeps and stops
 * as soon as a sweep changes nothing.
 */
class Optimizer {
public:
    Optimizer();

    void add_rule(std::unique_ptr<OptimizationRule> rule);

    Graph optimize(const Graph& graph,
                   const std::optional<std::string>& target_id = std::nullopt,
                   int max_passes = 1);

    // One sweep; sets *changed when any rule fired
    Graph fuse(const Graph& graph, bool* changed = nullptr);

    const std::vector<std::string>& applied_rules() const { return applied_rules_; }

private:
    std::vector<std::unique_ptr<OptimizationRule>> rules_;
    std::vector<std::string> applied_rules_;
};

} // namespace dag
} // namespace pipeforge
