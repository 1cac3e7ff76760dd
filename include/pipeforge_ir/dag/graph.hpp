#pragma once

#include "node.hpp"
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pipeforge {
namespace dag {

struct Edge {
    std::string source;
    std::string target;

    bool operator==(const Edge& other) const {
        return source == other.source && target == other.target;
    }
};

/**
 * Result of a topological sort. On a cycle the ids come back in the
 * caller's node order and acyclic is false; nothing throws.
 */
struct Ordering {
    std::vector<std::string> ids;
    bool acyclic = true;
};

/**
 * Pipeline graph: nodes in caller order plus an edge list.
 * Edge order matters: a join's first incoming edge is its left input.
 */
class Graph {
public:
    Graph() = default;
    Graph(std::vector<Node> nodes, std::vector<Edge> edges);

    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<Edge>& edges() const { return edges_; }
    bool empty() const { return nodes_.empty(); }

    const Node& node(const std::string& id) const;
    bool contains(const std::string& id) const;

    // In edge-list order
    std::vector<std::string> parents_of(const std::string& id) const;
    std::vector<std::string> children_of(const std::string& id) const;

    // Kahn's algorithm, FIFO ready queue seeded in caller order
    Ordering topological_order() const;

    // Backward reachability from target, target included
    std::unordered_set<std::string> ancestors_of(const std::string& target) const;

    // Nodes in keep (caller order preserved) and edges between them
    Graph subgraph(const std::unordered_set<std::string>& keep) const;

    // Throws GraphError when a node's parent count does not fit its kind
    void check_arity() const;

    // Debugging
    std::string to_dot() const;

private:
    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace dag
} // namespace pipeforge
