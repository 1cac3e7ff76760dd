#include "pipeforge_ir/dag/graph.hpp"
#include <spdlog/spdlog.h>
#include <deque>
#include <sstream>

namespace pipeforge {
namespace dag {

Graph::Graph(std::vector<Node> nodes, std::vector<Edge> edges)
    : nodes_(std::move(nodes))
    , edges_(std::move(edges)) {
    for (size_t i = 0; i < nodes_.size(); ++i) {
        const std::string& id = nodes_[i].id;
        if (!index_.emplace(id, i).second) {
            throw GraphError("Node with id '" + id + "' already exists");
        }
    }

    for (const auto& edge : edges_) {
        if (!contains(edge.source)) {
            throw GraphError("Edge source '" + edge.source + "' is not a node");
        }
        if (!contains(edge.target)) {
            throw GraphError("Edge target '" + edge.target + "' is not a node");
        }
    }
}

const Node& Graph::node(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw GraphError("Node '" + id + "' not found");
    }
    return nodes_[it->second];
}

bool Graph::contains(const std::string& id) const {
    return index_.find(id) != index_.end();
}

std::vector<std::string> Graph::parents_of(const std::string& id) const {
    std::vector<std::string> parents;
    for (const auto& edge : edges_) {
        if (edge.target == id) parents.push_back(edge.source);
    }
    return parents;
}

std::vector<std::string> Graph::children_of(const std::string& id) const {
    std::vector<std::string> children;
    for (const auto& edge : edges_) {
        if (edge.source == id) children.push_back(edge.target);
    }
    return children;
}

Ordering Graph::topological_order() const {
    // Calculate in-degrees
    std::unordered_map<std::string, size_t> in_degree;
    std::unordered_map<std::string, std::vector<std::string>> outs;
    for (const auto& node : nodes_) {
        in_degree[node.id] = 0;
    }
    for (const auto& edge : edges_) {
        in_degree[edge.target]++;
        outs[edge.source].push_back(edge.target);
    }

    // Kahn's algorithm
    std::deque<std::string> queue;
    for (const auto& node : nodes_) {
        if (in_degree[node.id] == 0) {
            queue.push_back(node.id);
        }
    }

    Ordering result;
    while (!queue.empty()) {
        std::string id = queue.front();
        queue.pop_front();
        result.ids.push_back(id);

        for (const auto& target : outs[id]) {
            if (--in_degree[target] == 0) {
                queue.push_back(target);
            }
        }
    }

    if (result.ids.size() != nodes_.size()) {
        spdlog::warn("Graph contains a cycle; falling back to input node order ({} of {} nodes sorted)",
                     result.ids.size(), nodes_.size());
        result.ids.clear();
        for (const auto& node : nodes_) {
            result.ids.push_back(node.id);
        }
        result.acyclic = false;
    }

    return result;
}

std::unordered_set<std::string> Graph::ancestors_of(const std::string& target) const {
    if (!contains(target)) {
        throw GraphError("Node '" + target + "' not found");
    }

    std::unordered_map<std::string, std::vector<std::string>> preds;
    for (const auto& edge : edges_) {
        preds[edge.target].push_back(edge.source);
    }

    std::unordered_set<std::string> keep;
    std::vector<std::string> stack{target};
    while (!stack.empty()) {
        std::string cur = stack.back();
        stack.pop_back();
        if (!keep.insert(cur).second) {
            continue;
        }
        for (const auto& p : preds[cur]) {
            stack.push_back(p);
        }
    }
    return keep;
}

Graph Graph::subgraph(const std::unordered_set<std::string>& keep) const {
    std::vector<Node> nodes;
    for (const auto& node : nodes_) {
        if (keep.count(node.id)) nodes.push_back(node);
    }
    std::vector<Edge> edges;
    for (const auto& edge : edges_) {
        if (keep.count(edge.source) && keep.count(edge.target)) edges.push_back(edge);
    }
    return Graph(std::move(nodes), std::move(edges));
}

void Graph::check_arity() const {
    std::unordered_map<std::string, size_t> in_count;
    for (const auto& edge : edges_) {
        in_count[edge.target]++;
    }

    for (const auto& node : nodes_) {
        size_t expected = node.expected_inputs();
        size_t actual = in_count[node.id];
        if (actual != expected) {
            throw GraphError(
                node.kind_string() + " node '" + node.id + "' expects " +
                std::to_string(expected) + " input(s), has " + std::to_string(actual));
        }
    }
}

std::string Graph::to_dot() const {
    std::ostringstream oss;
    oss << "digraph DAG {\n";
    oss << "  rankdir=LR;\n";
    oss << "  node [shape=box];\n";

    for (const auto& node : nodes_) {
        oss << "  \"" << node.id << "\" [label=\""
            << (node.label.empty() ? node.id : node.label) << "\\n"
            << node.kind_string() << "\"];\n";
    }
    for (const auto& edge : edges_) {
        oss << "  \"" << edge.source << "\" -> \"" << edge.target << "\";\n";
    }

    oss << "}\n";
    return oss.str();
}

} // namespace dag
} // namespace pipeforge
