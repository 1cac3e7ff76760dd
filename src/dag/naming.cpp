#include "pipeforge_ir/dag/naming.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace pipeforge {
namespace dag {

namespace {

// Names the generated programs bind themselves
const std::unordered_set<std::string> kReservedNames = {"result", "spark", "pd", "F"};

} // namespace

std::string sanitize_label(const std::string& label) {
    std::string out;
    bool pending_underscore = false;

    for (unsigned char c : label) {
        if (std::isalnum(c)) {
            if (pending_underscore && !out.empty()) {
                out.push_back('_');
            }
            pending_underscore = false;
            out.push_back(static_cast<char>(std::tolower(c)));
        } else {
            pending_underscore = true;
        }
    }

    if (out.empty()) {
        return "node";
    }
    if (std::isdigit(static_cast<unsigned char>(out[0]))) {
        out = "n_" + out;
    }
    return out;
}

NameTable assign_names(const Graph& graph, const std::vector<std::string>& order) {
    NameTable names;
    std::unordered_set<std::string> taken(kReservedNames);
    std::unordered_map<std::string, int> counts;

    for (const auto& id : order) {
        std::string base = sanitize_label(graph.node(id).label);
        int& seen = counts[base];

        std::string name = base;
        if (seen == 0 && !taken.count(base)) {
            seen = 1;
        } else {
            // base itself counts as the first occurrence
            seen = std::max(seen, 1);
            do {
                name = base + "_" + std::to_string(++seen);
            } while (taken.count(name));
        }

        taken.insert(name);
        names[id] = name;
    }
    return names;
}

} // namespace dag
} // namespace pipeforge
