#include "pipeforge_ir/dag/node.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>

namespace pipeforge {
namespace dag {

static_assert(std::variant_size_v<Payload> == static_cast<size_t>(NodeKind::UNKNOWN) + 1,
              "Payload alternatives must line up with NodeKind");

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

NodeKind parse_kind(const std::string& kind) {
    static const std::unordered_map<std::string, NodeKind> kKinds = {
        {"source.load", NodeKind::LOAD},
        {"source.csv", NodeKind::LOAD},
        {"transform.select", NodeKind::SELECT},
        {"transform.filter", NodeKind::FILTER},
        {"transform.aggregate", NodeKind::AGGREGATE},
        {"transform.summarize", NodeKind::AGGREGATE},
        {"transform.derive", NodeKind::DERIVE},
        {"transform.formula", NodeKind::DERIVE},
        {"transform.sort", NodeKind::SORT},
        {"transform.sample", NodeKind::SAMPLE},
        {"transform.join", NodeKind::JOIN},
        {"sink.write", NodeKind::WRITE},
        {"sink.csv", NodeKind::WRITE},
    };
    auto it = kKinds.find(kind);
    return it == kKinds.end() ? NodeKind::UNKNOWN : it->second;
}

std::string kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::LOAD: return "source.load";
        case NodeKind::SELECT: return "transform.select";
        case NodeKind::FILTER: return "transform.filter";
        case NodeKind::AGGREGATE: return "transform.aggregate";
        case NodeKind::DERIVE: return "transform.derive";
        case NodeKind::SORT: return "transform.sort";
        case NodeKind::SAMPLE: return "transform.sample";
        case NodeKind::JOIN: return "transform.join";
        case NodeKind::WRITE: return "sink.write";
        case NodeKind::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

std::string join_list(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += ",";
        out += items[i];
    }
    return out;
}

SelectSpec SelectSpec::parse(const std::string& columns) {
    SelectSpec spec;
    std::string trimmed = trim(columns);
    if (!trimmed.empty() && trimmed != "*") {
        spec.columns = split_list(trimmed);
    }
    return spec;
}

std::vector<Measure> AggregateSpec::usable_measures() const {
    std::vector<Measure> out;
    for (const auto& m : measures) {
        if (!m.col.empty() && !m.op.empty()) {
            out.push_back(m);
        }
    }
    return out;
}

SortSpec SortSpec::parse(const std::string& spec) {
    SortSpec out;
    for (const auto& token : split_list(spec)) {
        std::istringstream words(token);
        SortKey key;
        words >> key.column;
        std::string last, word;
        while (words >> word) last = word;
        key.descending = lower(last) == "desc";
        out.keys.push_back(key);
    }
    return out;
}

std::vector<std::pair<std::string, std::string>> JoinSpec::key_pairs() const {
    std::vector<std::pair<std::string, std::string>> pairs;
    if (right_keys.empty()) {
        throw GraphError("transform.join needs at least one right key");
    }
    for (size_t i = 0; i < left_keys.size(); ++i) {
        pairs.emplace_back(left_keys[i], right_keys[i < right_keys.size() ? i : 0]);
    }
    return pairs;
}

NodeKind Node::kind() const {
    return static_cast<NodeKind>(payload.index());
}

std::string Node::kind_string() const {
    if (auto p = std::get_if<PassthroughSpec>(&payload)) {
        return p->kind;
    }
    return kind_name(kind());
}

size_t Node::expected_inputs() const {
    switch (kind()) {
        case NodeKind::LOAD: return 0;
        case NodeKind::JOIN: return 2;
        default: return 1;
    }
}

} // namespace dag
} // namespace pipeforge
