#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "pipeforge_ir/engine.hpp"
#include "pipeforge_ir/columnar/table.hpp"
#include "pipeforge_ir/columnar/value.hpp"
#include "pipeforge_ir/dag/graph.hpp"
#include "pipeforge_ir/dag/node.hpp"
#include "pipeforge_ir/runtime/python_runtime.hpp"

#include <algorithm>
#include <cctype>
#include <memory>

namespace py = pybind11;
using namespace pipeforge;

namespace {

// Request conversion: {"id": ..., "data": {"type": ..., ...}} -> dag::Node

bool blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    return s.substr(b, s.find_last_not_of(" \t\r\n") - b + 1);
}

std::string lowered(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// String form of a field; lists are joined with ","
std::optional<std::string> text_field(const py::dict& data, const char* key) {
    if (!data.contains(key)) return std::nullopt;
    py::object value = data[key];
    if (value.is_none()) return std::nullopt;
    if (py::isinstance<py::str>(value)) return value.cast<std::string>();
    if (py::isinstance<py::list>(value) || py::isinstance<py::tuple>(value)) {
        std::vector<std::string> items;
        for (auto item : value) items.push_back(py::str(item).cast<std::string>());
        return dag::join_list(items);
    }
    return py::str(value).cast<std::string>();
}

// Missing, None and blank strings fall back
std::string text_or(const py::dict& data, const char* key, const std::string& fallback) {
    auto value = text_field(data, key);
    return value && !blank(*value) ? *value : fallback;
}

bool present(const py::dict& data, const char* key) {
    if (!data.contains(key)) return false;
    py::object value = data[key];
    if (value.is_none()) return false;
    return !py::isinstance<py::str>(value) || !blank(value.cast<std::string>());
}

py::dict dict_field(const py::handle& obj, const char* key) {
    py::dict d = py::reinterpret_borrow<py::dict>(obj);
    if (!d.contains(key) || d[key].is_none()) return py::dict();
    py::object value = d[key];
    if (!py::isinstance<py::dict>(value)) {
        throw py::type_error(std::string("'") + key + "' must be a dict");
    }
    return value.cast<py::dict>();
}

std::vector<dag::Measure> parse_measures(const py::dict& data) {
    std::vector<dag::Measure> measures;
    if (!present(data, "measures")) return measures;
    for (auto item : data["measures"]) {
        if (!py::isinstance<py::dict>(item)) continue;
        py::dict m = py::reinterpret_borrow<py::dict>(item);
        dag::Measure measure;
        measure.col = text_or(m, "col", "");
        measure.op = text_or(m, "op", "");
        measure.alias = text_or(m, "as", text_or(m, "alias", ""));
        measures.push_back(measure);
    }
    return measures;
}

std::vector<dag::ColumnCast> parse_schema(const py::dict& data) {
    std::vector<dag::ColumnCast> schema;
    if (!present(data, "schema")) return schema;
    for (auto item : data["schema"]) {
        if (!py::isinstance<py::dict>(item)) continue;
        py::dict s = py::reinterpret_borrow<py::dict>(item);
        dag::ColumnCast cast;
        cast.name = trim(text_or(s, "name", ""));
        cast.dtype = lowered(trim(text_or(s, "dtype", "string")));
        if (!cast.name.empty()) schema.push_back(cast);
    }
    return schema;
}

dag::Payload parse_payload(const std::string& type, const py::dict& data) {
    switch (dag::parse_kind(type)) {
        case dag::NodeKind::LOAD: {
            dag::LoadSpec spec;
            spec.path = text_or(data, "path", spec.path);
            if (data.contains("_fileText")) {
                py::object text = data["_fileText"];
                if (py::isinstance<py::str>(text)) spec.inline_text = text.cast<std::string>();
            }
            return spec;
        }
        case dag::NodeKind::SELECT: {
            dag::SelectSpec spec = dag::SelectSpec::parse(text_or(data, "columns", "*"));
            spec.schema = parse_schema(data);
            return spec;
        }
        case dag::NodeKind::FILTER:
            return dag::FilterSpec{expr::PassthroughExpr(text_or(data, "expr", ""))};
        case dag::NodeKind::AGGREGATE: {
            dag::AggregateSpec spec;
            spec.group_by = dag::split_list(text_or(data, "groupBy", ""));
            spec.measures = parse_measures(data);
            return spec;
        }
        case dag::NodeKind::DERIVE: {
            dag::DeriveSpec spec;
            spec.new_col = text_or(data, "newCol", spec.new_col);
            spec.expr = expr::PassthroughExpr(text_or(data, "expr", "0"));
            return spec;
        }
        case dag::NodeKind::SORT:
            return dag::SortSpec::parse(text_or(data, "sortSpec", ""));
        case dag::NodeKind::SAMPLE: {
            dag::SampleSpec spec;
            if (lowered(text_or(data, "mode", "rows")) == "fraction") {
                spec.mode = dag::SampleSpec::Mode::FRACTION;
            }
            if (present(data, "n")) spec.n = py::int_(py::object(data["n"])).cast<int64_t>();
            if (present(data, "frac")) spec.frac = py::float_(py::object(data["frac"])).cast<double>();
            if (present(data, "seed")) spec.seed = py::int_(py::object(data["seed"])).cast<uint64_t>();
            return spec;
        }
        case dag::NodeKind::JOIN: {
            dag::JoinSpec spec;
            spec.how = lowered(text_or(data, "how", spec.how));
            auto left = dag::split_list(text_or(data, "leftKeys", text_or(data, "left_on", "id")));
            auto right = dag::split_list(text_or(data, "rightKeys", text_or(data, "right_on", "id")));
            spec.left_keys = left.empty() ? std::vector<std::string>{"id"} : left;
            spec.right_keys = right.empty() ? std::vector<std::string>{"id"} : right;
            return spec;
        }
        case dag::NodeKind::WRITE: {
            dag::WriteSpec spec;
            spec.path = text_or(data, "path", spec.path);
            return spec;
        }
        case dag::NodeKind::UNKNOWN:
            break;
    }
    return dag::PassthroughSpec{type};
}

dag::Node node_from_request(const py::handle& item) {
    if (!py::isinstance<py::dict>(item)) {
        throw py::type_error("Each node must be a dict");
    }
    py::dict obj = py::reinterpret_borrow<py::dict>(item);
    if (!obj.contains("id")) {
        throw py::value_error("Node without an 'id'");
    }
    py::dict data = dict_field(obj, "data");

    dag::Node node;
    node.id = py::str(obj["id"]).cast<std::string>();
    node.label = text_or(data, "label", "node");
    node.payload = parse_payload(text_or(data, "type", ""), data);
    return node;
}

std::vector<dag::Node> nodes_from_request(const py::list& nodes) {
    std::vector<dag::Node> out;
    for (auto item : nodes) out.push_back(node_from_request(item));
    return out;
}

dag::Graph graph_from_request(const py::list& nodes, const py::list& edges) {
    std::vector<dag::Edge> out;
    for (auto item : edges) {
        if (!py::isinstance<py::dict>(item)) {
            throw py::type_error("Each edge must be a dict");
        }
        py::dict e = py::reinterpret_borrow<py::dict>(item);
        out.push_back({py::str(e["source"]).cast<std::string>(), py::str(e["target"]).cast<std::string>()});
    }
    return dag::Graph(nodes_from_request(nodes), std::move(out));
}

// Response conversion

py::dict data_to_request(const dag::Node& node) {
    py::dict data;
    data["type"] = node.kind_string();
    data["label"] = node.label;

    std::visit([&](const auto& spec) {
        using T = std::decay_t<decltype(spec)>;
        if constexpr (std::is_same_v<T, dag::LoadSpec>) {
            data["path"] = spec.path;
            if (spec.inline_text) data["_fileText"] = *spec.inline_text;
        } else if constexpr (std::is_same_v<T, dag::SelectSpec>) {
            data["columns"] = spec.is_wildcard() ? std::string("*") : dag::join_list(spec.columns);
            py::list schema;
            for (const auto& cast : spec.schema) {
                py::dict c;
                c["name"] = cast.name;
                c["dtype"] = cast.dtype;
                schema.append(c);
            }
            if (!spec.schema.empty()) data["schema"] = schema;
        } else if constexpr (std::is_same_v<T, dag::FilterSpec>) {
            data["expr"] = spec.expr.text();
        } else if constexpr (std::is_same_v<T, dag::AggregateSpec>) {
            data["groupBy"] = dag::join_list(spec.group_by);
            py::list measures;
            for (const auto& m : spec.measures) {
                py::dict d;
                d["col"] = m.col;
                d["op"] = m.op;
                if (!m.alias.empty()) d["as"] = m.alias;
                measures.append(d);
            }
            data["measures"] = measures;
        } else if constexpr (std::is_same_v<T, dag::DeriveSpec>) {
            data["newCol"] = spec.new_col;
            data["expr"] = spec.expr.text();
        } else if constexpr (std::is_same_v<T, dag::SortSpec>) {
            std::vector<std::string> tokens;
            for (const auto& key : spec.keys) {
                tokens.push_back(key.column + (key.descending ? " desc" : ""));
            }
            data["sortSpec"] = dag::join_list(tokens);
        } else if constexpr (std::is_same_v<T, dag::SampleSpec>) {
            data["mode"] = spec.mode == dag::SampleSpec::Mode::FRACTION ? "fraction" : "rows";
            data["n"] = spec.n;
            data["frac"] = spec.frac;
            if (spec.seed) data["seed"] = *spec.seed;
        } else if constexpr (std::is_same_v<T, dag::JoinSpec>) {
            data["how"] = spec.how;
            data["left_on"] = dag::join_list(spec.left_keys);
            data["right_on"] = dag::join_list(spec.right_keys);
        } else if constexpr (std::is_same_v<T, dag::WriteSpec>) {
            data["path"] = spec.path;
        }
    }, node.payload);
    return data;
}

py::object value_to_python(const columnar::Value& value) {
    return std::visit([](const auto& v) -> py::object {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return py::none();
        } else {
            return py::cast(v);
        }
    }, value);
}

// First max_rows rows as records
py::list preview_records(const columnar::Table& table, size_t max_rows) {
    py::list records;
    auto names = table.column_names();
    size_t rows = std::min(table.num_rows(), max_rows);
    for (size_t r = 0; r < rows; ++r) {
        py::dict record;
        for (const auto& name : names) {
            record[py::str(name)] = value_to_python(table.get_column(name)->value_at(r));
        }
        records.append(record);
    }
    return records;
}

py::dict table_response(const columnar::Table& table, size_t max_rows) {
    py::dict out;
    out["columns"] = table.column_names();
    out["rows"] = table.num_rows();
    out["preview"] = preview_records(table, max_rows);
    return out;
}

std::optional<std::string> optional_id(const py::object& id) {
    if (id.is_none()) return std::nullopt;
    return py::str(id).cast<std::string>();
}

// Module-wide engine, rebuilt by configure(). Calls that release the GIL
// keep their own reference to the engine they started on.
SharedEngine& module_engine() {
    static SharedEngine engine([] {
        EngineOptions options = EngineOptions::from_env();
        options.apply_log_level();
        runtime::RuntimeRegistry runtimes;
        runtime::register_python_runtimes(runtimes, options.spark_app_name);
        return std::make_shared<Engine>(options, std::move(runtimes));
    });
    return engine;
}

std::shared_ptr<Engine> engine() {
    return module_engine().get();
}

} // namespace

PYBIND11_MODULE(pypipeforge, m) {
    m.doc() = "pipeforge - ETL pipeline IR: lowering to pandas, DuckDB SQL and PySpark, "
              "ground-truth interpretation and differential validation";

    // Error types surface as Python exceptions
    py::register_exception<dag::GraphError>(m, "GraphError", PyExc_ValueError);
    py::register_exception<codegen::LoweringError>(m, "LoweringError", PyExc_ValueError);
    py::register_exception<runtime::BackendError>(m, "BackendError", PyExc_RuntimeError);

    m.def("configure",
          [](py::object sample_limit, py::object optimizer_passes, py::object staging_root,
             py::object spark_app_name, py::object log_level) {
              EngineOptions options = EngineOptions::from_env();
              if (!sample_limit.is_none()) options.sample_limit = sample_limit.cast<size_t>();
              if (!optimizer_passes.is_none()) options.optimizer_passes = optimizer_passes.cast<int>();
              if (!staging_root.is_none()) options.staging_root = staging_root.cast<std::string>();
              if (!spark_app_name.is_none()) options.spark_app_name = spark_app_name.cast<std::string>();
              if (!log_level.is_none()) options.log_level = log_level.cast<std::string>();
              if (options.sample_limit == 0 || options.optimizer_passes <= 0) {
                  throw py::value_error("sample_limit and optimizer_passes must be positive");
              }
              options.apply_log_level();

              runtime::RuntimeRegistry runtimes;
              runtime::register_python_runtimes(runtimes, options.spark_app_name);
              module_engine().reset(std::make_shared<Engine>(options, std::move(runtimes)));
          },
          py::arg("sample_limit") = py::none(), py::arg("optimizer_passes") = py::none(),
          py::arg("staging_root") = py::none(), py::arg("spark_app_name") = py::none(),
          py::arg("log_level") = py::none());

    m.def("compile",
          [](const py::list& nodes, const py::list& edges, const std::string& lang) {
              return engine()->compile(graph_from_request(nodes, edges), lang);
          },
          py::arg("nodes"), py::arg("edges"), py::arg("lang"));

    m.def("optimize",
          [](const py::list& nodes, const py::list& edges, py::object target_id, py::object max_passes) {
              std::optional<int> passes;
              if (!max_passes.is_none()) passes = max_passes.cast<int>();
              dag::Graph optimized = engine()->optimize(graph_from_request(nodes, edges),
                                                       optional_id(target_id), passes);
              py::list out_nodes;
              for (const auto& node : optimized.nodes()) {
                  py::dict n;
                  n["id"] = node.id;
                  n["data"] = data_to_request(node);
                  out_nodes.append(n);
              }
              py::list out_edges;
              for (const auto& edge : optimized.edges()) {
                  py::dict e;
                  e["source"] = edge.source;
                  e["target"] = edge.target;
                  out_edges.append(e);
              }
              py::dict out;
              out["nodes"] = out_nodes;
              out["edges"] = out_edges;
              return out;
          },
          py::arg("nodes"), py::arg("edges"), py::arg("target_id") = py::none(),
          py::arg("max_passes") = py::none());

    m.def("interpret",
          [](const py::list& nodes, const py::list& edges, py::object preview_id) {
              auto e = engine();
              exec::RunResult result = e->interpret(graph_from_request(nodes, edges), optional_id(preview_id));
              py::dict out = table_response(*result.table, e->options().sample_limit);
              out["node_errors"] = result.node_errors;
              return out;
          },
          py::arg("nodes"), py::arg("edges"), py::arg("preview_id") = py::none());

    m.def("validate",
          [](const py::list& nodes, const py::list& edges, const std::string& lang, py::object preview_id) {
              dag::Graph graph = graph_from_request(nodes, edges);
              auto preview = optional_id(preview_id);
              auto e = engine();
              validate::ValidationResult result;
              {
                  // Backend runtimes take the GIL themselves
                  py::gil_scoped_release release;
                  result = e->validate(graph, lowered(lang), preview);
              }
              py::dict out;
              out["lang"] = result.lang;
              out["valid"] = result.valid;
              out["reason"] = result.reason;
              return out;
          },
          py::arg("nodes"), py::arg("edges"), py::arg("lang"), py::arg("preview_id") = py::none());

    m.def("execute_user_text",
          [](const std::string& lang, const std::string& code, const py::list& nodes) {
              auto e = engine();
              auto request_nodes = nodes_from_request(nodes);
              std::shared_ptr<columnar::Table> table;
              {
                  py::gil_scoped_release release;
                  table = e->execute_user_text(lowered(lang), code, request_nodes);
              }
              return table_response(*table, e->options().sample_limit);
          },
          py::arg("lang"), py::arg("code"), py::arg("nodes") = py::list());

    m.def("version", []() { return "0.1.0"; });
}
