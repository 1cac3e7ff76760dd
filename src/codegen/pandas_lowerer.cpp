#include "pipeforge_ir/codegen/pandas_lowerer.hpp"

namespace pipeforge {
namespace codegen {

using expr::python_string_literal;

namespace {

std::string py_list(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += ", ";
        out += python_string_literal(items[i]);
    }
    return out + "]";
}

std::string column_ref(const std::string& frame, const std::string& column) {
    return frame + "[" + python_string_literal(column) + "]";
}

std::string cast_expression(const std::string& frame, const dag::ColumnCast& cast) {
    std::string col = column_ref(frame, cast.name);
    if (cast.dtype == "integer") {
        // truncate toward zero, unparsable -> <NA>
        return "pd.to_numeric(" + col + ", errors=\"coerce\").map(lambda x: x if x != x else float(int(x))).astype(\"Int64\")";
    }
    if (cast.dtype == "float") {
        return "pd.to_numeric(" + col + ", errors=\"coerce\").astype(\"float64\")";
    }
    if (cast.dtype == "boolean") {
        return col + ".astype(\"boolean\")";
    }
    return col + ".astype(\"string\")";
}

std::string seed_literal(const dag::SampleSpec& spec) {
    return spec.seed ? std::to_string(*spec.seed) : "None";
}

} // namespace

void PandasLowerer::begin(std::ostream& out) {
    out << "# Generated by pipeforge (pandas)\n"
        << "import pandas as pd\n\n";
}

void PandasLowerer::finish(std::ostream& out, const std::optional<std::string>& last) {
    out << "result = " << (last ? *last : "pd.DataFrame()") << "\n";
}

void PandasLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::LoadSpec& spec) {
    out << ctx.name << " = pd.read_csv(" << python_string_literal(spec.path) << ")\n\n";
}

void PandasLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::SelectSpec& spec) {
    if (spec.is_wildcard()) {
        out << ctx.name << " = " << ctx.input() << ".copy()\n";
    } else {
        out << ctx.name << " = " << ctx.input() << "[" << py_list(spec.columns) << "].copy()\n";
    }
    for (const auto& cast : spec.schema) {
        out << "if " << python_string_literal(cast.name) << " in " << ctx.name << ".columns:\n"
            << "    " << column_ref(ctx.name, cast.name) << " = " << cast_expression(ctx.name, cast) << "\n";
    }
    out << "\n";
}

void PandasLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::FilterSpec& spec) {
    if (spec.expr.empty()) {
        out << ctx.name << " = " << ctx.input() << ".copy()\n\n";
        return;
    }
    out << ctx.name << " = " << ctx.input() << ".query(" << spec.expr.as_python_literal() << ")\n\n";
}

void PandasLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::AggregateSpec& spec) {
    auto measures = spec.usable_measures();
    for (const auto& m : measures) {
        check_operator_name(m.op);
    }

    const std::string& p = ctx.input();
    if (spec.group_by.empty() && measures.empty()) {
        out << ctx.name << " = " << p << ".copy()\n\n";
        return;
    }

    if (spec.group_by.empty()) {
        out << ctx.name << " = pd.DataFrame({";
        for (size_t i = 0; i < measures.size(); ++i) {
            if (i) out << ", ";
            out << python_string_literal(measures[i].output_name()) << ": ["
                << column_ref(p, measures[i].col) << ".agg(" << python_string_literal(measures[i].op) << ")]";
        }
        out << "})\n\n";
        return;
    }

    std::string keys = py_list(spec.group_by);
    if (measures.empty()) {
        out << ctx.name << " = " << p << "[" << keys << "].drop_duplicates()"
            << ".sort_values(" << keys << ", kind=\"stable\", na_position=\"last\")"
            << ".reset_index(drop=True)\n\n";
        return;
    }

    out << ctx.name << " = " << p << ".groupby(" << keys << ", sort=True, dropna=False).agg(**{";
    for (size_t i = 0; i < measures.size(); ++i) {
        if (i) out << ", ";
        out << python_string_literal(measures[i].output_name()) << ": ("
            << python_string_literal(measures[i].col) << ", " << python_string_literal(measures[i].op) << ")";
    }
    out << "}).reset_index()\n\n";
}

void PandasLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::DeriveSpec& spec) {
    out << ctx.name << " = " << ctx.input() << ".copy()\n"
        << column_ref(ctx.name, spec.new_col) << " = " << ctx.name << ".eval("
        << spec.expr.as_python_literal() << ", engine=\"python\")\n\n";
}

void PandasLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::SortSpec& spec) {
    if (spec.keys.empty()) {
        out << ctx.name << " = " << ctx.input() << ".copy()\n\n";
        return;
    }

    std::vector<std::string> columns;
    std::string ascending = "[";
    for (size_t i = 0; i < spec.keys.size(); ++i) {
        columns.push_back(spec.keys[i].column);
        if (i) ascending += ", ";
        ascending += spec.keys[i].descending ? "False" : "True";
    }
    ascending += "]";

    out << ctx.name << " = " << ctx.input() << ".sort_values(" << py_list(columns)
        << ", ascending=" << ascending << ", kind=\"stable\", na_position=\"last\")\n\n";
}

void PandasLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::SampleSpec& spec) {
    const std::string& p = ctx.input();
    if (spec.mode == dag::SampleSpec::Mode::FRACTION) {
        out << ctx.name << " = " << p << ".sample(frac=" << python_float(spec.frac)
            << ", random_state=" << seed_literal(spec) << ")\n\n";
    } else {
        out << ctx.name << " = " << p << ".sample(n=min(" << spec.n << ", len(" << p << "))"
            << ", random_state=" << seed_literal(spec) << ")\n\n";
    }
}

void PandasLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::JoinSpec& spec) {
    check_join_type(spec.how);

    std::vector<std::string> left, right;
    for (const auto& pair : spec.key_pairs()) {
        left.push_back(pair.first);
        right.push_back(pair.second);
    }

    out << ctx.name << " = " << ctx.input(0) << ".merge(" << ctx.input(1)
        << ", how=" << python_string_literal(spec.how)
        << ", left_on=" << py_list(left)
        << ", right_on=" << py_list(right) << ")\n\n";
}

void PandasLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::WriteSpec& spec) {
    out << ctx.input() << ".to_csv(" << python_string_literal(spec.path) << ", index=False)\n"
        << ctx.name << " = " << ctx.input() << "\n\n";
}

void PandasLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::PassthroughSpec& spec) {
    out << "# UNSUPPORTED node kind " << python_string_literal(spec.kind) << ", copied through\n"
        << ctx.name << " = " << ctx.input() << ".copy()\n\n";
}

} // namespace codegen
} // namespace pipeforge
