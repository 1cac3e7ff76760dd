#include "pipeforge_ir/codegen/spark_lowerer.hpp"
#include <algorithm>

namespace pipeforge {
namespace codegen {

using expr::python_string_literal;

namespace {

std::string py_args(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += ", ";
        out += python_string_literal(items[i]);
    }
    return out;
}

std::string spark_type(const std::string& dtype) {
    if (dtype == "integer") return "bigint";
    if (dtype == "float") return "double";
    if (dtype == "boolean") return "boolean";
    return "string";
}

std::string ascending_keys(const std::vector<std::string>& keys) {
    std::string out;
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i) out += ", ";
        out += "F.col(" + python_string_literal(keys[i]) + ").asc_nulls_last()";
    }
    return out;
}

} // namespace

void SparkLowerer::begin(std::ostream& out) {
    out << "# Generated by pipeforge (PySpark)\n"
        << "from pyspark.sql import SparkSession, functions as F\n\n"
        << "spark = SparkSession.builder.appName(\"pipeforge\").getOrCreate()\n\n";
}

void SparkLowerer::finish(std::ostream& out, const std::optional<std::string>& last) {
    out << "result = " << (last ? *last : "spark.range(0).drop(\"id\")") << "\n";
}

void SparkLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::LoadSpec& spec) {
    out << ctx.name << " = spark.read.option(\"header\", True).option(\"inferSchema\", True).csv("
        << python_string_literal(spec.path) << ")\n\n";
}

void SparkLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::SelectSpec& spec) {
    if (spec.is_wildcard()) {
        out << ctx.name << " = " << ctx.input() << "\n";
    } else {
        out << ctx.name << " = " << ctx.input() << ".select(" << py_args(spec.columns) << ")\n";
    }
    for (const auto& cast : spec.schema) {
        std::string col = python_string_literal(cast.name);
        std::string expr = "F.col(" + col + ")";
        if (cast.dtype == "integer") expr += ".cast(\"double\")";
        expr += ".cast(\"" + spark_type(cast.dtype) + "\")";
        out << "if " << col << " in " << ctx.name << ".columns:\n"
            << "    " << ctx.name << " = " << ctx.name << ".withColumn(" << col << ", " << expr << ")\n";
    }
    out << "\n";
}

void SparkLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::FilterSpec& spec) {
    if (spec.expr.empty()) {
        out << ctx.name << " = " << ctx.input() << "\n\n";
        return;
    }
    out << ctx.name << " = " << ctx.input() << ".filter(" << spec.expr.as_python_literal() << ")\n\n";
}

void SparkLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::AggregateSpec& spec) {
    auto measures = spec.usable_measures();
    const std::string& p = ctx.input();

    std::string aggs;
    for (size_t i = 0; i < measures.size(); ++i) {
        check_operator_name(measures[i].op);
        if (i) aggs += ", ";
        aggs += "F." + measures[i].op + "(" + python_string_literal(measures[i].col) + ").alias(" +
                python_string_literal(measures[i].output_name()) + ")";
    }

    if (spec.group_by.empty()) {
        if (measures.empty()) {
            out << ctx.name << " = " << p << "\n\n";
        } else {
            out << ctx.name << " = " << p << ".agg(" << aggs << ")\n\n";
        }
        return;
    }

    std::string keys = py_args(spec.group_by);
    if (measures.empty()) {
        out << ctx.name << " = " << p << ".select(" << keys << ").distinct()";
    } else {
        out << ctx.name << " = " << p << ".groupBy(" << keys << ").agg(" << aggs << ")";
    }
    out << ".orderBy(" << ascending_keys(spec.group_by) << ")\n\n";
}

void SparkLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::DeriveSpec& spec) {
    out << ctx.name << " = " << ctx.input() << ".withColumn(" << python_string_literal(spec.new_col)
        << ", F.expr(" << spec.expr.as_python_literal() << "))\n\n";
}

void SparkLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::SortSpec& spec) {
    if (spec.keys.empty()) {
        out << ctx.name << " = " << ctx.input() << "\n\n";
        return;
    }
    out << ctx.name << " = " << ctx.input() << ".orderBy(";
    for (size_t i = 0; i < spec.keys.size(); ++i) {
        if (i) out << ", ";
        out << "F.col(" << python_string_literal(spec.keys[i].column) << ")."
            << (spec.keys[i].descending ? "desc_nulls_last()" : "asc_nulls_last()");
    }
    out << ")\n\n";
}

void SparkLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::SampleSpec& spec) {
    std::string seed = spec.seed ? std::to_string(*spec.seed) : "";
    if (spec.mode == dag::SampleSpec::Mode::FRACTION) {
        out << ctx.name << " = " << ctx.input() << ".sample(withReplacement=False, fraction="
            << python_float(spec.frac) << (spec.seed ? ", seed=" + seed : "") << ")\n\n";
    } else {
        out << ctx.name << " = " << ctx.input() << ".orderBy(F.rand(" << seed << ")).limit("
            << std::max<int64_t>(spec.n, 0) << ")\n\n";
    }
}

void SparkLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::JoinSpec& spec) {
    check_join_type(spec.how);
    auto pairs = spec.key_pairs();

    // Aliases keep the two sides apart even when both inputs are one frame
    std::string condition;
    std::vector<std::string> merged;
    for (size_t i = 0; i < pairs.size(); ++i) {
        if (i) condition += ", ";
        condition += "F.col(" + python_string_literal("lhs.`" + pairs[i].first + "`") + ") == F.col(" +
                     python_string_literal("rhs.`" + pairs[i].second + "`") + ")";
        if (pairs[i].first == pairs[i].second &&
            std::find(merged.begin(), merged.end(), pairs[i].first) == merged.end()) {
            merged.push_back(pairs[i].first);
        }
    }

    const std::string& left = ctx.input(0);
    const std::string& right = ctx.input(1);
    std::string keys = "[" + py_args(merged) + "]";

    out << ctx.name << " = " << left << ".alias(\"lhs\").join(" << right
        << ".alias(\"rhs\"), on=[" << condition << "], how=" << python_string_literal(spec.how) << ")\n";

    // merge layout: left columns in place (shared keys coalesced), then the
    // remaining right columns; other clashing names get _x / _y
    out << ctx.name << " = " << ctx.name << ".select(\n"
        << "    *[(F.coalesce(F.col(\"lhs.`\" + c + \"`\"), F.col(\"rhs.`\" + c + \"`\")) if c in " << keys
        << " else F.col(\"lhs.`\" + c + \"`\"))\n"
        << "      .alias(c + \"_x\" if c in " << right << ".columns and c not in " << keys << " else c)\n"
        << "      for c in " << left << ".columns],\n"
        << "    *[F.col(\"rhs.`\" + c + \"`\").alias(c + \"_y\" if c in " << left << ".columns else c)\n"
        << "      for c in " << right << ".columns if c not in " << keys << "])\n\n";
}

void SparkLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::WriteSpec& spec) {
    out << ctx.input() << ".write.mode(\"overwrite\").option(\"header\", True).csv("
        << python_string_literal(spec.path) << ")\n"
        << ctx.name << " = " << ctx.input() << "\n\n";
}

void SparkLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::PassthroughSpec& spec) {
    out << "# UNSUPPORTED node kind " << python_string_literal(spec.kind) << ", copied through\n"
        << ctx.name << " = " << ctx.input() << "\n\n";
}

} // namespace codegen
} // namespace pipeforge
