#include "pipeforge_ir/codegen/sql_lowerer.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace pipeforge {
namespace codegen {

using expr::sql_identifier;
using expr::sql_string_literal;

namespace {

void create_view(std::ostream& out, const std::string& name, const std::string& body) {
    out << "CREATE OR REPLACE TEMP VIEW " << sql_identifier(name) << " AS " << body << ";\n";
}

std::string identifier_list(const std::vector<std::string>& names, const std::string& suffix = "") {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i) out += ", ";
        out += sql_identifier(names[i]) + suffix;
    }
    return out;
}

std::string cast_expression(const dag::ColumnCast& cast) {
    std::string col = sql_identifier(cast.name);
    if (cast.dtype == "integer") return "TRY_CAST(TRUNC(TRY_CAST(" + col + " AS DOUBLE)) AS BIGINT)";
    if (cast.dtype == "float") return "TRY_CAST(" + col + " AS DOUBLE)";
    if (cast.dtype == "boolean") return "TRY_CAST(" + col + " AS BOOLEAN)";
    return "CAST(" + col + " AS VARCHAR)";
}

// Last cast naming the column wins
const dag::ColumnCast* find_cast(const dag::SelectSpec& spec, const std::string& column) {
    const dag::ColumnCast* found = nullptr;
    for (const auto& cast : spec.schema) {
        if (cast.name == column) found = &cast;
    }
    return found;
}

std::string join_keyword(const std::string& how) {
    if (how == "left") return "LEFT JOIN";
    if (how == "right") return "RIGHT JOIN";
    if (how == "outer") return "FULL OUTER JOIN";
    return "INNER JOIN";
}

} // namespace

void SqlLowerer::begin(std::ostream& out) {
    out << "-- Generated by pipeforge (DuckDB SQL)\n";
}

void SqlLowerer::finish(std::ostream& out, const std::optional<std::string>& last) {
    if (!last) {
        out << "-- empty pipeline\n";
        return;
    }
    out << "SELECT * FROM " << sql_identifier(*last) << ";\n";
}

void SqlLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::LoadSpec& spec) {
    create_view(out, ctx.name, "SELECT * FROM read_csv_auto(" + sql_string_literal(spec.path) + ", header=true)");
}

void SqlLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::SelectSpec& spec) {
    std::string from = " FROM " + sql_identifier(ctx.input());

    if (spec.is_wildcard()) {
        if (spec.schema.empty()) {
            create_view(out, ctx.name, "SELECT *" + from);
            return;
        }
        std::vector<std::string> seen;
        std::string replace;
        for (auto it = spec.schema.rbegin(); it != spec.schema.rend(); ++it) {
            if (std::find(seen.begin(), seen.end(), it->name) != seen.end()) continue;
            seen.push_back(it->name);
            if (!replace.empty()) replace += ", ";
            replace += cast_expression(*it) + " AS " + sql_identifier(it->name);
        }
        create_view(out, ctx.name, "SELECT * REPLACE (" + replace + ")" + from);
        return;
    }

    std::string list;
    for (size_t i = 0; i < spec.columns.size(); ++i) {
        if (i) list += ", ";
        const auto* cast = find_cast(spec, spec.columns[i]);
        list += cast ? cast_expression(*cast) + " AS " + sql_identifier(spec.columns[i])
                     : sql_identifier(spec.columns[i]);
    }
    create_view(out, ctx.name, "SELECT " + list + from);
}

void SqlLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::FilterSpec& spec) {
    std::string body = "SELECT * FROM " + sql_identifier(ctx.input());
    if (!spec.expr.empty()) {
        body += " WHERE " + spec.expr.as_sql();
    }
    create_view(out, ctx.name, body);
}

void SqlLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::AggregateSpec& spec) {
    auto measures = spec.usable_measures();
    std::string from = " FROM " + sql_identifier(ctx.input());

    std::vector<std::string> parts;
    for (const auto& key : spec.group_by) {
        parts.push_back(sql_identifier(key));
    }
    for (const auto& m : measures) {
        check_operator_name(m.op);
        parts.push_back(m.op + "(" + sql_identifier(m.col) + ") AS " + sql_identifier(m.output_name()));
    }

    if (parts.empty()) {
        create_view(out, ctx.name, "SELECT *" + from);
        return;
    }

    std::string select = "SELECT ";
    if (measures.empty()) select += "DISTINCT ";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) select += ", ";
        select += parts[i];
    }
    std::string body = select + from;

    if (!spec.group_by.empty()) {
        if (!measures.empty()) {
            body += " GROUP BY " + identifier_list(spec.group_by);
        }
        body += " ORDER BY " + identifier_list(spec.group_by, " ASC NULLS LAST");
    }
    create_view(out, ctx.name, body);
}

void SqlLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::DeriveSpec& spec) {
    create_view(out, ctx.name, "SELECT *, (" + spec.expr.as_sql() + ") AS " + sql_identifier(spec.new_col) +
                               " FROM " + sql_identifier(ctx.input()));
}

void SqlLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::SortSpec& spec) {
    std::string body = "SELECT * FROM " + sql_identifier(ctx.input());
    if (!spec.keys.empty()) {
        body += " ORDER BY ";
        for (size_t i = 0; i < spec.keys.size(); ++i) {
            if (i) body += ", ";
            body += sql_identifier(spec.keys[i].column) +
                    (spec.keys[i].descending ? " DESC NULLS LAST" : " ASC NULLS LAST");
        }
    }
    create_view(out, ctx.name, body);
}

void SqlLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::SampleSpec& spec) {
    std::string body = "SELECT * FROM " + sql_identifier(ctx.input()) + " USING SAMPLE ";
    if (spec.mode == dag::SampleSpec::Mode::FRACTION) {
        body += fmt::format("{} PERCENT (bernoulli", spec.frac * 100.0);
        if (spec.seed) body += ", " + std::to_string(*spec.seed);
        body += ")";
    } else {
        body += "reservoir(" + std::to_string(std::max<int64_t>(spec.n, 0)) + " ROWS)";
        if (spec.seed) body += " REPEATABLE (" + std::to_string(*spec.seed) + ")";
    }
    create_view(out, ctx.name, body);
}

void SqlLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::JoinSpec& spec) {
    check_join_type(spec.how);
    auto pairs = spec.key_pairs();

    std::string from = " FROM " + sql_identifier(ctx.input(0)) + " AS lhs " + join_keyword(spec.how) +
                       " " + sql_identifier(ctx.input(1)) + " AS rhs";

    bool same_names = std::all_of(pairs.begin(), pairs.end(),
                                  [](const auto& p) { return p.first == p.second; });
    if (same_names) {
        // USING merges each key into one output column
        std::vector<std::string> keys;
        for (const auto& pair : pairs) {
            if (std::find(keys.begin(), keys.end(), pair.first) == keys.end()) keys.push_back(pair.first);
        }
        create_view(out, ctx.name, "SELECT *" + from + " USING (" + identifier_list(keys) + ")");
        return;
    }

    std::vector<std::string> merged;
    std::string condition;
    for (size_t i = 0; i < pairs.size(); ++i) {
        if (i) condition += " AND ";
        condition += "lhs." + sql_identifier(pairs[i].first) + " = rhs." + sql_identifier(pairs[i].second);
        if (pairs[i].first == pairs[i].second &&
            std::find(merged.begin(), merged.end(), pairs[i].first) == merged.end()) {
            merged.push_back(pairs[i].first);
        }
    }

    std::string select = "SELECT lhs.*, rhs.*";
    if (!merged.empty()) {
        select += " EXCLUDE (" + identifier_list(merged) + ")";
    }
    create_view(out, ctx.name, select + from + " ON " + condition);
}

void SqlLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::WriteSpec& spec) {
    create_view(out, ctx.name, "SELECT * FROM " + sql_identifier(ctx.input()));
    out << "COPY (SELECT * FROM " << sql_identifier(ctx.name) << ") TO " << sql_string_literal(spec.path)
        << " (HEADER, DELIMITER ',');\n";
}

void SqlLowerer::emit(std::ostream& out, const LoweringContext& ctx, const dag::PassthroughSpec& spec) {
    out << "-- UNSUPPORTED node kind " << expr::python_string_literal(spec.kind) << ", copied through\n";
    create_view(out, ctx.name, "SELECT * FROM " + sql_identifier(ctx.input()));
}

} // namespace codegen
} // namespace pipeforge
