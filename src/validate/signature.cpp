#include "pipeforge_ir/validate/signature.hpp"
#include "pipeforge_ir/columnar/csv.hpp"
#include <fmt/format.h>

namespace pipeforge {
namespace validate {

namespace {

std::string list_repr(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += ", ";
        out += "'" + items[i] + "'";
    }
    return out + "]";
}

} // namespace

uint64_t fnv1a_64(const std::string& data) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

Signature signature(const columnar::Table& table, size_t sample_limit) {
    Signature sig;
    sig.columns = table.column_names();
    for (const auto& name : sig.columns) {
        sig.dtypes.push_back(columnar::type_name(table.get_column(name)->type()));
    }
    sig.row_count = table.num_rows();
    sig.sample_hash = fmt::format("{:016x}", fnv1a_64(columnar::to_csv_text(table, sample_limit)));
    return sig;
}

Comparison compare(const Signature& a, const Signature& b) {
    if (a.columns != b.columns) {
        return {false, "Columns differ.\nA: " + list_repr(a.columns) + "\nB: " + list_repr(b.columns)};
    }
    if (a.row_count != b.row_count) {
        return {false, "Row count differs. A=" + std::to_string(a.row_count) +
                       " B=" + std::to_string(b.row_count)};
    }
    if (a.sample_hash != b.sample_hash) {
        return {false, "Sample hash differs (first rows content mismatch). A=" + a.sample_hash +
                       " B=" + b.sample_hash};
    }
    return {true, "Match."};
}

} // namespace validate
} // namespace pipeforge
