#pragma once

#include "../columnar/table.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace pipeforge {
namespace validate {

constexpr size_t kDefaultSampleLimit = 200;

/**
 * Comparable fingerprint of a result table
 */
struct Signature {
    std::vector<std::string> columns;
    std::vector<std::string> dtypes;  // int64 | float64 | string | bool
    size_t row_count = 0;
    std::string sample_hash;          // 16 hex digits
};

struct Comparison {
    bool matches = false;
    std::string reason;
};

// 64-bit FNV-1a
uint64_t fnv1a_64(const std::string& data);

// Hash covers the canonical CSV text of the first sample_limit rows
Signature signature(const columnar::Table& table, size_t sample_limit = kDefaultSampleLimit);

/**
 * Matches iff columns (names and order), row counts and sample hashes
 * are equal. Dtypes are reported but never compared. The reason names
 * the first dimension that differs.
 */
Comparison compare(const Signature& a, const Signature& b);

} // namespace validate
} // namespace pipeforge
