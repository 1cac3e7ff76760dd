#include "test_util.hpp"

#include "pipeforge_ir/validate/signature.hpp"

namespace pipeforge {
namespace test {

using validate::compare;
using validate::signature;

TEST(SignatureTest, Fnv1aVectors) {
    EXPECT_EQ(validate::fnv1a_64(""), 0xcbf29ce484222325ULL);
    EXPECT_EQ(validate::fnv1a_64("a"), 0xaf63dc4c8601ec8cULL);
    EXPECT_NE(validate::fnv1a_64("ab"), validate::fnv1a_64("ba"));
}

TEST(SignatureTest, DescribesTable) {
    auto sig = signature(*table("id,score,name,ok\n1,1.5,x,true\n2,,y,false\n"));
    EXPECT_EQ(sig.columns, (std::vector<std::string>{"id", "score", "name", "ok"}));
    EXPECT_EQ(sig.dtypes, (std::vector<std::string>{"int64", "float64", "string", "bool"}));
    EXPECT_EQ(sig.row_count, 2u);
    EXPECT_EQ(sig.sample_hash.size(), 16u);
    EXPECT_EQ(sig.sample_hash.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(SignatureTest, EqualTablesMatch) {
    auto result = compare(signature(*table(kPeopleCsv)), signature(*table(kPeopleCsv)));
    EXPECT_TRUE(result.matches);
    EXPECT_EQ(result.reason, "Match.");
}

TEST(SignatureTest, NumericSpellingDoesNotMatter) {
    // 1 and 1.0 print the same in canonical CSV; dtypes are not compared
    auto ints = signature(*table("v\n1\n2\n"));
    auto floats = signature(*table("v\n1.0\n2.0\n"));
    EXPECT_NE(ints.dtypes, floats.dtypes);
    EXPECT_TRUE(compare(ints, floats).matches);
}

TEST(SignatureTest, ColumnsCompareFirst) {
    auto result = compare(signature(*table("a,b\n1,2\n")), signature(*table("b,a\n2,1\n1,1\n")));
    EXPECT_FALSE(result.matches);
    EXPECT_EQ(result.reason, "Columns differ.\nA: ['a', 'b']\nB: ['b', 'a']");
}

TEST(SignatureTest, RowCountThenHash) {
    auto base = signature(*table("v\n1\n2\n"));

    auto longer = compare(base, signature(*table("v\n1\n2\n3\n")));
    EXPECT_FALSE(longer.matches);
    EXPECT_EQ(longer.reason, "Row count differs. A=2 B=3");

    auto changed = compare(base, signature(*table("v\n1\n5\n")));
    EXPECT_FALSE(changed.matches);
    EXPECT_EQ(changed.reason.rfind("Sample hash differs (first rows content mismatch). A=", 0), 0u);
}

TEST(SignatureTest, HashCoversOnlySampledRows) {
    auto a = table("v\n1\n2\n3\n");
    auto b = table("v\n1\n2\n4\n");
    EXPECT_TRUE(compare(signature(*a, 2), signature(*b, 2)).matches);
    EXPECT_FALSE(compare(signature(*a), signature(*b)).matches);
}

TEST(SignatureTest, RowOrderMatters) {
    auto a = signature(*table("v\n1\n2\n"));
    auto b = signature(*table("v\n2\n1\n"));
    EXPECT_FALSE(compare(a, b).matches);
}

} // namespace test
} // namespace pipeforge
