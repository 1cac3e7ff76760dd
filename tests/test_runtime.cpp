/**
 * Upload staging, reader-path rewriting and the runtime registry
 */

#include "test_util.hpp"

#include "pipeforge_ir/runtime/path_rewrite.hpp"
#include "pipeforge_ir/runtime/staging.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace pipeforge {
namespace test {

using codegen::Backend;
using runtime::rewrite_paths;

namespace {

std::string slurp(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

// ---------------------------------------------------------------------------
// inline_uploads / StagingArea
// ---------------------------------------------------------------------------

TEST(StagingTest, InlineUploadsSkipBlankAndKeepFirst) {
    std::vector<dag::Node> nodes{
        load("a", "A", "x\n1\n", "people.csv"),
        load("b", "B", "x\n2\n", "people.csv"),
        load("c", "C", "   \n", "blank.csv"),
        filter("f", "x > 1"),
    };
    dag::LoadSpec from_disk;
    from_disk.path = "disk.csv";
    nodes.push_back(node("d", "D", from_disk));

    auto uploads = runtime::inline_uploads(nodes);
    ASSERT_EQ(uploads.size(), 1u);
    EXPECT_EQ(uploads.at("people.csv"), "x\n1\n");
}

TEST(StagingTest, WritesEachBlobIntoItsOwnSlot) {
    std::filesystem::path directory;
    {
        runtime::StagingArea staging(::testing::TempDir(), "pipeforge_test_");
        EXPECT_TRUE(staging.directory().empty());

        auto mapping = staging.stage({{"people.csv", "a\n1\n"}, {"in/people.csv", "b\n2\n"}, {"", "c\n3\n"}});
        directory = staging.directory();
        ASSERT_FALSE(directory.empty());
        EXPECT_EQ(directory.filename().string().rfind("pipeforge_test_", 0), 0u);

        ASSERT_EQ(mapping.size(), 3u);
        EXPECT_NE(mapping.at("people.csv"), mapping.at("in/people.csv"));
        EXPECT_EQ(std::filesystem::path(mapping.at("people.csv")).filename().string(), "people.csv");
        EXPECT_EQ(std::filesystem::path(mapping.at("")).filename().string(), "uploaded.csv");
        EXPECT_EQ(slurp(mapping.at("people.csv")), "a\n1\n");
        EXPECT_EQ(slurp(mapping.at("in/people.csv")), "b\n2\n");
    }
    EXPECT_FALSE(std::filesystem::exists(directory));
}

TEST(StagingTest, NothingToStageCreatesNothing) {
    runtime::StagingArea staging(::testing::TempDir());
    EXPECT_TRUE(staging.stage({}).empty());
    EXPECT_TRUE(staging.directory().empty());
}

TEST(StagingTest, UnusableRootThrows) {
    runtime::StagingArea staging("/nonexistent/pipeforge/root");
    EXPECT_THROW(staging.stage({{"a.csv", "x\n1\n"}}), std::runtime_error);
}

// ---------------------------------------------------------------------------
// rewrite_paths
// ---------------------------------------------------------------------------

class RewritePathsTest : public ::testing::Test {
protected:
    runtime::PathMapping mapping_{{"people.csv", "/stage/0/people.csv"}};
};

TEST_F(RewritePathsTest, Pandas) {
    std::string text =
        "a = pd.read_csv(\"people.csv\")\n"
        "b = pd.read_csv( 'people.csv' )\n"
        "c = pd.read_csv(r\"people.csv\")\n"
        "d = pd.read_csv(\"other.csv\")\n"
        "e = open(\"people.csv\")\n";
    EXPECT_EQ(rewrite_paths(Backend::PANDAS, text, mapping_),
              "a = pd.read_csv(\"/stage/0/people.csv\")\n"
              "b = pd.read_csv(\"/stage/0/people.csv\")\n"
              "c = pd.read_csv(\"/stage/0/people.csv\")\n"
              "d = pd.read_csv(\"other.csv\")\n"
              "e = open(\"people.csv\")\n");
}

TEST_F(RewritePathsTest, Sql) {
    std::string text =
        "SELECT * FROM read_csv_auto('people.csv', header=true);\n"
        "SELECT * FROM READ_CSV_AUTO(\"people.csv\");\n"
        "SELECT * FROM read_csv_auto('people.csv', sep=';');\n";
    EXPECT_EQ(rewrite_paths(Backend::DUCKDB, text, mapping_),
              "SELECT * FROM read_csv_auto('/stage/0/people.csv', header=true);\n"
              "SELECT * FROM read_csv_auto('/stage/0/people.csv', header=true);\n"
              "SELECT * FROM read_csv_auto('people.csv', sep=';');\n");
}

TEST_F(RewritePathsTest, SparkKeepsReaderOptions) {
    std::string text =
        "a = spark.read.option(\"header\", True).option(\"inferSchema\", True).csv(\"people.csv\")\n"
        "b = spark.read.csv('people.csv')\n";
    EXPECT_EQ(rewrite_paths(Backend::SPARK, text, mapping_),
              "a = spark.read.option(\"header\", True).option(\"inferSchema\", True).csv(\"/stage/0/people.csv\")\n"
              "b = spark.read.csv(\"/stage/0/people.csv\")\n");
}

TEST_F(RewritePathsTest, GeneratedProgramsRoundTrip) {
    auto graph = people_pipeline();
    for (Backend backend : {Backend::PANDAS, Backend::DUCKDB, Backend::SPARK}) {
        std::string program = codegen::lower(graph, backend);
        std::string rewritten = rewrite_paths(backend, program, mapping_);
        EXPECT_NE(rewritten, program);
        EXPECT_NE(rewritten.find("/stage/0/people.csv"), std::string::npos);
    }
}

TEST(RewritePathsSpecialTest, RegexAndReplacementCharactersAreLiteral) {
    runtime::PathMapping mapping{{"data (1).csv", "/s/$1/data.csv"}};
    EXPECT_EQ(rewrite_paths(Backend::PANDAS, "x = pd.read_csv(\"data (1).csv\")", mapping),
              "x = pd.read_csv(\"/s/$1/data.csv\")");
    EXPECT_EQ(rewrite_paths(Backend::SPARK, "x = spark.read.csv(\"data (1).csv\")", mapping),
              "x = spark.read.csv(\"/s/$1/data.csv\")");
    EXPECT_EQ(rewrite_paths(Backend::PANDAS, "x = pd.read_csv(\"data X1).csv\")", mapping),
              "x = pd.read_csv(\"data X1).csv\")");
}

TEST(RewritePathsSpecialTest, EscapedBackslashesMatch) {
    runtime::PathMapping mapping{{"C:\\data\\in.csv", "/s/0/in.csv"}};
    EXPECT_EQ(rewrite_paths(Backend::PANDAS, "x = pd.read_csv(\"C:\\\\data\\\\in.csv\")", mapping),
              "x = pd.read_csv(\"/s/0/in.csv\")");
}

TEST(RewritePathsSpecialTest, EmptyMappingLeavesText) {
    std::string text = "x = pd.read_csv(\"people.csv\")";
    EXPECT_EQ(rewrite_paths(Backend::PANDAS, text, {}), text);
}

// ---------------------------------------------------------------------------
// RuntimeRegistry
// ---------------------------------------------------------------------------

TEST(RuntimeRegistryTest, RegisterFindReplace) {
    runtime::RuntimeRegistry registry;
    EXPECT_TRUE(registry.empty());
    EXPECT_EQ(registry.find(Backend::PANDAS), nullptr);

    auto first = std::make_shared<FakeRuntime>(Backend::PANDAS);
    auto second = std::make_shared<FakeRuntime>(Backend::PANDAS);
    registry.register_runtime(first);
    EXPECT_EQ(registry.find(Backend::PANDAS), first.get());
    EXPECT_EQ(registry.find(Backend::SPARK), nullptr);

    registry.register_runtime(second);
    EXPECT_EQ(registry.find(Backend::PANDAS), second.get());
    EXPECT_FALSE(registry.empty());
}

TEST(RuntimeRegistryTest, NullRuntimeThrows) {
    runtime::RuntimeRegistry registry;
    EXPECT_THROW(registry.register_runtime(nullptr), std::invalid_argument);
}

} // namespace test
} // namespace pipeforge
