/**
 * PythonRuntime against the embedded interpreter. Backends whose Python
 * packages are not installed are skipped, or fail when the build sets
 * PIPEFORGE_REQUIRE_PYTHON_BACKENDS.
 */

#include "test_util.hpp"

#include "pipeforge_ir/engine.hpp"
#include "pipeforge_ir/runtime/python_runtime.hpp"

namespace pipeforge {
namespace test {

using codegen::Backend;
using runtime::PythonRuntime;

class PythonRuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        runtime::EmbeddedPython::ensure();
    }

    void require(const PythonRuntime& rt) {
        if (!rt.available()) {
#ifdef PIPEFORGE_REQUIRE_PYTHON_BACKENDS
            FAIL() << codegen::backend_name(rt.backend()) << " packages are not installed";
#else
            GTEST_SKIP() << codegen::backend_name(rt.backend()) << " packages are not installed";
#endif
        }
    }

    Engine python_engine() {
        runtime::RuntimeRegistry registry;
        runtime::register_python_runtimes(registry);
        return Engine(EngineOptions(), std::move(registry));
    }
};

TEST_F(PythonRuntimeTest, EnsureIsIdempotent) {
    EXPECT_NO_THROW(runtime::EmbeddedPython::ensure());
    EXPECT_NO_THROW(runtime::EmbeddedPython::ensure());
}

TEST_F(PythonRuntimeTest, PandasResultBecomesTable) {
    PythonRuntime rt(Backend::PANDAS);
    require(rt);
    if (IsSkipped() || HasFailure()) return;

    auto result = rt.execute("result = pd.DataFrame({'a': [1, 2], 'b': ['x', None]})\n");
    EXPECT_EQ(result->column_names(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(cells(*result, "a"), (std::vector<std::string>{"1", "2"}));
    EXPECT_EQ(cells(*result, "b"), (std::vector<std::string>{"x", ""}));
}

TEST_F(PythonRuntimeTest, PandasFailuresAreBackendErrors) {
    PythonRuntime rt(Backend::PANDAS);
    require(rt);
    if (IsSkipped() || HasFailure()) return;

    EXPECT_THROW(rt.execute("frame = pd.DataFrame()\n"), runtime::BackendError);
    EXPECT_THROW(rt.execute("result = (\n"), runtime::BackendError);
    EXPECT_THROW(rt.execute("result = 42\n"), runtime::BackendError);
    EXPECT_THROW(rt.execute("raise ValueError('nope')\n"), runtime::BackendError);
}

TEST_F(PythonRuntimeTest, EachProgramGetsFreshGlobals) {
    PythonRuntime rt(Backend::PANDAS);
    require(rt);
    if (IsSkipped() || HasFailure()) return;

    rt.execute("leftover = 1\nresult = pd.DataFrame({'a': [1]})\n");
    EXPECT_THROW(rt.execute("result = pd.DataFrame({'a': [leftover]})\n"), runtime::BackendError);
}

TEST_F(PythonRuntimeTest, FrameWithoutColumnsIsEmptyTable) {
    PythonRuntime rt(Backend::PANDAS);
    require(rt);
    if (IsSkipped() || HasFailure()) return;

    auto result = rt.execute("result = pd.DataFrame()\n");
    EXPECT_EQ(result->num_columns(), 0u);
    EXPECT_EQ(result->num_rows(), 0u);
}

TEST_F(PythonRuntimeTest, DuckDbRunsStatements) {
    PythonRuntime rt(Backend::DUCKDB);
    require(rt);
    if (IsSkipped() || HasFailure()) return;

    auto result = rt.execute(
        "CREATE OR REPLACE TEMP VIEW \"v\" AS SELECT 1 AS x UNION ALL SELECT 2;\n"
        "SELECT * FROM \"v\" ORDER BY x;\n");
    EXPECT_EQ(cells(*result, "x"), (std::vector<std::string>{"1", "2"}));

    EXPECT_THROW(rt.execute("SELECT * FROM missing_table;"), runtime::BackendError);
}

TEST_F(PythonRuntimeTest, DuckDbProgramWithoutStatementsIsEmptyTable) {
    PythonRuntime rt(Backend::DUCKDB);
    require(rt);
    if (IsSkipped() || HasFailure()) return;

    auto result = rt.execute("-- Generated by pipeforge (DuckDB SQL)\n-- empty pipeline\n");
    EXPECT_EQ(result->num_columns(), 0u);
    EXPECT_EQ(result->num_rows(), 0u);
}

TEST_F(PythonRuntimeTest, ValidatesGeneratedPandasEndToEnd) {
    PythonRuntime backend(Backend::PANDAS);
    require(backend);
    if (IsSkipped() || HasFailure()) return;

    Engine engine = python_engine();

    auto result = engine.validate(people_pipeline(), "python");
    EXPECT_TRUE(result.valid) << result.reason;
}

TEST_F(PythonRuntimeTest, ValidatesGeneratedSqlEndToEnd) {
    PythonRuntime backend(Backend::DUCKDB);
    require(backend);
    if (IsSkipped() || HasFailure()) return;

    Engine engine = python_engine();

    auto result = engine.validate(people_pipeline(), "sql");
    EXPECT_TRUE(result.valid) << result.reason;
}

TEST_F(PythonRuntimeTest, ValidatesEmptyGraphAgainstSql) {
    PythonRuntime backend(Backend::DUCKDB);
    require(backend);
    if (IsSkipped() || HasFailure()) return;

    Engine engine = python_engine();
    auto result = engine.validate(dag::Graph(), "sql");
    EXPECT_TRUE(result.valid) << result.reason;
}

TEST_F(PythonRuntimeTest, ValidatesSparkJoinLayout) {
    PythonRuntime backend(Backend::SPARK);
    require(backend);
    if (IsSkipped() || HasFailure()) return;

    // One matching row: id once, score_x, score_y, team
    dag::JoinSpec spec;
    dag::Graph graph({load("l", "Left", "id,score\n1,10\n2,20\n", "left.csv"),
                      load("r", "Right", "id,score,team\n2,200,red\n3,300,blue\n", "right.csv"),
                      node("j", "Join", spec)},
                     {{"l", "j"}, {"r", "j"}});

    Engine engine = python_engine();
    auto result = engine.validate(graph, "spark");
    EXPECT_TRUE(result.valid) << result.reason;
}

} // namespace test
} // namespace pipeforge
