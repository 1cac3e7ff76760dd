/**
 * Engine facade and the differential validator, run against fake
 * backend runtimes
 */

#include "test_util.hpp"

#include "pipeforge_ir/engine.hpp"
#include "pipeforge_ir/exec/interpreter.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <thread>

namespace pipeforge {
namespace test {

using codegen::Backend;

namespace {

// Text between `marker` and the next double quote
std::string quoted_after(const std::string& program, const std::string& marker) {
    size_t start = program.find(marker);
    if (start == std::string::npos) return "";
    start += marker.size();
    return program.substr(start, program.find('"', start) - start);
}

// Reads the file the program's first pd.read_csv call names, the way a
// real pandas runtime would
std::shared_ptr<columnar::Table> read_first_csv(const std::string& program) {
    std::string path = quoted_after(program, "pd.read_csv(\"");
    if (path.empty()) throw runtime::BackendError("no reader call");
    return columnar::read_csv_file(path);
}

} // namespace

class EngineTest : public ::testing::Test {
protected:
    Engine engine_with(std::shared_ptr<FakeRuntime> fake, EngineOptions options = EngineOptions()) {
        runtime::RuntimeRegistry registry;
        registry.register_runtime(std::move(fake));
        return Engine(std::move(options), std::move(registry));
    }

    std::shared_ptr<columnar::Table> truth(const dag::Graph& graph) {
        return exec::Interpreter().run(graph).table;
    }
};

// ---------------------------------------------------------------------------
// compile / optimize / interpret
// ---------------------------------------------------------------------------

TEST_F(EngineTest, CompileByLanguageName) {
    Engine engine;
    auto graph = people_pipeline();
    EXPECT_EQ(engine.compile(graph, "python"), codegen::lower(graph, Backend::PANDAS));
    EXPECT_EQ(engine.compile(graph, "duckdb"), codegen::lower(graph, Backend::DUCKDB));
    EXPECT_EQ(engine.compile(graph, "spark"), codegen::lower(graph, Backend::SPARK));
    EXPECT_THROW(engine.compile(graph, "cobol"), codegen::LoweringError);
}

TEST_F(EngineTest, OptimizeFusesAndPrunes) {
    Engine engine;
    dag::Graph graph(
        {load("src", "People", kPeopleCsv), select("sel", "name, age"), filter("flt", "age > 18"),
         filter("flt2", "name != 'Bob'")},
        {{"src", "sel"}, {"sel", "flt"}, {"flt", "flt2"}});

    auto fused = engine.optimize(graph);
    EXPECT_EQ(fused.nodes().size(), 3u);
    EXPECT_FALSE(fused.contains("flt2"));
    EXPECT_EQ(std::get<dag::FilterSpec>(fused.node("flt").payload).expr.text(),
              "(age > 18) AND (name != 'Bob')");

    auto pruned = engine.optimize(graph, std::string("sel"));
    EXPECT_EQ(pruned.nodes().size(), 2u);
    EXPECT_THROW(engine.optimize(graph, std::string("nope")), dag::GraphError);
}

TEST_F(EngineTest, InterpretMatchesInterpreter) {
    Engine engine;
    auto result = engine.interpret(people_pipeline());
    EXPECT_EQ(cells(*result.table, "name"), (std::vector<std::string>{"Ann", "Cy", "Eve"}));
    EXPECT_EQ(engine.interpret(people_pipeline(), std::string("src")).table->num_rows(), 5u);
}

// ---------------------------------------------------------------------------
// validate
// ---------------------------------------------------------------------------

TEST_F(EngineTest, ValidateUnsupportedLanguage) {
    Engine engine;
    auto result = engine.validate(people_pipeline(), "cobol");
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.lang, "cobol");
    EXPECT_EQ(result.reason, "Unsupported language: cobol");
}

TEST_F(EngineTest, ValidateWithoutRuntime) {
    Engine engine;
    auto result = engine.validate(people_pipeline(), "pandas");
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.lang, "python");
    EXPECT_EQ(result.reason, "runtime not available for python");
}

TEST_F(EngineTest, ValidateMatchingBackend) {
    auto graph = people_pipeline();
    auto fake = std::make_shared<FakeRuntime>(Backend::DUCKDB, truth(graph));
    Engine engine = engine_with(fake);

    auto result = engine.validate(graph, "sql");
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.lang, "sql");
    EXPECT_EQ(result.reason, "Match.");

    // The inline upload was staged and the reader call points at it
    ASSERT_EQ(fake->programs.size(), 1u);
    EXPECT_EQ(fake->programs[0].find("read_csv_auto('people.csv'"), std::string::npos);
    EXPECT_NE(fake->programs[0].find("pipeforge_uploads_"), std::string::npos);
}

TEST_F(EngineTest, ValidateReadsStagedUploadDuringExecution) {
    auto fake = std::make_shared<FakeRuntime>(Backend::PANDAS);
    std::string staged_path;
    fake->on_execute = [&staged_path](const std::string& program) {
        staged_path = quoted_after(program, "pd.read_csv(\"");
        return columnar::read_csv_file(staged_path);
    };
    Engine engine = engine_with(fake);

    dag::Graph graph({load("src", "People", kPeopleCsv)}, {});
    auto result = engine.validate(graph, "python");
    EXPECT_TRUE(result.valid) << result.reason;

    // Cleaned up once the call returns
    ASSERT_FALSE(staged_path.empty());
    EXPECT_FALSE(std::filesystem::exists(staged_path));
}

TEST_F(EngineTest, ValidateMismatch) {
    auto fake = std::make_shared<FakeRuntime>(Backend::SPARK, table("name,age\nAnn,34\n"));
    Engine engine = engine_with(fake);

    auto result = engine.validate(people_pipeline(), "pyspark");
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.lang, "spark");
    EXPECT_EQ(result.reason, "Row count differs. A=3 B=1");
}

TEST_F(EngineTest, ValidateHonoursSampleLimit) {
    auto almost = table("name,age\nAnn,34\nCy,52\nZed,41\n");

    EngineOptions narrow;
    narrow.sample_limit = 2;
    EXPECT_TRUE(engine_with(std::make_shared<FakeRuntime>(Backend::PANDAS, almost), narrow)
                    .validate(people_pipeline(), "python").valid);
    EXPECT_FALSE(engine_with(std::make_shared<FakeRuntime>(Backend::PANDAS, almost))
                     .validate(people_pipeline(), "python").valid);
}

TEST_F(EngineTest, ValidateScopesToPreviewNode) {
    auto graph = people_pipeline();
    auto fake = std::make_shared<FakeRuntime>(Backend::PANDAS);
    fake->on_execute = [](const std::string& program) {
        auto loaded = read_first_csv(program);
        return loaded->select({"name", "age"});
    };
    Engine engine = engine_with(fake);

    auto result = engine.validate(graph, "python", std::string("sel"));
    EXPECT_TRUE(result.valid) << result.reason;
    ASSERT_EQ(fake->programs.size(), 1u);
    EXPECT_EQ(fake->programs[0].find(".query("), std::string::npos);

    EXPECT_THROW(engine.validate(graph, "python", std::string("missing")), dag::GraphError);
}

TEST_F(EngineTest, ValidatePropagatesBackendFailure) {
    Engine engine = engine_with(std::make_shared<FakeRuntime>(Backend::PANDAS));
    EXPECT_THROW(engine.validate(people_pipeline(), "python"), runtime::BackendError);
}

// ---------------------------------------------------------------------------
// execute_user_text
// ---------------------------------------------------------------------------

TEST_F(EngineTest, ExecuteUserTextStagesUploads) {
    auto fake = std::make_shared<FakeRuntime>(Backend::PANDAS);
    fake->on_execute = read_first_csv;
    Engine engine = engine_with(fake);

    std::vector<dag::Node> nodes{load("src", "People", kPeopleCsv, "people.csv")};
    auto result = engine.execute_user_text("python", "df = pd.read_csv(\"people.csv\")\nresult = df\n", nodes);

    EXPECT_EQ(result->num_rows(), 5u);
    ASSERT_EQ(fake->programs.size(), 1u);
    EXPECT_EQ(fake->programs[0].find("pd.read_csv(\"people.csv\")"), std::string::npos);
}

TEST_F(EngineTest, ExecuteUserTextWithoutUploadsIsUnchanged) {
    auto fake = std::make_shared<FakeRuntime>(Backend::DUCKDB, table("x\n1\n"));
    Engine engine = engine_with(fake);

    std::string text = "SELECT 1 AS x";
    EXPECT_EQ(engine.execute_user_text("sql", text, {})->num_rows(), 1u);
    EXPECT_EQ(fake->programs.at(0), text);
}

TEST_F(EngineTest, ExecuteUserTextErrors) {
    Engine engine;
    EXPECT_THROW(engine.execute_user_text("cobol", "x", {}), std::invalid_argument);
    EXPECT_THROW(engine.execute_user_text("python", "result = 1", {}), runtime::BackendError);
}

// ---------------------------------------------------------------------------
// EngineOptions
// ---------------------------------------------------------------------------

class EngineOptionsTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("PIPEFORGE_SAMPLE_LIMIT");
        unsetenv("PIPEFORGE_OPTIMIZER_PASSES");
        unsetenv("PIPEFORGE_TMPDIR");
        unsetenv("PIPEFORGE_LOG_LEVEL");
        spdlog::set_level(spdlog::level::info);
    }
};

TEST_F(EngineOptionsTest, Defaults) {
    auto options = EngineOptions::from_env();
    EXPECT_EQ(options.sample_limit, 200u);
    EXPECT_EQ(options.optimizer_passes, 1);
    EXPECT_TRUE(options.staging_root.empty());
    EXPECT_EQ(options.log_level, "info");
}

TEST_F(EngineOptionsTest, ReadsEnvironment) {
    setenv("PIPEFORGE_SAMPLE_LIMIT", "50", 1);
    setenv("PIPEFORGE_OPTIMIZER_PASSES", "3", 1);
    setenv("PIPEFORGE_TMPDIR", "/var/tmp", 1);
    setenv("PIPEFORGE_LOG_LEVEL", "debug", 1);

    auto options = EngineOptions::from_env();
    EXPECT_EQ(options.sample_limit, 50u);
    EXPECT_EQ(options.optimizer_passes, 3);
    EXPECT_EQ(options.staging_root, "/var/tmp");
    EXPECT_NO_THROW(options.apply_log_level());
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
}

TEST_F(EngineOptionsTest, RejectsMalformedValues) {
    setenv("PIPEFORGE_SAMPLE_LIMIT", "lots", 1);
    EXPECT_THROW(EngineOptions::from_env(), std::invalid_argument);

    setenv("PIPEFORGE_SAMPLE_LIMIT", "0", 1);
    EXPECT_THROW(EngineOptions::from_env(), std::invalid_argument);

    EngineOptions options;
    options.log_level = "chatty";
    EXPECT_THROW(options.apply_log_level(), std::invalid_argument);
}

// ---------------------------------------------------------------------------
// SharedEngine
// ---------------------------------------------------------------------------

TEST(SharedEngineTest, ConcurrentFirstUseBuildsOnce) {
    std::atomic<int> built{0};
    SharedEngine slot([&built] {
        ++built;
        return std::make_shared<Engine>();
    });

    std::vector<std::shared_ptr<Engine>> seen(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&slot, &seen, i] { seen[i] = slot.get(); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(built.load(), 1);
    for (const auto& e : seen) {
        EXPECT_EQ(e.get(), seen[0].get());
    }
}

TEST(SharedEngineTest, ResetLeavesRunningCallsTheirEngine) {
    std::atomic<int> built{0};
    SharedEngine slot([&built] {
        ++built;
        return std::make_shared<Engine>();
    });

    auto running = slot.get();
    EngineOptions options;
    options.sample_limit = 5;
    slot.reset(std::make_shared<Engine>(options));

    EXPECT_EQ(running->options().sample_limit, 200u);
    EXPECT_FALSE(running->compile(people_pipeline(), "sql").empty());
    EXPECT_EQ(slot.get()->options().sample_limit, 5u);
    EXPECT_EQ(built.load(), 1);

    slot.reset(nullptr);
    EXPECT_EQ(slot.get()->options().sample_limit, 200u);
    EXPECT_EQ(built.load(), 2);

    SharedEngine broken([] { return std::shared_ptr<Engine>(); });
    EXPECT_THROW(broken.get(), std::runtime_error);
}

} // namespace test
} // namespace pipeforge
