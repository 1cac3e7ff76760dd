#pragma once

#include "codegen/lowerer.hpp"
#include "dag/graph.hpp"
#include "exec/interpreter.hpp"
#include "options.hpp"
#include "runtime/backend_runtime.hpp"
#include "validate/validator.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pipeforge {

/**
 * Request-level facade over the pipeline IR. Holds no per-request state;
 * each call builds what it needs and cleans up staged files before it
 * returns.
 */
class Engine {
public:
    explicit Engine(EngineOptions options = EngineOptions(),
                    runtime::RuntimeRegistry runtimes = runtime::RuntimeRegistry());

    const EngineOptions& options() const { return options_; }
    runtime::RuntimeRegistry& runtimes() { return runtimes_; }

    // Program text for lang. Throws LoweringError for an unsupported language.
    std::string compile(const dag::Graph& graph, const std::string& lang) const;

    // Prunes to target_id's ancestors, then fuses. max_passes defaults to options().optimizer_passes.
    dag::Graph optimize(const dag::Graph& graph,
                        const std::optional<std::string>& target_id = std::nullopt,
                        std::optional<int> max_passes = std::nullopt) const;

    exec::RunResult interpret(const dag::Graph& graph,
                              const std::optional<std::string>& preview_id = std::nullopt) const;

    validate::ValidationResult validate(const dag::Graph& graph,
                                        const std::string& lang,
                                        const std::optional<std::string>& preview_id = std::nullopt) const;

    /**
     * Runs caller-written program text under lang's runtime. Inline
     * uploads among nodes are staged and reader calls naming them are
     * pointed at the staged files first.
     *
     * Throws std::invalid_argument for an unsupported language and
     * BackendError when no runtime is registered or the program fails.
     */
    std::shared_ptr<columnar::Table> execute_user_text(const std::string& lang,
                                                       const std::string& text,
                                                       const std::vector<dag::Node>& nodes) const;

private:
    EngineOptions options_;
    runtime::RuntimeRegistry runtimes_;
};

/**
 * Process-wide engine slot. get() builds the engine on first use;
 * reset() swaps in a new one. Callers hold the returned pointer for the
 * length of a call, so a swap never frees an engine that is still
 * running.
 */
class SharedEngine {
public:
    using Factory = std::function<std::shared_ptr<Engine>()>;

    explicit SharedEngine(Factory factory);

    std::shared_ptr<Engine> get();
    void reset(std::shared_ptr<Engine> engine);

private:
    std::mutex mutex_;
    Factory factory_;
    std::shared_ptr<Engine> engine_;
};

} // namespace pipeforge
