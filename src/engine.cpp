#include "pipeforge_ir/engine.hpp"
#include "pipeforge_ir/dag/optimizer.hpp"
#include "pipeforge_ir/runtime/path_rewrite.hpp"
#include "pipeforge_ir/runtime/staging.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace pipeforge {

Engine::Engine(EngineOptions options, runtime::RuntimeRegistry runtimes)
    : options_(std::move(options)), runtimes_(std::move(runtimes)) {}

std::string Engine::compile(const dag::Graph& graph, const std::string& lang) const {
    auto backend = codegen::parse_backend(lang);
    if (!backend) {
        throw codegen::LoweringError("Unsupported language: " + lang);
    }
    return codegen::lower(graph, *backend);
}

dag::Graph Engine::optimize(const dag::Graph& graph,
                            const std::optional<std::string>& target_id,
                            std::optional<int> max_passes) const {
    dag::Optimizer optimizer;
    dag::Graph optimized = optimizer.optimize(graph, target_id, max_passes.value_or(options_.optimizer_passes));
    SPDLOG_DEBUG("optimize: {} -> {} node(s), {} rewrite(s)",
                 graph.nodes().size(), optimized.nodes().size(), optimizer.applied_rules().size());
    return optimized;
}

exec::RunResult Engine::interpret(const dag::Graph& graph, const std::optional<std::string>& preview_id) const {
    exec::Interpreter interpreter;
    return interpreter.run(graph, preview_id);
}

validate::ValidationResult Engine::validate(const dag::Graph& graph,
                                            const std::string& lang,
                                            const std::optional<std::string>& preview_id) const {
    validate::Validator validator(runtimes_, options_);
    return validator.validate(graph, lang, preview_id);
}

std::shared_ptr<columnar::Table> Engine::execute_user_text(const std::string& lang,
                                                           const std::string& text,
                                                           const std::vector<dag::Node>& nodes) const {
    auto backend = codegen::parse_backend(lang);
    if (!backend) {
        throw std::invalid_argument("Unsupported language: " + lang);
    }
    runtime::BackendRuntime* backend_runtime = runtimes_.find(*backend);
    if (!backend_runtime) {
        throw runtime::BackendError("runtime not available for " + codegen::backend_name(*backend));
    }

    runtime::StagingArea staging(options_.staging_root, options_.staging_prefix);
    runtime::PathMapping staged = staging.stage(runtime::inline_uploads(nodes));
    std::string program = runtime::rewrite_paths(*backend, text, staged);

    spdlog::info("Executing user {} program", codegen::backend_name(*backend));
    return backend_runtime->execute(program);
}

SharedEngine::SharedEngine(Factory factory) : factory_(std::move(factory)) {}

std::shared_ptr<Engine> SharedEngine::get() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!engine_) {
        engine_ = factory_();
        if (!engine_) {
            throw std::runtime_error("Engine factory returned no engine");
        }
    }
    return engine_;
}

void SharedEngine::reset(std::shared_ptr<Engine> engine) {
    std::lock_guard<std::mutex> lock(mutex_);
    engine_ = std::move(engine);
}

} // namespace pipeforge
