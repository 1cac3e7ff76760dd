#include "pipeforge_ir/validate/validator.hpp"
#include "pipeforge_ir/codegen/lowerer.hpp"
#include "pipeforge_ir/dag/optimizer.hpp"
#include "pipeforge_ir/exec/interpreter.hpp"
#include "pipeforge_ir/runtime/path_rewrite.hpp"
#include "pipeforge_ir/runtime/staging.hpp"
#include <spdlog/spdlog.h>

namespace pipeforge {
namespace validate {

Validator::Validator(const runtime::RuntimeRegistry& runtimes, const EngineOptions& options)
    : runtimes_(runtimes), options_(options) {}

ValidationResult Validator::validate(const dag::Graph& graph,
                                     const std::string& lang,
                                     const std::optional<std::string>& preview_id) const {
    ValidationResult result;
    result.lang = lang;

    auto backend = codegen::parse_backend(lang);
    if (!backend) {
        result.reason = "Unsupported language: " + lang;
        return result;
    }
    result.lang = codegen::backend_name(*backend);

    runtime::BackendRuntime* backend_runtime = runtimes_.find(*backend);
    if (!backend_runtime) {
        result.reason = "runtime not available for " + result.lang;
        return result;
    }

    // Both sides see the same subgraph
    dag::Graph scoped = dag::prune_dead(graph, preview_id);

    // Ground truth
    exec::Interpreter interpreter;
    exec::RunResult truth = interpreter.run(scoped);
    Signature expected = signature(*truth.table, options_.sample_limit);

    // Backend
    std::string program = codegen::lower(scoped, *backend);
    runtime::StagingArea staging(options_.staging_root, options_.staging_prefix);
    runtime::PathMapping staged = staging.stage(runtime::inline_uploads(scoped.nodes()));
    program = runtime::rewrite_paths(*backend, program, staged);

    auto actual_table = backend_runtime->execute(program);
    Signature actual = signature(*actual_table, options_.sample_limit);

    Comparison comparison = compare(expected, actual);
    result.valid = comparison.matches;
    result.reason = comparison.reason;

    if (comparison.matches) {
        SPDLOG_DEBUG("Validation against {} matched ({} rows)", result.lang, actual.row_count);
    } else {
        spdlog::info("Validation against {} failed: {}", result.lang, comparison.reason);
    }
    return result;
}

} // namespace validate
} // namespace pipeforge
