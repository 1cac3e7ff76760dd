#include "pipeforge_ir/runtime/backend_runtime.hpp"
#include <spdlog/spdlog.h>

namespace pipeforge {
namespace runtime {

void RuntimeRegistry::register_runtime(std::shared_ptr<BackendRuntime> runtime) {
    if (!runtime) {
        throw std::invalid_argument("Cannot register a null runtime");
    }
    codegen::Backend backend = runtime->backend();
    runtimes_[backend] = std::move(runtime);
    spdlog::debug("Registered runtime for {}", codegen::backend_name(backend));
}

BackendRuntime* RuntimeRegistry::find(codegen::Backend backend) const {
    auto it = runtimes_.find(backend);
    return it == runtimes_.end() ? nullptr : it->second.get();
}

} // namespace runtime
} // namespace pipeforge
