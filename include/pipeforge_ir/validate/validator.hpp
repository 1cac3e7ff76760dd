#pragma once

#include "../dag/graph.hpp"
#include "../options.hpp"
#include "../runtime/backend_runtime.hpp"
#include "signature.hpp"
#include <optional>
#include <string>

namespace pipeforge {
namespace validate {

struct ValidationResult {
    std::string lang;  // backend name, or the language as given when unsupported
    bool valid = false;
    std::string reason;
};

/**
 * Differential validator: runs a (sub)graph through the interpreter and
 * through a backend runtime, then compares result signatures.
 *
 * Unsupported languages and missing runtimes come back as valid=false.
 * Malformed graphs, lowering failures and backend failures throw.
 */
class Validator {
public:
    Validator(const runtime::RuntimeRegistry& runtimes, const EngineOptions& options);

    ValidationResult validate(const dag::Graph& graph,
                              const std::string& lang,
                              const std::optional<std::string>& preview_id = std::nullopt) const;

private:
    const runtime::RuntimeRegistry& runtimes_;
    const EngineOptions& options_;
};

} // namespace validate
} // namespace pipeforge
