#pragma once

#include "../codegen/lowerer.hpp"
#include "../columnar/table.hpp"
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace pipeforge {
namespace runtime {

/**
 * Program text failed under its backend. what() carries the backend's
 * own message.
 */
class BackendError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * "Execute program text, return a table" for one backend. Programs are
 * trusted: no sandboxing happens at this layer.
 */
class BackendRuntime {
public:
    virtual ~BackendRuntime() = default;

    virtual codegen::Backend backend() const = 0;

    // Throws BackendError when the program fails or produces no table
    virtual std::shared_ptr<columnar::Table> execute(const std::string& program) = 0;
};

class RuntimeRegistry {
public:
    // Replaces any runtime already registered for the same backend
    void register_runtime(std::shared_ptr<BackendRuntime> runtime);

    // nullptr when nothing is registered for the backend
    BackendRuntime* find(codegen::Backend backend) const;

    bool empty() const { return runtimes_.empty(); }

private:
    std::map<codegen::Backend, std::shared_ptr<BackendRuntime>> runtimes_;
};

} // namespace runtime
} // namespace pipeforge
