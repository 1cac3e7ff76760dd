#pragma once

#include "backend_runtime.hpp"
#include <memory>
#include <string>

namespace pipeforge {
namespace runtime {

/**
 * Makes sure a CPython interpreter is running in this process. Inside
 * the pypipeforge extension one already is; a plain C++ program gets an
 * embedded interpreter that lives until exit.
 */
class EmbeddedPython {
public:
    static void ensure();
};

/**
 * Runs generated or user program text in embedded CPython:
 *
 *   PANDAS  exec in a fresh globals dict with pandas bound to `pd`,
 *           reads the `result` DataFrame
 *   DUCKDB  runs the statements on a fresh in-memory connection and
 *           reads the last statement's result; no statements at all
 *           give an empty table
 *   SPARK   exec in a fresh globals dict with the shared session bound
 *           to `spark`, reads `result.toPandas()`; one program at a time
 *
 * The result crosses back as CSV text and is parsed by the columnar
 * reader.
 */
class PythonRuntime : public BackendRuntime {
public:
    explicit PythonRuntime(codegen::Backend backend, std::string spark_app_name = "pipeforge");

    codegen::Backend backend() const override { return backend_; }

    std::shared_ptr<columnar::Table> execute(const std::string& program) override;

    // True when every Python module the backend needs can be imported
    bool available() const;

private:
    codegen::Backend backend_;
    std::string spark_app_name_;
};

// Registers a PythonRuntime for each of the three backends
void register_python_runtimes(RuntimeRegistry& registry, const std::string& spark_app_name = "pipeforge");

} // namespace runtime
} // namespace pipeforge
