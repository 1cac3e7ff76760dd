#include "pipeforge_ir/runtime/python_runtime.hpp"
#include "pipeforge_ir/columnar/csv.hpp"
#include <pybind11/embed.h>
#include <spdlog/spdlog.h>
#include <mutex>
#include <vector>

namespace py = pybind11;

namespace pipeforge {
namespace runtime {

namespace {

// Spark sessions are process-wide; programs against them run one at a time
std::mutex& spark_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::vector<const char*> required_modules(codegen::Backend backend) {
    switch (backend) {
        case codegen::Backend::PANDAS: return {"pandas"};
        case codegen::Backend::DUCKDB: return {"pandas", "duckdb"};
        case codegen::Backend::SPARK: return {"pandas", "pyspark"};
    }
    return {};
}

py::dict fresh_globals() {
    py::dict scope;
    scope["__builtins__"] = py::module_::import("builtins");
    return scope;
}

py::object bound_result(const py::dict& scope) {
    if (!scope.contains("result")) {
        throw BackendError("Program did not bind a variable named 'result'");
    }
    return scope["result"];
}

// pandas DataFrame -> table, through CSV
std::shared_ptr<columnar::Table> frame_to_table(const py::object& frame) {
    if (!py::hasattr(frame, "to_csv") || !py::hasattr(frame, "columns")) {
        throw BackendError("'result' is not a DataFrame");
    }
    if (py::len(frame.attr("columns")) == 0) {
        return std::make_shared<columnar::Table>();
    }
    std::string csv = frame.attr("to_csv")(py::arg("index") = false).cast<std::string>();
    return columnar::read_csv_text(csv);
}

} // namespace

void EmbeddedPython::ensure() {
    static std::unique_ptr<py::scoped_interpreter> interpreter;
    static std::once_flag once;
    std::call_once(once, [] {
        if (!Py_IsInitialized()) {
            interpreter = std::make_unique<py::scoped_interpreter>();
            spdlog::debug("Started embedded Python interpreter");
        }
    });
}

PythonRuntime::PythonRuntime(codegen::Backend backend, std::string spark_app_name)
    : backend_(backend), spark_app_name_(std::move(spark_app_name)) {}

bool PythonRuntime::available() const {
    EmbeddedPython::ensure();
    py::gil_scoped_acquire gil;
    for (const char* module : required_modules(backend_)) {
        try {
            py::module_::import(module);
        } catch (py::error_already_set& e) {
            spdlog::debug("{} runtime unavailable: {}", codegen::backend_name(backend_), e.what());
            return false;
        }
    }
    return true;
}

std::shared_ptr<columnar::Table> PythonRuntime::execute(const std::string& program) {
    EmbeddedPython::ensure();
    spdlog::debug("Executing {} program ({} bytes)", codegen::backend_name(backend_), program.size());

    std::unique_lock<std::mutex> spark_lock;
    if (backend_ == codegen::Backend::SPARK) {
        spark_lock = std::unique_lock<std::mutex>(spark_mutex());
    }

    py::gil_scoped_acquire gil;
    try {
        switch (backend_) {
            case codegen::Backend::PANDAS: {
                py::dict scope = fresh_globals();
                scope["pd"] = py::module_::import("pandas");
                py::exec(program, scope);
                return frame_to_table(bound_result(scope));
            }

            case codegen::Backend::DUCKDB: {
                py::object connection = py::module_::import("duckdb").attr("connect")(":memory:");
                try {
                    py::object cursor = connection.attr("execute")(program);
                    // A program without statements leaves no result set
                    auto table = cursor.attr("description").is_none()
                        ? std::make_shared<columnar::Table>()
                        : frame_to_table(cursor.attr("df")());
                    connection.attr("close")();
                    return table;
                } catch (py::error_already_set&) {
                    connection.attr("close")();
                    throw;
                }
            }

            case codegen::Backend::SPARK: {
                py::object session = py::module_::import("pyspark.sql").attr("SparkSession")
                    .attr("builder").attr("appName")(spark_app_name_).attr("getOrCreate")();
                py::dict scope = fresh_globals();
                scope["spark"] = session;
                py::exec(program, scope);
                return frame_to_table(bound_result(scope).attr("toPandas")());
            }
        }
    } catch (py::error_already_set& e) {
        throw BackendError(e.what());
    }
    throw BackendError("Unknown backend");
}

void register_python_runtimes(RuntimeRegistry& registry, const std::string& spark_app_name) {
    registry.register_runtime(std::make_shared<PythonRuntime>(codegen::Backend::PANDAS));
    registry.register_runtime(std::make_shared<PythonRuntime>(codegen::Backend::DUCKDB));
    registry.register_runtime(std::make_shared<PythonRuntime>(codegen::Backend::SPARK, spark_app_name));
}

} // namespace runtime
} // namespace pipeforge
