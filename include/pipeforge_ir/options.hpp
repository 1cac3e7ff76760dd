#pragma once

#include <cstddef>
#include <string>

namespace pipeforge {

/**
 * Engine configuration. Defaults suit an interactive preview server;
 * from_env() layers PIPEFORGE_* environment variables on top.
 */
struct EngineOptions {
    size_t sample_limit = 200;                         // rows hashed by validate, rows in previews
    int optimizer_passes = 1;                          // fusion sweeps per optimize()
    std::string staging_root;                          // empty = system temp directory
    std::string staging_prefix = "pipeforge_uploads_";
    std::string spark_app_name = "pipeforge";
    std::string log_level = "info";                    // spdlog level name

    /**
     * Reads PIPEFORGE_SAMPLE_LIMIT, PIPEFORGE_OPTIMIZER_PASSES,
     * PIPEFORGE_TMPDIR and PIPEFORGE_LOG_LEVEL. Unset variables keep the
     * defaults; malformed ones throw std::invalid_argument.
     */
    static EngineOptions from_env();

    // Sets the default spdlog logger's level from log_level
    void apply_log_level() const;
};

} // namespace pipeforge
