#include "pipeforge_ir/options.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stdexcept>

namespace pipeforge {

namespace {

long positive_integer(const char* name, const char* value) {
    char* end = nullptr;
    long parsed = std::strtol(value, &end, 10);
    if (end == value || *end != '\0' || parsed <= 0) {
        throw std::invalid_argument(std::string(name) + " must be a positive integer, got '" + value + "'");
    }
    return parsed;
}

} // namespace

EngineOptions EngineOptions::from_env() {
    EngineOptions options;

    if (const char* v = std::getenv("PIPEFORGE_SAMPLE_LIMIT")) {
        options.sample_limit = static_cast<size_t>(positive_integer("PIPEFORGE_SAMPLE_LIMIT", v));
    }
    if (const char* v = std::getenv("PIPEFORGE_OPTIMIZER_PASSES")) {
        options.optimizer_passes = static_cast<int>(positive_integer("PIPEFORGE_OPTIMIZER_PASSES", v));
    }
    if (const char* v = std::getenv("PIPEFORGE_TMPDIR")) {
        options.staging_root = v;
    }
    if (const char* v = std::getenv("PIPEFORGE_LOG_LEVEL")) {
        options.log_level = v;
    }
    return options;
}

void EngineOptions::apply_log_level() const {
    auto level = spdlog::level::from_str(log_level);
    if (level == spdlog::level::off && log_level != "off") {
        throw std::invalid_argument("Unknown log level '" + log_level + "'");
    }
    spdlog::set_level(level);
}

} // namespace pipeforge
