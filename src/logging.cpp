#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "logging.h"

spdlog::level::level_enum level_for_verbosity(int verbosity) {
    if (verbosity <= 0) return spdlog::level::warn;
    if (verbosity == 1) return spdlog::level::info;
    return spdlog::level::debug;
}

void configure_logging(int verbosity) {
    // Snapshots go to stdout, so diagnostics stay on stderr
    auto logger = spdlog::get("microbit");
    if (!logger) logger = spdlog::stderr_color_mt("microbit");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("%H:%M:%S [%^%l%$] %v");
    spdlog::set_level(level_for_verbosity(verbosity));
}
