#pragma once

#include <spdlog/common.h>

// 0 -> warn, 1 -> info, 2+ -> debug
spdlog::level::level_enum level_for_verbosity(int verbosity);

// Colour stderr logger as the spdlog default, "%H:%M:%S [level] message".
void configure_logging(int verbosity);
