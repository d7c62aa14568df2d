#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace perfmon::core {

// Initialize logging with colored console output
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse a level name ("debug", "warn", ...); unknown names map to info.
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace perfmon::core
