#include "core/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace perfmon::core {

void init_logger() {
    auto logger = spdlog::get("perfmon");
    if (!logger) {
        logger = spdlog::stdout_color_mt("perfmon");
    }
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str returns off for names it does not know
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace perfmon::core
