#include "monitor/config.hpp"
#include "core/config.hpp"
#include <spdlog/spdlog.h>

namespace perfmon::monitor {

namespace env = core::config;

MonitorConfig MonitorConfig::from_env() {
    MonitorConfig config;

    config.bind_address = env::get_env_or("PERFMON_HOST", config.bind_address);
    config.sidebar_path = env::get_env_or("PERFMON_SIDEBAR_PATH", config.sidebar_path);
    config.cgroup_root = env::get_env_or("PERFMON_CGROUP_ROOT", config.cgroup_root);
    config.log_level = env::get_env_or("PERFMON_LOG_LEVEL", config.log_level);

    if (auto port = env::get_env_long("PERFMON_PORT")) {
        if (*port > 0 && *port <= 65535) {
            config.port = static_cast<uint16_t>(*port);
        } else {
            spdlog::warn("Ignoring PERFMON_PORT={}: out of range", *port);
        }
    }

    if (auto lag = env::get_env_long("PERFMON_LAG_INTERVAL_MS")) {
        if (*lag > 0) {
            config.lag_interval_ms = *lag;
        } else {
            spdlog::warn("Ignoring PERFMON_LAG_INTERVAL_MS={}: must be positive", *lag);
        }
    }

    if (auto refresh = env::get_env_long("PERFMON_REFRESH_INTERVAL_MS")) {
        if (*refresh > 0) {
            config.refresh_interval_ms = *refresh;
        } else {
            spdlog::warn("Ignoring PERFMON_REFRESH_INTERVAL_MS={}: must be positive", *refresh);
        }
    }

    return config;
}

} // namespace perfmon::monitor
