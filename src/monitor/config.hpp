#pragma once
#include <cstdint>
#include <string>

namespace perfmon::monitor {

// Monitor service configuration
struct MonitorConfig {
    std::string bind_address = "127.0.0.1";
    uint16_t port = 1881;
    std::string sidebar_path = "assets/performance-monitor.html";
    int64_t lag_interval_ms = 1000;
    int64_t refresh_interval_ms = 2000;      // Initial settings value
    std::string cgroup_root = "/sys/fs/cgroup";
    std::string log_level = "info";

    // Defaults overridden by PERFMON_* environment variables
    static MonitorConfig from_env();
};

} // namespace perfmon::monitor
