#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include "core/config.hpp"
#include "core/logger.hpp"
#include "monitor/monitor.hpp"

namespace {

volatile std::sig_atomic_t g_running = 1;

void signal_handler(int) {
    g_running = 0;
}

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--help] [--version]\n"
              << "\n"
              << "Serves host metrics on /performance-monitor/*.\n"
              << "Configuration is read from PERFMON_* environment variables or a .env file:\n"
              << "  PERFMON_HOST, PERFMON_PORT, PERFMON_SIDEBAR_PATH, PERFMON_LAG_INTERVAL_MS,\n"
              << "  PERFMON_REFRESH_INTERVAL_MS, PERFMON_CGROUP_ROOT, PERFMON_LOG_LEVEL\n";
}

} // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--version") {
            std::cout << "perfmond " << perfmon::monitor::version() << "\n";
            return 0;
        }
        std::cerr << "Unknown argument: " << arg << "\n";
        print_usage(argv[0]);
        return 2;
    }

    perfmon::core::init_logger();
    perfmon::core::config::load_dotenv();

    auto config = perfmon::monitor::MonitorConfig::from_env();
    perfmon::core::set_log_level(perfmon::core::parse_log_level(config.log_level));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    perfmon::monitor::MonitorService service(config);
    if (!service.init() || !service.serve()) {
        spdlog::critical("Failed to start performance monitor");
        return 1;
    }

    while (g_running && service.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    service.shutdown();
    return 0;
}
