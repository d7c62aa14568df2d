#include "monitor/monitor.hpp"
#include "core/paths.hpp"
#include "metrics/procfs.hpp"
#include <spdlog/spdlog.h>

#ifndef PERFMON_VERSION
#define PERFMON_VERSION "0.0.0"
#endif

namespace perfmon::monitor {

namespace {

metrics::ContainerPaths container_paths_from(const MonitorConfig& config) {
    metrics::ContainerPaths paths;
    paths.cgroup_root = config.cgroup_root;
    return paths;
}

Settings initial_settings(const MonitorConfig& config) {
    Settings settings;
    if (config.refresh_interval_ms > 0) {
        settings.refresh_interval_ms = config.refresh_interval_ms;
    }
    return settings;
}

} // namespace

const char* version() {
    return PERFMON_VERSION;
}

MonitorService::MonitorService(const Config& config)
    : MonitorService(config, metrics::make_platform_probe(), container_paths_from(config)) {}

MonitorService::MonitorService(const Config& config,
                               std::unique_ptr<metrics::PlatformProbe> probe,
                               metrics::ContainerPaths container_paths,
                               metrics::Clock clock)
    : config_(config),
      probe_(std::move(probe)),
      detector_(*probe_, std::move(container_paths)),
      samplers_(*probe_, detector_, clock),
      settings_(initial_settings(config)),
      aggregator_(*probe_, detector_, samplers_, lag_gauge_,
                  [this]() { return settings_.refresh_interval_ms(); },
                  version(), clock),
      route_context_{aggregator_, settings_, sidebar_html_},
      loop_(1),
      lag_probe_(loop_, lag_gauge_, std::chrono::milliseconds(config.lag_interval_ms)) {}

MonitorService::~MonitorService() {
    shutdown();
}

bool MonitorService::init() {
    if (running_) {
        return true;
    }

    load_sidebar();

    modules_.push_back(std::make_unique<StatsRoutes>(route_context_));
    modules_.push_back(std::make_unique<SettingsRoutes>(route_context_));
    modules_.push_back(std::make_unique<SidebarRoutes>(route_context_));
    for (auto& module : modules_) {
        module->register_routes(router_);
    }

    // Detect up front so the first request does not pay for it
    detector_.detect();

    lag_probe_.start();
    running_ = true;

    spdlog::info("Performance monitor loaded (v{}, platform={}, refresh={}ms)",
                 version(), probe_->os(), settings_.refresh_interval_ms());
    return true;
}

bool MonitorService::serve() {
    if (!running_ && !init()) {
        return false;
    }
    if (http_ && http_->is_running()) {
        return true;
    }

    http_ = std::make_unique<HttpServer>(config_.bind_address, config_.port, router_, loop_);
    if (!http_->start()) {
        http_.reset();
        return false;
    }
    return true;
}

void MonitorService::shutdown() {
    bool was_running = running_.exchange(false);

    if (http_) {
        http_->stop();
    }
    lag_probe_.stop();
    loop_.stop();

    if (was_running) {
        spdlog::info("Performance monitor stopped");
    }
}

Response MonitorService::dispatch(const Request& request) {
    auto response = loop_.call([this, &request]() { return router_.handle(request); });
    if (!response) {
        return Response::json(503, nlohmann::json{{"error", "shutting down"}}.dump());
    }
    return *response;
}

bool MonitorService::load_sidebar() {
    auto path = core::paths::locate(config_.sidebar_path);
    if (!path) {
        spdlog::warn("Sidebar asset {} not found; {} will answer 404", config_.sidebar_path, SIDEBAR_PATH);
        return false;
    }

    auto content = metrics::procfs::read_file(*path);
    if (!content) {
        spdlog::warn("Sidebar asset {} unreadable", path->string());
        return false;
    }

    sidebar_html_ = std::move(*content);
    spdlog::debug("Loaded sidebar asset {} ({} bytes)", path->string(), sidebar_html_->size());
    return true;
}

} // namespace perfmon::monitor
