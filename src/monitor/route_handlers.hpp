#pragma once
#include <optional>
#include <string>
#include "monitor/module.hpp"
#include "monitor/router.hpp"

namespace perfmon::metrics {
class MetricsAggregator;
}

namespace perfmon::monitor {

class SettingsStore;

inline constexpr const char* STATS_PATH = "/performance-monitor/stats";
inline constexpr const char* SETTINGS_PATH = "/performance-monitor/settings";
inline constexpr const char* SIDEBAR_PATH = "/performance-monitor/sidebar";

// Service state the handlers work against
struct RouteContext {
    metrics::MetricsAggregator& aggregator;
    SettingsStore& settings;
    const std::optional<std::string>& sidebar_html;
};

class StatsRoutes : public RouteModule {
public:
    explicit StatsRoutes(RouteContext& context) : context_(context) {}
    void register_routes(Router& router) override;

private:
    Response handle_stats(const Request& request);

    RouteContext& context_;
};

class SettingsRoutes : public RouteModule {
public:
    explicit SettingsRoutes(RouteContext& context) : context_(context) {}
    void register_routes(Router& router) override;

private:
    Response handle_get(const Request& request);
    Response handle_update(const Request& request);

    RouteContext& context_;
};

class SidebarRoutes : public RouteModule {
public:
    explicit SidebarRoutes(RouteContext& context) : context_(context) {}
    void register_routes(Router& router) override;

private:
    Response handle_sidebar(const Request& request);

    RouteContext& context_;
};

} // namespace perfmon::monitor
