/**
 * perfmon Monitor Service
 *
 * Owns every piece of process-wide state (platform probe, container
 * detection, CPU baselines, metrics cache, settings, lag gauge) and wires
 * them to the route table:
 * - TaskLoop (request serialization)
 * - LagProbe (event-loop lag timer)
 * - MetricsAggregator (cached snapshots)
 * - HttpServer (optional listener)
 */
#pragma once
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "metrics/aggregator.hpp"
#include "metrics/container.hpp"
#include "metrics/lag_probe.hpp"
#include "metrics/platform.hpp"
#include "metrics/samplers.hpp"
#include "monitor/config.hpp"
#include "monitor/http_server.hpp"
#include "monitor/module.hpp"
#include "monitor/route_handlers.hpp"
#include "monitor/router.hpp"
#include "monitor/settings_store.hpp"
#include "runtime/task_loop.hpp"

namespace perfmon::monitor {

// Version reported in every snapshot
const char* version();

class MonitorService {
public:
    using Config = MonitorConfig;

    explicit MonitorService(const Config& config);

    // Injection points for tests: a fake probe, a synthetic cgroup tree, a clock
    MonitorService(const Config& config,
                   std::unique_ptr<metrics::PlatformProbe> probe,
                   metrics::ContainerPaths container_paths,
                   metrics::Clock clock = metrics::Clock::system());

    ~MonitorService();

    // Non-copyable
    MonitorService(const MonitorService&) = delete;
    MonitorService& operator=(const MonitorService&) = delete;

    // Load the sidebar asset, register routes and start the lag probe
    bool init();

    // Start the HTTP listener on the configured address
    bool serve();

    // Stop listener, lag probe and task loop. Idempotent.
    void shutdown();

    bool is_running() const { return running_; }

    // Core operations
    metrics::CollectResult collect() { return aggregator_.collect(); }
    Settings settings() const { return settings_.get(); }
    Settings update_settings(const nlohmann::json& partial) { return settings_.update(partial); }
    const std::optional<std::string>& sidebar_html() const { return sidebar_html_; }

    // Dispatch a request on the task loop, as the listener does
    Response dispatch(const Request& request);

    const Config& get_config() const { return config_; }
    const Router& router() const { return router_; }
    runtime::TaskLoop& loop() { return loop_; }
    metrics::LagGauge& lag_gauge() { return lag_gauge_; }
    metrics::ContainerDetector& container() { return detector_; }
    metrics::ResourceSamplers& samplers() { return samplers_; }
    uint16_t port() const { return http_ ? http_->port() : config_.port; }

private:
    bool load_sidebar();

    Config config_;
    std::atomic<bool> running_{false};

    std::unique_ptr<metrics::PlatformProbe> probe_;
    metrics::ContainerDetector detector_;
    metrics::ResourceSamplers samplers_;
    metrics::LagGauge lag_gauge_;
    SettingsStore settings_;
    metrics::MetricsAggregator aggregator_;

    std::optional<std::string> sidebar_html_;
    RouteContext route_context_;
    std::vector<std::unique_ptr<RouteModule>> modules_;
    Router router_;

    runtime::TaskLoop loop_;
    metrics::LagProbe lag_probe_;
    std::unique_ptr<HttpServer> http_;
};

} // namespace perfmon::monitor
