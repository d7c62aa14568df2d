/**
 * Metrics aggregator
 *
 * Runs every sampler, assembles a MetricsSnapshot and caches it. Requests
 * arriving within half the configured refresh interval are served from the
 * cache, so staleness never exceeds one full interval.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "metrics/metrics.hpp"
#include "metrics/samplers.hpp"

namespace perfmon::metrics {

class ContainerDetector;
class LagGauge;
class PlatformProbe;

struct CollectResult {
    std::optional<MetricsSnapshot> snapshot;
    bool from_cache = false;        // Served without sampling
    bool stale = false;             // Sampling failed; snapshot is the last good one
    std::string error;              // Set when sampling failed

    bool ok() const { return snapshot.has_value(); }

    // The snapshot, or {"error": ...} when there is none
    nlohmann::json to_json() const;
};

class MetricsAggregator {
public:
    using RefreshIntervalFn = std::function<int64_t()>;

    MetricsAggregator(const PlatformProbe& probe,
                      ContainerDetector& detector,
                      ResourceSamplers& samplers,
                      const LagGauge& lag,
                      RefreshIntervalFn refresh_interval_ms,
                      std::string version,
                      Clock clock = Clock::system());

    MetricsAggregator(const MetricsAggregator&) = delete;
    MetricsAggregator& operator=(const MetricsAggregator&) = delete;

    /**
     * Current metrics. Never throws: a sampling failure is logged and
     * answered with the last good snapshot, or an error if there is none.
     */
    CollectResult collect();

    // Drop the cached snapshot
    void invalidate();

private:
    MetricsSnapshot sample(int64_t now_ms);

    struct Cache {
        std::optional<MetricsSnapshot> snapshot;
        std::chrono::steady_clock::time_point taken;
    };

    const PlatformProbe& probe_;
    ContainerDetector& detector_;
    ResourceSamplers& samplers_;
    const LagGauge& lag_;
    RefreshIntervalFn refresh_interval_ms_;
    std::string version_;
    Clock clock_;

    Cache cache_;
    std::mutex mutex_;
};

} // namespace perfmon::metrics
