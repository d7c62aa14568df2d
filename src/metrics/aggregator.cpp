#include "metrics/aggregator.hpp"
#include "metrics/container.hpp"
#include "metrics/lag_probe.hpp"
#include "metrics/platform.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace perfmon::metrics {

namespace {

template <typename T>
T take(const Sample<T>& sample, const char* what) {
    if (!sample.ok()) {
        spdlog::debug("{} fell back to defaults: {}", what, sample.reason);
    }
    return sample.value;
}

} // namespace

nlohmann::json CollectResult::to_json() const {
    if (snapshot) {
        return snapshot->to_json();
    }
    return nlohmann::json{{"error", error.empty() ? std::string("metrics unavailable") : error}};
}

MetricsAggregator::MetricsAggregator(const PlatformProbe& probe,
                                     ContainerDetector& detector,
                                     ResourceSamplers& samplers,
                                     const LagGauge& lag,
                                     RefreshIntervalFn refresh_interval_ms,
                                     std::string version,
                                     Clock clock)
    : probe_(probe),
      detector_(detector),
      samplers_(samplers),
      lag_(lag),
      refresh_interval_ms_(std::move(refresh_interval_ms)),
      version_(std::move(version)),
      clock_(std::move(clock)) {}

CollectResult MetricsAggregator::collect() {
    std::lock_guard<std::mutex> lock(mutex_);

    int64_t now = clock_.wall_ms();
    auto taken = clock_.monotonic();
    int64_t half_interval = refresh_interval_ms_() / 2;

    CollectResult result;
    // Cache age is measured on the monotonic clock; wall time may step
    if (cache_.snapshot &&
        std::chrono::duration_cast<std::chrono::milliseconds>(taken - cache_.taken).count() < half_interval) {
        result.snapshot = cache_.snapshot;
        result.from_cache = true;
        return result;
    }

    try {
        MetricsSnapshot snapshot = sample(now);
        cache_.snapshot = snapshot;
        cache_.taken = taken;
        result.snapshot = std::move(snapshot);
    } catch (const std::exception& e) {
        spdlog::error("Performance monitor: error collecting metrics - {}", e.what());
        result.error = e.what();
        if (cache_.snapshot) {
            result.snapshot = cache_.snapshot;
            result.stale = true;
        }
    }
    return result;
}

void MetricsAggregator::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_ = Cache{};
}

MetricsSnapshot MetricsAggregator::sample(int64_t now_ms) {
    MetricsSnapshot snapshot;
    snapshot.timestamp_ms = now_ms;
    snapshot.version = version_;

    MemoryUsage memory = take(samplers_.system_memory(), "System memory");
    double process_cpu = samplers_.cpu_percent();
    CpuInfo cpu = samplers_.cpu_info();
    DiskUsage disk = take(samplers_.disk_usage(), "Disk usage");
    double system_cpu = samplers_.system_cpu_percent();
    ContainerInfo container = detector_.detect();

    snapshot.is_containerized = container.is_containerized;

    SystemMetrics& system = snapshot.system;
    system.platform = probe_.os();
    system.architecture = probe_.architecture();
    system.hostname = probe_.hostname();
    system.cpu_percent = round1(system_cpu);
    system.cpu = cpu;
    system.memory = memory;
    system.disk = disk;
    system.network = take(samplers_.network_usage(), "Network counters");
    system.load_average = take(samplers_.load_average(), "Load average");
    system.uptime_seconds = probe_.system_uptime_seconds();

    ProcessMetrics& process = snapshot.process;
    process.pid = probe_.pid();
    process.uptime_seconds = probe_.process_uptime_seconds();
    process.cpu_percent = round1(process_cpu);
    process.memory = samplers_.process_memory(memory.total);
    process.event_loop_lag_ms = round2(lag_.read());

    return snapshot;
}

} // namespace perfmon::metrics
