#include "metrics/metrics.hpp"
#include <algorithm>
#include <cmath>

namespace perfmon::metrics {

double used_percent(uint64_t part, uint64_t total) {
    if (total == 0) {
        return 0.0;
    }
    double percent = std::round(static_cast<double>(part) / static_cast<double>(total) * 1000.0) / 10.0;
    return std::clamp(percent, 0.0, 100.0);
}

double round1(double value) {
    return std::round(value * 10.0) / 10.0;
}

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

MemoryUsage MemoryUsage::from_total_free(uint64_t total, uint64_t free) {
    MemoryUsage usage;
    usage.total = total;
    usage.free = free;
    usage.available = free;
    usage.used = total > free ? total - free : 0;
    usage.used_percent = metrics::used_percent(usage.used, usage.total);
    return usage;
}

// ============================================================================
// JSON Conversion
// ============================================================================

nlohmann::json MemoryUsage::to_json() const {
    return nlohmann::json{
        {"total", total},
        {"used", used},
        {"free", free},
        {"available", available},
        {"usedPercent", used_percent}
    };
}

nlohmann::json DiskUsage::to_json() const {
    return nlohmann::json{
        {"mount", mount},
        {"total", total},
        {"used", used},
        {"available", available},
        {"usedPercent", used_percent}
    };
}

nlohmann::json CpuInfo::to_json() const {
    return nlohmann::json{
        {"cores", cores},
        {"effectiveCores", effective_cores},
        {"model", model},
        {"speedMHz", speed_mhz}
    };
}

nlohmann::json NetworkUsage::to_json() const {
    return nlohmann::json{
        {"bytesReceived", bytes_received},
        {"bytesSent", bytes_sent},
        {"packetsReceived", packets_received},
        {"packetsSent", packets_sent}
    };
}

nlohmann::json ProcessMemory::to_json() const {
    return nlohmann::json{
        {"rss", rss},
        {"heapTotal", heap_total},
        {"heapUsed", heap_used},
        {"external", external},
        {"extraAllocated", extra_allocated},
        {"percentOfSystem", percent_of_system}
    };
}

nlohmann::json SystemMetrics::to_json() const {
    nlohmann::json cpu_json = cpu.to_json();
    cpu_json["percent"] = cpu_percent;

    return nlohmann::json{
        {"platform", platform},
        {"architecture", architecture},
        {"hostname", hostname},
        {"cpu", cpu_json},
        {"memory", memory.to_json()},
        {"disk", disk.to_json()},
        {"network", network.to_json()},
        {"loadAverage", load_average},
        {"uptimeSeconds", uptime_seconds}
    };
}

nlohmann::json ProcessMetrics::to_json() const {
    return nlohmann::json{
        {"pid", pid},
        {"uptimeSeconds", uptime_seconds},
        {"cpuPercent", cpu_percent},
        {"memory", memory.to_json()},
        {"eventLoopLagMs", event_loop_lag_ms}
    };
}

nlohmann::json MetricsSnapshot::to_json() const {
    return nlohmann::json{
        {"timestampMs", timestamp_ms},
        {"isContainerized", is_containerized},
        {"version", version},
        {"system", system.to_json()},
        {"process", process.to_json()}
    };
}

} // namespace perfmon::metrics
