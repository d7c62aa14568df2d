/**
 * perfmon Metrics Model
 *
 * Value types produced by the resource samplers and assembled by the
 * aggregator into a single snapshot. Every type knows its JSON shape.
 */
#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include <sys/types.h>
#include <nlohmann/json.hpp>

namespace perfmon::metrics {

/**
 * Outcome of a single sampler call. FALLBACK means the platform source was
 * missing or failed and the value is the documented default.
 */
enum class SampleOutcome {
    OK,
    FALLBACK
};

template <typename T>
struct Sample {
    T value{};
    SampleOutcome outcome = SampleOutcome::OK;
    std::string reason;             // Why the fallback was taken

    bool ok() const { return outcome == SampleOutcome::OK; }

    static Sample success(T v) {
        return Sample{std::move(v), SampleOutcome::OK, {}};
    }

    static Sample fallback(T v, std::string why) {
        return Sample{std::move(v), SampleOutcome::FALLBACK, std::move(why)};
    }
};

// round(part / total * 1000) / 10, clamped to [0, 100]; 0 when total is 0
double used_percent(uint64_t part, uint64_t total);

// Round to one / two decimal places
double round1(double value);
double round2(double value);

/**
 * Memory block (bytes). Used for host memory and for a container's
 * cgroup-limited view.
 */
struct MemoryUsage {
    uint64_t total = 0;
    uint64_t used = 0;
    uint64_t free = 0;
    uint64_t available = 0;
    double used_percent = 0.0;

    // Derive used/free/available/percent from a total and a free figure
    static MemoryUsage from_total_free(uint64_t total, uint64_t free);

    nlohmann::json to_json() const;
};

/**
 * Root filesystem usage (bytes)
 */
struct DiskUsage {
    std::string mount = "/";
    uint64_t total = 0;
    uint64_t used = 0;
    uint64_t available = 0;
    double used_percent = 0.0;

    nlohmann::json to_json() const;
};

struct CpuInfo {
    int cores = 0;
    double effective_cores = 0.0;   // Container quota in cores, else cores
    std::string model = "Unknown";
    double speed_mhz = 0.0;

    nlohmann::json to_json() const;
};

// Cumulative counters since boot, loopback excluded
struct NetworkUsage {
    uint64_t bytes_received = 0;
    uint64_t bytes_sent = 0;
    uint64_t packets_received = 0;
    uint64_t packets_sent = 0;

    nlohmann::json to_json() const;
};

using LoadAverage = std::array<double, 3>;

/**
 * Memory of the sampling process itself. Heap figures come from the C
 * allocator's statistics where the platform exposes them.
 */
struct ProcessMemory {
    uint64_t rss = 0;
    uint64_t heap_total = 0;        // Bytes obtained from the OS by the allocator
    uint64_t heap_used = 0;         // Bytes in live allocations
    uint64_t external = 0;          // Bytes in mmapped chunks outside the arena
    uint64_t extra_allocated = 0;   // Free bytes retained by the allocator
    double percent_of_system = 0.0;

    nlohmann::json to_json() const;
};

struct SystemMetrics {
    std::string platform;
    std::string architecture;
    std::string hostname;
    double cpu_percent = 0.0;
    CpuInfo cpu;
    MemoryUsage memory;
    DiskUsage disk;
    NetworkUsage network;
    LoadAverage load_average{};
    double uptime_seconds = 0.0;

    nlohmann::json to_json() const;
};

struct ProcessMetrics {
    pid_t pid = 0;
    double uptime_seconds = 0.0;
    double cpu_percent = 0.0;
    ProcessMemory memory;
    double event_loop_lag_ms = 0.0;

    nlohmann::json to_json() const;
};

/**
 * Unified metrics record served by the stats endpoint
 */
struct MetricsSnapshot {
    int64_t timestamp_ms = 0;
    bool is_containerized = false;
    std::string version;
    SystemMetrics system;
    ProcessMetrics process;

    nlohmann::json to_json() const;
};

} // namespace perfmon::metrics
