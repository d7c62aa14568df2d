/**
 * Resource samplers
 *
 * Independent readers for memory, CPU, disk, network and load. Samplers that
 * have a documented fallback return Sample<T> and never throw; the CPU
 * samplers are diff-based and mutate their baseline on every call.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include "metrics/metrics.hpp"
#include "metrics/platform.hpp"

namespace perfmon::metrics {

class ContainerDetector;

/**
 * Time sources used by samplers and the aggregator. Replaceable so tests can
 * drive elapsed time deterministically.
 */
struct Clock {
    std::function<int64_t()> wall_ms;                                   // Epoch milliseconds
    std::function<std::chrono::steady_clock::time_point()> monotonic;

    static Clock system();
};

class ResourceSamplers {
public:
    ResourceSamplers(const PlatformProbe& probe, ContainerDetector& detector, Clock clock = Clock::system());

    ResourceSamplers(const ResourceSamplers&) = delete;
    ResourceSamplers& operator=(const ResourceSamplers&) = delete;

    /**
     * cgroup-limited memory view. nullopt unless containerized with a known
     * memory limit. An unreadable usage file counts as zero usage.
     */
    std::optional<MemoryUsage> container_memory();

    /**
     * Container memory when confined, otherwise host memory refined by the
     * platform's available-memory figure. FALLBACK when the refinement was
     * unavailable and raw free memory was used.
     */
    Sample<MemoryUsage> system_memory();

    /**
     * Process CPU percent since the previous call, clamped to [0, 100].
     * Returns 0 when no wall time has elapsed. Resets the baseline.
     * Throws ProbeError if process CPU time cannot be read.
     */
    double cpu_percent();

    /**
     * Host-wide CPU percent since the previous call across all cores,
     * clamped to [0, 100]. The first call returns 0.
     */
    double system_cpu_percent();

    CpuInfo cpu_info();

    /**
     * Root filesystem usage. FALLBACK (all zero, mount "/") when the
     * platform has no statistics call or the call fails.
     */
    Sample<DiskUsage> disk_usage();

    Sample<NetworkUsage> network_usage();
    Sample<LoadAverage> load_average();

    // Process memory; percent_of_system is relative to system_total
    ProcessMemory process_memory(uint64_t system_total);

    // Restart process CPU accounting from now
    void reset_cpu_baseline();

private:
    struct CpuBaseline {
        ProcessCpuTime process;
        std::chrono::steady_clock::time_point taken;
        bool has_system = false;
        uint64_t system_idle = 0;
        uint64_t system_total = 0;
    };

    const PlatformProbe& probe_;
    ContainerDetector& detector_;
    Clock clock_;

    CpuBaseline baseline_;
    std::mutex baseline_mutex_;
};

} // namespace perfmon::metrics
