#include "metrics/samplers.hpp"
#include "metrics/container.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace perfmon::metrics {

Clock Clock::system() {
    return Clock{
        []() {
            return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count());
        },
        []() { return std::chrono::steady_clock::now(); }
    };
}

ResourceSamplers::ResourceSamplers(const PlatformProbe& probe, ContainerDetector& detector, Clock clock)
    : probe_(probe), detector_(detector), clock_(std::move(clock)) {
    try {
        baseline_.process = probe_.process_cpu_time();
    } catch (const ProbeError& e) {
        spdlog::warn("Initial process CPU time unavailable: {}", e.what());
    }
    baseline_.taken = clock_.monotonic();
}

// ============================================================================
// Memory
// ============================================================================

std::optional<MemoryUsage> ResourceSamplers::container_memory() {
    ContainerInfo info = detector_.detect();
    if (!info.is_containerized || !info.memory_limit_bytes) {
        return std::nullopt;
    }

    uint64_t limit = *info.memory_limit_bytes;
    uint64_t usage = detector_.memory_usage().value_or(0);

    MemoryUsage memory;
    memory.total = limit;
    memory.used = usage;
    memory.free = limit > usage ? limit - usage : 0;
    memory.available = memory.free;
    memory.used_percent = used_percent(usage, limit);
    return memory;
}

Sample<MemoryUsage> ResourceSamplers::system_memory() {
    if (auto container = container_memory()) {
        return Sample<MemoryUsage>::success(*container);
    }

    uint64_t total = probe_.total_memory();
    if (auto available = probe_.available_memory()) {
        return Sample<MemoryUsage>::success(MemoryUsage::from_total_free(total, *available));
    }

    auto memory = MemoryUsage::from_total_free(total, probe_.free_memory());
    if (probe_.os() == "linux" || probe_.os() == "darwin") {
        return Sample<MemoryUsage>::fallback(memory, "available memory unreadable, using free memory");
    }
    return Sample<MemoryUsage>::success(memory);
}

// ============================================================================
// CPU
// ============================================================================

double ResourceSamplers::cpu_percent() {
    ProcessCpuTime current = probe_.process_cpu_time();
    auto now = clock_.monotonic();

    std::lock_guard<std::mutex> lock(baseline_mutex_);

    double elapsed_ms = std::chrono::duration<double, std::milli>(now - baseline_.taken).count();
    if (elapsed_ms <= 0.0) {
        return 0.0;
    }

    // Counters only move forward; a smaller reading means the baseline is bogus
    auto delta = [](uint64_t now_us, uint64_t then_us) {
        return now_us > then_us ? now_us - then_us : 0;
    };
    uint64_t cpu_us = delta(current.user_us, baseline_.process.user_us) +
                      delta(current.system_us, baseline_.process.system_us);

    double percent = (static_cast<double>(cpu_us) / 1000.0) / elapsed_ms * 100.0;

    baseline_.process = current;
    baseline_.taken = now;

    return std::clamp(percent, 0.0, 100.0);
}

double ResourceSamplers::system_cpu_percent() {
    uint64_t total_idle = 0;
    uint64_t total_tick = 0;
    for (const auto& core : probe_.cpus()) {
        total_idle += core.times.idle_total();
        total_tick += core.times.total();
    }

    std::lock_guard<std::mutex> lock(baseline_mutex_);

    double percent = 0.0;
    if (baseline_.has_system && total_tick > baseline_.system_total) {
        uint64_t total_diff = total_tick - baseline_.system_total;
        uint64_t idle_diff = total_idle > baseline_.system_idle ? total_idle - baseline_.system_idle : 0;
        percent = 100.0 - (100.0 * static_cast<double>(idle_diff) / static_cast<double>(total_diff));
    }

    baseline_.has_system = true;
    baseline_.system_idle = total_idle;
    baseline_.system_total = total_tick;

    return std::clamp(percent, 0.0, 100.0);
}

CpuInfo ResourceSamplers::cpu_info() {
    auto cores = probe_.cpus();
    ContainerInfo container = detector_.detect();

    CpuInfo info;
    info.cores = static_cast<int>(cores.size());
    info.effective_cores = container.cpu_limit_cores.value_or(static_cast<double>(info.cores));
    if (!cores.empty()) {
        if (!cores.front().model.empty()) {
            info.model = cores.front().model;
        }
        info.speed_mhz = cores.front().speed_mhz;
    }
    return info;
}

void ResourceSamplers::reset_cpu_baseline() {
    ProcessCpuTime current = probe_.process_cpu_time();
    std::lock_guard<std::mutex> lock(baseline_mutex_);
    baseline_.process = current;
    baseline_.taken = clock_.monotonic();
}

// ============================================================================
// Disk, network, load
// ============================================================================

Sample<DiskUsage> ResourceSamplers::disk_usage() {
    DiskUsage fallback;

    if (!probe_.has_fs_stats()) {
        return Sample<DiskUsage>::fallback(fallback, "filesystem statistics unsupported");
    }

    std::string mount = probe_.root_mount();
    FsStats stats;
    try {
        stats = probe_.fs_stats(mount);
    } catch (const ProbeError& e) {
        return Sample<DiskUsage>::fallback(fallback, e.what());
    }

    DiskUsage disk;
    disk.mount = mount;
    disk.total = stats.blocks * stats.block_size;
    uint64_t free = stats.free_blocks * stats.block_size;
    disk.available = stats.available_blocks * stats.block_size;
    disk.used = disk.total > free ? disk.total - free : 0;
    disk.used_percent = used_percent(disk.used, disk.total);
    return Sample<DiskUsage>::success(disk);
}

Sample<NetworkUsage> ResourceSamplers::network_usage() {
    if (auto counters = probe_.network_counters()) {
        return Sample<NetworkUsage>::success(*counters);
    }
    return Sample<NetworkUsage>::fallback(NetworkUsage{}, "network counters unavailable");
}

Sample<LoadAverage> ResourceSamplers::load_average() {
    if (auto load = probe_.load_average()) {
        return Sample<LoadAverage>::success(*load);
    }
    return Sample<LoadAverage>::fallback(LoadAverage{}, "load average unavailable");
}

ProcessMemory ResourceSamplers::process_memory(uint64_t system_total) {
    AllocatorStats heap = probe_.allocator_stats();

    ProcessMemory memory;
    memory.rss = probe_.process_rss();
    memory.heap_total = heap.heap_total;
    memory.heap_used = heap.heap_used;
    memory.external = heap.external;
    memory.extra_allocated = heap.extra_allocated;
    if (system_total > 0) {
        double percent = static_cast<double>(memory.rss) / static_cast<double>(system_total) * 100.0;
        memory.percent_of_system = std::clamp(percent, 0.0, 100.0);
    }
    return memory;
}

} // namespace perfmon::metrics
