/**
 * Linux platform probe - reads sysinfo(2), /proc and /sys.
 */

#ifdef __linux__

#include "metrics/platform.hpp"
#include <cstdlib>
#include <malloc.h>
#include <unistd.h>
#include <sys/sysinfo.h>

namespace perfmon::metrics {

namespace {

bool read_sysinfo(struct sysinfo& si) {
    return sysinfo(&si) == 0;
}

double cpufreq_mhz(size_t core) {
    auto text = procfs::read_file("/sys/devices/system/cpu/cpu" + std::to_string(core) +
                                  "/cpufreq/scaling_cur_freq");
    if (!text) return 0.0;
    auto khz = procfs::parse_uint64(*text);
    return khz ? static_cast<double>(*khz) / 1000.0 : 0.0;
}

} // namespace

uint64_t LinuxProbe::total_memory() const {
    struct sysinfo si;
    if (!read_sysinfo(si)) return PosixProbe::total_memory();
    return static_cast<uint64_t>(si.totalram) * si.mem_unit;
}

uint64_t LinuxProbe::free_memory() const {
    struct sysinfo si;
    if (!read_sysinfo(si)) return PosixProbe::free_memory();
    return static_cast<uint64_t>(si.freeram) * si.mem_unit;
}

std::optional<uint64_t> LinuxProbe::available_memory() const {
    auto content = procfs::read_file("/proc/meminfo");
    if (!content) return std::nullopt;
    return procfs::parse_meminfo_available(*content);
}

std::vector<CpuCore> LinuxProbe::cpus() const {
    auto stat = procfs::read_file("/proc/stat");
    if (!stat) return PosixProbe::cpus();

    auto times = procfs::parse_proc_stat(*stat);
    if (times.empty()) return PosixProbe::cpus();

    std::vector<procfs::CpuModel> models;
    if (auto cpuinfo = procfs::read_file("/proc/cpuinfo")) {
        models = procfs::parse_cpuinfo(*cpuinfo);
    }

    std::vector<CpuCore> cores(times.size());
    for (size_t i = 0; i < times.size(); ++i) {
        cores[i].times = times[i];
        if (i < models.size()) {
            cores[i].model = models[i].model;
            cores[i].speed_mhz = models[i].speed_mhz;
        } else if (!models.empty()) {
            cores[i].model = models.front().model;
        }
        // ARM kernels omit "cpu MHz"; cpufreq has the current clock
        if (cores[i].speed_mhz <= 0.0) {
            cores[i].speed_mhz = cpufreq_mhz(i);
        }
    }
    return cores;
}

uint64_t LinuxProbe::process_rss() const {
    auto content = procfs::read_file("/proc/self/statm");
    if (!content) return PosixProbe::process_rss();

    auto pages = procfs::parse_statm_resident(*content);
    if (!pages) {
        throw ProbeError("unparseable /proc/self/statm");
    }
    return *pages * static_cast<uint64_t>(sysconf(_SC_PAGESIZE));
}

AllocatorStats LinuxProbe::allocator_stats() const {
    AllocatorStats stats;
#if defined(__GLIBC__) && (__GLIBC__ > 2 || (__GLIBC__ == 2 && __GLIBC_MINOR__ >= 33))
    struct mallinfo2 info = mallinfo2();
    stats.heap_total = info.arena + info.hblkhd;
    stats.heap_used = info.uordblks + info.hblkhd;
    stats.external = info.hblkhd;
    stats.extra_allocated = info.fordblks;
#endif
    return stats;
}

double LinuxProbe::process_uptime_seconds() const {
    auto content = procfs::read_file("/proc/self/stat");
    long ticks_per_sec = sysconf(_SC_CLK_TCK);
    if (!content || ticks_per_sec <= 0) return PosixProbe::process_uptime_seconds();

    auto start_ticks = procfs::parse_stat_starttime(*content);
    if (!start_ticks) return PosixProbe::process_uptime_seconds();

    double started_after_boot = static_cast<double>(*start_ticks) / static_cast<double>(ticks_per_sec);
    double uptime = system_uptime_seconds() - started_after_boot;
    return uptime > 0.0 ? uptime : 0.0;
}

std::optional<NetworkUsage> LinuxProbe::network_counters() const {
    auto content = procfs::read_file("/proc/net/dev");
    if (!content) return std::nullopt;
    return procfs::parse_net_dev(*content);
}

double LinuxProbe::system_uptime_seconds() const {
    // /proc/uptime carries sub-second precision
    if (auto content = procfs::read_file("/proc/uptime")) {
        double uptime = std::strtod(content->c_str(), nullptr);
        if (uptime > 0.0) return uptime;
    }
    struct sysinfo si;
    if (!read_sysinfo(si)) return 0.0;
    return static_cast<double>(si.uptime);
}

} // namespace perfmon::metrics

#endif // __linux__
