/**
 * Platform probes
 *
 * Operating-system specific readers behind one interface. The service picks a
 * probe once at startup; samplers only talk to the interface.
 */
#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/types.h>
#include "metrics/metrics.hpp"
#include "metrics/procfs.hpp"

namespace perfmon::metrics {

// Raised when a platform source that has no documented fallback fails.
class ProbeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CpuCore {
    std::string model;
    double speed_mhz = 0.0;
    procfs::CpuTimes times;
};

// Cumulative CPU time consumed by this process
struct ProcessCpuTime {
    uint64_t user_us = 0;
    uint64_t system_us = 0;
};

struct FsStats {
    uint64_t blocks = 0;
    uint64_t block_size = 0;
    uint64_t free_blocks = 0;
    uint64_t available_blocks = 0;      // Available to unprivileged users
};

struct AllocatorStats {
    uint64_t heap_total = 0;
    uint64_t heap_used = 0;
    uint64_t external = 0;
    uint64_t extra_allocated = 0;
};

class PlatformProbe {
public:
    virtual ~PlatformProbe() = default;

    // Lower-case OS name: "linux", "darwin", ...
    virtual std::string os() const = 0;
    virtual std::string architecture() const = 0;
    virtual std::string hostname() const = 0;

    virtual uint64_t total_memory() const = 0;
    virtual uint64_t free_memory() const = 0;

    /**
     * Reclaimable-aware free memory from the platform's own accounting.
     * nullopt when the source is missing or unparseable; callers fall back
     * to free_memory().
     */
    virtual std::optional<uint64_t> available_memory() const = 0;

    // One entry per logical core; may be empty
    virtual std::vector<CpuCore> cpus() const = 0;

    virtual ProcessCpuTime process_cpu_time() const = 0;
    virtual uint64_t process_rss() const = 0;
    virtual AllocatorStats allocator_stats() const = 0;
    virtual double process_uptime_seconds() const = 0;
    virtual pid_t pid() const = 0;

    // Whether fs_stats() is backed by a real filesystem-statistics call
    virtual bool has_fs_stats() const = 0;

    // Throws ProbeError on failure
    virtual FsStats fs_stats(const std::string& mount) const = 0;
    virtual std::string root_mount() const { return "/"; }

    virtual std::optional<NetworkUsage> network_counters() const = 0;
    virtual std::optional<LoadAverage> load_average() const = 0;
    virtual double system_uptime_seconds() const = 0;
};

/**
 * Portable POSIX probe (sysconf, getrusage, statvfs, uname). Used directly on
 * platforms without a specialised probe.
 */
class PosixProbe : public PlatformProbe {
public:
    PosixProbe();

    std::string os() const override;
    std::string architecture() const override;
    std::string hostname() const override;

    uint64_t total_memory() const override;
    uint64_t free_memory() const override;
    std::optional<uint64_t> available_memory() const override;

    std::vector<CpuCore> cpus() const override;

    ProcessCpuTime process_cpu_time() const override;
    uint64_t process_rss() const override;
    AllocatorStats allocator_stats() const override;
    double process_uptime_seconds() const override;
    pid_t pid() const override;

    bool has_fs_stats() const override;
    FsStats fs_stats(const std::string& mount) const override;

    std::optional<NetworkUsage> network_counters() const override;
    std::optional<LoadAverage> load_average() const override;
    double system_uptime_seconds() const override;

protected:
    std::chrono::steady_clock::time_point started_;
};

#ifdef __linux__
/**
 * Linux probe: sysinfo(2), /proc and /sys
 */
class LinuxProbe : public PosixProbe {
public:
    std::string os() const override { return "linux"; }

    uint64_t total_memory() const override;
    uint64_t free_memory() const override;
    std::optional<uint64_t> available_memory() const override;

    std::vector<CpuCore> cpus() const override;

    uint64_t process_rss() const override;
    AllocatorStats allocator_stats() const override;
    double process_uptime_seconds() const override;

    std::optional<NetworkUsage> network_counters() const override;
    double system_uptime_seconds() const override;
};
#endif

#ifdef __APPLE__
/**
 * Darwin probe: sysctl, Mach host statistics and vm_stat(1)
 */
class DarwinProbe : public PosixProbe {
public:
    std::string os() const override { return "darwin"; }

    uint64_t total_memory() const override;
    uint64_t free_memory() const override;
    std::optional<uint64_t> available_memory() const override;

    std::vector<CpuCore> cpus() const override;

    uint64_t process_rss() const override;
    double system_uptime_seconds() const override;
};
#endif

// Probe matching the build platform
std::unique_ptr<PlatformProbe> make_platform_probe();

/**
 * Run a shell command and capture stdout. nullopt if the command could not
 * be started or exited non-zero.
 */
std::optional<std::string> run_command(const std::string& command);

/**
 * Available bytes from vm_stat(1) output:
 * (free + inactive + speculative pages) x page size. Page size defaults to
 * 4096 when the header is missing; nullopt when no "Pages free" line exists.
 */
std::optional<uint64_t> parse_vm_stat(const std::string& output);

} // namespace perfmon::metrics
