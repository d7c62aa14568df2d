#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "metrics/metrics.hpp"

namespace perfmon::metrics::procfs {

// Whole file contents; nullopt if the file cannot be opened.
std::optional<std::string> read_file(const std::filesystem::path& path);

std::vector<std::string> read_file_lines(const std::filesystem::path& path);

// Whitespace-trimmed parse of an unsigned / signed decimal integer.
// Trailing garbage or overflow yields nullopt.
std::optional<uint64_t> parse_uint64(const std::string& text);
std::optional<int64_t> parse_int64(const std::string& text);

// Per-core jiffy counters from one "cpuN ..." line of /proc/stat
struct CpuTimes {
    uint64_t user = 0;
    uint64_t nice = 0;
    uint64_t system = 0;
    uint64_t idle = 0;
    uint64_t iowait = 0;
    uint64_t irq = 0;
    uint64_t softirq = 0;
    uint64_t steal = 0;

    // Busy+idle ticks on the user/nice/system/idle/irq basis. iowait,
    // softirq and steal are parsed but left out of the utilisation figure.
    uint64_t total() const { return user + nice + system + idle + irq; }
    uint64_t idle_total() const { return idle; }
};

// "cpuN" lines of /proc/stat in order; the aggregate "cpu" line is skipped.
std::vector<CpuTimes> parse_proc_stat(const std::string& content);

// MemAvailable from /proc/meminfo in bytes.
std::optional<uint64_t> parse_meminfo_available(const std::string& content);

struct CpuModel {
    std::string model;
    double speed_mhz = 0.0;
};

// One entry per "processor" block of /proc/cpuinfo.
std::vector<CpuModel> parse_cpuinfo(const std::string& content);

// Sum of all non-loopback interfaces in /proc/net/dev.
std::optional<NetworkUsage> parse_net_dev(const std::string& content);

// Resident pages (second field) of /proc/<pid>/statm.
std::optional<uint64_t> parse_statm_resident(const std::string& content);

// starttime (field 22, in clock ticks) of /proc/<pid>/stat.
std::optional<uint64_t> parse_stat_starttime(const std::string& content);

} // namespace perfmon::metrics::procfs
