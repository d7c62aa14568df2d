#include "metrics/platform.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <regex>
#include <sys/resource.h>
#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <sys/wait.h>
#include <unistd.h>
#include <limits.h>
#include <spdlog/spdlog.h>

#ifndef HOST_NAME_MAX
#define HOST_NAME_MAX 255
#endif

namespace perfmon::metrics {

PosixProbe::PosixProbe()
    : started_(std::chrono::steady_clock::now()) {}

std::string PosixProbe::os() const {
    struct utsname info;
    if (uname(&info) != 0) {
        return "unknown";
    }
    std::string name = info.sysname;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

std::string PosixProbe::architecture() const {
    struct utsname info;
    if (uname(&info) != 0) {
        return "unknown";
    }
    return info.machine;
}

std::string PosixProbe::hostname() const {
    char buf[HOST_NAME_MAX + 1] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0) {
        return "";
    }
    return buf;
}

uint64_t PosixProbe::total_memory() const {
    long pages = sysconf(_SC_PHYS_PAGES);
    long page_size = sysconf(_SC_PAGESIZE);
    if (pages <= 0 || page_size <= 0) return 0;
    return static_cast<uint64_t>(pages) * static_cast<uint64_t>(page_size);
}

uint64_t PosixProbe::free_memory() const {
#ifdef _SC_AVPHYS_PAGES
    long pages = sysconf(_SC_AVPHYS_PAGES);
    long page_size = sysconf(_SC_PAGESIZE);
    if (pages <= 0 || page_size <= 0) return 0;
    return static_cast<uint64_t>(pages) * static_cast<uint64_t>(page_size);
#else
    return 0;
#endif
}

std::optional<uint64_t> PosixProbe::available_memory() const {
    return std::nullopt;
}

std::vector<CpuCore> PosixProbe::cpus() const {
    long count = sysconf(_SC_NPROCESSORS_ONLN);
    if (count < 1) return {};
    return std::vector<CpuCore>(static_cast<size_t>(count));
}

ProcessCpuTime PosixProbe::process_cpu_time() const {
    struct rusage usage;
    if (getrusage(RUSAGE_SELF, &usage) != 0) {
        throw ProbeError(std::string("getrusage failed: ") + std::strerror(errno));
    }

    ProcessCpuTime t;
    t.user_us = static_cast<uint64_t>(usage.ru_utime.tv_sec) * 1000000 +
                static_cast<uint64_t>(usage.ru_utime.tv_usec);
    t.system_us = static_cast<uint64_t>(usage.ru_stime.tv_sec) * 1000000 +
                  static_cast<uint64_t>(usage.ru_stime.tv_usec);
    return t;
}

uint64_t PosixProbe::process_rss() const {
    // Peak RSS is the only portable figure
    struct rusage usage;
    if (getrusage(RUSAGE_SELF, &usage) != 0) {
        throw ProbeError(std::string("getrusage failed: ") + std::strerror(errno));
    }
#ifdef __APPLE__
    return static_cast<uint64_t>(usage.ru_maxrss);
#else
    return static_cast<uint64_t>(usage.ru_maxrss) * 1024;
#endif
}

AllocatorStats PosixProbe::allocator_stats() const {
    return {};
}

double PosixProbe::process_uptime_seconds() const {
    auto elapsed = std::chrono::steady_clock::now() - started_;
    return std::chrono::duration<double>(elapsed).count();
}

pid_t PosixProbe::pid() const {
    return getpid();
}

bool PosixProbe::has_fs_stats() const {
    return true;
}

FsStats PosixProbe::fs_stats(const std::string& mount) const {
    struct statvfs vfs;
    if (statvfs(mount.c_str(), &vfs) != 0) {
        throw ProbeError("statvfs(" + mount + ") failed: " + std::strerror(errno));
    }

    // Block counts are expressed in f_frsize units
    FsStats stats;
    stats.block_size = vfs.f_frsize ? vfs.f_frsize : vfs.f_bsize;
    stats.blocks = vfs.f_blocks;
    stats.free_blocks = vfs.f_bfree;
    stats.available_blocks = vfs.f_bavail;
    return stats;
}

std::optional<NetworkUsage> PosixProbe::network_counters() const {
    return std::nullopt;
}

std::optional<LoadAverage> PosixProbe::load_average() const {
    double loads[3];
    if (getloadavg(loads, 3) != 3) {
        return std::nullopt;
    }
    return LoadAverage{loads[0], loads[1], loads[2]};
}

double PosixProbe::system_uptime_seconds() const {
    return 0.0;
}

std::unique_ptr<PlatformProbe> make_platform_probe() {
#if defined(__linux__)
    return std::make_unique<LinuxProbe>();
#elif defined(__APPLE__)
    return std::make_unique<DarwinProbe>();
#else
    return std::make_unique<PosixProbe>();
#endif
}

std::optional<std::string> run_command(const std::string& command) {
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        spdlog::debug("popen({}) failed: {}", command, std::strerror(errno));
        return std::nullopt;
    }

    std::string output;
    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.append(buffer, n);
    }

    int status = pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        spdlog::debug("{} exited abnormally (status={})", command, status);
        return std::nullopt;
    }
    return output;
}

std::optional<uint64_t> parse_vm_stat(const std::string& output) {
    static const std::regex page_size_re(R"(page size of (\d+) bytes)");
    static const std::regex free_re(R"(Pages free:\s+(\d+)\.)");
    static const std::regex inactive_re(R"(Pages inactive:\s+(\d+)\.)");
    static const std::regex speculative_re(R"(Pages speculative:\s+(\d+)\.)");

    auto capture = [&output](const std::regex& re) -> std::optional<uint64_t> {
        std::smatch match;
        if (!std::regex_search(output, match, re)) return std::nullopt;
        return procfs::parse_uint64(match[1].str());
    };

    auto free_pages = capture(free_re);
    if (!free_pages) {
        return std::nullopt;
    }

    uint64_t page_size = capture(page_size_re).value_or(4096);
    uint64_t inactive = capture(inactive_re).value_or(0);
    uint64_t speculative = capture(speculative_re).value_or(0);

    return (*free_pages + inactive + speculative) * page_size;
}

} // namespace perfmon::metrics
