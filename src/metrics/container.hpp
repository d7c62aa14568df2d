/**
 * Container environment detection
 *
 * Probes cgroup v2 then v1 control files once to decide whether the process
 * is confined and what its memory and CPU limits are.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace perfmon::metrics {

class PlatformProbe;

enum class CgroupVersion {
    NONE,
    V1,
    V2
};

inline const char* cgroup_version_to_string(CgroupVersion version) {
    switch (version) {
        case CgroupVersion::V1: return "v1";
        case CgroupVersion::V2: return "v2";
        default: return "none";
    }
}

// cgroup v1 reports "no limit" as LONG_MAX rounded down to a page boundary
inline constexpr uint64_t CGROUP_V1_UNLIMITED = 9223372036854771712ULL;

struct ContainerInfo {
    bool is_containerized = false;
    CgroupVersion cgroup_version = CgroupVersion::NONE;
    std::optional<uint64_t> memory_limit_bytes;     // nullopt = unconfined
    std::optional<double> cpu_limit_cores;          // nullopt = unconfined

    nlohmann::json to_json() const;
};

/**
 * Filesystem locations read by the detector. Tests point these at a
 * synthetic tree.
 */
struct ContainerPaths {
    std::filesystem::path cgroup_root = "/sys/fs/cgroup";
    std::filesystem::path marker_root = "/";

    // cgroup v2 (unified hierarchy)
    std::filesystem::path v2_memory_max() const { return cgroup_root / "memory.max"; }
    std::filesystem::path v2_memory_current() const { return cgroup_root / "memory.current"; }
    std::filesystem::path v2_cpu_max() const { return cgroup_root / "cpu.max"; }

    // cgroup v1
    std::filesystem::path v1_memory_limit() const { return cgroup_root / "memory" / "memory.limit_in_bytes"; }
    std::filesystem::path v1_memory_usage() const { return cgroup_root / "memory" / "memory.usage_in_bytes"; }
    std::filesystem::path v1_cpu_quota() const { return cgroup_root / "cpu" / "cpu.cfs_quota_us"; }
    std::filesystem::path v1_cpu_period() const { return cgroup_root / "cpu" / "cpu.cfs_period_us"; }

    // Container runtime markers
    std::filesystem::path docker_marker() const { return marker_root / ".dockerenv"; }
    std::filesystem::path kubernetes_marker() const { return marker_root / "var/run/secrets/kubernetes.io"; }
};

class ContainerDetector {
public:
    explicit ContainerDetector(const PlatformProbe& probe, ContainerPaths paths = {});

    ContainerDetector(const ContainerDetector&) = delete;
    ContainerDetector& operator=(const ContainerDetector&) = delete;

    /**
     * Detect once and cache. Never throws; any unreadable or unparseable
     * file counts as an absent signal.
     */
    ContainerInfo detect();

    /**
     * Current memory usage of the cgroup matching the detected version.
     * nullopt when unconfined or the usage file cannot be read.
     */
    std::optional<uint64_t> memory_usage();

    // Drop the cached result so the next detect() probes again
    void reset();

    const ContainerPaths& paths() const { return paths_; }

private:
    ContainerInfo probe_cgroups() const;
    void probe_v2(ContainerInfo& info, uint64_t host_total) const;
    void probe_v1(ContainerInfo& info, uint64_t host_total) const;
    bool has_container_marker() const;

    const PlatformProbe& probe_;
    ContainerPaths paths_;

    std::optional<ContainerInfo> info_;
    std::mutex mutex_;
};

} // namespace perfmon::metrics
