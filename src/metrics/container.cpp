#include "metrics/container.hpp"
#include "metrics/platform.hpp"
#include "metrics/procfs.hpp"
#include <sstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace perfmon::metrics {

namespace {

bool path_exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

std::optional<std::string> read_trimmed(const fs::path& path) {
    auto content = procfs::read_file(path);
    if (!content) return std::nullopt;
    size_t start = content->find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return std::string();
    size_t end = content->find_last_not_of(" \t\r\n");
    return content->substr(start, end - start + 1);
}

std::optional<double> cores_from_quota(int64_t quota, int64_t period) {
    // A quota of -1 (v1) or 0 means no CPU limit
    if (quota <= 0 || period <= 0) return std::nullopt;
    return static_cast<double>(quota) / static_cast<double>(period);
}

} // namespace

nlohmann::json ContainerInfo::to_json() const {
    return nlohmann::json{
        {"isContainerized", is_containerized},
        {"cgroupVersion", cgroup_version_to_string(cgroup_version)},
        {"memoryLimitBytes", memory_limit_bytes ? nlohmann::json(*memory_limit_bytes) : nlohmann::json(nullptr)},
        {"cpuLimitCores", cpu_limit_cores ? nlohmann::json(*cpu_limit_cores) : nlohmann::json(nullptr)}
    };
}

ContainerDetector::ContainerDetector(const PlatformProbe& probe, ContainerPaths paths)
    : probe_(probe), paths_(std::move(paths)) {}

ContainerInfo ContainerDetector::detect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!info_) {
        info_ = probe_cgroups();
        spdlog::info("Container detection: containerized={} cgroup={} memory_limit={} cpu_limit={}",
                     info_->is_containerized,
                     cgroup_version_to_string(info_->cgroup_version),
                     info_->memory_limit_bytes ? std::to_string(*info_->memory_limit_bytes) : "none",
                     info_->cpu_limit_cores ? std::to_string(*info_->cpu_limit_cores) : "none");
    }
    return *info_;
}

void ContainerDetector::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    info_.reset();
}

std::optional<uint64_t> ContainerDetector::memory_usage() {
    ContainerInfo info = detect();
    if (!info.memory_limit_bytes) return std::nullopt;

    fs::path usage_path;
    if (info.cgroup_version == CgroupVersion::V2) {
        usage_path = paths_.v2_memory_current();
    } else if (info.cgroup_version == CgroupVersion::V1) {
        usage_path = paths_.v1_memory_usage();
    } else {
        return std::nullopt;
    }

    auto content = read_trimmed(usage_path);
    if (!content) return std::nullopt;
    return procfs::parse_uint64(*content);
}

ContainerInfo ContainerDetector::probe_cgroups() const {
    ContainerInfo info;

    // Containers are a Linux cgroup concept
    if (probe_.os() != "linux") {
        return info;
    }

    uint64_t host_total = probe_.total_memory();

    // v2 first: current runtimes default to the unified hierarchy
    if (path_exists(paths_.v2_memory_max())) {
        probe_v2(info, host_total);
    } else if (path_exists(paths_.v1_memory_limit())) {
        probe_v1(info, host_total);
    }

    if (!info.is_containerized && has_container_marker()) {
        info.is_containerized = true;
    }
    return info;
}

void ContainerDetector::probe_v2(ContainerInfo& info, uint64_t host_total) const {
    if (auto mem_max = read_trimmed(paths_.v2_memory_max()); mem_max && *mem_max != "max") {
        auto limit = procfs::parse_uint64(*mem_max);
        if (limit && *limit > 0 && *limit < host_total) {
            info.memory_limit_bytes = *limit;
        }
    }

    // Format: "$QUOTA $PERIOD" or "max $PERIOD"
    if (auto cpu_max = read_trimmed(paths_.v2_cpu_max())) {
        std::istringstream iss(*cpu_max);
        std::string quota_str, period_str, extra;
        if ((iss >> quota_str >> period_str) && !(iss >> extra) && quota_str != "max") {
            auto quota = procfs::parse_int64(quota_str);
            auto period = procfs::parse_int64(period_str);
            if (quota && period) {
                info.cpu_limit_cores = cores_from_quota(*quota, *period);
            }
        }
    }

    if (info.memory_limit_bytes || info.cpu_limit_cores) {
        info.is_containerized = true;
        info.cgroup_version = CgroupVersion::V2;
    }
}

void ContainerDetector::probe_v1(ContainerInfo& info, uint64_t host_total) const {
    if (auto mem_limit = read_trimmed(paths_.v1_memory_limit())) {
        auto limit = procfs::parse_uint64(*mem_limit);
        if (limit && *limit > 0 && *limit < CGROUP_V1_UNLIMITED && *limit < host_total) {
            info.memory_limit_bytes = *limit;
        }
    }

    auto quota_str = read_trimmed(paths_.v1_cpu_quota());
    auto period_str = read_trimmed(paths_.v1_cpu_period());
    if (quota_str && period_str) {
        auto quota = procfs::parse_int64(*quota_str);
        auto period = procfs::parse_int64(*period_str);
        if (quota && period) {
            info.cpu_limit_cores = cores_from_quota(*quota, *period);
        }
    }

    if (info.memory_limit_bytes || info.cpu_limit_cores) {
        info.is_containerized = true;
        info.cgroup_version = CgroupVersion::V1;
    }
}

bool ContainerDetector::has_container_marker() const {
    return path_exists(paths_.docker_marker()) || path_exists(paths_.kubernetes_marker());
}

} // namespace perfmon::metrics
