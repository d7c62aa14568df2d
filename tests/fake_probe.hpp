#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>
#include "metrics/platform.hpp"
#include "metrics/samplers.hpp"

namespace perfmon::test_support {

inline constexpr uint64_t GiB = 1024ULL * 1024 * 1024;
inline constexpr uint64_t MiB = 1024ULL * 1024;

// Platform probe whose every reading is a plain field the test can set.
class FakeProbe : public metrics::PlatformProbe {
public:
    std::string os_name = "linux";
    std::string arch = "x64";
    std::string host = "fake-host";

    uint64_t total = 16 * GiB;
    uint64_t free = 8 * GiB;
    std::optional<uint64_t> available;

    std::vector<metrics::CpuCore> cores;

    metrics::ProcessCpuTime cpu_time;
    bool fail_cpu_time = false;

    uint64_t rss = 64 * MiB;
    metrics::AllocatorStats heap;
    double process_uptime = 12.5;
    pid_t process_id = 4242;

    bool fs_supported = true;
    bool fail_fs_stats = false;
    metrics::FsStats fs;

    std::optional<metrics::NetworkUsage> network;
    std::optional<metrics::LoadAverage> load;
    double uptime = 3600.0;

    std::string os() const override { return os_name; }
    std::string architecture() const override { return arch; }
    std::string hostname() const override { return host; }

    uint64_t total_memory() const override { return total; }
    uint64_t free_memory() const override { return free; }
    std::optional<uint64_t> available_memory() const override { return available; }

    std::vector<metrics::CpuCore> cpus() const override { return cores; }

    metrics::ProcessCpuTime process_cpu_time() const override {
        if (fail_cpu_time) {
            throw metrics::ProbeError("getrusage failed");
        }
        return cpu_time;
    }
    uint64_t process_rss() const override { return rss; }
    metrics::AllocatorStats allocator_stats() const override { return heap; }
    double process_uptime_seconds() const override { return process_uptime; }
    pid_t pid() const override { return process_id; }

    bool has_fs_stats() const override { return fs_supported; }
    metrics::FsStats fs_stats(const std::string& mount) const override {
        if (fail_fs_stats) {
            throw metrics::ProbeError("statvfs(" + mount + ") failed");
        }
        return fs;
    }

    std::optional<metrics::NetworkUsage> network_counters() const override { return network; }
    std::optional<metrics::LoadAverage> load_average() const override { return load; }
    double system_uptime_seconds() const override { return uptime; }

    // count identical cores
    void set_cores(size_t count, const std::string& model = "Test CPU @ 3.00GHz", double mhz = 3000.0) {
        cores.assign(count, metrics::CpuCore{model, mhz, {}});
    }
};

// Hand-driven clock: time moves only when the test advances it
struct ManualClock {
    int64_t wall = 1700000000000;
    std::chrono::steady_clock::time_point mono{std::chrono::seconds(1000)};

    void advance(std::chrono::milliseconds ms) {
        wall += ms.count();
        mono += ms;
    }

    metrics::Clock clock() {
        return metrics::Clock{
            [this]() { return wall; },
            [this]() { return mono; }
        };
    }
};

// Scratch directory removed when the test ends
class TempDir {
public:
    TempDir() {
        static int counter = 0;
        path_ = std::filesystem::temp_directory_path() /
                ("perfmon-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write(const std::string& relative, const std::string& content) const {
        auto file = path_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file);
        out << content;
        return file;
    }

private:
    std::filesystem::path path_;
};

} // namespace perfmon::test_support
