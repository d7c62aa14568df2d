/**
 * Readers for /proc and /sys pseudo-files. Parsers take file contents so they
 * can run against captured text.
 */

#include "metrics/procfs.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace perfmon::metrics::procfs {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) return std::nullopt;
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::vector<std::string> read_file_lines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    if (!file) return lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::optional<uint64_t> parse_uint64(const std::string& text) {
    std::string value = trim(text);
    if (value.empty() || value[0] == '-') return std::nullopt;

    errno = 0;
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<uint64_t>(parsed);
}

std::optional<int64_t> parse_int64(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<int64_t>(parsed);
}

std::vector<CpuTimes> parse_proc_stat(const std::string& content) {
    std::vector<CpuTimes> cores;
    std::istringstream stream(content);
    std::string line;

    while (std::getline(stream, line)) {
        // "cpu " is the aggregate line; "cpuN" are the per-core lines
        if (!starts_with(line, "cpu") || line.size() < 4 || line[3] == ' ') {
            continue;
        }

        std::istringstream iss(line);
        std::string name;
        CpuTimes t;
        iss >> name >> t.user >> t.nice >> t.system >> t.idle;
        if (!iss) continue;
        // Older kernels stop after idle; missing columns stay zero
        iss >> t.iowait >> t.irq >> t.softirq >> t.steal;
        cores.push_back(t);
    }
    return cores;
}

std::optional<uint64_t> parse_meminfo_available(const std::string& content) {
    std::istringstream stream(content);
    std::string line;

    while (std::getline(stream, line)) {
        std::istringstream iss(line);
        std::string key;
        std::string value;
        std::string unit;
        iss >> key >> value >> unit;
        if (key != "MemAvailable:") continue;

        auto kb = parse_uint64(value);
        if (!kb || unit != "kB") return std::nullopt;
        return *kb * 1024;
    }
    return std::nullopt;
}

std::vector<CpuModel> parse_cpuinfo(const std::string& content) {
    std::vector<CpuModel> cpus;
    std::istringstream stream(content);
    std::string line;

    while (std::getline(stream, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string key = trim(line.substr(0, colon));
        std::string value = trim(line.substr(colon + 1));

        if (key == "processor") {
            cpus.emplace_back();
        } else if (cpus.empty()) {
            continue;
        } else if (key == "model name") {
            cpus.back().model = value;
        } else if (key == "cpu MHz") {
            cpus.back().speed_mhz = std::strtod(value.c_str(), nullptr);
        }
    }
    return cpus;
}

std::optional<NetworkUsage> parse_net_dev(const std::string& content) {
    std::istringstream stream(content);
    std::string line;
    NetworkUsage usage;
    bool seen = false;

    while (std::getline(stream, line)) {
        size_t colon = line.find(':');
        // Header lines have no "iface:" prefix
        if (colon == std::string::npos) continue;

        std::string iface = trim(line.substr(0, colon));
        if (iface.empty() || iface.find('|') != std::string::npos) continue;
        if (iface == "lo") {
            seen = true;
            continue;
        }

        std::istringstream iss(line.substr(colon + 1));
        uint64_t rx_bytes, rx_packets, rx_errs, rx_drop, rx_fifo, rx_frame, rx_compressed, rx_multicast;
        uint64_t tx_bytes, tx_packets;
        iss >> rx_bytes >> rx_packets >> rx_errs >> rx_drop >> rx_fifo >> rx_frame >> rx_compressed >> rx_multicast
            >> tx_bytes >> tx_packets;
        if (!iss) continue;

        usage.bytes_received += rx_bytes;
        usage.packets_received += rx_packets;
        usage.bytes_sent += tx_bytes;
        usage.packets_sent += tx_packets;
        seen = true;
    }

    if (!seen) return std::nullopt;
    return usage;
}

std::optional<uint64_t> parse_statm_resident(const std::string& content) {
    std::istringstream iss(content);
    uint64_t size = 0;
    uint64_t resident = 0;
    if (!(iss >> size >> resident)) return std::nullopt;
    return resident;
}

std::optional<uint64_t> parse_stat_starttime(const std::string& content) {
    // comm may contain spaces and parentheses; fields resume after the last ')'
    size_t comm_end = content.rfind(')');
    if (comm_end == std::string::npos || comm_end + 2 > content.size()) return std::nullopt;

    std::istringstream iss(content.substr(comm_end + 2));
    std::string field;
    // state is field 3, starttime is field 22
    for (int index = 3; index <= 22; ++index) {
        if (!(iss >> field)) return std::nullopt;
    }
    return parse_uint64(field);
}

} // namespace perfmon::metrics::procfs
