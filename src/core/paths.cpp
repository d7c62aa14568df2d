#include "core/paths.hpp"
#include <algorithm>
#include <unistd.h>
#include <limits.h>

namespace perfmon::core::paths {

namespace {

void push_with_parents(std::vector<std::filesystem::path>& roots, const std::filesystem::path& dir) {
    if (dir.empty()) return;
    roots.push_back(dir);
    roots.push_back(dir.parent_path());
    roots.push_back(dir.parent_path().parent_path());
}

} // namespace

std::filesystem::path executable_path() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf);
}

std::vector<std::filesystem::path> search_roots() {
    std::vector<std::filesystem::path> roots;

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        push_with_parents(roots, cwd);
    }
    push_with_parents(roots, executable_path().parent_path());

    std::vector<std::filesystem::path> unique;
    for (const auto& p : roots) {
        if (p.empty()) continue;
        if (std::find(unique.begin(), unique.end(), p) == unique.end()) {
            unique.push_back(p);
        }
    }
    return unique;
}

std::optional<std::filesystem::path> locate(const std::string& path) {
    std::error_code ec;
    std::filesystem::path requested(path);
    if (requested.is_absolute()) {
        if (std::filesystem::exists(requested, ec)) return requested;
        return std::nullopt;
    }

    for (const auto& base : search_roots()) {
        auto candidate = base / requested;
        if (std::filesystem::exists(candidate, ec)) {
            auto canonical = std::filesystem::canonical(candidate, ec);
            return ec ? candidate : canonical;
        }
    }
    return std::nullopt;
}

} // namespace perfmon::core::paths
