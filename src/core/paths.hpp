#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace perfmon::core::paths {

// Path of the running executable via /proc/self/exe; empty if unavailable.
std::filesystem::path executable_path();

// Roots searched for .env and bundled assets: the working directory, the
// executable directory, and up to two parents of each, de-duplicated.
std::vector<std::filesystem::path> search_roots();

// Resolve a path. Absolute paths are returned as-is when they exist; relative
// ones are tried under each search root.
std::optional<std::filesystem::path> locate(const std::string& path);

} // namespace perfmon::core::paths
