#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace perfmon::core::config {

// Load every variable from the first .env file found (idempotent).
// Variables already present in the environment are never overwritten.
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Integer environment variable; nullopt if unset or not a whole number.
std::optional<long> get_env_long(const std::string& key);

// Parse one "KEY=value" line. Comments, blanks and lines without '=' yield nullopt.
std::optional<std::pair<std::string, std::string>> parse_env_line(const std::string& line);

} // namespace perfmon::core::config
