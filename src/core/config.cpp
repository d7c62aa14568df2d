#include "core/config.hpp"
#include "core/paths.hpp"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace perfmon::core::config {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

std::optional<std::pair<std::string, std::string>> parse_env_line(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') return std::nullopt;

    if (line.rfind("export ", 0) == 0) {
        line = trim(line.substr(7));
    }

    size_t eq_pos = line.find('=');
    if (eq_pos == std::string::npos) return std::nullopt;

    std::string key = trim(line.substr(0, eq_pos));
    std::string value = trim(line.substr(eq_pos + 1));
    if (key.empty()) return std::nullopt;

    if (value.size() >= 2) {
        if ((value.front() == '"' && value.back() == '"') ||
            (value.front() == '\'' && value.back() == '\'')) {
            value = value.substr(1, value.size() - 2);
        }
    }
    return std::make_pair(key, value);
}

void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths) {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;

    std::vector<std::filesystem::path> search_paths = paths::search_roots();
    for (const auto& p : extra_search_paths) {
        search_paths.push_back(p);
    }

    for (const auto& base : search_paths) {
        auto env_path = base / ".env";
        std::error_code ec;
        if (!std::filesystem::exists(env_path, ec)) {
            continue;
        }

        std::ifstream file(env_path);
        std::string line;
        int applied = 0;
        while (std::getline(file, line)) {
            auto entry = parse_env_line(line);
            if (!entry) continue;
            if (std::getenv(entry->first.c_str()) == nullptr) {
                setenv(entry->first.c_str(), entry->second.c_str(), 0);
                ++applied;
            }
        }
        spdlog::debug("Loaded {} variable(s) from {}", applied, env_path.string());
        break;
    }
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

std::optional<long> get_env_long(const std::string& key) {
    std::string value = trim(get_env(key));
    if (value.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0') {
        spdlog::warn("Ignoring {}={}: not an integer", key, value);
        return std::nullopt;
    }
    return parsed;
}

} // namespace perfmon::core::config
