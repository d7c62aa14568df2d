#include "monitor/settings_store.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace perfmon::monitor {

namespace {

// Field value under its current name or its legacy alias
const nlohmann::json* find_field(const nlohmann::json& partial, const char* name, const char* alias = nullptr) {
    auto it = partial.find(name);
    if (it != partial.end()) return &*it;
    if (alias) {
        it = partial.find(alias);
        if (it != partial.end()) return &*it;
    }
    return nullptr;
}

} // namespace

nlohmann::json Settings::to_json() const {
    return nlohmann::json{
        {"refreshIntervalMs", refresh_interval_ms},
        {"paneFontSizePx", pane_font_size_px},
        {"paneFontFamily", pane_font_family},
        {"hudSize", hud_size},
        {"hudTheme", hud_theme},
        {"hideHud", hide_hud}
    };
}

std::optional<int64_t> coerce_positive_int(const nlohmann::json& value) {
    std::optional<int64_t> parsed;

    if (value.is_number_integer()) {
        parsed = value.get<int64_t>();
    } else if (value.is_number_unsigned()) {
        uint64_t v = value.get<uint64_t>();
        if (v <= static_cast<uint64_t>(INT64_MAX)) parsed = static_cast<int64_t>(v);
    } else if (value.is_number_float()) {
        double v = value.get<double>();
        if (std::isfinite(v) && std::fabs(v) < 9.0e18) parsed = static_cast<int64_t>(std::trunc(v));
    } else if (value.is_string()) {
        const std::string& text = value.get_ref<const std::string&>();
        size_t pos = 0;
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
        const char* start = text.c_str() + pos;
        errno = 0;
        char* end = nullptr;
        long long v = std::strtoll(start, &end, 10);
        if (end != start && errno == 0) parsed = static_cast<int64_t>(v);
    }

    if (!parsed || *parsed <= 0) return std::nullopt;
    return parsed;
}

std::optional<std::string> coerce_string(const nlohmann::json& value) {
    if (!value.is_string()) return std::nullopt;
    const std::string& text = value.get_ref<const std::string&>();
    if (text.empty()) return std::nullopt;
    return text;
}

bool coerce_truthy(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return false;
        case nlohmann::json::value_t::boolean:
            return value.get<bool>();
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float: {
            double v = value.get<double>();
            return v != 0.0 && !std::isnan(v);
        }
        case nlohmann::json::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        default:
            return true;
    }
}

SettingsStore::SettingsStore(Settings initial)
    : settings_(std::move(initial)) {
    if (settings_.refresh_interval_ms <= 0) {
        settings_.refresh_interval_ms = Settings::DEFAULT_REFRESH_INTERVAL_MS;
    }
}

Settings SettingsStore::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

int64_t SettingsStore::refresh_interval_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_.refresh_interval_ms;
}

Settings SettingsStore::update(const nlohmann::json& partial) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!partial.is_object()) {
        return settings_;
    }

    if (auto v = find_field(partial, "refreshIntervalMs", "refreshInterval")) {
        settings_.refresh_interval_ms = coerce_positive_int(*v).value_or(Settings::DEFAULT_REFRESH_INTERVAL_MS);
    }
    if (auto v = find_field(partial, "paneFontSizePx", "paneFontSize")) {
        settings_.pane_font_size_px = coerce_positive_int(*v).value_or(Settings::DEFAULT_PANE_FONT_SIZE_PX);
    }
    if (auto v = find_field(partial, "paneFontFamily")) {
        settings_.pane_font_family = coerce_string(*v).value_or(Settings::DEFAULT_PANE_FONT_FAMILY);
    }
    if (auto v = find_field(partial, "hudSize")) {
        settings_.hud_size = coerce_string(*v).value_or(Settings::DEFAULT_HUD_SIZE);
    }
    if (auto v = find_field(partial, "hudTheme")) {
        settings_.hud_theme = coerce_string(*v).value_or(Settings::DEFAULT_HUD_THEME);
    }
    if (auto v = find_field(partial, "hideHud")) {
        settings_.hide_hud = coerce_truthy(*v);
    }

    spdlog::debug("Settings updated: {}", settings_.to_json().dump());
    return settings_;
}

} // namespace perfmon::monitor
