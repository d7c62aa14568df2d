#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace perfmon::monitor {

// Dashboard settings. Only refresh_interval_ms affects collection; the rest
// is stored for the front end.
struct Settings {
    static constexpr int64_t DEFAULT_REFRESH_INTERVAL_MS = 2000;
    static constexpr int64_t DEFAULT_PANE_FONT_SIZE_PX = 12;
    static constexpr const char* DEFAULT_PANE_FONT_FAMILY = "Helvetica Neue";
    static constexpr const char* DEFAULT_HUD_SIZE = "Normal";
    static constexpr const char* DEFAULT_HUD_THEME = "classic";

    int64_t refresh_interval_ms = DEFAULT_REFRESH_INTERVAL_MS;
    int64_t pane_font_size_px = DEFAULT_PANE_FONT_SIZE_PX;
    std::string pane_font_family = DEFAULT_PANE_FONT_FAMILY;
    std::string hud_size = DEFAULT_HUD_SIZE;
    std::string hud_theme = DEFAULT_HUD_THEME;
    bool hide_hud = false;

    nlohmann::json to_json() const;
};

// Leading base-10 integer of a number or string ("150px" -> 150). nullopt
// for anything else and for values <= 0.
std::optional<int64_t> coerce_positive_int(const nlohmann::json& value);

// Non-empty string, else nullopt
std::optional<std::string> coerce_string(const nlohmann::json& value);

// JSON truthiness: false, 0, "", null are false
bool coerce_truthy(const nlohmann::json& value);

class SettingsStore {
public:
    explicit SettingsStore(Settings initial = {});

    Settings get() const;

    /**
     * Apply a partial update. Absent fields keep their value, present but
     * invalid fields reset to their default, unknown fields are ignored.
     * A non-object leaves the settings untouched.
     */
    Settings update(const nlohmann::json& partial);

    int64_t refresh_interval_ms() const;

private:
    Settings settings_;
    mutable std::mutex mutex_;
};

} // namespace perfmon::monitor
