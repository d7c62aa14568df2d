#include "monitor/route_handlers.hpp"
#include "monitor/settings_store.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace perfmon::monitor {

void SettingsRoutes::register_routes(Router& router) {
    router.add_route("GET", SETTINGS_PATH,
        [this](const Request& req) { return handle_get(req); });
    router.add_route("POST", SETTINGS_PATH,
        [this](const Request& req) { return handle_update(req); });
}

Response SettingsRoutes::handle_get(const Request&) {
    return Response::json(200, context_.settings.get().to_json().dump());
}

Response SettingsRoutes::handle_update(const Request& req) {
    json request = json::object();
    if (!req.body.empty()) {
        try {
            request = json::parse(req.body);
        } catch (const json::parse_error& e) {
            json response;
            response["error"] = std::string("invalid JSON payload: ") + e.what();
            return Response::json(400, response.dump());
        }
    }

    if (!request.is_object()) {
        json response;
        response["error"] = "settings payload must be a JSON object";
        return Response::json(400, response.dump());
    }

    auto settings = context_.settings.update(request);
    spdlog::info("Settings updated (refresh={}ms)", settings.refresh_interval_ms);
    return Response::json(200, settings.to_json().dump());
}

} // namespace perfmon::monitor
