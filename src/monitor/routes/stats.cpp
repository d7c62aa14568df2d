#include "monitor/route_handlers.hpp"
#include "metrics/aggregator.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace perfmon::monitor {

void StatsRoutes::register_routes(Router& router) {
    router.add_route("GET", STATS_PATH,
        [this](const Request& req) { return handle_stats(req); });
}

Response StatsRoutes::handle_stats(const Request&) {
    try {
        auto result = context_.aggregator.collect();
        if (result.stale) {
            spdlog::warn("Serving stale metrics from {}", result.snapshot->timestamp_ms);
        }
        return Response::json(200, result.to_json().dump());
    } catch (const std::exception& e) {
        json response;
        response["error"] = e.what();
        return Response::json(500, response.dump());
    }
}

} // namespace perfmon::monitor
