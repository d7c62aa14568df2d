#include "monitor/router.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace perfmon::monitor {

Response Response::json(int status, const std::string& body) {
    return Response{status, "application/json", body};
}

Response Response::html(const std::string& body) {
    return Response{200, "text/html; charset=utf-8", body};
}

Response Router::handle(const Request& request) const {
    auto it = routes_.find({request.method, request.path});
    if (it == routes_.end()) {
        spdlog::warn("Unknown route: {} {}", request.method, request.path);
        return Response::json(404, nlohmann::json{{"error", "not found"}}.dump());
    }

    try {
        return it->second(request);
    } catch (const std::exception& e) {
        spdlog::error("{} {} failed: {}", request.method, request.path, e.what());
        return Response::json(500, nlohmann::json{{"error", e.what()}}.dump());
    }
}

void Router::add_route(const std::string& method, const std::string& path, Handler handler) {
    routes_[{method, path}] = std::move(handler);
}

bool Router::has_route(const std::string& method, const std::string& path) const {
    return routes_.count({method, path}) > 0;
}

} // namespace perfmon::monitor
