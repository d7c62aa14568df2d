#include "monitor/route_handlers.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace perfmon::monitor {

void SidebarRoutes::register_routes(Router& router) {
    router.add_route("GET", SIDEBAR_PATH,
        [this](const Request& req) { return handle_sidebar(req); });
}

Response SidebarRoutes::handle_sidebar(const Request&) {
    if (!context_.sidebar_html) {
        json response;
        response["error"] = "sidebar asset not loaded";
        return Response::json(404, response.dump());
    }
    return Response::html(*context_.sidebar_html);
}

} // namespace perfmon::monitor
