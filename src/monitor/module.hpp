#pragma once

namespace perfmon::monitor {

class Router;

// A group of endpoints that installs its handlers on the route table.
class RouteModule {
public:
    virtual ~RouteModule() = default;
    virtual void register_routes(Router& router) = 0;
};

} // namespace perfmon::monitor
