#pragma once
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace perfmon::monitor {

struct Request {
    std::string method;
    std::string path;                   // Without query string
    std::string query;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

struct Response {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;

    static Response json(int status, const std::string& body);
    static Response html(const std::string& body);
};

// Route table keyed by (method, path).
class Router {
public:
    using Handler = std::function<Response(const Request&)>;

    Router() = default;

    // Unknown routes answer 404; a throwing handler answers 500.
    Response handle(const Request& request) const;
    void add_route(const std::string& method, const std::string& path, Handler handler);

    bool has_route(const std::string& method, const std::string& path) const;

private:
    std::map<std::pair<std::string, std::string>, Handler> routes_;
};

} // namespace perfmon::monitor
