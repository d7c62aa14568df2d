#include <gtest/gtest.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "fake_probe.hpp"
#include "monitor/http_server.hpp"
#include "monitor/monitor.hpp"

using json = nlohmann::json;
using namespace perfmon::monitor;
using namespace perfmon::test_support;

namespace {

Request make_request(const std::string& method, const std::string& path, const std::string& body = "") {
    Request request;
    request.method = method;
    request.path = path;
    request.body = body;
    return request;
}

class MonitorServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        sidebar = dir.write("performance-monitor.html", "<html><body>sidebar</body></html>");

        config.port = 0;
        config.sidebar_path = sidebar.string();
        config.lag_interval_ms = 50;

        auto fake = std::make_unique<FakeProbe>();
        fake->available = 8 * GiB;
        fake->set_cores(2);
        fake->fs = perfmon::metrics::FsStats{1000, 4096, 500, 400};
        probe = fake.get();

        perfmon::metrics::ContainerPaths paths;
        paths.cgroup_root = dir.path() / "cgroup";
        paths.marker_root = dir.path() / "root";

        service = std::make_unique<MonitorService>(config, std::move(fake), paths);
        ASSERT_TRUE(service->init());
    }

    void TearDown() override {
        service->shutdown();
    }

    TempDir dir;
    std::filesystem::path sidebar;
    MonitorConfig config;
    FakeProbe* probe = nullptr;
    std::unique_ptr<MonitorService> service;
};

// Connected client socket to the local listener
int connect_local(uint16_t port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) throw std::runtime_error("socket failed");

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        throw std::runtime_error(std::string("connect failed: ") + std::strerror(errno));
    }
    return fd;
}

// One request over a real socket; returns the raw response
std::string http_exchange(uint16_t port, const std::string& raw_request) {
    int fd = connect_local(port);

    send(fd, raw_request.data(), raw_request.size(), 0);

    std::string response;
    char buffer[4096];
    ssize_t n;
    while ((n = recv(fd, buffer, sizeof(buffer), 0)) > 0) {
        response.append(buffer, static_cast<size_t>(n));
    }
    close(fd);
    return response;
}

} // namespace

TEST(RouterTest, UnknownRouteIs404) {
    Router router;
    router.add_route("GET", "/known", [](const Request&) { return Response::json(200, "{}"); });

    Response response = router.handle(make_request("GET", "/unknown"));
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(json::parse(response.body)["error"], "not found");

    // Method is part of the route key
    EXPECT_EQ(router.handle(make_request("POST", "/known")).status, 404);
    EXPECT_TRUE(router.has_route("GET", "/known"));
    EXPECT_FALSE(router.has_route("POST", "/known"));
}

TEST(RouterTest, ThrowingHandlerIs500) {
    Router router;
    router.add_route("GET", "/boom", [](const Request&) -> Response { throw std::runtime_error("kaput"); });

    Response response = router.handle(make_request("GET", "/boom"));
    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(json::parse(response.body)["error"], "kaput");
}

TEST(HttpParseTest, RequestWithBodyAndQuery) {
    const std::string raw =
        "POST /performance-monitor/settings?x=1 HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 13\r\n"
        "\r\n"
        "{\"hudSize\":1}";

    auto request = parse_request(raw);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->method, "POST");
    EXPECT_EQ(request->path, "/performance-monitor/settings");
    EXPECT_EQ(request->query, "x=1");
    EXPECT_EQ(request->body, "{\"hudSize\":1}");
    ASSERT_EQ(request->headers.size(), 3u);
    EXPECT_EQ(request->headers[0].first, "host");
    EXPECT_EQ(request->headers[0].second, "localhost");
}

TEST(HttpParseTest, MalformedRequests) {
    EXPECT_FALSE(parse_request("GET / HTTP/1.1\r\n").has_value());
    EXPECT_FALSE(parse_request("GET\r\n\r\n").has_value());
    EXPECT_FALSE(parse_request("GET nopath HTTP/1.1\r\n\r\n").has_value());
    EXPECT_FALSE(parse_request("GET / HTTP/1.1\r\nContent-Length: ten\r\n\r\n").has_value());
    EXPECT_FALSE(parse_request("POST / HTTP/1.1\r\nContent-Length: 10\r\n\r\nshort").has_value());
}

TEST(HttpParseTest, RequestState) {
    EXPECT_EQ(request_state("GET / HTTP/1.1\r\nHost: x"), RequestState::INCOMPLETE);
    EXPECT_EQ(request_state("GET / HTTP/1.1\r\n\r\n"), RequestState::COMPLETE);
    EXPECT_EQ(request_state("POST / HTTP/1.1\r\nContent-Length: 4\r\n\r\nab"), RequestState::INCOMPLETE);
    EXPECT_EQ(request_state("POST / HTTP/1.1\r\nContent-Length: 4\r\n\r\nabcd"), RequestState::COMPLETE);
    EXPECT_EQ(request_state("POST / HTTP/1.1\r\nContent-Length: x\r\n\r\n"), RequestState::MALFORMED);
    EXPECT_EQ(request_state("POST / HTTP/1.1\r\nContent-Length: 99999999\r\n\r\n"), RequestState::MALFORMED);
    EXPECT_EQ(request_state(std::string(HttpServer::MAX_HEAD_BYTES + 1, 'a')), RequestState::MALFORMED);
}

TEST(HttpParseTest, FormatResponse) {
    std::string raw = format_response(Response::json(404, "{\"error\":\"not found\"}"));

    EXPECT_EQ(raw.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
    EXPECT_NE(raw.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(raw.find("Content-Length: 21\r\n"), std::string::npos);
    EXPECT_NE(raw.find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(raw.substr(raw.size() - 21), "{\"error\":\"not found\"}");
}

TEST_F(MonitorServiceTest, StatsEndpoint) {
    Response response = service->dispatch(make_request("GET", STATS_PATH));
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.content_type, "application/json");

    json body = json::parse(response.body);
    EXPECT_EQ(body["version"], version());
    EXPECT_EQ(body["system"]["hostname"], "fake-host");
    EXPECT_EQ(body["system"]["cpu"]["cores"], 2);
    EXPECT_EQ(body["system"]["memory"]["usedPercent"], 50.0);
    EXPECT_EQ(body["process"]["pid"], 4242);
    EXPECT_FALSE(body.contains("error"));
}

TEST_F(MonitorServiceTest, StatsEndpointReportsSamplingError) {
    probe->fail_cpu_time = true;

    Response response = service->dispatch(make_request("GET", STATS_PATH));
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(json::parse(response.body)["error"], "getrusage failed");
}

TEST_F(MonitorServiceTest, SettingsRoundTrip) {
    Response get = service->dispatch(make_request("GET", SETTINGS_PATH));
    EXPECT_EQ(get.status, 200);
    EXPECT_EQ(json::parse(get.body)["refreshIntervalMs"], 2000);

    Response post = service->dispatch(make_request("POST", SETTINGS_PATH,
        R"({"refreshIntervalMs": "500", "hudTheme": "dark", "bogus": 1})"));
    EXPECT_EQ(post.status, 200);
    json body = json::parse(post.body);
    EXPECT_EQ(body["refreshIntervalMs"], 500);
    EXPECT_EQ(body["hudTheme"], "dark");
    EXPECT_FALSE(body.contains("bogus"));

    EXPECT_EQ(service->settings().refresh_interval_ms, 500);
}

TEST_F(MonitorServiceTest, SettingsEmptyBodyReturnsCurrent) {
    Response post = service->dispatch(make_request("POST", SETTINGS_PATH));
    EXPECT_EQ(post.status, 200);
    EXPECT_EQ(json::parse(post.body), Settings{}.to_json());
}

TEST_F(MonitorServiceTest, SettingsRejectsBadPayload) {
    EXPECT_EQ(service->dispatch(make_request("POST", SETTINGS_PATH, "{not json")).status, 400);
    EXPECT_EQ(service->dispatch(make_request("POST", SETTINGS_PATH, "[1,2]")).status, 400);
    EXPECT_EQ(service->settings().refresh_interval_ms, 2000);
}

TEST_F(MonitorServiceTest, SidebarServesAsset) {
    Response response = service->dispatch(make_request("GET", SIDEBAR_PATH));
    EXPECT_EQ(response.status, 200);
    EXPECT_NE(response.content_type.find("text/html"), std::string::npos);
    EXPECT_EQ(response.body, "<html><body>sidebar</body></html>");
}

TEST_F(MonitorServiceTest, UnknownPath) {
    EXPECT_EQ(service->dispatch(make_request("GET", "/performance-monitor/nope")).status, 404);
}

TEST_F(MonitorServiceTest, ShutdownRejectsRequests) {
    service->shutdown();
    EXPECT_FALSE(service->is_running());
    EXPECT_EQ(service->dispatch(make_request("GET", STATS_PATH)).status, 503);
}

TEST_F(MonitorServiceTest, ServesOverHttp) {
    ASSERT_TRUE(service->serve());
    ASSERT_NE(service->port(), 0);

    std::string response = http_exchange(service->port(),
        "GET /performance-monitor/stats HTTP/1.1\r\nHost: localhost\r\n\r\n");
    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);

    size_t body_start = response.find("\r\n\r\n");
    ASSERT_NE(body_start, std::string::npos);
    json body = json::parse(response.substr(body_start + 4));
    EXPECT_EQ(body["system"]["platform"], "linux");

    std::string settings = http_exchange(service->port(),
        "POST /performance-monitor/settings HTTP/1.1\r\nContent-Length: 16\r\n\r\n{\"hideHud\":true}");
    EXPECT_EQ(settings.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_TRUE(service->settings().hide_hud);
}

TEST_F(MonitorServiceTest, IdleConnectionDoesNotBlockOthers) {
    ASSERT_TRUE(service->serve());

    // Connected but never sends a byte
    int idle = connect_local(service->port());
    // Partial head, body never finished
    int partial = connect_local(service->port());
    const std::string head = "POST /performance-monitor/settings HTTP/1.1\r\nContent-Length: 40\r\n\r\n{";
    send(partial, head.data(), head.size(), 0);

    auto started = std::chrono::steady_clock::now();
    std::string response = http_exchange(service->port(),
        "GET /performance-monitor/settings HTTP/1.1\r\nHost: localhost\r\n\r\n");
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 1000);

    close(partial);
    close(idle);
}

TEST(MonitorServiceSidebarTest, MissingAssetAnswers404) {
    TempDir dir;
    MonitorConfig config;
    config.sidebar_path = (dir.path() / "absent.html").string();

    perfmon::metrics::ContainerPaths paths;
    paths.cgroup_root = dir.path() / "cgroup";
    paths.marker_root = dir.path() / "root";

    MonitorService service(config, std::make_unique<FakeProbe>(), paths);
    ASSERT_TRUE(service.init());
    EXPECT_FALSE(service.sidebar_html().has_value());

    Response response = service.dispatch(make_request("GET", SIDEBAR_PATH));
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(json::parse(response.body)["error"], "sidebar asset not loaded");
}
