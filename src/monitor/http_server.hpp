#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include "monitor/router.hpp"

namespace perfmon::runtime {
class TaskLoop;
}

namespace perfmon::monitor {

// Parse a complete request (head and body). nullopt when malformed.
std::optional<Request> parse_request(const std::string& raw);

// Serialize a response with Content-Length and Connection: close
std::string format_response(const Response& response);

enum class RequestState { INCOMPLETE, COMPLETE, MALFORMED };

// Whether the bytes received so far hold a whole request
RequestState request_state(const std::string& raw);

/**
 * Minimal HTTP/1.1 listener. One thread multiplexes the listening socket
 * and every open client with select(), one request per connection. Only
 * fully received requests reach the task loop, so handlers never execute
 * concurrently and a slow client cannot stall the others.
 */
class HttpServer {
public:
    static constexpr size_t MAX_HEAD_BYTES = 64 * 1024;
    static constexpr size_t MAX_BODY_BYTES = 1024 * 1024;
    static constexpr size_t MAX_CONNECTIONS = 64;
    static constexpr std::chrono::milliseconds CLIENT_TIMEOUT{5000};

    HttpServer(std::string bind_address, uint16_t port, const Router& router, runtime::TaskLoop& loop);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind, listen and start accepting; false if the socket could not be set up.
    bool start();
    void stop();

    bool is_running() const { return running_; }

    // Bound port (useful when constructed with port 0)
    uint16_t port() const { return port_; }

private:
    struct Connection {
        std::string raw;
        std::chrono::steady_clock::time_point accepted;
    };

    void accept_loop();
    void accept_client();
    void read_client(int client_fd);
    void expire_clients();
    void drop_client(int client_fd);
    Response dispatch(const std::string& raw);
    void respond(int client_fd, const Response& response);

    std::string bind_address_;
    uint16_t port_;
    const Router& router_;
    runtime::TaskLoop& loop_;

    int server_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread thread_;
    // Owned by the accept thread
    std::map<int, Connection> clients_;
};

} // namespace perfmon::monitor
