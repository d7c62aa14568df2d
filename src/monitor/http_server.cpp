#include "monitor/http_server.hpp"
#include "runtime/task_loop.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <vector>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace perfmon::monitor {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

// Content-Length from a raw head; 0 when absent, nullopt when invalid
std::optional<size_t> content_length(const std::string& head) {
    std::istringstream stream(head);
    std::string line;
    while (std::getline(stream, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (lower(trim(line.substr(0, colon))) != "content-length") continue;

        std::string value = trim(line.substr(colon + 1));
        if (value.empty() || !std::all_of(value.begin(), value.end(),
                                          [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        try {
            return static_cast<size_t>(std::stoull(value));
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }
    return 0;
}

bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

std::optional<Request> parse_request(const std::string& raw) {
    size_t head_end = raw.find("\r\n\r\n");
    if (head_end == std::string::npos) return std::nullopt;

    std::istringstream stream(raw.substr(0, head_end));
    std::string request_line;
    if (!std::getline(stream, request_line)) return std::nullopt;
    if (!request_line.empty() && request_line.back() == '\r') request_line.pop_back();

    Request request;
    std::istringstream line_stream(request_line);
    std::string target, version;
    if (!(line_stream >> request.method >> target >> version)) return std::nullopt;
    if (version.rfind("HTTP/", 0) != 0 || target.empty() || target[0] != '/') return std::nullopt;

    size_t query_pos = target.find('?');
    request.path = target.substr(0, query_pos);
    if (query_pos != std::string::npos) {
        request.query = target.substr(query_pos + 1);
    }

    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        size_t colon = line.find(':');
        if (colon == std::string::npos) return std::nullopt;
        request.headers.emplace_back(lower(trim(line.substr(0, colon))), trim(line.substr(colon + 1)));
    }

    auto length = content_length(raw.substr(0, head_end));
    if (!length) return std::nullopt;
    size_t body_start = head_end + 4;
    if (raw.size() - body_start < *length) return std::nullopt;
    request.body = raw.substr(body_start, *length);

    return request;
}

std::string format_response(const Response& response) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << response.status << " " << reason_phrase(response.status) << "\r\n"
        << "Content-Type: " << response.content_type << "\r\n"
        << "Content-Length: " << response.body.size() << "\r\n"
        << "Cache-Control: no-store\r\n"
        << "Connection: close\r\n"
        << "\r\n"
        << response.body;
    return oss.str();
}

RequestState request_state(const std::string& raw) {
    size_t head_end = raw.find("\r\n\r\n");
    if (head_end == std::string::npos) {
        return raw.size() > HttpServer::MAX_HEAD_BYTES ? RequestState::MALFORMED : RequestState::INCOMPLETE;
    }
    auto length = content_length(raw.substr(0, head_end));
    if (!length || *length > HttpServer::MAX_BODY_BYTES) return RequestState::MALFORMED;
    return raw.size() >= head_end + 4 + *length ? RequestState::COMPLETE : RequestState::INCOMPLETE;
}

HttpServer::HttpServer(std::string bind_address, uint16_t port, const Router& router, runtime::TaskLoop& loop)
    : bind_address_(std::move(bind_address)), port_(port), router_(router), loop_(loop) {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        spdlog::error("Socket creation failed: {}", std::strerror(errno));
        return false;
    }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(port_);
    if (inet_pton(AF_INET, bind_address_.c_str(), &address.sin_addr) != 1) {
        spdlog::error("Invalid bind address: {}", bind_address_);
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0) {
        spdlog::error("Bind to {}:{} failed: {}", bind_address_, port_, std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, 16) < 0) {
        spdlog::error("Listen failed: {}", std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    socklen_t len = sizeof(address);
    if (getsockname(server_fd_, reinterpret_cast<struct sockaddr*>(&address), &len) == 0) {
        port_ = ntohs(address.sin_port);
    }

    running_ = true;
    thread_ = std::thread(&HttpServer::accept_loop, this);
    spdlog::info("HTTP server listening on {}:{}", bind_address_, port_);
    return true;
}

void HttpServer::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    for (const auto& [fd, connection] : clients_) {
        close(fd);
    }
    clients_.clear();
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }
}

void HttpServer::accept_loop() {
    while (running_) {
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(server_fd_, &readfds);
        int max_fd = server_fd_;
        for (const auto& [fd, connection] : clients_) {
            FD_SET(fd, &readfds);
            max_fd = std::max(max_fd, fd);
        }

        // Wake up periodically to notice stop() and expire idle clients
        struct timeval timeout;
        timeout.tv_sec = 0;
        timeout.tv_usec = 100 * 1000;

        int activity = select(max_fd + 1, &readfds, nullptr, nullptr, &timeout);
        if (activity < 0 && errno != EINTR) {
            spdlog::error("select failed: {}", std::strerror(errno));
        }

        if (activity > 0) {
            std::vector<int> ready;
            for (const auto& [fd, connection] : clients_) {
                if (FD_ISSET(fd, &readfds)) ready.push_back(fd);
            }
            for (int fd : ready) {
                read_client(fd);
            }
            if (FD_ISSET(server_fd_, &readfds)) {
                accept_client();
            }
        }

        expire_clients();
    }
}

void HttpServer::accept_client() {
    int client_fd = accept(server_fd_, nullptr, nullptr);
    if (client_fd < 0) return;

    if (clients_.size() >= MAX_CONNECTIONS || client_fd >= FD_SETSIZE) {
        spdlog::warn("Refusing client: {} connections open", clients_.size());
        respond(client_fd, Response::json(503, nlohmann::json{{"error", "too many connections"}}.dump()));
        close(client_fd);
        return;
    }

    int flags = fcntl(client_fd, F_GETFL, 0);
    if (flags < 0 || fcntl(client_fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        spdlog::warn("Could not make client socket non-blocking: {}", std::strerror(errno));
        close(client_fd);
        return;
    }

    clients_[client_fd] = Connection{std::string(), std::chrono::steady_clock::now()};
}

void HttpServer::read_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) return;

    char buffer[8192];
    ssize_t n = recv(client_fd, buffer, sizeof(buffer), 0);
    if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) return;
    if (n <= 0) {
        // Peer went away before finishing its request
        drop_client(client_fd);
        return;
    }

    std::string& raw = it->second.raw;
    raw.append(buffer, static_cast<size_t>(n));

    switch (request_state(raw)) {
        case RequestState::INCOMPLETE:
            return;
        case RequestState::MALFORMED:
            respond(client_fd, Response::json(400, nlohmann::json{{"error", "malformed request"}}.dump()));
            break;
        case RequestState::COMPLETE:
            respond(client_fd, dispatch(raw));
            break;
    }
    drop_client(client_fd);
}

void HttpServer::expire_clients() {
    auto now = std::chrono::steady_clock::now();
    std::vector<int> expired;
    for (const auto& [fd, connection] : clients_) {
        if (now - connection.accepted >= CLIENT_TIMEOUT) expired.push_back(fd);
    }
    for (int fd : expired) {
        spdlog::debug("Closing idle client after {} ms",
                      std::chrono::duration_cast<std::chrono::milliseconds>(CLIENT_TIMEOUT).count());
        respond(fd, Response::json(408, nlohmann::json{{"error", "request timeout"}}.dump()));
        drop_client(fd);
    }
}

void HttpServer::drop_client(int client_fd) {
    close(client_fd);
    clients_.erase(client_fd);
}

Response HttpServer::dispatch(const std::string& raw) {
    auto request = parse_request(raw);
    if (!request) {
        return Response::json(400, nlohmann::json{{"error", "malformed request"}}.dump());
    }

    spdlog::debug("{} {}", request->method, request->path);
    try {
        const Request& req = *request;
        auto handled = loop_.call([this, &req]() { return router_.handle(req); });
        if (handled) return std::move(*handled);
        return Response::json(503, nlohmann::json{{"error", "shutting down"}}.dump());
    } catch (const std::exception& e) {
        return Response::json(500, nlohmann::json{{"error", e.what()}}.dump());
    }
}

void HttpServer::respond(int client_fd, const Response& response) {
    // Responses are written blocking, bounded by a send timeout
    int flags = fcntl(client_fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(client_fd, F_SETFL, flags & ~O_NONBLOCK);
    }
    struct timeval timeout;
    timeout.tv_sec = 5;
    timeout.tv_usec = 0;
    setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

    if (!send_all(client_fd, format_response(response))) {
        spdlog::debug("Client disconnected before response was sent");
    }
}

} // namespace perfmon::monitor
