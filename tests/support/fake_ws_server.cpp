/**
 * @file fake_ws_server.cpp
 * @brief FakeWsServer implementation over blocking POSIX sockets.
 * @author AnalyzerOrchestrator Team
 */

#include "support/fake_ws_server.hpp"

#include "network/ws_connection.hpp"
#include "protocol/worker_protocol.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cctype>
#include <stdexcept>

namespace analyzer_orchestrator::testing {

namespace {

bool read_exact(int fd, uint8_t* data, size_t len) {
    size_t got = 0;
    while (got < len) {
        ssize_t n = ::recv(fd, data + got, len - got, 0);
        if (n <= 0) return false;
        got += static_cast<size_t>(n);
    }
    return true;
}

bool write_all(int fd, const uint8_t* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

/// Read the upgrade request; returns the request path and client key.
bool read_handshake(int fd, std::string& path, std::string& key) {
    std::string request;
    char c = 0;
    while (request.size() < 16384 && request.find("\r\n\r\n") == std::string::npos) {
        if (::recv(fd, &c, 1, 0) != 1) return false;
        request.push_back(c);
    }

    auto first_space = request.find(' ');
    auto second_space = request.find(' ', first_space + 1);
    if (first_space == std::string::npos || second_space == std::string::npos) return false;
    path = request.substr(first_space + 1, second_space - first_space - 1);

    const std::string header = "sec-websocket-key:";
    std::string lower;
    lower.reserve(request.size());
    for (char ch : request) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    auto pos = lower.find(header);
    if (pos == std::string::npos) return false;
    auto begin = request.find_first_not_of(' ', pos + header.size());
    auto end = request.find("\r\n", begin);
    key = request.substr(begin, end - begin);
    return true;
}

/// Read one masked client frame. Returns false on EOF or a close frame.
bool read_client_message(int fd, std::string& payload) {
    uint8_t head[2];
    if (!read_exact(fd, head, 2)) return false;
    const uint8_t opcode = head[0] & 0x0F;
    uint64_t len = head[1] & 0x7F;
    if (len == 126) {
        uint8_t ext[2];
        if (!read_exact(fd, ext, 2)) return false;
        len = (uint64_t{ext[0]} << 8) | ext[1];
    } else if (len == 127) {
        uint8_t ext[8];
        if (!read_exact(fd, ext, 8)) return false;
        len = 0;
        for (uint8_t b : ext) len = (len << 8) | b;
    }
    uint8_t mask[4] = {0, 0, 0, 0};
    if ((head[1] & 0x80) != 0 && !read_exact(fd, mask, 4)) return false;

    payload.assign(len, '\0');
    if (len > 0 && !read_exact(fd, reinterpret_cast<uint8_t*>(payload.data()), len)) return false;
    for (size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<char>(payload[i] ^ mask[i % 4]);
    return opcode != static_cast<uint8_t>(WsOpcode::Close);
}

}  // namespace

FakeWsServer::FakeWsServer(Handler handler) : handler_(std::move(handler)) {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) throw std::runtime_error("socket() failed");
    int yes = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0
        || ::listen(listen_fd_, 64) != 0) {
        ::close(listen_fd_);
        throw std::runtime_error("bind/listen failed");
    }
    socklen_t len = sizeof(addr);
    ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    accept_thread_ = std::jthread([this](std::stop_token stop) { accept_loop(stop); });
}

FakeWsServer::~FakeWsServer() {
    accept_thread_.request_stop();
    if (accept_thread_.joinable()) accept_thread_.join();
    std::vector<std::jthread> connections;
    {
        std::lock_guard lock(mutex_);
        connections.swap(connections_);
    }
    connections.clear();
    ::close(listen_fd_);
}

std::vector<std::string> FakeWsServer::paths() const {
    std::lock_guard lock(mutex_);
    return paths_;
}

FakeWsServer::Handler FakeWsServer::reply_with(Json::Value message) {
    return [message = std::move(message)](const std::string&, const Json::Value&) {
        return std::vector<std::string>{to_json_string(message)};
    };
}

void FakeWsServer::accept_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        pollfd pfd{listen_fd_, POLLIN, 0};
        if (::poll(&pfd, 1, 50) <= 0) continue;
        int fd = ::accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) continue;

        timeval tv{5, 0};
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        std::lock_guard lock(mutex_);
        connections_.emplace_back([this, fd] { serve(fd); });
    }
}

void FakeWsServer::serve(int fd) {
    std::string path;
    std::string key;
    if (!read_handshake(fd, path, key)) {
        ::close(fd);
        return;
    }
    const std::string response =
        "HTTP/1.1 101 Switching Protocols\r\n"
        "Upgrade: websocket\r\n"
        "Connection: Upgrade\r\n"
        "Sec-WebSocket-Accept: " + websocket_accept_key(key) + "\r\n\r\n";
    if (!write_all(fd, reinterpret_cast<const uint8_t*>(response.data()), response.size())) {
        ::close(fd);
        return;
    }

    std::string payload;
    if (!read_client_message(fd, payload)) {
        ::close(fd);
        return;
    }
    auto request = parse_json(payload);
    if (!request) {
        ::close(fd);
        return;
    }

    std::vector<std::string> replies;
    if ((*request)["type"].asString() == "health_check") {
        ++health_checks_;
        if (!healthy_) {
            ::close(fd);
            return;
        }
        Json::Value pong(Json::objectValue);
        pong["type"] = "health_check_response";
        pong["status"] = "healthy";
        replies.push_back(to_json_string(pong));
    } else {
        ++requests_;
        {
            std::lock_guard lock(mutex_);
            paths_.push_back(path);
        }
        replies = handler_(path, *request);
    }

    for (const auto& reply : replies) {
        auto frame = encode_ws_frame(WsOpcode::Text, reply, true, nullptr);
        if (!write_all(fd, frame.data(), frame.size())) break;
    }
    // Drain the client's close frame, if any, before hanging up.
    std::string ignored;
    if (!replies.empty()) read_client_message(fd, ignored);
    ::close(fd);
}

}  // namespace analyzer_orchestrator::testing
