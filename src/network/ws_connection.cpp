/**
 * @file ws_connection.cpp
 * @brief WsConnection implementation: RFC 6455 client framing over poll().
 * @author AnalyzerOrchestrator Team
 */

#include "network/ws_connection.hpp"

#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <map>

namespace analyzer_orchestrator {

namespace {

constexpr std::string_view kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr size_t kMaxHandshakeBytes = 16 * 1024;

void configure_socket(int fd) {
    int flag = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag));
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left <= 0 ? 0 : static_cast<int>(std::min<int64_t>(left, INT32_MAX));
}

std::string to_lower(std::string_view text) {
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(std::string_view text) {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos) return {};
    auto end = text.find_last_not_of(" \t\r");
    return std::string{text.substr(begin, end - begin + 1)};
}

std::string openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

Error remote_error(const std::string& message) {
    return Error{message, ErrorKind::RemoteFailure};
}

}  // namespace

// ─────────────────────────────────────────────
// URL / handshake helpers
// ─────────────────────────────────────────────

std::string WsUrl::to_string() const {
    return std::string{secure ? "wss://" : "ws://"} + host + ":" + std::to_string(port) + path;
}

Result<WsUrl> parse_ws_url(std::string_view url) {
    WsUrl out;
    if (url.rfind("wss://", 0) == 0) {
        out.secure = true;
        out.port = 443;
        url.remove_prefix(6);
    } else if (url.rfind("ws://", 0) == 0) {
        url.remove_prefix(5);
    } else {
        return Error{"Not a WebSocket URL: " + std::string{url}, ErrorKind::InvalidArgument};
    }

    auto slash = url.find('/');
    std::string_view authority = url.substr(0, slash);
    if (slash != std::string_view::npos) out.path = std::string{url.substr(slash)};

    std::string_view port_text;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return Error{"Malformed IPv6 host in " + std::string{url}, ErrorKind::InvalidArgument};
        }
        out.host = std::string{authority.substr(1, close - 1)};
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            port_text = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        out.host = std::string{authority.substr(0, colon)};
        if (colon != std::string_view::npos) port_text = authority.substr(colon + 1);
    }

    if (out.host.empty()) {
        return Error{"Missing host in WebSocket URL", ErrorKind::InvalidArgument};
    }
    if (!port_text.empty()) {
        uint32_t port = 0;
        for (char c : port_text) {
            if (c < '0' || c > '9') {
                return Error{"Invalid port in " + std::string{url}, ErrorKind::InvalidArgument};
            }
            port = port * 10 + static_cast<uint32_t>(c - '0');
            if (port > 65535) {
                return Error{"Port out of range in " + std::string{url},
                             ErrorKind::InvalidArgument};
            }
        }
        out.port = static_cast<uint16_t>(port);
    }
    return out;
}

std::string base64_encode(const unsigned char* data, size_t len) {
    std::string out(4 * ((len + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data,
                                  static_cast<int>(len));
    out.resize(static_cast<size_t>(std::max(written, 0)));
    return out;
}

std::string websocket_accept_key(std::string_view client_key) {
    std::string combined{client_key};
    combined += kWebSocketGuid;
    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(combined.data()), combined.size(), hash);
    return base64_encode(hash, SHA_DIGEST_LENGTH);
}

std::vector<uint8_t> encode_ws_frame(WsOpcode opcode, std::string_view payload, bool fin,
                                     const uint8_t* mask_key) {
    std::vector<uint8_t> frame;
    frame.reserve(payload.size() + 14);
    frame.push_back(static_cast<uint8_t>((fin ? 0x80 : 0x00) | static_cast<uint8_t>(opcode)));

    const uint8_t mask_bit = mask_key != nullptr ? 0x80 : 0x00;
    const size_t len = payload.size();
    if (len <= 125) {
        frame.push_back(static_cast<uint8_t>(mask_bit | len));
    } else if (len <= 0xFFFF) {
        frame.push_back(mask_bit | 126);
        frame.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
        frame.push_back(static_cast<uint8_t>(len & 0xFF));
    } else {
        frame.push_back(mask_bit | 127);
        for (int i = 7; i >= 0; --i) {
            frame.push_back(static_cast<uint8_t>((static_cast<uint64_t>(len) >> (i * 8)) & 0xFF));
        }
    }

    if (mask_key != nullptr) {
        frame.insert(frame.end(), mask_key, mask_key + 4);
        for (size_t i = 0; i < len; ++i) {
            frame.push_back(static_cast<uint8_t>(payload[i]) ^ mask_key[i % 4]);
        }
    } else {
        frame.insert(frame.end(), payload.begin(), payload.end());
    }
    return frame;
}

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

WsConnection::WsConnection() = default;

WsConnection::~WsConnection() {
    drop();
}

void WsConnection::drop() noexcept {
    if (ssl_ != nullptr) {
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    if (ssl_ctx_ != nullptr) {
        SSL_CTX_free(ssl_ctx_);
        ssl_ctx_ = nullptr;
    }
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        fd_ = -1;
    }
    pending_.clear();
}

void WsConnection::close() noexcept {
    if (fd_ < 0) return;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds{200};
    uint8_t mask[4] = {0, 0, 0, 0};
    RAND_bytes(mask, sizeof(mask));
    // Status 1000 (normal closure)
    const char body[2] = {static_cast<char>(0x03), static_cast<char>(0xE8)};
    auto frame = encode_ws_frame(WsOpcode::Close, std::string_view{body, 2}, true, mask);
    if (auto r = write_all(frame.data(), frame.size(), deadline); !r) {
        // Peer already gone; nothing left to tell it.
    }
    drop();
}

// ─────────────────────────────────────────────
// Connect
// ─────────────────────────────────────────────

Result<void> WsConnection::connect(const WsUrl& url, Duration timeout) {
    if (fd_ >= 0) {
        return Error{"Already connected", ErrorKind::Internal};
    }
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    if (auto r = open_socket(url, deadline); !r) {
        drop();
        return r;
    }
    if (url.secure) {
        if (auto r = start_tls(url, deadline); !r) {
            drop();
            return r;
        }
    }
    if (auto r = handshake(url, deadline); !r) {
        drop();
        return r;
    }
    return {};
}

Result<void> WsConnection::open_socket(const WsUrl& url, Deadline deadline) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* resolved = nullptr;
    const std::string port = std::to_string(url.port);
    int gai = ::getaddrinfo(url.host.c_str(), port.c_str(), &hints, &resolved);
    if (gai != 0) {
        return remote_error("Cannot resolve " + url.host + ": " + gai_strerror(gai));
    }

    std::string last_error = "no addresses";
    for (addrinfo* ai = resolved; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                          ai->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }

        int ret = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            last_error = std::strerror(errno);
            ::close(fd);
            continue;
        }

        if (ret < 0) {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            int ready = ::poll(&pfd, 1, remaining_ms(deadline));
            if (ready <= 0) {
                ::close(fd);
                ::freeaddrinfo(resolved);
                return Error{"Connect to " + url.to_string() + " timed out", ErrorKind::Timeout};
            }
            int err = 0;
            socklen_t len = sizeof(err);
            ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len);
            if (err != 0) {
                last_error = std::strerror(err);
                ::close(fd);
                continue;
            }
        }

        configure_socket(fd);
        fd_ = fd;
        ::freeaddrinfo(resolved);
        return {};
    }

    ::freeaddrinfo(resolved);
    return remote_error("Connect to " + url.to_string() + " failed: " + last_error);
}

Result<void> WsConnection::start_tls(const WsUrl& url, Deadline deadline) {
    ssl_ctx_ = SSL_CTX_new(TLS_client_method());
    if (ssl_ctx_ == nullptr) return remote_error("SSL_CTX_new: " + openssl_error());
    SSL_CTX_set_default_verify_paths(ssl_ctx_);
    SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);

    ssl_ = SSL_new(ssl_ctx_);
    if (ssl_ == nullptr) return remote_error("SSL_new: " + openssl_error());
    SSL_set_fd(ssl_, fd_);
    SSL_set_tlsext_host_name(ssl_, url.host.c_str());
    SSL_set1_host(ssl_, url.host.c_str());

    while (true) {
        int ret = SSL_connect(ssl_);
        if (ret == 1) return {};
        int err = SSL_get_error(ssl_, ret);
        if (err == SSL_ERROR_WANT_READ) {
            if (auto r = wait_fd(POLLIN, deadline); !r) return r;
        } else if (err == SSL_ERROR_WANT_WRITE) {
            if (auto r = wait_fd(POLLOUT, deadline); !r) return r;
        } else {
            return remote_error("TLS handshake with " + url.host + " failed: " + openssl_error());
        }
    }
}

Result<void> WsConnection::handshake(const WsUrl& url, Deadline deadline) {
    unsigned char nonce[16];
    if (RAND_bytes(nonce, sizeof(nonce)) != 1) {
        return Error{"RAND_bytes failed", ErrorKind::Internal};
    }
    const std::string key = base64_encode(nonce, sizeof(nonce));

    std::string request = "GET " + url.path + " HTTP/1.1\r\n"
                          "Host: " + url.host + ":" + std::to_string(url.port) + "\r\n"
                          "Upgrade: websocket\r\n"
                          "Connection: Upgrade\r\n"
                          "Sec-WebSocket-Key: " + key + "\r\n"
                          "Sec-WebSocket-Version: 13\r\n"
                          "\r\n";
    if (auto r = write_all(reinterpret_cast<const uint8_t*>(request.data()), request.size(),
                           deadline); !r) {
        return r;
    }

    std::string response;
    size_t header_end = std::string::npos;
    while (header_end == std::string::npos) {
        if (response.size() > kMaxHandshakeBytes) {
            return Error{"Handshake response too large", ErrorKind::Protocol};
        }
        uint8_t buf[1024];
        auto n = read_some(buf, sizeof(buf), deadline);
        if (!n) return n.error();
        response.append(reinterpret_cast<const char*>(buf), *n);
        header_end = response.find("\r\n\r\n");
    }
    pending_ = response.substr(header_end + 4);
    response.resize(header_end);

    auto line_end = response.find("\r\n");
    std::string status_line = response.substr(0, line_end);
    if (status_line.rfind("HTTP/1.1 101", 0) != 0) {
        return Error{"Upgrade rejected by " + url.to_string() + ": " + status_line,
                     ErrorKind::Protocol};
    }

    std::map<std::string, std::string> headers;
    size_t pos = line_end == std::string::npos ? response.size() : line_end + 2;
    while (pos < response.size()) {
        auto next = response.find("\r\n", pos);
        if (next == std::string::npos) next = response.size();
        std::string_view line{response.data() + pos, next - pos};
        auto colon = line.find(':');
        if (colon != std::string_view::npos) {
            headers[to_lower(line.substr(0, colon))] = trim(line.substr(colon + 1));
        }
        pos = next + 2;
    }

    if (to_lower(headers["upgrade"]) != "websocket") {
        return Error{"Handshake response lacks Upgrade: websocket", ErrorKind::Protocol};
    }
    if (headers["sec-websocket-accept"] != websocket_accept_key(key)) {
        return Error{"Sec-WebSocket-Accept mismatch from " + url.to_string(),
                     ErrorKind::Protocol};
    }
    return {};
}

// ─────────────────────────────────────────────
// Messages
// ─────────────────────────────────────────────

Result<void> WsConnection::send_text(std::string_view payload, Duration timeout) {
    if (fd_ < 0) return remote_error("Not connected");
    return send_frame(WsOpcode::Text, payload, std::chrono::steady_clock::now() + timeout);
}

Result<void> WsConnection::send_frame(WsOpcode opcode, std::string_view payload,
                                      Deadline deadline) {
    uint8_t mask[4];
    if (RAND_bytes(mask, sizeof(mask)) != 1) {
        return Error{"RAND_bytes failed", ErrorKind::Internal};
    }
    auto frame = encode_ws_frame(opcode, payload, true, mask);
    return write_all(frame.data(), frame.size(), deadline);
}

Result<std::string> WsConnection::receive(Duration timeout) {
    if (fd_ < 0) return remote_error("Not connected");
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::string message;
    bool in_fragment = false;
    while (true) {
        auto frame = read_frame(deadline);
        if (!frame) return frame.error();

        switch (frame->opcode) {
            case WsOpcode::Ping:
                if (auto r = send_frame(WsOpcode::Pong, frame->payload, deadline); !r) {
                    return r.error();
                }
                continue;
            case WsOpcode::Pong:
                continue;
            case WsOpcode::Close: {
                uint8_t mask[4] = {0, 0, 0, 0};
                RAND_bytes(mask, sizeof(mask));
                auto reply = encode_ws_frame(WsOpcode::Close, frame->payload.substr(0, 2), true,
                                             mask);
                if (auto r = write_all(reply.data(), reply.size(), deadline); !r) {
                    // The peer may already have closed its side.
                }
                drop();
                return remote_error("Connection closed by peer");
            }
            case WsOpcode::Text:
            case WsOpcode::Binary:
                if (in_fragment) {
                    return Error{"New data frame inside a fragmented message",
                                 ErrorKind::Protocol};
                }
                message = std::move(frame->payload);
                in_fragment = !frame->fin;
                break;
            case WsOpcode::Continuation:
                if (!in_fragment) {
                    return Error{"Continuation frame without a message", ErrorKind::Protocol};
                }
                message += frame->payload;
                in_fragment = !frame->fin;
                break;
            default:
                return Error{"Unknown opcode", ErrorKind::Protocol};
        }

        if (message.size() > max_message_size_) {
            return Error{"Message exceeds " + std::to_string(max_message_size_) + " bytes",
                         ErrorKind::Protocol};
        }
        if (!in_fragment) return message;
    }
}

Result<WsConnection::Frame> WsConnection::read_frame(Deadline deadline) {
    uint8_t header[2];
    if (auto r = read_exact(header, 2, deadline); !r) return r.error();

    if ((header[0] & 0x70) != 0) {
        return Error{"Reserved bits set without a negotiated extension", ErrorKind::Protocol};
    }

    Frame frame;
    frame.fin = (header[0] & 0x80) != 0;
    frame.opcode = static_cast<WsOpcode>(header[0] & 0x0F);
    const bool masked = (header[1] & 0x80) != 0;
    uint64_t length = header[1] & 0x7F;

    if (length == 126) {
        uint8_t ext[2];
        if (auto r = read_exact(ext, 2, deadline); !r) return r.error();
        length = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
    } else if (length == 127) {
        uint8_t ext[8];
        if (auto r = read_exact(ext, 8, deadline); !r) return r.error();
        length = 0;
        for (uint8_t byte : ext) length = (length << 8) | byte;
    }

    if (length > max_message_size_) {
        return Error{"Frame of " + std::to_string(length) + " bytes exceeds the limit",
                     ErrorKind::Protocol};
    }

    uint8_t mask[4] = {0, 0, 0, 0};
    if (masked) {
        if (auto r = read_exact(mask, 4, deadline); !r) return r.error();
    }

    frame.payload.resize(static_cast<size_t>(length));
    if (length > 0) {
        if (auto r = read_exact(reinterpret_cast<uint8_t*>(frame.payload.data()),
                                frame.payload.size(), deadline); !r) {
            return r.error();
        }
    }
    if (masked) {
        for (size_t i = 0; i < frame.payload.size(); ++i) {
            frame.payload[i] = static_cast<char>(frame.payload[i] ^ mask[i % 4]);
        }
    }
    return frame;
}

// ─────────────────────────────────────────────
// Byte I/O
// ─────────────────────────────────────────────

Result<void> WsConnection::wait_fd(short events, Deadline deadline) {
    while (true) {
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = events;
        int ready = ::poll(&pfd, 1, remaining_ms(deadline));
        if (ready > 0) return {};
        if (ready == 0) return Error{"Timed out waiting for worker", ErrorKind::Timeout};
        if (errno != EINTR) return remote_error(std::string{"poll: "} + std::strerror(errno));
    }
}

Result<void> WsConnection::write_all(const uint8_t* data, size_t len, Deadline deadline) {
    if (fd_ < 0) return remote_error("Not connected");
    size_t sent_total = 0;
    while (sent_total < len) {
        if (ssl_ != nullptr) {
            int n = SSL_write(ssl_, data + sent_total, static_cast<int>(len - sent_total));
            if (n > 0) {
                sent_total += static_cast<size_t>(n);
                continue;
            }
            int err = SSL_get_error(ssl_, n);
            short events = err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT;
            if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) {
                return remote_error("TLS write failed: " + openssl_error());
            }
            if (auto r = wait_fd(events, deadline); !r) return r;
        } else {
            if (auto r = wait_fd(POLLOUT, deadline); !r) return r;
            auto n = ::send(fd_, data + sent_total, len - sent_total, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                return remote_error(std::string{"send: "} + std::strerror(errno));
            }
            sent_total += static_cast<size_t>(n);
        }
    }
    return {};
}

Result<size_t> WsConnection::read_some(uint8_t* data, size_t len, Deadline deadline) {
    if (!pending_.empty()) {
        size_t n = std::min(len, pending_.size());
        std::memcpy(data, pending_.data(), n);
        pending_.erase(0, n);
        return n;
    }
    if (fd_ < 0) return remote_error("Not connected");

    while (true) {
        if (ssl_ != nullptr) {
            int n = SSL_read(ssl_, data, static_cast<int>(len));
            if (n > 0) return static_cast<size_t>(n);
            int err = SSL_get_error(ssl_, n);
            if (err == SSL_ERROR_WANT_READ) {
                if (auto r = wait_fd(POLLIN, deadline); !r) return r.error();
            } else if (err == SSL_ERROR_WANT_WRITE) {
                if (auto r = wait_fd(POLLOUT, deadline); !r) return r.error();
            } else if (err == SSL_ERROR_ZERO_RETURN) {
                return remote_error("Connection closed by peer");
            } else {
                return remote_error("TLS read failed: " + openssl_error());
            }
        } else {
            if (auto r = wait_fd(POLLIN, deadline); !r) return r.error();
            auto n = ::recv(fd_, data, len, 0);
            if (n > 0) return static_cast<size_t>(n);
            if (n == 0) return remote_error("Connection closed by peer");
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return remote_error(std::string{"recv: "} + std::strerror(errno));
        }
    }
}

Result<void> WsConnection::read_exact(uint8_t* data, size_t len, Deadline deadline) {
    size_t got = 0;
    while (got < len) {
        auto n = read_some(data + got, len - got, deadline);
        if (!n) return n.error();
        got += *n;
    }
    return {};
}

}  // namespace analyzer_orchestrator
