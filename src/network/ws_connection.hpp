/**
 * @file ws_connection.hpp
 * @brief Minimal RFC 6455 WebSocket client over POSIX sockets.
 * @author AnalyzerOrchestrator Team
 *
 * One connection carries one request/response exchange with a worker.
 * All I/O is non-blocking with poll() against a per-call deadline. wss://
 * URLs are wrapped in OpenSSL TLS.
 *
 * Wire frame (client side, always masked):
 *   [FIN|opcode][MASK|len7][len16 | len64]?[mask key 4B][payload ^ mask]
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

typedef struct ssl_st SSL;
typedef struct ssl_ctx_st SSL_CTX;

namespace analyzer_orchestrator {

struct WsUrl {
    bool secure = false;
    std::string host;
    uint16_t port = 80;
    std::string path = "/";

    [[nodiscard]] std::string to_string() const;
};

/// Parse ws://host[:port][/path] or wss://...
Result<WsUrl> parse_ws_url(std::string_view url);

/// base64(SHA-1(key + RFC 6455 GUID)), the expected Sec-WebSocket-Accept value.
std::string websocket_accept_key(std::string_view client_key);

/// Standard base64 encoding (OpenSSL EVP_EncodeBlock).
std::string base64_encode(const unsigned char* data, size_t len);

enum class WsOpcode : uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA
};

/// Serialize one frame. Client frames must be masked; server frames must not.
std::vector<uint8_t> encode_ws_frame(WsOpcode opcode, std::string_view payload, bool fin,
                                     const uint8_t* mask_key);

class WsConnection {
public:
    static constexpr uint64_t DEFAULT_MAX_MESSAGE_SIZE = 100ULL * 1024 * 1024;  // 100 MB

    WsConnection();
    ~WsConnection();

    WsConnection(const WsConnection&) = delete;
    WsConnection& operator=(const WsConnection&) = delete;

    /// Resolve, connect, (TLS) and perform the upgrade handshake.
    Result<void> connect(const WsUrl& url, Duration timeout);

    Result<void> send_text(std::string_view payload, Duration timeout);

    /**
     * @brief Read one complete text or binary message.
     *
     * Pings are answered and fragments reassembled transparently. A close
     * frame from the peer is a RemoteFailure; deadline expiry is a Timeout.
     */
    Result<std::string> receive(Duration timeout);

    /// Send a close frame (best effort) and drop the socket.
    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    void set_max_message_size(uint64_t bytes) noexcept { max_message_size_ = bytes; }

private:
    using Deadline = std::chrono::steady_clock::time_point;

    struct Frame {
        bool fin = true;
        WsOpcode opcode = WsOpcode::Text;
        std::string payload;
    };

    Result<void> open_socket(const WsUrl& url, Deadline deadline);
    Result<void> start_tls(const WsUrl& url, Deadline deadline);
    Result<void> handshake(const WsUrl& url, Deadline deadline);
    Result<void> send_frame(WsOpcode opcode, std::string_view payload, Deadline deadline);
    Result<Frame> read_frame(Deadline deadline);

    Result<void> write_all(const uint8_t* data, size_t len, Deadline deadline);
    Result<void> read_exact(uint8_t* data, size_t len, Deadline deadline);
    Result<size_t> read_some(uint8_t* data, size_t len, Deadline deadline);
    Result<void> wait_fd(short events, Deadline deadline);

    void drop() noexcept;

    int fd_ = -1;
    SSL_CTX* ssl_ctx_ = nullptr;
    SSL* ssl_ = nullptr;
    std::string pending_;  ///< Bytes read past the handshake response
    uint64_t max_message_size_ = DEFAULT_MAX_MESSAGE_SIZE;
};

}  // namespace analyzer_orchestrator
