#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include <optional>
#include <functional>
#include "common/types.hpp"

namespace polycap {

/**
 * Message-oriented WebSocket transport.
 *
 * Listeners only talk to this interface so tests can drive them with
 * scripted in-memory transports.
 */
class WsTransport {
public:
    enum class RecvStatus {
        MESSAGE,
        TIMEOUT,
        CLOSED,
        ERROR
    };

    struct RecvResult {
        RecvStatus status{RecvStatus::ERROR};
        std::string payload;
    };

    virtual ~WsTransport() = default;

    virtual bool open() = 0;
    virtual bool send_text(const std::string& message) = 0;
    virtual RecvResult receive(Duration timeout) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<WsTransport>(const std::string& url)>;

struct WsUrl {
    std::string host;
    int port{443};
    std::string path{"/"};
    bool secure{true};
};

// Parses ws:// and wss:// URLs
std::optional<WsUrl> parse_ws_url(const std::string& url);

/**
 * RFC 6455 client over a TCP socket, TLS via OpenSSL for wss://.
 * Sends and frame reads are serialized on one I/O mutex so a keep-alive
 * thread can send while another thread receives.
 */
class TlsWebSocket : public WsTransport {
public:
    TlsWebSocket(const std::string& url, int connect_timeout_ms);
    ~TlsWebSocket() override;

    TlsWebSocket(const TlsWebSocket&) = delete;
    TlsWebSocket& operator=(const TlsWebSocket&) = delete;

    bool open() override;
    bool send_text(const std::string& message) override;
    RecvResult receive(Duration timeout) override;
    void close() override;
    bool is_open() const override { return open_.load(); }

    const std::string& url() const { return url_; }

private:
    std::string url_;
    int connect_timeout_ms_;
    std::atomic<bool> open_{false};

    int fd_{-1};
    void* ssl_ctx_{nullptr};
    void* ssl_{nullptr};
    bool secure_{true};

    std::mutex io_mutex_;
    std::string fragment_buffer_;

    enum class FrameKind {
        DATA,
        PING,
        PONG,
        CLOSE,
        PARTIAL,
        ERROR
    };

    struct Frame {
        FrameKind kind{FrameKind::ERROR};
        std::string payload;
    };

    bool connect_socket(const WsUrl& target);
    bool perform_handshake(const WsUrl& target);
    void release();

    // Low-level I/O (caller holds io_mutex_ once connected)
    int raw_read(void* buf, int len);
    int raw_write(const void* buf, int len);
    bool read_exact(void* buf, size_t len);
    bool write_frame(const std::string& data, uint8_t opcode);
    Frame read_frame();
    bool has_buffered_data();
};

// Factory producing TlsWebSocket instances
TransportFactory make_tls_transport_factory(int connect_timeout_ms);

} // namespace polycap
