#include "market_data/ws_transport.hpp"
#include <spdlog/spdlog.h>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <random>
#include <algorithm>

namespace polycap {

namespace {
    constexpr uint64_t MAX_FRAME_BYTES = 4 * 1024 * 1024;

    std::string base64_encode(const std::string& input) {
        static const char* b64 = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        std::string encoded;
        for (size_t i = 0; i < input.size(); i += 3) {
            uint32_t n = static_cast<uint8_t>(input[i]) << 16;
            if (i + 1 < input.size()) n |= static_cast<uint8_t>(input[i + 1]) << 8;
            if (i + 2 < input.size()) n |= static_cast<uint8_t>(input[i + 2]);
            encoded += b64[(n >> 18) & 0x3F];
            encoded += b64[(n >> 12) & 0x3F];
            encoded += (i + 1 < input.size()) ? b64[(n >> 6) & 0x3F] : '=';
            encoded += (i + 2 < input.size()) ? b64[n & 0x3F] : '=';
        }
        return encoded;
    }

    std::string create_ws_handshake(const std::string& host, const std::string& path) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 255);

        std::string key;
        for (int i = 0; i < 16; i++) {
            key += static_cast<char>(dis(gen));
        }

        std::string request = "GET " + path + " HTTP/1.1\r\n";
        request += "Host: " + host + "\r\n";
        request += "Upgrade: websocket\r\n";
        request += "Connection: Upgrade\r\n";
        request += "Sec-WebSocket-Key: " + base64_encode(key) + "\r\n";
        request += "Sec-WebSocket-Version: 13\r\n";
        request += "\r\n";
        return request;
    }

    std::string create_ws_frame(const std::string& data, uint8_t opcode) {
        std::string frame;
        frame += static_cast<char>(0x80 | opcode);  // FIN + opcode

        size_t len = data.size();
        if (len < 126) {
            frame += static_cast<char>(0x80 | len);  // Masked + length
        } else if (len < 65536) {
            frame += static_cast<char>(0x80 | 126);
            frame += static_cast<char>((len >> 8) & 0xFF);
            frame += static_cast<char>(len & 0xFF);
        } else {
            frame += static_cast<char>(0x80 | 127);
            for (int i = 7; i >= 0; i--) {
                frame += static_cast<char>((len >> (8 * i)) & 0xFF);
            }
        }

        // Client frames are always masked
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 255);
        uint8_t mask[4];
        for (int i = 0; i < 4; i++) {
            mask[i] = static_cast<uint8_t>(dis(gen));
            frame += static_cast<char>(mask[i]);
        }

        for (size_t i = 0; i < data.size(); i++) {
            frame += static_cast<char>(data[i] ^ mask[i % 4]);
        }

        return frame;
    }

    void set_socket_timeouts(int fd, int timeout_ms) {
        struct timeval tv{};
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
}

std::optional<WsUrl> parse_ws_url(const std::string& url) {
    WsUrl result;
    std::string rest;

    if (url.rfind("wss://", 0) == 0) {
        result.secure = true;
        result.port = 443;
        rest = url.substr(6);
    } else if (url.rfind("ws://", 0) == 0) {
        result.secure = false;
        result.port = 80;
        rest = url.substr(5);
    } else {
        return std::nullopt;
    }

    auto slash = rest.find('/');
    std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
    result.path = slash == std::string::npos ? "/" : rest.substr(slash);

    auto colon = authority.find(':');
    if (colon != std::string::npos) {
        result.host = authority.substr(0, colon);
        try {
            result.port = std::stoi(authority.substr(colon + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
        if (result.port <= 0 || result.port > 65535) return std::nullopt;
    } else {
        result.host = authority;
    }

    if (result.host.empty()) return std::nullopt;
    return result;
}

TlsWebSocket::TlsWebSocket(const std::string& url, int connect_timeout_ms)
    : url_(url)
    , connect_timeout_ms_(connect_timeout_ms)
{
}

TlsWebSocket::~TlsWebSocket() {
    close();
}

bool TlsWebSocket::open() {
    auto target = parse_ws_url(url_);
    if (!target) {
        spdlog::error("Invalid WebSocket URL: {}", url_);
        return false;
    }

    std::lock_guard<std::mutex> lock(io_mutex_);
    release();
    secure_ = target->secure;

    if (!connect_socket(*target)) {
        release();
        return false;
    }

    if (!perform_handshake(*target)) {
        release();
        return false;
    }

    fragment_buffer_.clear();
    open_ = true;
    spdlog::debug("WebSocket connected: {}", url_);
    return true;
}

bool TlsWebSocket::connect_socket(const WsUrl& target) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port = std::to_string(target.port);
    int rc = getaddrinfo(target.host.c_str(), port.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        spdlog::error("Failed to resolve host {}: {}", target.host, gai_strerror(rc));
        return false;
    }

    for (auto* ai = res; ai != nullptr; ai = ai->ai_next) {
        int sock = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) continue;

        // SO_SNDTIMEO also bounds connect() on Linux
        set_socket_timeouts(sock, connect_timeout_ms_);
        if (::connect(sock, ai->ai_addr, ai->ai_addrlen) == 0) {
            fd_ = sock;
            break;
        }
        ::close(sock);
    }
    freeaddrinfo(res);

    if (fd_ < 0) {
        spdlog::error("Failed to connect to {}:{}: {}", target.host, target.port, strerror(errno));
        return false;
    }

    if (!target.secure) {
        return true;
    }

    SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
    if (!ctx) {
        spdlog::error("Failed to create SSL context");
        return false;
    }
    ssl_ctx_ = ctx;
    SSL_CTX_set_default_verify_paths(ctx);

    SSL* ssl = SSL_new(ctx);
    if (!ssl) {
        spdlog::error("Failed to create SSL session");
        return false;
    }
    ssl_ = ssl;
    SSL_set_fd(ssl, fd_);
    SSL_set_tlsext_host_name(ssl, target.host.c_str());

    if (SSL_connect(ssl) <= 0) {
        unsigned long err = ERR_get_error();
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        spdlog::error("SSL handshake failed with {}: {}", target.host, buf);
        return false;
    }

    return true;
}

bool TlsWebSocket::perform_handshake(const WsUrl& target) {
    std::string host_header = target.host;
    if ((target.secure && target.port != 443) || (!target.secure && target.port != 80)) {
        host_header += ":" + std::to_string(target.port);
    }

    std::string handshake = create_ws_handshake(host_header, target.path);
    if (raw_write(handshake.data(), static_cast<int>(handshake.size())) <= 0) {
        spdlog::error("Failed to send WebSocket handshake to {}", target.host);
        return false;
    }

    // Read headers byte-wise so no frame bytes are consumed with them
    std::string response;
    char c;
    while (response.size() < 16384) {
        if (raw_read(&c, 1) <= 0) {
            spdlog::error("Failed to receive WebSocket handshake response from {}", target.host);
            return false;
        }
        response += c;
        if (response.size() >= 4 && response.compare(response.size() - 4, 4, "\r\n\r\n") == 0) {
            break;
        }
    }

    auto line_end = response.find("\r\n");
    std::string status_line = response.substr(0, line_end);
    if (status_line.find(" 101") == std::string::npos) {
        spdlog::error("WebSocket handshake rejected by {}: {}", target.host, status_line);
        return false;
    }

    return true;
}

void TlsWebSocket::close() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (open_.load()) {
        // Best-effort close frame
        write_frame("", 0x08);
    }
    release();
}

void TlsWebSocket::release() {
    // Caller holds io_mutex_
    open_ = false;
    if (ssl_) {
        SSL_shutdown(static_cast<SSL*>(ssl_));
        SSL_free(static_cast<SSL*>(ssl_));
        ssl_ = nullptr;
    }
    if (ssl_ctx_) {
        SSL_CTX_free(static_cast<SSL_CTX*>(ssl_ctx_));
        ssl_ctx_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

int TlsWebSocket::raw_read(void* buf, int len) {
    if (secure_) {
        if (!ssl_) return -1;
        return SSL_read(static_cast<SSL*>(ssl_), buf, len);
    }
    if (fd_ < 0) return -1;
    return static_cast<int>(::recv(fd_, buf, len, 0));
}

int TlsWebSocket::raw_write(const void* buf, int len) {
    if (secure_) {
        if (!ssl_) return -1;
        return SSL_write(static_cast<SSL*>(ssl_), buf, len);
    }
    if (fd_ < 0) return -1;
    return static_cast<int>(::send(fd_, buf, len, MSG_NOSIGNAL));
}

bool TlsWebSocket::read_exact(void* buf, size_t len) {
    auto* out = static_cast<char*>(buf);
    size_t total = 0;
    while (total < len) {
        int chunk = raw_read(out + total, static_cast<int>(len - total));
        if (chunk <= 0) return false;
        total += chunk;
    }
    return true;
}

bool TlsWebSocket::write_frame(const std::string& data, uint8_t opcode) {
    std::string frame = create_ws_frame(data, opcode);
    return raw_write(frame.data(), static_cast<int>(frame.size())) > 0;
}

bool TlsWebSocket::has_buffered_data() {
    return secure_ && ssl_ && SSL_pending(static_cast<SSL*>(ssl_)) > 0;
}

TlsWebSocket::Frame TlsWebSocket::read_frame() {
    Frame frame;

    uint8_t header[2];
    if (!read_exact(header, 2)) return frame;

    bool fin = (header[0] & 0x80) != 0;
    uint8_t opcode = header[0] & 0x0F;
    bool masked = (header[1] & 0x80) != 0;
    uint64_t payload_len = header[1] & 0x7F;

    if (payload_len == 126) {
        uint8_t ext[2];
        if (!read_exact(ext, 2)) return frame;
        payload_len = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
    } else if (payload_len == 127) {
        uint8_t ext[8];
        if (!read_exact(ext, 8)) return frame;
        payload_len = 0;
        for (int i = 0; i < 8; i++) {
            payload_len = (payload_len << 8) | ext[i];
        }
    }

    uint8_t mask[4] = {0};
    if (masked && !read_exact(mask, 4)) return frame;

    if (payload_len > MAX_FRAME_BYTES) {
        spdlog::error("Frame too large: {}", payload_len);
        return frame;
    }

    std::string payload(payload_len, '\0');
    if (payload_len > 0 && !read_exact(&payload[0], payload_len)) return frame;

    if (masked) {
        for (size_t i = 0; i < payload.size(); i++) {
            payload[i] ^= mask[i % 4];
        }
    }

    switch (opcode) {
        case 0x00:  // Continuation
            fragment_buffer_ += payload;
            if (!fin) {
                frame.kind = FrameKind::PARTIAL;
                return frame;
            }
            frame.kind = FrameKind::DATA;
            frame.payload = std::move(fragment_buffer_);
            fragment_buffer_.clear();
            return frame;
        case 0x01:  // Text
        case 0x02:  // Binary
            if (!fin) {
                fragment_buffer_ = std::move(payload);
                frame.kind = FrameKind::PARTIAL;
                return frame;
            }
            frame.kind = FrameKind::DATA;
            frame.payload = std::move(payload);
            return frame;
        case 0x08:
            frame.kind = FrameKind::CLOSE;
            return frame;
        case 0x09:
            frame.kind = FrameKind::PING;
            frame.payload = std::move(payload);
            return frame;
        case 0x0A:
            frame.kind = FrameKind::PONG;
            return frame;
        default:
            spdlog::debug("Unknown WebSocket opcode {}", opcode);
            frame.kind = FrameKind::PARTIAL;
            return frame;
    }
}

WsTransport::RecvResult TlsWebSocket::receive(Duration timeout) {
    auto deadline = now() + timeout;

    while (true) {
        if (!open_.load()) {
            return {RecvStatus::CLOSED, ""};
        }

        bool readable = false;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            if (fd_ < 0) return {RecvStatus::CLOSED, ""};
            readable = has_buffered_data();
        }

        if (!readable) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now());
            if (remaining.count() <= 0) {
                return {RecvStatus::TIMEOUT, ""};
            }

            struct pollfd pfd{};
            pfd.fd = fd_;
            pfd.events = POLLIN;
            int slice = static_cast<int>(std::min<int64_t>(remaining.count(), 250));
            int rc = ::poll(&pfd, 1, slice);
            if (rc < 0) {
                if (errno == EINTR) continue;
                return {RecvStatus::ERROR, strerror(errno)};
            }
            if (rc == 0) continue;
            if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
                return {RecvStatus::CLOSED, ""};
            }
        }

        std::lock_guard<std::mutex> lock(io_mutex_);
        Frame frame = read_frame();
        switch (frame.kind) {
            case FrameKind::DATA:
                return {RecvStatus::MESSAGE, std::move(frame.payload)};
            case FrameKind::PING:
                if (!write_frame(frame.payload, 0x0A)) {
                    return {RecvStatus::ERROR, "pong write failed"};
                }
                break;
            case FrameKind::PONG:
            case FrameKind::PARTIAL:
                break;
            case FrameKind::CLOSE:
                spdlog::info("Received WebSocket close frame from {}", url_);
                open_ = false;
                return {RecvStatus::CLOSED, ""};
            case FrameKind::ERROR:
                open_ = false;
                return {RecvStatus::ERROR, "frame read failed"};
        }
    }
}

bool TlsWebSocket::send_text(const std::string& message) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!open_.load()) return false;
    if (!write_frame(message, 0x01)) {
        open_ = false;
        return false;
    }
    return true;
}

TransportFactory make_tls_transport_factory(int connect_timeout_ms) {
    return [connect_timeout_ms](const std::string& url) -> std::unique_ptr<WsTransport> {
        return std::make_unique<TlsWebSocket>(url, connect_timeout_ms);
    };
}

} // namespace polycap
