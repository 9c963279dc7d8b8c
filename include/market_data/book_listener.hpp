#pragma once

#include <functional>
#include <memory>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/config.hpp"
#include "market_data/ws_transport.hpp"

namespace polycap {

/**
 * CLOB market-channel listener for one token.
 *
 * Lifecycle: CONNECTING -> CONNECTED (subscribed, streaming) -> CLOSED.
 * There is no reconnect inside the listener; the scheduler decides whether
 * to start a new one. A keep-alive thread sends a text PING every
 * ping_interval_ms; a failed ping ends the listener.
 */
class BookListener {
public:
    using EventHandler = std::function<void(const nlohmann::json& event)>;

    BookListener(const std::string& market_id, const std::string& token_id,
                 const ConnectionConfig& config, TransportFactory factory,
                 EventHandler handler);
    ~BookListener();

    BookListener(const BookListener&) = delete;
    BookListener& operator=(const BookListener&) = delete;

    void start();

    // Request cancellation without waiting
    void cancel();

    // Cancel and join
    void stop();

    const std::string& market_id() const { return market_id_; }
    const std::string& token_id() const { return token_id_; }

    ConnectionStatus status() const { return status_.load(); }
    bool finished() const { return finished_.load(); }
    bool cancelled() const { return cancelled_.load(); }

    int64_t messages_received() const { return messages_received_.load(); }
    int64_t events_dispatched() const { return events_dispatched_.load(); }
    int64_t pings_sent() const { return pings_sent_.load(); }

    static std::string subscribe_message(const std::string& token_id);

    // Object -> [object], array -> its object elements, anything else -> []
    static std::vector<nlohmann::json> normalize_events(const std::string& raw);

private:
    std::string market_id_;
    std::string token_id_;
    ConnectionConfig config_;
    TransportFactory factory_;
    EventHandler handler_;

    std::atomic<ConnectionStatus> status_{ConnectionStatus::DISCONNECTED};
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> finished_{false};
    std::thread recv_thread_;

    std::mutex cancel_mutex_;
    std::condition_variable cancel_cv_;

    std::atomic<int64_t> messages_received_{0};
    std::atomic<int64_t> events_dispatched_{0};
    std::atomic<int64_t> pings_sent_{0};

    void run();
    void run_pinger(WsTransport& transport);
    void receive_loop(WsTransport& transport);
};

} // namespace polycap
