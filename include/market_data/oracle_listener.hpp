#pragma once

#include <functional>
#include <memory>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <string>
#include "common/types.hpp"
#include "config/config.hpp"
#include "market_data/price_series_cache.hpp"
#include "market_data/ws_transport.hpp"

namespace polycap {

// One decoded oracle update
struct OracleTick {
    std::string source;       // "cl" or "bn"
    std::string asset;
    int64_t timestamp_ms{0};
    Price price{0.0};
};

/**
 * RTDS oracle price listener.
 *
 * Subscribes to the Chainlink and Binance relay topics and writes every
 * accepted tick into the PriceSeriesCache. Any transport error, close or
 * silence longer than recv_timeout_ms drops the connection; it is reopened
 * after a fixed reconnect_delay_ms until stop() is called.
 */
class OracleListener {
public:
    using TickCallback = std::function<void(const OracleTick&)>;
    using StatusCallback = std::function<void(ConnectionStatus)>;

    OracleListener(const ConnectionConfig& config, PriceSeriesCache& cache, TransportFactory factory);
    ~OracleListener();

    OracleListener(const OracleListener&) = delete;
    OracleListener& operator=(const OracleListener&) = delete;

    void start();
    void stop();

    void set_tick_callback(TickCallback cb) { on_tick_ = std::move(cb); }
    void set_status_callback(StatusCallback cb) { on_status_ = std::move(cb); }

    ConnectionStatus status() const { return status_.load(); }
    bool is_connected() const { return status_.load() == ConnectionStatus::CONNECTED; }
    bool is_running() const { return running_.load(); }

    // Stats
    int64_t messages_received() const { return messages_received_.load(); }
    int64_t ticks_accepted() const { return ticks_accepted_.load(); }
    int64_t messages_dropped() const { return messages_dropped_.load(); }
    int64_t connections() const { return connections_.load(); }

    static std::string subscribe_message();

    // Decode one raw RTDS message; nullopt for anything that is not a usable tick
    static std::optional<OracleTick> parse_message(const std::string& raw);

private:
    ConnectionConfig config_;
    PriceSeriesCache& cache_;
    TransportFactory factory_;

    TickCallback on_tick_;
    StatusCallback on_status_;

    std::atomic<ConnectionStatus> status_{ConnectionStatus::DISCONNECTED};
    std::atomic<bool> running_{false};
    std::thread recv_thread_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    std::atomic<int64_t> messages_received_{0};
    std::atomic<int64_t> ticks_accepted_{0};
    std::atomic<int64_t> messages_dropped_{0};
    std::atomic<int64_t> connections_{0};

    void run_connection_loop();
    void receive_loop(WsTransport& transport);
    void handle_message(const std::string& raw);
    void set_status(ConnectionStatus s);

    // Sleeps for the reconnect delay; returns false if stop() interrupted it
    bool wait_reconnect_delay();
};

} // namespace polycap
