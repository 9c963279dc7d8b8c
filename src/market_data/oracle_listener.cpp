#include "market_data/oracle_listener.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace polycap {

namespace {
    const std::string TOPIC_CHAINLINK = "crypto_prices_chainlink";
    const std::string TOPIC_BINANCE = "crypto_prices";
    // below INT64_MAX with room for the double rounding
    constexpr double MAX_TIMESTAMP_MS = 9.2e18;

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    // RTDS sends numbers, occasionally as strings
    std::optional<double> as_number(const nlohmann::json& v) {
        if (v.is_number()) return v.get<double>();
        if (v.is_string()) {
            try {
                size_t idx = 0;
                const auto& s = v.get_ref<const std::string&>();
                double d = std::stod(s, &idx);
                if (idx != s.size() || !std::isfinite(d)) return std::nullopt;
                return d;
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
        return std::nullopt;
    }
}

OracleListener::OracleListener(const ConnectionConfig& config, PriceSeriesCache& cache,
                               TransportFactory factory)
    : config_(config)
    , cache_(cache)
    , factory_(std::move(factory))
{
}

OracleListener::~OracleListener() {
    stop();
}

void OracleListener::start() {
    if (running_.exchange(true)) return;
    spdlog::info("Starting oracle listener on {}", config_.rtds_ws_url);
    recv_thread_ = std::thread(&OracleListener::run_connection_loop, this);
}

void OracleListener::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        running_ = false;
    }
    wait_cv_.notify_all();
    if (recv_thread_.joinable()) {
        recv_thread_.join();
        set_status(ConnectionStatus::CLOSED);
        spdlog::info("Oracle listener stopped ({} ticks, {} dropped)",
                     ticks_accepted_.load(), messages_dropped_.load());
    }
}

void OracleListener::set_status(ConnectionStatus s) {
    status_ = s;
    if (on_status_) on_status_(s);
}

std::string OracleListener::subscribe_message() {
    nlohmann::json msg;
    msg["action"] = "subscribe";
    msg["subscriptions"] = nlohmann::json::array({
        {{"topic", TOPIC_CHAINLINK}, {"type", "update"}, {"filters", ""}},
        {{"topic", TOPIC_BINANCE}, {"type", "update"}, {"filters", ""}}
    });
    return msg.dump();
}

std::optional<OracleTick> OracleListener::parse_message(const std::string& raw) {
    if (raw.find_first_not_of(" \t\r\n") == std::string::npos) return std::nullopt;

    nlohmann::json msg = nlohmann::json::parse(raw, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) return std::nullopt;

    nlohmann::json payload = nlohmann::json::object();
    if (msg.contains("payload") && msg["payload"].is_object()) {
        payload = msg["payload"];
    }

    std::string topic;
    if (msg.contains("topic") && msg["topic"].is_string()) {
        topic = msg["topic"].get<std::string>();
    } else if (payload.contains("topic") && payload["topic"].is_string()) {
        topic = payload["topic"].get<std::string>();
    }

    if (!payload.contains("timestamp") || !payload.contains("value")) return std::nullopt;
    auto ts = as_number(payload["timestamp"]);
    auto value = as_number(payload["value"]);
    if (!ts || !value || *value <= 0.0) return std::nullopt;
    if (*ts <= 0.0 || *ts >= MAX_TIMESTAMP_MS) return std::nullopt;

    std::string symbol;
    if (payload.contains("symbol") && payload["symbol"].is_string()) {
        symbol = to_lower(payload["symbol"].get<std::string>());
    }

    OracleTick tick;
    tick.timestamp_ms = static_cast<int64_t>(*ts);
    tick.price = *value;

    if (topic == TOPIC_CHAINLINK) {
        // "btc/usd"
        auto slash = symbol.find('/');
        if (slash == std::string::npos) return std::nullopt;
        tick.source = SOURCE_CHAINLINK;
        tick.asset = symbol.substr(0, slash);
    } else if (topic == TOPIC_BINANCE) {
        // "btcusdt"
        const std::string quote = "usdt";
        if (symbol.size() <= quote.size()
            || symbol.compare(symbol.size() - quote.size(), quote.size(), quote) != 0) {
            return std::nullopt;
        }
        tick.source = SOURCE_BINANCE;
        tick.asset = symbol.substr(0, symbol.size() - quote.size());
    } else {
        return std::nullopt;
    }

    if (!is_known_asset(tick.asset)) return std::nullopt;
    return tick;
}

void OracleListener::handle_message(const std::string& raw) {
    messages_received_++;

    auto tick = parse_message(raw);
    if (!tick) {
        messages_dropped_++;
        POLYCAP_COUNTER("oracle_messages_dropped").increment();
        return;
    }

    cache_.add(tick->source, tick->asset, tick->timestamp_ms, tick->price);
    ticks_accepted_++;
    POLYCAP_COUNTER("oracle_ticks").increment();

    if (on_tick_) on_tick_(*tick);
}

bool OracleListener::wait_reconnect_delay() {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, std::chrono::milliseconds(config_.reconnect_delay_ms),
                      [this] { return !running_.load(); });
    return running_.load();
}

void OracleListener::run_connection_loop() {
    while (running_.load()) {
        set_status(ConnectionStatus::CONNECTING);

        std::unique_ptr<WsTransport> transport = factory_(config_.rtds_ws_url);
        if (!transport || !transport->open()) {
            spdlog::warn("Oracle stream connect failed, retrying in {}ms", config_.reconnect_delay_ms);
            set_status(ConnectionStatus::RECONNECTING);
            if (!wait_reconnect_delay()) break;
            continue;
        }

        if (!transport->send_text(subscribe_message())) {
            spdlog::warn("Oracle subscribe failed");
            transport->close();
            set_status(ConnectionStatus::RECONNECTING);
            if (!wait_reconnect_delay()) break;
            continue;
        }

        connections_++;
        POLYCAP_COUNTER("oracle_connections").increment();
        set_status(ConnectionStatus::CONNECTED);
        spdlog::info("Oracle stream subscribed");

        receive_loop(*transport);
        transport->close();

        if (!running_.load()) break;

        spdlog::info("Oracle stream closed, reconnecting in {}ms", config_.reconnect_delay_ms);
        set_status(ConnectionStatus::RECONNECTING);
        if (!wait_reconnect_delay()) break;
    }
}

void OracleListener::receive_loop(WsTransport& transport) {
    const auto recv_timeout = std::chrono::milliseconds(config_.recv_timeout_ms);
    const auto slice = std::chrono::milliseconds(std::min(250, std::max(1, config_.recv_timeout_ms)));
    auto last_message = now();

    while (running_.load()) {
        auto result = transport.receive(slice);

        switch (result.status) {
            case WsTransport::RecvStatus::MESSAGE:
                last_message = now();
                handle_message(result.payload);
                break;
            case WsTransport::RecvStatus::TIMEOUT:
                if (now() - last_message > recv_timeout) {
                    spdlog::warn("No oracle message for {}ms, forcing reconnect", config_.recv_timeout_ms);
                    return;
                }
                break;
            case WsTransport::RecvStatus::CLOSED:
                return;
            case WsTransport::RecvStatus::ERROR:
                spdlog::warn("Oracle stream error: {}", result.payload);
                return;
        }
    }
}

} // namespace polycap
