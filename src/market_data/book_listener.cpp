#include "market_data/book_listener.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace polycap {

namespace {
    std::string short_id(const std::string& id) {
        return id.size() > 6 ? id.substr(0, 6) + "..." : id;
    }
}

BookListener::BookListener(const std::string& market_id, const std::string& token_id,
                           const ConnectionConfig& config, TransportFactory factory,
                           EventHandler handler)
    : market_id_(market_id)
    , token_id_(token_id)
    , config_(config)
    , factory_(std::move(factory))
    , handler_(std::move(handler))
{
}

BookListener::~BookListener() {
    stop();
}

void BookListener::start() {
    if (recv_thread_.joinable()) return;
    recv_thread_ = std::thread(&BookListener::run, this);
}

void BookListener::cancel() {
    {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        cancelled_ = true;
    }
    cancel_cv_.notify_all();
}

void BookListener::stop() {
    cancel();
    if (recv_thread_.joinable()) {
        recv_thread_.join();
    }
}

std::string BookListener::subscribe_message(const std::string& token_id) {
    nlohmann::json msg;
    msg["type"] = "market";
    msg["assets_ids"] = nlohmann::json::array({token_id});
    return msg.dump();
}

std::vector<nlohmann::json> BookListener::normalize_events(const std::string& raw) {
    std::vector<nlohmann::json> events;

    nlohmann::json payload = nlohmann::json::parse(raw, nullptr, false);
    if (payload.is_discarded()) return events;

    if (payload.is_object()) {
        events.push_back(std::move(payload));
    } else if (payload.is_array()) {
        for (auto& e : payload) {
            if (e.is_object()) events.push_back(std::move(e));
        }
    }
    return events;
}

void BookListener::run() {
    status_ = ConnectionStatus::CONNECTING;
    spdlog::info("[CLOB] connecting market={} token={}", market_id_, short_id(token_id_));

    std::unique_ptr<WsTransport> transport = factory_(config_.clob_ws_url);
    if (!transport || !transport->open()) {
        spdlog::warn("[CLOB] connect failed market={}", market_id_);
        status_ = ConnectionStatus::ERROR;
        finished_ = true;
        return;
    }

    if (!transport->send_text(subscribe_message(token_id_))) {
        spdlog::warn("[CLOB] subscribe failed market={}", market_id_);
        transport->close();
        status_ = ConnectionStatus::ERROR;
        finished_ = true;
        return;
    }

    status_ = ConnectionStatus::CONNECTED;
    spdlog::info("[CLOB] subscribed market={} token={}", market_id_, short_id(token_id_));

    std::thread pinger(&BookListener::run_pinger, this, std::ref(*transport));
    receive_loop(*transport);

    // Wake the pinger and wait for it before the transport goes away
    cancel();
    pinger.join();
    transport->close();

    status_ = ConnectionStatus::CLOSED;
    finished_ = true;
    spdlog::info("[CLOB] closed market={} ({} messages)", market_id_, messages_received_.load());
}

void BookListener::run_pinger(WsTransport& transport) {
    std::unique_lock<std::mutex> lock(cancel_mutex_);
    while (!cancelled_.load()) {
        lock.unlock();
        bool ok = transport.send_text("PING");
        lock.lock();

        if (!ok) {
            spdlog::warn("[CLOB] ping failed market={}, ending listener", market_id_);
            cancelled_ = true;
            break;
        }
        pings_sent_++;

        cancel_cv_.wait_for(lock, std::chrono::milliseconds(config_.ping_interval_ms),
                            [this] { return cancelled_.load(); });
    }
}

void BookListener::receive_loop(WsTransport& transport) {
    const auto recv_timeout = std::chrono::milliseconds(config_.recv_timeout_ms);
    const auto slice = std::chrono::milliseconds(std::min(250, std::max(1, config_.recv_timeout_ms)));
    auto last_message = now();

    while (!cancelled_.load()) {
        auto result = transport.receive(slice);

        switch (result.status) {
            case WsTransport::RecvStatus::MESSAGE: {
                last_message = now();
                messages_received_++;
                auto events = normalize_events(result.payload);
                for (const auto& event : events) {
                    if (cancelled_.load()) break;
                    try {
                        handler_(event);
                        events_dispatched_++;
                    } catch (const std::exception& e) {
                        POLYCAP_COUNTER("book_handler_errors").increment();
                        spdlog::debug("[CLOB] handler error market={}: {}", market_id_, e.what());
                    }
                }
                break;
            }
            case WsTransport::RecvStatus::TIMEOUT:
                if (now() - last_message > recv_timeout) {
                    spdlog::warn("[CLOB] no message for {}ms market={}", config_.recv_timeout_ms, market_id_);
                    return;
                }
                break;
            case WsTransport::RecvStatus::CLOSED:
                return;
            case WsTransport::RecvStatus::ERROR:
                spdlog::warn("[CLOB] stream error market={}: {}", market_id_, result.payload);
                return;
        }
    }
}

} // namespace polycap
