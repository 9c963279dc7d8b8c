#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace polycap {

// Time types
using Timestamp = std::chrono::time_point<std::chrono::steady_clock>;
using WallClock = std::chrono::time_point<std::chrono::system_clock>;
using Duration = std::chrono::nanoseconds;

inline Timestamp now() {
    return std::chrono::steady_clock::now();
}

inline WallClock wall_now() {
    return std::chrono::system_clock::now();
}

inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// Binary market prices are probabilities in [0, 1]
using Price = double;
using Size = double;

// Oracle source tags
inline const std::string SOURCE_CHAINLINK = "cl";
inline const std::string SOURCE_BINANCE = "bn";

// Assets traded in 15-minute up/down markets
inline const std::vector<std::string>& known_assets() {
    static const std::vector<std::string> assets{"btc", "eth", "sol", "xrp"};
    return assets;
}

inline bool is_known_asset(const std::string& asset) {
    for (const auto& a : known_assets()) {
        if (a == asset) return true;
    }
    return false;
}

enum class BookSide {
    BID,
    ASK
};

// Connection status
enum class ConnectionStatus {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    RECONNECTING,
    CLOSED,
    ERROR
};

inline std::string conn_status_to_string(ConnectionStatus s) {
    switch (s) {
        case ConnectionStatus::DISCONNECTED: return "DISCONNECTED";
        case ConnectionStatus::CONNECTING: return "CONNECTING";
        case ConnectionStatus::CONNECTED: return "CONNECTED";
        case ConnectionStatus::RECONNECTING: return "RECONNECTING";
        case ConnectionStatus::CLOSED: return "CLOSED";
        case ConnectionStatus::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

// Oracle observation
struct PricePoint {
    int64_t timestamp_ms{0};
    Price price{0.0};

    bool operator==(const PricePoint& other) const {
        return timestamp_ms == other.timestamp_ms && price == other.price;
    }
};

// Price level in order book
struct PriceLevel {
    Price price{0.0};
    Size size{0.0};

    bool operator==(const PriceLevel& other) const {
        return price == other.price && size == other.size;
    }
};

// Ordered view of a book: bids descending, asks ascending
struct BookSnapshot {
    std::vector<PriceLevel> bids;
    std::vector<PriceLevel> asks;
};

// One persisted top-of-book row
struct BookRow {
    int64_t timestamp_ms{0};
    std::string timestamp_iso;
    Price bid_price_1{0.0};
    Size bid_size_1{0.0};
    Price ask_price_1{0.0};
    Size ask_size_1{0.0};
    Price spread{0.0};
    Price mid_price{0.0};
    std::string market_id;
};

// 15-minute recurring market
struct MarketWindow {
    static constexpr int64_t DURATION_MS = 15 * 60 * 1000;

    std::string market_id;
    std::string event_id;
    std::string slug;
    std::string question;
    std::string asset;
    std::string yes_token_id;
    std::string no_token_id;
    int64_t start_ms{0};
    std::optional<Price> strike;           // Oracle price at open, once captured
    std::string strike_source;             // Source the strike was read from

    int64_t end_ms() const { return start_ms + DURATION_MS; }
};

// Fair value of the YES outcome
struct FairValueResult {
    bool ok{false};
    std::string error;
    double fair_yes{0.5};
    double fair_no{0.5};
    double z_score{0.0};
    double log_distance{0.0};
    double sigma_remaining{0.0};
};

enum class MispriceKind {
    OVERPRICED_YES,
    UNDERPRICED_YES
};

inline std::string misprice_kind_to_string(MispriceKind k) {
    return k == MispriceKind::OVERPRICED_YES ? "overpriced_yes" : "underpriced_yes";
}

struct Misprice {
    MispriceKind kind{MispriceKind::UNDERPRICED_YES};
    double market_price{0.0};
    double fair_value{0.0};
    double edge{0.0};

    std::string action() const {
        return kind == MispriceKind::OVERPRICED_YES ? "short_yes (buy_no)" : "long_yes";
    }
};

enum class SignalAction {
    LONG,
    SHORT,
    NONE
};

inline std::string action_to_string(SignalAction a) {
    switch (a) {
        case SignalAction::LONG: return "long";
        case SignalAction::SHORT: return "short";
        case SignalAction::NONE: return "none";
    }
    return "none";
}

inline SignalAction action_from_string(const std::string& s) {
    if (s == "long" || s == "LONG") return SignalAction::LONG;
    if (s == "short" || s == "SHORT") return SignalAction::SHORT;
    return SignalAction::NONE;
}

// Signal produced by the pricing path
struct Signal {
    std::string market_id;
    std::string asset;
    SignalAction action{SignalAction::NONE};
    Price entry_price{0.0};
    double edge{0.0};
    double confidence{0.0};
    int64_t generated_at_ms{0};
    double fair_yes{0.0};
};

} // namespace polycap
