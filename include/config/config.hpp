#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace polycap {

struct CacheConfig {
    int64_t max_age_ms{30 * 60 * 1000};      // Retention relative to newest point
};

struct BookConfig {
    int levels{5};                           // Top N kept per side
    int flush_every_rows{100};               // Flush book logs every N valid rows
};

struct ScannerConfig {
    int horizon_sec{2 * 3600};               // +-2h around now
    int page_size{200};
    int max_pages{20};                       // Hard stop against runaway paging
    int connect_timeout_ms{5000};
    int request_timeout_ms{15000};
    std::string recurrence{"15m"};
};

struct ConnectionConfig {
    std::string gamma_url{"https://gamma-api.polymarket.com"};
    std::string rtds_ws_url{"wss://ws-live-data.polymarket.com"};
    std::string clob_ws_url{"wss://ws-subscriptions-clob.polymarket.com/ws/market"};

    int recv_timeout_ms{30000};              // Max wait per message before reconnect
    int reconnect_delay_ms{200};             // Fixed delay, no backoff
    int ping_interval_ms{10000};             // CLOB keep-alive
    int connect_timeout_ms{10000};
};

struct SchedulerConfig {
    int tick_interval_ms{1000};
    int scan_interval_sec{600};
    int start_buffer_sec{10};                // Listen this long before open
    int stop_buffer_sec{10};                 // Keep listening this long after close
    int max_active_listeners{64};
};

struct PricingConfig {
    double sigma_floor{0.001};
    double default_volatility{0.01};         // Per-minute vol when history is thin
    double min_edge{0.05};
    double full_confidence_edge{0.20};       // Edge at which confidence saturates
    int vol_lookback_minutes{30};
    int signal_interval_ms{1000};
};

struct EvaluatorConfig {
    double loss_penalty{0.5};                // Applied to losing trades only
    double position_scale{1.0};              // Sizing multiplier on every trade
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{true};
    bool json_format{true};                  // JSON lines format
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct Config {
    CacheConfig cache;
    BookConfig book;
    ScannerConfig scanner;
    ConnectionConfig connection;
    SchedulerConfig scheduler;
    PricingConfig pricing;
    EvaluatorConfig evaluator;
    LoggingConfig logging;

    std::string data_dir{"./data"};
    std::string signal_ledger_path{"./data/signals.jsonl"};

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

// JSON serialization
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace polycap
