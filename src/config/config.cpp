#include "config/config.hpp"
#include <fstream>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace polycap {

void to_json(nlohmann::json& j, const CacheConfig& c) {
    j = nlohmann::json{
        {"max_age_ms", c.max_age_ms}
    };
}

void from_json(const nlohmann::json& j, CacheConfig& c) {
    if (j.contains("max_age_ms")) j.at("max_age_ms").get_to(c.max_age_ms);
}

void to_json(nlohmann::json& j, const BookConfig& c) {
    j = nlohmann::json{
        {"levels", c.levels},
        {"flush_every_rows", c.flush_every_rows}
    };
}

void from_json(const nlohmann::json& j, BookConfig& c) {
    if (j.contains("levels")) j.at("levels").get_to(c.levels);
    if (j.contains("flush_every_rows")) j.at("flush_every_rows").get_to(c.flush_every_rows);
}

void to_json(nlohmann::json& j, const ScannerConfig& c) {
    j = nlohmann::json{
        {"horizon_sec", c.horizon_sec},
        {"page_size", c.page_size},
        {"max_pages", c.max_pages},
        {"connect_timeout_ms", c.connect_timeout_ms},
        {"request_timeout_ms", c.request_timeout_ms},
        {"recurrence", c.recurrence}
    };
}

void from_json(const nlohmann::json& j, ScannerConfig& c) {
    if (j.contains("horizon_sec")) j.at("horizon_sec").get_to(c.horizon_sec);
    if (j.contains("page_size")) j.at("page_size").get_to(c.page_size);
    if (j.contains("max_pages")) j.at("max_pages").get_to(c.max_pages);
    if (j.contains("connect_timeout_ms")) j.at("connect_timeout_ms").get_to(c.connect_timeout_ms);
    if (j.contains("request_timeout_ms")) j.at("request_timeout_ms").get_to(c.request_timeout_ms);
    if (j.contains("recurrence")) j.at("recurrence").get_to(c.recurrence);
}

void to_json(nlohmann::json& j, const ConnectionConfig& c) {
    j = nlohmann::json{
        {"gamma_url", c.gamma_url},
        {"rtds_ws_url", c.rtds_ws_url},
        {"clob_ws_url", c.clob_ws_url},
        {"recv_timeout_ms", c.recv_timeout_ms},
        {"reconnect_delay_ms", c.reconnect_delay_ms},
        {"ping_interval_ms", c.ping_interval_ms},
        {"connect_timeout_ms", c.connect_timeout_ms}
    };
}

void from_json(const nlohmann::json& j, ConnectionConfig& c) {
    if (j.contains("gamma_url")) j.at("gamma_url").get_to(c.gamma_url);
    if (j.contains("rtds_ws_url")) j.at("rtds_ws_url").get_to(c.rtds_ws_url);
    if (j.contains("clob_ws_url")) j.at("clob_ws_url").get_to(c.clob_ws_url);
    if (j.contains("recv_timeout_ms")) j.at("recv_timeout_ms").get_to(c.recv_timeout_ms);
    if (j.contains("reconnect_delay_ms")) j.at("reconnect_delay_ms").get_to(c.reconnect_delay_ms);
    if (j.contains("ping_interval_ms")) j.at("ping_interval_ms").get_to(c.ping_interval_ms);
    if (j.contains("connect_timeout_ms")) j.at("connect_timeout_ms").get_to(c.connect_timeout_ms);
}

void to_json(nlohmann::json& j, const SchedulerConfig& c) {
    j = nlohmann::json{
        {"tick_interval_ms", c.tick_interval_ms},
        {"scan_interval_sec", c.scan_interval_sec},
        {"start_buffer_sec", c.start_buffer_sec},
        {"stop_buffer_sec", c.stop_buffer_sec},
        {"max_active_listeners", c.max_active_listeners}
    };
}

void from_json(const nlohmann::json& j, SchedulerConfig& c) {
    if (j.contains("tick_interval_ms")) j.at("tick_interval_ms").get_to(c.tick_interval_ms);
    if (j.contains("scan_interval_sec")) j.at("scan_interval_sec").get_to(c.scan_interval_sec);
    if (j.contains("start_buffer_sec")) j.at("start_buffer_sec").get_to(c.start_buffer_sec);
    if (j.contains("stop_buffer_sec")) j.at("stop_buffer_sec").get_to(c.stop_buffer_sec);
    if (j.contains("max_active_listeners")) j.at("max_active_listeners").get_to(c.max_active_listeners);
}

void to_json(nlohmann::json& j, const PricingConfig& c) {
    j = nlohmann::json{
        {"sigma_floor", c.sigma_floor},
        {"default_volatility", c.default_volatility},
        {"min_edge", c.min_edge},
        {"full_confidence_edge", c.full_confidence_edge},
        {"vol_lookback_minutes", c.vol_lookback_minutes},
        {"signal_interval_ms", c.signal_interval_ms}
    };
}

void from_json(const nlohmann::json& j, PricingConfig& c) {
    if (j.contains("sigma_floor")) j.at("sigma_floor").get_to(c.sigma_floor);
    if (j.contains("default_volatility")) j.at("default_volatility").get_to(c.default_volatility);
    if (j.contains("min_edge")) j.at("min_edge").get_to(c.min_edge);
    if (j.contains("full_confidence_edge")) j.at("full_confidence_edge").get_to(c.full_confidence_edge);
    if (j.contains("vol_lookback_minutes")) j.at("vol_lookback_minutes").get_to(c.vol_lookback_minutes);
    if (j.contains("signal_interval_ms")) j.at("signal_interval_ms").get_to(c.signal_interval_ms);
}

void to_json(nlohmann::json& j, const EvaluatorConfig& c) {
    j = nlohmann::json{
        {"loss_penalty", c.loss_penalty},
        {"position_scale", c.position_scale}
    };
}

void from_json(const nlohmann::json& j, EvaluatorConfig& c) {
    if (j.contains("loss_penalty")) j.at("loss_penalty").get_to(c.loss_penalty);
    if (j.contains("position_scale")) j.at("position_scale").get_to(c.position_scale);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"cache", c.cache},
        {"book", c.book},
        {"scanner", c.scanner},
        {"connection", c.connection},
        {"scheduler", c.scheduler},
        {"pricing", c.pricing},
        {"evaluator", c.evaluator},
        {"logging", c.logging},
        {"data_dir", c.data_dir},
        {"signal_ledger_path", c.signal_ledger_path}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("cache")) j.at("cache").get_to(c.cache);
    if (j.contains("book")) j.at("book").get_to(c.book);
    if (j.contains("scanner")) j.at("scanner").get_to(c.scanner);
    if (j.contains("connection")) j.at("connection").get_to(c.connection);
    if (j.contains("scheduler")) j.at("scheduler").get_to(c.scheduler);
    if (j.contains("pricing")) j.at("pricing").get_to(c.pricing);
    if (j.contains("evaluator")) j.at("evaluator").get_to(c.evaluator);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("data_dir")) j.at("data_dir").get_to(c.data_dir);
    if (j.contains("signal_ledger_path")) j.at("signal_ledger_path").get_to(c.signal_ledger_path);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    file >> j;

    Config config;
    from_json(j, config);

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    if (cache.max_age_ms <= 0) {
        spdlog::error("cache.max_age_ms must be positive");
        return false;
    }

    if (book.levels <= 0) {
        spdlog::error("book.levels must be positive");
        return false;
    }

    if (scanner.page_size <= 0 || scanner.max_pages <= 0) {
        spdlog::error("scanner.page_size and scanner.max_pages must be positive");
        return false;
    }

    if (connection.recv_timeout_ms <= 0 || connection.ping_interval_ms <= 0) {
        spdlog::error("connection timeouts must be positive");
        return false;
    }

    if (connection.reconnect_delay_ms < 0) {
        spdlog::error("connection.reconnect_delay_ms must be non-negative");
        return false;
    }

    if (scheduler.tick_interval_ms <= 0 || scheduler.scan_interval_sec <= 0) {
        spdlog::error("scheduler intervals must be positive");
        return false;
    }

    if (scheduler.max_active_listeners <= 0) {
        spdlog::error("scheduler.max_active_listeners must be positive");
        return false;
    }

    if (pricing.sigma_floor <= 0) {
        spdlog::error("pricing.sigma_floor must be positive");
        return false;
    }

    if (pricing.min_edge < 0 || pricing.min_edge > 1) {
        spdlog::error("pricing.min_edge must be in [0, 1]");
        return false;
    }

    if (pricing.full_confidence_edge <= 0) {
        spdlog::error("pricing.full_confidence_edge must be positive");
        return false;
    }

    if (evaluator.loss_penalty < 0) {
        spdlog::error("evaluator.loss_penalty must be non-negative");
        return false;
    }

    if (evaluator.loss_penalty > 1.0) {
        spdlog::warn("evaluator.loss_penalty > 1 penalizes losses beyond their price delta");
    }

    return true;
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace polycap
