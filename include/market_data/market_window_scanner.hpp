#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <utility>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/config.hpp"

namespace polycap {

/**
 * Paged source of catalog events. Returns the raw JSON body of one page;
 * throws std::runtime_error on transport failure.
 */
class CatalogSource {
public:
    virtual ~CatalogSource() = default;
    virtual std::string fetch_events_page(int limit, int offset) = 0;
};

/**
 * Gamma REST catalog over libcurl.
 */
class GammaCatalogSource : public CatalogSource {
public:
    GammaCatalogSource(const std::string& base_url, const ScannerConfig& config);
    ~GammaCatalogSource() override;

    std::string fetch_events_page(int limit, int offset) override;

private:
    std::string base_url_;
    ScannerConfig config_;

    std::string http_get(const std::string& url);
};

struct ScanStats {
    int pages{0};
    int events_seen{0};
    int events_matched{0};
    int page_errors{0};
    int64_t duration_ms{0};
};

/**
 * Discovers 15-minute recurring markets whose start lies within
 * [now - horizon, now + horizon].
 */
class MarketWindowScanner {
public:
    MarketWindowScanner(std::shared_ptr<CatalogSource> source, const ScannerConfig& config);

    // Full paged scan; never throws, page failures are logged and skipped
    std::vector<MarketWindow> scan(int64_t now_ms);

    ScanStats last_stats() const { return last_stats_; }

    // Event -> windows (one per tradable market in the event)
    std::vector<MarketWindow> parse_event(const nlohmann::json& event, int64_t now_ms) const;

    static bool has_recurrence(const nlohmann::json& event, const std::string& recurrence);
    static std::optional<int64_t> event_start_ms(const nlohmann::json& event);
    static std::string extract_asset(const nlohmann::json& event);
    static std::optional<std::pair<std::string, std::string>> token_pair(const nlohmann::json& market);

private:
    std::shared_ptr<CatalogSource> source_;
    ScannerConfig config_;
    ScanStats last_stats_;
};

} // namespace polycap
