#include "market_data/market_window_scanner.hpp"
#include "utils/time_utils.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace polycap {

namespace {
    size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
        size_t total_size = size * nmemb;
        output->append(static_cast<char*>(contents), total_size);
        return total_size;
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string json_string(const nlohmann::json& j, const char* key) {
        if (!j.contains(key) || j.at(key).is_null()) return "";
        const auto& v = j.at(key);
        if (v.is_string()) return v.get<std::string>();
        if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
        return v.dump();
    }
}

// GammaCatalogSource

GammaCatalogSource::GammaCatalogSource(const std::string& base_url, const ScannerConfig& config)
    : base_url_(base_url)
    , config_(config)
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
    curl_global_init(CURL_GLOBAL_ALL);
}

GammaCatalogSource::~GammaCatalogSource() {
    curl_global_cleanup();
}

std::string GammaCatalogSource::fetch_events_page(int limit, int offset) {
    std::string url = base_url_ + "/events?order=id&ascending=false&closed=false"
        + "&limit=" + std::to_string(limit)
        + "&offset=" + std::to_string(offset);
    return http_get(url);
}

std::string GammaCatalogSource::http_get(const std::string& url) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connect_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.request_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw std::runtime_error(std::string("CURL request failed: ") + curl_easy_strerror(res));
    }
    if (status >= 400) {
        throw std::runtime_error("HTTP " + std::to_string(status) + " from " + url);
    }

    return response;
}

// MarketWindowScanner

MarketWindowScanner::MarketWindowScanner(std::shared_ptr<CatalogSource> source,
                                         const ScannerConfig& config)
    : source_(std::move(source))
    , config_(config)
{
}

std::vector<MarketWindow> MarketWindowScanner::scan(int64_t now_ms) {
    time_utils::LatencyTimer timer;
    timer.start();

    ScanStats stats;
    std::vector<MarketWindow> windows;
    int offset = 0;

    for (int page = 0; page < config_.max_pages; page++) {
        nlohmann::json data;
        try {
            std::string body = source_->fetch_events_page(config_.page_size, offset);
            data = nlohmann::json::parse(body);
        } catch (const std::exception& e) {
            spdlog::warn("Catalog page at offset {} failed: {}", offset, e.what());
            stats.page_errors++;
            POLYCAP_COUNTER("scan_page_errors").increment();
            offset += config_.page_size;
            continue;
        }

        stats.pages++;
        if (!data.is_array() || data.empty()) {
            break;
        }

        for (const auto& event : data) {
            stats.events_seen++;
            try {
                auto found = parse_event(event, now_ms);
                if (!found.empty()) {
                    stats.events_matched++;
                    windows.insert(windows.end(), found.begin(), found.end());
                }
            } catch (const nlohmann::json::exception& e) {
                spdlog::debug("Skipping malformed event: {}", e.what());
            }
        }

        offset += config_.page_size;
    }

    timer.stop();
    stats.duration_ms = timer.elapsed_ms();
    POLYCAP_HISTOGRAM("scan_latency").record(timer.elapsed());
    last_stats_ = stats;

    spdlog::info("Scan complete: {} windows from {} events over {} pages ({} errors) in {}",
                 windows.size(), stats.events_seen, stats.pages, stats.page_errors,
                 time_utils::format_duration_ms(stats.duration_ms));
    return windows;
}

std::vector<MarketWindow> MarketWindowScanner::parse_event(const nlohmann::json& event,
                                                            int64_t now_ms) const {
    std::vector<MarketWindow> result;
    if (!event.is_object()) return result;
    if (!has_recurrence(event, config_.recurrence)) return result;

    auto start = event_start_ms(event);
    if (!start) return result;

    int64_t horizon_ms = static_cast<int64_t>(config_.horizon_sec) * 1000;
    if (*start < now_ms - horizon_ms || *start > now_ms + horizon_ms) return result;

    if (!event.contains("markets") || !event.at("markets").is_array()) return result;

    std::string asset = extract_asset(event);
    for (const auto& market : event.at("markets")) {
        auto tokens = token_pair(market);
        if (!tokens) continue;

        MarketWindow w;
        w.market_id = json_string(market, "id");
        if (w.market_id.empty()) continue;
        w.event_id = json_string(event, "id");
        w.slug = json_string(event, "slug");
        w.question = json_string(market, "question");
        if (w.question.empty()) w.question = json_string(event, "title");
        w.asset = asset;
        w.yes_token_id = tokens->first;
        w.no_token_id = tokens->second;
        w.start_ms = *start;
        result.push_back(std::move(w));
    }
    return result;
}

bool MarketWindowScanner::has_recurrence(const nlohmann::json& event, const std::string& recurrence) {
    if (!event.contains("series") || !event.at("series").is_array()) return false;
    for (const auto& s : event.at("series")) {
        if (s.is_object() && s.contains("recurrence") && s.at("recurrence").is_string()
            && s.at("recurrence").get<std::string>() == recurrence) {
            return true;
        }
    }
    return false;
}

std::optional<int64_t> MarketWindowScanner::event_start_ms(const nlohmann::json& event) {
    std::string start = json_string(event, "eventStartTime");
    if (start.empty()) start = json_string(event, "startTime");
    if (start.empty()) return std::nullopt;
    return time_utils::parse_iso8601_ms(start);
}

std::string MarketWindowScanner::extract_asset(const nlohmann::json& event) {
    std::string slug = to_lower(json_string(event, "slug"));

    for (const auto& a : known_assets()) {
        if (slug.rfind(a + "-", 0) == 0) return a;
    }

    if (event.contains("tags") && event.at("tags").is_array()) {
        for (const auto& t : event.at("tags")) {
            if (!t.is_object()) continue;
            std::string tag = to_lower(json_string(t, "slug"));
            if (is_known_asset(tag)) return tag;
        }
    }

    if (slug.empty()) return "unknown";
    return slug.substr(0, slug.find('-'));
}

std::optional<std::pair<std::string, std::string>> MarketWindowScanner::token_pair(const nlohmann::json& market) {
    if (!market.is_object() || !market.contains("clobTokenIds")) return std::nullopt;

    const auto& raw = market.at("clobTokenIds");
    nlohmann::json ids;
    if (raw.is_string()) {
        // Gamma encodes the array as a JSON string
        ids = nlohmann::json::parse(raw.get<std::string>(), nullptr, false);
        if (ids.is_discarded()) return std::nullopt;
    } else {
        ids = raw;
    }

    if (!ids.is_array() || ids.size() < 2) return std::nullopt;

    auto as_id = [](const nlohmann::json& v) -> std::string {
        if (v.is_string()) return v.get<std::string>();
        return v.dump();
    };
    return std::make_pair(as_id(ids[0]), as_id(ids[1]));
}

} // namespace polycap
