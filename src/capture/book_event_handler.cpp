#include "capture/book_event_handler.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cmath>

namespace polycap {

namespace {
    constexpr double MAX_TIMESTAMP_MS = 9.2e18;

    std::optional<double> to_double(const nlohmann::json& v) {
        if (v.is_number()) return v.get<double>();
        if (v.is_string()) {
            const auto& s = v.get_ref<const std::string&>();
            try {
                size_t idx = 0;
                double d = std::stod(s, &idx);
                if (idx != s.size() || !std::isfinite(d)) return std::nullopt;
                return d;
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::string string_field(const nlohmann::json& obj, const char* key) {
        if (!obj.contains(key) || !obj.at(key).is_string()) return "";
        return obj.at(key).get<std::string>();
    }
}

BookEventHandler::BookEventHandler(const std::string& market_id, const std::string& token_id,
                                   std::shared_ptr<OrderBook> book, BookRecorder& recorder)
    : market_id_(market_id)
    , token_id_(token_id)
    , book_(std::move(book))
    , recorder_(recorder)
{
}

std::string BookEventHandler::event_type(const nlohmann::json& event) {
    std::string type = string_field(event, "event_type");
    if (type.empty()) type = string_field(event, "type");
    return type;
}

std::optional<int64_t> BookEventHandler::parse_timestamp(const nlohmann::json& event) {
    if (!event.contains("timestamp")) return std::nullopt;
    auto ts = to_double(event.at("timestamp"));
    if (!ts || *ts <= 0.0 || *ts >= MAX_TIMESTAMP_MS) return std::nullopt;
    return static_cast<int64_t>(*ts);
}

bool BookEventHandler::parse_levels(const nlohmann::json& levels, std::vector<PriceLevel>& out) {
    out.clear();
    if (!levels.is_array()) return false;

    for (const auto& level : levels) {
        if (!level.is_object() || !level.contains("price") || !level.contains("size")) return false;
        auto price = to_double(level.at("price"));
        auto size = to_double(level.at("size"));
        if (!price || !size) return false;
        out.push_back({*price, *size});
    }
    return true;
}

bool BookEventHandler::is_other_token(const nlohmann::json& obj) const {
    std::string asset = string_field(obj, "asset_id");
    return !asset.empty() && asset != token_id_;
}

void BookEventHandler::handle(const nlohmann::json& event) {
    if (!event.is_object()) return;

    std::string type = event_type(event);
    if (type == "book") {
        handle_book(event);
    } else if (type == "price_change") {
        handle_price_change(event);
    }
}

void BookEventHandler::handle_book(const nlohmann::json& event) {
    if (is_other_token(event)) return;

    std::string id = string_field(event, "asset_id");
    if (id.empty()) id = string_field(event, "market");

    auto ts = parse_timestamp(event);

    std::vector<PriceLevel> bids;
    std::vector<PriceLevel> asks;
    static const nlohmann::json empty = nlohmann::json::array();
    const auto& raw_bids = event.contains("bids") ? event.at("bids") : empty;
    const auto& raw_asks = event.contains("asks") ? event.at("asks") : empty;

    if (!parse_levels(raw_bids, bids) || !parse_levels(raw_asks, asks)) {
        recorder_.reject("Bids/asks not lists of {price,size}");
        return;
    }

    if (auto err = BookRecorder::validate_update(id, ts.value_or(0), bids, asks)) {
        recorder_.reject(*err);
        return;
    }

    book_->apply_snapshot(bids, asks);
    recorder_.record(BookRecorder::build_row(market_id_, *ts, book_->snapshot()));
    events_applied_++;
}

void BookEventHandler::handle_price_change(const nlohmann::json& event) {
    const nlohmann::json* changes = nullptr;
    if (event.contains("price_changes") && event.at("price_changes").is_array()) {
        changes = &event.at("price_changes");
    } else if (event.contains("changes") && event.at("changes").is_array()) {
        // Legacy shape carries asset_id on the event
        if (is_other_token(event)) return;
        changes = &event.at("changes");
    }
    if (!changes) {
        recorder_.reject("price_change without changes");
        return;
    }

    auto ts = parse_timestamp(event);
    if (!ts) {
        recorder_.reject("Missing market_id or timestamp");
        return;
    }

    struct Delta {
        BookSide side;
        Price price;
        Size size;
    };
    std::vector<Delta> deltas;

    for (const auto& change : *changes) {
        if (!change.is_object()) {
            recorder_.reject("Malformed price change");
            return;
        }
        if (is_other_token(change)) continue;

        auto price = change.contains("price") ? to_double(change.at("price")) : std::nullopt;
        auto size = change.contains("size") ? to_double(change.at("size")) : std::nullopt;
        std::string side = string_field(change, "side");
        if (!price || !size || (side != "BUY" && side != "SELL")) {
            recorder_.reject("Malformed price change");
            return;
        }
        if (!(*price > 0.0 && *price < 1.0) || *size < 0.0) {
            recorder_.reject(fmt::format("Invalid price change: {} x {}", *price, *size));
            return;
        }
        deltas.push_back({side == "BUY" ? BookSide::BID : BookSide::ASK, *price, *size});
    }

    if (deltas.empty()) return;

    for (const auto& d : deltas) {
        book_->apply_delta(d.side, d.price, d.size);
    }
    recorder_.record(BookRecorder::build_row(market_id_, *ts, book_->snapshot()));
    events_applied_++;
}

} // namespace polycap
