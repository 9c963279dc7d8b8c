#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "market_data/order_book.hpp"
#include "persistence/book_recorder.hpp"

namespace polycap {

/**
 * Applies CLOB market-channel events for one market to its OrderBook and
 * appends a top-of-book row per accepted event.
 *
 *   book          full snapshot, validated before it touches the book
 *   price_change  level deltas from "changes" or "price_changes"
 *
 * Other event types are ignored. Rejected events are counted by the
 * recorder and never persisted.
 */
class BookEventHandler {
public:
    BookEventHandler(const std::string& market_id, const std::string& token_id,
                     std::shared_ptr<OrderBook> book, BookRecorder& recorder);

    void handle(const nlohmann::json& event);

    int64_t events_applied() const { return events_applied_; }

    static std::string event_type(const nlohmann::json& event);
    static std::optional<int64_t> parse_timestamp(const nlohmann::json& event);

    // {price, size} objects with string or numeric fields; false if any is malformed
    static bool parse_levels(const nlohmann::json& levels, std::vector<PriceLevel>& out);

private:
    std::string market_id_;
    std::string token_id_;
    std::shared_ptr<OrderBook> book_;
    BookRecorder& recorder_;
    int64_t events_applied_{0};

    void handle_book(const nlohmann::json& event);
    void handle_price_change(const nlohmann::json& event);
    bool is_other_token(const nlohmann::json& obj) const;
};

} // namespace polycap
