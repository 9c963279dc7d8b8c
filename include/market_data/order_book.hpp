#pragma once

#include <map>
#include <vector>
#include <mutex>
#include <optional>
#include <functional>
#include "common/types.hpp"

namespace polycap {

/**
 * Thread-safe top-N order book for one outcome token.
 *
 * Bids are kept descending, asks ascending, each side truncated to
 * max_levels after every update. Every mutation and every read takes the
 * same mutex, so a reader never sees a half-applied snapshot.
 */
class OrderBook {
public:
    explicit OrderBook(const std::string& token_id, int max_levels = 5);

    // Full replacement of both sides
    void apply_snapshot(const std::vector<PriceLevel>& bids,
                        const std::vector<PriceLevel>& asks);

    // Single level change; size <= 0 removes the level
    void apply_delta(BookSide side, Price price, Size size);

    void clear();

    // Query methods (thread-safe)
    BookSnapshot snapshot() const;
    std::optional<PriceLevel> best_bid() const;
    std::optional<PriceLevel> best_ask() const;
    Price mid_price() const;
    Price spread() const;

    int64_t update_count() const;
    Timestamp last_update_time() const;
    bool is_stale(Duration threshold) const;

    const std::string& token_id() const { return token_id_; }
    int max_levels() const { return max_levels_; }

private:
    std::string token_id_;
    int max_levels_;
    int64_t update_count_{0};
    Timestamp last_update_;

    // Bids sorted descending (highest first)
    std::map<Price, Size, std::greater<Price>> bids_;
    // Asks sorted ascending (lowest first)
    std::map<Price, Size> asks_;

    mutable std::mutex mutex_;

    void trim_levels();
};

} // namespace polycap
