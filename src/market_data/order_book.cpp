#include "market_data/order_book.hpp"
#include <algorithm>

namespace polycap {

OrderBook::OrderBook(const std::string& token_id, int max_levels)
    : token_id_(token_id)
    , max_levels_(std::max(1, max_levels))
    , last_update_(now())
{
}

void OrderBook::apply_snapshot(const std::vector<PriceLevel>& bids,
                               const std::vector<PriceLevel>& asks) {
    std::lock_guard<std::mutex> lock(mutex_);

    bids_.clear();
    for (const auto& level : bids) {
        if (level.size > 0.0) {
            bids_[level.price] = level.size;
        }
    }

    asks_.clear();
    for (const auto& level : asks) {
        if (level.size > 0.0) {
            asks_[level.price] = level.size;
        }
    }

    last_update_ = now();
    update_count_++;
    trim_levels();
}

void OrderBook::apply_delta(BookSide side, Price price, Size size) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (side == BookSide::BID) {
        if (size <= 0.0) {
            bids_.erase(price);
        } else {
            bids_[price] = size;
        }
    } else {
        if (size <= 0.0) {
            asks_.erase(price);
        } else {
            asks_[price] = size;
        }
    }

    last_update_ = now();
    update_count_++;
    trim_levels();
}

void OrderBook::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    bids_.clear();
    asks_.clear();
    last_update_ = now();
}

BookSnapshot OrderBook::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BookSnapshot snap;
    snap.bids.reserve(bids_.size());
    snap.asks.reserve(asks_.size());
    for (const auto& [price, size] : bids_) {
        snap.bids.push_back({price, size});
    }
    for (const auto& [price, size] : asks_) {
        snap.asks.push_back({price, size});
    }
    return snap;
}

std::optional<PriceLevel> OrderBook::best_bid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (bids_.empty()) return std::nullopt;
    auto it = bids_.begin();
    return PriceLevel{it->first, it->second};
}

std::optional<PriceLevel> OrderBook::best_ask() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (asks_.empty()) return std::nullopt;
    auto it = asks_.begin();
    return PriceLevel{it->first, it->second};
}

Price OrderBook::mid_price() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (bids_.empty() || asks_.empty()) return 0.0;
    return (bids_.begin()->first + asks_.begin()->first) / 2.0;
}

Price OrderBook::spread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (bids_.empty() || asks_.empty()) return 0.0;
    return asks_.begin()->first - bids_.begin()->first;
}

int64_t OrderBook::update_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return update_count_;
}

Timestamp OrderBook::last_update_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_update_;
}

bool OrderBook::is_stale(Duration threshold) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return (now() - last_update_) > threshold;
}

void OrderBook::trim_levels() {
    // Already holding lock
    while (static_cast<int>(bids_.size()) > max_levels_) {
        auto it = bids_.end();
        --it;
        bids_.erase(it);
    }
    while (static_cast<int>(asks_.size()) > max_levels_) {
        auto it = asks_.end();
        --it;
        asks_.erase(it);
    }
}

} // namespace polycap
