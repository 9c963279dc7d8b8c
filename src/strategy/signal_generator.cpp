#include "strategy/signal_generator.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace polycap {

SignalGenerator::SignalGenerator(const PricingConfig& config, const PriceSeriesCache& cache)
    : config_(config)
    , cache_(cache)
    , model_(config)
{
}

std::vector<double> SignalGenerator::minute_samples(const std::string& source,
                                                    const std::string& asset,
                                                    int64_t from_ms, int64_t to_ms) const {
    std::vector<double> prices;
    if (from_ms > to_ms) return prices;

    int64_t first = time_utils::floor_to_minute(from_ms);
    if (first < from_ms) first += 60000;

    for (int64_t t = first; t <= to_ms; t += 60000) {
        auto point = cache_.as_of(source, asset, t);
        if (point) prices.push_back(point->price);
    }
    return prices;
}

std::optional<Signal> SignalGenerator::evaluate(const MarketWindow& window,
                                                const OrderBook& yes_book,
                                                int64_t now_ms) const {
    if (!window.strike || now_ms < window.start_ms) return std::nullopt;

    const std::string& source = window.strike_source.empty() ? SOURCE_CHAINLINK : window.strike_source;
    auto current = cache_.as_of(source, window.asset, now_ms);
    if (!current) return std::nullopt;

    auto bid = yes_book.best_bid();
    auto ask = yes_book.best_ask();
    if (!bid || !ask) return std::nullopt;
    double market_price = (bid->price + ask->price) / 2.0;

    int64_t lookback_ms = static_cast<int64_t>(config_.vol_lookback_minutes) * 60000;
    auto history = minute_samples(source, window.asset, now_ms - lookback_ms, now_ms);
    double vol = model_.estimate_volatility(history);

    double minutes_remaining = static_cast<double>(window.end_ms() - now_ms) / 60000.0;
    auto fv = model_.fair_value(current->price, *window.strike, vol, minutes_remaining);
    if (!fv.ok) {
        spdlog::debug("Fair value rejected for {}: {}", window.market_id, fv.error);
        return std::nullopt;
    }

    auto misprice = model_.find_misprice(market_price, fv.fair_yes);
    if (!misprice) return std::nullopt;

    Signal signal;
    signal.market_id = window.market_id;
    signal.asset = window.asset;
    signal.action = misprice->kind == MispriceKind::UNDERPRICED_YES ? SignalAction::LONG
                                                                    : SignalAction::SHORT;
    signal.entry_price = market_price;
    signal.edge = misprice->edge;
    signal.confidence = config_.full_confidence_edge > 0.0
        ? std::min(1.0, misprice->edge / config_.full_confidence_edge)
        : 1.0;
    signal.generated_at_ms = now_ms;
    signal.fair_yes = fv.fair_yes;

    spdlog::debug("{} {} market={:.3f} fair={:.3f} z={:.2f} vol={:.5f} ({} samples)",
                  window.market_id, misprice_kind_to_string(misprice->kind), market_price,
                  fv.fair_yes, fv.z_score, vol, history.size());
    return signal;
}

} // namespace polycap
