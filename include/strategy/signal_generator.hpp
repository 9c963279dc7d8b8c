#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "market_data/price_series_cache.hpp"
#include "market_data/order_book.hpp"
#include "strategy/fair_value_model.hpp"

namespace polycap {

/**
 * Turns oracle history plus the live YES book into a Signal for one window.
 */
class SignalGenerator {
public:
    SignalGenerator(const PricingConfig& config, const PriceSeriesCache& cache);

    // nullopt when the window has no strike, is not open, has no
    // two-sided book, lacks oracle data, or shows no edge
    std::optional<Signal> evaluate(const MarketWindow& window, const OrderBook& yes_book,
                                   int64_t now_ms) const;

    // As-of prices at each minute boundary in [from_ms, to_ms]
    std::vector<double> minute_samples(const std::string& source, const std::string& asset,
                                       int64_t from_ms, int64_t to_ms) const;

    const FairValueModel& model() const { return model_; }

private:
    PricingConfig config_;
    const PriceSeriesCache& cache_;
    FairValueModel model_;
};

} // namespace polycap
