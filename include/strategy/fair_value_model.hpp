#pragma once

#include <vector>
#include <optional>
#include "common/types.hpp"
#include "config/config.hpp"

namespace polycap {

/**
 * Lognormal fair value for 15-minute up/down markets.
 *
 * A market resolves YES when the oracle price at expiry is above the strike
 * (the oracle price at open). With per-minute volatility sigma_1m and m
 * minutes left:
 *
 *   distance = ln(S / K)
 *   sigma    = max(sigma_1m * sqrt(m), sigma_floor)
 *   fair_yes = Phi(distance / sigma)
 *
 * No query throws; invalid input yields ok=false or nullopt.
 */
class FairValueModel {
public:
    explicit FairValueModel(const PricingConfig& config = PricingConfig{});

    FairValueResult fair_value(double current_price, double strike_price,
                               double volatility_per_minute, double minutes_remaining) const;

    // Population std of consecutive log returns; default_volatility when
    // fewer than two valid returns exist
    double estimate_volatility(const std::vector<double>& prices) const;

    std::optional<Misprice> find_misprice(double market_price_yes, double fair_value_yes) const;
    std::optional<Misprice> find_misprice(double market_price_yes, double fair_value_yes,
                                          double min_edge) const;

    static double normal_cdf(double x);

    const PricingConfig& config() const { return config_; }

private:
    PricingConfig config_;
};

} // namespace polycap
