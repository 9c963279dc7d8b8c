#include "strategy/fair_value_model.hpp"
#include <cmath>
#include <algorithm>

namespace polycap {

FairValueModel::FairValueModel(const PricingConfig& config)
    : config_(config)
{
}

double FairValueModel::normal_cdf(double x) {
    return 0.5 * (1.0 + std::erf(x / std::sqrt(2.0)));
}

FairValueResult FairValueModel::fair_value(double current_price, double strike_price,
                                           double volatility_per_minute,
                                           double minutes_remaining) const {
    FairValueResult result;

    if (!std::isfinite(current_price) || !std::isfinite(strike_price)
        || !(current_price > 0.0) || !(strike_price > 0.0)) {
        result.error = "Invalid prices";
        return result;
    }
    if (!std::isfinite(volatility_per_minute) || !std::isfinite(minutes_remaining)) {
        result.error = "Non-finite volatility or time remaining";
        return result;
    }

    result.ok = true;
    result.log_distance = std::log(current_price / strike_price);

    if (minutes_remaining <= 0.0) {
        // Expired: settle on the last observed price
        result.fair_yes = current_price > strike_price ? 1.0 : 0.0;
        result.fair_no = 1.0 - result.fair_yes;
        return result;
    }

    double vol = std::abs(volatility_per_minute);
    result.sigma_remaining = std::max(vol * std::sqrt(minutes_remaining), config_.sigma_floor);
    result.z_score = result.log_distance / result.sigma_remaining;
    result.fair_yes = std::clamp(normal_cdf(result.z_score), 0.0, 1.0);
    result.fair_no = 1.0 - result.fair_yes;
    return result;
}

double FairValueModel::estimate_volatility(const std::vector<double>& prices) const {
    std::vector<double> returns;
    returns.reserve(prices.size());

    for (size_t i = 1; i < prices.size(); i++) {
        if (prices[i] > 0.0 && prices[i - 1] > 0.0) {
            returns.push_back(std::log(prices[i] / prices[i - 1]));
        }
    }

    if (returns.size() < 2) {
        return config_.default_volatility;
    }

    double mean = 0.0;
    for (double r : returns) mean += r;
    mean /= returns.size();

    double variance = 0.0;
    for (double r : returns) {
        variance += (r - mean) * (r - mean);
    }
    variance /= returns.size();

    return std::sqrt(variance);
}

std::optional<Misprice> FairValueModel::find_misprice(double market_price_yes,
                                                      double fair_value_yes) const {
    return find_misprice(market_price_yes, fair_value_yes, config_.min_edge);
}

std::optional<Misprice> FairValueModel::find_misprice(double market_price_yes,
                                                      double fair_value_yes,
                                                      double min_edge) const {
    if (!(market_price_yes >= 0.0 && market_price_yes <= 1.0) || !std::isfinite(fair_value_yes)) {
        return std::nullopt;
    }

    double edge = std::abs(market_price_yes - fair_value_yes);
    if (edge < min_edge) {
        return std::nullopt;
    }

    Misprice m;
    m.kind = market_price_yes > fair_value_yes ? MispriceKind::OVERPRICED_YES
                                               : MispriceKind::UNDERPRICED_YES;
    m.market_price = market_price_yes;
    m.fair_value = fair_value_yes;
    m.edge = edge;
    return m;
}

} // namespace polycap
