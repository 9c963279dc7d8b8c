#include "market_data/price_series_cache.hpp"
#include <algorithm>
#include <mutex>

namespace polycap {

namespace {
    bool ts_less(int64_t ts, const PricePoint& p) {
        return ts < p.timestamp_ms;
    }

    bool point_before(const PricePoint& p, int64_t ts) {
        return p.timestamp_ms < ts;
    }
}

PriceSeriesCache::PriceSeriesCache(int64_t max_age_ms)
    : max_age_ms_(max_age_ms)
{
}

void PriceSeriesCache::add(const std::string& source, const std::string& asset,
                           int64_t timestamp_ms, Price price) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto& series = series_[SeriesKey{source, asset}];

    if (series.empty() || timestamp_ms >= series.back().timestamp_ms) {
        series.push_back({timestamp_ms, price});
    } else {
        // Insert after any equal timestamps so arrival order is kept among ties
        auto pos = std::upper_bound(series.begin(), series.end(), timestamp_ms, ts_less);
        series.insert(pos, {timestamp_ms, price});
    }

    int64_t cutoff = series.back().timestamp_ms - max_age_ms_;
    auto keep_from = std::lower_bound(series.begin(), series.end(), cutoff, point_before);
    if (keep_from != series.begin()) {
        series.erase(series.begin(), keep_from);
    }
}

const std::vector<PricePoint>* PriceSeriesCache::find_series(const std::string& source,
                                                             const std::string& asset) const {
    // Caller holds the lock
    auto it = series_.find(SeriesKey{source, asset});
    if (it == series_.end() || it->second.empty()) return nullptr;
    return &it->second;
}

std::optional<PricePoint> PriceSeriesCache::as_of(const std::string& source,
                                                  const std::string& asset,
                                                  int64_t timestamp_ms) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    const auto* series = find_series(source, asset);
    if (!series) return std::nullopt;

    auto it = std::upper_bound(series->begin(), series->end(), timestamp_ms, ts_less);
    if (it == series->begin()) return std::nullopt;
    return *(it - 1);
}

std::optional<PricePoint> PriceSeriesCache::latest(const std::string& source,
                                                   const std::string& asset) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    const auto* series = find_series(source, asset);
    if (!series) return std::nullopt;
    return series->back();
}

std::vector<PricePoint> PriceSeriesCache::range(const std::string& source,
                                                const std::string& asset,
                                                int64_t from_ms, int64_t to_ms) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<PricePoint> result;
    const auto* series = find_series(source, asset);
    if (!series || from_ms > to_ms) return result;

    auto first = std::lower_bound(series->begin(), series->end(), from_ms, point_before);
    auto last = std::upper_bound(first, series->end(), to_ms, ts_less);
    result.assign(first, last);
    return result;
}

size_t PriceSeriesCache::size(const std::string& source, const std::string& asset) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = series_.find(SeriesKey{source, asset});
    return it == series_.end() ? 0 : it->second.size();
}

size_t PriceSeriesCache::series_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return series_.size();
}

} // namespace polycap
