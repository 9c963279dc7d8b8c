#pragma once

#include <map>
#include <vector>
#include <string>
#include <utility>
#include <optional>
#include <shared_mutex>
#include "common/types.hpp"

namespace polycap {

/**
 * Time-ordered oracle price store keyed by (source, asset).
 *
 * Each series is a dense vector sorted by timestamp. Out-of-order arrivals
 * are inserted at their sorted position. After every insert, points older
 * than (newest - max_age_ms) are evicted, so retention follows the feed's
 * own clock rather than the wall clock.
 *
 * One writer (the oracle listener), many readers (signal path). Writes take
 * the exclusive lock, reads the shared one.
 */
class PriceSeriesCache {
public:
    explicit PriceSeriesCache(int64_t max_age_ms = 30 * 60 * 1000);

    void add(const std::string& source, const std::string& asset,
             int64_t timestamp_ms, Price price);

    // Latest point with timestamp <= timestamp_ms
    std::optional<PricePoint> as_of(const std::string& source, const std::string& asset,
                                    int64_t timestamp_ms) const;

    std::optional<PricePoint> latest(const std::string& source, const std::string& asset) const;

    // Points with from_ms <= timestamp <= to_ms, in order
    std::vector<PricePoint> range(const std::string& source, const std::string& asset,
                                  int64_t from_ms, int64_t to_ms) const;

    size_t size(const std::string& source, const std::string& asset) const;
    size_t series_count() const;

    int64_t max_age_ms() const { return max_age_ms_; }

private:
    using SeriesKey = std::pair<std::string, std::string>;

    int64_t max_age_ms_;
    std::map<SeriesKey, std::vector<PricePoint>> series_;
    mutable std::shared_mutex mutex_;

    const std::vector<PricePoint>* find_series(const std::string& source,
                                               const std::string& asset) const;
};

} // namespace polycap
