#pragma once

#include <string>
#include <chrono>
#include <optional>
#include "common/types.hpp"

namespace polycap {
namespace time_utils {

/**
 * Convert timestamp to ISO 8601 string (UTC, millisecond precision).
 */
std::string to_iso8601(WallClock t);
std::string to_iso8601(int64_t epoch_ms);

/**
 * Parse an ISO 8601 UTC timestamp to epoch milliseconds.
 * Accepts "2025-01-01T12:00:00Z", fractional seconds and "+00:00" offsets.
 * Returns nullopt when the string does not parse.
 */
std::optional<int64_t> parse_iso8601_ms(const std::string& s);

std::string now_iso8601();

int64_t epoch_ms();

// Start of the minute containing epoch_ms
int64_t floor_to_minute(int64_t epoch_ms);

std::string format_duration_ms(int64_t ms);

/**
 * High resolution timer for latency measurement.
 */
class LatencyTimer {
public:
    LatencyTimer();

    void start();
    void stop();

    Duration elapsed() const;
    int64_t elapsed_ms() const;

private:
    Timestamp start_;
    Timestamp end_;
    bool running_{false};
};

} // namespace time_utils
} // namespace polycap
