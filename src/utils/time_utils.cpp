#include "utils/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cctype>

namespace polycap {
namespace time_utils {

std::string to_iso8601(WallClock t) {
    auto time_t = std::chrono::system_clock::to_time_t(t);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    return ss.str();
}

std::string to_iso8601(int64_t epoch_ms) {
    auto tp = WallClock(std::chrono::milliseconds(epoch_ms));
    return to_iso8601(tp);
}

std::optional<int64_t> parse_iso8601_ms(const std::string& s) {
    if (s.size() < 19) return std::nullopt;

    std::tm tm = {};
    std::istringstream ss(s.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        // Some payloads use a space separator
        std::istringstream alt(s.substr(0, 19));
        tm = {};
        alt >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        if (alt.fail()) return std::nullopt;
    }

    int64_t ms = static_cast<int64_t>(timegm(&tm)) * 1000;

    size_t pos = 19;
    if (pos < s.size() && s[pos] == '.') {
        pos++;
        int digits = 0;
        int frac = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits < 3) {
                frac = frac * 10 + (s[pos] - '0');
                digits++;
            }
            pos++;
        }
        while (digits > 0 && digits < 3) {
            frac *= 10;
            digits++;
        }
        ms += frac;
    }

    if (pos == s.size() || s[pos] == 'Z' || s[pos] == 'z') {
        return ms;
    }

    // +HH:MM / -HH:MM offset
    if ((s[pos] == '+' || s[pos] == '-') && pos + 3 <= s.size()) {
        int sign = s[pos] == '+' ? 1 : -1;
        try {
            int hours = std::stoi(s.substr(pos + 1, 2));
            int minutes = 0;
            if (pos + 6 <= s.size() && s[pos + 3] == ':') {
                minutes = std::stoi(s.substr(pos + 4, 2));
            }
            ms -= sign * (static_cast<int64_t>(hours) * 3600000 + static_cast<int64_t>(minutes) * 60000);
            return ms;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    return std::nullopt;
}

std::string now_iso8601() {
    return to_iso8601(wall_now());
}

int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

int64_t floor_to_minute(int64_t epoch_ms) {
    return epoch_ms - (epoch_ms % 60000);
}

std::string format_duration_ms(int64_t ms) {
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    } else if (ms < 60000) {
        double sec = ms / 1000.0;
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << sec << "s";
        return ss.str();
    } else {
        int64_t min = ms / 60000;
        int64_t sec = (ms % 60000) / 1000;
        return std::to_string(min) + "m" + std::to_string(sec) + "s";
    }
}

// LatencyTimer implementation

LatencyTimer::LatencyTimer()
    : start_(now())
    , end_(start_)
{
}

void LatencyTimer::start() {
    start_ = now();
    running_ = true;
}

void LatencyTimer::stop() {
    end_ = now();
    running_ = false;
}

Duration LatencyTimer::elapsed() const {
    if (running_) {
        return now() - start_;
    }
    return end_ - start_;
}

int64_t LatencyTimer::elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed()).count();
}

} // namespace time_utils
} // namespace polycap
