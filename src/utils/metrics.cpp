#include "utils/metrics.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace polycap {

namespace {
    int64_t to_ms(Duration d) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    }
}

LatencyHistogram::LatencyHistogram(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity))
{
    window_.reserve(capacity_);
}

void LatencyHistogram::record(Duration d) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (window_.size() < capacity_) {
        window_.push_back(d);
    } else {
        window_[cursor_] = d;
        cursor_ = (cursor_ + 1) % capacity_;
    }
    total_++;
}

LatencySummary LatencyHistogram::summary() const {
    std::vector<Duration> sorted;
    LatencySummary s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sorted = window_;
        s.count = total_;
    }
    if (sorted.empty()) return s;

    std::sort(sorted.begin(), sorted.end());
    auto rank = [&sorted](double q) {
        return sorted[static_cast<size_t>(q * static_cast<double>(sorted.size() - 1))];
    };
    s.p50 = rank(0.50);
    s.p95 = rank(0.95);
    s.max = sorted.back();
    return s;
}

void LatencyHistogram::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    window_.clear();
    cursor_ = 0;
    total_ = 0;
}

MetricsRegistry& MetricsRegistry::instance() {
    static MetricsRegistry registry;
    return registry;
}

template <typename T>
T& MetricsRegistry::lookup(std::map<std::string, std::unique_ptr<T>>& table,
                           const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = table[name];
    if (!slot) slot = std::make_unique<T>();
    return *slot;
}

Counter& MetricsRegistry::counter(const std::string& name) {
    return lookup(counters_, name);
}

Gauge& MetricsRegistry::gauge(const std::string& name) {
    return lookup(gauges_, name);
}

LatencyHistogram& MetricsRegistry::histogram(const std::string& name) {
    return lookup(histograms_, name);
}

std::string MetricsRegistry::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json out = {
        {"counters", nlohmann::json::object()},
        {"gauges", nlohmann::json::object()},
        {"histograms", nlohmann::json::object()}
    };
    for (const auto& [name, c] : counters_) out["counters"][name] = c->value();
    for (const auto& [name, g] : gauges_) out["gauges"][name] = g->value();
    for (const auto& [name, h] : histograms_) {
        LatencySummary s = h->summary();
        out["histograms"][name] = {
            {"count", s.count},
            {"p50_ms", to_ms(s.p50)},
            {"p95_ms", to_ms(s.p95)},
            {"max_ms", to_ms(s.max)}
        };
    }
    return out.dump(2);
}

void MetricsRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, c] : counters_) c->clear();
    for (auto& [name, g] : gauges_) g->set(0.0);
    for (auto& [name, h] : histograms_) h->clear();
}

} // namespace polycap
