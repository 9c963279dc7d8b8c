#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include "common/types.hpp"

namespace polycap {

struct LatencySummary {
    int64_t count{0};
    Duration p50{Duration::zero()};
    Duration p95{Duration::zero()};
    Duration max{Duration::zero()};
};

/**
 * Keeps the most recent `capacity` samples. `count` in the summary covers
 * every sample ever recorded, not just the retained ones.
 */
class LatencyHistogram {
public:
    explicit LatencyHistogram(size_t capacity = 1024);

    void record(Duration d);
    LatencySummary summary() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<Duration> window_;
    size_t capacity_;
    size_t cursor_{0};
    int64_t total_{0};
};

class Counter {
public:
    void increment(int64_t delta = 1) { value_ += delta; }
    int64_t value() const { return value_.load(); }
    void clear() { value_ = 0; }

private:
    std::atomic<int64_t> value_{0};
};

class Gauge {
public:
    void set(double value) { value_ = value; }
    double value() const { return value_.load(); }

private:
    std::atomic<double> value_{0.0};
};

// Named metrics live for the whole process; references stay valid
class MetricsRegistry {
public:
    static MetricsRegistry& instance();

    Counter& counter(const std::string& name);
    Gauge& gauge(const std::string& name);
    LatencyHistogram& histogram(const std::string& name);

    // {"counters": {...}, "gauges": {...}, "histograms": {name: {count, p50_ms, p95_ms, max_ms}}}
    std::string to_json() const;

    void clear();

private:
    MetricsRegistry() = default;

    template <typename T>
    T& lookup(std::map<std::string, std::unique_ptr<T>>& table, const std::string& name);

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>> counters_;
    std::map<std::string, std::unique_ptr<Gauge>> gauges_;
    std::map<std::string, std::unique_ptr<LatencyHistogram>> histograms_;
};

#define POLYCAP_COUNTER(name) ::polycap::MetricsRegistry::instance().counter(name)
#define POLYCAP_GAUGE(name) ::polycap::MetricsRegistry::instance().gauge(name)
#define POLYCAP_HISTOGRAM(name) ::polycap::MetricsRegistry::instance().histogram(name)

} // namespace polycap
