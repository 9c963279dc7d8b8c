#include <gtest/gtest.h>
#include "utils/metrics.hpp"
#include <nlohmann/json.hpp>

using namespace polycap;
using std::chrono::milliseconds;

class MetricsTest : public ::testing::Test {
protected:
    void SetUp() override {
        MetricsRegistry::instance().clear();
    }
};

TEST_F(MetricsTest, Histogram_Percentiles) {
    LatencyHistogram h(100);
    for (int i = 1; i <= 100; i++) {
        h.record(milliseconds(i));
    }

    auto s = h.summary();
    EXPECT_EQ(s.count, 100);
    EXPECT_EQ(s.p50, milliseconds(50));
    EXPECT_EQ(s.p95, milliseconds(95));
    EXPECT_EQ(s.max, milliseconds(100));
}

TEST_F(MetricsTest, Histogram_KeepsOnlyNewestSamples) {
    LatencyHistogram h(4);
    h.record(milliseconds(500));
    for (int i = 1; i <= 5; i++) {
        h.record(milliseconds(i * 10));
    }

    // The 500 ms sample was overwritten
    auto s = h.summary();
    EXPECT_EQ(s.count, 6);
    EXPECT_EQ(s.max, milliseconds(50));

    h.clear();
    s = h.summary();
    EXPECT_EQ(s.count, 0);
    EXPECT_EQ(s.p50, Duration::zero());
}

TEST_F(MetricsTest, Registry_ReturnsSameInstanceByName) {
    auto& a = POLYCAP_COUNTER("test_counter");
    auto& b = POLYCAP_COUNTER("test_counter");
    EXPECT_EQ(&a, &b);

    a.increment();
    b.increment(4);
    EXPECT_EQ(a.value(), 5);
}

TEST_F(MetricsTest, Gauge_HoldsLastValue) {
    auto& g = POLYCAP_GAUGE("test_gauge");
    g.set(3.0);
    g.set(2.5);
    EXPECT_DOUBLE_EQ(g.value(), 2.5);

    MetricsRegistry::instance().clear();
    EXPECT_DOUBLE_EQ(g.value(), 0.0);
}

TEST_F(MetricsTest, ToJson_ExportsAllKinds) {
    POLYCAP_COUNTER("json_counter").increment(2);
    POLYCAP_GAUGE("json_gauge").set(7.0);
    POLYCAP_HISTOGRAM("json_latency").record(milliseconds(12));

    auto j = nlohmann::json::parse(MetricsRegistry::instance().to_json());
    EXPECT_EQ(j["counters"]["json_counter"], 2);
    EXPECT_DOUBLE_EQ(j["gauges"]["json_gauge"].get<double>(), 7.0);
    EXPECT_EQ(j["histograms"]["json_latency"]["count"], 1);
    EXPECT_EQ(j["histograms"]["json_latency"]["p95_ms"], 12);
}
