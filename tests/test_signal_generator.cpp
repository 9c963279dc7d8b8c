#include <gtest/gtest.h>
#include "strategy/signal_generator.hpp"

using namespace polycap;

class SignalGeneratorTest : public ::testing::Test {
protected:
    static constexpr int64_t T0 = 1700000040000;   // Minute aligned

    void SetUp() override {
        cache_ = std::make_unique<PriceSeriesCache>(2 * 3600 * 1000);
        book_ = std::make_unique<OrderBook>("yes", 5);

        window_.market_id = "m1";
        window_.asset = "btc";
        window_.start_ms = T0;
        window_.strike = 100.0;
        window_.strike_source = SOURCE_CHAINLINK;

        // Flat history before open
        for (int i = 30; i >= 0; i--) {
            cache_->add(SOURCE_CHAINLINK, "btc", T0 - i * 60000, 100.0);
        }
    }

    void set_book(double bid, double ask) {
        book_->apply_snapshot({{bid, 100.0}}, {{ask, 100.0}});
    }

    std::unique_ptr<PriceSeriesCache> cache_;
    std::unique_ptr<OrderBook> book_;
    PricingConfig config_;
    MarketWindow window_;
};

TEST_F(SignalGeneratorTest, PriceAboveStrike_LongWhenYesCheap) {
    cache_->add(SOURCE_CHAINLINK, "btc", T0 + 60000, 105.0);
    set_book(0.48, 0.52);

    SignalGenerator gen(config_, *cache_);
    auto signal = gen.evaluate(window_, *book_, T0 + 120000);

    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->action, SignalAction::LONG);
    EXPECT_EQ(signal->market_id, "m1");
    EXPECT_EQ(signal->asset, "btc");
    EXPECT_NEAR(signal->entry_price, 0.50, 1e-12);
    EXPECT_GT(signal->fair_yes, 0.9);
    EXPECT_NEAR(signal->edge, signal->fair_yes - 0.50, 1e-12);
    EXPECT_DOUBLE_EQ(signal->confidence, 1.0);
    EXPECT_EQ(signal->generated_at_ms, T0 + 120000);
}

TEST_F(SignalGeneratorTest, PriceBelowStrike_ShortWhenYesRich) {
    cache_->add(SOURCE_CHAINLINK, "btc", T0 + 60000, 95.0);
    set_book(0.60, 0.70);

    SignalGenerator gen(config_, *cache_);
    auto signal = gen.evaluate(window_, *book_, T0 + 120000);

    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->action, SignalAction::SHORT);
    EXPECT_LT(signal->fair_yes, 0.1);
}

TEST_F(SignalGeneratorTest, ConfidenceScalesWithEdge) {
    config_.full_confidence_edge = 2.0;
    cache_->add(SOURCE_CHAINLINK, "btc", T0 + 60000, 105.0);
    set_book(0.48, 0.52);

    SignalGenerator gen(config_, *cache_);
    auto signal = gen.evaluate(window_, *book_, T0 + 120000);
    ASSERT_TRUE(signal.has_value());
    EXPECT_NEAR(signal->confidence, signal->edge / 2.0, 1e-12);
}

TEST_F(SignalGeneratorTest, NoEdge_NoSignal) {
    set_book(0.49, 0.51);

    SignalGenerator gen(config_, *cache_);
    EXPECT_FALSE(gen.evaluate(window_, *book_, T0 + 60000).has_value());
}

TEST_F(SignalGeneratorTest, MissingInputs_NoSignal) {
    SignalGenerator gen(config_, *cache_);
    cache_->add(SOURCE_CHAINLINK, "btc", T0 + 60000, 105.0);

    // One-sided book
    book_->apply_snapshot({{0.48, 10.0}}, {});
    EXPECT_FALSE(gen.evaluate(window_, *book_, T0 + 120000).has_value());

    set_book(0.48, 0.52);

    // Before open
    EXPECT_FALSE(gen.evaluate(window_, *book_, T0 - 1).has_value());

    // No strike yet
    MarketWindow no_strike = window_;
    no_strike.strike.reset();
    EXPECT_FALSE(gen.evaluate(no_strike, *book_, T0 + 120000).has_value());

    // No oracle data for the asset
    MarketWindow other = window_;
    other.asset = "eth";
    EXPECT_FALSE(gen.evaluate(other, *book_, T0 + 120000).has_value());
}

TEST_F(SignalGeneratorTest, UsesStrikeSourceForCurrentPrice) {
    cache_->add(SOURCE_BINANCE, "btc", T0 - 1000, 100.0);
    cache_->add(SOURCE_BINANCE, "btc", T0 + 60000, 95.0);
    cache_->add(SOURCE_CHAINLINK, "btc", T0 + 60000, 105.0);
    set_book(0.48, 0.52);

    window_.strike_source = SOURCE_BINANCE;
    SignalGenerator gen(config_, *cache_);
    auto signal = gen.evaluate(window_, *book_, T0 + 120000);
    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->action, SignalAction::SHORT);
}

TEST_F(SignalGeneratorTest, MinuteSamples_AsOfEachBoundary) {
    cache_->add(SOURCE_CHAINLINK, "btc", T0 + 30000, 101.0);
    cache_->add(SOURCE_CHAINLINK, "btc", T0 + 90000, 102.0);

    SignalGenerator gen(config_, *cache_);
    auto samples = gen.minute_samples(SOURCE_CHAINLINK, "btc", T0 - 1, T0 + 120000);

    ASSERT_EQ(samples.size(), 3u);
    EXPECT_DOUBLE_EQ(samples[0], 100.0);   // T0
    EXPECT_DOUBLE_EQ(samples[1], 101.0);   // T0 + 1m
    EXPECT_DOUBLE_EQ(samples[2], 102.0);   // T0 + 2m

    EXPECT_TRUE(gen.minute_samples(SOURCE_CHAINLINK, "btc", T0, T0 - 1).empty());
    EXPECT_TRUE(gen.minute_samples(SOURCE_BINANCE, "sol", T0, T0 + 120000).empty());
}
