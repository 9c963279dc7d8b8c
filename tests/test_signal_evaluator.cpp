#include <gtest/gtest.h>
#include "backtest/signal_evaluator.hpp"
#include "persistence/signal_ledger.hpp"
#include <filesystem>
#include <fstream>
#include <cmath>

using namespace polycap;

class SignalEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        evaluator_ = std::make_unique<SignalEvaluator>(EvaluatorConfig{});
    }

    static Signal make_signal(SignalAction action, double entry, double confidence,
                              const std::string& market = "m1") {
        Signal s;
        s.market_id = market;
        s.asset = "btc";
        s.action = action;
        s.entry_price = entry;
        s.confidence = confidence;
        return s;
    }

    std::unique_ptr<SignalEvaluator> evaluator_;
};

TEST_F(SignalEvaluatorTest, LongWin_ScaledByConfidence) {
    auto report = evaluator_->evaluate({{make_signal(SignalAction::LONG, 0.40, 0.7), 0.55}});

    ASSERT_TRUE(report.has_signals);
    EXPECT_EQ(report.trades, 1);
    EXPECT_EQ(report.wins, 1);
    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_TRUE(report.outcomes[0].won);
    EXPECT_NEAR(report.outcomes[0].pnl, 0.105, 1e-12);
    EXPECT_NEAR(report.total_pnl, 0.105, 1e-12);
}

TEST_F(SignalEvaluatorTest, ShortLoss_AppliesLossPenalty) {
    auto report = evaluator_->evaluate({{make_signal(SignalAction::SHORT, 0.80, 0.6), 0.90}});

    ASSERT_TRUE(report.has_signals);
    EXPECT_EQ(report.wins, 0);
    EXPECT_FALSE(report.outcomes[0].won);
    EXPECT_NEAR(report.outcomes[0].pnl, -0.03, 1e-12);
}

TEST_F(SignalEvaluatorTest, NoSignals_ReportsExplicitEmptyResult) {
    auto report = evaluator_->evaluate({});
    EXPECT_FALSE(report.has_signals);
    EXPECT_EQ(report.trades, 0);
    EXPECT_DOUBLE_EQ(report.sharpe, 0.0);

    nlohmann::json j = report;
    EXPECT_FALSE(j["has_signals"].get<bool>());
    EXPECT_TRUE(j.contains("error"));
}

TEST_F(SignalEvaluatorTest, NoneActions_AreSkipped) {
    auto report = evaluator_->evaluate({{make_signal(SignalAction::NONE, 0.5, 1.0), 1.0}});
    EXPECT_FALSE(report.has_signals);
    EXPECT_EQ(report.skipped, 1);
}

TEST_F(SignalEvaluatorTest, Aggregates_PopulationStdAndSharpe) {
    std::vector<GradedSignal> graded{
        {make_signal(SignalAction::LONG, 0.40, 1.0), 0.60},   // +0.20
        {make_signal(SignalAction::LONG, 0.50, 1.0), 0.40},   // -0.05
        {make_signal(SignalAction::SHORT, 0.70, 1.0), 0.60},  // +0.10
    };

    auto report = evaluator_->evaluate(graded);
    ASSERT_TRUE(report.has_signals);
    EXPECT_EQ(report.trades, 3);
    EXPECT_EQ(report.wins, 2);
    EXPECT_NEAR(report.win_rate, 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(report.total_pnl, 0.25, 1e-12);

    double mean = 0.25 / 3.0;
    double var = (std::pow(0.20 - mean, 2) + std::pow(-0.05 - mean, 2) + std::pow(0.10 - mean, 2)) / 3.0;
    EXPECT_NEAR(report.avg_pnl, mean, 1e-12);
    EXPECT_NEAR(report.std_dev, std::sqrt(var), 1e-12);
    EXPECT_NEAR(report.sharpe, mean / std::sqrt(var), 1e-9);
}

TEST_F(SignalEvaluatorTest, Sharpe_ZeroForSingleTradeOrFlatPnl) {
    auto single = evaluator_->evaluate({{make_signal(SignalAction::LONG, 0.40, 1.0), 0.60}});
    EXPECT_DOUBLE_EQ(single.sharpe, 0.0);

    auto flat = evaluator_->evaluate({
        {make_signal(SignalAction::LONG, 0.40, 1.0), 0.50},
        {make_signal(SignalAction::LONG, 0.40, 1.0), 0.50},
    });
    EXPECT_DOUBLE_EQ(flat.std_dev, 0.0);
    EXPECT_DOUBLE_EQ(flat.sharpe, 0.0);
}

TEST_F(SignalEvaluatorTest, Config_OverridesPenaltyAndScale) {
    EvaluatorConfig cfg;
    cfg.loss_penalty = 1.0;
    cfg.position_scale = 2.0;
    SignalEvaluator evaluator(cfg);

    auto t = evaluator.grade(make_signal(SignalAction::SHORT, 0.80, 0.6), 0.90);
    EXPECT_NEAR(t.pnl, -0.12, 1e-12);
}

TEST_F(SignalEvaluatorTest, LoadGraded_SkipsMalformedLines) {
    std::string path = "/tmp/polycap_graded_test.jsonl";
    {
        std::ofstream out(path);
        nlohmann::json line;
        line["signal"] = make_signal(SignalAction::LONG, 0.40, 0.7);
        line["settlement"] = 0.55;
        out << line.dump() << "\n";
        out << "not json\n";
        out << "{\"signal\":{}}\n";
        out << "\n";
    }

    auto graded = SignalEvaluator::load_graded(path);
    ASSERT_EQ(graded.size(), 1u);
    EXPECT_EQ(graded[0].signal.action, SignalAction::LONG);
    EXPECT_DOUBLE_EQ(graded[0].settlement, 0.55);

    std::filesystem::remove(path);
}

TEST_F(SignalEvaluatorTest, LoadGraded_MissingFileThrows) {
    EXPECT_THROW(SignalEvaluator::load_graded("/tmp/polycap_missing_graded.jsonl"), std::runtime_error);
}
