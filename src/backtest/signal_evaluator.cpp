#include "backtest/signal_evaluator.hpp"
#include "persistence/signal_ledger.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <cmath>
#include <stdexcept>

namespace polycap {

void to_json(nlohmann::json& j, const TradeOutcome& t) {
    j = nlohmann::json{
        {"market_id", t.market_id},
        {"action", action_to_string(t.action)},
        {"entry_price", t.entry_price},
        {"settlement", t.settlement},
        {"won", t.won},
        {"pnl", t.pnl}
    };
}

void to_json(nlohmann::json& j, const EvaluationReport& r) {
    if (!r.has_signals) {
        j = nlohmann::json{
            {"has_signals", false},
            {"trades", 0},
            {"error", "No signals to evaluate"}
        };
        return;
    }

    j = nlohmann::json{
        {"has_signals", true},
        {"trades", r.trades},
        {"wins", r.wins},
        {"skipped", r.skipped},
        {"win_rate", r.win_rate},
        {"total_pnl", r.total_pnl},
        {"avg_pnl", r.avg_pnl},
        {"std_dev", r.std_dev},
        {"sharpe", r.sharpe},
        {"outcomes", r.outcomes}
    };
}

SignalEvaluator::SignalEvaluator(const EvaluatorConfig& config)
    : config_(config)
{
}

TradeOutcome SignalEvaluator::grade(const Signal& signal, double settlement) const {
    TradeOutcome t;
    t.market_id = signal.market_id;
    t.action = signal.action;
    t.entry_price = signal.entry_price;
    t.settlement = settlement;

    double delta = 0.0;
    switch (signal.action) {
        case SignalAction::LONG:
            delta = settlement - signal.entry_price;
            break;
        case SignalAction::SHORT:
            delta = signal.entry_price - settlement;
            break;
        case SignalAction::NONE:
            return t;
    }

    t.won = delta > 0.0;
    t.pnl = delta * signal.confidence * config_.position_scale;
    if (!t.won) {
        t.pnl *= config_.loss_penalty;
    }
    return t;
}

EvaluationReport SignalEvaluator::evaluate(const std::vector<GradedSignal>& graded) const {
    EvaluationReport report;

    std::vector<double> pnls;
    for (const auto& g : graded) {
        if (g.signal.action == SignalAction::NONE) {
            report.skipped++;
            continue;
        }
        auto outcome = grade(g.signal, g.settlement);
        if (outcome.won) report.wins++;
        pnls.push_back(outcome.pnl);
        report.outcomes.push_back(std::move(outcome));
    }

    report.trades = static_cast<int>(pnls.size());
    if (report.trades == 0) {
        return report;
    }
    report.has_signals = true;

    for (double p : pnls) report.total_pnl += p;
    report.avg_pnl = report.total_pnl / report.trades;
    report.win_rate = static_cast<double>(report.wins) / report.trades;

    double variance = 0.0;
    for (double p : pnls) {
        variance += (p - report.avg_pnl) * (p - report.avg_pnl);
    }
    variance /= report.trades;
    report.std_dev = std::sqrt(variance);

    if (report.std_dev > 0.0 && report.trades > 1) {
        report.sharpe = report.avg_pnl / report.std_dev;
    }

    return report;
}

std::vector<GradedSignal> SignalEvaluator::load_graded(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open graded signal file: " + path);
    }

    std::vector<GradedSignal> graded;
    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        try {
            auto j = nlohmann::json::parse(line);
            GradedSignal g;
            g.signal = j.at("signal").get<Signal>();
            g.settlement = j.at("settlement").get<double>();
            graded.push_back(std::move(g));
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Skipping graded line {}: {}", line_no, e.what());
        }
    }
    return graded;
}

} // namespace polycap
