#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "config/config.hpp"

namespace polycap {

// A signal paired with the realized settlement price of its market
struct GradedSignal {
    Signal signal;
    double settlement{0.0};
};

struct TradeOutcome {
    std::string market_id;
    SignalAction action{SignalAction::NONE};
    double entry_price{0.0};
    double settlement{0.0};
    bool won{false};
    double pnl{0.0};
};

struct EvaluationReport {
    bool has_signals{false};
    int trades{0};
    int wins{0};
    int skipped{0};              // action == none
    double win_rate{0.0};
    double total_pnl{0.0};
    double avg_pnl{0.0};
    double std_dev{0.0};
    double sharpe{0.0};
    std::vector<TradeOutcome> outcomes;
};

/**
 * Grades signals against settlement prices.
 *
 * Long wins when settlement > entry, short when settlement < entry.
 * pnl = delta * confidence * position_scale, and losing trades are further
 * multiplied by loss_penalty. sharpe = mean / population std, 0 when the
 * std is 0 or fewer than two trades exist.
 */
class SignalEvaluator {
public:
    explicit SignalEvaluator(const EvaluatorConfig& config = EvaluatorConfig{});

    TradeOutcome grade(const Signal& signal, double settlement) const;
    EvaluationReport evaluate(const std::vector<GradedSignal>& graded) const;

    // Lines of {"signal": {...}, "settlement": x}; throws std::runtime_error
    // if the file cannot be opened. Malformed lines are skipped.
    static std::vector<GradedSignal> load_graded(const std::string& path);

    const EvaluatorConfig& config() const { return config_; }

private:
    EvaluatorConfig config_;
};

void to_json(nlohmann::json& j, const TradeOutcome& t);
void to_json(nlohmann::json& j, const EvaluationReport& r);

} // namespace polycap
