#include "persistence/signal_ledger.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>

namespace polycap {

void to_json(nlohmann::json& j, const Signal& s) {
    j = nlohmann::json{
        {"market_id", s.market_id},
        {"asset", s.asset},
        {"action", action_to_string(s.action)},
        {"entry_price", s.entry_price},
        {"edge", s.edge},
        {"confidence", s.confidence},
        {"generated_at_ms", s.generated_at_ms},
        {"fair_yes", s.fair_yes}
    };
}

void from_json(const nlohmann::json& j, Signal& s) {
    s.market_id = j.value("market_id", "");
    s.asset = j.value("asset", "");
    s.action = action_from_string(j.value("action", "none"));
    s.entry_price = j.value("entry_price", 0.0);
    s.edge = j.value("edge", 0.0);
    s.confidence = j.value("confidence", 0.0);
    s.generated_at_ms = j.value("generated_at_ms", int64_t{0});
    s.fair_yes = j.value("fair_yes", 0.0);
}

// SignalLedger implementation

SignalLedger::SignalLedger(const std::string& path)
    : path_(path)
{
    open_file();
}

SignalLedger::~SignalLedger() {
    flush();
    if (file_.is_open()) {
        file_.close();
    }
}

void SignalLedger::open_file() {
    std::filesystem::path p(path_);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    file_.open(path_, std::ios::app);
    if (!file_.is_open()) {
        spdlog::error("Failed to open signal ledger: {}", path_);
    } else {
        spdlog::info("Signal ledger opened: {}", path_);
    }
}

void SignalLedger::write_line(const nlohmann::json& j) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << j.dump() << "\n";
        events_written_++;
    }
}

void SignalLedger::record_signal(const Signal& signal) {
    record_event("signal", signal);
}

void SignalLedger::record_event(const std::string& event_type, const nlohmann::json& data) {
    nlohmann::json j;
    j["event_type"] = event_type;
    j["timestamp"] = time_utils::now_iso8601();
    j["data"] = data;
    write_line(j);
}

std::vector<Signal> SignalLedger::read_signals(const std::string& path) {
    std::vector<Signal> signals;

    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::warn("Signal ledger not found: {}", path);
        return signals;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        if (line.empty()) continue;
        try {
            auto j = nlohmann::json::parse(line);
            if (j.value("event_type", "") == "signal" && j.contains("data")) {
                signals.push_back(j.at("data").get<Signal>());
            }
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Skipping ledger line {}: {}", line_no, e.what());
        }
    }
    return signals;
}

void SignalLedger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

bool SignalLedger::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

int64_t SignalLedger::events_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_written_;
}

} // namespace polycap
