#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace polycap {

/**
 * Persistent ledger of generated signals.
 * Writes JSON lines {event_type, timestamp, data}.
 */
class SignalLedger {
public:
    explicit SignalLedger(const std::string& path);
    ~SignalLedger();

    SignalLedger(const SignalLedger&) = delete;
    SignalLedger& operator=(const SignalLedger&) = delete;

    void record_signal(const Signal& signal);

    // Generic event recording
    void record_event(const std::string& event_type, const nlohmann::json& data);

    // All "signal" events in a ledger file, in file order
    static std::vector<Signal> read_signals(const std::string& path);

    void flush();
    bool is_open() const;
    int64_t events_written() const;
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ofstream file_;
    int64_t events_written_{0};
    mutable std::mutex mutex_;

    void open_file();
    void write_line(const nlohmann::json& j);
};

void to_json(nlohmann::json& j, const Signal& s);
void from_json(const nlohmann::json& j, Signal& s);

} // namespace polycap
