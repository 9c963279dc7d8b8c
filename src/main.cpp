#include <iostream>
#include <iomanip>
#include <csignal>
#include <atomic>
#include <thread>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <nlohmann/json.hpp>

#include "common/types.hpp"
#include "config/config.hpp"
#include "market_data/price_series_cache.hpp"
#include "market_data/ws_transport.hpp"
#include "market_data/market_window_scanner.hpp"
#include "market_data/oracle_listener.hpp"
#include "market_data/book_listener.hpp"
#include "capture/capture_scheduler.hpp"
#include "persistence/book_recorder.hpp"
#include "persistence/signal_ledger.hpp"
#include "backtest/signal_evaluator.hpp"
#include "utils/time_utils.hpp"
#include "utils/metrics.hpp"

using namespace polycap;

// Global shutdown flag
std::atomic<bool> g_shutdown{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}

// Parse duration string like "1.5h", "30m", "90s", "2h30m"
// Returns duration in seconds, or 0 if invalid/empty
int64_t parse_duration_string(const std::string& input) {
    if (input.empty()) return 0;

    std::string s = input;
    s.erase(std::remove(s.begin(), s.end(), ' '), s.end());
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);

    int64_t total_seconds = 0;
    std::string number_buf;

    for (char c : s) {
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
            number_buf += c;
        } else if (c == 'h' || c == 'm' || c == 's') {
            if (number_buf.empty()) continue;

            double value = std::stod(number_buf);
            if (c == 'h') {
                total_seconds += static_cast<int64_t>(value * 3600);
            } else if (c == 'm') {
                total_seconds += static_cast<int64_t>(value * 60);
            } else {
                total_seconds += static_cast<int64_t>(value);
            }
            number_buf.clear();
        }
    }

    // Bare number means minutes
    if (!number_buf.empty() && total_seconds == 0) {
        total_seconds = static_cast<int64_t>(std::stod(number_buf) * 60);
    }

    return total_seconds;
}

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/polycap.log",
            config.max_log_file_size_mb * 1024 * 1024,
            config.max_log_files
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","thread":%t,"msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("polycap", sinks.begin(), sinks.end());

    if (config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
}

void print_windows(const std::vector<MarketWindow>& windows) {
    std::cout << "\n" << windows.size() << " windows within horizon\n\n";
    for (const auto& w : windows) {
        std::cout << "* " << w.question << "\n";
        std::cout << "  Market: " << w.market_id << "  Asset: " << w.asset << "\n";
        std::cout << "  Slug:   " << w.slug << "\n";
        std::cout << "  Window: " << time_utils::to_iso8601(w.start_ms)
                  << " -> " << time_utils::to_iso8601(w.end_ms()) << "\n";
        std::cout << "  YES:    " << w.yes_token_id.substr(0, 16) << "...\n";
        std::cout << "  NO:     " << w.no_token_id.substr(0, 16) << "...\n\n";
    }
}

int run_grade(const std::string& path, const Config& config) {
    std::vector<GradedSignal> graded;
    try {
        graded = SignalEvaluator::load_graded(path);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    SignalEvaluator evaluator(config.evaluator);
    auto report = evaluator.evaluate(graded);
    nlohmann::json j = report;
    std::cout << j.dump(2) << std::endl;

    if (report.has_signals) {
        spdlog::info("Graded {} trades: win_rate={:.1f}% total_pnl={:.4f} sharpe={:.2f}",
                     report.trades, report.win_rate * 100, report.total_pnl, report.sharpe);
    } else {
        spdlog::warn("No signals to grade in {}", path);
    }
    return 0;
}

void log_recorder_stats(const BookRecorder& recorder) {
    auto stats = recorder.stats();
    spdlog::info("Book updates: total={} valid={} invalid={} markets={}",
                 stats.total_updates, stats.valid_updates, stats.invalid_updates,
                 stats.markets_tracked);
    for (const auto& err : stats.recent_errors) {
        spdlog::info("  recent validation error: {}", err);
    }
}

int main(int argc, char* argv[]) {
    CLI::App app{"PolyCap - 15-minute crypto market capture and fair-value engine"};

    std::string config_path = "configs/polycap.json";
    std::string grade_path;
    std::string duration;
    bool list_windows = false;
    bool no_signals = false;
    bool show_version = false;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("--grade", grade_path, "Grade a JSONL file of {signal, settlement} lines and exit")
        ->check(CLI::ExistingFile);
    app.add_option("-d,--duration", duration, "Stop after this long (e.g. 90m, 2h30m)");
    app.add_flag("--list-windows", list_windows, "Run one scan, print discovered windows and exit");
    app.add_flag("--no-signals", no_signals, "Capture only, do not generate signals");
    app.add_flag("-v,--version", show_version, "Show version information");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
        std::cout << "PolyCap v1.0.0\n";
        std::cout << "Built with C++20\n";
        return 0;
    }

    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    setup_logging(config.logging);

    if (!config.validate()) {
        spdlog::error("Invalid configuration in {}", config_path);
        return 1;
    }

    if (!grade_path.empty()) {
        return run_grade(grade_path, config);
    }

    auto catalog = std::make_shared<GammaCatalogSource>(config.connection.gamma_url, config.scanner);
    MarketWindowScanner scanner(catalog, config.scanner);

    if (list_windows) {
        print_windows(scanner.scan(time_utils::epoch_ms()));
        return 0;
    }

    int64_t session_secs = 0;
    try {
        session_secs = parse_duration_string(duration);
    } catch (const std::exception& e) {
        spdlog::error("Invalid duration '{}': {}", duration, e.what());
        return 1;
    }
    auto session_end = std::chrono::steady_clock::now() + std::chrono::seconds(session_secs);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    spdlog::info("Initializing PolyCap (data_dir={})", config.data_dir);

    PriceSeriesCache cache(config.cache.max_age_ms);
    BookRecorder recorder((std::filesystem::path(config.data_dir) / "books").string(),
                          config.book.flush_every_rows);
    SignalLedger ledger(config.signal_ledger_path);

    auto transports = make_tls_transport_factory(config.connection.connect_timeout_ms);

    OracleListener oracle(config.connection, cache, transports);
    oracle.set_status_callback([](ConnectionStatus status) {
        POLYCAP_GAUGE("oracle_connected").set(status == ConnectionStatus::CONNECTED ? 1.0 : 0.0);
    });

    const ConnectionConfig conn = config.connection;
    CaptureScheduler scheduler(config, scanner, cache, recorder,
        [conn, transports](const MarketWindow& window, BookListener::EventHandler handler) {
            return std::make_unique<BookListener>(window.market_id, window.yes_token_id,
                                                  conn, transports, std::move(handler));
        });

    scheduler.set_signal_callback([&ledger](const Signal& signal) {
        ledger.record_signal(signal);
    });

    oracle.start();
    scheduler.start();

    if (session_secs > 0) {
        spdlog::info("PolyCap started, running for {}", time_utils::format_duration_ms(session_secs * 1000));
    } else {
        spdlog::info("PolyCap started, running until Ctrl+C");
    }

    // Signal loop
    auto last_status = std::chrono::steady_clock::now();
    while (!g_shutdown.load()) {
        if (session_secs > 0 && std::chrono::steady_clock::now() >= session_end) {
            spdlog::info("Session time limit reached. Shutting down...");
            break;
        }

        if (!no_signals) {
            scheduler.generate_signals(time_utils::epoch_ms());
        }

        if (std::chrono::steady_clock::now() - last_status >= std::chrono::seconds(60)) {
            auto rec = recorder.stats();
            spdlog::info("Status: oracle={} ticks={} windows={} listeners={} rows={} invalid={}",
                         conn_status_to_string(oracle.status()), oracle.ticks_accepted(),
                         scheduler.window_count(), scheduler.active_listener_count(),
                         rec.valid_updates, rec.invalid_updates);
            last_status = std::chrono::steady_clock::now();
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(config.pricing.signal_interval_ms));
    }

    spdlog::info("Shutting down...");
    scheduler.stop();
    oracle.stop();
    recorder.close_all();
    ledger.flush();

    log_recorder_stats(recorder);
    spdlog::info("Signals written: {}", ledger.events_written());
    spdlog::info("Metrics:\n{}", MetricsRegistry::instance().to_json());

    spdlog::shutdown();
    return 0;
}
