#pragma once

#include <functional>
#include <memory>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <map>
#include <set>
#include <optional>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "market_data/price_series_cache.hpp"
#include "market_data/order_book.hpp"
#include "market_data/market_window_scanner.hpp"
#include "market_data/book_listener.hpp"
#include "capture/book_event_handler.hpp"
#include "persistence/book_recorder.hpp"
#include "strategy/signal_generator.hpp"

namespace polycap {

/**
 * Drives the 15-minute window lifecycle.
 *
 * The scan thread refreshes the window table every scan_interval_sec. The
 * tick thread starts a book listener start_buffer_sec before a window
 * opens and stops it stop_buffer_sec after it closes, captures the strike
 * once the window is open, and drops windows whose stop time has passed.
 * Listeners live in a table keyed by market id.
 */
class CaptureScheduler {
public:
    using ListenerFactory = std::function<std::unique_ptr<BookListener>(
        const MarketWindow& window, BookListener::EventHandler handler)>;
    using SignalCallback = std::function<void(const Signal&)>;

    CaptureScheduler(const Config& config, MarketWindowScanner& scanner,
                     PriceSeriesCache& cache, BookRecorder& recorder,
                     ListenerFactory listener_factory);
    ~CaptureScheduler();

    CaptureScheduler(const CaptureScheduler&) = delete;
    CaptureScheduler& operator=(const CaptureScheduler&) = delete;

    void start();
    void stop();

    // Single steps, also driven directly by tests
    void run_scan(int64_t now_ms);
    void tick(int64_t now_ms);
    std::vector<Signal> generate_signals(int64_t now_ms);

    // Insert or refresh a window; an existing strike is kept
    void add_window(const MarketWindow& window);

    void set_signal_callback(SignalCallback cb) { on_signal_ = std::move(cb); }

    // Queries
    std::vector<MarketWindow> windows() const;
    std::optional<MarketWindow> window(const std::string& market_id) const;
    std::shared_ptr<const OrderBook> book(const std::string& market_id) const;
    size_t window_count() const;
    size_t active_listener_count() const;
    bool is_listening(const std::string& market_id) const;
    int64_t cap_rejections() const { return cap_rejections_.load(); }

    static bool should_be_active(const MarketWindow& window, int64_t now_ms,
                                 const SchedulerConfig& config);
    static bool is_expired(const MarketWindow& window, int64_t now_ms,
                           const SchedulerConfig& config);

    // Oracle price as-of the window start, chainlink first
    static std::optional<PricePoint> strike_for(const MarketWindow& window,
                                                const PriceSeriesCache& cache,
                                                std::string& source);

private:
    struct ActiveCapture {
        std::shared_ptr<OrderBook> book;
        std::shared_ptr<BookEventHandler> handler;
        std::unique_ptr<BookListener> listener;
    };

    Config config_;
    MarketWindowScanner& scanner_;
    PriceSeriesCache& cache_;
    BookRecorder& recorder_;
    ListenerFactory listener_factory_;
    SignalGenerator generator_;
    SignalCallback on_signal_;

    std::map<std::string, MarketWindow> windows_;
    std::map<std::string, ActiveCapture> active_;
    std::map<std::string, SignalAction> last_action_;
    std::set<std::string> cap_warned_;
    mutable std::mutex mutex_;

    std::atomic<bool> running_{false};
    std::atomic<int64_t> cap_rejections_{0};
    std::thread tick_thread_;
    std::thread scan_thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    void run_tick_loop();
    void run_scan_loop();
    bool wait_for(std::chrono::milliseconds d);

    // Caller holds mutex_
    void start_capture(const MarketWindow& window);
    void try_capture_strike(MarketWindow& window);
};

} // namespace polycap
