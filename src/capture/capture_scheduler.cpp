#include "capture/capture_scheduler.hpp"
#include "utils/time_utils.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>

namespace polycap {

CaptureScheduler::CaptureScheduler(const Config& config, MarketWindowScanner& scanner,
                                   PriceSeriesCache& cache, BookRecorder& recorder,
                                   ListenerFactory listener_factory)
    : config_(config)
    , scanner_(scanner)
    , cache_(cache)
    , recorder_(recorder)
    , listener_factory_(std::move(listener_factory))
    , generator_(config.pricing, cache)
{
}

CaptureScheduler::~CaptureScheduler() {
    stop();
}

bool CaptureScheduler::should_be_active(const MarketWindow& window, int64_t now_ms,
                                        const SchedulerConfig& config) {
    int64_t open_at = window.start_ms - static_cast<int64_t>(config.start_buffer_sec) * 1000;
    int64_t close_at = window.end_ms() + static_cast<int64_t>(config.stop_buffer_sec) * 1000;
    return now_ms >= open_at && now_ms < close_at;
}

bool CaptureScheduler::is_expired(const MarketWindow& window, int64_t now_ms,
                                  const SchedulerConfig& config) {
    return now_ms >= window.end_ms() + static_cast<int64_t>(config.stop_buffer_sec) * 1000;
}

std::optional<PricePoint> CaptureScheduler::strike_for(const MarketWindow& window,
                                                       const PriceSeriesCache& cache,
                                                       std::string& source) {
    for (const auto& candidate : {SOURCE_CHAINLINK, SOURCE_BINANCE}) {
        auto point = cache.as_of(candidate, window.asset, window.start_ms);
        if (point) {
            source = candidate;
            return point;
        }
    }
    return std::nullopt;
}

void CaptureScheduler::start() {
    if (running_.exchange(true)) return;
    spdlog::info("Capture scheduler starting (tick={}ms, scan={}s, cap={})",
                 config_.scheduler.tick_interval_ms, config_.scheduler.scan_interval_sec,
                 config_.scheduler.max_active_listeners);
    scan_thread_ = std::thread(&CaptureScheduler::run_scan_loop, this);
    tick_thread_ = std::thread(&CaptureScheduler::run_tick_loop, this);
}

void CaptureScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        running_ = false;
    }
    wait_cv_.notify_all();

    if (tick_thread_.joinable()) tick_thread_.join();
    if (scan_thread_.joinable()) scan_thread_.join();

    std::map<std::string, ActiveCapture> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(active_);
    }
    if (remaining.empty()) return;

    spdlog::info("Stopping {} book listeners", remaining.size());
    for (auto& [market_id, capture] : remaining) {
        capture.listener->stop();
        recorder_.close(market_id);
    }
    POLYCAP_GAUGE("active_listeners").set(0.0);
}

bool CaptureScheduler::wait_for(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, d, [this] { return !running_.load(); });
    return running_.load();
}

void CaptureScheduler::run_tick_loop() {
    while (running_.load()) {
        tick(time_utils::epoch_ms());
        if (!wait_for(std::chrono::milliseconds(config_.scheduler.tick_interval_ms))) break;
    }
}

void CaptureScheduler::run_scan_loop() {
    while (running_.load()) {
        run_scan(time_utils::epoch_ms());
        if (!wait_for(std::chrono::seconds(config_.scheduler.scan_interval_sec))) break;
    }
}

void CaptureScheduler::run_scan(int64_t now_ms) {
    auto found = scanner_.scan(now_ms);

    int added = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& w : found) {
            if (is_expired(w, now_ms, config_.scheduler)) continue;

            auto it = windows_.find(w.market_id);
            if (it == windows_.end()) {
                windows_.emplace(w.market_id, w);
                added++;
                continue;
            }

            MarketWindow refreshed = w;
            refreshed.strike = it->second.strike;
            refreshed.strike_source = it->second.strike_source;
            it->second = std::move(refreshed);
        }
        POLYCAP_GAUGE("windows_tracked").set(static_cast<double>(windows_.size()));
    }

    spdlog::info("Window table: {} new, {} tracked", added, window_count());
}

void CaptureScheduler::add_window(const MarketWindow& window) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = windows_.find(window.market_id);
    if (it == windows_.end()) {
        windows_.emplace(window.market_id, window);
        return;
    }
    auto strike = it->second.strike;
    auto source = it->second.strike_source;
    it->second = window;
    if (strike) {
        it->second.strike = strike;
        it->second.strike_source = source;
    }
}

void CaptureScheduler::start_capture(const MarketWindow& window) {
    // Already holding lock
    ActiveCapture capture;
    capture.book = std::make_shared<OrderBook>(window.yes_token_id, config_.book.levels);
    capture.handler = std::make_shared<BookEventHandler>(
        window.market_id, window.yes_token_id, capture.book, recorder_);

    auto handler = capture.handler;
    capture.listener = listener_factory_(window, [handler](const nlohmann::json& event) {
        handler->handle(event);
    });
    if (!capture.listener) {
        spdlog::error("Listener factory returned nothing for market {}", window.market_id);
        return;
    }

    spdlog::info("Starting capture {} ({}) {} -> {}",
                 window.market_id, window.asset,
                 time_utils::to_iso8601(window.start_ms),
                 time_utils::to_iso8601(window.end_ms()));
    capture.listener->start();
    active_.emplace(window.market_id, std::move(capture));
    POLYCAP_COUNTER("listeners_started").increment();
}

void CaptureScheduler::try_capture_strike(MarketWindow& window) {
    // Already holding lock
    std::string source;
    auto point = strike_for(window, cache_, source);
    if (!point) return;

    window.strike = point->price;
    window.strike_source = source;
    spdlog::info("Strike for {} ({}): {} from {} at {}",
                 window.market_id, window.asset, point->price, source,
                 time_utils::to_iso8601(point->timestamp_ms));
}

void CaptureScheduler::tick(int64_t now_ms) {
    std::vector<ActiveCapture> to_stop;
    std::vector<std::string> to_close;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto& sched = config_.scheduler;

        for (auto it = active_.begin(); it != active_.end();) {
            auto w = windows_.find(it->first);
            if (w == windows_.end() || !should_be_active(w->second, now_ms, sched)) {
                spdlog::info("Stopping capture {}", it->first);
                to_close.push_back(it->first);
                to_stop.push_back(std::move(it->second));
                it = active_.erase(it);
            } else if (it->second.listener->finished()) {
                // Ended early; a fresh listener is started below
                spdlog::info("Listener for {} ended inside its window, restarting", it->first);
                to_stop.push_back(std::move(it->second));
                it = active_.erase(it);
            } else {
                ++it;
            }
        }

        for (auto& [market_id, w] : windows_) {
            if (!should_be_active(w, now_ms, sched)) continue;

            if (!w.strike && now_ms >= w.start_ms) {
                try_capture_strike(w);
            }

            if (active_.count(market_id)) continue;

            if (static_cast<int>(active_.size()) >= sched.max_active_listeners) {
                cap_rejections_++;
                if (cap_warned_.insert(market_id).second) {
                    spdlog::warn("Listener cap {} reached, not capturing {}",
                                 sched.max_active_listeners, market_id);
                }
                continue;
            }

            start_capture(w);
        }

        for (auto it = windows_.begin(); it != windows_.end();) {
            if (is_expired(it->second, now_ms, sched) && !active_.count(it->first)) {
                last_action_.erase(it->first);
                cap_warned_.erase(it->first);
                it = windows_.erase(it);
            } else {
                ++it;
            }
        }

        POLYCAP_GAUGE("active_listeners").set(static_cast<double>(active_.size()));
        POLYCAP_GAUGE("windows_tracked").set(static_cast<double>(windows_.size()));
    }

    // Join outside the table lock
    for (auto& capture : to_stop) {
        capture.listener->stop();
    }
    for (const auto& market_id : to_close) {
        recorder_.close(market_id);
    }
}

std::vector<Signal> CaptureScheduler::generate_signals(int64_t now_ms) {
    std::vector<Signal> emitted;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [market_id, capture] : active_) {
            auto w = windows_.find(market_id);
            if (w == windows_.end()) continue;

            auto signal = generator_.evaluate(w->second, *capture.book, now_ms);
            if (!signal) {
                last_action_.insert_or_assign(market_id, SignalAction::NONE);
                continue;
            }

            // Emit on direction changes only
            auto last = last_action_.find(market_id);
            if (last != last_action_.end() && last->second == signal->action) continue;

            last_action_.insert_or_assign(market_id, signal->action);
            emitted.push_back(*signal);
        }
    }

    for (const auto& signal : emitted) {
        POLYCAP_COUNTER("signals").increment();
        spdlog::info("Signal {} {} entry={:.3f} fair={:.3f} edge={:.3f} conf={:.2f}",
                     signal.market_id, action_to_string(signal.action), signal.entry_price,
                     signal.fair_yes, signal.edge, signal.confidence);
        if (on_signal_) on_signal_(signal);
    }
    return emitted;
}

std::vector<MarketWindow> CaptureScheduler::windows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MarketWindow> result;
    result.reserve(windows_.size());
    for (const auto& [id, w] : windows_) {
        result.push_back(w);
    }
    return result;
}

std::optional<MarketWindow> CaptureScheduler::window(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = windows_.find(market_id);
    if (it == windows_.end()) return std::nullopt;
    return it->second;
}

std::shared_ptr<const OrderBook> CaptureScheduler::book(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(market_id);
    if (it == active_.end()) return nullptr;
    return it->second.book;
}

size_t CaptureScheduler::window_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.size();
}

size_t CaptureScheduler::active_listener_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

bool CaptureScheduler::is_listening(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(market_id) > 0;
}

} // namespace polycap
