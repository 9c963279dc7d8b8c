#include "persistence/book_recorder.hpp"
#include "utils/time_utils.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <filesystem>
#include <algorithm>
#include <stdexcept>

namespace polycap {

const char* const BookRecorder::CSV_HEADER =
    "timestamp_ms,timestamp_iso,bid_price_1,bid_size_1,ask_price_1,ask_size_1,spread,mid_price,market_id";

namespace {
    // Top-of-book placeholder when a side is empty
    constexpr Price EMPTY_SIDE_PRICE = 0.5;

    std::optional<std::string> check_levels(const std::vector<PriceLevel>& levels, const char* side) {
        for (const auto& level : levels) {
            if (!(level.price > 0.0 && level.price < 1.0)) {
                return fmt::format("Invalid {} price: {}", side, level.price);
            }
            if (!(level.size > 0.0)) {
                return fmt::format("Invalid {} size: {}", side, level.size);
            }
        }
        return std::nullopt;
    }
}

BookRecorder::BookRecorder(const std::string& books_dir, int flush_every_rows)
    : books_dir_(books_dir)
    , flush_every_rows_(std::max(1, flush_every_rows))
{
}

BookRecorder::~BookRecorder() {
    close_all();
}

std::optional<std::string> BookRecorder::validate_update(const std::string& market_id,
                                                         int64_t timestamp_ms,
                                                         const std::vector<PriceLevel>& bids,
                                                         const std::vector<PriceLevel>& asks) {
    if (market_id.empty() || timestamp_ms <= 0) {
        return std::string("Missing market_id or timestamp");
    }
    if (auto err = check_levels(bids, "bid")) return err;
    if (auto err = check_levels(asks, "ask")) return err;
    return std::nullopt;
}

BookRow BookRecorder::build_row(const std::string& market_id, int64_t timestamp_ms,
                                const BookSnapshot& book) {
    BookRow row;
    row.timestamp_ms = timestamp_ms;
    row.timestamp_iso = time_utils::to_iso8601(timestamp_ms);
    row.market_id = market_id;

    row.bid_price_1 = book.bids.empty() ? EMPTY_SIDE_PRICE : book.bids.front().price;
    row.bid_size_1 = book.bids.empty() ? 0.0 : book.bids.front().size;
    row.ask_price_1 = book.asks.empty() ? EMPTY_SIDE_PRICE : book.asks.front().price;
    row.ask_size_1 = book.asks.empty() ? 0.0 : book.asks.front().size;

    if (!book.bids.empty() && !book.asks.empty()) {
        row.spread = row.ask_price_1 - row.bid_price_1;
        row.mid_price = (row.bid_price_1 + row.ask_price_1) / 2.0;
    } else {
        row.spread = 0.0;
        row.mid_price = EMPTY_SIDE_PRICE;
    }
    return row;
}

std::string BookRecorder::format_row(const BookRow& row) {
    return fmt::format("{},{},{},{},{},{},{},{},{}",
                       row.timestamp_ms, row.timestamp_iso,
                       row.bid_price_1, row.bid_size_1,
                       row.ask_price_1, row.ask_size_1,
                       row.spread, row.mid_price,
                       row.market_id);
}

std::string BookRecorder::path_for(const std::string& market_id) const {
    return (std::filesystem::path(books_dir_) / (market_id + ".csv")).string();
}

BookRecorder::MarketFile& BookRecorder::open_file(const std::string& market_id) {
    // Already holding lock
    auto it = files_.find(market_id);
    if (it != files_.end()) return *it->second;

    std::filesystem::create_directories(books_dir_);
    std::string path = path_for(market_id);

    bool is_new = !std::filesystem::exists(path) || std::filesystem::file_size(path) == 0;

    auto file = std::make_unique<MarketFile>();
    file->out.open(path, std::ios::app);
    if (!file->out.is_open()) {
        throw std::runtime_error("Failed to open book log: " + path);
    }
    if (is_new) {
        file->out << CSV_HEADER << "\n";
    }

    spdlog::debug("Book log opened: {}", path);
    auto& ref = *file;
    files_[market_id] = std::move(file);
    seen_markets_.insert(market_id);
    return ref;
}

void BookRecorder::record(const BookRow& row) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& file = open_file(row.market_id);
    file.out << format_row(row) << "\n";
    file.rows++;

    total_updates_++;
    valid_updates_++;
    POLYCAP_COUNTER("book_rows_written").increment();

    if (file.rows % flush_every_rows_ == 0) {
        file.out.flush();
    }
}

void BookRecorder::reject(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_updates_++;
    invalid_updates_++;
    push_error(error);
    POLYCAP_COUNTER("book_updates_invalid").increment();
}

void BookRecorder::push_error(const std::string& error) {
    recent_errors_.push_back(error);
    while (recent_errors_.size() > MAX_RECENT_ERRORS) {
        recent_errors_.pop_front();
    }
}

void BookRecorder::close(const std::string& market_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(market_id);
    if (it == files_.end()) return;

    it->second->out.flush();
    it->second->out.close();
    spdlog::debug("Book log closed: {} ({} rows)", market_id, it->second->rows);
    files_.erase(it);
}

void BookRecorder::close_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [market_id, file] : files_) {
        file->out.flush();
        file->out.close();
    }
    files_.clear();
}

RecorderStats BookRecorder::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RecorderStats s;
    s.total_updates = total_updates_;
    s.valid_updates = valid_updates_;
    s.invalid_updates = invalid_updates_;
    s.markets_tracked = seen_markets_.size();
    s.recent_errors.assign(recent_errors_.begin(), recent_errors_.end());
    return s;
}

} // namespace polycap
