#pragma once

#include <string>
#include <vector>
#include <deque>
#include <map>
#include <set>
#include <memory>
#include <fstream>
#include <mutex>
#include <optional>
#include "common/types.hpp"

namespace polycap {

struct RecorderStats {
    int64_t total_updates{0};
    int64_t valid_updates{0};
    int64_t invalid_updates{0};
    size_t markets_tracked{0};
    std::vector<std::string> recent_errors;   // Last MAX_RECENT_ERRORS
};

/**
 * Append-only CSV log of top-of-book rows, one file per market under
 * books_dir. The header is written only when a file is new. Handles are
 * flushed every flush_every_rows valid rows of that market and on close.
 */
class BookRecorder {
public:
    static constexpr size_t MAX_RECENT_ERRORS = 10;
    static const char* const CSV_HEADER;

    BookRecorder(const std::string& books_dir, int flush_every_rows = 100);
    ~BookRecorder();

    BookRecorder(const BookRecorder&) = delete;
    BookRecorder& operator=(const BookRecorder&) = delete;

    // Returns an error description, or nullopt when the update is valid.
    static std::optional<std::string> validate_update(const std::string& market_id,
                                                      int64_t timestamp_ms,
                                                      const std::vector<PriceLevel>& bids,
                                                      const std::vector<PriceLevel>& asks);

    static BookRow build_row(const std::string& market_id, int64_t timestamp_ms,
                             const BookSnapshot& book);

    static std::string format_row(const BookRow& row);

    // Persist one valid row; throws std::runtime_error if the file cannot be opened
    void record(const BookRow& row);

    // Count an update that was rejected before reaching record()
    void reject(const std::string& error);

    // Flush and release one market's handle
    void close(const std::string& market_id);
    void close_all();

    RecorderStats stats() const;
    std::string path_for(const std::string& market_id) const;
    const std::string& books_dir() const { return books_dir_; }

private:
    struct MarketFile {
        std::ofstream out;
        int64_t rows{0};
    };

    std::string books_dir_;
    int flush_every_rows_;

    std::map<std::string, std::unique_ptr<MarketFile>> files_;
    std::set<std::string> seen_markets_;

    int64_t total_updates_{0};
    int64_t valid_updates_{0};
    int64_t invalid_updates_{0};
    std::deque<std::string> recent_errors_;

    mutable std::mutex mutex_;

    MarketFile& open_file(const std::string& market_id);
    void push_error(const std::string& error);
};

} // namespace polycap
