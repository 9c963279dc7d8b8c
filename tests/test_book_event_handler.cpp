#include <gtest/gtest.h>
#include "capture/book_event_handler.hpp"
#include <filesystem>
#include <fstream>

using namespace polycap;
using json = nlohmann::json;

class BookEventHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = "/tmp/polycap_book_event_handler_test";
        std::filesystem::remove_all(dir_);
        recorder_ = std::make_unique<BookRecorder>(dir_, 1);
        book_ = std::make_shared<OrderBook>("yes-tok", 5);
        handler_ = std::make_unique<BookEventHandler>("m1", "yes-tok", book_, *recorder_);
    }

    void TearDown() override {
        handler_.reset();
        recorder_.reset();
        std::filesystem::remove_all(dir_);
    }

    static json book_event(const std::string& asset, json bids, json asks,
                           json ts = "1700000000000") {
        return json{
            {"event_type", "book"},
            {"asset_id", asset},
            {"market", "0xcond"},
            {"timestamp", ts},
            {"bids", bids},
            {"asks", asks}
        };
    }

    size_t csv_rows() {
        recorder_->close("m1");
        std::ifstream in(recorder_->path_for("m1"));
        size_t n = 0;
        std::string line;
        while (std::getline(in, line)) n++;
        return n == 0 ? 0 : n - 1;
    }

    std::string dir_;
    std::unique_ptr<BookRecorder> recorder_;
    std::shared_ptr<OrderBook> book_;
    std::unique_ptr<BookEventHandler> handler_;
};

TEST_F(BookEventHandlerTest, Book_ReplacesSnapshotAndRecords) {
    handler_->handle(book_event("yes-tok",
        json::array({{{"price", "0.48"}, {"size", "120"}}, {{"price", "0.47"}, {"size", "50"}}}),
        json::array({{{"price", "0.52"}, {"size", "90"}}})));

    ASSERT_TRUE(book_->best_bid().has_value());
    EXPECT_DOUBLE_EQ(book_->best_bid()->price, 0.48);
    EXPECT_DOUBLE_EQ(book_->best_ask()->price, 0.52);
    EXPECT_EQ(handler_->events_applied(), 1);
    EXPECT_EQ(recorder_->stats().valid_updates, 1);
    EXPECT_EQ(csv_rows(), 1u);
}

TEST_F(BookEventHandlerTest, Book_OtherTokenIgnored) {
    handler_->handle(book_event("no-tok", json::array({{{"price", 0.4}, {"size", 1}}}), json::array()));

    EXPECT_EQ(book_->update_count(), 0);
    EXPECT_EQ(recorder_->stats().total_updates, 0);
}

TEST_F(BookEventHandlerTest, Book_InvalidLevelRejectedWithoutTouchingBook) {
    handler_->handle(book_event("yes-tok", json::array({{{"price", "1.20"}, {"size", "5"}}}), json::array()));

    EXPECT_EQ(book_->update_count(), 0);
    auto stats = recorder_->stats();
    EXPECT_EQ(stats.invalid_updates, 1);
    ASSERT_EQ(stats.recent_errors.size(), 1u);
    EXPECT_NE(stats.recent_errors[0].find("bid price"), std::string::npos);
}

TEST_F(BookEventHandlerTest, Book_MalformedLevelsRejected) {
    handler_->handle(book_event("yes-tok", json::array({{{"price", "abc"}, {"size", "5"}}}), json::array()));
    handler_->handle(book_event("yes-tok", json{{"price", 0.5}}, json::array()));

    EXPECT_EQ(recorder_->stats().invalid_updates, 2);
    EXPECT_EQ(book_->update_count(), 0);
}

TEST_F(BookEventHandlerTest, Book_MissingTimestampRejected) {
    json event = book_event("yes-tok", json::array(), json::array());
    event.erase("timestamp");
    handler_->handle(event);

    auto stats = recorder_->stats();
    EXPECT_EQ(stats.invalid_updates, 1);
    EXPECT_EQ(stats.recent_errors[0], "Missing market_id or timestamp");
}

TEST_F(BookEventHandlerTest, Book_NonFiniteNumbersRejected) {
    handler_->handle(book_event("yes-tok",
        json::array({{{"price", "0.4"}, {"size", "inf"}}}),
        json::array({{{"price", "0.6"}, {"size", "10"}}})));
    handler_->handle(book_event("yes-tok",
        json::array({{{"price", "nan"}, {"size", "5"}}}), json::array()));
    handler_->handle(book_event("yes-tok", json::array(), json::array(), "1e300"));
    handler_->handle(book_event("yes-tok", json::array(), json::array(), 1e300));
    handler_->handle(book_event("yes-tok", json::array(), json::array(), "nan"));

    EXPECT_EQ(book_->update_count(), 0);
    EXPECT_EQ(handler_->events_applied(), 0);
    EXPECT_EQ(recorder_->stats().valid_updates, 0);
    EXPECT_EQ(recorder_->stats().invalid_updates, 5);
    EXPECT_EQ(csv_rows(), 0u);
}

TEST_F(BookEventHandlerTest, PriceChange_AppliesDeltasForOwnToken) {
    handler_->handle(book_event("yes-tok",
        json::array({{{"price", "0.48"}, {"size", "120"}}}),
        json::array({{{"price", "0.52"}, {"size", "90"}}})));

    json change = {
        {"event_type", "price_change"},
        {"timestamp", "1700000001000"},
        {"price_changes", json::array({
            {{"asset_id", "yes-tok"}, {"price", "0.49"}, {"size", "30"}, {"side", "BUY"}},
            {{"asset_id", "yes-tok"}, {"price", "0.52"}, {"size", "0"}, {"side", "SELL"}},
            {{"asset_id", "yes-tok"}, {"price", "0.53"}, {"size", "10"}, {"side", "SELL"}},
            {{"asset_id", "no-tok"}, {"price", "0.10"}, {"size", "10"}, {"side", "BUY"}}
        })}
    };
    handler_->handle(change);

    EXPECT_DOUBLE_EQ(book_->best_bid()->price, 0.49);
    EXPECT_DOUBLE_EQ(book_->best_ask()->price, 0.53);
    EXPECT_EQ(book_->snapshot().bids.size(), 2u);
    EXPECT_EQ(handler_->events_applied(), 2);
    EXPECT_EQ(csv_rows(), 2u);
}

TEST_F(BookEventHandlerTest, PriceChange_LegacyChangesShape) {
    json change = {
        {"event_type", "price_change"},
        {"asset_id", "yes-tok"},
        {"timestamp", 1700000001000},
        {"changes", json::array({{{"price", "0.40"}, {"size", "10"}, {"side", "BUY"}}})}
    };
    handler_->handle(change);
    EXPECT_DOUBLE_EQ(book_->best_bid()->price, 0.40);

    change["asset_id"] = "no-tok";
    change["changes"][0]["price"] = "0.41";
    handler_->handle(change);
    EXPECT_DOUBLE_EQ(book_->best_bid()->price, 0.40);
}

TEST_F(BookEventHandlerTest, PriceChange_InvalidDeltaRejectsWholeEvent) {
    json change = {
        {"event_type", "price_change"},
        {"timestamp", "1700000001000"},
        {"price_changes", json::array({
            {{"asset_id", "yes-tok"}, {"price", "0.40"}, {"size", "10"}, {"side", "BUY"}},
            {{"asset_id", "yes-tok"}, {"price", "0.40"}, {"size", "10"}, {"side", "HOLD"}}
        })}
    };
    handler_->handle(change);

    EXPECT_EQ(book_->update_count(), 0);
    EXPECT_EQ(recorder_->stats().invalid_updates, 1);
}

TEST_F(BookEventHandlerTest, OtherEventTypesIgnored) {
    handler_->handle(json{{"event_type", "last_trade_price"}, {"price", "0.5"}});
    handler_->handle(json{{"event_type", "tick_size_change"}});
    handler_->handle(json::array());

    EXPECT_EQ(recorder_->stats().total_updates, 0);
    EXPECT_EQ(handler_->events_applied(), 0);
}

TEST_F(BookEventHandlerTest, EventType_FallsBackToType) {
    EXPECT_EQ(BookEventHandler::event_type(json{{"type", "book"}}), "book");
    EXPECT_EQ(BookEventHandler::event_type(json{{"event_type", "price_change"}, {"type", "x"}}), "price_change");
    EXPECT_EQ(BookEventHandler::event_type(json::object()), "");
}
