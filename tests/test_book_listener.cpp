#include <gtest/gtest.h>
#include "market_data/book_listener.hpp"
#include "fake_transport.hpp"
#include <algorithm>

using namespace polycap;
using polycap::testing::ScriptedTransport;
using polycap::testing::TransportScript;
using polycap::testing::wait_until;
using json = nlohmann::json;

class BookListenerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.recv_timeout_ms = 2000;
        config_.ping_interval_ms = 20;
        script_ = std::make_shared<TransportScript>();
    }

    TransportFactory factory() {
        auto script = script_;
        return [script](const std::string&) -> std::unique_ptr<WsTransport> {
            return std::make_unique<ScriptedTransport>(script);
        };
    }

    BookListener::EventHandler collector() {
        return [this](const json& event) {
            std::lock_guard<std::mutex> lock(events_mutex_);
            events_.push_back(event);
        };
    }

    size_t event_count() {
        std::lock_guard<std::mutex> lock(events_mutex_);
        return events_.size();
    }

    ConnectionConfig config_;
    std::shared_ptr<TransportScript> script_;
    std::mutex events_mutex_;
    std::vector<json> events_;
};

TEST_F(BookListenerTest, NormalizeEvents_ObjectBecomesSingleton) {
    auto events = BookListener::normalize_events(R"({"event_type":"book"})");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["event_type"], "book");
}

TEST_F(BookListenerTest, NormalizeEvents_ArrayKeepsObjectsOnly) {
    auto events = BookListener::normalize_events(R"([{"a":1}, 5, "x", {"b":2}, null])");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0]["a"], 1);
    EXPECT_EQ(events[1]["b"], 2);
}

TEST_F(BookListenerTest, NormalizeEvents_NonJsonIsEmpty) {
    EXPECT_TRUE(BookListener::normalize_events("PONG").empty());
    EXPECT_TRUE(BookListener::normalize_events("").empty());
    EXPECT_TRUE(BookListener::normalize_events("42").empty());
}

TEST_F(BookListenerTest, SubscribeMessage_MarketChannel) {
    auto msg = json::parse(BookListener::subscribe_message("tok-1"));
    EXPECT_EQ(msg["type"], "market");
    ASSERT_TRUE(msg["assets_ids"].is_array());
    EXPECT_EQ(msg["assets_ids"][0], "tok-1");
}

TEST_F(BookListenerTest, Run_DispatchesEventsUntilClosed) {
    script_->push_message(R"({"event_type":"book","asset_id":"tok-1"})");
    script_->push_message("PONG");
    script_->push_message(R"([{"event_type":"price_change"},{"event_type":"last_trade_price"}])");
    script_->push_status(WsTransport::RecvStatus::CLOSED);

    BookListener listener("m-1", "tok-1", config_, factory(), collector());
    listener.start();

    ASSERT_TRUE(wait_until([&] { return listener.finished(); }));
    listener.stop();

    EXPECT_EQ(listener.status(), ConnectionStatus::CLOSED);
    EXPECT_EQ(listener.messages_received(), 3);
    EXPECT_EQ(listener.events_dispatched(), 3);
    ASSERT_EQ(event_count(), 3u);
    EXPECT_EQ(events_[1]["event_type"], "price_change");
    EXPECT_EQ(script_->close_count(), 1);

    auto sent = script_->sent_copy();
    ASSERT_FALSE(sent.empty());
    EXPECT_EQ(sent[0], BookListener::subscribe_message("tok-1"));
}

TEST_F(BookListenerTest, Run_SendsKeepAlivePings) {
    BookListener listener("m-1", "tok-1", config_, factory(), collector());
    listener.start();

    ASSERT_TRUE(wait_until([&] { return listener.pings_sent() >= 3; }));
    listener.stop();

    auto sent = script_->sent_copy();
    size_t pings = std::count(sent.begin(), sent.end(), std::string("PING"));
    EXPECT_GE(pings, 3u);
    EXPECT_TRUE(listener.finished());
    EXPECT_TRUE(listener.cancelled());
}

TEST_F(BookListenerTest, Run_HandlerErrorDoesNotStopStream) {
    script_->push_message(R"({"n":1})");
    script_->push_message(R"({"n":2})");
    script_->push_status(WsTransport::RecvStatus::CLOSED);

    int calls = 0;
    BookListener listener("m-1", "tok-1", config_, factory(), [&](const json& e) {
        calls++;
        if (e["n"] == 1) throw std::runtime_error("bad event");
    });
    listener.start();
    ASSERT_TRUE(wait_until([&] { return listener.finished(); }));
    listener.stop();

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(listener.events_dispatched(), 1);
}

TEST_F(BookListenerTest, Run_ConnectFailureEndsWithError) {
    script_->fail_open = true;

    BookListener listener("m-1", "tok-1", config_, factory(), collector());
    listener.start();
    ASSERT_TRUE(wait_until([&] { return listener.finished(); }));
    listener.stop();

    EXPECT_EQ(listener.status(), ConnectionStatus::ERROR);
    EXPECT_EQ(event_count(), 0u);
}

TEST_F(BookListenerTest, Run_SilenceEndsListener) {
    config_.recv_timeout_ms = 30;
    config_.ping_interval_ms = 10000;

    BookListener listener("m-1", "tok-1", config_, factory(), collector());
    listener.start();
    ASSERT_TRUE(wait_until([&] { return listener.finished(); }));
    EXPECT_EQ(listener.status(), ConnectionStatus::CLOSED);
}

TEST_F(BookListenerTest, Stop_CancelsActiveStream) {
    BookListener listener("m-1", "tok-1", config_, factory(), collector());
    listener.start();
    ASSERT_TRUE(wait_until([&] { return listener.status() == ConnectionStatus::CONNECTED; }));

    listener.stop();
    EXPECT_TRUE(listener.finished());
    EXPECT_EQ(script_->close_count(), 1);
}
