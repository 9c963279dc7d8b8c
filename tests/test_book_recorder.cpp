#include <gtest/gtest.h>
#include "persistence/book_recorder.hpp"
#include <filesystem>
#include <fstream>

using namespace polycap;

class BookRecorderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = "/tmp/polycap_book_recorder_test";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    static std::vector<std::string> read_lines(const std::string& path) {
        std::vector<std::string> lines;
        std::ifstream in(path);
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
        return lines;
    }

    static BookSnapshot two_sided() {
        BookSnapshot snap;
        snap.bids = {{0.45, 100.0}, {0.44, 50.0}};
        snap.asks = {{0.55, 80.0}};
        return snap;
    }

    std::string dir_;
};

TEST_F(BookRecorderTest, Validate_AcceptsWellFormedUpdate) {
    auto err = BookRecorder::validate_update("m1", 1700000000000, {{0.45, 10.0}}, {{0.55, 5.0}});
    EXPECT_FALSE(err.has_value());

    EXPECT_FALSE(BookRecorder::validate_update("m1", 1, {}, {}).has_value());
}

TEST_F(BookRecorderTest, Validate_RejectsMissingIdentity) {
    auto err = BookRecorder::validate_update("", 1700000000000, {}, {});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "Missing market_id or timestamp");

    EXPECT_TRUE(BookRecorder::validate_update("m1", 0, {}, {}).has_value());
}

TEST_F(BookRecorderTest, Validate_RejectsOutOfRangeLevels) {
    EXPECT_TRUE(BookRecorder::validate_update("m1", 1, {{1.0, 10.0}}, {}).has_value());
    EXPECT_TRUE(BookRecorder::validate_update("m1", 1, {{0.0, 10.0}}, {}).has_value());
    EXPECT_TRUE(BookRecorder::validate_update("m1", 1, {}, {{0.5, 0.0}}).has_value());
    EXPECT_TRUE(BookRecorder::validate_update("m1", 1, {}, {{0.5, -3.0}}).has_value());
}

TEST_F(BookRecorderTest, BuildRow_TwoSidedBook) {
    auto row = BookRecorder::build_row("m1", 1700000000000, two_sided());
    EXPECT_DOUBLE_EQ(row.bid_price_1, 0.45);
    EXPECT_DOUBLE_EQ(row.bid_size_1, 100.0);
    EXPECT_DOUBLE_EQ(row.ask_price_1, 0.55);
    EXPECT_DOUBLE_EQ(row.ask_size_1, 80.0);
    EXPECT_NEAR(row.spread, 0.10, 1e-12);
    EXPECT_NEAR(row.mid_price, 0.50, 1e-12);
    EXPECT_EQ(row.timestamp_iso.substr(0, 19), "2023-11-14T22:13:20");
}

TEST_F(BookRecorderTest, BuildRow_EmptySideUsesPlaceholders) {
    BookSnapshot snap;
    snap.bids = {{0.30, 10.0}};

    auto row = BookRecorder::build_row("m1", 1, snap);
    EXPECT_DOUBLE_EQ(row.bid_price_1, 0.30);
    EXPECT_DOUBLE_EQ(row.ask_price_1, 0.5);
    EXPECT_DOUBLE_EQ(row.ask_size_1, 0.0);
    EXPECT_DOUBLE_EQ(row.spread, 0.0);
    EXPECT_DOUBLE_EQ(row.mid_price, 0.5);
}

TEST_F(BookRecorderTest, Record_WritesHeaderOnceAcrossReopen) {
    {
        BookRecorder recorder(dir_);
        recorder.record(BookRecorder::build_row("m1", 1000, two_sided()));
        recorder.record(BookRecorder::build_row("m1", 2000, two_sided()));
    }
    {
        BookRecorder recorder(dir_);
        recorder.record(BookRecorder::build_row("m1", 3000, two_sided()));
    }

    auto lines = read_lines(dir_ + "/m1.csv");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], BookRecorder::CSV_HEADER);
    EXPECT_EQ(lines[1].substr(0, 5), "1000,");
    EXPECT_EQ(lines[3].substr(0, 5), "3000,");
    EXPECT_NE(lines[1].find(",0.45,100,0.55,80,"), std::string::npos);
    EXPECT_EQ(lines[1].substr(lines[1].size() - 3), ",m1");
}

TEST_F(BookRecorderTest, Record_OneFilePerMarket) {
    BookRecorder recorder(dir_);
    recorder.record(BookRecorder::build_row("m1", 1000, two_sided()));
    recorder.record(BookRecorder::build_row("m2", 1000, two_sided()));
    recorder.close_all();

    EXPECT_TRUE(std::filesystem::exists(recorder.path_for("m1")));
    EXPECT_TRUE(std::filesystem::exists(recorder.path_for("m2")));
    EXPECT_EQ(recorder.stats().markets_tracked, 2u);
}

TEST_F(BookRecorderTest, Close_FlushesPendingRows) {
    BookRecorder recorder(dir_, 1000);
    recorder.record(BookRecorder::build_row("m1", 1000, two_sided()));
    recorder.close("m1");

    EXPECT_EQ(read_lines(recorder.path_for("m1")).size(), 2u);

    // Reopens lazily after close
    recorder.record(BookRecorder::build_row("m1", 2000, two_sided()));
    recorder.close("m1");
    EXPECT_EQ(read_lines(recorder.path_for("m1")).size(), 3u);
}

TEST_F(BookRecorderTest, Stats_KeepLastTenErrors) {
    BookRecorder recorder(dir_);
    for (int i = 0; i < 15; i++) {
        recorder.reject("error " + std::to_string(i));
    }
    recorder.record(BookRecorder::build_row("m1", 1000, two_sided()));

    auto stats = recorder.stats();
    EXPECT_EQ(stats.total_updates, 16);
    EXPECT_EQ(stats.valid_updates, 1);
    EXPECT_EQ(stats.invalid_updates, 15);
    ASSERT_EQ(stats.recent_errors.size(), BookRecorder::MAX_RECENT_ERRORS);
    EXPECT_EQ(stats.recent_errors.front(), "error 5");
    EXPECT_EQ(stats.recent_errors.back(), "error 14");
}

TEST_F(BookRecorderTest, Record_UnwritableDirectoryThrows) {
    std::filesystem::create_directories(dir_);
    std::ofstream(dir_ + "/blocker") << "x";

    BookRecorder recorder(dir_ + "/blocker/books");
    EXPECT_ANY_THROW(recorder.record(BookRecorder::build_row("m1", 1000, two_sided())));
}
