#include <gtest/gtest.h>

#include "csv_bar_loader.hpp"
#include "database_manager.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <fstream>
#include <string>

using namespace data;

namespace {

    std::string writeTempFile(const std::string& name, const std::string& content) {
        const std::string path = ::testing::TempDir() + name;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

} // anonymous namespace

// --- CSV ---

TEST(CsvBarLoaderTest, LoadsFileWithHeader) {
    const auto path = writeTempFile("bars_header.csv",
        "Date,Open,High,Low,Close,Volume\n"
        "2020-01-02,300.35,305.13,299.00,303.00,33911900\n"
        "2020-01-03, 297.15 ,300.58,296.30,297.43,36028600\n"
        "\n"
        "2020-01-06,293.79,299.96,292.75,299.80,29644600\n");

    const auto candles = CsvBarLoader(path).load();
    ASSERT_EQ(candles.size(), 3u);
    EXPECT_EQ(candles[0].timestamp, core::utils::makeDate(2020, 1, 2));
    EXPECT_DOUBLE_EQ(candles[0].open, 300.35);
    EXPECT_DOUBLE_EQ(candles[1].open, 297.15);
    EXPECT_DOUBLE_EQ(candles[2].close, 299.80);
    EXPECT_EQ(candles[2].volume, 29644600);
}

TEST(CsvBarLoaderTest, HeaderIsOptionalAndMalformedLinesAreSkipped) {
    const auto path = writeTempFile("bars_no_header.csv",
        "2020-01-02,10,11,9,10.5,1000\n"
        "2020-01-03,10,11,9,not_a_number,1000\n"
        "2020-01-06,10,11\n"
        "2020-01-07,10,11,9,10.8,1200,extra\n");

    const auto candles = CsvBarLoader(path).load();
    ASSERT_EQ(candles.size(), 2u);
    EXPECT_DOUBLE_EQ(candles[1].close, 10.8);
}

TEST(CsvBarLoaderTest, RejectsUnorderedTimestamps) {
    const auto path = writeTempFile("bars_unordered.csv",
        "2020-01-03,10,11,9,10.5,1000\n"
        "2020-01-02,10,11,9,10.5,1000\n");
    EXPECT_THROW(CsvBarLoader(path).load(), core::DataLoadException);
}

TEST(CsvBarLoaderTest, MissingFileIsDataLoadError) {
    EXPECT_THROW(CsvBarLoader(::testing::TempDir() + "does_not_exist.csv").load(), core::DataLoadException);
}

TEST(CsvBarLoaderTest, ParseLineRejectsInconsistentBars) {
    EXPECT_TRUE(CsvBarLoader::parseLine("2021-06-01,5,6,4,5.5,10").has_value());
    EXPECT_FALSE(CsvBarLoader::parseLine("2021-06-01,5,4,6,5.5,10").has_value());
    EXPECT_FALSE(CsvBarLoader::parseLine("Date,Open,High,Low,Close,Volume").has_value());
}

// --- SQLite ---

TEST(DatabaseManagerTest, CandlesRoundTripThroughMemoryDatabase) {
    DatabaseManager db(":memory:");
    ASSERT_TRUE(db.connect());
    ASSERT_TRUE(db.initializeSchema());

    const auto candles = testing_helpers::wavyCandles(10);
    ASSERT_TRUE(db.saveCandles(candles, "TEST|ABC", "day"));
    // Duplicates are ignored
    ASSERT_TRUE(db.saveCandles(candles, "TEST|ABC", "day"));

    const auto loaded = db.queryCandles("TEST|ABC", "day", candles[2].timestamp, candles[6].timestamp);
    ASSERT_EQ(loaded.size(), 5u);
    EXPECT_EQ(loaded[0].timestamp, candles[2].timestamp);
    EXPECT_DOUBLE_EQ(loaded[0].close, candles[2].close);
    EXPECT_EQ(loaded[4].volume, candles[6].volume);

    EXPECT_TRUE(db.queryCandles("OTHER", "day", candles[0].timestamp, candles[9].timestamp).empty());
}

TEST(DatabaseManagerTest, EvaluationsAreStoredBestFirst) {
    DatabaseManager db(":memory:");
    ASSERT_TRUE(db.connect());
    ASSERT_TRUE(db.initializeSchema());

    EvaluationRecord weak;
    weak.strategy_name = "weak";
    weak.instrument_key = "TEST|ABC";
    weak.evaluated_at = core::utils::makeDate(2024, 5, 1);
    weak.total_score = 3.5;
    weak.letter_grade = "D";
    weak.report_json = "{}";

    EvaluationRecord strong = weak;
    strong.strategy_name = "strong";
    strong.total_score = 7.25;
    strong.letter_grade = "B+";
    strong.total_trades = 12;

    ASSERT_TRUE(db.saveEvaluation(weak));
    ASSERT_TRUE(db.saveEvaluation(strong));

    const auto records = db.queryEvaluations("TEST|ABC");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].strategy_name, "strong");
    EXPECT_DOUBLE_EQ(records[0].total_score, 7.25);
    EXPECT_EQ(records[0].total_trades, 12);
    EXPECT_EQ(records[0].evaluated_at, weak.evaluated_at);
    EXPECT_EQ(records[1].letter_grade, "D");
}

TEST(DatabaseManagerTest, OperationsFailWhenDisconnected) {
    DatabaseManager db(":memory:");
    EXPECT_FALSE(db.isConnected());
    EXPECT_FALSE(db.executeSQL("SELECT 1;"));
    EXPECT_FALSE(db.saveEvaluation(EvaluationRecord()));
    EXPECT_TRUE(db.queryEvaluations("any").empty());
}
