// =============================================================================
// database_manager_test.cpp
// =============================================================================
// Integration tests for data::DatabaseManager on an in-memory SQLite database.
//
// Validates:
//   - Schema creation and connection state
//   - Bars survive a save / query cycle with their named fields
//   - Non-finite fields are stored as null and read back as absent
//   - loadSeriesStore fills every timeframe
//   - Backtest runs persist their trades and equity in order
// =============================================================================

#include "database_manager.hpp"
#include "exceptions.hpp"
#include "test_fixtures.hpp"

#include <gtest/gtest.h>

#include <limits>

using cascade_test::day;
using cascade_test::flatBar;
using cascade_test::makeBar;
using data::DatabaseManager;
using data::Timeframe;

class DatabaseManagerTest : public ::testing::Test {
protected:
    DatabaseManagerTest() : db(":memory:") {}

    void SetUp() override {
        ASSERT_TRUE(db.connect());
        ASSERT_TRUE(db.initializeSchema());
    }

    DatabaseManager db;
};

// -----------------------------------------------------------------------------
// 1. Connection state.
// -----------------------------------------------------------------------------
TEST(DatabaseManagerStateTest, NothingWorksBeforeConnect) {
    DatabaseManager db(":memory:");
    EXPECT_FALSE(db.isConnected());
    EXPECT_FALSE(db.executeSQL("SELECT 1;"));
    EXPECT_FALSE(db.saveBars("AAA", Timeframe::Daily, {flatBar(day(0), 1.0)}));
    EXPECT_THROW(db.loadSeriesStore(), core::DataLoadException);
}

TEST_F(DatabaseManagerTest, ConnectTwiceIsHarmless) {
    EXPECT_TRUE(db.connect());
    EXPECT_TRUE(db.isConnected());
    db.disconnect();
    EXPECT_FALSE(db.isConnected());
}

TEST_F(DatabaseManagerTest, BadSqlReturnsFalse) {
    EXPECT_FALSE(db.executeSQL("SELEKT nothing;"));
}

// -----------------------------------------------------------------------------
// 2. Bars and fields.
// -----------------------------------------------------------------------------
TEST_F(DatabaseManagerTest, BarsRoundTripWithFields) {
    core::TimeSeries<core::SeriesBar> bars = {
        makeBar(day(0), 10.0, 11.0, 9.0, 10.5, {{"SMA20", 10.2}}),
        makeBar(day(1), 10.5, 12.0, 10.0, 11.5, {{"SMA20", 10.4}, {"RS_4W", 91.0}})
    };
    ASSERT_TRUE(db.saveBars("AAA", Timeframe::Daily, bars));

    auto loaded = db.queryBars("AAA", Timeframe::Daily, day(0), day(5));
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[1].timestamp, day(1));
    EXPECT_DOUBLE_EQ(loaded[1].high, 12.0);
    EXPECT_EQ(loaded[1].volume, 1000);
    EXPECT_DOUBLE_EQ(*loaded[1].field("RS_4W"), 91.0);

    // Other timeframes and date ranges stay separate
    EXPECT_TRUE(db.queryBars("AAA", Timeframe::Weekly, day(0), day(5)).empty());
    EXPECT_EQ(db.queryBars("AAA", Timeframe::Daily, day(1), day(5)).size(), 1u);
}

TEST_F(DatabaseManagerTest, NonFiniteFieldReadsBackAbsent) {
    auto bar = flatBar(day(0), 5.0, {{"SMA200", std::numeric_limits<double>::quiet_NaN()}, {"SMA20", 5.0}});
    ASSERT_TRUE(db.saveBars("AAA", Timeframe::Daily, {bar}));
    auto loaded = db.queryBars("AAA", Timeframe::Daily, day(0), day(0));
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].fields.count("SMA200"), 0u);
    EXPECT_TRUE(loaded[0].field("SMA20").has_value());
}

TEST_F(DatabaseManagerTest, SavingSameKeyReplacesRow) {
    ASSERT_TRUE(db.saveBars("AAA", Timeframe::Daily, {flatBar(day(0), 5.0)}));
    ASSERT_TRUE(db.saveBars("AAA", Timeframe::Daily, {flatBar(day(0), 6.0)}));
    auto loaded = db.queryBars("AAA", Timeframe::Daily, day(0), day(0));
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_DOUBLE_EQ(loaded[0].close, 6.0);
}

TEST_F(DatabaseManagerTest, LoadSeriesStoreFillsAllTimeframes) {
    ASSERT_TRUE(db.saveBars("BBB", Timeframe::Daily, {flatBar(day(0), 1.0), flatBar(day(1), 1.0)}));
    ASSERT_TRUE(db.saveBars("BBB", Timeframe::Earnings, {flatBar(day(0), 0.0, {{"rev_yoy", 0.3}})}));
    ASSERT_TRUE(db.saveBars("AAA", Timeframe::Weekly, {flatBar(day(0), 1.0)}));

    EXPECT_EQ(db.listSymbols(), (std::vector<std::string>{"AAA", "BBB"}));

    auto store = db.loadSeriesStore();
    EXPECT_EQ(store.size(), 2u);
    const auto* bbb = store.find("BBB");
    ASSERT_NE(bbb, nullptr);
    EXPECT_EQ(bbb->series(Timeframe::Daily).size(), 2u);
    EXPECT_EQ(bbb->series(Timeframe::Earnings).size(), 1u);
    EXPECT_TRUE(bbb->series(Timeframe::Weekly).empty());

    auto only_a = db.loadSeriesStore({"AAA"});
    EXPECT_EQ(only_a.size(), 1u);
}

// -----------------------------------------------------------------------------
// 3. Backtest runs.
// -----------------------------------------------------------------------------
TEST_F(DatabaseManagerTest, BacktestRunPersistsTradesAndEquity) {
    data::RunRecord record;
    record.profile_name = "test";
    record.mode = "retrospective";
    record.status = "completed";
    record.profile_json = "{}";

    core::Trade entry;
    entry.sequence = 1;
    entry.position_id = 1;
    entry.ticker = "AAA";
    entry.type = core::TradeType::Entry;
    entry.quantity = 10;
    entry.price = 100.0;
    entry.timestamp = day(1);
    entry.reason = core::ReasonCode::Breakout;

    core::Trade exit = entry;
    exit.sequence = 2;
    exit.type = core::TradeType::StopOut;
    exit.price = 97.0;
    exit.timestamp = day(3);
    exit.reason = core::ReasonCode::StopLoss;
    exit.realized_pnl = -30.0;
    record.trades = {entry, exit};

    core::EquityPoint p0{day(0), 1000.0, 1000.0, 0.0, 0};
    core::EquityPoint p1{day(1), 1000.0, 0.0, 1000.0, 1};
    record.equity_history = {p0, p1};

    auto run_id = db.saveBacktestRun(record);
    ASSERT_TRUE(run_id.has_value());

    auto trades = db.queryTrades(*run_id);
    ASSERT_EQ(trades.size(), 2u);
    EXPECT_EQ(trades[0].type, core::TradeType::Entry);
    EXPECT_EQ(trades[1].type, core::TradeType::StopOut);
    EXPECT_EQ(trades[1].reason, core::ReasonCode::StopLoss);
    EXPECT_DOUBLE_EQ(trades[1].realized_pnl, -30.0);
    EXPECT_EQ(trades[1].timestamp, day(3));

    auto equity = db.queryEquity(*run_id);
    ASSERT_EQ(equity.size(), 2u);
    EXPECT_EQ(equity[1].open_positions, 1u);
    EXPECT_DOUBLE_EQ(equity[1].positions_value, 1000.0);

    EXPECT_TRUE(db.queryTrades(*run_id + 1).empty());
}

TEST_F(DatabaseManagerTest, DuplicateTradeSequenceRollsBackWholeRun) {
    data::RunRecord record;
    record.profile_name = "broken";
    record.mode = "retrospective";
    record.status = "completed";
    core::Trade trade;
    trade.sequence = 1;
    trade.ticker = "AAA";
    trade.timestamp = day(0);
    record.trades = {trade, trade};

    EXPECT_FALSE(db.saveBacktestRun(record).has_value());
    // Nothing from the failed run is visible
    EXPECT_TRUE(db.queryTrades(1).empty());
}
