// =============================================================================
// backtester_test.cpp
// =============================================================================
// End-to-end tests for backtester::Backtester over small hand-built series.
//
// Validates:
//   - A flat market produces no trades and a flat equity curve
//   - Breakout entry on the bar after the decision bar, then a stop-out
//   - Re-entry suppressed in the step that stopped the position out
//   - Capacity limit keeps the higher-scoring candidate
//   - Bars after a step never change that step's decisions
//   - Trade log ordering and one terminal trade per position
//   - Cancellation, end-of-run liquidation, forward-mode signals
//   - Parallel and sequential runs agree; runs persist to SQLite
// =============================================================================

#include "backtester.hpp"
#include "database_manager.hpp"
#include "exceptions.hpp"
#include "test_fixtures.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>

using backtester::Backtester;
using backtester::RunStatus;
using cascade_test::breakoutProfile;
using cascade_test::countTrades;
using cascade_test::day;
using cascade_test::findTrade;
using cascade_test::flatBar;
using cascade_test::makeBar;
using cascade_test::trendFields;
using core::ReasonCode;
using core::TradeType;

namespace {

    // Flat at 100 for four days, a breakout decision bar on day 4, entry on
    // day 5, drift, and a gap through the 97 stop on day 9.
    core::TimeSeries<core::SeriesBar> breakoutThenStop(double rs = 95.0, double day8_high = 105.5) {
        auto fields = trendFields(rs);
        core::TimeSeries<core::SeriesBar> bars;
        for (int i = 0; i < 4; ++i) {
            bars.push_back(flatBar(day(i), 100.0, fields));
        }
        bars.push_back(makeBar(day(4), 100.0, 105.0, 99.0, 104.0, fields));
        bars.push_back(makeBar(day(5), 104.0, 106.0, 103.0, 105.0, fields));
        bars.push_back(makeBar(day(6), 104.0, 105.5, 103.0, 105.0, fields));
        bars.push_back(makeBar(day(7), 104.0, 105.5, 103.0, 105.0, fields));
        bars.push_back(makeBar(day(8), 104.0, day8_high, 103.0, 105.0, fields));
        bars.push_back(makeBar(day(9), 99.0, 99.0, 95.0, 96.0, fields));
        return bars;
    }

    data::SeriesStore storeWith(const std::map<std::string, core::TimeSeries<core::SeriesBar>>& series) {
        data::SeriesStore store;
        for (const auto& [symbol, bars] : series) {
            store.upsert(symbol).setSeries(data::Timeframe::Daily, bars);
        }
        return store;
    }

    core::TimeSeries<core::SeriesBar> truncate(core::TimeSeries<core::SeriesBar> bars, core::Timestamp last) {
        bars.erase(std::remove_if(bars.begin(), bars.end(),
                                  [last](const core::SeriesBar& bar) { return bar.timestamp > last; }),
                   bars.end());
        return bars;
    }

    void expectWellFormedLog(const std::vector<core::Trade>& trades) {
        std::map<int, int> terminal_count;
        for (std::size_t i = 0; i < trades.size(); ++i) {
            EXPECT_EQ(trades[i].sequence, static_cast<long long>(i + 1));
            EXPECT_GE(trades[i].quantity, 0);
            if (i > 0) {
                EXPECT_LE(trades[i - 1].timestamp, trades[i].timestamp);
            }
            if (trades[i].isTerminal()) {
                ++terminal_count[trades[i].position_id];
            }
        }
        for (const auto& [id, count] : terminal_count) {
            EXPECT_EQ(count, 1) << "position " << id;
        }
    }

} // namespace

// -----------------------------------------------------------------------------
// 1. Flat market.
// -----------------------------------------------------------------------------
TEST(BacktesterTest, FlatMarketDoesNothing) {
    core::TimeSeries<core::SeriesBar> bars;
    for (int i = 0; i < 10; ++i) {
        bars.push_back(flatBar(day(i), 100.0, trendFields()));
    }
    auto store = storeWith({{"AAA", bars}});
    Backtester backtester(breakoutProfile(3));

    auto result = backtester.run(store, {"AAA"});
    EXPECT_EQ(result.status, RunStatus::Completed);
    EXPECT_EQ(result.steps_run, 10u);
    EXPECT_TRUE(result.trades.empty());
    ASSERT_EQ(result.equity_history.size(), 10u);
    for (const auto& point : result.equity_history) {
        EXPECT_DOUBLE_EQ(point.total_equity, 100000.0);
    }
    ASSERT_TRUE(result.summary.has_value());
    EXPECT_DOUBLE_EQ(result.summary->total_return, 0.0);
    EXPECT_EQ(result.candidates_generated, 0u);
}

// -----------------------------------------------------------------------------
// 2. Breakout entry and stop-out.
// -----------------------------------------------------------------------------
TEST(BacktesterTest, BreakoutEntryThenStopOut) {
    auto store = storeWith({{"AAA", breakoutThenStop()}});
    Backtester backtester(breakoutProfile(3));
    auto result = backtester.run(store, {"AAA"});

    const core::Trade* entry = findTrade(result.trades, TradeType::Entry);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->timestamp, day(5));
    EXPECT_DOUBLE_EQ(entry->price, 104.0);
    EXPECT_EQ(entry->quantity, 192);

    const core::Trade* stop = findTrade(result.trades, TradeType::StopOut);
    ASSERT_NE(stop, nullptr);
    EXPECT_EQ(stop->timestamp, day(9));
    EXPECT_DOUBLE_EQ(stop->price, 97.0);
    EXPECT_EQ(stop->reason, ReasonCode::StopLoss);
    EXPECT_DOUBLE_EQ(stop->realized_pnl, -1344.0);
    EXPECT_EQ(stop->position_id, entry->position_id);

    EXPECT_DOUBLE_EQ(result.equity_history.back().total_equity, 98656.0);
    EXPECT_EQ(backtester.portfolio().openPositionCount(), 0u);
    expectWellFormedLog(result.trades);

    ASSERT_TRUE(result.summary.has_value());
    EXPECT_EQ(result.summary->closed_positions, 1u);
    EXPECT_EQ(result.summary->losing_positions, 1u);
}

TEST(BacktesterTest, NoReentryInTheStepOfAStopOut) {
    // Day 8 clears the prior 3-day high, so day 9 carries a fresh candidate
    auto store = storeWith({{"AAA", breakoutThenStop(95.0, 107.0)}});
    Backtester backtester(breakoutProfile(3));
    auto result = backtester.run(store, {"AAA"});

    ASSERT_GE(result.trades.size(), 3u);
    const auto& last = result.trades.back();
    EXPECT_EQ(last.type, TradeType::Rejected);
    EXPECT_EQ(last.reason, ReasonCode::WhipsawGuard);
    EXPECT_EQ(last.timestamp, day(9));
    EXPECT_EQ(result.trades[result.trades.size() - 2].type, TradeType::StopOut);
    EXPECT_EQ(countTrades(result.trades, TradeType::Entry), 1u);
    EXPECT_FALSE(backtester.portfolio().hasPosition("AAA"));
}

TEST(BacktesterTest, CapacityKeepsHigherScore) {
    auto store = storeWith({{"AAA", breakoutThenStop(92.0)}, {"BBB", breakoutThenStop(99.0)}});
    auto profile = breakoutProfile(3);
    profile.execution.max_positions = 1;
    Backtester backtester(profile);
    auto result = backtester.run(store, {});

    const core::Trade* entry = findTrade(result.trades, TradeType::Entry);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->ticker, "BBB");
    const core::Trade* rejected = findTrade(result.trades, TradeType::Rejected, "AAA");
    ASSERT_NE(rejected, nullptr);
    EXPECT_EQ(rejected->reason, ReasonCode::CapacityLimit);
    EXPECT_EQ(rejected->timestamp, day(5));
    expectWellFormedLog(result.trades);
}

// -----------------------------------------------------------------------------
// 3. No look-ahead.
// -----------------------------------------------------------------------------
TEST(BacktesterTest, FutureBarsDoNotChangeEarlierSteps) {
    auto full = storeWith({{"AAA", breakoutThenStop(95.0, 107.0)}});
    auto cut = storeWith({{"AAA", truncate(breakoutThenStop(95.0, 107.0), day(7))}});

    Backtester a(breakoutProfile(3));
    Backtester b(breakoutProfile(3));
    auto full_result = a.run(full, {"AAA"});
    auto cut_result = b.run(cut, {"AAA"});

    ASSERT_EQ(cut_result.equity_history.size(), 8u);
    for (std::size_t i = 0; i < cut_result.equity_history.size(); ++i) {
        EXPECT_EQ(full_result.equity_history[i].timestamp, cut_result.equity_history[i].timestamp);
        EXPECT_DOUBLE_EQ(full_result.equity_history[i].total_equity, cut_result.equity_history[i].total_equity);
    }
    std::size_t compared = 0;
    for (const auto& trade : full_result.trades) {
        if (trade.timestamp > day(7)) {
            break;
        }
        ASSERT_LT(compared, cut_result.trades.size());
        EXPECT_EQ(trade.type, cut_result.trades[compared].type);
        EXPECT_EQ(trade.quantity, cut_result.trades[compared].quantity);
        EXPECT_DOUBLE_EQ(trade.price, cut_result.trades[compared].price);
        ++compared;
    }
    EXPECT_EQ(compared, cut_result.trades.size());
}

// -----------------------------------------------------------------------------
// 4. Run control.
// -----------------------------------------------------------------------------
TEST(BacktesterTest, CancelStopsBetweenSteps) {
    auto store = storeWith({{"AAA", breakoutThenStop()}});
    Backtester backtester(breakoutProfile(3));
    std::vector<std::size_t> seen;
    backtester.setStepObserver([&](std::size_t step, const core::EquityPoint&) {
        seen.push_back(step);
        if (step == 2) {
            backtester.requestCancel();
        }
    });

    auto result = backtester.run(store, {"AAA"});
    EXPECT_EQ(result.status, RunStatus::Cancelled);
    EXPECT_EQ(result.steps_run, 3u);
    EXPECT_EQ(seen, (std::vector<std::size_t>{0, 1, 2}));
    EXPECT_EQ(result.equity_history.size(), 3u);

    // A later run starts from scratch
    backtester.setStepObserver(nullptr);
    auto rerun = backtester.run(store, {"AAA"});
    EXPECT_EQ(rerun.status, RunStatus::Completed);
    EXPECT_EQ(rerun.steps_run, 10u);
}

TEST(BacktesterTest, DateRangeLimitsSteps) {
    auto store = storeWith({{"AAA", breakoutThenStop()}});
    Backtester backtester(breakoutProfile(3));
    auto result = backtester.run(store, {"AAA"}, day(2), day(6));
    EXPECT_EQ(result.steps_run, 5u);
    EXPECT_EQ(result.equity_history.front().timestamp, day(2));
    EXPECT_EQ(result.equity_history.back().timestamp, day(6));
    EXPECT_EQ(countTrades(result.trades, TradeType::Entry), 1u);

    auto empty = backtester.run(store, {"AAA"}, day(20), day(30));
    EXPECT_EQ(empty.steps_run, 0u);
    EXPECT_FALSE(empty.summary.has_value());
}

TEST(BacktesterTest, CloseAtEndLiquidatesAtMark) {
    auto store = storeWith({{"AAA", truncate(breakoutThenStop(), day(7))}});
    auto profile = breakoutProfile(3);
    profile.execution.close_positions_at_end = true;
    Backtester backtester(profile);
    auto result = backtester.run(store, {"AAA"});

    ASSERT_FALSE(result.trades.empty());
    const auto& last = result.trades.back();
    EXPECT_EQ(last.type, TradeType::Exit);
    EXPECT_EQ(last.reason, ReasonCode::EndOfRun);
    EXPECT_DOUBLE_EQ(last.price, 105.0);
    EXPECT_DOUBLE_EQ(last.realized_pnl, 192.0);
    EXPECT_EQ(result.equity_history.size(), 8u);
    EXPECT_EQ(result.equity_history.back().open_positions, 0u);
    EXPECT_DOUBLE_EQ(result.equity_history.back().cash, 100192.0);
    expectWellFormedLog(result.trades);
}

TEST(BacktesterTest, InvalidProfileRejectedUpFront) {
    auto profile = breakoutProfile(3);
    profile.execution.max_positions = 0;
    EXPECT_THROW(Backtester{profile}, core::ConfigException);
}

// -----------------------------------------------------------------------------
// 5. Forward signals and parallel runs.
// -----------------------------------------------------------------------------
TEST(BacktesterTest, ForwardModeFlagsPendingBreakouts) {
    core::TimeSeries<core::SeriesBar> bars;
    for (int i = 0; i < 3; ++i) {
        bars.push_back(flatBar(day(i), 110.0, trendFields()));
    }
    bars.push_back(flatBar(day(3), 100.0, trendFields()));
    bars.push_back(flatBar(day(4), 100.0, trendFields()));
    auto store = storeWith({{"AAA", bars}});

    auto profile = breakoutProfile(3);
    profile.mode = core::Mode::Forward;
    Backtester backtester(profile);
    auto signals = backtester.generateSignals(store, {}, day(4));
    ASSERT_EQ(signals.candidates.size(), 1u);
    EXPECT_DOUBLE_EQ(*signals.candidates[0].target_price, 110.0);
    EXPECT_EQ(signals.candidates[0].decision_time, day(4));
}

TEST(BacktesterTest, ParallelRunMatchesSequential) {
    auto store = storeWith({{"AAA", breakoutThenStop(92.0)},
                            {"BBB", breakoutThenStop(99.0, 107.0)},
                            {"CCC", breakoutThenStop(96.0)}});
    auto sequential_profile = breakoutProfile(3);
    auto parallel_profile = breakoutProfile(3);
    parallel_profile.worker_threads = 4;

    Backtester sequential(sequential_profile);
    Backtester parallel(parallel_profile);
    auto a = sequential.run(store, {});
    auto b = parallel.run(store, {});

    ASSERT_EQ(a.trades.size(), b.trades.size());
    for (std::size_t i = 0; i < a.trades.size(); ++i) {
        EXPECT_EQ(a.trades[i].sequence, b.trades[i].sequence);
        EXPECT_EQ(a.trades[i].ticker, b.trades[i].ticker);
        EXPECT_EQ(a.trades[i].type, b.trades[i].type);
        EXPECT_EQ(a.trades[i].quantity, b.trades[i].quantity);
    }
    EXPECT_DOUBLE_EQ(a.equity_history.back().total_equity, b.equity_history.back().total_equity);
}

// -----------------------------------------------------------------------------
// 6. Output.
// -----------------------------------------------------------------------------
TEST(BacktesterTest, ResultSerializesAndPersists) {
    auto store = storeWith({{"AAA", breakoutThenStop()}});
    auto profile = breakoutProfile(3);
    Backtester backtester(profile);
    auto result = backtester.run(store, {"AAA"});

    auto json = result.toJson();
    EXPECT_EQ(json["status"].get<std::string>(), "Completed");
    EXPECT_EQ(json["trades"].size(), result.trades.size());
    EXPECT_EQ(json["funnel"].size(), 5u);
    EXPECT_TRUE(json["summary"].is_object());

    data::DatabaseManager db(":memory:");
    ASSERT_TRUE(db.connect());
    ASSERT_TRUE(db.initializeSchema());
    auto run_id = db.saveBacktestRun(result.toRunRecord(profile));
    ASSERT_TRUE(run_id.has_value());
    auto trades = db.queryTrades(*run_id);
    ASSERT_EQ(trades.size(), result.trades.size());
    EXPECT_EQ(trades.back().type, TradeType::StopOut);
    EXPECT_EQ(db.queryEquity(*run_id).size(), result.equity_history.size());
}
