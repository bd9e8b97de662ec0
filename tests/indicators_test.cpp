// =============================================================================
// indicators_test.cpp
// =============================================================================
// Unit tests for the TA-Lib backed indicators and the field enricher.
//
// Validates:
//   - SMA output values and lookback alignment
//   - SMA momentum as a percent change of the average
//   - Rolling highs / lows over a fixed window
//   - Average daily range in percent
//   - The enricher writes fields at the right bars and keeps upstream values
//   - A non-finite close only blanks the averages whose window holds it
// =============================================================================

#include "adr_indicator.hpp"
#include "indicator_enricher.hpp"
#include "rolling_extreme_indicator.hpp"
#include "sma_indicator.hpp"
#include "sma_momentum_indicator.hpp"
#include "test_fixtures.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

using namespace indicators;
using cascade_test::day;
using cascade_test::flatBar;
using cascade_test::makeBar;

namespace {

    // Closes 1, 2, ..., n with a 2-point daily range
    core::TimeSeries<core::SeriesBar> countingBars(int n) {
        core::TimeSeries<core::SeriesBar> bars;
        for (int i = 0; i < n; ++i) {
            double close = i + 1.0;
            bars.push_back(makeBar(day(i), close, close + 1.0, close - 1.0, close));
        }
        return bars;
    }

} // namespace

// -----------------------------------------------------------------------------
// 1. SMA.
// -----------------------------------------------------------------------------
TEST(SmaIndicatorTest, AveragesCloses) {
    SmaIndicator sma(3);
    EXPECT_EQ(sma.getName(), "SMA3");
    EXPECT_EQ(sma.getLookback(), 2);

    sma.calculate(countingBars(6));
    const auto& out = sma.getResult();
    ASSERT_EQ(out.size(), 4u);
    EXPECT_NEAR(out[0], 2.0, 1e-9);
    EXPECT_NEAR(out[3], 5.0, 1e-9);
}

TEST(SmaIndicatorTest, ShortInputGivesNoOutput) {
    SmaIndicator sma(10);
    sma.calculate(countingBars(5));
    EXPECT_TRUE(sma.getResult().empty());
}

TEST(SmaIndicatorTest, NonFiniteCloseOnlyBlanksItsWindows) {
    auto bars = countingBars(8);
    bars[3].close = std::numeric_limits<double>::quiet_NaN();
    SmaIndicator sma(3);
    sma.calculate(bars);
    const auto& out = sma.getResult(); // out[i] belongs to bars[i + 2]
    ASSERT_EQ(out.size(), 6u);
    EXPECT_NEAR(out[0], 2.0, 1e-9);
    EXPECT_TRUE(std::isnan(out[1]));
    EXPECT_TRUE(std::isnan(out[2]));
    EXPECT_TRUE(std::isnan(out[3]));
    EXPECT_NEAR(out[4], 6.0, 1e-9);
    EXPECT_NEAR(out[5], 7.0, 1e-9);
}

TEST(SmaIndicatorTest, NonPositivePeriodThrows) {
    EXPECT_THROW(SmaIndicator(0), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 2. SMA momentum.
// -----------------------------------------------------------------------------
TEST(SmaMomentumIndicatorTest, PercentChangeOfAverage) {
    SmaMomentumIndicator momentum(2, 1, "SMA2_M");
    EXPECT_EQ(momentum.getName(), "SMA2_M");
    EXPECT_EQ(momentum.getLookback(), 2);

    momentum.calculate(countingBars(6)); // SMA2: 1.5, 2.5, 3.5, 4.5, 5.5
    const auto& out = momentum.getResult();
    ASSERT_EQ(out.size(), 4u);
    EXPECT_NEAR(out[0], (2.5 / 1.5 - 1.0) * 100.0, 1e-9);
    EXPECT_NEAR(out[3], (5.5 / 4.5 - 1.0) * 100.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 3. Rolling extremes.
// -----------------------------------------------------------------------------
TEST(RollingExtremeIndicatorTest, MaxOfHighsAndMinOfLows) {
    auto bars = countingBars(5); // highs 2..6, lows 0..4
    bars[1].high = 50.0;

    RollingExtremeIndicator max_high(3, RollingExtremeIndicator::Extreme::Max, PriceSource::High, "H3");
    max_high.calculate(bars);
    ASSERT_EQ(max_high.getResult().size(), 3u);
    EXPECT_DOUBLE_EQ(max_high.getResult()[0], 50.0);
    EXPECT_DOUBLE_EQ(max_high.getResult()[1], 50.0);
    EXPECT_DOUBLE_EQ(max_high.getResult()[2], 6.0);

    RollingExtremeIndicator min_low(3, RollingExtremeIndicator::Extreme::Min, PriceSource::Low, "L3");
    min_low.calculate(bars);
    ASSERT_EQ(min_low.getResult().size(), 3u);
    EXPECT_DOUBLE_EQ(min_low.getResult()[2], 2.0);
}

TEST(RollingExtremeIndicatorTest, PeriodBelowTwoThrows) {
    EXPECT_THROW(RollingExtremeIndicator(1, RollingExtremeIndicator::Extreme::Max, PriceSource::High, "x"),
                 std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 4. ADR.
// -----------------------------------------------------------------------------
TEST(AdrIndicatorTest, RangeAsPercentOfClose) {
    core::TimeSeries<core::SeriesBar> bars;
    for (int i = 0; i < 4; ++i) {
        bars.push_back(makeBar(day(i), 100.0, 102.0, 98.0, 100.0)); // 4%
    }
    bars.push_back(makeBar(day(4), 100.0, 101.0, 99.0, 100.0));     // 2%

    AdrIndicator adr(2);
    EXPECT_EQ(adr.getName(), core::fields::ADR);
    adr.calculate(bars);
    const auto& out = adr.getResult();
    ASSERT_EQ(out.size(), 4u);
    EXPECT_NEAR(out[0], 4.0, 1e-9);
    EXPECT_NEAR(out[3], 3.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 5. Enricher.
// -----------------------------------------------------------------------------
TEST(IndicatorEnricherTest, WritesAtLookbackOffset) {
    auto bars = countingBars(5);
    SmaIndicator sma(3);
    std::size_t written = IndicatorEnricher::applyIndicator(sma, bars);
    EXPECT_EQ(written, 3u);
    EXPECT_FALSE(bars[1].field("SMA3").has_value());
    ASSERT_TRUE(bars[2].field("SMA3").has_value());
    EXPECT_NEAR(*bars[2].field("SMA3"), 2.0, 1e-9);
    EXPECT_NEAR(*bars[4].field("SMA3"), 4.0, 1e-9);
}

TEST(IndicatorEnricherTest, UpstreamValuesAreKept) {
    auto bars = countingBars(5);
    bars[4].fields["SMA3"] = 99.0;
    SmaIndicator sma(3);
    EXPECT_EQ(IndicatorEnricher::applyIndicator(sma, bars), 2u);
    EXPECT_DOUBLE_EQ(*bars[4].field("SMA3"), 99.0);
}

TEST(IndicatorEnricherTest, EnrichStoreFillsDailyAndWeekly) {
    EnrichmentConfig config;
    config.daily_sma_periods = {2, 3};
    config.momentum_sma_period = 2;
    config.momentum_change_bars = 1;
    config.adr_period = 2;
    config.weekly_52_bars = 2;
    config.weekly_1y_bars = 2;
    config.weekly_2y_bars = 3;

    data::SeriesStore store;
    auto& series = store.upsert("AAA");
    series.setSeries(data::Timeframe::Daily, countingBars(6));
    series.setSeries(data::Timeframe::Weekly, countingBars(4));

    IndicatorEnricher enricher(config);
    EXPECT_EQ(enricher.enrichStore(store), 1u);

    const auto& daily = store.find("AAA")->series(data::Timeframe::Daily);
    EXPECT_TRUE(daily.back().field("SMA2").has_value());
    EXPECT_TRUE(daily.back().field("SMA3").has_value());
    EXPECT_TRUE(daily.back().field("SMA2_M").has_value());
    EXPECT_TRUE(daily.back().field(core::fields::ADR).has_value());

    const auto& weekly = store.find("AAA")->series(data::Timeframe::Weekly);
    ASSERT_TRUE(weekly.back().field(core::fields::HIGH_52).has_value());
    EXPECT_DOUBLE_EQ(*weekly.back().field(core::fields::HIGH_52), 5.0);
    EXPECT_DOUBLE_EQ(*weekly.back().field(core::fields::LOW_2Y), 1.0);
    EXPECT_FALSE(weekly.front().field(core::fields::HIGH_52).has_value());
}

TEST(IndicatorEnricherTest, NonFiniteCloseRecoversAfterItsWindow) {
    EnrichmentConfig config;
    config.daily_sma_periods = {3};
    config.momentum_sma_period = 2;
    config.momentum_change_bars = 1;
    config.adr_period = 2;
    config.weekly_52_bars = 2;
    config.weekly_1y_bars = 2;
    config.weekly_2y_bars = 3;

    auto daily_bars = countingBars(10);
    daily_bars[3].close = std::numeric_limits<double>::quiet_NaN();
    data::SeriesStore store;
    auto& series = store.upsert("AAA");
    series.setSeries(data::Timeframe::Daily, daily_bars);
    series.setSeries(data::Timeframe::Weekly, countingBars(4));

    IndicatorEnricher enricher(config);
    EXPECT_EQ(enricher.enrichStore(store), 1u);

    const auto& daily = store.find("AAA")->series(data::Timeframe::Daily);
    EXPECT_TRUE(daily[2].field("SMA3").has_value());
    EXPECT_FALSE(daily[4].field("SMA3").has_value());
    EXPECT_FALSE(daily[5].field("SMA2_M").has_value());
    ASSERT_TRUE(daily[6].field("SMA3").has_value());
    EXPECT_NEAR(*daily[6].field("SMA3"), 6.0, 1e-9);
    ASSERT_TRUE(daily.back().field("SMA3").has_value());
    EXPECT_NEAR(*daily.back().field("SMA3"), 9.0, 1e-9);
    ASSERT_TRUE(daily.back().field("SMA2_M").has_value());
    EXPECT_NEAR(*daily.back().field("SMA2_M"), (9.5 / 8.5 - 1.0) * 100.0, 1e-9);
}
