#pragma once

#include <memory>
#include <string>
#include <vector>

#include "indicators.hpp"
#include "series_store.hpp"

namespace indicators {

    struct EnrichmentConfig {
        std::vector<int> daily_sma_periods = {20, 50, 200};
        int momentum_sma_period = 200;
        int momentum_change_bars = 3;
        int adr_period = 20;
        int weekly_52_bars = 52;
        int weekly_1y_bars = 52;
        int weekly_2y_bars = 104;
    };

    // Derives the technical fields the stages read from raw OHLCV.
    // Fields that are already present on a bar are left untouched.
    class IndicatorEnricher {
    public:
        explicit IndicatorEnricher(EnrichmentConfig config = {});

        void enrichDaily(core::TimeSeries<core::SeriesBar>& bars) const;
        void enrichWeekly(core::TimeSeries<core::SeriesBar>& bars) const;

        // Both timeframes for every symbol; returns the number of symbols touched
        std::size_t enrichStore(data::SeriesStore& store) const;

        // Writes indicator output into bars[i + lookback].fields[name]
        static std::size_t applyIndicator(IIndicator& indicator, core::TimeSeries<core::SeriesBar>& bars);

    private:
        std::vector<std::unique_ptr<IIndicator>> dailyIndicators() const;
        std::vector<std::unique_ptr<IIndicator>> weeklyIndicators() const;

        EnrichmentConfig config_;
    };

} // namespace indicators
