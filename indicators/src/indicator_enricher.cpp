#include "indicator_enricher.hpp"
#include "adr_indicator.hpp"
#include "rolling_extreme_indicator.hpp"
#include "sma_indicator.hpp"
#include "sma_momentum_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace indicators {

    IndicatorEnricher::IndicatorEnricher(EnrichmentConfig config) : config_(std::move(config)) {}

    std::vector<std::unique_ptr<IIndicator>> IndicatorEnricher::dailyIndicators() const {
        std::vector<std::unique_ptr<IIndicator>> list;
        for (int period : config_.daily_sma_periods) {
            list.push_back(std::make_unique<SmaIndicator>(period));
        }
        list.push_back(std::make_unique<SmaMomentumIndicator>(
            config_.momentum_sma_period, config_.momentum_change_bars,
            fmt::format("SMA{}_M", config_.momentum_sma_period)));
        list.push_back(std::make_unique<AdrIndicator>(config_.adr_period));
        return list;
    }

    std::vector<std::unique_ptr<IIndicator>> IndicatorEnricher::weeklyIndicators() const {
        using Extreme = RollingExtremeIndicator::Extreme;
        std::vector<std::unique_ptr<IIndicator>> list;
        list.push_back(std::make_unique<RollingExtremeIndicator>(config_.weekly_52_bars, Extreme::Max, PriceSource::High, core::fields::HIGH_52));
        list.push_back(std::make_unique<RollingExtremeIndicator>(config_.weekly_52_bars, Extreme::Min, PriceSource::Low, core::fields::LOW_52));
        list.push_back(std::make_unique<RollingExtremeIndicator>(config_.weekly_1y_bars, Extreme::Max, PriceSource::High, core::fields::HIGH_1Y));
        list.push_back(std::make_unique<RollingExtremeIndicator>(config_.weekly_1y_bars, Extreme::Min, PriceSource::Low, core::fields::LOW_1Y));
        list.push_back(std::make_unique<RollingExtremeIndicator>(config_.weekly_2y_bars, Extreme::Max, PriceSource::High, core::fields::HIGH_2Y));
        list.push_back(std::make_unique<RollingExtremeIndicator>(config_.weekly_2y_bars, Extreme::Min, PriceSource::Low, core::fields::LOW_2Y));
        return list;
    }

    std::size_t IndicatorEnricher::applyIndicator(IIndicator& indicator, core::TimeSeries<core::SeriesBar>& bars) {
        indicator.calculate(bars);
        const auto& results = indicator.getResult();
        const std::string name = indicator.getName();
        const std::size_t lookback = static_cast<std::size_t>(indicator.getLookback());

        std::size_t written = 0;
        for (std::size_t i = 0; i < results.size() && i + lookback < bars.size(); ++i) {
            if (!std::isfinite(results[i])) {
                continue;
            }
            auto& fields = bars[i + lookback].fields;
            // emplace keeps an upstream value when one exists
            if (fields.emplace(name, results[i]).second) {
                ++written;
            }
        }
        return written;
    }

    void IndicatorEnricher::enrichDaily(core::TimeSeries<core::SeriesBar>& bars) const {
        for (auto& indicator : dailyIndicators()) {
            std::size_t written = applyIndicator(*indicator, bars);
            core::logging::getLogger()->trace(" -> {} values written for {}", written, indicator->getName());
        }
    }

    void IndicatorEnricher::enrichWeekly(core::TimeSeries<core::SeriesBar>& bars) const {
        for (auto& indicator : weeklyIndicators()) {
            std::size_t written = applyIndicator(*indicator, bars);
            core::logging::getLogger()->trace(" -> {} values written for {}", written, indicator->getName());
        }
    }

    std::size_t IndicatorEnricher::enrichStore(data::SeriesStore& store) const {
        auto logger = core::logging::getLogger();
        std::size_t touched = 0;
        for (const auto& symbol : store.symbols()) {
            data::SymbolSeries* series = store.find(symbol);
            try {
                enrichDaily(series->mutableSeries(data::Timeframe::Daily));
                enrichWeekly(series->mutableSeries(data::Timeframe::Weekly));
                ++touched;
            } catch (const core::IndicatorCalculationException& e) {
                // The symbol keeps whatever fields it already had
                logger->warn("Indicator enrichment failed for {}: {}", symbol, e.what());
            }
        }
        logger->info("Enriched indicator fields for {} of {} symbols", touched, store.size());
        return touched;
    }

} // namespace indicators
