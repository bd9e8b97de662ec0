#include "series_store.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <set>
#include <spdlog/fmt/fmt.h>

namespace data {

    namespace {

        std::size_t slot(Timeframe timeframe) {
            return static_cast<std::size_t>(timeframe);
        }

        bool timestampLess(const core::SeriesBar& bar, core::Timestamp ts) {
            return bar.timestamp < ts;
        }

    } // end anonymous namespace

    std::string timeframeToString(Timeframe timeframe) {
        switch (timeframe) {
            case Timeframe::Daily:       return "day";
            case Timeframe::Weekly:      return "week";
            case Timeframe::Fundamental: return "fundamental";
            case Timeframe::Earnings:    return "earnings";
            case Timeframe::Minute:      return "minute";
        }
        return "?";
    }

    Timeframe timeframeFromString(const std::string& text) {
        if (text == "day" || text == "daily") return Timeframe::Daily;
        if (text == "week" || text == "weekly") return Timeframe::Weekly;
        if (text == "fundamental") return Timeframe::Fundamental;
        if (text == "earnings") return Timeframe::Earnings;
        if (text == "minute") return Timeframe::Minute;
        throw core::DataLoadException("Unknown timeframe string: " + text);
    }

    // --- SeriesWindow ---

    SeriesWindow::SeriesWindow(const core::TimeSeries<core::SeriesBar>* bars, core::Timestamp as_of)
        : bars_(bars), as_of_(as_of)
    {
        if (bars_) {
            // First bar stamped strictly after as_of
            auto it = std::upper_bound(bars_->begin(), bars_->end(), as_of,
                [](core::Timestamp ts, const core::SeriesBar& bar) { return ts < bar.timestamp; });
            end_ = static_cast<std::size_t>(std::distance(bars_->begin(), it));
        }
    }

    const core::SeriesBar* SeriesWindow::fromEnd(std::size_t back) const {
        if (!bars_ || back >= end_) {
            return nullptr;
        }
        return &(*bars_)[end_ - 1 - back];
    }

    std::optional<double> SeriesWindow::highestHigh(std::size_t bars, std::size_t offset) const {
        if (bars == 0 || end_ < 1 + offset) {
            return std::nullopt;
        }
        std::size_t last = end_ - 1 - offset; // Newest bar in the window
        // Short history shrinks the window to what exists
        std::size_t first = last + 1 - std::min(bars, last + 1);
        double highest = (*bars_)[first].high;
        for (std::size_t i = first; i <= last; ++i) {
            double high = (*bars_)[i].high;
            if (!std::isfinite(high)) {
                return std::nullopt;
            }
            highest = std::max(highest, high);
        }
        return highest;
    }

    // --- SymbolSeries ---

    SymbolSeries::SymbolSeries(std::string symbol) : symbol_(std::move(symbol)) {}

    void SymbolSeries::setSeries(Timeframe timeframe, core::TimeSeries<core::SeriesBar> bars) {
        std::stable_sort(bars.begin(), bars.end());
        for (std::size_t i = 1; i < bars.size(); ++i) {
            if (bars[i].timestamp == bars[i - 1].timestamp) {
                throw core::DataLoadException(fmt::format("Duplicate {} bar for {} at {}",
                    timeframeToString(timeframe), symbol_, core::utils::timestampToString(bars[i].timestamp)));
            }
        }
        series_[slot(timeframe)] = std::move(bars);
    }

    void SymbolSeries::appendBar(Timeframe timeframe, core::SeriesBar bar) {
        auto& bars = series_[slot(timeframe)];
        if (!bars.empty() && !(bars.back().timestamp < bar.timestamp)) {
            throw core::DataLoadException(fmt::format("Out-of-order {} bar for {} at {}",
                timeframeToString(timeframe), symbol_, core::utils::timestampToString(bar.timestamp)));
        }
        bars.push_back(std::move(bar));
    }

    const core::TimeSeries<core::SeriesBar>& SymbolSeries::series(Timeframe timeframe) const {
        return series_[slot(timeframe)];
    }

    core::TimeSeries<core::SeriesBar>& SymbolSeries::mutableSeries(Timeframe timeframe) {
        return series_[slot(timeframe)];
    }

    SeriesWindow SymbolSeries::window(Timeframe timeframe, core::Timestamp as_of) const {
        return SeriesWindow(&series_[slot(timeframe)], as_of);
    }

    const core::SeriesBar* SymbolSeries::dailyBarAt(core::Timestamp ts) const {
        const auto& bars = series_[slot(Timeframe::Daily)];
        auto it = std::lower_bound(bars.begin(), bars.end(), ts, timestampLess);
        if (it == bars.end() || it->timestamp != ts) {
            return nullptr;
        }
        return &(*it);
    }

    std::vector<const core::SeriesBar*> SymbolSeries::intradayBars(core::Timestamp session_start,
                                                                   core::Timestamp session_end) const {
        const auto& bars = series_[slot(Timeframe::Minute)];
        std::vector<const core::SeriesBar*> session;
        auto it = std::lower_bound(bars.begin(), bars.end(), session_start, timestampLess);
        for (; it != bars.end() && it->timestamp < session_end; ++it) {
            session.push_back(&(*it));
        }
        return session;
    }

    // --- SeriesStore ---

    SymbolSeries& SeriesStore::upsert(const std::string& symbol) {
        auto it = symbols_.find(symbol);
        if (it == symbols_.end()) {
            it = symbols_.emplace(symbol, SymbolSeries(symbol)).first;
        }
        return it->second;
    }

    const SymbolSeries* SeriesStore::find(const std::string& symbol) const {
        auto it = symbols_.find(symbol);
        return it == symbols_.end() ? nullptr : &it->second;
    }

    SymbolSeries* SeriesStore::find(const std::string& symbol) {
        auto it = symbols_.find(symbol);
        return it == symbols_.end() ? nullptr : &it->second;
    }

    std::vector<std::string> SeriesStore::symbols() const {
        std::vector<std::string> keys;
        keys.reserve(symbols_.size());
        for (const auto& pair : symbols_) {
            keys.push_back(pair.first);
        }
        return keys;
    }

    std::vector<core::Timestamp> SeriesStore::masterCalendar(const std::vector<std::string>& universe) const {
        std::set<core::Timestamp> calendar;
        auto collect = [&calendar](const SymbolSeries& series) {
            for (const auto& bar : series.series(Timeframe::Daily)) {
                calendar.insert(bar.timestamp);
            }
        };
        if (universe.empty()) {
            for (const auto& pair : symbols_) {
                collect(pair.second);
            }
        } else {
            for (const auto& symbol : universe) {
                if (const SymbolSeries* series = find(symbol)) {
                    collect(*series);
                } else if (core::logging::isInitialized()) {
                    core::logging::getLogger()->warn("Universe symbol {} has no series in the store", symbol);
                }
            }
        }
        return std::vector<core::Timestamp>(calendar.begin(), calendar.end());
    }

} // namespace data
