#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "datatypes.hpp"

namespace data {

    // Bar series kept per symbol. Weekly bars are stamped at the week's last
    // session; fundamental and earnings records at the date they became public.
    enum class Timeframe {
        Daily,
        Weekly,
        Fundamental,
        Earnings,
        Minute
    };

    std::string timeframeToString(Timeframe timeframe);
    Timeframe timeframeFromString(const std::string& text);

    // --- SeriesWindow ---
    // Read-only view of a series truncated at an as-of time. Bars stamped after
    // as_of are not reachable through this view.
    class SeriesWindow {
    public:
        SeriesWindow() = default;
        SeriesWindow(const core::TimeSeries<core::SeriesBar>* bars, core::Timestamp as_of);

        std::size_t size() const { return end_; }
        bool empty() const { return end_ == 0; }
        core::Timestamp asOf() const { return as_of_; }

        // back = 0 is the latest visible bar; nullptr when out of range
        const core::SeriesBar* fromEnd(std::size_t back) const;
        const core::SeriesBar* latest() const { return fromEnd(0); }

        // Highest high over `bars` bars, the newest of which sits `offset` bars
        // before the latest one. A window longer than the history covers every
        // bar up to that newest one; empty only when not even that bar exists.
        std::optional<double> highestHigh(std::size_t bars, std::size_t offset) const;

    private:
        const core::TimeSeries<core::SeriesBar>* bars_ = nullptr;
        std::size_t end_ = 0; // One past the last visible bar
        core::Timestamp as_of_{};
    };

    // --- SymbolSeries ---
    class SymbolSeries {
    public:
        explicit SymbolSeries(std::string symbol);

        const std::string& symbol() const { return symbol_; }

        // Sorts by timestamp; duplicate timestamps throw core::DataLoadException
        void setSeries(Timeframe timeframe, core::TimeSeries<core::SeriesBar> bars);
        // Must be strictly later than the current last bar
        void appendBar(Timeframe timeframe, core::SeriesBar bar);

        const core::TimeSeries<core::SeriesBar>& series(Timeframe timeframe) const;
        core::TimeSeries<core::SeriesBar>& mutableSeries(Timeframe timeframe);

        SeriesWindow window(Timeframe timeframe, core::Timestamp as_of) const;

        // Exact-timestamp lookup on the daily series
        const core::SeriesBar* dailyBarAt(core::Timestamp ts) const;
        // Minute bars in [session_start, session_end)
        std::vector<const core::SeriesBar*> intradayBars(core::Timestamp session_start,
                                                         core::Timestamp session_end) const;

    private:
        std::string symbol_;
        std::array<core::TimeSeries<core::SeriesBar>, 5> series_;
    };

    // --- SeriesStore ---
    // Owns every symbol's series. Read-only once the run starts.
    class SeriesStore {
    public:
        SymbolSeries& upsert(const std::string& symbol);
        const SymbolSeries* find(const std::string& symbol) const;
        SymbolSeries* find(const std::string& symbol);

        std::size_t size() const { return symbols_.size(); }
        // Sorted ascending
        std::vector<std::string> symbols() const;

        // Union of daily bar timestamps across the given symbols (all when empty), ascending
        std::vector<core::Timestamp> masterCalendar(const std::vector<std::string>& universe = {}) const;

    private:
        std::map<std::string, SymbolSeries> symbols_;
    };

} // namespace data
