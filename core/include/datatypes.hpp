#pragma once

#include <string>
#include <vector>
#include <chrono> // For timestamps
#include <map>    // For named indicator fields
#include <optional>
#include <cmath>

namespace core {

    // Using system_clock for time points, all values are UTC
    using Timestamp = std::chrono::system_clock::time_point;

    template<typename T>
    using TimeSeries = std::vector<T>;

    // --- Operating Mode ---
    // Retrospective = historical backtest, Forward = live/paper signal generation.
    enum class Mode {
        Retrospective,
        Forward
    };

    // The only two things that differ between modes.
    struct ModeTraits {
        // Bars between the decision bar and the last bar of a breakout window.
        // 1 -> the window ends one bar before the decision bar.
        std::size_t window_offset = 1;
        // true  -> breakout when decision high > level (already exceeded)
        // false -> breakout when decision high < level (pending target)
        bool breakout_when_exceeded = true;
    };

    inline ModeTraits modeTraits(Mode mode) {
        if (mode == Mode::Forward) {
            return ModeTraits{0, false};
        }
        return ModeTraits{1, true};
    }

    // Fill resolution used by the execution simulator
    enum class Resolution {
        Daily,
        Minute
    };

    // One symbol, one timestamp. OHLCV plus named derived fields.
    struct SeriesBar {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0;
        std::map<std::string, double> fields;

        // Empty when the field is missing or not a finite number
        std::optional<double> field(const std::string& name) const {
            auto it = fields.find(name);
            if (it == fields.end() || !std::isfinite(it->second)) {
                return std::nullopt;
            }
            return it->second;
        }

        bool hasFiniteOhlc() const {
            return std::isfinite(open) && std::isfinite(high) &&
                   std::isfinite(low) && std::isfinite(close);
        }

        bool operator<(const SeriesBar& other) const {
            return timestamp < other.timestamp;
        }
    };

    // --- Pipeline Records ---
    enum class StageId {
        Earnings,
        Fundamental,
        Weekly,
        RelativeStrength,
        DailyBreakout
    };

    struct StageResult {
        std::string symbol;
        StageId stage = StageId::Earnings;
        bool passed = false;
        bool skipped = false; // Stage disabled, passed unconditionally
        std::optional<double> target_price;
        std::optional<double> stop_price;
        std::optional<std::string> signal_label;
        double score = 0.0;   // In [0, 1]
        std::string reason;   // Why it failed (empty on pass)
        Timestamp decision_time;
    };

    struct Candidate {
        std::string symbol;
        double composite_score = 0.0;
        std::optional<double> target_price; // Absent when the breakout stage is disabled
        std::optional<double> stop_price;
        std::optional<double> sizing_hint;  // Average daily range (%) on the decision bar
        std::string signal_label;
        Timestamp decision_time;
    };

    // --- Position / Trade Records ---
    enum class PositionState {
        Open,
        PartiallyClosed,
        Closed
    };

    enum class TradeType {
        Entry,
        Exit,
        PartialExit,
        Pyramid,
        StopOut,
        Rejected // No-op record for a skipped or clamped-to-zero request
    };

    enum class ReasonCode {
        Breakout,
        MarketEntry,
        PyramidAdd,
        StopLoss,
        TrailingStop,
        SignalExit,
        TargetReached,
        Whipsaw,            // Stopped out in the same step it was entered
        WhipsawGuard,       // Re-entry suppressed after a same-step stop-out
        CapacityLimit,
        ConcentrationLimit,
        InsufficientCash,
        InvalidSizing,
        EndOfRun
    };

    struct Trade {
        long long sequence = 0;
        int position_id = 0; // 0 for Rejected records that never opened a position
        std::string ticker;
        TradeType type = TradeType::Entry;
        long long quantity = 0;
        double price = 0.0;
        Timestamp timestamp;
        ReasonCode reason = ReasonCode::Breakout;
        double realized_pnl = 0.0;
        double commission = 0.0;

        bool isTerminal() const {
            return type == TradeType::Exit || type == TradeType::StopOut;
        }
    };

    struct EquityPoint {
        Timestamp timestamp;
        double total_equity = 0.0;
        double cash = 0.0;
        double positions_value = 0.0;
        std::size_t open_positions = 0;
    };

    // Field names shared by the indicator layer, stages and simulator
    namespace fields {
        inline const std::string SMA20 = "SMA20";
        inline const std::string SMA50 = "SMA50";
        inline const std::string SMA200 = "SMA200";
        inline const std::string SMA200_M = "SMA200_M";
        inline const std::string ADR = "ADR";
        inline const std::string RS_4W = "RS_4W";
        inline const std::string RS_12W = "RS_12W";
        inline const std::string HIGH_52 = "52_H";
        inline const std::string LOW_52 = "52_L";
        inline const std::string HIGH_1Y = "1Year_H";
        inline const std::string HIGH_2Y = "2Year_H";
        inline const std::string LOW_1Y = "1Year_L";
        inline const std::string LOW_2Y = "2Year_L";
        inline const std::string MARKET_CAP = "MarketCapitalization";
        inline const std::string REV_YOY = "REV_YOY";
        inline const std::string EPS_YOY = "EPS_YOY";
        inline const std::string REVENUE = "revenue";
        inline const std::string EARN_REV_YOY = "rev_yoy";
        inline const std::string EARN_EPS_YOY = "eps_yoy";
    } // namespace fields

} // namespace core
