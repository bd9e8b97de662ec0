#pragma once

#include <optional>
#include <string>

#include "datatypes.hpp"

namespace backtester {

    // --- Position ---
    // One open holding and its lifecycle:
    //   Open -> Open (pyramid), Open -> PartiallyClosed, Open -> Closed,
    //   PartiallyClosed -> PartiallyClosed (further partial), PartiallyClosed -> Closed.
    // Anything else throws core::PositionStateException. Cash is the
    // portfolio's concern; the sell-side methods only return realized P&L.
    class Position {
    public:
        Position(int id,
                 std::string ticker,
                 long long quantity,
                 double entry_price,
                 double stop_price,
                 std::optional<double> target_price,
                 core::Timestamp entry_time,
                 double trailing_step,
                 double entry_commission);

        int id() const { return id_; }
        const std::string& ticker() const { return ticker_; }
        long long quantity() const { return quantity_; }
        double averagePrice() const { return average_price_; }
        double stopPrice() const { return stop_price_; }
        std::optional<double> targetPrice() const { return target_price_; }
        core::Timestamp entryTime() const { return entry_time_; }
        int daysHeld() const { return days_held_; }
        double riskFraction() const { return risk_fraction_; }
        double trailingStep() const { return trailing_step_; }
        int pyramidLevel() const { return pyramid_level_; }
        core::PositionState state() const { return state_; }
        double markPrice() const { return mark_price_; }
        double openCommission() const { return open_commission_; }

        bool isOpen() const { return state_ != core::PositionState::Closed; }
        double marketValue() const { return static_cast<double>(quantity_) * mark_price_; }
        // Mark-to-market gain less the entry commission not yet charged to a sale
        double unrealizedPnl() const;

        // --- Transitions ---
        // Adds shares at price; Open only. Average price is quantity-weighted.
        void addPyramid(long long quantity, double price, double commission);
        // Sells part of the holding, leaving at least one share. Returns realized P&L.
        double partialClose(long long quantity, double price, double commission);
        // Sells everything. Returns realized P&L.
        double close(double price, double commission);

        // --- Adjustments ---
        // Stops only move up; returns true when the stop changed
        bool raiseStop(double new_stop);
        void setTargetPrice(std::optional<double> target) { target_price_ = target; }
        void scaleTrailingStep(double multiplier);
        void mark(double price);
        void incrementDaysHeld() { ++days_held_; }

    private:
        // Share of open entry commission carried by `quantity` shares
        double commissionShare(long long quantity) const;
        void requireOpen(const char* operation) const;

        int id_;
        std::string ticker_;
        long long quantity_;
        double average_price_;
        double stop_price_;
        std::optional<double> target_price_;
        core::Timestamp entry_time_;
        int days_held_ = 0;
        double risk_fraction_ = 0.0;
        double trailing_step_;
        int pyramid_level_ = 0;
        core::PositionState state_ = core::PositionState::Open;
        double mark_price_;
        double open_commission_;
    };

} // namespace backtester
