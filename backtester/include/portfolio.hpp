#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "position.hpp"

namespace backtester {

    // --- Portfolio ---
    // Cash, open positions keyed by ticker, realized P&L and the equity curve.
    // Copyable so a step can run against a staged copy and be committed whole.
    class Portfolio {
    public:
        explicit Portfolio(double initial_cash);

        // --- Getters ---
        double initialCash() const { return initial_cash_; }
        double cash() const { return cash_; }
        double realizedPnl() const { return realized_pnl_; }
        double unrealizedPnl() const;
        double positionsValue() const;
        double equity() const { return cash_ + positionsValue(); }
        std::size_t openPositionCount() const { return positions_.size(); }

        bool hasPosition(const std::string& ticker) const;
        const Position* findPosition(const std::string& ticker) const;
        Position* findPosition(const std::string& ticker);
        const std::map<std::string, Position>& positions() const { return positions_; }

        const std::vector<core::EquityPoint>& equityHistory() const { return equity_history_; }

        // --- Modifiers ---
        // Debits quantity * price + commission. Throws if the ticker is already held.
        Position& openPosition(const std::string& ticker,
                               long long quantity,
                               double price,
                               double stop_price,
                               std::optional<double> target_price,
                               core::Timestamp entry_time,
                               double trailing_step,
                               double commission);

        void pyramid(const std::string& ticker, long long quantity, double price, double commission);

        // Both return the realized P&L of the sale
        double partialClose(const std::string& ticker, long long quantity, double price, double commission);
        // Removes the position from the book
        double closePosition(const std::string& ticker, double price, double commission);

        // Tickers without a price keep their previous mark
        void markToMarket(const std::map<std::string, double>& prices);

        // Appends a snapshot. A second snapshot at the last timestamp replaces
        // it; an earlier timestamp throws core::BacktestException.
        const core::EquityPoint& recordEquity(core::Timestamp timestamp);

        // Largest quantity <= requested keeping the position's value within
        // max_fraction of equity after the fill, with held shares revalued at
        // fill_price and the fill's commission deducted.
        long long clampToConcentration(const std::string& ticker,
                                       long long requested,
                                       double fill_price,
                                       double commission_rate,
                                       double max_fraction) const;

        // Accounting identities; throws core::InvariantViolationException
        void checkInvariants(std::size_t step_index, core::Timestamp step_time) const;

        nlohmann::json toJson() const;

    private:
        Position& requirePosition(const std::string& ticker, const char* operation);

        double initial_cash_;
        double cash_;
        double realized_pnl_ = 0.0;
        int next_position_id_ = 1;
        std::map<std::string, Position> positions_;
        std::vector<core::EquityPoint> equity_history_;
    };

} // namespace backtester
