#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "datatypes.hpp"

namespace backtester {

    // --- Performance Summary ---
    struct PerformanceSummary {
        double initial_equity = 0.0;
        double final_equity = 0.0;
        double total_return = 0.0;        // Fraction, 0.1 = +10%
        double annualized_return = 0.0;
        double volatility = 0.0;          // Annualized stdev of step returns
        double sharpe_ratio = 0.0;
        double sortino_ratio = 0.0;
        double calmar_ratio = 0.0;
        double max_drawdown = 0.0;        // Fraction of peak equity
        double max_drawdown_duration_days = 0.0;

        std::size_t total_trades = 0;     // Fills, Rejected records excluded
        std::size_t rejected_trades = 0;
        std::size_t closed_positions = 0;
        std::size_t winning_positions = 0;
        std::size_t losing_positions = 0;
        double win_rate = 0.0;
        double profit_factor = 0.0;       // Infinity when nothing lost
        double average_win = 0.0;
        double average_loss = 0.0;        // Negative
        double expectancy = 0.0;          // Mean P&L per closed position
        int max_consecutive_wins = 0;
        int max_consecutive_losses = 0;
        double average_holding_days = 0.0;
        double total_commission = 0.0;
        std::map<std::string, double> symbol_contribution; // Realized P&L per ticker

        void logMetrics() const;
        nlohmann::json toJson() const;
    };

    // Stateless: the same inputs always give the same summary
    class PerformanceAnalyzer {
    public:
        explicit PerformanceAnalyzer(double risk_free_rate = 0.02, double periods_per_year = 252.0);

        // Throws core::InsufficientDataException with fewer than two equity points
        PerformanceSummary analyze(const std::vector<core::Trade>& trades,
                                   const std::vector<core::EquityPoint>& equity_history) const;

    private:
        void computeReturnStats(const std::vector<core::EquityPoint>& equity_history,
                                PerformanceSummary& summary) const;
        void computeTradeStats(const std::vector<core::Trade>& trades, PerformanceSummary& summary) const;

        double risk_free_rate_;
        double periods_per_year_;
    };

} // namespace backtester
