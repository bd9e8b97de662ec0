#include "performance_analyzer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace backtester {

    void PerformanceSummary::logMetrics() const {
        auto logger = core::logging::getLogger();
        logger->info("--- Backtest Metrics ---");
        logger->info("Final Equity: {:.2f} (from {:.2f})", final_equity, initial_equity);
        logger->info("Total Return: {:.2f}%", total_return * 100.0);
        logger->info("Annualized Return: {:.2f}%", annualized_return * 100.0);
        logger->info("Volatility: {:.2f}%", volatility * 100.0);
        logger->info("Sharpe: {:.2f}  Sortino: {:.2f}  Calmar: {:.2f}", sharpe_ratio, sortino_ratio, calmar_ratio);
        logger->info("Max Drawdown: {:.2f}% over {:.0f} days", max_drawdown * 100.0, max_drawdown_duration_days);
        logger->info("Trades: {} ({} rejected)", total_trades, rejected_trades);
        logger->info("Closed Positions: {}  Win Rate: {:.2f}%", closed_positions, win_rate * 100.0);
        logger->info("Profit Factor: {:.2f}", profit_factor);
        logger->info("Avg Win: {:.2f}  Avg Loss: {:.2f}  Expectancy: {:.2f}", average_win, average_loss, expectancy);
        logger->info("Max Consecutive Wins/Losses: {}/{}", max_consecutive_wins, max_consecutive_losses);
        logger->info("Avg Holding: {:.1f} days", average_holding_days);
        logger->info("------------------------");
    }

    nlohmann::json PerformanceSummary::toJson() const {
        nlohmann::json contribution = nlohmann::json::object();
        for (const auto& [ticker, pnl] : symbol_contribution) {
            contribution[ticker] = pnl;
        }
        return {
            {"initial_equity", initial_equity},
            {"final_equity", final_equity},
            {"total_return", total_return},
            {"annualized_return", annualized_return},
            {"volatility", volatility},
            {"sharpe_ratio", sharpe_ratio},
            {"sortino_ratio", sortino_ratio},
            {"calmar_ratio", calmar_ratio},
            {"max_drawdown", max_drawdown},
            {"max_drawdown_duration_days", max_drawdown_duration_days},
            {"total_trades", total_trades},
            {"rejected_trades", rejected_trades},
            {"closed_positions", closed_positions},
            {"winning_positions", winning_positions},
            {"losing_positions", losing_positions},
            {"win_rate", win_rate},
            // JSON has no infinity
            {"profit_factor", std::isfinite(profit_factor) ? nlohmann::json(profit_factor) : nlohmann::json()},
            {"average_win", average_win},
            {"average_loss", average_loss},
            {"expectancy", expectancy},
            {"max_consecutive_wins", max_consecutive_wins},
            {"max_consecutive_losses", max_consecutive_losses},
            {"average_holding_days", average_holding_days},
            {"total_commission", total_commission},
            {"symbol_contribution", std::move(contribution)}
        };
    }

    PerformanceAnalyzer::PerformanceAnalyzer(double risk_free_rate, double periods_per_year)
        : risk_free_rate_(risk_free_rate), periods_per_year_(periods_per_year) {}

    PerformanceSummary PerformanceAnalyzer::analyze(const std::vector<core::Trade>& trades,
                                                    const std::vector<core::EquityPoint>& equity_history) const {
        if (equity_history.size() < 2) {
            throw core::InsufficientDataException(
                "Performance statistics need at least two equity points, got " + std::to_string(equity_history.size()));
        }
        PerformanceSummary summary;
        computeReturnStats(equity_history, summary);
        computeTradeStats(trades, summary);
        return summary;
    }

    void PerformanceAnalyzer::computeReturnStats(const std::vector<core::EquityPoint>& equity_history,
                                                 PerformanceSummary& summary) const {
        summary.initial_equity = equity_history.front().total_equity;
        summary.final_equity = equity_history.back().total_equity;
        summary.total_return = summary.initial_equity > 0.0
                                   ? summary.final_equity / summary.initial_equity - 1.0
                                   : 0.0;

        const double days = core::utils::daysBetween(equity_history.front().timestamp, equity_history.back().timestamp);
        if (days > 0.0 && summary.total_return > -1.0) {
            summary.annualized_return = std::pow(1.0 + summary.total_return, 365.25 / days) - 1.0;
        } else if (summary.total_return <= -1.0) {
            summary.annualized_return = -1.0;
        }

        // --- Step returns ---
        std::vector<double> returns;
        returns.reserve(equity_history.size() - 1);
        for (std::size_t i = 1; i < equity_history.size(); ++i) {
            const double previous = equity_history[i - 1].total_equity;
            returns.push_back(previous > 0.0 ? equity_history[i].total_equity / previous - 1.0 : 0.0);
        }
        const double per_period_rf = risk_free_rate_ / periods_per_year_;
        const double n = static_cast<double>(returns.size());
        const double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / n;

        double variance = 0.0;
        double downside = 0.0;
        for (double r : returns) {
            variance += (r - mean) * (r - mean);
            const double shortfall = std::min(r - per_period_rf, 0.0);
            downside += shortfall * shortfall;
        }
        const double stdev = returns.size() > 1 ? std::sqrt(variance / (n - 1.0)) : 0.0;
        const double downside_deviation = std::sqrt(downside / n) * std::sqrt(periods_per_year_);

        summary.volatility = stdev * std::sqrt(periods_per_year_);
        summary.sharpe_ratio = stdev > 0.0 ? (mean - per_period_rf) / stdev * std::sqrt(periods_per_year_) : 0.0;
        summary.sortino_ratio = downside_deviation > 0.0
                                    ? (summary.annualized_return - risk_free_rate_) / downside_deviation
                                    : 0.0;

        // --- Drawdown ---
        double peak = equity_history.front().total_equity;
        core::Timestamp peak_time = equity_history.front().timestamp;
        double longest_underwater = 0.0;
        for (const auto& point : equity_history) {
            if (point.total_equity >= peak) {
                peak = point.total_equity;
                peak_time = point.timestamp;
                continue;
            }
            if (peak > 0.0) {
                summary.max_drawdown = std::max(summary.max_drawdown, (peak - point.total_equity) / peak);
            }
            longest_underwater = std::max(longest_underwater, core::utils::daysBetween(peak_time, point.timestamp));
        }
        summary.max_drawdown_duration_days = longest_underwater;
        summary.calmar_ratio = summary.max_drawdown > 0.0 ? summary.annualized_return / summary.max_drawdown : 0.0;
    }

    void PerformanceAnalyzer::computeTradeStats(const std::vector<core::Trade>& trades,
                                                PerformanceSummary& summary) const {
        struct PositionTally {
            double pnl = 0.0;
            core::Timestamp opened;
            core::Timestamp closed;
            bool has_entry = false;
            bool terminal = false;
        };
        std::map<int, PositionTally> tallies;
        std::vector<int> close_order; // Position ids in the order they closed

        for (const auto& trade : trades) {
            if (trade.type == core::TradeType::Rejected) {
                ++summary.rejected_trades;
                continue;
            }
            ++summary.total_trades;
            summary.total_commission += trade.commission;
            summary.symbol_contribution[trade.ticker] += trade.realized_pnl;

            PositionTally& tally = tallies[trade.position_id];
            tally.pnl += trade.realized_pnl;
            if (trade.type == core::TradeType::Entry) {
                tally.opened = trade.timestamp;
                tally.has_entry = true;
            }
            if (trade.isTerminal()) {
                tally.closed = trade.timestamp;
                tally.terminal = true;
                close_order.push_back(trade.position_id);
            }
        }

        double gross_profit = 0.0;
        double gross_loss = 0.0;
        double total_pnl = 0.0;
        double holding_days = 0.0;
        int win_streak = 0;
        int loss_streak = 0;
        for (int id : close_order) {
            const PositionTally& tally = tallies[id];
            ++summary.closed_positions;
            total_pnl += tally.pnl;
            if (tally.has_entry) {
                holding_days += core::utils::daysBetween(tally.opened, tally.closed);
            }
            if (tally.pnl > 0.0) {
                ++summary.winning_positions;
                gross_profit += tally.pnl;
                ++win_streak;
                loss_streak = 0;
            } else {
                ++summary.losing_positions;
                gross_loss += tally.pnl;
                ++loss_streak;
                win_streak = 0;
            }
            summary.max_consecutive_wins = std::max(summary.max_consecutive_wins, win_streak);
            summary.max_consecutive_losses = std::max(summary.max_consecutive_losses, loss_streak);
        }

        if (summary.closed_positions == 0) {
            return;
        }
        const double closed = static_cast<double>(summary.closed_positions);
        summary.win_rate = static_cast<double>(summary.winning_positions) / closed;
        summary.expectancy = total_pnl / closed;
        summary.average_holding_days = holding_days / closed;
        if (summary.winning_positions > 0) {
            summary.average_win = gross_profit / static_cast<double>(summary.winning_positions);
        }
        if (summary.losing_positions > 0) {
            summary.average_loss = gross_loss / static_cast<double>(summary.losing_positions);
        }
        if (gross_loss < 0.0) {
            summary.profit_factor = gross_profit / -gross_loss;
        } else {
            summary.profit_factor = gross_profit > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
        }
    }

} // namespace backtester
