#include "portfolio.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace backtester {

    namespace {
        constexpr double kAbsoluteTolerance = 1e-6;
        constexpr double kRelativeTolerance = 1e-9;

        bool nearlyEqual(double a, double b, double scale) {
            return std::fabs(a - b) <= kAbsoluteTolerance + kRelativeTolerance * std::max(1.0, std::fabs(scale));
        }
    } // anonymous namespace

    Portfolio::Portfolio(double initial_cash)
        : initial_cash_(initial_cash), cash_(initial_cash) {
        if (!std::isfinite(initial_cash) || initial_cash <= 0.0) {
            throw core::BacktestException("Initial cash must be positive.");
        }
    }

    double Portfolio::positionsValue() const {
        double value = 0.0;
        for (const auto& [ticker, position] : positions_) {
            value += position.marketValue();
        }
        return value;
    }

    double Portfolio::unrealizedPnl() const {
        double pnl = 0.0;
        for (const auto& [ticker, position] : positions_) {
            pnl += position.unrealizedPnl();
        }
        return pnl;
    }

    bool Portfolio::hasPosition(const std::string& ticker) const {
        return positions_.count(ticker) > 0;
    }

    const Position* Portfolio::findPosition(const std::string& ticker) const {
        auto it = positions_.find(ticker);
        return it != positions_.end() ? &it->second : nullptr;
    }

    Position* Portfolio::findPosition(const std::string& ticker) {
        auto it = positions_.find(ticker);
        return it != positions_.end() ? &it->second : nullptr;
    }

    Position& Portfolio::requirePosition(const std::string& ticker, const char* operation) {
        Position* position = findPosition(ticker);
        if (position == nullptr) {
            throw core::PositionStateException(fmt::format("{} on {}: no open position", operation, ticker));
        }
        return *position;
    }

    Position& Portfolio::openPosition(const std::string& ticker,
                                      long long quantity,
                                      double price,
                                      double stop_price,
                                      std::optional<double> target_price,
                                      core::Timestamp entry_time,
                                      double trailing_step,
                                      double commission) {
        if (hasPosition(ticker)) {
            throw core::PositionStateException(fmt::format("Position in {} is already open", ticker));
        }
        Position position(next_position_id_, ticker, quantity, price, stop_price,
                          target_price, entry_time, trailing_step, commission);
        ++next_position_id_;
        cash_ -= static_cast<double>(quantity) * price + commission;
        auto [it, inserted] = positions_.emplace(ticker, std::move(position));
        return it->second;
    }

    void Portfolio::pyramid(const std::string& ticker, long long quantity, double price, double commission) {
        Position& position = requirePosition(ticker, "Pyramid");
        position.addPyramid(quantity, price, commission);
        cash_ -= static_cast<double>(quantity) * price + commission;
    }

    double Portfolio::partialClose(const std::string& ticker, long long quantity, double price, double commission) {
        Position& position = requirePosition(ticker, "Partial close");
        double pnl = position.partialClose(quantity, price, commission);
        cash_ += static_cast<double>(quantity) * price - commission;
        realized_pnl_ += pnl;
        return pnl;
    }

    double Portfolio::closePosition(const std::string& ticker, double price, double commission) {
        Position& position = requirePosition(ticker, "Close");
        const long long quantity = position.quantity();
        double pnl = position.close(price, commission);
        cash_ += static_cast<double>(quantity) * price - commission;
        realized_pnl_ += pnl;
        positions_.erase(ticker);
        return pnl;
    }

    void Portfolio::markToMarket(const std::map<std::string, double>& prices) {
        for (auto& [ticker, position] : positions_) {
            auto it = prices.find(ticker);
            if (it != prices.end()) {
                position.mark(it->second);
            }
        }
    }

    const core::EquityPoint& Portfolio::recordEquity(core::Timestamp timestamp) {
        core::EquityPoint point;
        point.timestamp = timestamp;
        point.cash = cash_;
        point.positions_value = positionsValue();
        point.total_equity = point.cash + point.positions_value;
        point.open_positions = positions_.size();

        if (!equity_history_.empty()) {
            const core::Timestamp last = equity_history_.back().timestamp;
            if (timestamp < last) {
                throw core::BacktestException(fmt::format("Equity snapshot at {} precedes last snapshot at {}",
                                                          core::utils::timestampToString(timestamp),
                                                          core::utils::timestampToString(last)));
            }
            if (timestamp == last) {
                equity_history_.back() = point;
                return equity_history_.back();
            }
        }
        equity_history_.push_back(point);
        return equity_history_.back();
    }

    long long Portfolio::clampToConcentration(const std::string& ticker,
                                              long long requested,
                                              double fill_price,
                                              double commission_rate,
                                              double max_fraction) const {
        if (requested <= 0 || !(fill_price > 0.0)) {
            return 0;
        }
        double held_quantity = 0.0;
        double held_value = 0.0;
        if (const Position* position = findPosition(ticker)) {
            held_quantity = static_cast<double>(position->quantity());
            held_value = position->marketValue();
        }
        // Equity with the existing holding revalued at the fill price
        const double equity_at_fill = equity() - held_value + held_quantity * fill_price;
        const double headroom = equity_at_fill * max_fraction - held_quantity * fill_price;
        if (headroom <= 0.0) {
            return 0;
        }
        const double limit = headroom / (fill_price * (1.0 + commission_rate * max_fraction));
        const long long allowed = static_cast<long long>(std::floor(limit + 1e-9));
        return std::clamp<long long>(allowed, 0, requested);
    }

    void Portfolio::checkInvariants(std::size_t step_index, core::Timestamp step_time) const {
        auto violation = [&](const std::string& message) {
            return core::InvariantViolationException(message, step_index, step_time, toJson().dump());
        };

        if (!std::isfinite(cash_) || cash_ < -kAbsoluteTolerance) {
            throw violation(fmt::format("Cash went negative: {:.6f}", cash_));
        }
        for (const auto& [ticker, position] : positions_) {
            if (position.quantity() <= 0 || !position.isOpen()) {
                throw violation(fmt::format("Position {} in {} held with quantity {} in state {}",
                                            position.id(), ticker, position.quantity(),
                                            core::utils::toString(position.state())));
            }
        }

        const double positions_value = positionsValue();
        const double book_value = cash_ + positions_value;
        const double accounted = initial_cash_ + realized_pnl_ + unrealizedPnl();
        if (!nearlyEqual(book_value, accounted, initial_cash_)) {
            throw violation(fmt::format("Cash + positions {:.6f} != initial + realized + unrealized {:.6f}",
                                        book_value, accounted));
        }

        if (!equity_history_.empty() && equity_history_.back().timestamp == step_time) {
            const double recorded = equity_history_.back().total_equity;
            if (!nearlyEqual(book_value, recorded, initial_cash_)) {
                throw violation(fmt::format("Cash + positions {:.6f} != recorded equity {:.6f}",
                                            book_value, recorded));
            }
        }
    }

    nlohmann::json Portfolio::toJson() const {
        nlohmann::json positions = nlohmann::json::array();
        for (const auto& [ticker, position] : positions_) {
            nlohmann::json item = {
                {"id", position.id()},
                {"ticker", ticker},
                {"quantity", position.quantity()},
                {"average_price", position.averagePrice()},
                {"stop_price", position.stopPrice()},
                {"entry_time", core::utils::timestampToString(position.entryTime())},
                {"days_held", position.daysHeld()},
                {"risk_fraction", position.riskFraction()},
                {"trailing_step", position.trailingStep()},
                {"pyramid_level", position.pyramidLevel()},
                {"state", core::utils::toString(position.state())},
                {"mark_price", position.markPrice()},
                {"open_commission", position.openCommission()}
            };
            item["target_price"] = position.targetPrice() ? nlohmann::json(*position.targetPrice()) : nlohmann::json();
            positions.push_back(std::move(item));
        }
        return {
            {"initial_cash", initial_cash_},
            {"cash", cash_},
            {"realized_pnl", realized_pnl_},
            {"unrealized_pnl", unrealizedPnl()},
            {"positions_value", positionsValue()},
            {"equity", equity()},
            {"positions", std::move(positions)},
            {"equity_points", equity_history_.size()}
        };
    }

} // namespace backtester
