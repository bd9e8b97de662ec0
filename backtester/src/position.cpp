#include "position.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace backtester {

    Position::Position(int id,
                       std::string ticker,
                       long long quantity,
                       double entry_price,
                       double stop_price,
                       std::optional<double> target_price,
                       core::Timestamp entry_time,
                       double trailing_step,
                       double entry_commission)
        : id_(id),
          ticker_(std::move(ticker)),
          quantity_(quantity),
          average_price_(entry_price),
          stop_price_(stop_price),
          target_price_(target_price),
          entry_time_(entry_time),
          trailing_step_(trailing_step),
          mark_price_(entry_price),
          open_commission_(entry_commission) {
        if (quantity_ <= 0) {
            throw core::PositionStateException(fmt::format("Cannot open {} with quantity {}", ticker_, quantity_));
        }
        if (!std::isfinite(entry_price) || entry_price <= 0.0) {
            throw core::PositionStateException(fmt::format("Cannot open {} at price {}", ticker_, entry_price));
        }
        risk_fraction_ = (entry_price - stop_price) / entry_price;
    }

    double Position::unrealizedPnl() const {
        if (!isOpen()) {
            return 0.0;
        }
        return (mark_price_ - average_price_) * static_cast<double>(quantity_) - open_commission_;
    }

    void Position::requireOpen(const char* operation) const {
        if (state_ == core::PositionState::Closed) {
            throw core::PositionStateException(
                fmt::format("{} on closed position {} ({})", operation, id_, ticker_));
        }
    }

    double Position::commissionShare(long long quantity) const {
        if (quantity_ <= 0) {
            return 0.0;
        }
        return open_commission_ * static_cast<double>(quantity) / static_cast<double>(quantity_);
    }

    void Position::addPyramid(long long quantity, double price, double commission) {
        if (state_ != core::PositionState::Open) {
            throw core::PositionStateException(
                fmt::format("Pyramid on {} position {} ({})", core::utils::toString(state_), id_, ticker_));
        }
        if (quantity <= 0) {
            throw core::PositionStateException(fmt::format("Pyramid of {} shares on {}", quantity, ticker_));
        }
        const double held_cost = average_price_ * static_cast<double>(quantity_);
        quantity_ += quantity;
        average_price_ = (held_cost + price * static_cast<double>(quantity)) / static_cast<double>(quantity_);
        open_commission_ += commission;
        ++pyramid_level_;
    }

    double Position::partialClose(long long quantity, double price, double commission) {
        requireOpen("Partial close");
        if (quantity <= 0) {
            throw core::PositionStateException(fmt::format("Partial close of {} shares on {}", quantity, ticker_));
        }
        if (quantity >= quantity_) {
            throw core::PositionStateException(
                fmt::format("Partial close of {} shares on {} holding {}", quantity, ticker_, quantity_));
        }
        const double allocated = commissionShare(quantity);
        const double pnl = (price - average_price_) * static_cast<double>(quantity) - commission - allocated;
        open_commission_ -= allocated;
        quantity_ -= quantity;
        state_ = core::PositionState::PartiallyClosed;
        return pnl;
    }

    double Position::close(double price, double commission) {
        requireOpen("Close");
        const double pnl = (price - average_price_) * static_cast<double>(quantity_) - commission - open_commission_;
        open_commission_ = 0.0;
        quantity_ = 0;
        mark_price_ = price;
        state_ = core::PositionState::Closed;
        return pnl;
    }

    bool Position::raiseStop(double new_stop) {
        if (!std::isfinite(new_stop) || new_stop <= stop_price_) {
            return false;
        }
        stop_price_ = new_stop;
        return true;
    }

    void Position::scaleTrailingStep(double multiplier) {
        if (multiplier > 0.0) {
            trailing_step_ *= multiplier;
        }
    }

    void Position::mark(double price) {
        if (std::isfinite(price) && price > 0.0) {
            mark_price_ = price;
        }
    }

} // namespace backtester
