#include "execution_simulator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>

namespace backtester {

    namespace {
        core::Trade makeTrade(int position_id, const std::string& ticker, core::TradeType type,
                              long long quantity, double price, core::Timestamp timestamp,
                              core::ReasonCode reason, double realized_pnl, double commission) {
            core::Trade trade;
            trade.position_id = position_id;
            trade.ticker = ticker;
            trade.type = type;
            trade.quantity = quantity;
            trade.price = price;
            trade.timestamp = timestamp;
            trade.reason = reason;
            trade.realized_pnl = realized_pnl;
            trade.commission = commission;
            return trade;
        }

        core::Trade rejection(const std::string& ticker, int position_id, core::ReasonCode reason,
                              core::Timestamp timestamp) {
            return makeTrade(position_id, ticker, core::TradeType::Rejected, 0, 0.0, timestamp, reason, 0.0, 0.0);
        }

        long long floorShares(double value) {
            if (!std::isfinite(value) || value <= 0.0) {
                return 0;
            }
            return static_cast<long long>(std::floor(value + 1e-9));
        }
    } // anonymous namespace

    ExecutionSimulator::ExecutionSimulator(config::ExecutionConfig config, core::WorkerPool* pool)
        : config_(std::move(config)), exit_signal_(config_.exit_signal_field), pool_(pool) {}

    double ExecutionSimulator::allocationRatio(std::optional<double> adr) const {
        double ratio = config_.base_allocation;
        if (adr) {
            if (*adr >= config_.adr_high_threshold) {
                ratio *= config_.adr_high_scale;
            } else if (*adr <= config_.adr_low_threshold) {
                ratio *= config_.adr_low_scale;
            }
        }
        return ratio;
    }

    ExecutionSimulator::BarPath ExecutionSimulator::fillPath(const data::SymbolSeries& series,
                                                             const StepContext& context) const {
        BarPath path;
        const core::SeriesBar* daily = series.dailyBarAt(context.step_time);
        if (daily == nullptr || !daily->hasFiniteOhlc()) {
            return path;
        }
        if (context.resolution == core::Resolution::Minute) {
            const core::Timestamp session_start = core::utils::startOfDay(context.step_time);
            for (const core::SeriesBar* bar : series.intradayBars(session_start, session_start + std::chrono::hours(24))) {
                if (bar->hasFiniteOhlc()) {
                    path.push_back(bar);
                }
            }
        }
        if (path.empty()) {
            path.push_back(daily);
        }
        return path;
    }

    long long ExecutionSimulator::affordableQuantity(const Portfolio& portfolio, double price,
                                                     double snapshot_equity) const {
        const double available = portfolio.cash() - snapshot_equity * config_.cash_reserve_fraction;
        return floorShares(available / (price * (1.0 + config_.commission_rate)));
    }

    // --- Exits ---

    void ExecutionSimulator::processExits(Portfolio& portfolio, const data::SeriesStore& store,
                                          const StepContext& context, StepReport& report) const {
        auto logger = core::logging::getLogger();

        std::vector<std::string> tickers;
        for (const auto& [ticker, position] : portfolio.positions()) {
            tickers.push_back(ticker);
        }

        for (const auto& ticker : tickers) {
            const data::SymbolSeries* series = store.find(ticker);
            BarPath path = series ? fillPath(*series, context) : BarPath{};
            if (path.empty()) {
                ++report.skipped_symbols;
                logger->debug("No usable bar for held {} at {}, exits skipped",
                              ticker, core::utils::timestampToString(context.step_time));
                continue;
            }
            Position& position = *portfolio.findPosition(ticker);
            const int position_id = position.id();

            // Stop breach. On a minute path, exits that trigger on an earlier
            // bar go first; on the stop bar itself the stop wins.
            std::size_t stop_index = path.size();
            for (std::size_t i = 0; i < path.size(); ++i) {
                if (path[i]->low <= position.stopPrice()) {
                    stop_index = i;
                    break;
                }
            }
            auto stop_out = [&]() {
                const core::SeriesBar* stop_bar = path[stop_index];
                const core::ReasonCode reason = position.stopPrice() > position.averagePrice()
                                                    ? core::ReasonCode::TrailingStop
                                                    : core::ReasonCode::StopLoss;
                const double price = std::min(stop_bar->open, position.stopPrice()) * (1.0 - config_.slippage);
                const long long quantity = position.quantity();
                const double commission = static_cast<double>(quantity) * price * config_.commission_rate;
                const double pnl = portfolio.closePosition(ticker, price, commission);
                report.trades.push_back(makeTrade(position_id, ticker, core::TradeType::StopOut, quantity, price,
                                                  stop_bar->timestamp, reason, pnl, commission));
                report.stopped_out.insert(ticker);
                logger->info("Stop-out {} {} @ {:.2f} ({}) pnl {:.2f}", ticker, quantity, price,
                             core::utils::toString(reason), pnl);
            };
            if (stop_index == 0) {
                stop_out();
                continue;
            }

            // Sell signal on the decision bar, filled at the first open
            if (config_.exit_signal_enabled) {
                const core::SeriesBar* decision_bar = series->dailyBarAt(context.decision_time);
                if (decision_bar != nullptr && exit_signal_.shouldExit(*decision_bar)) {
                    const double price = path.front()->open * (1.0 - config_.slippage);
                    const long long quantity = position.quantity();
                    const double commission = static_cast<double>(quantity) * price * config_.commission_rate;
                    const double pnl = portfolio.closePosition(ticker, price, commission);
                    report.trades.push_back(makeTrade(position_id, ticker, core::TradeType::Exit, quantity, price,
                                                      path.front()->timestamp, core::ReasonCode::SignalExit,
                                                      pnl, commission));
                    logger->info("Exit {} {} @ {:.2f} (close below {}) pnl {:.2f}", ticker, quantity, price,
                                 exit_signal_.field(), pnl);
                    continue;
                }
            }

            // Profit target before any stop bar: sell part, widen the trailing step
            bool partially_exited = false;
            if (config_.partial_exit_enabled && position.state() == core::PositionState::Open &&
                position.targetPrice()) {
                const double target = *position.targetPrice();
                const long long quantity = floorShares(static_cast<double>(position.quantity()) * config_.partial_exit_fraction);
                if (quantity > 0 && quantity < position.quantity()) {
                    for (std::size_t i = 0; i < stop_index; ++i) {
                        const core::SeriesBar* bar = path[i];
                        if (bar->high < target) {
                            continue;
                        }
                        const double price = std::max(bar->open, target) * (1.0 - config_.slippage);
                        const double commission = static_cast<double>(quantity) * price * config_.commission_rate;
                        const double pnl = portfolio.partialClose(ticker, quantity, price, commission);
                        position.scaleTrailingStep(config_.partial_exit_risk_multiplier);
                        report.trades.push_back(makeTrade(position_id, ticker, core::TradeType::PartialExit, quantity,
                                                          price, bar->timestamp, core::ReasonCode::TargetReached,
                                                          pnl, commission));
                        logger->info("Partial exit {} {} @ {:.2f} pnl {:.2f}", ticker, quantity, price, pnl);
                        partially_exited = true;
                        break;
                    }
                }
            }

            if (stop_index < path.size()) {
                stop_out();
                continue;
            }
            if (partially_exited) {
                continue;
            }

            // Hold: step the stop up the gain ladder
            if (config_.trailing_stop_enabled && position.trailingStep() > 0.0) {
                const double gain = path.back()->close / position.averagePrice();
                const double level = std::floor((gain - 1.0) / position.trailingStep() + 1e-9);
                if (level >= 2.0) {
                    const double new_stop = position.averagePrice() * (1.0 + (level - 1.0) * position.trailingStep());
                    if (position.raiseStop(new_stop)) {
                        logger->debug("Trailing stop for {} raised to {:.2f}", ticker, new_stop);
                    }
                }
            }
        }
    }

    // --- Entries ---

    ExecutionSimulator::EntryPlan ExecutionSimulator::planEntry(const core::Candidate& candidate,
                                                                const data::SeriesStore& store,
                                                                const StepContext& context,
                                                                double equity) const {
        EntryPlan plan;
        const data::SymbolSeries* series = store.find(candidate.symbol);
        if (series == nullptr) {
            return plan;
        }
        plan.path = fillPath(*series, context);
        if (plan.path.empty()) {
            return plan;
        }

        if (candidate.target_price) {
            const double target = *candidate.target_price;
            if (!std::isfinite(target) || target <= 0.0) {
                return plan;
            }
            for (std::size_t i = 0; i < plan.path.size(); ++i) {
                const core::SeriesBar* bar = plan.path[i];
                if (bar->high >= target) {
                    plan.filled = true;
                    plan.fill_bar = i;
                    plan.fill_time = bar->timestamp;
                    plan.fill_price = std::max(bar->open, target) * (1.0 + config_.slippage);
                    break;
                }
            }
            if (!plan.filled) {
                return plan;
            }
            plan.stop_price = candidate.stop_price && std::isfinite(*candidate.stop_price)
                                  ? *candidate.stop_price
                                  : target * (1.0 - config_.default_stop_fraction);
        } else {
            // No breakout level: market entry at the open
            plan.filled = true;
            plan.fill_bar = 0;
            plan.fill_time = plan.path.front()->timestamp;
            plan.fill_price = plan.path.front()->open * (1.0 + config_.slippage);
            plan.stop_price = candidate.stop_price && std::isfinite(*candidate.stop_price)
                                  ? *candidate.stop_price
                                  : plan.fill_price * (1.0 - config_.default_stop_fraction);
        }

        const double risk_per_share = plan.fill_price - plan.stop_price;
        if (!(risk_per_share > 0.0) || !(plan.fill_price > 0.0)) {
            plan.sized_quantity = 0;
            return plan;
        }
        const double by_risk = equity * config_.risk_per_trade / risk_per_share;
        const double by_allocation = equity * allocationRatio(candidate.sizing_hint) / plan.fill_price;
        plan.sized_quantity = floorShares(std::min(by_risk, by_allocation));
        return plan;
    }

    void ExecutionSimulator::checkSameStepStop(Portfolio& portfolio, const std::string& ticker,
                                               const EntryPlan& plan, StepReport& report) const {
        const Position* position = portfolio.findPosition(ticker);
        if (position == nullptr) {
            return;
        }
        const double stop = position->stopPrice();
        const bool single_bar = plan.path.size() == 1;
        const std::size_t first = single_bar ? 0 : plan.fill_bar + 1;
        for (std::size_t i = first; i < plan.path.size(); ++i) {
            const core::SeriesBar* bar = plan.path[i];
            if (bar->low > stop) {
                continue;
            }
            const double base = (i == plan.fill_bar) ? stop : std::min(bar->open, stop);
            const double price = base * (1.0 - config_.slippage);
            const int position_id = position->id();
            const long long quantity = position->quantity();
            const double commission = static_cast<double>(quantity) * price * config_.commission_rate;
            const double pnl = portfolio.closePosition(ticker, price, commission);
            const core::Timestamp when = std::max(bar->timestamp, plan.fill_time);
            report.trades.push_back(makeTrade(position_id, ticker, core::TradeType::StopOut, quantity, price,
                                              when, core::ReasonCode::Whipsaw, pnl, commission));
            report.stopped_out.insert(ticker);
            core::logging::getLogger()->info("Whipsaw stop-out {} {} @ {:.2f} pnl {:.2f}", ticker, quantity, price, pnl);
            return;
        }
    }

    void ExecutionSimulator::applyEntry(Portfolio& portfolio, const core::Candidate& candidate,
                                        const EntryPlan& plan, double snapshot_equity,
                                        const StepContext& context, StepReport& report) const {
        auto logger = core::logging::getLogger();
        const std::string& ticker = candidate.symbol;

        if (portfolio.openPositionCount() >= config_.max_positions) {
            report.trades.push_back(rejection(ticker, 0, core::ReasonCode::CapacityLimit, context.step_time));
            logger->debug("{} rejected: {} positions already open", ticker, portfolio.openPositionCount());
            return;
        }
        if (plan.sized_quantity <= 0) {
            report.trades.push_back(rejection(ticker, 0, core::ReasonCode::InvalidSizing, context.step_time));
            logger->debug("{} rejected: sizing produced no shares", ticker);
            return;
        }
        long long quantity = std::min(plan.sized_quantity,
                                      affordableQuantity(portfolio, plan.fill_price, snapshot_equity));
        if (quantity <= 0) {
            report.trades.push_back(rejection(ticker, 0, core::ReasonCode::InsufficientCash, context.step_time));
            logger->debug("{} rejected: insufficient cash {:.2f}", ticker, portfolio.cash());
            return;
        }
        quantity = portfolio.clampToConcentration(ticker, quantity, plan.fill_price,
                                                  config_.commission_rate, config_.max_position_fraction);
        if (quantity <= 0) {
            report.trades.push_back(rejection(ticker, 0, core::ReasonCode::ConcentrationLimit, context.step_time));
            logger->debug("{} rejected: concentration limit", ticker);
            return;
        }

        const double commission = static_cast<double>(quantity) * plan.fill_price * config_.commission_rate;
        Position& position = portfolio.openPosition(ticker, quantity, plan.fill_price, plan.stop_price,
                                                     plan.fill_price * (1.0 + config_.partial_exit_gain),
                                                     plan.fill_time, config_.trailing_step, commission);
        const core::ReasonCode reason = candidate.target_price ? core::ReasonCode::Breakout
                                                               : core::ReasonCode::MarketEntry;
        report.trades.push_back(makeTrade(position.id(), ticker, core::TradeType::Entry, quantity, plan.fill_price,
                                          plan.fill_time, reason, 0.0, commission));
        logger->info("Entry {} {} @ {:.2f} stop {:.2f} ({}, score {:.3f})", ticker, quantity, plan.fill_price,
                     plan.stop_price, candidate.signal_label, candidate.composite_score);

        if (config_.same_step_stop) {
            checkSameStepStop(portfolio, ticker, plan, report);
        }
    }

    void ExecutionSimulator::applyPyramid(Portfolio& portfolio, Position& held, const core::Candidate& candidate,
                                          const EntryPlan& plan, double snapshot_equity,
                                          const StepContext& context, StepReport& report) const {
        auto logger = core::logging::getLogger();
        const std::string& ticker = candidate.symbol;

        if (!config_.pyramiding_enabled || held.state() != core::PositionState::Open ||
            held.pyramidLevel() >= config_.max_pyramid_levels || !(plan.fill_price > held.averagePrice())) {
            logger->debug("{} already held, no pyramid (level {}, state {})", ticker, held.pyramidLevel(),
                          core::utils::toString(held.state()));
            return;
        }

        const int position_id = held.id();
        long long quantity = floorShares(static_cast<double>(held.quantity()) * config_.pyramid_fraction);
        if (quantity <= 0) {
            report.trades.push_back(rejection(ticker, position_id, core::ReasonCode::InvalidSizing, context.step_time));
            return;
        }
        quantity = std::min(quantity, affordableQuantity(portfolio, plan.fill_price, snapshot_equity));
        if (quantity <= 0) {
            report.trades.push_back(rejection(ticker, position_id, core::ReasonCode::InsufficientCash, context.step_time));
            return;
        }
        quantity = portfolio.clampToConcentration(ticker, quantity, plan.fill_price,
                                                  config_.commission_rate, config_.max_position_fraction);
        if (quantity <= 0) {
            report.trades.push_back(rejection(ticker, position_id, core::ReasonCode::ConcentrationLimit, context.step_time));
            return;
        }

        const double commission = static_cast<double>(quantity) * plan.fill_price * config_.commission_rate;
        portfolio.pyramid(ticker, quantity, plan.fill_price, commission);
        held.setTargetPrice(held.averagePrice() * (1.0 + config_.partial_exit_gain));
        report.trades.push_back(makeTrade(position_id, ticker, core::TradeType::Pyramid, quantity, plan.fill_price,
                                          plan.fill_time, core::ReasonCode::PyramidAdd, 0.0, commission));
        logger->info("Pyramid {} +{} @ {:.2f} (level {})", ticker, quantity, plan.fill_price, held.pyramidLevel());
    }

    void ExecutionSimulator::markPositions(Portfolio& portfolio, const data::SeriesStore& store,
                                           const StepContext& context, const std::set<std::string>& entered) const {
        std::map<std::string, double> prices;
        std::vector<std::string> tickers;
        for (const auto& [ticker, position] : portfolio.positions()) {
            tickers.push_back(ticker);
            const data::SymbolSeries* series = store.find(ticker);
            const core::SeriesBar* bar = series ? series->dailyBarAt(context.step_time) : nullptr;
            if (bar != nullptr && std::isfinite(bar->close) && bar->close > 0.0) {
                prices[ticker] = bar->close;
            }
        }
        portfolio.markToMarket(prices);
        for (const auto& ticker : tickers) {
            if (entered.count(ticker) == 0) {
                portfolio.findPosition(ticker)->incrementDaysHeld();
            }
        }
    }

    // --- Step ---

    StepReport ExecutionSimulator::executeStep(Portfolio& portfolio,
                                               const data::SeriesStore& store,
                                               const std::vector<core::Candidate>& candidates,
                                               const StepContext& context) const {
        auto logger = core::logging::getLogger();
        StepReport report;

        processExits(portfolio, store, context, report);

        // Whipsaw guard
        std::vector<core::Candidate> eligible;
        eligible.reserve(candidates.size());
        for (const auto& candidate : candidates) {
            if (report.stopped_out.count(candidate.symbol) > 0) {
                report.trades.push_back(rejection(candidate.symbol, 0, core::ReasonCode::WhipsawGuard, context.step_time));
                logger->debug("{} re-entry suppressed after stop-out this step", candidate.symbol);
                continue;
            }
            eligible.push_back(candidate);
        }

        // Sizing against the post-exit book
        const double snapshot_equity = portfolio.equity();
        std::vector<EntryPlan> plans;
        plans.reserve(eligible.size());
        auto plan_one = [this, &store, &context, snapshot_equity](const core::Candidate& candidate) {
            return planEntry(candidate, store, context, snapshot_equity);
        };
        if (pool_ != nullptr && eligible.size() > 1) {
            auto futures = pool_->mapOrdered(eligible, plan_one);
            for (std::size_t i = 0; i < futures.size(); ++i) {
                try {
                    plans.push_back(futures[i].get());
                } catch (const std::exception& e) {
                    logger->warn("Sizing for {} failed: {}", eligible[i].symbol, e.what());
                    plans.push_back(EntryPlan{});
                }
            }
        } else {
            for (const auto& candidate : eligible) {
                plans.push_back(plan_one(candidate));
            }
        }

        std::set<std::string> entered;
        for (std::size_t i = 0; i < eligible.size(); ++i) {
            const core::Candidate& candidate = eligible[i];
            const EntryPlan& plan = plans[i];
            if (!plan.filled) {
                ++report.lapsed_candidates;
                logger->debug("{} buy stop not reached, candidate lapsed", candidate.symbol);
                continue;
            }
            if (Position* held = portfolio.findPosition(candidate.symbol)) {
                applyPyramid(portfolio, *held, candidate, plan, snapshot_equity, context, report);
                continue;
            }
            applyEntry(portfolio, candidate, plan, snapshot_equity, context, report);
            entered.insert(candidate.symbol);
        }

        markPositions(portfolio, store, context, entered);
        portfolio.recordEquity(context.step_time);

        std::stable_sort(report.trades.begin(), report.trades.end(),
                         [](const core::Trade& a, const core::Trade& b) { return a.timestamp < b.timestamp; });
        return report;
    }

    std::vector<core::Trade> ExecutionSimulator::liquidate(Portfolio& portfolio,
                                                           core::Timestamp timestamp,
                                                           core::ReasonCode reason) const {
        std::vector<core::Trade> trades;
        std::vector<std::string> tickers;
        for (const auto& [ticker, position] : portfolio.positions()) {
            tickers.push_back(ticker);
        }
        for (const auto& ticker : tickers) {
            const Position& position = *portfolio.findPosition(ticker);
            const int position_id = position.id();
            const long long quantity = position.quantity();
            const double price = position.markPrice() * (1.0 - config_.slippage);
            const double commission = static_cast<double>(quantity) * price * config_.commission_rate;
            const double pnl = portfolio.closePosition(ticker, price, commission);
            trades.push_back(makeTrade(position_id, ticker, core::TradeType::Exit, quantity, price,
                                       timestamp, reason, pnl, commission));
        }
        if (!trades.empty()) {
            core::logging::getLogger()->info("Liquidated {} positions ({})", trades.size(), core::utils::toString(reason));
        }
        return trades;
    }

} // namespace backtester
