#include "backtester.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "profile_loader.hpp"
#include "stage_factory.hpp"
#include "utils.hpp"

#include <algorithm>

namespace backtester {

    std::string toString(RunStatus status) {
        return status == RunStatus::Completed ? "Completed" : "Cancelled";
    }

    nlohmann::json tradeToJson(const core::Trade& trade) {
        return {
            {"sequence", trade.sequence},
            {"position_id", trade.position_id},
            {"ticker", trade.ticker},
            {"type", core::utils::toString(trade.type)},
            {"quantity", trade.quantity},
            {"price", trade.price},
            {"timestamp", core::utils::timestampToString(trade.timestamp)},
            {"reason", core::utils::toString(trade.reason)},
            {"realized_pnl", trade.realized_pnl},
            {"commission", trade.commission}
        };
    }

    nlohmann::json equityPointToJson(const core::EquityPoint& point) {
        return {
            {"timestamp", core::utils::timestampToString(point.timestamp)},
            {"total_equity", point.total_equity},
            {"cash", point.cash},
            {"positions_value", point.positions_value},
            {"open_positions", point.open_positions}
        };
    }

    nlohmann::json BacktestResult::toJson() const {
        nlohmann::json trades_json = nlohmann::json::array();
        for (const auto& trade : trades) {
            trades_json.push_back(tradeToJson(trade));
        }
        nlohmann::json equity_json = nlohmann::json::array();
        for (const auto& point : equity_history) {
            equity_json.push_back(equityPointToJson(point));
        }
        nlohmann::json funnel_json = nlohmann::json::array();
        for (const auto& stage : funnel) {
            funnel_json.push_back({
                {"stage", core::utils::toString(stage.stage)},
                {"enabled", stage.enabled},
                {"evaluated", stage.evaluated},
                {"passed", stage.passed}
            });
        }
        return {
            {"profile", profile_name},
            {"mode", core::utils::toString(mode)},
            {"status", backtester::toString(status)},
            {"steps_run", steps_run},
            {"candidates_generated", candidates_generated},
            {"funnel", std::move(funnel_json)},
            {"summary", summary ? summary->toJson() : nlohmann::json()},
            {"trades", std::move(trades_json)},
            {"equity_history", std::move(equity_json)}
        };
    }

    data::RunRecord BacktestResult::toRunRecord(const config::Profile& profile) const {
        data::RunRecord record;
        record.profile_name = profile_name;
        record.mode = core::utils::toString(mode);
        record.status = backtester::toString(status);
        record.profile_json = config::ProfileLoader::toJson(profile).dump();
        record.summary_json = summary ? summary->toJson().dump() : std::string();
        record.trades = trades;
        record.equity_history = equity_history;
        return record;
    }

    Backtester::Backtester(config::Profile profile) : profile_(std::move(profile)) {
        config::validate(profile_);
        if (profile_.worker_threads > 1) {
            pool_ = std::make_unique<core::WorkerPool>(profile_.worker_threads);
        }
        runner_ = pipeline::StageFactory::createRunner(profile_.stages, pool_.get());
        simulator_ = std::make_unique<ExecutionSimulator>(profile_.execution, pool_.get());
        portfolio_ = std::make_unique<Portfolio>(profile_.execution.initial_cash);
        core::logging::getLogger()->debug("Backtester initialized for profile '{}' with capital: {}",
                                          profile_.name, profile_.execution.initial_cash);
    }

    Backtester::~Backtester() = default;

    pipeline::PipelineOutput Backtester::generateSignals(const data::SeriesStore& store,
                                                         const std::vector<std::string>& universe,
                                                         core::Timestamp decision_time) const {
        return runner_->run(store, universe.empty() ? store.symbols() : universe, decision_time, profile_.mode);
    }

    void Backtester::checkTradeLog(const std::vector<core::Trade>& trades, const Portfolio& staged,
                                   std::size_t step_index, core::Timestamp step_time) const {
        auto violation = [&](const std::string& message) {
            return core::InvariantViolationException(message, step_index, step_time, staged.toJson().dump());
        };

        core::Timestamp last = trade_log_.empty() ? core::Timestamp::min() : trade_log_.back().timestamp;
        std::set<int> closed_this_step;
        for (const auto& trade : trades) {
            if (trade.timestamp < last) {
                throw violation("Trade timestamps went backwards for " + trade.ticker);
            }
            last = trade.timestamp;
            if (trade.quantity < 0) {
                throw violation("Negative trade quantity for " + trade.ticker);
            }
            if (!trade.isTerminal()) {
                continue;
            }
            if (closed_position_ids_.count(trade.position_id) > 0 ||
                !closed_this_step.insert(trade.position_id).second) {
                throw violation("Second terminal trade for position " + std::to_string(trade.position_id));
            }
            if (staged.hasPosition(trade.ticker) &&
                staged.findPosition(trade.ticker)->id() == trade.position_id) {
                throw violation("Position " + std::to_string(trade.position_id) + " still open after terminal trade");
            }
        }
    }

    void Backtester::commitStep(Portfolio staged, std::vector<core::Trade> trades,
                                std::size_t step_index, core::Timestamp step_time) {
        long long sequence = trade_log_.empty() ? 0 : trade_log_.back().sequence;
        for (auto& trade : trades) {
            trade.sequence = ++sequence;
        }

        staged.checkInvariants(step_index, step_time);
        checkTradeLog(trades, staged, step_index, step_time);

        // --- Commit ---
        for (const auto& trade : trades) {
            if (trade.isTerminal()) {
                closed_position_ids_.insert(trade.position_id);
            }
        }
        trade_log_.insert(trade_log_.end(), std::make_move_iterator(trades.begin()),
                          std::make_move_iterator(trades.end()));
        *portfolio_ = std::move(staged);
    }

    BacktestResult Backtester::run(const data::SeriesStore& store,
                                   const std::vector<std::string>& universe,
                                   std::optional<core::Timestamp> start,
                                   std::optional<core::Timestamp> end) {
        auto logger = core::logging::getLogger();
        logger->info("========================================================");
        logger->info("Starting Backtest Run '{}' ({} mode, {} resolution)", profile_.name,
                     core::utils::toString(profile_.mode), core::utils::toString(profile_.resolution));
        logger->info("========================================================");

        // Reset state for a new run
        portfolio_ = std::make_unique<Portfolio>(profile_.execution.initial_cash);
        trade_log_.clear();
        closed_position_ids_.clear();
        cancel_requested_.store(false);

        BacktestResult result;
        result.profile_name = profile_.name;
        result.mode = profile_.mode;
        for (std::size_t i = 0; i < runner_->stageCount(); ++i) {
            result.funnel.push_back(pipeline::StageFunnel{});
        }

        // An empty universe means every symbol in the store
        const std::vector<std::string> symbols = universe.empty() ? store.symbols() : universe;
        const std::vector<core::Timestamp> calendar = store.masterCalendar(symbols);
        std::size_t first = 0;
        std::size_t last = calendar.size();
        if (start) {
            first = std::lower_bound(calendar.begin(), calendar.end(), *start) - calendar.begin();
        }
        if (end) {
            last = std::upper_bound(calendar.begin(), calendar.end(), *end) - calendar.begin();
        }
        if (first >= last) {
            logger->warn("No calendar steps in the requested range ({} bars in total)", calendar.size());
            return result;
        }
        logger->info("Simulating {} steps from {} to {} over {} symbols", last - first,
                     core::utils::timestampToString(calendar[first]),
                     core::utils::timestampToString(calendar[last - 1]), symbols.size());

        for (std::size_t i = first; i < last; ++i) {
            if (cancel_requested_.load()) {
                result.status = RunStatus::Cancelled;
                logger->warn("Backtest cancelled before step {}", i);
                break;
            }
            const std::size_t step_index = i - first;
            const core::Timestamp step_time = calendar[i];

            Portfolio staged = *portfolio_;
            std::vector<core::Trade> step_trades;

            try {
                if (i == 0) {
                    // No decision bar yet
                    staged.recordEquity(step_time);
                } else {
                    StepContext context;
                    context.step_index = step_index;
                    context.step_time = step_time;
                    context.decision_time = calendar[i - 1];
                    context.resolution = profile_.resolution;

                    pipeline::PipelineOutput signals = runner_->run(store, symbols, context.decision_time, profile_.mode);
                    result.candidates_generated += signals.candidates.size();
                    for (std::size_t s = 0; s < signals.funnel.size() && s < result.funnel.size(); ++s) {
                        result.funnel[s].stage = signals.funnel[s].stage;
                        result.funnel[s].enabled = signals.funnel[s].enabled;
                        result.funnel[s].evaluated += signals.funnel[s].evaluated;
                        result.funnel[s].passed += signals.funnel[s].passed;
                    }

                    StepReport report = simulator_->executeStep(staged, store, signals.candidates, context);
                    step_trades = std::move(report.trades);
                }

                commitStep(std::move(staged), std::move(step_trades), step_index, step_time);
            } catch (const core::InvariantViolationException& e) {
                logger->critical("Invariant violated at step {} ({}): {}", e.stepIndex(),
                                 core::utils::timestampToString(e.stepTime()), e.what());
                logger->critical("Staged state: {}", e.stateSnapshot());
                throw;
            }

            ++result.steps_run;
            logger->debug("Step {} {} equity {:.2f} cash {:.2f} positions {}", step_index,
                          core::utils::timestampToString(step_time), portfolio_->equityHistory().back().total_equity,
                          portfolio_->cash(), portfolio_->openPositionCount());
            if (observer_) {
                observer_(step_index, portfolio_->equityHistory().back());
            }
        }

        if (profile_.execution.close_positions_at_end && result.status == RunStatus::Completed &&
            portfolio_->openPositionCount() > 0 && !portfolio_->equityHistory().empty()) {
            const core::Timestamp final_time = portfolio_->equityHistory().back().timestamp;
            // Minute fills in the last step can sit later than its daily stamp
            const core::Timestamp exit_time = trade_log_.empty() ? final_time
                                                                 : std::max(final_time, trade_log_.back().timestamp);
            Portfolio staged = *portfolio_;
            std::vector<core::Trade> exits = simulator_->liquidate(staged, exit_time, core::ReasonCode::EndOfRun);
            staged.recordEquity(final_time);
            try {
                commitStep(std::move(staged), std::move(exits), result.steps_run, final_time);
            } catch (const core::InvariantViolationException& e) {
                logger->critical("Invariant violated during end-of-run liquidation: {}", e.what());
                throw;
            }
        }

        result.trades = trade_log_;
        result.equity_history = portfolio_->equityHistory();
        if (result.equity_history.size() >= 2) {
            PerformanceAnalyzer analyzer(profile_.risk_free_rate);
            result.summary = analyzer.analyze(result.trades, result.equity_history);
            result.summary->logMetrics();
        } else {
            logger->warn("Not enough equity points ({}) to calculate metrics.", result.equity_history.size());
        }

        logger->info("========================================================");
        logger->info("Backtest Run {} for '{}': {} steps, {} trades", backtester::toString(result.status),
                     profile_.name, result.steps_run, result.trades.size());
        logger->info("========================================================");
        return result;
    }

} // namespace backtester
