#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "database_manager.hpp"
#include "datatypes.hpp"
#include "execution_simulator.hpp"
#include "performance_analyzer.hpp"
#include "pipeline_runner.hpp"
#include "portfolio.hpp"
#include "profile.hpp"
#include "series_store.hpp"
#include "worker_pool.hpp"

namespace backtester {

    enum class RunStatus {
        Completed,
        Cancelled
    };

    std::string toString(RunStatus status);

    struct BacktestResult {
        std::string profile_name;
        core::Mode mode = core::Mode::Retrospective;
        RunStatus status = RunStatus::Completed;
        std::size_t steps_run = 0;
        std::vector<core::Trade> trades;
        std::vector<core::EquityPoint> equity_history;
        std::optional<PerformanceSummary> summary; // Needs two equity points
        std::vector<pipeline::StageFunnel> funnel; // Summed over all steps
        std::size_t candidates_generated = 0;

        nlohmann::json toJson() const;
        data::RunRecord toRunRecord(const config::Profile& profile) const;
    };

    nlohmann::json tradeToJson(const core::Trade& trade);
    nlohmann::json equityPointToJson(const core::EquityPoint& point);

    // --- Backtester ---
    // Walks the master calendar one step at a time. Step t decides on the bar
    // at t-1 and trades the bar at t. Each step runs on a staged copy of the
    // portfolio and is committed only after the accounting checks pass.
    class Backtester {
    public:
        using StepObserver = std::function<void(std::size_t step_index, const core::EquityPoint& point)>;

        explicit Backtester(config::Profile profile);
        ~Backtester();

        Backtester(const Backtester&) = delete;
        Backtester& operator=(const Backtester&) = delete;

        // Throws core::InvariantViolationException when a step fails its
        // checks; portfolio() then still holds the last committed state.
        BacktestResult run(const data::SeriesStore& store,
                           const std::vector<std::string>& universe,
                           std::optional<core::Timestamp> start = std::nullopt,
                           std::optional<core::Timestamp> end = std::nullopt);

        // Candidates for the next session, deciding on the bar at decision_time
        pipeline::PipelineOutput generateSignals(const data::SeriesStore& store,
                                                 const std::vector<std::string>& universe,
                                                 core::Timestamp decision_time) const;

        // Honoured between steps; safe to call from any thread
        void requestCancel() { cancel_requested_.store(true); }

        // Called on the run thread after each committed step
        void setStepObserver(StepObserver observer) { observer_ = std::move(observer); }

        const Portfolio& portfolio() const { return *portfolio_; }
        const std::vector<core::Trade>& tradeLog() const { return trade_log_; }
        const config::Profile& profile() const { return profile_; }

    private:
        void commitStep(Portfolio staged, std::vector<core::Trade> trades,
                        std::size_t step_index, core::Timestamp step_time);
        void checkTradeLog(const std::vector<core::Trade>& trades, const Portfolio& staged,
                           std::size_t step_index, core::Timestamp step_time) const;

        config::Profile profile_;
        std::unique_ptr<core::WorkerPool> pool_;
        std::unique_ptr<pipeline::PipelineRunner> runner_;
        std::unique_ptr<ExecutionSimulator> simulator_;
        std::unique_ptr<Portfolio> portfolio_;
        std::vector<core::Trade> trade_log_;
        std::set<int> closed_position_ids_;
        std::atomic<bool> cancel_requested_{false};
        StepObserver observer_;
    };

} // namespace backtester
