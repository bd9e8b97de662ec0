#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "exit_signal.hpp"
#include "portfolio.hpp"
#include "profile.hpp"
#include "series_store.hpp"
#include "worker_pool.hpp"

namespace backtester {

    struct StepContext {
        std::size_t step_index = 0;
        core::Timestamp step_time;     // Timestamp of the bar being traded
        core::Timestamp decision_time; // Timestamp of the bar signals were computed on
        core::Resolution resolution = core::Resolution::Daily;
    };

    struct StepReport {
        std::vector<core::Trade> trades; // Timestamp order; sequence numbers not yet assigned
        std::set<std::string> stopped_out;
        std::size_t skipped_symbols = 0;   // Held symbols without a usable bar this step
        std::size_t lapsed_candidates = 0; // Buy stop never reached
    };

    // --- ExecutionSimulator ---
    // Turns one step's candidates into fills against a portfolio, in a fixed
    // order: exits, whipsaw guard, entries and pyramids, marks, equity snapshot.
    // Sizing is computed on the worker pool against the post-exit book;
    // fills are applied on the calling thread in candidate order.
    class ExecutionSimulator {
    public:
        explicit ExecutionSimulator(config::ExecutionConfig config, core::WorkerPool* pool = nullptr);

        StepReport executeStep(Portfolio& portfolio,
                               const data::SeriesStore& store,
                               const std::vector<core::Candidate>& candidates,
                               const StepContext& context) const;

        // Sells every open position at its mark less slippage
        std::vector<core::Trade> liquidate(Portfolio& portfolio,
                                           core::Timestamp timestamp,
                                           core::ReasonCode reason) const;

        // base_allocation scaled by the ADR bands
        double allocationRatio(std::optional<double> adr) const;

        const config::ExecutionConfig& config() const { return config_; }

    private:
        using BarPath = std::vector<const core::SeriesBar*>;

        struct EntryPlan {
            bool filled = false;
            double fill_price = 0.0;
            core::Timestamp fill_time;
            std::size_t fill_bar = 0; // Index into path
            double stop_price = 0.0;
            long long sized_quantity = 0; // Before cash, slot and concentration limits
            BarPath path;
        };

        BarPath fillPath(const data::SymbolSeries& series, const StepContext& context) const;

        void processExits(Portfolio& portfolio, const data::SeriesStore& store,
                          const StepContext& context, StepReport& report) const;

        EntryPlan planEntry(const core::Candidate& candidate, const data::SeriesStore& store,
                            const StepContext& context, double equity) const;

        void applyEntry(Portfolio& portfolio, const core::Candidate& candidate, const EntryPlan& plan,
                        double snapshot_equity, const StepContext& context, StepReport& report) const;
        void applyPyramid(Portfolio& portfolio, Position& held, const core::Candidate& candidate,
                          const EntryPlan& plan, double snapshot_equity,
                          const StepContext& context, StepReport& report) const;
        void checkSameStepStop(Portfolio& portfolio, const std::string& ticker, const EntryPlan& plan,
                               StepReport& report) const;

        void markPositions(Portfolio& portfolio, const data::SeriesStore& store,
                           const StepContext& context, const std::set<std::string>& entered) const;

        // Whole shares the cash above the reserve pays for, commission included
        long long affordableQuantity(const Portfolio& portfolio, double price, double snapshot_equity) const;

        config::ExecutionConfig config_;
        pipeline::ExitSignal exit_signal_;
        core::WorkerPool* pool_ = nullptr;
    };

} // namespace backtester
