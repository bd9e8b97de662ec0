#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "interfaces.hpp"
#include "series_store.hpp"
#include "worker_pool.hpp"

namespace pipeline {

    // Per-stage counts for one run: how many symbols reached the stage and how
    // many came out of it.
    struct StageFunnel {
        core::StageId stage = core::StageId::Earnings;
        bool enabled = true;
        std::size_t evaluated = 0;
        std::size_t passed = 0;
    };

    // Everything the runner learned about one symbol
    struct SymbolEvaluation {
        std::string symbol;
        std::vector<core::StageResult> results; // Up to and including the first failure
        bool excluded = false; // No usable decision bar; no stage ran
        bool faulted = false;  // A stage threw; converted to a failure
        std::optional<core::Candidate> candidate;
    };

    struct PipelineOutput {
        core::Timestamp decision_time;
        std::vector<core::Candidate> candidates; // Best first
        std::vector<StageFunnel> funnel;         // Stage order
        std::size_t symbols_evaluated = 0;
        std::size_t excluded = 0;
        std::size_t faulted = 0;
    };

    // --- PipelineRunner ---
    // Runs each symbol through the ordered stages, stopping at the first
    // failure. Disabled stages pass without being evaluated and do not count
    // toward the composite score.
    class PipelineRunner {
    public:
        // pool may be null, in which case symbols are evaluated inline
        explicit PipelineRunner(core::WorkerPool* pool = nullptr);

        PipelineRunner(PipelineRunner&&) = default;
        PipelineRunner& operator=(PipelineRunner&&) = default;

        void addStage(std::unique_ptr<IStage> stage, bool enabled = true);
        std::size_t stageCount() const { return stages_.size(); }
        bool isEnabled(core::StageId stage) const;

        SymbolEvaluation evaluateSymbol(const data::SymbolSeries& series,
                                        core::Timestamp decision_time,
                                        core::Mode mode) const;

        // Symbols missing from the store are skipped with a warning
        PipelineOutput run(const data::SeriesStore& store,
                           const std::vector<std::string>& universe,
                           core::Timestamp decision_time,
                           core::Mode mode) const;

        std::vector<std::string> describe() const;

        // Composite score descending, symbol ascending on ties
        static void sortCandidates(std::vector<core::Candidate>& candidates);

    private:
        struct StageSlot {
            std::unique_ptr<IStage> stage;
            bool enabled = true;
        };

        core::StageResult runStage(const IStage& stage, const StageInput& input, bool& faulted) const;
        core::Candidate buildCandidate(const StageInput& input,
                                       const std::vector<core::StageResult>& results) const;

        std::vector<StageSlot> stages_;
        core::WorkerPool* pool_ = nullptr;
    };

} // namespace pipeline
