#include "pipeline_runner.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <future>
#include <set>

namespace pipeline {

    PipelineRunner::PipelineRunner(core::WorkerPool* pool) : pool_(pool) {}

    void PipelineRunner::addStage(std::unique_ptr<IStage> stage, bool enabled) {
        if (!stage) {
            throw core::StageException("PipelineRunner::addStage called with a null stage");
        }
        stages_.push_back(StageSlot{std::move(stage), enabled});
    }

    bool PipelineRunner::isEnabled(core::StageId stage) const {
        for (const auto& slot : stages_) {
            if (slot.stage->id() == stage) {
                return slot.enabled;
            }
        }
        return false;
    }

    core::StageResult PipelineRunner::runStage(const IStage& stage, const StageInput& input, bool& faulted) const {
        try {
            return stage.evaluate(input);
        } catch (const std::exception& e) {
            faulted = true;
            core::logging::getLogger()->warn("Stage {} threw for {}: {}",
                                             core::utils::toString(stage.id()), input.symbol, e.what());
            core::StageResult result = makeResult(input, stage.id());
            return fail(result, std::string("stage error: ") + e.what());
        }
    }

    core::Candidate PipelineRunner::buildCandidate(const StageInput& input,
                                                   const std::vector<core::StageResult>& results) const {
        core::Candidate candidate;
        candidate.symbol = input.symbol;
        candidate.decision_time = input.decision_time;
        candidate.signal_label = "Screened";

        double score_sum = 0.0;
        std::size_t scored = 0;
        for (const auto& result : results) {
            if (result.skipped) {
                continue;
            }
            score_sum += result.score;
            ++scored;
            if (result.stage == core::StageId::DailyBreakout) {
                candidate.target_price = result.target_price;
                candidate.stop_price = result.stop_price;
                if (result.signal_label) {
                    candidate.signal_label = *result.signal_label;
                }
            }
        }
        candidate.composite_score = scored > 0 ? score_sum / static_cast<double>(scored) : 0.0;

        if (const core::SeriesBar* decision_bar = input.daily.latest()) {
            candidate.sizing_hint = decision_bar->field(core::fields::ADR);
        }
        return candidate;
    }

    SymbolEvaluation PipelineRunner::evaluateSymbol(const data::SymbolSeries& series,
                                                    core::Timestamp decision_time,
                                                    core::Mode mode) const {
        SymbolEvaluation evaluation;
        evaluation.symbol = series.symbol();

        StageInput input = StageInput::fromSeries(series, decision_time, mode);
        const core::SeriesBar* decision_bar = input.daily.latest();
        if (decision_bar == nullptr || decision_bar->timestamp != decision_time || !decision_bar->hasFiniteOhlc()) {
            evaluation.excluded = true;
            core::logging::getLogger()->debug("{} has no usable daily bar at {}, excluded",
                                              series.symbol(), core::utils::timestampToString(decision_time));
            return evaluation;
        }

        for (const auto& slot : stages_) {
            if (!slot.enabled) {
                core::StageResult skipped = makeResult(input, slot.stage->id());
                skipped.passed = true;
                skipped.skipped = true;
                skipped.score = 1.0;
                evaluation.results.push_back(std::move(skipped));
                continue;
            }
            core::StageResult result = runStage(*slot.stage, input, evaluation.faulted);
            const bool passed = result.passed;
            evaluation.results.push_back(std::move(result));
            if (!passed) {
                return evaluation;
            }
        }

        evaluation.candidate = buildCandidate(input, evaluation.results);
        return evaluation;
    }

    PipelineOutput PipelineRunner::run(const data::SeriesStore& store,
                                       const std::vector<std::string>& universe,
                                       core::Timestamp decision_time,
                                       core::Mode mode) const {
        auto logger = core::logging::getLogger();

        PipelineOutput output;
        output.decision_time = decision_time;
        for (const auto& slot : stages_) {
            output.funnel.push_back(StageFunnel{slot.stage->id(), slot.enabled, 0, 0});
        }

        // Sorted and de-duplicated so the merge below never depends on scheduling
        std::set<std::string> unique_symbols(universe.begin(), universe.end());
        std::vector<const data::SymbolSeries*> work;
        work.reserve(unique_symbols.size());
        for (const auto& symbol : unique_symbols) {
            const data::SymbolSeries* series = store.find(symbol);
            if (series == nullptr) {
                logger->warn("Symbol {} is not in the series store, skipped", symbol);
                continue;
            }
            work.push_back(series);
        }

        auto evaluate = [this, decision_time, mode](const data::SymbolSeries* series) {
            return evaluateSymbol(*series, decision_time, mode);
        };

        std::vector<SymbolEvaluation> evaluations;
        evaluations.reserve(work.size());
        if (pool_ != nullptr && work.size() > 1) {
            auto futures = pool_->mapOrdered(work, evaluate);
            for (std::size_t i = 0; i < futures.size(); ++i) {
                try {
                    evaluations.push_back(futures[i].get());
                } catch (const std::exception& e) {
                    logger->error("Pipeline task for {} failed: {}", work[i]->symbol(), e.what());
                    SymbolEvaluation failed;
                    failed.symbol = work[i]->symbol();
                    failed.faulted = true;
                    evaluations.push_back(std::move(failed));
                }
            }
        } else {
            for (const auto* series : work) {
                evaluations.push_back(evaluate(series));
            }
        }

        for (auto& evaluation : evaluations) {
            ++output.symbols_evaluated;
            if (evaluation.excluded) {
                ++output.excluded;
                continue;
            }
            if (evaluation.faulted) {
                ++output.faulted;
            }
            for (std::size_t i = 0; i < evaluation.results.size() && i < output.funnel.size(); ++i) {
                ++output.funnel[i].evaluated;
                if (evaluation.results[i].passed) {
                    ++output.funnel[i].passed;
                }
            }
            if (evaluation.candidate) {
                output.candidates.push_back(std::move(*evaluation.candidate));
            }
        }

        sortCandidates(output.candidates);

        logger->debug("Pipeline at {}: {} symbols, {} candidates, {} excluded, {} faulted",
                      core::utils::timestampToString(decision_time), output.symbols_evaluated,
                      output.candidates.size(), output.excluded, output.faulted);
        return output;
    }

    std::vector<std::string> PipelineRunner::describe() const {
        std::vector<std::string> lines;
        for (const auto& slot : stages_) {
            lines.push_back(slot.enabled ? slot.stage->describe()
                                         : slot.stage->describe() + " (disabled)");
        }
        return lines;
    }

    void PipelineRunner::sortCandidates(std::vector<core::Candidate>& candidates) {
        std::sort(candidates.begin(), candidates.end(),
                  [](const core::Candidate& a, const core::Candidate& b) {
                      if (a.composite_score != b.composite_score) {
                          return a.composite_score > b.composite_score;
                      }
                      return a.symbol < b.symbol;
                  });
    }

} // namespace pipeline
