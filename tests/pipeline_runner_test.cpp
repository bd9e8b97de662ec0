// =============================================================================
// pipeline_runner_test.cpp
// =============================================================================
// Unit tests for pipeline::PipelineRunner.
//
// Validates:
//   - Evaluation stops at the first failing stage
//   - Disabled stages pass unevaluated and stay out of the composite score
//   - Symbols without a usable decision bar are excluded
//   - A throwing stage fails only its own symbol
//   - Candidates are ordered by score, then symbol
//   - The funnel counts per stage
//   - Parallel evaluation produces the same output as sequential
// =============================================================================

#include "exceptions.hpp"
#include "pipeline_runner.hpp"
#include "stage_factory.hpp"
#include "test_fixtures.hpp"
#include "worker_pool.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <map>
#include <set>
#include <stdexcept>

using namespace pipeline;
using cascade_test::day;
using cascade_test::flatBar;
using cascade_test::makeBar;
using cascade_test::trendFields;

namespace {

    // Scores come from a per-symbol table; symbols not in it fail.
    class ScriptedStage : public IStage {
    public:
        ScriptedStage(core::StageId id, std::map<std::string, double> scores, std::set<std::string> throwing = {})
            : id_(id), scores_(std::move(scores)), throwing_(std::move(throwing)) {}

        core::StageId id() const override { return id_; }

        core::StageResult evaluate(const StageInput& input) const override {
            if (throwing_.count(input.symbol)) {
                throw std::runtime_error("scripted failure");
            }
            core::StageResult result = makeResult(input, id_);
            auto it = scores_.find(input.symbol);
            if (it == scores_.end()) {
                return fail(result, "not scripted");
            }
            result.passed = true;
            result.score = it->second;
            return result;
        }

        std::string describe() const override { return "scripted"; }

    private:
        core::StageId id_;
        std::map<std::string, double> scores_;
        std::set<std::string> throwing_;
    };

    void addDaily(data::SeriesStore& store, const std::string& symbol, int days) {
        auto& series = store.upsert(symbol);
        for (int i = 0; i < days; ++i) {
            series.appendBar(data::Timeframe::Daily, flatBar(day(i), 100.0, {{core::fields::ADR, 3.5}}));
        }
    }

} // namespace

class PipelineRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* symbol : {"AAA", "BBB", "CCC", "DDD"}) {
            addDaily(store, symbol, 5);
        }
    }

    data::SeriesStore store;
};

// -----------------------------------------------------------------------------
// 1. Short-circuit and composite score.
// -----------------------------------------------------------------------------
TEST_F(PipelineRunnerTest, StopsAtFirstFailure) {
    PipelineRunner runner;
    runner.addStage(std::make_unique<ScriptedStage>(core::StageId::Earnings, std::map<std::string, double>{{"AAA", 1.0}}));
    runner.addStage(std::make_unique<ScriptedStage>(core::StageId::Fundamental, std::map<std::string, double>{{"BBB", 1.0}}));

    auto evaluation = runner.evaluateSymbol(*store.find("AAA"), day(4), core::Mode::Retrospective);
    ASSERT_EQ(evaluation.results.size(), 2u);
    EXPECT_TRUE(evaluation.results[0].passed);
    EXPECT_FALSE(evaluation.results[1].passed);
    EXPECT_FALSE(evaluation.candidate.has_value());

    auto early = runner.evaluateSymbol(*store.find("BBB"), day(4), core::Mode::Retrospective);
    EXPECT_EQ(early.results.size(), 1u);
}

TEST_F(PipelineRunnerTest, DisabledStagesAreSkippedAndUnscored) {
    PipelineRunner runner;
    runner.addStage(std::make_unique<ScriptedStage>(core::StageId::Earnings, std::map<std::string, double>{}), false);
    runner.addStage(std::make_unique<ScriptedStage>(core::StageId::RelativeStrength, std::map<std::string, double>{{"AAA", 0.95}}));
    runner.addStage(std::make_unique<ScriptedStage>(core::StageId::DailyBreakout, std::map<std::string, double>{{"AAA", 0.5}}));

    auto evaluation = runner.evaluateSymbol(*store.find("AAA"), day(4), core::Mode::Retrospective);
    ASSERT_EQ(evaluation.results.size(), 3u);
    EXPECT_TRUE(evaluation.results[0].skipped);
    EXPECT_TRUE(evaluation.results[0].passed);
    ASSERT_TRUE(evaluation.candidate.has_value());
    EXPECT_DOUBLE_EQ(evaluation.candidate->composite_score, 0.725);
    EXPECT_DOUBLE_EQ(*evaluation.candidate->sizing_hint, 3.5);
    EXPECT_EQ(evaluation.candidate->decision_time, day(4));
}

TEST_F(PipelineRunnerTest, ScreenedLabelWithoutBreakoutStage) {
    PipelineRunner runner;
    runner.addStage(std::make_unique<ScriptedStage>(core::StageId::RelativeStrength, std::map<std::string, double>{{"AAA", 1.0}}));
    auto evaluation = runner.evaluateSymbol(*store.find("AAA"), day(4), core::Mode::Retrospective);
    ASSERT_TRUE(evaluation.candidate.has_value());
    EXPECT_EQ(evaluation.candidate->signal_label, "Screened");
    EXPECT_FALSE(evaluation.candidate->target_price.has_value());
}

// -----------------------------------------------------------------------------
// 2. Exclusion and faults.
// -----------------------------------------------------------------------------
TEST_F(PipelineRunnerTest, NoBarAtDecisionTimeExcludes) {
    PipelineRunner runner;
    runner.addStage(std::make_unique<ScriptedStage>(core::StageId::RelativeStrength, std::map<std::string, double>{{"AAA", 1.0}}));
    // Day 10 has no bar; the day 4 bar is stale
    auto evaluation = runner.evaluateSymbol(*store.find("AAA"), day(10), core::Mode::Retrospective);
    EXPECT_TRUE(evaluation.excluded);
    EXPECT_TRUE(evaluation.results.empty());
}

TEST_F(PipelineRunnerTest, NonFiniteDecisionBarExcludes) {
    store.find("AAA")->mutableSeries(data::Timeframe::Daily).back().close = std::numeric_limits<double>::quiet_NaN();
    PipelineRunner runner;
    runner.addStage(std::make_unique<ScriptedStage>(core::StageId::RelativeStrength, std::map<std::string, double>{{"AAA", 1.0}}));
    EXPECT_TRUE(runner.evaluateSymbol(*store.find("AAA"), day(4), core::Mode::Retrospective).excluded);
}

TEST_F(PipelineRunnerTest, ThrowingStageFailsOnlyItsSymbol) {
    PipelineRunner runner;
    runner.addStage(std::make_unique<ScriptedStage>(core::StageId::RelativeStrength,
        std::map<std::string, double>{{"AAA", 1.0}, {"BBB", 1.0}}, std::set<std::string>{"AAA"}));

    auto output = runner.run(store, {"AAA", "BBB"}, day(4), core::Mode::Retrospective);
    EXPECT_EQ(output.faulted, 1u);
    ASSERT_EQ(output.candidates.size(), 1u);
    EXPECT_EQ(output.candidates[0].symbol, "BBB");

    auto evaluation = runner.evaluateSymbol(*store.find("AAA"), day(4), core::Mode::Retrospective);
    EXPECT_TRUE(evaluation.faulted);
    ASSERT_EQ(evaluation.results.size(), 1u);
    EXPECT_NE(evaluation.results[0].reason.find("stage error"), std::string::npos);
}

TEST(PipelineRunnerSetupTest, NullStageThrows) {
    PipelineRunner runner;
    EXPECT_THROW(runner.addStage(nullptr), core::StageException);
}

// -----------------------------------------------------------------------------
// 3. Run output.
// -----------------------------------------------------------------------------
TEST_F(PipelineRunnerTest, CandidatesOrderedByScoreThenSymbol) {
    PipelineRunner runner;
    runner.addStage(std::make_unique<ScriptedStage>(core::StageId::RelativeStrength,
        std::map<std::string, double>{{"AAA", 0.5}, {"BBB", 0.9}, {"CCC", 0.5}}));

    auto output = runner.run(store, {"CCC", "AAA", "BBB", "DDD", "AAA", "MISSING"}, day(4), core::Mode::Retrospective);
    ASSERT_EQ(output.candidates.size(), 3u);
    EXPECT_EQ(output.candidates[0].symbol, "BBB");
    EXPECT_EQ(output.candidates[1].symbol, "AAA");
    EXPECT_EQ(output.candidates[2].symbol, "CCC");
    EXPECT_EQ(output.symbols_evaluated, 4u);
}

TEST_F(PipelineRunnerTest, FunnelCountsPerStage) {
    PipelineRunner runner;
    runner.addStage(std::make_unique<ScriptedStage>(core::StageId::Earnings, std::map<std::string, double>{}), false);
    runner.addStage(std::make_unique<ScriptedStage>(core::StageId::RelativeStrength,
        std::map<std::string, double>{{"AAA", 1.0}, {"BBB", 1.0}, {"CCC", 1.0}}));
    runner.addStage(std::make_unique<ScriptedStage>(core::StageId::DailyBreakout,
        std::map<std::string, double>{{"AAA", 1.0}}));

    auto output = runner.run(store, store.symbols(), day(4), core::Mode::Retrospective);
    ASSERT_EQ(output.funnel.size(), 3u);
    EXPECT_FALSE(output.funnel[0].enabled);
    EXPECT_EQ(output.funnel[0].evaluated, 4u);
    EXPECT_EQ(output.funnel[1].evaluated, 4u);
    EXPECT_EQ(output.funnel[1].passed, 3u);
    EXPECT_EQ(output.funnel[2].evaluated, 3u);
    EXPECT_EQ(output.funnel[2].passed, 1u);
    EXPECT_EQ(output.candidates.size(), 1u);
}

TEST_F(PipelineRunnerTest, ParallelMatchesSequential) {
    std::map<std::string, double> scores{{"AAA", 0.3}, {"BBB", 0.8}, {"CCC", 0.8}, {"DDD", 0.1}};

    PipelineRunner sequential;
    sequential.addStage(std::make_unique<ScriptedStage>(core::StageId::RelativeStrength, scores));

    core::WorkerPool pool(3);
    PipelineRunner parallel(&pool);
    parallel.addStage(std::make_unique<ScriptedStage>(core::StageId::RelativeStrength, scores));

    auto a = sequential.run(store, store.symbols(), day(4), core::Mode::Retrospective);
    auto b = parallel.run(store, store.symbols(), day(4), core::Mode::Retrospective);
    ASSERT_EQ(a.candidates.size(), b.candidates.size());
    for (std::size_t i = 0; i < a.candidates.size(); ++i) {
        EXPECT_EQ(a.candidates[i].symbol, b.candidates[i].symbol);
        EXPECT_DOUBLE_EQ(a.candidates[i].composite_score, b.candidates[i].composite_score);
    }
}

// -----------------------------------------------------------------------------
// 4. Real stages end to end.
// -----------------------------------------------------------------------------
TEST(PipelineRunnerStagesTest, BreakoutCandidateCarriesTargetAndStop) {
    data::SeriesStore store;
    auto& series = store.upsert("AAA");
    for (int i = 0; i < 4; ++i) {
        series.appendBar(data::Timeframe::Daily, flatBar(day(i), 100.0, trendFields()));
    }
    series.appendBar(data::Timeframe::Daily, makeBar(day(4), 100.0, 105.0, 99.0, 104.0, trendFields()));

    auto settings = cascade_test::breakoutProfile(3).stages;
    auto runner = StageFactory::createRunner(settings);
    auto output = runner->run(store, {"AAA"}, day(4), core::Mode::Retrospective);
    ASSERT_EQ(output.candidates.size(), 1u);
    const auto& candidate = output.candidates[0];
    EXPECT_DOUBLE_EQ(*candidate.target_price, 100.0);
    EXPECT_DOUBLE_EQ(*candidate.stop_price, 97.0);
    EXPECT_EQ(candidate.signal_label, "Breakout_W");
    // RS 0.95 and D 1.0
    EXPECT_DOUBLE_EQ(candidate.composite_score, 0.975);
}
