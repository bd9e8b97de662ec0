#include "stage_factory.hpp"
#include "daily_breakout_stage.hpp"
#include "earnings_stage.hpp"
#include "fundamental_stage.hpp"
#include "relative_strength_stage.hpp"
#include "weekly_stage.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

namespace pipeline {

    std::unique_ptr<IStage> StageFactory::createStage(core::StageId stage, const config::StageSettings& settings) {
        switch (stage) {
            case core::StageId::Earnings:
                return std::make_unique<EarningsStage>(settings.earnings);
            case core::StageId::Fundamental:
                return std::make_unique<FundamentalStage>(settings.fundamental);
            case core::StageId::Weekly:
                return std::make_unique<WeeklyStage>(settings.weekly);
            case core::StageId::RelativeStrength:
                return std::make_unique<RelativeStrengthStage>(settings.relative_strength);
            case core::StageId::DailyBreakout:
                return std::make_unique<DailyBreakoutStage>(settings.daily, settings.relative_strength);
        }
        throw core::StageException("Unknown stage id");
    }

    std::unique_ptr<PipelineRunner> StageFactory::createRunner(const config::StageSettings& settings,
                                                               core::WorkerPool* pool) {
        auto logger = core::logging::getLogger();
        auto runner = std::make_unique<PipelineRunner>(pool);

        const std::pair<core::StageId, bool> order[] = {
            {core::StageId::Earnings, settings.earnings.enabled},
            {core::StageId::Fundamental, settings.fundamental.enabled},
            {core::StageId::Weekly, settings.weekly.enabled},
            {core::StageId::RelativeStrength, settings.relative_strength.enabled},
            {core::StageId::DailyBreakout, settings.daily.enabled},
        };
        for (const auto& [stage, enabled] : order) {
            runner->addStage(createStage(stage, settings), enabled);
        }

        for (const auto& line : runner->describe()) {
            logger->debug("  {}", line);
        }
        return runner;
    }

} // namespace pipeline
