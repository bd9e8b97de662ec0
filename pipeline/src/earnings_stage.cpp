#include "earnings_stage.hpp"

#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace pipeline {

    namespace {
        // Prior >= floor and latest > prior. Missing values never pass.
        bool accelerating(const core::SeriesBar& prior, const core::SeriesBar& latest,
                          const std::string& field, double floor) {
            auto prior_value = prior.field(field);
            auto latest_value = latest.field(field);
            if (!prior_value || !latest_value) {
                return false;
            }
            return *prior_value >= floor && *latest_value > *prior_value;
        }
    } // anonymous namespace

    EarningsStage::EarningsStage(config::EarningsStageConfig config) : config_(std::move(config)) {}

    core::StageResult EarningsStage::evaluate(const StageInput& input) const {
        core::StageResult result = makeResult(input, id());

        const std::size_t needed = std::max<std::size_t>(config_.min_records, 2);
        if (input.earnings.size() < needed) {
            return fail(result, fmt::format("{} earnings records, need {}", input.earnings.size(), needed));
        }

        const core::SeriesBar* latest = input.earnings.fromEnd(0);
        const core::SeriesBar* prior = input.earnings.fromEnd(1);

        bool revenue_ok = accelerating(*prior, *latest, core::fields::EARN_REV_YOY, config_.growth_floor);
        bool eps_ok = accelerating(*prior, *latest, core::fields::EARN_EPS_YOY, config_.growth_floor);

        if (!revenue_ok && !eps_ok) {
            return fail(result, "neither revenue nor EPS growth is accelerating");
        }

        result.passed = true;
        result.score = 1.0;
        return result;
    }

    std::string EarningsStage::describe() const {
        return fmt::format("E: prior {0} or {1} >= {2:.2f} and latest above prior",
                           core::fields::EARN_REV_YOY, core::fields::EARN_EPS_YOY, config_.growth_floor);
    }

} // namespace pipeline
