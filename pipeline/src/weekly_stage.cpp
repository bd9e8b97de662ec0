#include "weekly_stage.hpp"

#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace pipeline {

    WeeklyStage::WeeklyStage(config::WeeklyStageConfig config) : config_(std::move(config)) {}

    core::StageResult WeeklyStage::evaluate(const StageInput& input) const {
        core::StageResult result = makeResult(input, id());

        if (input.weekly.size() < 3) {
            return fail(result, fmt::format("{} weekly bars, need 3", input.weekly.size()));
        }
        const core::SeriesBar& latest = *input.weekly.fromEnd(0);
        const core::SeriesBar& two_back = *input.weekly.fromEnd(2);

        auto high_1y = latest.field(core::fields::HIGH_1Y);
        auto high_2y = latest.field(core::fields::HIGH_2Y);
        auto low_1y = latest.field(core::fields::LOW_1Y);
        auto low_2y = latest.field(core::fields::LOW_2Y);
        auto high_52 = latest.field(core::fields::HIGH_52);
        auto low_52 = latest.field(core::fields::LOW_52);
        auto high_52_prior = two_back.field(core::fields::HIGH_52);
        if (!high_1y || !high_2y || !low_1y || !low_2y || !high_52 || !low_52 || !high_52_prior) {
            return fail(result, "weekly range fields missing");
        }
        if (!std::isfinite(latest.close)) {
            return fail(result, "weekly close not finite");
        }
        const double close = latest.close;

        if (*high_1y != *high_2y) {
            return fail(result, "1-year high differs from 2-year high");
        }
        if (!(*low_2y < *low_1y)) {
            return fail(result, "2-year low not below 1-year low");
        }
        if (*high_52 > *high_52_prior * (1.0 + config_.stability_tolerance)) {
            return fail(result, "52-week high not stable");
        }
        if (!(close > *low_52 * config_.low_distance_factor)) {
            return fail(result, "close too close to 52-week low");
        }
        if (!(close > *high_52 * config_.high_distance_factor)) {
            return fail(result, "close too far below 52-week high");
        }
        if (*high_52 <= 0.0) {
            return fail(result, "52-week high not positive");
        }

        result.passed = true;
        result.score = std::clamp(close / *high_52, 0.0, 1.0);
        return result;
    }

    std::string WeeklyStage::describe() const {
        return fmt::format("W: 1Y high == 2Y high, 2Y low < 1Y low, 52W high drift <= {:.0f}%, "
                           "close > 52W low x {:.2f}, close > 52W high x {:.2f}",
                           config_.stability_tolerance * 100.0,
                           config_.low_distance_factor, config_.high_distance_factor);
    }

} // namespace pipeline
