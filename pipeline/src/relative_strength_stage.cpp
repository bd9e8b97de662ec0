#include "relative_strength_stage.hpp"

#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace pipeline {

    RelativeStrengthStage::RelativeStrengthStage(config::RelativeStrengthStageConfig config)
        : config_(std::move(config)) {}

    bool RelativeStrengthStage::holds(const core::SeriesBar& bar, const std::string& field, double threshold) {
        auto rs = bar.field(field);
        return rs && *rs >= threshold;
    }

    core::StageResult RelativeStrengthStage::evaluate(const StageInput& input) const {
        core::StageResult result = makeResult(input, id());

        const core::SeriesBar* decision_bar = input.daily.latest();
        if (decision_bar == nullptr) {
            return fail(result, "no daily bar at decision time");
        }
        auto rs = decision_bar->field(config_.field);
        if (!rs) {
            return fail(result, fmt::format("{} missing", config_.field));
        }
        if (*rs < config_.threshold) {
            return fail(result, fmt::format("{} {:.1f} below {:.1f}", config_.field, *rs, config_.threshold));
        }

        result.passed = true;
        result.score = std::clamp(*rs / 100.0, 0.0, 1.0);
        return result;
    }

    std::string RelativeStrengthStage::describe() const {
        return fmt::format("RS: {} >= {:.1f}", config_.field, config_.threshold);
    }

} // namespace pipeline
