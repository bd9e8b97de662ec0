#include "fundamental_stage.hpp"

#include <spdlog/fmt/fmt.h>

namespace pipeline {

    FundamentalStage::FundamentalStage(config::FundamentalStageConfig config) : config_(std::move(config)) {}

    bool FundamentalStage::growthHolds(const core::SeriesBar& latest, const core::SeriesBar* prior,
                                       const std::string& field) const {
        auto current = latest.field(field);
        // No earlier record, or one without the field, reads as zero growth
        double previous = 0.0;
        if (prior != nullptr) {
            previous = prior->field(field).value_or(0.0);
        }
        return current && *current >= config_.growth_threshold &&
               previous >= config_.prior_growth_floor;
    }

    core::StageResult FundamentalStage::evaluate(const StageInput& input) const {
        core::StageResult result = makeResult(input, id());

        const core::SeriesBar* latest = input.fundamental.latest();
        if (latest == nullptr) {
            return fail(result, "no fundamental record");
        }
        const core::SeriesBar* prior = input.fundamental.fromEnd(1);

        auto market_cap = latest->field(core::fields::MARKET_CAP);
        if (!market_cap) {
            return fail(result, "market cap missing");
        }
        if (*market_cap < config_.min_market_cap || *market_cap > config_.max_market_cap) {
            return fail(result, fmt::format("market cap {:.0f} outside [{:.0f}, {:.0f}]",
                                            *market_cap, config_.min_market_cap, config_.max_market_cap));
        }

        if (!growthHolds(*latest, prior, core::fields::REV_YOY) &&
            !growthHolds(*latest, prior, core::fields::EPS_YOY)) {
            return fail(result, "revenue and EPS growth below threshold");
        }

        auto revenue = latest->field(core::fields::REVENUE);
        if (!revenue || *revenue <= 0.0) {
            return fail(result, "revenue missing or not positive");
        }

        result.passed = true;
        result.score = 1.0;
        return result;
    }

    std::string FundamentalStage::describe() const {
        return fmt::format("F: cap in [{:.0f}, {:.0f}], {} or {} >= {:.2f} (prior >= {:.2f}), revenue > 0",
                           config_.min_market_cap, config_.max_market_cap,
                           core::fields::REV_YOY, core::fields::EPS_YOY,
                           config_.growth_threshold, config_.prior_growth_floor);
    }

} // namespace pipeline
