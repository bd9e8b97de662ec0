#pragma once

#include "interfaces.hpp"
#include "profile.hpp"

namespace pipeline {

    // --- RelativeStrengthStage (RS) ---
    // Relative strength rank on the decision bar at or above the threshold.
    class RelativeStrengthStage : public IStage {
    public:
        explicit RelativeStrengthStage(config::RelativeStrengthStageConfig config);

        core::StageId id() const override { return core::StageId::RelativeStrength; }
        core::StageResult evaluate(const StageInput& input) const override;
        std::string describe() const override;

        // Shared with the breakout stage, which repeats the RS gate
        static bool holds(const core::SeriesBar& bar, const std::string& field, double threshold);

    private:
        config::RelativeStrengthStageConfig config_;
    };

} // namespace pipeline
