#pragma once

#include "interfaces.hpp"
#include "profile.hpp"

namespace pipeline {

    // --- WeeklyStage (W) ---
    // Stock near its highs with a stable 52-week high and the yearly high
    // equal to the two-year high.
    class WeeklyStage : public IStage {
    public:
        explicit WeeklyStage(config::WeeklyStageConfig config);

        core::StageId id() const override { return core::StageId::Weekly; }
        core::StageResult evaluate(const StageInput& input) const override;
        std::string describe() const override;

    private:
        config::WeeklyStageConfig config_;
    };

} // namespace pipeline
