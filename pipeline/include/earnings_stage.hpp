#pragma once

#include "interfaces.hpp"
#include "profile.hpp"

namespace pipeline {

    // --- EarningsStage (E) ---
    // Revenue or EPS growth must be accelerating: the prior record's YoY is at
    // least growth_floor and the latest record's YoY is higher still.
    class EarningsStage : public IStage {
    public:
        explicit EarningsStage(config::EarningsStageConfig config);

        core::StageId id() const override { return core::StageId::Earnings; }
        core::StageResult evaluate(const StageInput& input) const override;
        std::string describe() const override;

    private:
        config::EarningsStageConfig config_;
    };

} // namespace pipeline
