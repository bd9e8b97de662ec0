#pragma once

#include "interfaces.hpp"
#include "profile.hpp"

namespace pipeline {

    // --- FundamentalStage (F) ---
    // Market cap band, year-over-year growth on revenue or EPS, positive revenue.
    class FundamentalStage : public IStage {
    public:
        explicit FundamentalStage(config::FundamentalStageConfig config);

        core::StageId id() const override { return core::StageId::Fundamental; }
        core::StageResult evaluate(const StageInput& input) const override;
        std::string describe() const override;

    private:
        bool growthHolds(const core::SeriesBar& latest, const core::SeriesBar* prior,
                         const std::string& field) const;

        config::FundamentalStageConfig config_;
    };

} // namespace pipeline
