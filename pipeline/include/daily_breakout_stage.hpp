#pragma once

#include <optional>

#include "interfaces.hpp"
#include "profile.hpp"

namespace pipeline {

    // --- DailyBreakoutStage (D) ---
    // Trend gate (long MA rising, short MA above long MA, RS gate) followed by a
    // scan of the lookback windows, longest first. The first window whose
    // breakout comparison holds sets the target (the window high) and the stop.
    //
    // Where the window ends and which way the comparison points come from
    // core::modeTraits(input.mode).
    class DailyBreakoutStage : public IStage {
    public:
        DailyBreakoutStage(config::DailyBreakoutStageConfig config,
                           config::RelativeStrengthStageConfig rs_config);

        core::StageId id() const override { return core::StageId::DailyBreakout; }
        core::StageResult evaluate(const StageInput& input) const override;
        std::string describe() const override;

    private:
        struct Breakout {
            double level = 0.0;
            std::size_t window_index = 0;
        };

        bool trendGateHolds(const core::SeriesBar& decision_bar, std::string& reason) const;
        std::optional<Breakout> checkWindow(const StageInput& input, double decision_high,
                                            std::size_t window_index) const;
        core::StageResult& emit(core::StageResult& result, const Breakout& breakout,
                                const std::string& prefix) const;

        config::DailyBreakoutStageConfig config_;
        config::RelativeStrengthStageConfig rs_config_;
    };

} // namespace pipeline
