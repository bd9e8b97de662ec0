#include "daily_breakout_stage.hpp"
#include "relative_strength_stage.hpp"
#include "exceptions.hpp"

#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace pipeline {

    DailyBreakoutStage::DailyBreakoutStage(config::DailyBreakoutStageConfig config,
                                           config::RelativeStrengthStageConfig rs_config)
        : config_(std::move(config)), rs_config_(std::move(rs_config)) {
        if (config_.windows.empty()) {
            throw core::StageException("DailyBreakoutStage requires at least one lookback window");
        }
    }

    bool DailyBreakoutStage::trendGateHolds(const core::SeriesBar& decision_bar, std::string& reason) const {
        auto momentum = decision_bar.field(config_.momentum_field);
        auto short_ma = decision_bar.field(config_.short_ma_field);
        auto long_ma = decision_bar.field(config_.long_ma_field);
        if (!momentum || !short_ma || !long_ma) {
            reason = "moving average fields missing";
            return false;
        }
        if (*momentum < config_.min_long_ma_momentum) {
            reason = fmt::format("{} {:.3f} below {:.3f}", config_.momentum_field, *momentum, config_.min_long_ma_momentum);
            return false;
        }
        if (!(*short_ma > *long_ma)) {
            reason = fmt::format("{} not above {}", config_.short_ma_field, config_.long_ma_field);
            return false;
        }
        if (!RelativeStrengthStage::holds(decision_bar, rs_config_.field, rs_config_.threshold)) {
            reason = fmt::format("{} below {:.1f}", rs_config_.field, rs_config_.threshold);
            return false;
        }
        return true;
    }

    std::optional<DailyBreakoutStage::Breakout> DailyBreakoutStage::checkWindow(
            const StageInput& input, double decision_high, std::size_t window_index) const {
        const core::ModeTraits traits = core::modeTraits(input.mode);
        const config::LookbackWindow& window = config_.windows[window_index];

        auto level = input.daily.highestHigh(window.bars, traits.window_offset);
        if (!level || *level <= 0.0) {
            return std::nullopt; // Not enough history for this window
        }
        bool breakout = traits.breakout_when_exceeded ? decision_high > *level
                                                      : decision_high < *level;
        if (!breakout) {
            return std::nullopt;
        }
        return Breakout{*level, window_index};
    }

    core::StageResult& DailyBreakoutStage::emit(core::StageResult& result, const Breakout& breakout,
                                                const std::string& prefix) const {
        const std::size_t count = config_.windows.size();
        result.passed = true;
        result.target_price = breakout.level;
        result.stop_price = breakout.level * (1.0 - config_.stop_loss_fraction);
        result.signal_label = prefix + "_" + config_.windows[breakout.window_index].label;
        // Longer windows rank higher: first window scores 1, last 1/count
        result.score = static_cast<double>(count - breakout.window_index) / static_cast<double>(count);
        result.reason.clear();
        return result;
    }

    core::StageResult DailyBreakoutStage::evaluate(const StageInput& input) const {
        core::StageResult result = makeResult(input, id());

        const core::SeriesBar* decision_bar = input.daily.latest();
        if (decision_bar == nullptr) {
            return fail(result, "no daily bar at decision time");
        }
        if (!std::isfinite(decision_bar->high)) {
            return fail(result, "decision bar high not finite");
        }
        const double decision_high = decision_bar->high;

        std::string gate_reason;
        if (trendGateHolds(*decision_bar, gate_reason)) {
            for (std::size_t i = 0; i < config_.windows.size(); ++i) {
                if (auto breakout = checkWindow(input, decision_high, i)) {
                    return emit(result, *breakout, "Breakout");
                }
            }
            gate_reason = "no lookback window broke out";
        }

        if (config_.alternate_rs_enabled &&
            RelativeStrengthStage::holds(*decision_bar, config_.alternate_rs_field, rs_config_.threshold)) {
            for (std::size_t i = 0; i < config_.windows.size(); ++i) {
                if (config_.windows[i].label != config_.alternate_window_label) {
                    continue;
                }
                if (auto breakout = checkWindow(input, decision_high, i)) {
                    return emit(result, *breakout, config_.alternate_rs_field);
                }
            }
        }

        return fail(result, gate_reason);
    }

    std::string DailyBreakoutStage::describe() const {
        std::string windows;
        for (const auto& window : config_.windows) {
            if (!windows.empty()) windows += ",";
            windows += fmt::format("{}={}", window.label, window.bars);
        }
        return fmt::format("D: {} >= {:.2f}, {} > {}, {} >= {:.1f}, windows [{}], stop {:.1f}% below target",
                           config_.momentum_field, config_.min_long_ma_momentum,
                           config_.short_ma_field, config_.long_ma_field,
                           rs_config_.field, rs_config_.threshold,
                           windows, config_.stop_loss_fraction * 100.0);
    }

} // namespace pipeline
