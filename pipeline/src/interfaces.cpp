#include "interfaces.hpp"

namespace pipeline {

    StageInput StageInput::fromSeries(const data::SymbolSeries& series,
                                      core::Timestamp decision_time,
                                      core::Mode mode) {
        StageInput input;
        input.symbol = series.symbol();
        input.decision_time = decision_time;
        input.mode = mode;
        input.daily = series.window(data::Timeframe::Daily, decision_time);
        input.weekly = series.window(data::Timeframe::Weekly, decision_time);
        input.fundamental = series.window(data::Timeframe::Fundamental, decision_time);
        input.earnings = series.window(data::Timeframe::Earnings, decision_time);
        return input;
    }

    core::StageResult makeResult(const StageInput& input, core::StageId stage) {
        core::StageResult result;
        result.symbol = input.symbol;
        result.stage = stage;
        result.decision_time = input.decision_time;
        return result;
    }

    core::StageResult& fail(core::StageResult& result, const std::string& reason) {
        result.passed = false;
        result.score = 0.0;
        result.target_price.reset();
        result.stop_price.reset();
        result.signal_label.reset();
        result.reason = reason;
        return result;
    }

} // namespace pipeline
