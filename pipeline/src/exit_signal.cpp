#include "exit_signal.hpp"

#include <cmath>

namespace pipeline {

    ExitSignal::ExitSignal(std::string field) : field_(std::move(field)) {}

    bool ExitSignal::shouldExit(const core::SeriesBar& decision_bar) const {
        auto average = decision_bar.field(field_);
        if (!average || !std::isfinite(decision_bar.close)) {
            return false;
        }
        return decision_bar.close < *average;
    }

} // namespace pipeline
