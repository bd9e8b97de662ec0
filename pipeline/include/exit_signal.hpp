#pragma once

#include <string>

#include "datatypes.hpp"

namespace pipeline {

    // Sell signal on an open position: decision-bar close below a moving
    // average field. A missing field never triggers an exit.
    class ExitSignal {
    public:
        explicit ExitSignal(std::string field = core::fields::SMA20);

        bool shouldExit(const core::SeriesBar& decision_bar) const;
        const std::string& field() const { return field_; }

    private:
        std::string field_;
    };

} // namespace pipeline
