#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Rolling highest / lowest value over a fixed number of bars (TA_MAX / TA_MIN).
// The output at bar i covers bars [i - period + 1, i].
class RollingExtremeIndicator : public IIndicator {
public:
    enum class Extreme { Max, Min };

    RollingExtremeIndicator(int period, Extreme extreme, PriceSource source, std::string name);

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::SeriesBar>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    Extreme extreme_;
    PriceSource source_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
