#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Percent change of an SMA over `change_bars` bars (TA_MA then TA_ROC).
// SMA200_M = SmaMomentumIndicator(200, 3)
class SmaMomentumIndicator : public IIndicator {
public:
    SmaMomentumIndicator(int sma_period, int change_bars, std::string name);

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::SeriesBar>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int sma_period_;
    const int change_bars_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
