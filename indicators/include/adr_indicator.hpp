#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Average daily range in percent: SMA of (high - low) / close * 100
class AdrIndicator : public IIndicator {
public:
    explicit AdrIndicator(int period = 20);

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::SeriesBar>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    int lookback_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
