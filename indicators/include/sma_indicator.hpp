#pragma once

#include "indicators.hpp" // Base interface
#include <vector>
#include <string>

namespace indicators {

class SmaIndicator : public IIndicator {
public:
    // Output field defaults to "SMA<period>"
    explicit SmaIndicator(int period, PriceSource source = PriceSource::Close, std::string name = "");

    ~SmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::SeriesBar>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    // Shared with the other TA_MA based indicators. A non-finite input blanks
    // (NaN) only the outputs whose window contains it.
    static bool computeSma(const std::vector<double>& values, int period,
                           int& out_begin, core::TimeSeries<double>& out);

private:
    const int period_;
    PriceSource source_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
