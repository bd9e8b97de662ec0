#pragma once

#include "datatypes.hpp" // Needs SeriesBar, TimeSeries
#include <string>
#include <vector>

namespace indicators {

// Which bar price an indicator reads
enum class PriceSource {
    Open,
    High,
    Low,
    Close
};

std::vector<double> extractPrices(const core::TimeSeries<core::SeriesBar>& input, PriceSource source);

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Name used as the output field (e.g. "SMA50")
    virtual std::string getName() const = 0;

    // Number of leading input bars that produce no output
    virtual int getLookback() const = 0;

    virtual void calculate(const core::TimeSeries<core::SeriesBar>& input) = 0;

    // results[i] belongs to input[i + getLookback()]
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

} // namespace indicators
