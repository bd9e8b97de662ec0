#include "adr_indicator.hpp"
#include "sma_indicator.hpp"
#include "exceptions.hpp"
#include "ta_libc.h"
#include <cmath>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

AdrIndicator::AdrIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("ADR period must be positive.");
    }
    lookback_ = TA_MA_Lookback(period_, TA_MAType_SMA);
}

std::string AdrIndicator::getName() const {
    return core::fields::ADR;
}

int AdrIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& AdrIndicator::getResult() const {
    return results_;
}

void AdrIndicator::calculate(const core::TimeSeries<core::SeriesBar>& input) {
    std::vector<double> range_pct;
    range_pct.reserve(input.size());
    for (const auto& bar : input) {
        // Bars without a usable close count as zero range
        bool usable = bar.close > 0.0 && std::isfinite(bar.high) && std::isfinite(bar.low);
        range_pct.push_back(usable ? (bar.high - bar.low) / bar.close * 100.0 : 0.0);
    }

    int out_begin_idx = 0;
    if (!SmaIndicator::computeSma(range_pct, period_, out_begin_idx, results_)) {
        throw core::IndicatorCalculationException(fmt::format("TA_MA failed for ADR({})", period_));
    }
}

} // namespace indicators
