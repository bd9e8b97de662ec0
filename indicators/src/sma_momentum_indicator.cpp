#include "sma_momentum_indicator.hpp"
#include "sma_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

SmaMomentumIndicator::SmaMomentumIndicator(int sma_period, int change_bars, std::string name)
    : sma_period_(sma_period), change_bars_(change_bars), lookback_(0), name_(std::move(name)) {
    if (sma_period_ <= 0 || change_bars_ <= 0) {
        throw std::invalid_argument("SMA momentum periods must be positive.");
    }
    lookback_ = TA_MA_Lookback(sma_period_, TA_MAType_SMA) + TA_ROC_Lookback(change_bars_);
}

std::string SmaMomentumIndicator::getName() const {
    return name_;
}

int SmaMomentumIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& SmaMomentumIndicator::getResult() const {
    return results_;
}

void SmaMomentumIndicator::calculate(const core::TimeSeries<core::SeriesBar>& input) {
    results_.clear();

    core::TimeSeries<double> sma;
    int sma_begin = 0;
    if (!SmaIndicator::computeSma(extractPrices(input, PriceSource::Close), sma_period_, sma_begin, sma)) {
        throw core::IndicatorCalculationException(fmt::format("TA_MA failed for {}", name_));
    }
    if (sma.size() <= static_cast<size_t>(change_bars_)) {
        return;
    }

    results_.resize(sma.size() - static_cast<size_t>(change_bars_));
    int out_begin_idx = 0;
    int out_nb_element = 0;
    // ROC = (sma / sma[change_bars back] - 1) * 100
    TA_RetCode ret_code = TA_ROC(0, static_cast<int>(sma.size()) - 1, sma.data(), change_bars_,
                                 &out_begin_idx, &out_nb_element, results_.data());
    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_ROC failed for {} with error code: {}", name_, static_cast<int>(ret_code)));
    }
    results_.resize(static_cast<size_t>(out_nb_element));
    core::logging::getLogger()->trace("Calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
