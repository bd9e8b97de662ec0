#include "rolling_extreme_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

RollingExtremeIndicator::RollingExtremeIndicator(int period, Extreme extreme, PriceSource source, std::string name)
    : period_(period), extreme_(extreme), source_(source), lookback_(0), name_(std::move(name)) {
    if (period_ < 2) {
        // TA_MAX / TA_MIN accept periods from 2
        throw std::invalid_argument("Rolling extreme period must be at least 2.");
    }
    lookback_ = extreme_ == Extreme::Max ? TA_MAX_Lookback(period_) : TA_MIN_Lookback(period_);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(fmt::format("TA lookback returned an unexpected value: {}", lookback_));
    }
}

std::string RollingExtremeIndicator::getName() const {
    return name_;
}

int RollingExtremeIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& RollingExtremeIndicator::getResult() const {
    return results_;
}

void RollingExtremeIndicator::calculate(const core::TimeSeries<core::SeriesBar>& input) {
    results_.clear();
    if (input.size() <= static_cast<size_t>(lookback_)) {
        return;
    }

    std::vector<double> values = extractPrices(input, source_);
    results_.resize(values.size() - static_cast<size_t>(lookback_));
    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code;
    if (extreme_ == Extreme::Max) {
        ret_code = TA_MAX(0, static_cast<int>(values.size()) - 1, values.data(), period_,
                          &out_begin_idx, &out_nb_element, results_.data());
    } else {
        ret_code = TA_MIN(0, static_cast<int>(values.size()) - 1, values.data(), period_,
                          &out_begin_idx, &out_nb_element, results_.data());
    }

    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA-Lib rolling extreme failed for {} with error code: {}", name_, static_cast<int>(ret_code)));
    }
    results_.resize(static_cast<size_t>(out_nb_element));
}

} // namespace indicators
