#include "sma_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"            // TA-Lib C API header
#include <cmath>
#include <limits>
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

std::vector<double> extractPrices(const core::TimeSeries<core::SeriesBar>& input, PriceSource source) {
    std::vector<double> prices;
    prices.reserve(input.size());
    for (const auto& bar : input) {
        switch (source) {
            case PriceSource::Open:  prices.push_back(bar.open); break;
            case PriceSource::High:  prices.push_back(bar.high); break;
            case PriceSource::Low:   prices.push_back(bar.low); break;
            case PriceSource::Close: prices.push_back(bar.close); break;
        }
    }
    return prices;
}

SmaIndicator::SmaIndicator(int period, PriceSource source, std::string name)
    : period_(period), source_(source), lookback_(0), name_(std::move(name)) {
    if (period_ <= 0) {
         throw std::invalid_argument("SMA period must be positive.");
    }

    lookback_ = TA_MA_Lookback(period_, TA_MAType_SMA);
    if (lookback_ < 0) {
         throw core::IndicatorCalculationException(fmt::format("TA_MA_Lookback returned an unexpected value: {}", lookback_));
    }

    if (name_.empty()) {
        name_ = fmt::format("SMA{}", period_);
    }
}

std::string SmaIndicator::getName() const {
    return name_;
}

int SmaIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& SmaIndicator::getResult() const {
    return results_;
}

bool SmaIndicator::computeSma(const std::vector<double>& values, int period,
                              int& out_begin, core::TimeSeries<double>& out) {
    out.clear();
    out_begin = 0;
    int lookback = TA_MA_Lookback(period, TA_MAType_SMA);
    if (values.size() <= static_cast<size_t>(lookback)) {
        return true; // Not enough data, nothing to output
    }

    // TA_MA keeps a running sum, so it only ever sees runs of finite values.
    // Outputs whose window touches a non-finite value stay NaN.
    out.assign(values.size() - static_cast<size_t>(lookback), std::numeric_limits<double>::quiet_NaN());
    out_begin = lookback;
    std::vector<double> run_out;
    size_t run_start = 0;
    while (run_start < values.size()) {
        while (run_start < values.size() && !std::isfinite(values[run_start])) {
            ++run_start;
        }
        size_t run_end = run_start;
        while (run_end < values.size() && std::isfinite(values[run_end])) {
            ++run_end;
        }
        const size_t run_size = run_end - run_start;
        if (run_size > static_cast<size_t>(lookback)) {
            run_out.resize(run_size - static_cast<size_t>(lookback));
            int run_begin = 0;
            int out_nb_element = 0;
            TA_RetCode ret_code = TA_MA(
                0,
                static_cast<int>(run_size) - 1,
                values.data() + run_start,
                period,
                TA_MAType_SMA,
                &run_begin,
                &out_nb_element,
                run_out.data()
            );
            if (ret_code != TA_SUCCESS) {
                core::logging::getLogger()->error("TA-Lib TA_MA failed (period {}) with error code: {}",
                                                  period, static_cast<int>(ret_code));
                out.clear();
                return false;
            }
            // run_out[k] belongs to values[run_start + run_begin + k]
            for (int k = 0; k < out_nb_element; ++k) {
                out[run_start + static_cast<size_t>(run_begin + k - lookback)] = run_out[static_cast<size_t>(k)];
            }
        }
        run_start = run_end;
    }
    return true;
}

void SmaIndicator::calculate(const core::TimeSeries<core::SeriesBar>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);

    int out_begin_idx = 0;
    if (!computeSma(extractPrices(input, source_), period_, out_begin_idx, results_)) {
        throw core::IndicatorCalculationException(fmt::format("TA_MA failed for {}", name_));
    }

    if (!results_.empty() && out_begin_idx != lookback_) {
         logger->warn("TA_MA out_begin_idx ({}) does not match calculated lookback ({}) for {}. Results might be misaligned.",
                      out_begin_idx, lookback_, name_);
    }
    logger->trace("Calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
