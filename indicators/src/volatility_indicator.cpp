#include "volatility_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

VolatilityIndicator::VolatilityIndicator(int period) : period_(period), lookback_(0) {
    if (period_ < 2) {
        throw std::invalid_argument("Volatility period must be at least 2.");
    }
    lookback_ = TA_ROCP_Lookback(1) + TA_STDDEV_Lookback(period_, 1.0);
    name_ = fmt::format("VOL({})", period_);
}

std::string VolatilityIndicator::getName() const {
    return name_;
}

int VolatilityIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& VolatilityIndicator::getResult() const {
    return results_;
}

void VolatilityIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    results_.clear();
    if (input.size() <= static_cast<size_t>(lookback_)) {
        core::logging::getLogger()->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                                          input.size(), lookback_, name_);
        return;
    }

    std::vector<double> close_prices = extractField(input, InputField::Close);

    // Pass 1: (close - prev_close) / prev_close
    std::vector<double> returns(close_prices.size());
    int ret_begin = 0;
    int ret_count = 0;
    TA_RetCode ret_code = TA_ROCP(0, static_cast<int>(close_prices.size()) - 1, close_prices.data(), 1,
                                  &ret_begin, &ret_count, returns.data());
    if (ret_code != TA_SUCCESS) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_ROCP failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }
    returns.resize(static_cast<size_t>(ret_count));

    // Pass 2: rolling standard deviation of those returns
    results_.resize(returns.size());
    int out_begin_idx = 0;
    int out_nb_element = 0;
    ret_code = TA_STDDEV(0, ret_count - 1, returns.data(), period_, 1.0,
                         &out_begin_idx, &out_nb_element, results_.data());
    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_STDDEV failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }
    results_.resize(static_cast<size_t>(out_nb_element));
}

} // namespace indicators
