#include "ema_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

EmaIndicator::EmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("EMA period must be positive.");
    }
    lookback_ = TA_MA_Lookback(period_, TA_MAType_EMA);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(fmt::format("TA_MA_Lookback returned an unexpected value: {}", lookback_));
    }
    name_ = fmt::format("EMA({})", period_);
}

std::string EmaIndicator::getName() const {
    return name_;
}

int EmaIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& EmaIndicator::getResult() const {
    return results_;
}

void EmaIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    results_.clear();
    if (input.size() <= static_cast<size_t>(lookback_)) {
        core::logging::getLogger()->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                                          input.size(), lookback_, name_);
        return;
    }

    std::vector<double> close_prices = extractField(input, InputField::Close);
    results_.resize(close_prices.size() - static_cast<size_t>(lookback_));

    int out_begin_idx = 0;
    int out_nb_element = 0;
    TA_RetCode ret_code = TA_MA(0, static_cast<int>(close_prices.size()) - 1, close_prices.data(),
                                period_, TA_MAType_EMA, &out_begin_idx, &out_nb_element, results_.data());
    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_MA (EMA) failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }
    results_.resize(static_cast<size_t>(out_nb_element));
}

} // namespace indicators
