#include "rsi_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

RsiIndicator::RsiIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("RSI period must be positive.");
    }

    lookback_ = TA_RSI_Lookback(period_);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(fmt::format("TA_RSI_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("RSI({})", period_);
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& RsiIndicator::getResult() const {
    return results_;
}

void RsiIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    results_.clear();
    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("{}: {} bars do not cover the lookback of {}, no output", name_, input.size(), lookback_);
        return;
    }

    const std::vector<double> closes = extractField(input, InputField::Close);
    results_.resize(closes.size() - static_cast<size_t>(lookback_));

    int out_begin_idx = 0;
    int out_nb_element = 0;
    const TA_RetCode ret_code = TA_RSI(0, static_cast<int>(closes.size()) - 1, closes.data(), period_,
                                       &out_begin_idx, &out_nb_element, results_.data());
    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_RSI failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }
    if (out_begin_idx != lookback_) {
        logger->warn("{}: first output at bar {} but lookback is {}", name_, out_begin_idx, lookback_);
    }
    results_.resize(static_cast<size_t>(out_nb_element));
    logger->trace("{}: {} values", name_, results_.size());
}

} // namespace indicators
