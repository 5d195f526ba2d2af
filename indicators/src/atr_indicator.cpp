#include "atr_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

AtrIndicator::AtrIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("ATR period must be positive.");
    }
    lookback_ = TA_TRANGE_Lookback() + TA_MA_Lookback(period_, TA_MAType_SMA);
    name_ = fmt::format("ATR({})", period_);
    core::logging::getLogger()->debug("AtrIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string AtrIndicator::getName() const {
    return name_;
}

int AtrIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& AtrIndicator::getResult() const {
    return results_;
}

void AtrIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    std::vector<double> highs = extractField(input, InputField::High);
    std::vector<double> lows = extractField(input, InputField::Low);
    std::vector<double> closes = extractField(input, InputField::Close);
    const int last_idx = static_cast<int>(input.size()) - 1;

    // Pass 1: true range, starting at bar 1
    std::vector<double> true_range(input.size());
    int tr_begin = 0;
    int tr_count = 0;
    TA_RetCode ret_code = TA_TRANGE(0, last_idx, highs.data(), lows.data(), closes.data(),
                                    &tr_begin, &tr_count, true_range.data());
    if (ret_code != TA_SUCCESS) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_TRANGE failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }
    true_range.resize(static_cast<size_t>(tr_count));

    // Pass 2: simple average of the true range
    results_.resize(true_range.size());
    int out_begin_idx = 0;
    int out_nb_element = 0;
    ret_code = TA_MA(0, tr_count - 1, true_range.data(), period_, TA_MAType_SMA,
                     &out_begin_idx, &out_nb_element, results_.data());
    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_MA over true range failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }
    results_.resize(static_cast<size_t>(out_nb_element));

    if (tr_begin + out_begin_idx != lookback_) {
        logger->warn("{} first output at bar {} but lookback is {}. Results might be misaligned.",
                     name_, tr_begin + out_begin_idx, lookback_);
    }
    logger->trace("Successfully calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
