#include "macd_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

MacdIndicator::MacdIndicator(int fast_period, int slow_period, int signal_period)
    : fast_period_(fast_period), slow_period_(slow_period), signal_period_(signal_period), lookback_(0) {
    if (fast_period_ < 2 || slow_period_ < 2 || signal_period_ < 1) {
        throw std::invalid_argument("MACD periods must be >= 2 (fast, slow) and >= 1 (signal).");
    }
    if (fast_period_ >= slow_period_) {
        throw std::invalid_argument("MACD fast period must be shorter than the slow period.");
    }
    lookback_ = TA_MACD_Lookback(fast_period_, slow_period_, signal_period_);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(fmt::format("TA_MACD_Lookback returned an unexpected value: {}", lookback_));
    }
    name_ = fmt::format("MACD({},{},{})", fast_period_, slow_period_, signal_period_);
    core::logging::getLogger()->debug("MacdIndicator created: Name='{}', Lookback={}", name_, lookback_);
}

std::string MacdIndicator::getName() const {
    return name_;
}

int MacdIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& MacdIndicator::getResult() const {
    return histogram_;
}

void MacdIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    macd_line_.clear();
    signal_line_.clear();
    histogram_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        core::logging::getLogger()->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                                          input.size(), lookback_, name_);
        return;
    }

    std::vector<double> close_prices = extractField(input, InputField::Close);
    const size_t output_size = close_prices.size() - static_cast<size_t>(lookback_);
    macd_line_.resize(output_size);
    signal_line_.resize(output_size);
    histogram_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;
    TA_RetCode ret_code = TA_MACD(0, static_cast<int>(close_prices.size()) - 1, close_prices.data(),
                                  fast_period_, slow_period_, signal_period_,
                                  &out_begin_idx, &out_nb_element,
                                  macd_line_.data(), signal_line_.data(), histogram_.data());
    if (ret_code != TA_SUCCESS) {
        macd_line_.clear();
        signal_line_.clear();
        histogram_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_MACD failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    const auto produced = static_cast<size_t>(out_nb_element);
    macd_line_.resize(produced);
    signal_line_.resize(produced);
    histogram_.resize(produced);
}

} // namespace indicators
