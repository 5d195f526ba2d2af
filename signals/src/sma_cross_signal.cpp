#include "sma_cross_signal.hpp"
#include "sma_indicator.hpp"
#include <stdexcept>
#include <utility>

namespace signals {

SmaCrossSignal::SmaCrossSignal(int fast_period, int slow_period, bool allow_short, std::string name)
    : fast_period_(fast_period), slow_period_(slow_period), allow_short_(allow_short), name_(std::move(name)) {
    if (fast_period_ <= 0 || slow_period_ <= 0) {
        throw std::invalid_argument("SmaCrossSignal periods must be positive.");
    }
    if (fast_period_ >= slow_period_) {
        throw std::invalid_argument("SmaCrossSignal fast period must be shorter than the slow period.");
    }
}

core::SignalSeries SmaCrossSignal::calculate(const core::TimeSeries<core::Candle>& candles) {
    const std::size_t n = candles.size();
    core::SignalSeries result(n, 0);

    indicators::SmaIndicator fast_sma(fast_period_);
    indicators::SmaIndicator slow_sma(slow_period_);
    fast_sma.calculate(candles);
    slow_sma.calculate(candles);
    const indicators::AlignedSeries fast(fast_sma, n);
    const indicators::AlignedSeries slow(slow_sma, n);

    for (std::size_t i = 0; i < n; ++i) {
        auto fast_value = fast.at(i);
        auto slow_value = slow.at(i);
        if (!fast_value || !slow_value) {
            continue;
        }
        if (*fast_value > *slow_value) {
            result[i] = 1;
        } else if (*fast_value < *slow_value && allow_short_) {
            result[i] = -1;
        }
    }
    return result;
}

} // namespace signals
