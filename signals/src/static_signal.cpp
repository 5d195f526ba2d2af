#include "static_signal.hpp"
#include <stdexcept>
#include <utility>

namespace signals {

StaticSignal::StaticSignal(core::SignalSeries series, std::string name)
    : series_(std::move(series)), name_(std::move(name)) {
    for (int value : series_) {
        if (value < -1 || value > 1) {
            throw std::invalid_argument("StaticSignal values must be -1, 0 or 1.");
        }
    }
}

core::SignalSeries StaticSignal::calculate(const core::TimeSeries<core::Candle>& /*candles*/) {
    return series_;
}

} // namespace signals
