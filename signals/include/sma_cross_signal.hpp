#pragma once

#include "signal_provider.hpp"
#include <string>

namespace signals {

    // Long while the fast SMA is above the slow SMA; below it the signal is
    // short when shorting is allowed, flat otherwise.
    class SmaCrossSignal : public ISignalProvider {
    public:
        SmaCrossSignal(int fast_period, int slow_period, bool allow_short = false,
                       std::string name = "sma_cross");

        std::string getName() const override { return name_; }
        core::SignalSeries calculate(const core::TimeSeries<core::Candle>& candles) override;

    private:
        int fast_period_;
        int slow_period_;
        bool allow_short_;
        std::string name_;
    };

} // namespace signals
