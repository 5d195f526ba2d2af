#pragma once

#include "signal_provider.hpp"
#include <string>

namespace signals {

    // Trend follower on two EMAs. Goes long when the long EMA is not falling
    // (slope > -0.1%), the mid EMA rises and close is above the close of
    // momentum_period bars ago; goes short on the mirrored condition. The last
    // state is held until the opposite condition fires.
    class MaTrendSignal : public ISignalProvider {
    public:
        MaTrendSignal(int momentum_period = 13, int mid_period = 21, int long_period = 55,
                      std::string name = "ma_trend");

        std::string getName() const override { return name_; }
        core::SignalSeries calculate(const core::TimeSeries<core::Candle>& candles) override;

    private:
        int momentum_period_;
        int mid_period_;
        int long_period_;
        std::string name_;
    };

} // namespace signals
