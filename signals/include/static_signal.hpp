#pragma once

#include "signal_provider.hpp"
#include <string>

namespace signals {

    // Replays a precomputed signal series, e.g. one exported by an external tool
    class StaticSignal : public ISignalProvider {
    public:
        StaticSignal(core::SignalSeries series, std::string name = "static");

        std::string getName() const override { return name_; }

        // Returns the stored series unchanged, whatever the candle count
        core::SignalSeries calculate(const core::TimeSeries<core::Candle>& candles) override;

    private:
        core::SignalSeries series_;
        std::string name_;
    };

} // namespace signals
