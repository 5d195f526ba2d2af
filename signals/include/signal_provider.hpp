#pragma once

#include "datatypes.hpp"
#include <string>

namespace signals {

    // Produces one target exposure per candle: -1 short, 0 flat, 1 long.
    // calculate() must return exactly one value per input candle.
    class ISignalProvider {
    public:
        virtual ~ISignalProvider() = default;

        // Unique name of the provider instance, used as the strategy key in reports
        virtual std::string getName() const = 0;

        virtual core::SignalSeries calculate(const core::TimeSeries<core::Candle>& candles) = 0;
    };

} // namespace signals
