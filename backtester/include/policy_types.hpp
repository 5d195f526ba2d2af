#pragma once

#include <string>

namespace backtester {

    enum class PositionSizing {
        Fixed,              // min(capital, initial_capital * max fraction)
        PercentOfEquity,    // capital * max fraction
        KellyApprox,        // fixed illustrative win rate / payoff constants
        VolatilityAdjusted, // max fraction scaled by price / ATR, never above it
        Pyramid             // max fraction on entry, scaled add-on legs afterwards
    };

    enum class StopLossType {
        Fixed,
        Trailing,
        Atr,
        Composite
    };

    // Accepts "fixed", "percent", "kelly", "volatility", "pyramid" (case-insensitive)
    // as well as the enum names, e.g. "PERCENT_OF_EQUITY". Throws core::ConfigException otherwise.
    PositionSizing parsePositionSizing(const std::string& id);
    StopLossType parseStopLossType(const std::string& id);

    std::string toString(PositionSizing sizing);
    std::string toString(StopLossType type);

} // namespace backtester
