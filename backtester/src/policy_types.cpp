#include "policy_types.hpp"
#include "exceptions.hpp"
#include <algorithm>
#include <cctype>

namespace backtester {

namespace {
    std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }
} // anonymous namespace

PositionSizing parsePositionSizing(const std::string& id) {
    const std::string key = toLower(id);
    if (key == "fixed") return PositionSizing::Fixed;
    if (key == "percent" || key == "percent_of_equity") return PositionSizing::PercentOfEquity;
    if (key == "kelly" || key == "kelly_approx") return PositionSizing::KellyApprox;
    if (key == "volatility" || key == "volatility_adjusted") return PositionSizing::VolatilityAdjusted;
    if (key == "pyramid") return PositionSizing::Pyramid;
    throw core::ConfigException("Unknown position sizing policy: '" + id + "'");
}

StopLossType parseStopLossType(const std::string& id) {
    const std::string key = toLower(id);
    if (key == "fixed") return StopLossType::Fixed;
    if (key == "trailing") return StopLossType::Trailing;
    if (key == "atr") return StopLossType::Atr;
    if (key == "composite") return StopLossType::Composite;
    throw core::ConfigException("Unknown stop loss policy: '" + id + "'");
}

std::string toString(PositionSizing sizing) {
    switch (sizing) {
        case PositionSizing::Fixed:              return "fixed";
        case PositionSizing::PercentOfEquity:    return "percent";
        case PositionSizing::KellyApprox:        return "kelly";
        case PositionSizing::VolatilityAdjusted: return "volatility";
        case PositionSizing::Pyramid:            return "pyramid";
    }
    return "unknown";
}

std::string toString(StopLossType type) {
    switch (type) {
        case StopLossType::Fixed:     return "fixed";
        case StopLossType::Trailing:  return "trailing";
        case StopLossType::Atr:       return "atr";
        case StopLossType::Composite: return "composite";
    }
    return "unknown";
}

} // namespace backtester
