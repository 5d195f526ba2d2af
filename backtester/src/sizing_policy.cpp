#include "sizing_policy.hpp"
#include <algorithm>
#include <cmath>

namespace backtester {

FixedSizing::FixedSizing(double max_position_fraction)
    : max_position_fraction_(max_position_fraction) {}

double FixedSizing::allocation(const SizingContext& context) const {
    return std::max(0.0, std::min(context.capital, context.initial_capital * max_position_fraction_));
}

PercentOfEquitySizing::PercentOfEquitySizing(double max_position_fraction)
    : max_position_fraction_(max_position_fraction) {}

double PercentOfEquitySizing::allocation(const SizingContext& context) const {
    return std::max(0.0, context.capital * max_position_fraction_);
}

KellyApproxSizing::KellyApproxSizing(double max_position_fraction)
    : max_position_fraction_(max_position_fraction) {}

double KellyApproxSizing::allocation(const SizingContext& context) const {
    double kelly = kAssumedWinRate - (1.0 - kAssumedWinRate) / kAssumedPayoffRatio;
    kelly = std::clamp(kelly, 0.0, max_position_fraction_);
    return std::max(0.0, context.capital * kelly);
}

VolatilityAdjustedSizing::VolatilityAdjustedSizing(double max_position_fraction)
    : max_position_fraction_(max_position_fraction) {}

double VolatilityAdjustedSizing::allocation(const SizingContext& context) const {
    double fraction = max_position_fraction_;
    if (context.atr && *context.atr > 0.0 && context.price > 0.0) {
        fraction = std::min(max_position_fraction_ * (context.price / *context.atr), max_position_fraction_);
    }
    return std::max(0.0, context.capital * fraction);
}

PyramidSizing::PyramidSizing(double max_position_fraction, double pyramid_factor)
    : max_position_fraction_(max_position_fraction), pyramid_factor_(pyramid_factor) {}

double PyramidSizing::allocation(const SizingContext& context) const {
    return std::max(0.0, context.capital * max_position_fraction_);
}

double PyramidSizing::addOnAllocation(double base_allocation, int level) const {
    return std::max(0.0, base_allocation * std::pow(pyramid_factor_, level));
}

std::unique_ptr<ISizingPolicy> makeSizingPolicy(const BacktestConfig& config) {
    switch (config.position_sizing) {
        case PositionSizing::Fixed:
            return std::make_unique<FixedSizing>(config.max_position_fraction);
        case PositionSizing::PercentOfEquity:
            return std::make_unique<PercentOfEquitySizing>(config.max_position_fraction);
        case PositionSizing::KellyApprox:
            return std::make_unique<KellyApproxSizing>(config.max_position_fraction);
        case PositionSizing::VolatilityAdjusted:
            return std::make_unique<VolatilityAdjustedSizing>(config.max_position_fraction);
        case PositionSizing::Pyramid:
            return std::make_unique<PyramidSizing>(config.max_position_fraction, config.pyramid_factor);
    }
    return std::make_unique<PercentOfEquitySizing>(config.max_position_fraction);
}

long long sharesForAllocation(double allocation, double fill_price, long long shares_per_lot) {
    if (allocation <= 0.0 || fill_price <= 0.0 || shares_per_lot <= 0 || !std::isfinite(allocation)) {
        return 0;
    }
    const double lots = std::floor(allocation / fill_price / static_cast<double>(shares_per_lot));
    return static_cast<long long>(lots) * shares_per_lot;
}

} // namespace backtester
