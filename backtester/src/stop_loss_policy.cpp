#include "stop_loss_policy.hpp"
#include <algorithm>
#include <utility>

namespace backtester {

FixedStopLoss::FixedStopLoss(double stop_fraction) : stop_fraction_(stop_fraction) {}

std::optional<double> FixedStopLoss::stopPrice(const Position& position, std::optional<double> /*atr*/) const {
    if (stop_fraction_ <= 0.0 || position.direction == core::Direction::Flat) {
        return std::nullopt;
    }
    return position.entry_price * (1.0 - stop_fraction_ * core::toInt(position.direction));
}

TrailingStopLoss::TrailingStopLoss(std::optional<double> trailing_fraction, double fallback_stop_fraction)
    : trailing_fraction_(trailing_fraction), fallback_(fallback_stop_fraction) {}

std::optional<double> TrailingStopLoss::stopPrice(const Position& position, std::optional<double> atr) const {
    if (!trailing_fraction_ || *trailing_fraction_ <= 0.0) {
        return fallback_.stopPrice(position, atr);
    }
    switch (position.direction) {
        case core::Direction::Long:  return position.watermark * (1.0 - *trailing_fraction_);
        case core::Direction::Short: return position.watermark * (1.0 + *trailing_fraction_);
        case core::Direction::Flat:  break;
    }
    return std::nullopt;
}

AtrStopLoss::AtrStopLoss(double multiplier) : multiplier_(multiplier) {}

std::optional<double> AtrStopLoss::stopPrice(const Position& position, std::optional<double> atr) const {
    if (!atr || *atr <= 0.0 || multiplier_ <= 0.0 || position.direction == core::Direction::Flat) {
        return std::nullopt;
    }
    return position.entry_price - multiplier_ * (*atr) * core::toInt(position.direction);
}

CompositeStopLoss::CompositeStopLoss(std::vector<std::unique_ptr<IStopLossPolicy>> components)
    : components_(std::move(components)) {}

std::optional<double> CompositeStopLoss::stopPrice(const Position& position, std::optional<double> atr) const {
    std::optional<double> result;
    for (const auto& component : components_) {
        auto price = component->stopPrice(position, atr);
        if (!price) {
            continue;
        }
        if (!result) {
            result = price;
        } else if (position.direction == core::Direction::Long) {
            result = std::max(*result, *price);
        } else {
            result = std::min(*result, *price);
        }
    }
    return result;
}

std::unique_ptr<IStopLossPolicy> makeStopLossPolicy(const BacktestConfig& config) {
    switch (config.stop_loss_type) {
        case StopLossType::Fixed:
            return std::make_unique<FixedStopLoss>(config.stop_loss_fraction);
        case StopLossType::Trailing:
            return std::make_unique<TrailingStopLoss>(config.trailing_stop_fraction, config.stop_loss_fraction);
        case StopLossType::Atr:
            return std::make_unique<AtrStopLoss>(config.use_atr_stop ? config.atr_stop_multiplier : 0.0);
        case StopLossType::Composite:
            break;
    }
    std::vector<std::unique_ptr<IStopLossPolicy>> components;
    components.push_back(std::make_unique<FixedStopLoss>(config.stop_loss_fraction));
    if (config.trailing_stop_fraction) {
        components.push_back(std::make_unique<TrailingStopLoss>(config.trailing_stop_fraction, config.stop_loss_fraction));
    }
    if (config.use_atr_stop) {
        components.push_back(std::make_unique<AtrStopLoss>(config.atr_stop_multiplier));
    }
    return std::make_unique<CompositeStopLoss>(std::move(components));
}

void updateWatermark(Position& position, double bar_high, double bar_low) {
    if (position.direction == core::Direction::Long) {
        position.watermark = std::max(position.watermark, bar_high);
    } else if (position.direction == core::Direction::Short) {
        position.watermark = std::min(position.watermark, bar_low);
    }
}

bool stopBreached(const Position& position, double stop_price, double bar_high, double bar_low) {
    switch (position.direction) {
        case core::Direction::Long:  return bar_low <= stop_price;
        case core::Direction::Short: return bar_high >= stop_price;
        case core::Direction::Flat:  break;
    }
    return false;
}

} // namespace backtester
