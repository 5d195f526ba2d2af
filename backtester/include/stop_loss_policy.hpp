#pragma once

#include "backtest_config.hpp"
#include "backtest_types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace backtester {

    // A stop component yields a price or nothing when it is disabled for this bar
    class IStopLossPolicy {
    public:
        virtual ~IStopLossPolicy() = default;
        virtual std::string getName() const = 0;
        virtual std::optional<double> stopPrice(const Position& position, std::optional<double> atr) const = 0;
    };

    // entry_price * (1 - fraction * direction); disabled for fraction <= 0
    class FixedStopLoss : public IStopLossPolicy {
    public:
        explicit FixedStopLoss(double stop_fraction);
        std::string getName() const override { return "fixed"; }
        std::optional<double> stopPrice(const Position& position, std::optional<double> atr) const override;
    private:
        double stop_fraction_;
    };

    // watermark * (1 -/+ trailing_fraction); behaves like FixedStopLoss when no trailing fraction is set
    class TrailingStopLoss : public IStopLossPolicy {
    public:
        TrailingStopLoss(std::optional<double> trailing_fraction, double fallback_stop_fraction);
        std::string getName() const override { return "trailing"; }
        std::optional<double> stopPrice(const Position& position, std::optional<double> atr) const override;
    private:
        std::optional<double> trailing_fraction_;
        FixedStopLoss fallback_;
    };

    // entry_price - multiplier * ATR * direction; disabled without a positive ATR
    class AtrStopLoss : public IStopLossPolicy {
    public:
        explicit AtrStopLoss(double multiplier);
        std::string getName() const override { return "atr"; }
        std::optional<double> stopPrice(const Position& position, std::optional<double> atr) const override;
    private:
        double multiplier_;
    };

    // Most protective of the enabled components: highest for longs, lowest for shorts
    class CompositeStopLoss : public IStopLossPolicy {
    public:
        explicit CompositeStopLoss(std::vector<std::unique_ptr<IStopLossPolicy>> components);
        std::string getName() const override { return "composite"; }
        std::optional<double> stopPrice(const Position& position, std::optional<double> atr) const override;
        std::size_t componentCount() const { return components_.size(); }
    private:
        std::vector<std::unique_ptr<IStopLossPolicy>> components_;
    };

    std::unique_ptr<IStopLossPolicy> makeStopLossPolicy(const BacktestConfig& config);

    // Folds a bar's range into the watermark: highest high for longs, lowest low for shorts
    void updateWatermark(Position& position, double bar_high, double bar_low);

    // True when the bar's range reached the stop price
    bool stopBreached(const Position& position, double stop_price, double bar_high, double bar_low);

} // namespace backtester
