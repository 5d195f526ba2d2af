#pragma once

#include "backtest_config.hpp"
#include <memory>
#include <optional>
#include <string>

namespace backtester {

    // Inputs a sizing policy may consult when a new position is opened
    struct SizingContext {
        double capital = 0.0;          // Cash currently available
        double initial_capital = 0.0;
        double price = 0.0;            // Reference price of the bar
        std::optional<double> atr;     // Absent while ATR history is insufficient
    };

    class ISizingPolicy {
    public:
        virtual ~ISizingPolicy() = default;

        virtual std::string getName() const = 0;

        // Capital to commit to a new position. Never negative.
        virtual double allocation(const SizingContext& context) const = 0;

        // Whether the engine may add legs to a winning position
        virtual bool allowsPyramiding() const { return false; }

        // Capital for an add-on leg at the given current pyramid level
        virtual double addOnAllocation(double /*base_allocation*/, int /*level*/) const { return 0.0; }
    };

    class FixedSizing : public ISizingPolicy {
    public:
        explicit FixedSizing(double max_position_fraction);
        std::string getName() const override { return "fixed"; }
        double allocation(const SizingContext& context) const override;
    private:
        double max_position_fraction_;
    };

    class PercentOfEquitySizing : public ISizingPolicy {
    public:
        explicit PercentOfEquitySizing(double max_position_fraction);
        std::string getName() const override { return "percent"; }
        double allocation(const SizingContext& context) const override;
    private:
        double max_position_fraction_;
    };

    // Not a fitted Kelly estimator: the win rate and payoff ratio are fixed
    // illustrative constants, the resulting fraction is clamped to [0, max fraction].
    class KellyApproxSizing : public ISizingPolicy {
    public:
        static constexpr double kAssumedWinRate = 0.55;
        static constexpr double kAssumedPayoffRatio = 1.5;

        explicit KellyApproxSizing(double max_position_fraction);
        std::string getName() const override { return "kelly"; }
        double allocation(const SizingContext& context) const override;
    private:
        double max_position_fraction_;
    };

    // Scales the max fraction by price / ATR, capped at the max fraction.
    // Missing or zero ATR leaves the fraction unadjusted.
    class VolatilityAdjustedSizing : public ISizingPolicy {
    public:
        explicit VolatilityAdjustedSizing(double max_position_fraction);
        std::string getName() const override { return "volatility"; }
        double allocation(const SizingContext& context) const override;
    private:
        double max_position_fraction_;
    };

    class PyramidSizing : public ISizingPolicy {
    public:
        PyramidSizing(double max_position_fraction, double pyramid_factor);
        std::string getName() const override { return "pyramid"; }
        double allocation(const SizingContext& context) const override;
        bool allowsPyramiding() const override { return true; }
        // base_allocation * pyramid_factor ^ level
        double addOnAllocation(double base_allocation, int level) const override;
    private:
        double max_position_fraction_;
        double pyramid_factor_;
    };

    std::unique_ptr<ISizingPolicy> makeSizingPolicy(const BacktestConfig& config);

    // floor(allocation / fill_price / shares_per_lot) * shares_per_lot, 0 for degenerate inputs
    long long sharesForAllocation(double allocation, double fill_price, long long shares_per_lot);

} // namespace backtester
