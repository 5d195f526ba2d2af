#pragma once

#include "policy_types.hpp"
#include <optional>
#include <nlohmann/json.hpp>

namespace backtester {

    // Immutable settings for one simulation run
    struct BacktestConfig {
        double initial_capital = 100000.0;
        PositionSizing position_sizing = PositionSizing::Fixed;
        double max_position_fraction = 0.2;
        StopLossType stop_loss_type = StopLossType::Composite;
        double stop_loss_fraction = 0.05;                 // <= 0 disables the fixed stop
        std::optional<double> trailing_stop_fraction;     // absent: trailing stop falls back to fixed
        bool use_atr_stop = true;
        double atr_stop_multiplier = 2.0;
        double slippage_rate = 0.001;
        double commission_rate = 0.0003;
        int atr_period = 14;
        double pyramid_factor = 0.5;
        int max_pyramid_levels = 3;
        int time_stop_bars = 10;                          // 0 disables the time stop
        long long shares_per_lot = 100;
        double risk_free_rate = 0.0;                      // Annual, used by the run's Sharpe ratio

        // Missing keys keep their defaults. Throws core::ConfigException on bad
        // types, unknown policy identifiers or values rejected by validate().
        static BacktestConfig fromJson(const nlohmann::json& config);

        // Throws core::ConfigException describing the first invalid setting
        void validate() const;
    };

    nlohmann::json toJson(const BacktestConfig& config);

} // namespace backtester
