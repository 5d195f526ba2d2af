#include "backtest_config.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

namespace backtester {

namespace {
    void requireFraction(double value, const char* key) {
        if (value < 0.0 || value > 1.0) {
            throw core::ConfigException(fmt::format("'{}' must be within [0, 1], got {}", key, value));
        }
    }

    void requireNonNegative(double value, const char* key) {
        if (value < 0.0) {
            throw core::ConfigException(fmt::format("'{}' must not be negative, got {}", key, value));
        }
    }
} // anonymous namespace

BacktestConfig BacktestConfig::fromJson(const nlohmann::json& config) {
    using core::utils::jsonValue;

    if (!config.is_null() && !config.is_object()) {
        throw core::ConfigException("Backtest config must be a JSON object");
    }

    BacktestConfig result;
    result.initial_capital = jsonValue(config, "initial_capital", result.initial_capital);
    result.position_sizing = parsePositionSizing(
        jsonValue<std::string>(config, "position_sizing", toString(result.position_sizing)));
    result.max_position_fraction = jsonValue(config, "max_position_fraction", result.max_position_fraction);
    result.stop_loss_type = parseStopLossType(
        jsonValue<std::string>(config, "stop_loss_type", toString(result.stop_loss_type)));
    result.stop_loss_fraction = jsonValue(config, "stop_loss_fraction", result.stop_loss_fraction);
    if (config.is_object() && config.contains("trailing_stop_fraction") && !config["trailing_stop_fraction"].is_null()) {
        result.trailing_stop_fraction = jsonValue(config, "trailing_stop_fraction", 0.0);
    }
    result.use_atr_stop = jsonValue(config, "use_atr_stop", result.use_atr_stop);
    result.atr_stop_multiplier = jsonValue(config, "atr_stop_multiplier", result.atr_stop_multiplier);
    result.slippage_rate = jsonValue(config, "slippage_rate", result.slippage_rate);
    result.commission_rate = jsonValue(config, "commission_rate", result.commission_rate);
    result.atr_period = jsonValue(config, "atr_period", result.atr_period);
    result.pyramid_factor = jsonValue(config, "pyramid_factor", result.pyramid_factor);
    result.max_pyramid_levels = jsonValue(config, "max_pyramid_levels", result.max_pyramid_levels);
    result.time_stop_bars = jsonValue(config, "time_stop_bars", result.time_stop_bars);
    result.shares_per_lot = jsonValue(config, "shares_per_lot", result.shares_per_lot);
    result.risk_free_rate = jsonValue(config, "risk_free_rate", result.risk_free_rate);

    result.validate();
    return result;
}

void BacktestConfig::validate() const {
    if (initial_capital <= 0.0) {
        throw core::ConfigException(fmt::format("'initial_capital' must be positive, got {}", initial_capital));
    }
    if (shares_per_lot <= 0) {
        throw core::ConfigException(fmt::format("'shares_per_lot' must be positive, got {}", shares_per_lot));
    }
    if (atr_period <= 0) {
        throw core::ConfigException(fmt::format("'atr_period' must be positive, got {}", atr_period));
    }
    requireFraction(max_position_fraction, "max_position_fraction");
    requireFraction(stop_loss_fraction, "stop_loss_fraction");
    if (trailing_stop_fraction) {
        requireFraction(*trailing_stop_fraction, "trailing_stop_fraction");
    }
    requireNonNegative(atr_stop_multiplier, "atr_stop_multiplier");
    requireNonNegative(slippage_rate, "slippage_rate");
    requireNonNegative(commission_rate, "commission_rate");
    requireNonNegative(pyramid_factor, "pyramid_factor");
    if (max_pyramid_levels < 1) {
        throw core::ConfigException(fmt::format("'max_pyramid_levels' must be at least 1, got {}", max_pyramid_levels));
    }
    if (time_stop_bars < 0) {
        throw core::ConfigException(fmt::format("'time_stop_bars' must not be negative, got {}", time_stop_bars));
    }
}

nlohmann::json toJson(const BacktestConfig& config) {
    nlohmann::json j = {
        {"initial_capital", config.initial_capital},
        {"position_sizing", toString(config.position_sizing)},
        {"max_position_fraction", config.max_position_fraction},
        {"stop_loss_type", toString(config.stop_loss_type)},
        {"stop_loss_fraction", config.stop_loss_fraction},
        {"use_atr_stop", config.use_atr_stop},
        {"atr_stop_multiplier", config.atr_stop_multiplier},
        {"slippage_rate", config.slippage_rate},
        {"commission_rate", config.commission_rate},
        {"atr_period", config.atr_period},
        {"pyramid_factor", config.pyramid_factor},
        {"max_pyramid_levels", config.max_pyramid_levels},
        {"time_stop_bars", config.time_stop_bars},
        {"shares_per_lot", config.shares_per_lot},
        {"risk_free_rate", config.risk_free_rate}
    };
    j["trailing_stop_fraction"] = config.trailing_stop_fraction ? nlohmann::json(*config.trailing_stop_fraction)
                                                                : nlohmann::json(nullptr);
    return j;
}

} // namespace backtester
