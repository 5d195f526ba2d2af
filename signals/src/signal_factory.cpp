#include "signal_factory.hpp"
#include "ma_trend_signal.hpp"
#include "sma_cross_signal.hpp"
#include "static_signal.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <stdexcept>
#include <string>

namespace signals {

std::unique_ptr<ISignalProvider> SignalFactory::create(const json& config) {
    using core::utils::jsonValue;
    auto logger = core::logging::getLogger();

    if (!config.is_object() || !config.contains("type") || !config["type"].is_string()) {
        throw core::ConfigException("Signal provider config must be an object with a 'type' (string).");
    }
    const std::string type = config["type"].get<std::string>();
    logger->debug("Creating signal provider of type '{}'", type);

    try {
        if (type == "ma_trend") {
            return std::make_unique<MaTrendSignal>(
                jsonValue(config, "p1", 13),
                jsonValue(config, "p2", 21),
                jsonValue(config, "p3", 55),
                jsonValue<std::string>(config, "name", "ma_trend"));
        }
        if (type == "sma_cross") {
            return std::make_unique<SmaCrossSignal>(
                jsonValue(config, "fast", 10),
                jsonValue(config, "slow", 30),
                jsonValue(config, "allow_short", false),
                jsonValue<std::string>(config, "name", "sma_cross"));
        }
        if (type == "static") {
            if (!config.contains("signals") || !config["signals"].is_array()) {
                throw core::ConfigException("Static signal provider requires a 'signals' array.");
            }
            return std::make_unique<StaticSignal>(
                jsonValue<core::SignalSeries>(config, "signals", {}),
                jsonValue<std::string>(config, "name", "static"));
        }
    } catch (const std::invalid_argument& e) {
        throw core::ConfigException("Invalid parameters for signal provider '" + type + "': " + e.what());
    }

    throw core::ConfigException("Unknown signal provider type: '" + type + "'");
}

} // namespace signals
