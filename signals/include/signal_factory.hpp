#pragma once

#include "signal_provider.hpp"
#include <memory>
#include <nlohmann/json.hpp>

namespace signals {

    using json = nlohmann::json;

    class SignalFactory {
    public:
        // Builds a provider from {"type": "ma_trend" | "sma_cross" | "static", "name": ..., params...}.
        // Throws core::ConfigException on unknown types or invalid parameters.
        static std::unique_ptr<ISignalProvider> create(const json& config);
    };

} // namespace signals
