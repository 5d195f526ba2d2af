#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class PlatformException : public std::runtime_error {
    public:
        explicit PlatformException(const std::string& message)
            : std::runtime_error(message) {}

        explicit PlatformException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    // Unknown policy identifiers, invalid numeric settings, malformed JSON config
    class ConfigException : public PlatformException {
    public: using PlatformException::PlatformException; };

    class DataLoadException : public PlatformException {
    public: using PlatformException::PlatformException; };

    class IndicatorCalculationException : public PlatformException {
    public: using PlatformException::PlatformException; };

    // Fatal run setup errors, e.g. a signal series shorter than the bar series
    class BacktestException : public PlatformException {
    public: using PlatformException::PlatformException; };

} // namespace core
