#pragma once

#include "datatypes.hpp"
#include "exceptions.hpp"
#include <string>
#include <chrono>
#include <nlohmann/json.hpp>

namespace core {
namespace utils {

    // Calendar fields of a timestamp, in UTC
    struct CalendarDate {
        int year = 1970;
        int month = 1;  // 1..12
        int day = 1;    // 1..31
    };

    // Formats a timestamp as ISO 8601 UTC, e.g. 2024-03-01T00:00:00Z
    std::string timestampToString(const Timestamp& ts);

    // Formats only the date part, e.g. 2024-03-01
    std::string dateToString(const Timestamp& ts);

    // Parses "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM)".
    // A missing offset is read as UTC. Throws std::runtime_error on malformed input.
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Builds a UTC midnight timestamp from calendar fields
    Timestamp makeDate(int year, int month, int day);

    CalendarDate toCalendarDate(const Timestamp& ts);

    // Calendar periods used by period performance slicing
    std::string monthKey(const Timestamp& ts);   // 2024-03
    std::string quarterKey(const Timestamp& ts); // 2024-Q1
    std::string yearKey(const Timestamp& ts);    // 2024

    // Elapsed time in (fractional) days
    double daysBetween(const Timestamp& from, const Timestamp& to);

    // Reads and parses a JSON file. Throws core::ConfigException on I/O or parse failure.
    nlohmann::json loadJsonFile(const std::string& path);

    // Reads an optional config key. Missing or null keys yield the fallback,
    // a value of the wrong type throws core::ConfigException.
    template <typename T>
    T jsonValue(const nlohmann::json& config, const std::string& key, const T& fallback) {
        if (!config.is_object() || !config.contains(key) || config[key].is_null()) {
            return fallback;
        }
        try {
            return config[key].get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw ConfigException("Invalid value for config key '" + key + "': " + e.what());
        }
    }

} // namespace utils
} // namespace core
