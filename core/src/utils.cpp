#include "utils.hpp"
#include "exceptions.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For std::istringstream
#include <fstream>
#include <string>
#include <stdexcept>  // For std::runtime_error
#include <cmath>      // For std::pow
#include <cctype>
#include <ctime>

namespace core {
namespace utils {

    namespace {

        std::time_t toUtcEpoch(std::tm& tm) {
            // timegm interprets struct tm as UTC. Not C++ standard, _mkgmtime on Windows.
            #ifdef _WIN32
                return _mkgmtime(&tm);
            #else
                return timegm(&tm);
            #endif
        }

        std::tm toUtcTm(const Timestamp& ts) {
            auto tt = std::chrono::system_clock::to_time_t(ts);
            std::tm time_tm{};
            #ifdef _WIN32
                gmtime_s(&time_tm, &tt);
            #else
                gmtime_r(&tt, &time_tm);
            #endif
            return time_tm;
        }

    } // end anonymous namespace

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Date part is mandatory
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date part): " + iso_string);
        }

        // 2. Optional time part, separated by 'T' or a space
        double fractional_seconds = 0.0;
        if (ss.peek() == 'T' || ss.peek() == ' ') {
            ss.ignore();
            ss >> std::get_time(&tm, "%H:%M:%S");
            if (ss.fail()) {
                throw std::runtime_error("Failed to parse timestamp (time part): " + iso_string);
            }

            if (ss.peek() == '.') {
                ss.ignore(); // consume '.'
                std::string digits;
                while (std::isdigit(ss.peek()) && digits.size() < 9) {
                    digits += static_cast<char>(ss.get());
                }
                while (std::isdigit(ss.peek())) {
                    ss.ignore();
                }
                if (!digits.empty()) {
                    fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
                }
            }
        }

        // 3. Optional timezone offset (+HH:MM, -HH:MM, or Z). Absent offset means UTC.
        std::chrono::seconds offset_duration(0);
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == 'Z') {
                offset_duration = std::chrono::seconds(0);
            } else if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                    throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
        }

        std::time_t tt = toUtcEpoch(tm);
        if (tt == static_cast<std::time_t>(-1)) {
            throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // 2015-04-20T00:00:00+05:30 is 2015-04-19T18:30:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        std::tm time_tm = toUtcTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    std::string dateToString(const Timestamp& ts) {
        std::tm time_tm = toUtcTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d");
        return oss.str();
    }

    Timestamp makeDate(int year, int month, int day) {
        std::tm tm = {};
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        std::time_t tt = toUtcEpoch(tm);
        return std::chrono::system_clock::from_time_t(tt);
    }

    CalendarDate toCalendarDate(const Timestamp& ts) {
        std::tm time_tm = toUtcTm(ts);
        CalendarDate date;
        date.year = time_tm.tm_year + 1900;
        date.month = time_tm.tm_mon + 1;
        date.day = time_tm.tm_mday;
        return date;
    }

    std::string monthKey(const Timestamp& ts) {
        CalendarDate d = toCalendarDate(ts);
        std::ostringstream oss;
        oss << d.year << '-' << std::setw(2) << std::setfill('0') << d.month;
        return oss.str();
    }

    std::string quarterKey(const Timestamp& ts) {
        CalendarDate d = toCalendarDate(ts);
        return std::to_string(d.year) + "-Q" + std::to_string((d.month - 1) / 3 + 1);
    }

    std::string yearKey(const Timestamp& ts) {
        return std::to_string(toCalendarDate(ts).year);
    }

    double daysBetween(const Timestamp& from, const Timestamp& to) {
        using Days = std::chrono::duration<double, std::ratio<86400>>;
        return std::chrono::duration_cast<Days>(to - from).count();
    }

    nlohmann::json loadJsonFile(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException("Failed to open config file: " + path);
        }
        try {
            return nlohmann::json::parse(ifs);
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigException("Failed to parse config file '" + path + "': " + e.what());
        }
    }

} // namespace utils
} // namespace core
