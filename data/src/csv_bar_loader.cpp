#include "csv_bar_loader.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace data {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::vector<std::string> split(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, delimiter)) {
        fields.push_back(trim(field));
    }
    return fields;
}

} // anonymous namespace

CsvBarLoader::CsvBarLoader(std::string path) : path_(std::move(path)) {
    if (path_.empty()) {
        throw std::invalid_argument("CSV path must not be empty.");
    }
}

std::optional<core::Candle> CsvBarLoader::parseLine(const std::string& line) {
    const auto fields = split(line, ',');
    if (fields.size() < 6) {
        return std::nullopt;
    }
    try {
        core::Candle candle;
        candle.timestamp = core::utils::stringToTimestamp(fields[0]);
        candle.open = std::stod(fields[1]);
        candle.high = std::stod(fields[2]);
        candle.low = std::stod(fields[3]);
        candle.close = std::stod(fields[4]);
        candle.volume = static_cast<long long>(std::stod(fields[5]));
        if (candle.high < candle.low || candle.open <= 0.0 || candle.close <= 0.0 || candle.volume < 0) {
            return std::nullopt;
        }
        return candle;
    } catch (const std::logic_error&) {
        // std::stod: invalid_argument, out_of_range
        return std::nullopt;
    } catch (const std::runtime_error&) {
        // stringToTimestamp: malformed date
        return std::nullopt;
    }
}

core::TimeSeries<core::Candle> CsvBarLoader::load() const {
    auto logger = core::logging::getLogger();
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw core::DataLoadException("Cannot open CSV file: " + path_);
    }

    core::TimeSeries<core::Candle> candles;
    std::string line;
    int line_number = 0;
    int skipped = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (trim(line).empty()) {
            continue;
        }
        auto candle = parseLine(line);
        if (!candle) {
            // A leading non-data row is the header
            if (line_number == 1) {
                logger->debug("Treating first line of {} as header.", path_);
            } else {
                logger->warn("Skipping malformed line {} in {}: '{}'", line_number, path_, line);
                ++skipped;
            }
            continue;
        }
        if (!candles.empty() && candle->timestamp <= candles.back().timestamp) {
            throw core::DataLoadException("Timestamps out of order at line " + std::to_string(line_number) +
                                          " in " + path_);
        }
        candles.push_back(*candle);
    }
    if (file.bad()) {
        throw core::DataLoadException("Error while reading CSV file: " + path_);
    }

    logger->info("Loaded {} bars from {} ({} malformed lines skipped).", candles.size(), path_, skipped);
    return candles;
}

} // namespace data
