#pragma once

#include <string>
#include <vector>
#include <optional>

#include "datatypes.hpp"

namespace data {

// Loads daily bars from a "Date,Open,High,Low,Close,Volume" file.
// The header row is optional, extra columns are ignored and malformed
// lines are skipped with a warning.
class CsvBarLoader {
public:
    explicit CsvBarLoader(std::string path);

    // Throws core::DataLoadException if the file cannot be read or the
    // timestamps are not strictly increasing.
    core::TimeSeries<core::Candle> load() const;

    // Parses one data line; std::nullopt for headers and malformed rows
    static std::optional<core::Candle> parseLine(const std::string& line);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace data
