#pragma once

#include <string>
#include <vector>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp"

namespace data {

// Summary row of one strategy evaluation, with the full report kept as JSON text
struct EvaluationRecord {
    std::string strategy_name;
    std::string instrument_key;
    core::Timestamp evaluated_at;
    double total_score = 0.0;
    std::string letter_grade;
    int total_trades = 0;
    double annual_return = 0.0;
    double max_drawdown = 0.0;
    std::string report_json;
};

// SQLite bar store. Pass ":memory:" for a private in-memory database.
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;
    DatabaseManager(DatabaseManager&&) = delete;
    DatabaseManager& operator=(DatabaseManager&&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    // Creates historical_candles and strategy_evaluations if missing
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // Inserts candles in one transaction; rows already stored are ignored
    bool saveCandles(const core::TimeSeries<core::Candle>& candles,
                     const std::string& instrument_key,
                     const std::string& interval);

    // Candles with start_time <= timestamp <= end_time, oldest first
    core::TimeSeries<core::Candle> queryCandles(
        const std::string& instrument_key,
        const std::string& interval,
        core::Timestamp start_time,
        core::Timestamp end_time);

    bool saveEvaluation(const EvaluationRecord& record);

    // Stored evaluations of one instrument, best total score first
    std::vector<EvaluationRecord> queryEvaluations(const std::string& instrument_key);

private:
    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
};

} // namespace data
