#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For timestampToString/stringToTimestamp
#include <vector>
#include <stdexcept>

namespace data
{

    namespace
    {
        std::string columnText(sqlite3_stmt *stmt, int column)
        {
            const unsigned char *text = sqlite3_column_text(stmt, column);
            return text ? std::string(reinterpret_cast<const char *>(text)) : std::string();
        }
    } // anonymous namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect(); // Ensure disconnection
    }

    bool DatabaseManager::connect()
    {
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Connecting to SQLite database: {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        sqlite3_busy_timeout(db_, 5000);
        core::logging::getLogger()->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        core::logging::getLogger()->info("Disconnecting from SQLite database: {}", database_path_);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // Usually caused by statements that were never finalized
            core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        core::logging::getLogger()->info("Initializing SQLite database schema if needed...");

        const std::string create_candles_sql = R"(
        CREATE TABLE IF NOT EXISTS historical_candles (
            instrument_key TEXT,
            interval TEXT,
            timestamp TEXT, -- ISO 8601 UTC, sorts chronologically as TEXT
            open REAL,
            high REAL,
            low REAL,
            close REAL,
            volume INTEGER,
            PRIMARY KEY (instrument_key, interval, timestamp)
        );
    )";

        const std::string create_candles_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_candles_timestamp
        ON historical_candles (instrument_key, interval, timestamp);
     )";

        const std::string create_evaluations_sql = R"(
        CREATE TABLE IF NOT EXISTS strategy_evaluations (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            strategy_name TEXT NOT NULL,
            instrument_key TEXT NOT NULL,
            evaluated_at TEXT NOT NULL,
            total_score REAL,
            letter_grade TEXT,
            total_trades INTEGER,
            annual_return REAL,
            max_drawdown REAL,
            report_json TEXT
        );
    )";

        bool success = true;
        success &= executeSQL(create_candles_sql);
        success &= executeSQL(create_candles_index_sql);
        success &= executeSQL(create_evaluations_sql);

        if (success)
        {
            core::logging::getLogger()->info("SQLite database schema initialization check complete.");
        }
        else
        {
            core::logging::getLogger()->error("SQLite database schema initialization failed for one or more statements.");
        }
        return success;
    }

    core::TimeSeries<core::Candle> DatabaseManager::queryCandles(
        const std::string &instrument_key,
        const std::string &interval,
        core::Timestamp start_time,
        core::Timestamp end_time)
    {
        core::TimeSeries<core::Candle> candles;
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot query candles: Not connected to database.");
            return candles;
        }

        const std::string start_str = core::utils::timestampToString(start_time);
        const std::string end_str = core::utils::timestampToString(end_time);
        logger->debug("Querying candles for {} ({}) between '{}' and '{}'", instrument_key, interval, start_str, end_str);

        const char *sql = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM historical_candles
            WHERE instrument_key = ?
              AND interval = ?
              AND timestamp >= ?
              AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare candle query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return candles;
        }

        sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, start_str.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 4, end_str.c_str(), -1, SQLITE_STATIC);

        int row_count = 0;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            row_count++;
            const std::string ts_text = columnText(stmt, 0);
            if (ts_text.empty())
            {
                logger->warn("NULL timestamp found in query result (row {}), skipping row.", row_count);
                continue;
            }
            try
            {
                core::Candle candle;
                candle.timestamp = core::utils::stringToTimestamp(ts_text);
                candle.open = sqlite3_column_double(stmt, 1);
                candle.high = sqlite3_column_double(stmt, 2);
                candle.low = sqlite3_column_double(stmt, 3);
                candle.close = sqlite3_column_double(stmt, 4);
                candle.volume = sqlite3_column_int64(stmt, 5);
                candles.push_back(candle);
            }
            catch (const std::runtime_error &e)
            {
                logger->warn("Skipping row {} with unparseable timestamp '{}': {}", row_count, ts_text, e.what());
            }
        }

        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through query results [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        else
        {
            logger->debug("Loaded {} candles for {} ({}).", candles.size(), instrument_key, interval);
        }

        sqlite3_finalize(stmt);
        return candles;
    }

    bool DatabaseManager::saveCandles(const core::TimeSeries<core::Candle> &candles,
                                      const std::string &instrument_key,
                                      const std::string &interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save candles: Not connected to database.");
            return false;
        }
        if (candles.empty())
        {
            logger->debug("No candles provided to save for {} ({}).", instrument_key, interval);
            return true;
        }

        const char *sql = R"(
INSERT OR IGNORE INTO historical_candles
(instrument_key, interval, timestamp, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for saving candles.");
            sqlite3_finalize(stmt);
            return false;
        }

        bool success = true;
        int saved_count = 0;
        for (const auto &candle : candles)
        {
            const std::string timestamp_str = core::utils::timestampToString(candle.timestamp);
            sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_STATIC);
            sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_STATIC);
            sqlite3_bind_text(stmt, 3, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 4, candle.open);
            sqlite3_bind_double(stmt, 5, candle.high);
            sqlite3_bind_double(stmt, 6, candle.low);
            sqlite3_bind_double(stmt, 7, candle.close);
            sqlite3_bind_int64(stmt, 8, candle.volume);

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            if (sqlite3_changes(db_) > 0)
            {
                saved_count++;
            }

            rc = sqlite3_reset(stmt);
            if (rc != SQLITE_OK)
            {
                logger->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
        }

        // Finalize the statement BEFORE commit/rollback
        sqlite3_finalize(stmt);

        if (!executeSQL(success ? "COMMIT;" : "ROLLBACK;"))
        {
            logger->error("Failed to {} transaction for saving candles.", success ? "COMMIT" : "ROLLBACK");
            if (success)
            {
                executeSQL("ROLLBACK;");
            }
            return false;
        }

        if (success)
        {
            logger->info("Saved {} new candles (duplicates ignored) for {} ({}).", saved_count, instrument_key, interval);
        }
        else
        {
            logger->warn("Transaction rolled back due to error during candle save for {} ({}).", instrument_key, interval);
        }
        return success;
    }

    bool DatabaseManager::saveEvaluation(const EvaluationRecord &record)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save evaluation: Not connected to database.");
            return false;
        }

        const char *sql = R"(
INSERT INTO strategy_evaluations
(strategy_name, instrument_key, evaluated_at, total_score, letter_grade,
 total_trades, annual_return, max_drawdown, report_json)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
)";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare evaluation INSERT [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }

        const std::string evaluated_at = core::utils::timestampToString(record.evaluated_at);
        sqlite3_bind_text(stmt, 1, record.strategy_name.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, record.instrument_key.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, evaluated_at.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_double(stmt, 4, record.total_score);
        sqlite3_bind_text(stmt, 5, record.letter_grade.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int(stmt, 6, record.total_trades);
        sqlite3_bind_double(stmt, 7, record.annual_return);
        sqlite3_bind_double(stmt, 8, record.max_drawdown);
        sqlite3_bind_text(stmt, 9, record.report_json.c_str(), -1, SQLITE_STATIC);

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            logger->error("Failed to insert evaluation for '{}' [{}]: {}", record.strategy_name, rc, sqlite3_errmsg(db_));
            return false;
        }
        logger->debug("Saved evaluation of '{}' on {} ({:.2f}, {})", record.strategy_name, record.instrument_key,
                      record.total_score, record.letter_grade);
        return true;
    }

    std::vector<EvaluationRecord> DatabaseManager::queryEvaluations(const std::string &instrument_key)
    {
        std::vector<EvaluationRecord> records;
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot query evaluations: Not connected to database.");
            return records;
        }

        const char *sql = R"(
            SELECT strategy_name, instrument_key, evaluated_at, total_score, letter_grade,
                   total_trades, annual_return, max_drawdown, report_json
            FROM strategy_evaluations
            WHERE instrument_key = ?
            ORDER BY total_score DESC, id ASC;
        )";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare evaluation query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return records;
        }
        sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_STATIC);

        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            EvaluationRecord record;
            record.strategy_name = columnText(stmt, 0);
            record.instrument_key = columnText(stmt, 1);
            try
            {
                record.evaluated_at = core::utils::stringToTimestamp(columnText(stmt, 2));
            }
            catch (const std::runtime_error &e)
            {
                logger->warn("Evaluation of '{}' has an unparseable timestamp: {}", record.strategy_name, e.what());
            }
            record.total_score = sqlite3_column_double(stmt, 3);
            record.letter_grade = columnText(stmt, 4);
            record.total_trades = sqlite3_column_int(stmt, 5);
            record.annual_return = sqlite3_column_double(stmt, 6);
            record.max_drawdown = sqlite3_column_double(stmt, 7);
            record.report_json = columnText(stmt, 8);
            records.push_back(record);
        }
        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through evaluation results [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        return records;
    }

} // namespace data
