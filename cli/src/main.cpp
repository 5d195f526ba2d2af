// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <string>
#include <vector>
#include <exception>
#include <chrono>
#include <memory>

// Project includes
#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "utils.hpp"
#include "database_manager.hpp"
#include "csv_bar_loader.hpp"
#include "signal_factory.hpp"
#include "strategy_evaluator.hpp"
#include "report_json.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

    const char* kUsage = "Usage: backtest_lab_cli <config.json>";

    // Resolves the "bars" section: {"csv": path} or {"sqlite": path, "instrument": ..., "interval": ..., "start": ..., "end": ...}
    core::TimeSeries<core::Candle> loadBars(const json& bars_config, std::string& instrument_key) {
        auto logger = core::logging::getLogger();
        if (!bars_config.is_object()) {
            throw core::ConfigException("Config key 'bars' must be an object.");
        }

        if (bars_config.contains("csv")) {
            const std::string csv_path = core::utils::jsonValue<std::string>(bars_config, "csv", "");
            instrument_key = core::utils::jsonValue<std::string>(bars_config, "instrument", csv_path);
            data::CsvBarLoader loader(csv_path);
            return loader.load();
        }

        if (bars_config.contains("sqlite")) {
            const std::string db_path = core::utils::jsonValue<std::string>(bars_config, "sqlite", "");
            instrument_key = core::utils::jsonValue<std::string>(bars_config, "instrument", "");
            const std::string interval = core::utils::jsonValue<std::string>(bars_config, "interval", "day");
            const std::string start = core::utils::jsonValue<std::string>(bars_config, "start", "1970-01-01");
            const std::string end = core::utils::jsonValue<std::string>(bars_config, "end", "2100-01-01");
            if (instrument_key.empty()) {
                throw core::ConfigException("SQLite bar source requires an 'instrument' key.");
            }

            data::DatabaseManager db_manager(db_path);
            if (!db_manager.connect() || !db_manager.initializeSchema()) {
                throw core::DataLoadException("Cannot open bar database: " + db_path);
            }
            core::Timestamp start_ts;
            core::Timestamp end_ts;
            try {
                start_ts = core::utils::stringToTimestamp(start);
                end_ts = core::utils::stringToTimestamp(end);
            } catch (const std::runtime_error& e) {
                throw core::ConfigException(std::string("Invalid bar date range: ") + e.what());
            }
            logger->info("Querying {} ({}) from {} to {}", instrument_key, interval, start, end);
            return db_manager.queryCandles(instrument_key, interval, start_ts, end_ts);
        }

        throw core::ConfigException("Config key 'bars' needs either 'csv' or 'sqlite'.");
    }

    std::vector<std::shared_ptr<signals::ISignalProvider>> buildProviders(const json& strategies) {
        if (!strategies.is_array() || strategies.empty()) {
            throw core::ConfigException("Config key 'strategies' must be a non-empty array.");
        }
        std::vector<std::shared_ptr<signals::ISignalProvider>> providers;
        for (const auto& strategy_config : strategies) {
            providers.push_back(signals::SignalFactory::create(strategy_config));
        }
        return providers;
    }

    void saveToDatabase(const std::string& db_path,
                        const std::string& instrument_key,
                        const evaluator::EvaluationReport& report) {
        auto logger = core::logging::getLogger();
        data::DatabaseManager db_manager(db_path);
        if (!db_manager.connect() || !db_manager.initializeSchema()) {
            throw core::DataLoadException("Cannot open results database: " + db_path);
        }

        const core::Timestamp now = std::chrono::system_clock::now();
        for (const auto& name : report.ranking) {
            const auto& evaluation = report.evaluations.at(name);
            data::EvaluationRecord record;
            record.strategy_name = name;
            record.instrument_key = instrument_key;
            record.evaluated_at = now;
            record.total_score = evaluation.rating.total_score;
            record.letter_grade = evaluation.rating.letter_grade;
            record.total_trades = evaluation.backtest_result.metrics.summary.total_trades;
            record.annual_return = evaluation.risk_metrics.annual_return;
            record.max_drawdown = evaluation.risk_metrics.max_drawdown;
            record.report_json = evaluator::toJson(evaluation).dump();
            if (!db_manager.saveEvaluation(record)) {
                logger->error("Failed to store evaluation of '{}' in {}", name, db_path);
            }
        }
        logger->info("Stored {} evaluations in {}", report.ranking.size(), db_path);
    }

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        // --- Initialize Logging ---
        core::logging::initialize("backtest_lab_cli", spdlog::level::info, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Backtest Lab CLI starting...");

        if (argc != 2) {
            std::cerr << kUsage << std::endl;
            logger->error("Expected exactly one argument, got {}", argc - 1);
            return 1;
        }

        // --- Configuration ---
        const json config = core::utils::loadJsonFile(argv[1]);
        const std::string log_level = core::utils::jsonValue<std::string>(config, "log_level", "");
        if (!log_level.empty()) {
            core::logging::setConsoleLevel(core::logging::level_from_string(log_level));
        }

        evaluator::EvaluatorConfig evaluator_config =
            evaluator::EvaluatorConfig::fromJson(config.value("evaluator", json::object()));
        const bool parallel = core::utils::jsonValue<bool>(config, "parallel", false);
        const std::string report_path = core::utils::jsonValue<std::string>(config, "report_path", "");
        const std::string save_to_db = core::utils::jsonValue<std::string>(config, "save_to_db", "");

        if (!config.contains("bars")) {
            throw core::ConfigException("Config key 'bars' is required.");
        }
        if (!config.contains("strategies")) {
            throw core::ConfigException("Config key 'strategies' is required.");
        }

        // --- Bars & Strategies ---
        std::string instrument_key;
        const auto candles = loadBars(config["bars"], instrument_key);
        if (candles.empty()) {
            throw core::DataLoadException("No bars loaded for " + instrument_key);
        }
        logger->info("Loaded {} bars for {} ({} .. {})", candles.size(), instrument_key,
                     core::utils::dateToString(candles.front().timestamp),
                     core::utils::dateToString(candles.back().timestamp));

        const auto providers = buildProviders(config["strategies"]);

        // --- Evaluation ---
        evaluator::StrategyEvaluator strategy_evaluator(evaluator_config);
        const auto report = strategy_evaluator.evaluateStrategies(providers, candles, parallel);

        logger->info("---=== Ranking ===---");
        int rank = 1;
        for (const auto& name : report.ranking) {
            const auto& evaluation = report.evaluations.at(name);
            logger->info("{}. {:<20} score {:5.2f} ({:<2})  trades {:>4}  annual {:>7.2f}%  max DD {:>6.2f}%",
                         rank++, name, evaluation.rating.total_score, evaluation.rating.letter_grade,
                         evaluation.backtest_result.metrics.summary.total_trades,
                         evaluation.risk_metrics.annual_return * 100.0,
                         evaluation.risk_metrics.max_drawdown * 100.0);
        }

        // --- Output ---
        if (!report_path.empty()) {
            evaluator::writeJsonFile(report_path, evaluator::toJson(report));
        }
        if (!save_to_db.empty()) {
            saveToDatabase(save_to_db, instrument_key, report);
        }

        logger->info("Backtest Lab CLI finished.");

    // --- Exception Handling ---
    } catch (const core::PlatformException& ex) {
        std::cerr << "Platform Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Platform Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
