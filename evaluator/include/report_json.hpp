#pragma once

#include "strategy_evaluator.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace evaluator {

    using json = nlohmann::json;

    // Dates are written as ISO 8601 UTC strings, enums as lower-case labels
    json toJson(const backtester::BacktestResult& result);
    json toJson(const backtester::PerformanceMetrics& metrics);
    json toJson(const backtester::CostAnalysis& analysis);
    json toJson(const regime::RegimeAnalysis& analysis);
    json toJson(const PeriodPerformance& performance);
    json toJson(const RiskMetrics& risk);
    json toJson(const StrategyRating& rating);
    json toJson(const StrategyEvaluation& evaluation);
    json toJson(const EvaluationReport& report);

    // Throws core::PlatformException when the file cannot be written
    void writeJsonFile(const std::string& path, const json& document);

} // namespace evaluator
