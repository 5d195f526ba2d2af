#pragma once

#include "backtest_types.hpp"
#include <vector>

namespace backtester {

    constexpr double kTradingDaysPerYear = 252.0;

    // --- Shared return / risk helpers ---

    std::vector<double> totalValues(const std::vector<EquityPoint>& equity_curve);

    // Simple returns between consecutive values; a non-positive previous value yields 0
    std::vector<double> simpleReturns(const std::vector<double>& values);

    double mean(const std::vector<double>& values);
    // Population standard deviation, 0 for fewer than two values
    double standardDeviation(const std::vector<double>& values);

    struct DrawdownStats {
        double max_drawdown = 0.0;       // Fraction in [0, 1]
        double avg_drawdown = 0.0;       // Mean of the deepest point of each underwater period
        int max_drawdown_duration = 0;   // Longest run of bars strictly below the running peak
    };

    DrawdownStats computeDrawdown(const std::vector<double>& values);

    double annualizedVolatility(const std::vector<double>& returns);
    // Standard deviation of the negative returns, annualized
    double downsideRisk(const std::vector<double>& returns);
    // sqrt(252) * mean(r - rf/252) / stdev(r); 0 when stdev is 0
    double sharpeRatio(const std::vector<double>& returns, double annual_risk_free_rate);
    // sqrt(252) * mean(r) / stdev(negative r); 0 without negative returns or when their stdev is 0
    double sortinoRatio(const std::vector<double>& returns);
    // (1 + total_return) ^ (365 / elapsed_days) - 1; 0 for elapsed_days <= 0, -1 when wiped out
    double annualizedReturn(double total_return, double elapsed_days);

    // Metrics of one run. Zero trades yield zero-valued metrics.
    PerformanceMetrics computePerformanceMetrics(const std::vector<Trade>& trades,
                                                 const std::vector<EquityPoint>& equity_curve,
                                                 double initial_capital,
                                                 double risk_free_rate);

    void logMetrics(const PerformanceMetrics& metrics);

} // namespace backtester
