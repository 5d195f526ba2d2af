#pragma once

#include "backtest_config.hpp"
#include "backtest_types.hpp"
#include "market_regime.hpp"
#include "signal_provider.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace evaluator {

    struct EvaluatorConfig {
        backtester::BacktestConfig backtest;
        regime::RegimeClassifierConfig regime;
        double risk_free_rate = 0.03;   // Annual, used by the evaluator's Sharpe ratio
        bool simple_mode = false;       // Use the simplified simulator

        // {"backtest": {...}, "regime": {...}, "risk_free_rate": ..., "simple_mode": ...}
        static EvaluatorConfig fromJson(const nlohmann::json& config);
    };

    // Compounded returns per calendar period, keyed "2024-03", "2024-Q1", "2024"
    struct PeriodPerformance {
        std::map<std::string, double> monthly_returns;
        std::map<std::string, double> quarterly_returns;
        std::map<std::string, double> yearly_returns;
        double best_month = 0.0;
        double worst_month = 0.0;
        double best_quarter = 0.0;
        double worst_quarter = 0.0;
        double best_year = 0.0;
        double worst_year = 0.0;
    };

    struct RiskMetrics {
        double max_drawdown = 0.0;
        int max_drawdown_duration = 0;
        double volatility = 0.0;
        double downside_risk = 0.0;
        double sharpe_ratio = 0.0;
        double sortino_ratio = 0.0;
        double annual_return = 0.0;
        double total_return = 0.0;
    };

    struct StrategyRating {
        double performance_score = 0.0;  // 0..10
        double risk_score = 0.0;         // 0..10
        double stability_score = 0.0;    // 0..10
        double total_score = 0.0;        // 0..10
        std::string letter_grade = "D";
    };

    struct StrategyEvaluation {
        std::string strategy_name;
        backtester::BacktestResult backtest_result;
        regime::RegimeAnalysis regime_analysis;
        PeriodPerformance period_performance;
        RiskMetrics risk_metrics;
        StrategyRating rating;
    };

    struct EvaluationReport {
        std::map<std::string, StrategyEvaluation> evaluations;
        std::vector<std::string> ranking;   // Strategy names by total_score, best first
    };

    // --- Scoring building blocks ---

    // Empty for fewer than two equity points
    PeriodPerformance computePeriodPerformance(const std::vector<backtester::EquityPoint>& equity_curve);

    RiskMetrics computeRiskMetrics(const std::vector<backtester::EquityPoint>& equity_curve,
                                   double risk_free_rate);

    // Zero trades rate 0 on every axis with grade D
    StrategyRating computeRating(const backtester::BacktestResult& result,
                                 const regime::RegimeAnalysis& regime_analysis,
                                 const RiskMetrics& risk_metrics);

    // Maps a 0..100 score: >=90 A+, >=80 A, >=70 B+, >=60 B, >=50 C+, >=40 C, else D
    std::string letterGrade(double score);

    // Runs backtest, regime analysis, period slicing, risk metrics and rating.
    // Every evaluation builds its own simulator, so no cost or capital state is shared.
    class StrategyEvaluator {
    public:
        explicit StrategyEvaluator(const EvaluatorConfig& config = EvaluatorConfig());

        const EvaluatorConfig& getConfig() const { return config_; }

        // Throws core::BacktestException when the provider's series length differs from the candle count
        StrategyEvaluation evaluateStrategy(signals::ISignalProvider& provider,
                                            const core::TimeSeries<core::Candle>& candles,
                                            const std::string& name = "") const;

        StrategyEvaluation evaluateSignals(const core::SignalSeries& signals,
                                           const core::TimeSeries<core::Candle>& candles,
                                           const std::string& name) const;

        // One evaluation per provider, optionally run concurrently with std::async
        EvaluationReport evaluateStrategies(const std::vector<std::shared_ptr<signals::ISignalProvider>>& providers,
                                            const core::TimeSeries<core::Candle>& candles,
                                            bool parallel = false) const;

    private:
        StrategyEvaluation evaluateWithRegimes(const core::SignalSeries& signals,
                                               const core::TimeSeries<core::Candle>& candles,
                                               const std::vector<regime::MarketRegime>& regimes,
                                               const std::string& name) const;

        core::SignalSeries collectSignals(signals::ISignalProvider& provider,
                                          const core::TimeSeries<core::Candle>& candles) const;

        EvaluatorConfig config_;
        regime::MarketRegimeClassifier classifier_;
    };

} // namespace evaluator
