#include "strategy_evaluator.hpp"
#include "backtest_engine.hpp"
#include "simple_backtest_engine.hpp"
#include "performance.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <functional>
#include <future>
#include <optional>
#include <spdlog/fmt/fmt.h>

namespace evaluator {

// --- EvaluatorConfig ---

EvaluatorConfig EvaluatorConfig::fromJson(const nlohmann::json& config) {
    using core::utils::jsonValue;
    EvaluatorConfig result;
    if (config.is_object() && config.contains("backtest")) {
        result.backtest = backtester::BacktestConfig::fromJson(config["backtest"]);
    }
    if (config.is_object() && config.contains("regime")) {
        result.regime = regime::RegimeClassifierConfig::fromJson(config["regime"]);
    }
    result.risk_free_rate = jsonValue(config, "risk_free_rate", result.risk_free_rate);
    result.simple_mode = jsonValue(config, "simple_mode", result.simple_mode);
    return result;
}

// --- Period performance ---

namespace {
    using KeyFn = std::string (*)(const core::Timestamp&);

    // Return of each period measured from the last value before it (or the first point)
    std::map<std::string, double> periodReturns(const std::vector<backtester::EquityPoint>& curve, KeyFn key_of) {
        std::map<std::string, double> returns;
        double base = curve.front().total_value;
        std::string current_key = key_of(curve.front().date);
        double last_value = base;

        for (const auto& point : curve) {
            const std::string key = key_of(point.date);
            if (key != current_key) {
                returns[current_key] = base > 0.0 ? last_value / base - 1.0 : 0.0;
                base = last_value;
                current_key = key;
            }
            last_value = point.total_value;
        }
        returns[current_key] = base > 0.0 ? last_value / base - 1.0 : 0.0;
        return returns;
    }

    void bestAndWorst(const std::map<std::string, double>& returns, double& best, double& worst) {
        if (returns.empty()) {
            return;
        }
        auto by_value = [](const auto& a, const auto& b) { return a.second < b.second; };
        best = std::max_element(returns.begin(), returns.end(), by_value)->second;
        worst = std::min_element(returns.begin(), returns.end(), by_value)->second;
    }
} // anonymous namespace

PeriodPerformance computePeriodPerformance(const std::vector<backtester::EquityPoint>& equity_curve) {
    PeriodPerformance perf;
    if (equity_curve.size() < 2) {
        return perf;
    }
    perf.monthly_returns = periodReturns(equity_curve, &core::utils::monthKey);
    perf.quarterly_returns = periodReturns(equity_curve, &core::utils::quarterKey);
    perf.yearly_returns = periodReturns(equity_curve, &core::utils::yearKey);
    bestAndWorst(perf.monthly_returns, perf.best_month, perf.worst_month);
    bestAndWorst(perf.quarterly_returns, perf.best_quarter, perf.worst_quarter);
    bestAndWorst(perf.yearly_returns, perf.best_year, perf.worst_year);
    return perf;
}

// --- Risk metrics ---

RiskMetrics computeRiskMetrics(const std::vector<backtester::EquityPoint>& equity_curve, double risk_free_rate) {
    RiskMetrics risk;
    if (equity_curve.empty()) {
        return risk;
    }
    const auto values = backtester::totalValues(equity_curve);
    const auto daily = backtester::simpleReturns(values);
    const auto drawdown = backtester::computeDrawdown(values);

    risk.max_drawdown = drawdown.max_drawdown;
    risk.max_drawdown_duration = drawdown.max_drawdown_duration;
    risk.volatility = backtester::annualizedVolatility(daily);
    risk.downside_risk = backtester::downsideRisk(daily);
    risk.sharpe_ratio = backtester::sharpeRatio(daily, risk_free_rate);
    risk.sortino_ratio = backtester::sortinoRatio(daily);

    if (values.front() > 0.0) {
        risk.total_return = values.back() / values.front() - 1.0;
    }
    const double elapsed = core::utils::daysBetween(equity_curve.front().date, equity_curve.back().date);
    risk.annual_return = backtester::annualizedReturn(risk.total_return, elapsed);
    return risk;
}

// --- Rating ---

std::string letterGrade(double score) {
    if (score >= 90.0) return "A+";
    if (score >= 80.0) return "A";
    if (score >= 70.0) return "B+";
    if (score >= 60.0) return "B";
    if (score >= 50.0) return "C+";
    if (score >= 40.0) return "C";
    return "D";
}

namespace {
    // Combined win rate over the given regimes, nullopt when none of them saw a trade
    std::optional<double> sideWinRate(const regime::RegimeAnalysis& analysis,
                                      regime::MarketRegime strong, regime::MarketRegime normal) {
        int trades = 0;
        int wins = 0;
        for (auto label : {strong, normal}) {
            auto it = analysis.by_regime.find(label);
            if (it != analysis.by_regime.end()) {
                trades += it->second.trade_count;
                wins += it->second.win_count;
            }
        }
        if (trades == 0) {
            return std::nullopt;
        }
        return static_cast<double>(wins) / trades;
    }
} // anonymous namespace

StrategyRating computeRating(const backtester::BacktestResult& result,
                             const regime::RegimeAnalysis& regime_analysis,
                             const RiskMetrics& risk_metrics) {
    StrategyRating rating;
    if (result.trades.empty()) {
        return rating;
    }

    rating.performance_score = std::clamp(risk_metrics.annual_return * 10.0, 0.0, 10.0);
    rating.risk_score = 10.0 * (1.0 - risk_metrics.max_drawdown);

    std::vector<double> factors;
    auto bull = sideWinRate(regime_analysis, regime::MarketRegime::StrongBull, regime::MarketRegime::Bull);
    auto bear = sideWinRate(regime_analysis, regime::MarketRegime::StrongBear, regime::MarketRegime::Bear);
    if (bull && bear) {
        const double hi = std::max(*bull, *bear);
        factors.push_back(hi > 0.0 ? std::min(*bull, *bear) / hi : 0.0);
    }

    const double trade_count = static_cast<double>(result.trades.size());
    double trades_per_year = trade_count;
    if (!result.equity_curve.empty()) {
        const double years = core::utils::daysBetween(result.equity_curve.front().date,
                                                      result.equity_curve.back().date) / 365.0;
        if (years > 0.0) {
            trades_per_year = trade_count / years;
        }
    }
    factors.push_back(std::min(1.0, trades_per_year / 250.0));
    factors.push_back(result.metrics.summary.win_rate);

    rating.stability_score = 10.0 * backtester::mean(factors);
    rating.total_score = 0.4 * rating.performance_score + 0.3 * rating.risk_score + 0.3 * rating.stability_score;
    rating.letter_grade = letterGrade(rating.total_score * 10.0);
    return rating;
}

// --- StrategyEvaluator ---

StrategyEvaluator::StrategyEvaluator(const EvaluatorConfig& config)
    : config_(config), classifier_(config.regime)
{
    config_.backtest.validate();
}

core::SignalSeries StrategyEvaluator::collectSignals(signals::ISignalProvider& provider,
                                                     const core::TimeSeries<core::Candle>& candles) const {
    core::SignalSeries series = provider.calculate(candles);
    if (series.size() != candles.size()) {
        throw core::BacktestException(fmt::format("Signal provider '{}' returned {} signals for {} candles",
                                                  provider.getName(), series.size(), candles.size()));
    }
    return series;
}

StrategyEvaluation StrategyEvaluator::evaluateStrategy(signals::ISignalProvider& provider,
                                                       const core::TimeSeries<core::Candle>& candles,
                                                       const std::string& name) const {
    const core::SignalSeries series = collectSignals(provider, candles);
    return evaluateWithRegimes(series, candles, classifier_.classify(candles),
                               name.empty() ? provider.getName() : name);
}

StrategyEvaluation StrategyEvaluator::evaluateSignals(const core::SignalSeries& signals,
                                                      const core::TimeSeries<core::Candle>& candles,
                                                      const std::string& name) const {
    return evaluateWithRegimes(signals, candles, classifier_.classify(candles), name);
}

StrategyEvaluation StrategyEvaluator::evaluateWithRegimes(const core::SignalSeries& signals,
                                                          const core::TimeSeries<core::Candle>& candles,
                                                          const std::vector<regime::MarketRegime>& regimes,
                                                          const std::string& name) const {
    auto logger = core::logging::getLogger();
    logger->info("Evaluating strategy '{}' over {} bars", name, candles.size());

    std::unique_ptr<backtester::ISimulator> simulator;
    if (config_.simple_mode) {
        simulator = std::make_unique<backtester::SimpleBacktestEngine>(config_.backtest);
    } else {
        simulator = std::make_unique<backtester::BacktestEngine>(config_.backtest);
    }

    StrategyEvaluation evaluation;
    evaluation.strategy_name = name;
    evaluation.backtest_result = simulator->run(candles, signals);
    evaluation.regime_analysis = classifier_.analyzeTradesByRegime(evaluation.backtest_result.trades, candles, regimes);
    evaluation.period_performance = computePeriodPerformance(evaluation.backtest_result.equity_curve);

    if (evaluation.backtest_result.trades.empty()) {
        logger->info("Strategy '{}' made no trades", name);
    } else {
        evaluation.risk_metrics = computeRiskMetrics(evaluation.backtest_result.equity_curve, config_.risk_free_rate);
    }
    evaluation.rating = computeRating(evaluation.backtest_result, evaluation.regime_analysis, evaluation.risk_metrics);

    logger->info("Strategy '{}': {} trades, annual return {:.2f}%, max drawdown {:.2f}%, score {:.2f} ({})",
                 name, evaluation.backtest_result.trades.size(), evaluation.risk_metrics.annual_return * 100.0,
                 evaluation.risk_metrics.max_drawdown * 100.0, evaluation.rating.total_score,
                 evaluation.rating.letter_grade);
    return evaluation;
}

EvaluationReport StrategyEvaluator::evaluateStrategies(
        const std::vector<std::shared_ptr<signals::ISignalProvider>>& providers,
        const core::TimeSeries<core::Candle>& candles,
        bool parallel) const {
    auto logger = core::logging::getLogger();
    logger->info("Evaluating {} strategies ({})", providers.size(), parallel ? "parallel" : "sequential");

    // Regimes depend only on the candles, classify once
    const std::vector<regime::MarketRegime> regimes = classifier_.classify(candles);

    std::vector<std::string> names;
    for (const auto& provider : providers) {
        std::string name = provider->getName();
        int suffix = 2;
        while (std::find(names.begin(), names.end(), name) != names.end()) {
            name = fmt::format("{}#{}", provider->getName(), suffix++);
        }
        if (name != provider->getName()) {
            logger->warn("Duplicate strategy name '{}' renamed to '{}'", provider->getName(), name);
        }
        names.push_back(name);
    }

    auto evaluate_one = [this, &candles, &regimes](signals::ISignalProvider& provider, const std::string& name) {
        const core::SignalSeries series = collectSignals(provider, candles);
        return evaluateWithRegimes(series, candles, regimes, name);
    };

    EvaluationReport report;
    if (parallel) {
        std::vector<std::future<StrategyEvaluation>> futures;
        futures.reserve(providers.size());
        for (std::size_t i = 0; i < providers.size(); ++i) {
            futures.push_back(std::async(std::launch::async, evaluate_one,
                                         std::ref(*providers[i]), std::cref(names[i])));
        }
        for (std::size_t i = 0; i < futures.size(); ++i) {
            report.evaluations[names[i]] = futures[i].get();
        }
    } else {
        for (std::size_t i = 0; i < providers.size(); ++i) {
            report.evaluations[names[i]] = evaluate_one(*providers[i], names[i]);
        }
    }

    report.ranking = names;
    std::stable_sort(report.ranking.begin(), report.ranking.end(),
                     [&report](const std::string& a, const std::string& b) {
                         return report.evaluations.at(a).rating.total_score > report.evaluations.at(b).rating.total_score;
                     });
    return report;
}

} // namespace evaluator
