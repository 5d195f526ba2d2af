#include "performance.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>

namespace backtester {

std::vector<double> totalValues(const std::vector<EquityPoint>& equity_curve) {
    std::vector<double> values;
    values.reserve(equity_curve.size());
    for (const auto& point : equity_curve) {
        values.push_back(point.total_value);
    }
    return values;
}

std::vector<double> simpleReturns(const std::vector<double>& values) {
    std::vector<double> returns;
    if (values.size() < 2) {
        return returns;
    }
    returns.reserve(values.size() - 1);
    for (std::size_t i = 1; i < values.size(); ++i) {
        const double prev = values[i - 1];
        returns.push_back(prev > 0.0 ? values[i] / prev - 1.0 : 0.0);
    }
    return returns;
}

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double standardDeviation(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    const double avg = mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - avg) * (v - avg);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

DrawdownStats computeDrawdown(const std::vector<double>& values) {
    DrawdownStats stats;
    if (values.empty()) {
        return stats;
    }

    double peak = values.front();
    int current_duration = 0;
    double current_depth = 0.0;
    std::vector<double> period_depths;

    for (double value : values) {
        if (value >= peak) {
            if (current_duration > 0) {
                period_depths.push_back(current_depth);
            }
            peak = value;
            current_duration = 0;
            current_depth = 0.0;
            continue;
        }

        ++current_duration;
        double drawdown = peak > 0.0 ? (peak - value) / peak : 0.0;
        drawdown = std::clamp(drawdown, 0.0, 1.0);
        current_depth = std::max(current_depth, drawdown);
        stats.max_drawdown = std::max(stats.max_drawdown, drawdown);
        stats.max_drawdown_duration = std::max(stats.max_drawdown_duration, current_duration);
    }
    if (current_duration > 0) {
        period_depths.push_back(current_depth);
    }
    stats.avg_drawdown = mean(period_depths);
    return stats;
}

double annualizedVolatility(const std::vector<double>& returns) {
    return standardDeviation(returns) * std::sqrt(kTradingDaysPerYear);
}

namespace {
    std::vector<double> negativeReturns(const std::vector<double>& returns) {
        std::vector<double> negatives;
        std::copy_if(returns.begin(), returns.end(), std::back_inserter(negatives),
                     [](double r) { return r < 0.0; });
        return negatives;
    }
} // anonymous namespace

double downsideRisk(const std::vector<double>& returns) {
    return standardDeviation(negativeReturns(returns)) * std::sqrt(kTradingDaysPerYear);
}

double sharpeRatio(const std::vector<double>& returns, double annual_risk_free_rate) {
    const double sd = standardDeviation(returns);
    if (sd <= 0.0) {
        return 0.0;
    }
    const double daily_rf = annual_risk_free_rate / kTradingDaysPerYear;
    return std::sqrt(kTradingDaysPerYear) * (mean(returns) - daily_rf) / sd;
}

double sortinoRatio(const std::vector<double>& returns) {
    const auto negatives = negativeReturns(returns);
    if (negatives.empty()) {
        return 0.0;
    }
    const double downside_sd = standardDeviation(negatives);
    if (downside_sd <= 0.0) {
        return 0.0;
    }
    return std::sqrt(kTradingDaysPerYear) * mean(returns) / downside_sd;
}

double annualizedReturn(double total_return, double elapsed_days) {
    if (elapsed_days <= 0.0) {
        return 0.0;
    }
    const double growth = 1.0 + total_return;
    if (growth <= 0.0) {
        return -1.0;
    }
    return std::pow(growth, 365.0 / elapsed_days) - 1.0;
}

PerformanceMetrics computePerformanceMetrics(const std::vector<Trade>& trades,
                                             const std::vector<EquityPoint>& equity_curve,
                                             double initial_capital,
                                             double risk_free_rate) {
    PerformanceMetrics metrics;
    if (trades.empty()) {
        return metrics;
    }

    // --- Summary / efficiency from the trade log ---
    auto& summary = metrics.summary;
    auto& returns = metrics.returns;
    auto& efficiency = metrics.efficiency;

    summary.total_trades = static_cast<int>(trades.size());
    double total_duration_days = 0.0;
    double largest_win = 0.0;
    double largest_loss = 0.0;

    for (const auto& trade : trades) {
        total_duration_days += core::utils::daysBetween(trade.entry_date, trade.exit_date);
        returns.total_profit += trade.profit;
        if (trade.profit > 0.0) {
            ++summary.winning_trades;
            returns.gross_profit += trade.profit;
            largest_win = std::max(largest_win, trade.profit);
        } else {
            returns.gross_loss += trade.profit;
            largest_loss = std::min(largest_loss, trade.profit);
        }
    }
    summary.losing_trades = summary.total_trades - summary.winning_trades;
    summary.win_rate = static_cast<double>(summary.winning_trades) / summary.total_trades;
    summary.avg_trade_duration_days = total_duration_days / summary.total_trades;

    efficiency.profit_per_trade = returns.total_profit / summary.total_trades;
    efficiency.avg_win = summary.winning_trades > 0 ? returns.gross_profit / summary.winning_trades : 0.0;
    efficiency.avg_loss = summary.losing_trades > 0 ? returns.gross_loss / summary.losing_trades : 0.0;
    efficiency.largest_win = largest_win;
    efficiency.largest_loss = largest_loss;

    if (efficiency.avg_win != 0.0 && efficiency.avg_loss != 0.0) {
        summary.profit_loss_ratio = std::fabs(efficiency.avg_win) / std::fabs(efficiency.avg_loss);
    }
    if (returns.gross_loss != 0.0) {
        returns.profit_factor = std::fabs(returns.gross_profit / returns.gross_loss);
    }
    if (initial_capital > 0.0) {
        returns.total_profit_pct = returns.total_profit / initial_capital;
    }

    // --- Equity curve based risk ---
    if (!equity_curve.empty() && initial_capital > 0.0) {
        const double total_return = equity_curve.back().total_value / initial_capital - 1.0;
        const double elapsed = core::utils::daysBetween(equity_curve.front().date, equity_curve.back().date);
        returns.annual_return = annualizedReturn(total_return, elapsed);

        const auto values = totalValues(equity_curve);
        const auto daily = simpleReturns(values);
        const DrawdownStats dd = computeDrawdown(values);
        metrics.risk.max_drawdown = dd.max_drawdown;
        metrics.risk.avg_drawdown = dd.avg_drawdown;
        metrics.risk.max_drawdown_duration = dd.max_drawdown_duration;
        metrics.risk.volatility = annualizedVolatility(daily);
        metrics.risk.sharpe_ratio = sharpeRatio(daily, risk_free_rate);
        metrics.risk.sortino_ratio = sortinoRatio(daily);
    }
    return metrics;
}

void logMetrics(const PerformanceMetrics& metrics) {
    auto logger = core::logging::getLogger();
    logger->info("--- Backtest Metrics ---");
    logger->info("Trades: {} (won {}, lost {}), Win Rate: {:.2f}%", metrics.summary.total_trades,
                 metrics.summary.winning_trades, metrics.summary.losing_trades, metrics.summary.win_rate * 100.0);
    logger->info("Total Profit: {:.2f} ({:.2f}%), Annual Return: {:.2f}%", metrics.returns.total_profit,
                 metrics.returns.total_profit_pct * 100.0, metrics.returns.annual_return * 100.0);
    logger->info("Profit Factor: {:.2f}, Profit/Loss Ratio: {:.2f}", metrics.returns.profit_factor,
                 metrics.summary.profit_loss_ratio);
    logger->info("Max Drawdown: {:.2f}% over {} bars", metrics.risk.max_drawdown * 100.0,
                 metrics.risk.max_drawdown_duration);
    logger->info("Sharpe: {:.3f}, Sortino: {:.3f}, Volatility: {:.2f}%", metrics.risk.sharpe_ratio,
                 metrics.risk.sortino_ratio, metrics.risk.volatility * 100.0);
    logger->info("------------------------");
}

} // namespace backtester
