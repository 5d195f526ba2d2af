#include <gtest/gtest.h>

#include "performance.hpp"
#include "test_helpers.hpp"

#include <cmath>

using namespace backtester;

TEST(PerformanceTest, DrawdownTracksRunningPeak) {
    const std::vector<double> values = {100, 90, 95, 100, 80, 85, 90, 95, 101};
    const auto stats = computeDrawdown(values);
    EXPECT_DOUBLE_EQ(stats.max_drawdown, 0.2);
    EXPECT_EQ(stats.max_drawdown_duration, 4);
    EXPECT_NEAR(stats.avg_drawdown, 0.15, 1e-12);
}

TEST(PerformanceTest, DrawdownOfMonotonicCurveIsZero) {
    const auto stats = computeDrawdown({100, 101, 102, 103});
    EXPECT_DOUBLE_EQ(stats.max_drawdown, 0.0);
    EXPECT_EQ(stats.max_drawdown_duration, 0);
    EXPECT_DOUBLE_EQ(stats.avg_drawdown, 0.0);
}

TEST(PerformanceTest, DrawdownIsClampedWhenEquityGoesNegative) {
    const auto stats = computeDrawdown({100, 50, -20, 10});
    EXPECT_DOUBLE_EQ(stats.max_drawdown, 1.0);
}

TEST(PerformanceTest, ZeroVolatilityGivesZeroRatios) {
    const std::vector<double> returns(10, 0.01);
    EXPECT_DOUBLE_EQ(standardDeviation(returns), 0.0);
    EXPECT_DOUBLE_EQ(sharpeRatio(returns, 0.03), 0.0);
    EXPECT_DOUBLE_EQ(sortinoRatio(returns), 0.0);
    EXPECT_DOUBLE_EQ(downsideRisk(returns), 0.0);
}

TEST(PerformanceTest, SharpeAndSortinoFollowAnnualizedFormulas) {
    const std::vector<double> returns = {0.01, -0.02, 0.03, -0.01, 0.02};
    const double avg = 0.006;
    double sum_sq = 0.0;
    for (double r : returns) {
        sum_sq += (r - avg) * (r - avg);
    }
    const double sd = std::sqrt(sum_sq / 5.0);
    EXPECT_NEAR(sharpeRatio(returns, 0.0), std::sqrt(252.0) * avg / sd, 1e-9);
    EXPECT_NEAR(sharpeRatio(returns, 0.0252), std::sqrt(252.0) * (avg - 0.0001) / sd, 1e-9);
    EXPECT_NEAR(annualizedVolatility(returns), sd * std::sqrt(252.0), 1e-12);

    // Negative returns -0.02 and -0.01: population stdev 0.005
    EXPECT_NEAR(sortinoRatio(returns), std::sqrt(252.0) * avg / 0.005, 1e-9);
}

TEST(PerformanceTest, AnnualizedReturnCompoundsOverElapsedDays) {
    EXPECT_NEAR(annualizedReturn(0.1, 365.0), 0.1, 1e-12);
    EXPECT_NEAR(annualizedReturn(0.21, 730.0), 0.1, 1e-12);
    EXPECT_DOUBLE_EQ(annualizedReturn(0.5, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(annualizedReturn(-1.5, 100.0), -1.0);
}

TEST(PerformanceTest, SimpleReturnsSkipNonPositiveBase) {
    const auto returns = simpleReturns({100, 110, 0, 50});
    ASSERT_EQ(returns.size(), 3u);
    EXPECT_NEAR(returns[0], 0.1, 1e-12);
    EXPECT_NEAR(returns[1], -1.0, 1e-12);
    EXPECT_DOUBLE_EQ(returns[2], 0.0);
}

TEST(PerformanceTest, MetricsSummarizeTradeLog) {
    const auto start = core::utils::makeDate(2023, 1, 1);
    std::vector<Trade> trades(3);
    trades[0].profit = 300.0;
    trades[1].profit = -100.0;
    trades[2].profit = 100.0;
    for (int i = 0; i < 3; ++i) {
        trades[i].entry_date = start + std::chrono::hours(24 * 10 * i);
        trades[i].exit_date = trades[i].entry_date + std::chrono::hours(24 * 2);
    }

    std::vector<EquityPoint> curve(2);
    curve[0].date = start;
    curve[0].total_value = 100000.0;
    curve[1].date = start + std::chrono::hours(24 * 365);
    curve[1].total_value = 100300.0;

    const auto metrics = computePerformanceMetrics(trades, curve, 100000.0, 0.0);
    EXPECT_EQ(metrics.summary.total_trades, 3);
    EXPECT_EQ(metrics.summary.winning_trades, 2);
    EXPECT_EQ(metrics.summary.losing_trades, 1);
    EXPECT_NEAR(metrics.summary.win_rate, 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(metrics.summary.avg_trade_duration_days, 2.0, 1e-9);
    EXPECT_DOUBLE_EQ(metrics.returns.total_profit, 300.0);
    EXPECT_DOUBLE_EQ(metrics.returns.gross_profit, 400.0);
    EXPECT_DOUBLE_EQ(metrics.returns.gross_loss, -100.0);
    EXPECT_DOUBLE_EQ(metrics.returns.profit_factor, 4.0);
    EXPECT_DOUBLE_EQ(metrics.summary.profit_loss_ratio, 2.0);
    EXPECT_NEAR(metrics.returns.annual_return, 0.003, 1e-9);
    EXPECT_DOUBLE_EQ(metrics.efficiency.largest_win, 300.0);
    EXPECT_DOUBLE_EQ(metrics.efficiency.largest_loss, -100.0);
}

TEST(PerformanceTest, NoTradesYieldZeroMetrics) {
    std::vector<EquityPoint> curve(3);
    curve[1].total_value = 50.0;
    const auto metrics = computePerformanceMetrics({}, curve, 100000.0, 0.0);
    EXPECT_EQ(metrics.summary.total_trades, 0);
    EXPECT_DOUBLE_EQ(metrics.risk.max_drawdown, 0.0);
    EXPECT_DOUBLE_EQ(metrics.returns.annual_return, 0.0);
}
