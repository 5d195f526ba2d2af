#include <gtest/gtest.h>

#include "market_regime.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <cmath>

using namespace regime;
using namespace testing_helpers;

namespace {

    RegimeClassifierConfig shortWindowConfig() {
        RegimeClassifierConfig config;
        config.sma_period = 20;
        config.volatility_period = 10;
        config.rsi_period = 5;
        config.volume_ma_period = 20;
        config.macd_fast = 3;
        config.macd_slow = 6;
        config.macd_signal = 3;
        return config;
    }

    // 2% compounding rise per bar on 10% compounding volume
    core::TimeSeries<core::Candle> surgingCandles(std::size_t count) {
        core::TimeSeries<core::Candle> candles;
        for (std::size_t i = 0; i < count; ++i) {
            const double close = 100.0 * std::pow(1.02, static_cast<double>(i));
            const double open = close / 1.01;
            const auto volume = static_cast<long long>(1000000.0 * std::pow(1.1, static_cast<double>(i)));
            candles.push_back(makeCandle(static_cast<int>(i), open, close * 1.005, open * 0.995, close, volume));
        }
        return candles;
    }

    backtester::Trade tradeAt(const core::Timestamp& entry, int holding_days, double profit) {
        backtester::Trade trade;
        trade.entry_date = entry;
        trade.exit_date = entry + std::chrono::hours(24 * holding_days);
        trade.profit = profit;
        return trade;
    }

} // anonymous namespace

TEST(MarketRegimeTest, LabelsRoundTrip) {
    for (MarketRegime regime : allRegimes()) {
        EXPECT_EQ(parseMarketRegime(toString(regime)), regime);
    }
    EXPECT_EQ(toString(MarketRegime::StrongBear), "strong_bear");
    EXPECT_THROW(parseMarketRegime("sideways"), core::ConfigException);
}

TEST(MarketRegimeTest, SurgingSeriesStabilizesToStrongBull) {
    MarketRegimeClassifier classifier(shortWindowConfig());
    const auto candles = surgingCandles(80);
    const auto regimes = classifier.classify(candles);
    ASSERT_EQ(regimes.size(), candles.size());

    const int lookback = classifier.requiredLookback();
    EXPECT_EQ(lookback, 19);
    for (int i = 0; i < lookback; ++i) {
        EXPECT_EQ(regimes[i], MarketRegime::Range) << "bar " << i;
    }
    for (std::size_t i = regimes.size() - 5; i < regimes.size(); ++i) {
        EXPECT_EQ(regimes[i], MarketRegime::StrongBull) << "bar " << i;
    }
    for (MarketRegime regime : regimes) {
        EXPECT_NE(regime, MarketRegime::Bear);
        EXPECT_NE(regime, MarketRegime::StrongBear);
    }
}

TEST(MarketRegimeTest, IndicatorsReportReadinessAndBoundedStrength) {
    MarketRegimeClassifier classifier(shortWindowConfig());
    const auto values = classifier.computeIndicators(surgingCandles(60));
    ASSERT_EQ(values.size(), 60u);
    EXPECT_FALSE(values[0].ready);
    EXPECT_DOUBLE_EQ(values[0].market_strength, 0.0);
    EXPECT_TRUE(values[59].ready);
    for (const auto& bar : values) {
        EXPECT_GE(bar.market_strength, 0.0);
        EXPECT_LE(bar.market_strength, 1.0 + 1e-9);
    }
    EXPECT_GT(values[59].price_to_ma, 0.05);
    EXPECT_GT(values[59].volume_ratio, 1.5);
    EXPECT_GT(values[59].rsi, 70.0);
}

TEST(MarketRegimeTest, ShortHistoryIsAllRange) {
    MarketRegimeClassifier classifier;
    const auto regimes = classifier.classify(wavyCandles(50));
    ASSERT_EQ(regimes.size(), 50u);
    for (MarketRegime regime : regimes) {
        EXPECT_EQ(regime, MarketRegime::Range);
    }
}

TEST(MarketRegimeTest, NearestBarPrefersEarlierOnTies) {
    const auto candles = flatCandles(5, 10.0);
    const auto day = std::chrono::hours(24);
    EXPECT_EQ(nearestBarIndex(candles, candles[0].timestamp - day), 0u);
    EXPECT_EQ(nearestBarIndex(candles, candles[4].timestamp + day), 4u);
    EXPECT_EQ(nearestBarIndex(candles, candles[2].timestamp), 2u);
    EXPECT_EQ(nearestBarIndex(candles, candles[2].timestamp + std::chrono::hours(5)), 2u);
    EXPECT_EQ(nearestBarIndex(candles, candles[2].timestamp + std::chrono::hours(13)), 3u);
    EXPECT_EQ(nearestBarIndex(candles, candles[2].timestamp + std::chrono::hours(12)), 2u);
}

TEST(MarketRegimeTest, TradesAreGroupedByEntryRegime) {
    MarketRegimeClassifier classifier;
    const auto candles = flatCandles(6, 10.0);
    const std::vector<MarketRegime> regimes = {
        MarketRegime::Bull, MarketRegime::Bull, MarketRegime::Bear,
        MarketRegime::Bear, MarketRegime::Range, MarketRegime::Range
    };
    const std::vector<backtester::Trade> trades = {
        tradeAt(candles[0].timestamp, 2, 100.0),
        tradeAt(candles[1].timestamp, 4, -50.0),
        tradeAt(candles[2].timestamp, 1, 30.0),
    };

    const auto analysis = classifier.analyzeTradesByRegime(trades, candles, regimes);
    EXPECT_EQ(analysis.regime_counts.at(MarketRegime::Bull), 2);
    EXPECT_EQ(analysis.regime_counts.at(MarketRegime::StrongBear), 0);
    EXPECT_EQ(analysis.by_regime.size(), 2u);

    const auto& bull = analysis.by_regime.at(MarketRegime::Bull);
    EXPECT_EQ(bull.trade_count, 2);
    EXPECT_EQ(bull.win_count, 1);
    EXPECT_DOUBLE_EQ(bull.win_rate, 0.5);
    EXPECT_DOUBLE_EQ(bull.avg_profit, 25.0);
    EXPECT_DOUBLE_EQ(bull.profit_std, 75.0);
    EXPECT_DOUBLE_EQ(bull.max_profit, 100.0);
    EXPECT_DOUBLE_EQ(bull.max_loss, -50.0);
    EXPECT_NEAR(bull.avg_holding_days, 3.0, 1e-9);

    const auto& bear = analysis.by_regime.at(MarketRegime::Bear);
    EXPECT_EQ(bear.trade_count, 1);
    EXPECT_DOUBLE_EQ(bear.win_rate, 1.0);
    EXPECT_EQ(analysis.by_regime.count(MarketRegime::Range), 0u);
}

TEST(MarketRegimeTest, MismatchedRegimeSeriesIsRejected) {
    MarketRegimeClassifier classifier;
    const auto candles = flatCandles(4, 10.0);
    EXPECT_THROW(classifier.analyzeTradesByRegime({}, candles, {MarketRegime::Range}), core::BacktestException);
}

TEST(MarketRegimeTest, ConfigParsingValidatesWindows) {
    const auto config = RegimeClassifierConfig::fromJson({{"sma_period", 50}, {"bull_threshold", 0.1}});
    EXPECT_EQ(config.sma_period, 50);
    EXPECT_DOUBLE_EQ(config.bull_threshold, 0.1);
    EXPECT_EQ(config.rsi_period, 14);
    EXPECT_THROW(RegimeClassifierConfig::fromJson({{"macd_fast", 30}}), core::ConfigException);
    EXPECT_THROW(RegimeClassifierConfig::fromJson({{"volatility_period", 1}}), core::ConfigException);
    EXPECT_THROW(RegimeClassifierConfig::fromJson({{"bear_threshold", 0.2}}), core::ConfigException);
}
