#pragma once

#include "datatypes.hpp"
#include "backtest_types.hpp"
#include <array>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace regime {

    enum class MarketRegime {
        StrongBull,
        Bull,
        Range,
        Bear,
        StrongBear
    };

    // "strong_bull", "bull", "range", "bear", "strong_bear"
    std::string toString(MarketRegime regime);
    MarketRegime parseMarketRegime(const std::string& label);

    const std::array<MarketRegime, 5>& allRegimes();

    struct RegimeClassifierConfig {
        int sma_period = 200;
        int volatility_period = 20;
        double bull_threshold = 0.05;
        double bear_threshold = -0.05;
        int rsi_period = 14;
        int volume_ma_period = 20;
        int macd_fast = 12;
        int macd_slow = 26;
        int macd_signal = 9;

        static RegimeClassifierConfig fromJson(const nlohmann::json& config);
        // Throws core::ConfigException
        void validate() const;
    };

    // Indicator snapshot of one bar. Values are 0 while ready is false.
    struct RegimeIndicators {
        double price_to_ma = 0.0;     // close / SMA - 1
        double volatility = 0.0;      // Rolling stdev of close-to-close returns
        double rsi = 0.0;             // 0..100
        double volume_ratio = 0.0;    // volume / volume SMA
        double macd_hist = 0.0;
        double market_strength = 0.0; // Weighted 0..1 blend
        bool ready = false;           // Every lookback window satisfied
    };

    struct RegimeTradeStats {
        int trade_count = 0;
        int win_count = 0;
        double win_rate = 0.0;
        double total_profit = 0.0;
        double avg_profit = 0.0;
        double max_profit = 0.0;
        double max_loss = 0.0;
        double profit_std = 0.0;
        double avg_holding_days = 0.0;
    };

    struct RegimeAnalysis {
        // Only regimes that received at least one trade
        std::map<MarketRegime, RegimeTradeStats> by_regime;
        // Bars per label over the whole series, all labels present
        std::map<MarketRegime, int> regime_counts;
    };

    // Labels every bar from price, volume and momentum indicators only
    class MarketRegimeClassifier {
    public:
        // Component weights of the market strength blend
        static constexpr double kTrendWeight = 0.3;
        static constexpr double kVolumeWeight = 0.2;
        static constexpr double kRsiWeight = 0.2;
        static constexpr double kMacdWeight = 0.2;
        static constexpr double kVolatilityWeight = 0.1;

        explicit MarketRegimeClassifier(const RegimeClassifierConfig& config = RegimeClassifierConfig());

        const RegimeClassifierConfig& getConfig() const { return config_; }

        // Number of leading bars without a full set of indicator values
        int requiredLookback() const;

        std::vector<RegimeIndicators> computeIndicators(const core::TimeSeries<core::Candle>& candles) const;

        // One label per bar; bars inside the lookback window are Range
        std::vector<MarketRegime> classify(const core::TimeSeries<core::Candle>& candles) const;

        // Assigns each trade the label of the bar nearest to its entry date.
        // Throws core::BacktestException when regimes and candles differ in length.
        RegimeAnalysis analyzeTradesByRegime(const std::vector<backtester::Trade>& trades,
                                             const core::TimeSeries<core::Candle>& candles,
                                             const std::vector<MarketRegime>& regimes) const;

        RegimeAnalysis analyzeTradesByRegime(const std::vector<backtester::Trade>& trades,
                                             const core::TimeSeries<core::Candle>& candles) const;

    private:
        MarketRegime classifyBar(const RegimeIndicators& values) const;

        RegimeClassifierConfig config_;
    };

    // Index of the candle whose timestamp is closest to ts (earlier one on ties).
    // candles must be non-empty and sorted.
    std::size_t nearestBarIndex(const core::TimeSeries<core::Candle>& candles, core::Timestamp ts);

} // namespace regime
