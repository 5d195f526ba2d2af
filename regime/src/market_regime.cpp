#include "market_regime.hpp"
#include "sma_indicator.hpp"
#include "rsi_indicator.hpp"
#include "macd_indicator.hpp"
#include "volatility_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace regime {

std::string toString(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::StrongBull: return "strong_bull";
        case MarketRegime::Bull:       return "bull";
        case MarketRegime::Range:      return "range";
        case MarketRegime::Bear:       return "bear";
        case MarketRegime::StrongBear: return "strong_bear";
    }
    return "range";
}

MarketRegime parseMarketRegime(const std::string& label) {
    for (MarketRegime regime : allRegimes()) {
        if (toString(regime) == label) {
            return regime;
        }
    }
    throw core::ConfigException("Unknown market regime label: '" + label + "'");
}

const std::array<MarketRegime, 5>& allRegimes() {
    static const std::array<MarketRegime, 5> regimes = {
        MarketRegime::StrongBull, MarketRegime::Bull, MarketRegime::Range,
        MarketRegime::Bear, MarketRegime::StrongBear
    };
    return regimes;
}

// --- RegimeClassifierConfig ---

RegimeClassifierConfig RegimeClassifierConfig::fromJson(const nlohmann::json& config) {
    using core::utils::jsonValue;
    RegimeClassifierConfig result;
    result.sma_period = jsonValue(config, "sma_period", result.sma_period);
    result.volatility_period = jsonValue(config, "volatility_period", result.volatility_period);
    result.bull_threshold = jsonValue(config, "bull_threshold", result.bull_threshold);
    result.bear_threshold = jsonValue(config, "bear_threshold", result.bear_threshold);
    result.rsi_period = jsonValue(config, "rsi_period", result.rsi_period);
    result.volume_ma_period = jsonValue(config, "volume_ma_period", result.volume_ma_period);
    result.macd_fast = jsonValue(config, "macd_fast", result.macd_fast);
    result.macd_slow = jsonValue(config, "macd_slow", result.macd_slow);
    result.macd_signal = jsonValue(config, "macd_signal", result.macd_signal);
    result.validate();
    return result;
}

void RegimeClassifierConfig::validate() const {
    if (sma_period <= 0 || rsi_period <= 0 || volume_ma_period <= 0) {
        throw core::ConfigException("Regime classifier SMA, RSI and volume MA periods must be positive");
    }
    if (volatility_period < 2) {
        throw core::ConfigException(fmt::format("'volatility_period' must be at least 2, got {}", volatility_period));
    }
    if (macd_fast < 2 || macd_slow <= macd_fast || macd_signal < 1) {
        throw core::ConfigException(fmt::format("Invalid MACD periods {}/{}/{}", macd_fast, macd_slow, macd_signal));
    }
    if (bear_threshold > bull_threshold) {
        throw core::ConfigException("'bear_threshold' must not exceed 'bull_threshold'");
    }
}

// --- MarketRegimeClassifier ---

MarketRegimeClassifier::MarketRegimeClassifier(const RegimeClassifierConfig& config) : config_(config) {
    config_.validate();
}

int MarketRegimeClassifier::requiredLookback() const {
    indicators::SmaIndicator sma(config_.sma_period);
    indicators::VolatilityIndicator volatility(config_.volatility_period);
    indicators::RsiIndicator rsi(config_.rsi_period);
    indicators::SmaIndicator volume_ma(config_.volume_ma_period, indicators::InputField::Volume);
    indicators::MacdIndicator macd(config_.macd_fast, config_.macd_slow, config_.macd_signal);
    return std::max({sma.getLookback(), volatility.getLookback(), rsi.getLookback(),
                     volume_ma.getLookback(), macd.getLookback()});
}

namespace {
    // Scales values into [0, 1] by the series maximum over ready bars; a zero maximum yields 0
    void normalizeByMax(std::vector<double>& values, const std::vector<RegimeIndicators>& bars) {
        double max_value = 0.0;
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (bars[i].ready) {
                max_value = std::max(max_value, values[i]);
            }
        }
        for (double& v : values) {
            v = max_value > 0.0 ? v / max_value : 0.0;
        }
    }
} // anonymous namespace

std::vector<RegimeIndicators> MarketRegimeClassifier::computeIndicators(
        const core::TimeSeries<core::Candle>& candles) const {
    const std::size_t n = candles.size();
    std::vector<RegimeIndicators> result(n);
    if (n == 0) {
        return result;
    }

    indicators::SmaIndicator sma(config_.sma_period);
    indicators::VolatilityIndicator volatility(config_.volatility_period);
    indicators::RsiIndicator rsi(config_.rsi_period);
    indicators::SmaIndicator volume_ma(config_.volume_ma_period, indicators::InputField::Volume);
    indicators::MacdIndicator macd(config_.macd_fast, config_.macd_slow, config_.macd_signal);

    sma.calculate(candles);
    volatility.calculate(candles);
    rsi.calculate(candles);
    volume_ma.calculate(candles);
    macd.calculate(candles);

    const indicators::AlignedSeries sma_series(sma, n);
    const indicators::AlignedSeries vol_series(volatility, n);
    const indicators::AlignedSeries rsi_series(rsi, n);
    const indicators::AlignedSeries volume_ma_series(volume_ma, n);
    const indicators::AlignedSeries hist_series(macd, n);

    std::vector<double> trend(n, 0.0), volume(n, 0.0), macd_mag(n, 0.0), vol(n, 0.0);

    for (std::size_t i = 0; i < n; ++i) {
        auto sma_value = sma_series.at(i);
        auto vol_value = vol_series.at(i);
        auto rsi_value = rsi_series.at(i);
        auto volume_ma_value = volume_ma_series.at(i);
        auto hist_value = hist_series.at(i);
        if (!sma_value || !vol_value || !rsi_value || !volume_ma_value || !hist_value) {
            continue;
        }

        RegimeIndicators& bar = result[i];
        const double close = candles[i].close;
        bar.price_to_ma = *sma_value > 0.0 ? close / *sma_value - 1.0 : 0.0;
        bar.volatility = *vol_value;
        bar.rsi = *rsi_value;
        bar.volume_ratio = *volume_ma_value > 0.0 ? static_cast<double>(candles[i].volume) / *volume_ma_value : 0.0;
        bar.macd_hist = *hist_value;
        bar.ready = true;

        trend[i] = *sma_value > 0.0 ? std::fabs(close - *sma_value) / *sma_value : 0.0;
        volume[i] = bar.volume_ratio;
        macd_mag[i] = std::fabs(bar.macd_hist);
        vol[i] = bar.volatility;
    }

    normalizeByMax(trend, result);
    normalizeByMax(volume, result);
    normalizeByMax(macd_mag, result);
    normalizeByMax(vol, result);

    for (std::size_t i = 0; i < n; ++i) {
        RegimeIndicators& bar = result[i];
        if (!bar.ready) {
            continue;
        }
        bar.market_strength = kTrendWeight * trend[i]
                            + kVolumeWeight * volume[i]
                            + kRsiWeight * (bar.rsi / 100.0)
                            + kMacdWeight * macd_mag[i]
                            + kVolatilityWeight * vol[i];
    }
    return result;
}

MarketRegime MarketRegimeClassifier::classifyBar(const RegimeIndicators& values) const {
    if (!values.ready) {
        return MarketRegime::Range;
    }
    if (values.price_to_ma > config_.bull_threshold) {
        if (values.market_strength > 0.8 && values.rsi > 70.0 && values.volume_ratio > 1.5) {
            return MarketRegime::StrongBull;
        }
        return MarketRegime::Bull;
    }
    if (values.price_to_ma < config_.bear_threshold) {
        if (values.market_strength < 0.2 && values.rsi < 30.0 && values.volume_ratio > 1.5) {
            return MarketRegime::StrongBear;
        }
        return MarketRegime::Bear;
    }
    return MarketRegime::Range;
}

std::vector<MarketRegime> MarketRegimeClassifier::classify(const core::TimeSeries<core::Candle>& candles) const {
    auto logger = core::logging::getLogger();
    const int lookback = requiredLookback();
    if (candles.size() <= static_cast<std::size_t>(lookback)) {
        logger->debug("Only {} bars for a regime lookback of {}, every bar is labelled range",
                      candles.size(), lookback);
        return std::vector<MarketRegime>(candles.size(), MarketRegime::Range);
    }

    const auto values = computeIndicators(candles);
    std::vector<MarketRegime> regimes;
    regimes.reserve(values.size());
    for (const auto& bar : values) {
        regimes.push_back(classifyBar(bar));
    }
    logger->debug("Classified {} bars (lookback {})", regimes.size(), lookback);
    return regimes;
}

std::size_t nearestBarIndex(const core::TimeSeries<core::Candle>& candles, core::Timestamp ts) {
    auto it = std::lower_bound(candles.begin(), candles.end(), ts,
                               [](const core::Candle& candle, core::Timestamp value) {
                                   return candle.timestamp < value;
                               });
    if (it == candles.begin()) {
        return 0;
    }
    if (it == candles.end()) {
        return candles.size() - 1;
    }
    const std::size_t after = static_cast<std::size_t>(it - candles.begin());
    const std::size_t before = after - 1;
    const auto gap_before = ts - candles[before].timestamp;
    const auto gap_after = candles[after].timestamp - ts;
    return gap_after < gap_before ? after : before;
}

RegimeAnalysis MarketRegimeClassifier::analyzeTradesByRegime(const std::vector<backtester::Trade>& trades,
                                                             const core::TimeSeries<core::Candle>& candles,
                                                             const std::vector<MarketRegime>& regimes) const {
    if (regimes.size() != candles.size()) {
        throw core::BacktestException(fmt::format(
            "Regime series has {} labels but {} candles were supplied", regimes.size(), candles.size()));
    }

    RegimeAnalysis analysis;
    for (MarketRegime regime : allRegimes()) {
        analysis.regime_counts[regime] = 0;
    }
    for (MarketRegime regime : regimes) {
        ++analysis.regime_counts[regime];
    }
    if (candles.empty() || trades.empty()) {
        return analysis;
    }

    std::map<MarketRegime, std::vector<const backtester::Trade*>> grouped;
    for (const auto& trade : trades) {
        grouped[regimes[nearestBarIndex(candles, trade.entry_date)]].push_back(&trade);
    }

    for (const auto& entry : grouped) {
        const auto& group = entry.second;
        RegimeTradeStats stats;
        stats.trade_count = static_cast<int>(group.size());
        stats.max_profit = group.front()->profit;
        stats.max_loss = group.front()->profit;

        double holding_days = 0.0;
        for (const backtester::Trade* trade : group) {
            if (trade->profit > 0.0) {
                ++stats.win_count;
            }
            stats.total_profit += trade->profit;
            stats.max_profit = std::max(stats.max_profit, trade->profit);
            stats.max_loss = std::min(stats.max_loss, trade->profit);
            holding_days += core::utils::daysBetween(trade->entry_date, trade->exit_date);
        }
        stats.win_rate = static_cast<double>(stats.win_count) / stats.trade_count;
        stats.avg_profit = stats.total_profit / stats.trade_count;
        stats.avg_holding_days = holding_days / stats.trade_count;

        double sum_sq = 0.0;
        for (const backtester::Trade* trade : group) {
            sum_sq += (trade->profit - stats.avg_profit) * (trade->profit - stats.avg_profit);
        }
        stats.profit_std = std::sqrt(sum_sq / stats.trade_count);

        analysis.by_regime[entry.first] = stats;
    }
    return analysis;
}

RegimeAnalysis MarketRegimeClassifier::analyzeTradesByRegime(const std::vector<backtester::Trade>& trades,
                                                             const core::TimeSeries<core::Candle>& candles) const {
    return analyzeTradesByRegime(trades, candles, classify(candles));
}

} // namespace regime
