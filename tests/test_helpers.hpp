#pragma once

#include "datatypes.hpp"
#include "utils.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <vector>

namespace testing_helpers {

    // Daily bar at start_date + day_offset days
    inline core::Candle makeCandle(int day_offset, double open, double high, double low, double close,
                                   long long volume = 1000000) {
        core::Candle candle;
        candle.timestamp = core::utils::makeDate(2023, 1, 2) + std::chrono::hours(24 * day_offset);
        candle.open = open;
        candle.high = high;
        candle.low = low;
        candle.close = close;
        candle.volume = volume;
        return candle;
    }

    // Every field equal to price
    inline core::TimeSeries<core::Candle> flatCandles(std::size_t count, double price) {
        core::TimeSeries<core::Candle> candles;
        for (std::size_t i = 0; i < count; ++i) {
            candles.push_back(makeCandle(static_cast<int>(i), price, price, price, price));
        }
        return candles;
    }

    // close = start + step * i, open half a step below, one unit of range either side
    inline core::TimeSeries<core::Candle> risingCandles(std::size_t count, double start, double step) {
        core::TimeSeries<core::Candle> candles;
        for (std::size_t i = 0; i < count; ++i) {
            const double close = start + step * static_cast<double>(i);
            const double open = close - step / 2.0;
            candles.push_back(makeCandle(static_cast<int>(i), open, close + 0.5, open - 0.5, close));
        }
        return candles;
    }

    // Oscillating prices around 100 with a slight drift
    inline core::TimeSeries<core::Candle> wavyCandles(std::size_t count) {
        core::TimeSeries<core::Candle> candles;
        double previous_close = 100.0;
        for (std::size_t i = 0; i < count; ++i) {
            const double x = static_cast<double>(i);
            const double close = 100.0 + 10.0 * std::sin(x / 5.0) + 0.1 * x;
            const double open = previous_close;
            const double high = std::max(open, close) + 1.0;
            const double low = std::min(open, close) - 1.0;
            candles.push_back(makeCandle(static_cast<int>(i), open, high, low, close,
                                         1000000 + static_cast<long long>(i) * 1000));
            previous_close = close;
        }
        return candles;
    }

    // Long, short and flat stretches derived from the same wave, lagged by a few bars
    inline core::SignalSeries wavySignals(std::size_t count) {
        core::SignalSeries signals(count, 0);
        for (std::size_t i = 3; i < count; ++i) {
            const double slope = std::cos(static_cast<double>(i - 3) / 5.0);
            if (slope > 0.3) {
                signals[i] = 1;
            } else if (slope < -0.3) {
                signals[i] = -1;
            }
        }
        return signals;
    }

} // namespace testing_helpers
