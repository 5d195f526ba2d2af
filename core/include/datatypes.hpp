#pragma once

#include <string>
#include <vector>
#include <chrono> // For timestamps
#include <cstdint>

namespace core {

    // Using system_clock for time points; all bar timestamps are treated as UTC
    using Timestamp = std::chrono::system_clock::time_point;

    // One OHLCV observation. A series of candles must be strictly increasing in time:
    // every index-based lookback assumes position == chronological order.
    struct Candle {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    // Direction of a position or of an order leg
    enum class Direction : int {
        Short = -1,
        Flat = 0,
        Long = 1
    };

    inline int toInt(Direction d) { return static_cast<int>(d); }

    inline Direction directionFromSignal(int signal) {
        if (signal > 0) return Direction::Long;
        if (signal < 0) return Direction::Short;
        return Direction::Flat;
    }

    // Per-bar target exposure produced by a signal provider: -1 short, 0 flat, 1 long
    using SignalSeries = std::vector<int>;

    // Basic TimeSeries concept
    template<typename T>
    using TimeSeries = std::vector<T>;

} // namespace core
