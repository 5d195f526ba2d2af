#pragma once

#include "datatypes.hpp" // Needs Candle, TimeSeries
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace indicators {

// Candle field an indicator reads its input from
enum class InputField {
    Open,
    High,
    Low,
    Close,
    Volume
};

// Copies one field of every candle into a plain double series (TA-Lib input layout)
std::vector<double> extractField(const core::TimeSeries<core::Candle>& input, InputField field);

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Get the name of the indicator (e.g., "SMA(50)", "RSI(14)")
    virtual std::string getName() const = 0;

    // Number of initial input bars consumed before the first valid output.
    // Result index r corresponds to input bar r + getLookback().
    virtual int getLookback() const = 0;

    // Calculate the indicator based on input candle data, storing the result internally.
    virtual void calculate(const core::TimeSeries<core::Candle>& input) = 0;

    // Calculated results, shorter than the input by the lookback.
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

// Bar-indexed view over an indicator result. Bars inside the lookback window report
// insufficient history (std::nullopt) instead of relying on index arithmetic at call sites.
class AlignedSeries {
public:
    AlignedSeries() = default;
    AlignedSeries(core::TimeSeries<double> values, int lookback, std::size_t bar_count);
    AlignedSeries(const IIndicator& indicator, std::size_t bar_count);

    std::optional<double> at(std::size_t bar_index) const;
    bool ready(std::size_t bar_index) const;

    // Value at bar_index, or fallback while history is insufficient
    double valueOr(std::size_t bar_index, double fallback) const;

    int lookback() const { return lookback_; }
    std::size_t barCount() const { return bar_count_; }

private:
    core::TimeSeries<double> values_;
    int lookback_ = 0;
    std::size_t bar_count_ = 0;
};

} // namespace indicators
