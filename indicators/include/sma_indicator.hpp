#pragma once

#include "indicators.hpp" // Base interface
#include <vector>
#include <string>
#include <stdexcept>

namespace indicators {

class SmaIndicator : public IIndicator {
public:
    // Simple moving average over the given candle field (close by default)
    explicit SmaIndicator(int period, InputField field = InputField::Close);

    virtual ~SmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;          // SMA period (e.g., 50, 200)
    const InputField field_;
    int lookback_;              // TA-Lib lookback
    std::string name_;          // Indicator name (e.g., "SMA(50)")
    core::TimeSeries<double> results_;
};

} // namespace indicators
