#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Wilder relative strength index of close prices, 0..100.
// A window without losses reads 100.
class RsiIndicator : public IIndicator {
public:
    explicit RsiIndicator(int period);

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
