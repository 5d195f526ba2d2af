#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Exponential moving average of close prices (TA-Lib TA_MAType_EMA)
class EmaIndicator : public IIndicator {
public:
    explicit EmaIndicator(int period);

    virtual ~EmaIndicator() override = default;

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
