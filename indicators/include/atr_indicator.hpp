#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Average true range: simple rolling mean of the true range
// max(high - low, |high - prev_close|, |low - prev_close|).
// The first true range needs a previous close, so the lookback equals the period.
class AtrIndicator : public IIndicator {
public:
    explicit AtrIndicator(int period);

    virtual ~AtrIndicator() override = default;

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
