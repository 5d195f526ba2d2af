#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Rolling standard deviation of one-bar close-to-close returns
class VolatilityIndicator : public IIndicator {
public:
    explicit VolatilityIndicator(int period);

    virtual ~VolatilityIndicator() override = default;

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
