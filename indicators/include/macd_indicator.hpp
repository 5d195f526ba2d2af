#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// MACD of close prices. getResult() returns the histogram (MACD line minus signal line);
// the two lines are available separately.
class MacdIndicator : public IIndicator {
public:
    MacdIndicator(int fast_period, int slow_period, int signal_period);

    virtual ~MacdIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    const core::TimeSeries<double>& getMacdLine() const { return macd_line_; }
    const core::TimeSeries<double>& getSignalLine() const { return signal_line_; }

private:
    const int fast_period_;
    const int slow_period_;
    const int signal_period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> macd_line_;
    core::TimeSeries<double> signal_line_;
    core::TimeSeries<double> histogram_;
};

} // namespace indicators
