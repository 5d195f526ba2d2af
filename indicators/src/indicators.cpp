#include "indicators.hpp"
#include <utility>

namespace indicators {

std::vector<double> extractField(const core::TimeSeries<core::Candle>& input, InputField field) {
    std::vector<double> values;
    values.reserve(input.size());
    for (const auto& candle : input) {
        switch (field) {
            case InputField::Open:   values.push_back(candle.open); break;
            case InputField::High:   values.push_back(candle.high); break;
            case InputField::Low:    values.push_back(candle.low); break;
            case InputField::Close:  values.push_back(candle.close); break;
            case InputField::Volume: values.push_back(static_cast<double>(candle.volume)); break;
        }
    }
    return values;
}

AlignedSeries::AlignedSeries(core::TimeSeries<double> values, int lookback, std::size_t bar_count)
    : values_(std::move(values)), lookback_(lookback < 0 ? 0 : lookback), bar_count_(bar_count) {}

AlignedSeries::AlignedSeries(const IIndicator& indicator, std::size_t bar_count)
    : AlignedSeries(indicator.getResult(), indicator.getLookback(), bar_count) {}

std::optional<double> AlignedSeries::at(std::size_t bar_index) const {
    if (bar_index >= bar_count_ || bar_index < static_cast<std::size_t>(lookback_)) {
        return std::nullopt;
    }
    std::size_t result_index = bar_index - static_cast<std::size_t>(lookback_);
    if (result_index >= values_.size()) {
        return std::nullopt;
    }
    return values_[result_index];
}

bool AlignedSeries::ready(std::size_t bar_index) const {
    return at(bar_index).has_value();
}

double AlignedSeries::valueOr(std::size_t bar_index, double fallback) const {
    auto value = at(bar_index);
    return value ? *value : fallback;
}

} // namespace indicators
