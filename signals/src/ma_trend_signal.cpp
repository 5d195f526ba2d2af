#include "ma_trend_signal.hpp"
#include "ema_indicator.hpp"
#include "logging.hpp"
#include <stdexcept>
#include <utility>

namespace signals {

namespace {
    constexpr double kSlopeTolerance = 0.001;
}

MaTrendSignal::MaTrendSignal(int momentum_period, int mid_period, int long_period, std::string name)
    : momentum_period_(momentum_period), mid_period_(mid_period), long_period_(long_period), name_(std::move(name)) {
    if (momentum_period_ <= 0 || mid_period_ <= 0 || long_period_ <= 0) {
        throw std::invalid_argument("MaTrendSignal periods must be positive.");
    }
}

core::SignalSeries MaTrendSignal::calculate(const core::TimeSeries<core::Candle>& candles) {
    const std::size_t n = candles.size();
    core::SignalSeries result(n, 0);
    if (n == 0) {
        return result;
    }

    indicators::EmaIndicator mid_ema(mid_period_);
    indicators::EmaIndicator long_ema(long_period_);
    mid_ema.calculate(candles);
    long_ema.calculate(candles);
    const indicators::AlignedSeries mid(mid_ema, n);
    const indicators::AlignedSeries slow(long_ema, n);

    int status = 0;
    for (std::size_t i = 1; i < n; ++i) {
        auto mid_now = mid.at(i);
        auto mid_prev = mid.at(i - 1);
        auto long_now = slow.at(i);
        auto long_prev = slow.at(i - 1);
        if (mid_now && mid_prev && long_now && long_prev) {
            const double close = candles[i].close;
            const std::size_t base_index = i > static_cast<std::size_t>(momentum_period_)
                                           ? i - static_cast<std::size_t>(momentum_period_) : 0;
            const double momentum_base = candles[base_index].close;
            const double slope = *long_now > 0.0 ? (*long_now - *long_prev) / *long_now : 0.0;

            if (slope > -kSlopeTolerance && *mid_prev < *mid_now && close > momentum_base) {
                status = 1;
            }
            if (slope < kSlopeTolerance && *mid_prev > *mid_now && close <= momentum_base) {
                status = -1;
            }
        }
        result[i] = status;
    }

    core::logging::getLogger()->debug("{}: computed {} signals", name_, n);
    return result;
}

} // namespace signals
