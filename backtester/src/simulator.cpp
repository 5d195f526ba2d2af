#include "simulator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace backtester {

core::SignalSeries alignSignals(const core::TimeSeries<core::Candle>& candles,
                                const core::SignalSeries& signals) {
    if (signals.size() < candles.size()) {
        throw core::BacktestException(fmt::format(
            "Signal series has {} entries but {} candles were supplied", signals.size(), candles.size()));
    }
    if (signals.size() > candles.size()) {
        core::logging::getLogger()->warn("Signal series has {} entries for {} candles, truncating.",
                                         signals.size(), candles.size());
        return core::SignalSeries(signals.begin(), signals.begin() + static_cast<std::ptrdiff_t>(candles.size()));
    }
    return signals;
}

Trade makeTrade(const Position& position, core::Timestamp exit_date, double exit_fill,
                double exit_commission, double exit_slippage, CloseType close_type) {
    Trade trade;
    trade.entry_date = position.entry_date;
    trade.entry_price = position.entry_price;
    trade.exit_date = exit_date;
    trade.exit_price = exit_fill;
    trade.direction = position.direction;
    trade.size = position.size;
    trade.commission = position.commission_paid + exit_commission;
    trade.slippage = position.slippage_paid + exit_slippage;
    trade.close_type = close_type;

    const double gross = (exit_fill - position.entry_price) * static_cast<double>(position.size)
                         * core::toInt(position.direction);
    trade.profit = gross - trade.commission;
    const double notional = position.entry_price * static_cast<double>(position.size);
    trade.profit_pct = notional > 0.0 ? trade.profit / notional : 0.0;
    return trade;
}

EquityPoint markToMarket(double cash, const Position* position, const core::Candle& candle) {
    EquityPoint point;
    point.date = candle.timestamp;
    point.cash = cash;
    point.total_value = cash;
    if (position == nullptr) {
        return point;
    }
    point.pyramid_level = position->pyramid_level;
    if (position->direction == core::Direction::Long) {
        point.holdings_size = position->size;
        point.holding_value = candle.close * static_cast<double>(position->size);
        point.total_value = cash + point.holding_value;
    } else {
        // Short proceeds stay in cash; P&L is realized at close
        point.holdings_size = -position->size;
    }
    return point;
}

double closingCashFlow(const Position& position, double exit_fill, double exit_commission) {
    const double size = static_cast<double>(position.size);
    if (position.direction == core::Direction::Long) {
        return exit_fill * size - exit_commission;
    }
    return (position.entry_price - exit_fill) * size - exit_commission;
}

} // namespace backtester
