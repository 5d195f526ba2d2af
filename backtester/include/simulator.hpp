#pragma once

#include "backtest_types.hpp"
#include <string>

namespace backtester {

    // One simulation fidelity behind a common input/output contract.
    // Instances are not thread-safe; give each concurrent run its own instance.
    class ISimulator {
    public:
        virtual ~ISimulator() = default;

        virtual std::string getName() const = 0;

        // Replays the signal series over the candles. Throws core::BacktestException
        // when the signal series is shorter than the candle series.
        virtual BacktestResult run(const core::TimeSeries<core::Candle>& candles,
                                   const core::SignalSeries& signals) = 0;

        // Restores the initial capital and clears accumulated costs
        virtual void reset() = 0;
    };

    // Checks signal/candle alignment: shorter signals throw core::BacktestException,
    // longer ones are truncated to the candle count with a warning.
    core::SignalSeries alignSignals(const core::TimeSeries<core::Candle>& candles,
                                    const core::SignalSeries& signals);

    // Builds the round-trip record of a position closed at exit_fill.
    // Slippage is embedded in both fill prices, so the fill difference already nets it out.
    Trade makeTrade(const Position& position, core::Timestamp exit_date, double exit_fill,
                    double exit_commission, double exit_slippage, CloseType close_type);

    // Long: cash + close * size. Flat or short: cash.
    EquityPoint markToMarket(double cash, const Position* position, const core::Candle& candle);

    // Cash released when a position is closed at exit_fill, net of the exit commission
    double closingCashFlow(const Position& position, double exit_fill, double exit_commission);

} // namespace backtester
