#pragma once

#include "backtest_config.hpp"
#include "cost_ledger.hpp"
#include "simulator.hpp"

namespace backtester {

    // Reference simulator used to cross-check the full engine. Ignores sizing,
    // stops and costs: enters whole lots bought with the initial capital at the bar
    // open whenever the signal leaves zero or reverses, exits on reversal, on a
    // zero signal or at the end of data. Fills carry no commission or slippage.
    // Trade dates match the full engine only while each of its entries buys at
    // least one whole lot; an entry the full engine skips is still taken here.
    class SimpleBacktestEngine : public ISimulator {
    public:
        explicit SimpleBacktestEngine(const BacktestConfig& config = BacktestConfig());

        std::string getName() const override { return "simple"; }

        BacktestResult run(const core::TimeSeries<core::Candle>& candles,
                           const core::SignalSeries& signals) override;

        void reset() override;

    private:
        BacktestConfig config_;
        CostLedger ledger_;
    };

} // namespace backtester
