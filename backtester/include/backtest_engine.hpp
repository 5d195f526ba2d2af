#pragma once

#include "backtest_config.hpp"
#include "backtest_types.hpp"
#include "cost_ledger.hpp"
#include "simulator.hpp"
#include "sizing_policy.hpp"
#include "stop_loss_policy.hpp"
#include "indicators.hpp"
#include <memory>
#include <optional>
#include <string>

namespace backtester {

    // Running state threaded through the bar loop of one run
    struct SimulationState {
        double cash = 0.0;
        std::optional<Position> position;
        int previous_signal = 0;
        std::size_t bar_index = 0;
    };

    // Full fidelity simulator: sizing policy, composite stops, time stop,
    // pyramiding and the slippage/commission cost model.
    class BacktestEngine : public ISimulator {
    public:
        explicit BacktestEngine(const BacktestConfig& config = BacktestConfig());

        std::string getName() const override { return "full"; }

        BacktestResult run(const core::TimeSeries<core::Candle>& candles,
                           const core::SignalSeries& signals) override;

        void reset() override;

        const BacktestConfig& getConfig() const { return config_; }
        const CostLedger& getCostLedger() const { return ledger_; }

    private:
        // --- Bar transitions, each returns true when it changed the position ---
        bool openPosition(SimulationState& state, const core::Candle& candle,
                          core::Direction direction, std::optional<double> atr);
        bool addPyramidLeg(SimulationState& state, const core::Candle& candle, std::optional<double> atr);
        bool checkStopLoss(SimulationState& state, BacktestResult& result,
                           const core::Candle& candle, std::optional<double> atr);
        void closePosition(SimulationState& state, BacktestResult& result, core::Timestamp date,
                           double price, CloseType close_type);

        // Largest whole-lot share count whose long entry cost fits in the cash
        long long affordableShares(long long shares, double fill_price, double cash) const;

        BacktestConfig config_;
        std::unique_ptr<ISizingPolicy> sizing_policy_;
        std::unique_ptr<IStopLossPolicy> stop_loss_policy_;
        CostLedger ledger_;
        double capital_;
    };

} // namespace backtester
