#include "simple_backtest_engine.hpp"
#include "performance.hpp"
#include "sizing_policy.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <optional>

namespace backtester {

SimpleBacktestEngine::SimpleBacktestEngine(const BacktestConfig& config)
    : config_(config), ledger_(0.0, 0.0)
{
    config_.validate();
}

void SimpleBacktestEngine::reset() {
    ledger_.reset();
}

BacktestResult SimpleBacktestEngine::run(const core::TimeSeries<core::Candle>& candles,
                                         const core::SignalSeries& signals) {
    auto logger = core::logging::getLogger();
    BacktestResult result;
    result.pos_data = alignSignals(candles, signals);
    reset();

    logger->info("Starting simplified backtest over {} bars", candles.size());
    if (candles.empty()) {
        return result;
    }

    double cash = config_.initial_capital;
    std::optional<Position> position;
    int previous_signal = 0;

    auto close = [&](const core::Candle& candle, double price, CloseType close_type) {
        ledger_.record(candle.timestamp, TransactionKind::Close, price, position->size, 0.0, 0.0);
        cash += closingCashFlow(*position, price, 0.0);
        result.trades.push_back(makeTrade(*position, candle.timestamp, price, 0.0, 0.0, close_type));
        position.reset();
    };

    for (std::size_t i = 0; i < candles.size(); ++i) {
        const core::Candle& candle = candles[i];
        const int signal = core::toInt(core::directionFromSignal(result.pos_data[i]));

        if (signal != previous_signal) {
            if (position && core::toInt(position->direction) != signal) {
                close(candle, candle.open, CloseType::Signal);
            }
            if (signal != 0 && !position) {
                const long long shares = sharesForAllocation(config_.initial_capital, candle.open,
                                                             config_.shares_per_lot);
                if (shares > 0) {
                    Position opened;
                    opened.entry_date = candle.timestamp;
                    opened.entry_index = i;
                    opened.entry_price = candle.open;
                    opened.first_entry_price = candle.open;
                    opened.direction = core::directionFromSignal(signal);
                    opened.size = shares;
                    opened.pyramid_level = 1;
                    opened.watermark = candle.open;
                    ledger_.record(candle.timestamp, TransactionKind::Open, candle.open, shares, 0.0, 0.0);
                    if (opened.direction == core::Direction::Long) {
                        cash -= candle.open * static_cast<double>(shares);
                    }
                    position = opened;
                } else {
                    logger->debug("{}: initial capital buys no whole lot at {:.4f}, entry skipped",
                                  core::utils::dateToString(candle.timestamp), candle.open);
                }
            }
        }

        result.equity_curve.push_back(markToMarket(cash, position ? &*position : nullptr, candle));
        previous_signal = signal;
    }

    if (position) {
        const core::Candle& last = candles.back();
        close(last, last.close, CloseType::EndOfData);
        result.equity_curve.back() = markToMarket(cash, nullptr, last);
    }

    result.metrics = computePerformanceMetrics(result.trades, result.equity_curve,
                                               config_.initial_capital, config_.risk_free_rate);
    result.costs.total_commission = ledger_.totalCommission();
    result.costs.total_slippage = ledger_.totalSlippage();
    result.costs.cost_analysis = ledger_.analysis();
    result.transactions = ledger_.transactions();

    logger->info("Simplified backtest finished: {} trades, final value {:.2f}",
                 result.trades.size(), result.equity_curve.back().total_value);
    return result;
}

} // namespace backtester
