#include "backtest_engine.hpp"
#include "atr_indicator.hpp"
#include "performance.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace backtester {

BacktestEngine::BacktestEngine(const BacktestConfig& config)
    : config_(config),
      ledger_(config.slippage_rate, config.commission_rate),
      capital_(config.initial_capital)
{
    config_.validate();
    sizing_policy_ = makeSizingPolicy(config_);
    stop_loss_policy_ = makeStopLossPolicy(config_);
    core::logging::getLogger()->debug("BacktestEngine initialized: capital {}, sizing '{}', stop '{}'",
                                      capital_, sizing_policy_->getName(), stop_loss_policy_->getName());
}

void BacktestEngine::reset() {
    capital_ = config_.initial_capital;
    ledger_.reset();
}

BacktestResult BacktestEngine::run(const core::TimeSeries<core::Candle>& candles,
                                   const core::SignalSeries& signals) {
    auto logger = core::logging::getLogger();
    BacktestResult result;
    result.pos_data = alignSignals(candles, signals);

    // Every run starts from the initial capital with an empty ledger
    reset();

    logger->info("Starting backtest over {} bars (sizing '{}', capital {:.2f})",
                 candles.size(), sizing_policy_->getName(), capital_);
    if (candles.empty()) {
        logger->warn("No candles supplied, backtest produces an empty result.");
        return result;
    }

    indicators::AtrIndicator atr_indicator(config_.atr_period);
    atr_indicator.calculate(candles);
    const indicators::AlignedSeries atr(atr_indicator, candles.size());

    SimulationState state;
    state.cash = capital_;
    result.equity_curve.reserve(candles.size());

    for (std::size_t i = 0; i < candles.size(); ++i) {
        state.bar_index = i;
        const core::Candle& candle = candles[i];
        const int signal = core::toInt(core::directionFromSignal(result.pos_data[i]));
        const bool signal_changed = signal != state.previous_signal;
        std::optional<double> current_atr = atr.at(i);
        if (current_atr && *current_atr <= 0.0) {
            current_atr.reset();
        }

        bool acted = false;
        bool forced_close = false;

        // 1. Time stop
        if (state.position && config_.time_stop_bars > 0 &&
            i - state.position->entry_index >= static_cast<std::size_t>(config_.time_stop_bars)) {
            closePosition(state, result, candle.timestamp, candle.open, CloseType::TimeStop);
            acted = true;
            forced_close = true;
        }

        // 2. Signal-change close
        if (signal_changed && state.position && core::toInt(state.position->direction) != signal) {
            closePosition(state, result, candle.timestamp, candle.open, CloseType::Signal);
            acted = true;
        }

        // 3. Signal-change open, also the second half of a reversal
        if (signal_changed && signal != 0 && !state.position && !forced_close) {
            if (openPosition(state, candle, core::directionFromSignal(signal), current_atr)) {
                acted = true;
            }
        }

        // 4. Pyramiding
        if (!acted && state.position && sizing_policy_->allowsPyramiding() &&
            core::toInt(state.position->direction) == signal &&
            state.position->pyramid_level < config_.max_pyramid_levels) {
            acted = addPyramidLeg(state, candle, current_atr);
        }

        // 5. Stop check, against the watermark of the bars before this one
        if (!acted && state.position) {
            checkStopLoss(state, result, candle, current_atr);
        }

        // Entry and pyramid bars count towards the watermark as well
        if (state.position) {
            updateWatermark(*state.position, candle.high, candle.low);
        }

        result.equity_curve.push_back(markToMarket(state.cash, state.position ? &*state.position : nullptr, candle));
        state.previous_signal = signal;
    }

    // Terminal close, unconditional
    if (state.position) {
        const core::Candle& last = candles.back();
        closePosition(state, result, last.timestamp, last.close, CloseType::EndOfData);
        result.equity_curve.back() = markToMarket(state.cash, nullptr, last);
    }

    result.metrics = computePerformanceMetrics(result.trades, result.equity_curve,
                                               config_.initial_capital, config_.risk_free_rate);
    result.costs.total_commission = ledger_.totalCommission();
    result.costs.total_slippage = ledger_.totalSlippage();
    result.costs.cost_analysis = ledger_.analysis();
    result.transactions = ledger_.transactions();
    logMetrics(result.metrics);

    logger->info("Backtest finished: {} trades, final value {:.2f}, commission {:.2f}, slippage {:.2f}",
                 result.trades.size(), result.equity_curve.back().total_value,
                 result.costs.total_commission, result.costs.total_slippage);
    return result;
}

long long BacktestEngine::affordableShares(long long shares, double fill_price, double cash) const {
    while (shares > 0) {
        const double cost = fill_price * static_cast<double>(shares) + ledger_.commissionFor(fill_price, shares);
        if (cost <= cash) {
            break;
        }
        shares -= config_.shares_per_lot;
    }
    return shares > 0 ? shares : 0;
}

bool BacktestEngine::openPosition(SimulationState& state, const core::Candle& candle,
                                  core::Direction direction, std::optional<double> atr) {
    auto logger = core::logging::getLogger();
    const int side = core::toInt(direction);
    const double fill = ledger_.applySlippage(candle.open, side);

    SizingContext context;
    context.capital = state.cash;
    context.initial_capital = config_.initial_capital;
    context.price = candle.open;
    context.atr = atr;
    const double allocation = sizing_policy_->allocation(context);

    long long shares = sharesForAllocation(allocation, fill, config_.shares_per_lot);
    if (direction == core::Direction::Long) {
        shares = affordableShares(shares, fill, state.cash);
    }
    if (shares <= 0) {
        logger->debug("{}: allocation {:.2f} buys no whole lot at {:.4f}, entry skipped",
                      core::utils::dateToString(candle.timestamp), allocation, fill);
        return false;
    }

    const double commission = ledger_.commissionFor(fill, shares);
    const double slippage = std::fabs(fill - candle.open) * static_cast<double>(shares);
    ledger_.record(candle.timestamp, TransactionKind::Open, fill, shares, commission, slippage);

    if (direction == core::Direction::Long) {
        state.cash -= fill * static_cast<double>(shares) + commission;
    } else {
        state.cash -= commission;
    }

    Position position;
    position.entry_date = candle.timestamp;
    position.entry_index = state.bar_index;
    position.entry_price = fill;
    position.first_entry_price = fill;
    position.direction = direction;
    position.size = shares;
    position.commission_paid = commission;
    position.slippage_paid = slippage;
    position.pyramid_level = 1;
    position.base_allocation = allocation;
    position.watermark = candle.open;
    position.stop_loss_price = stop_loss_policy_->stopPrice(position, atr);
    state.position = position;

    logger->debug("{}: opened {} {} @ {:.4f} (stop {})", core::utils::dateToString(candle.timestamp),
                  direction == core::Direction::Long ? "long" : "short", shares, fill,
                  position.stop_loss_price ? fmt::format("{:.4f}", *position.stop_loss_price) : "none");
    return true;
}

bool BacktestEngine::addPyramidLeg(SimulationState& state, const core::Candle& candle, std::optional<double> atr) {
    Position& position = *state.position;
    if (!atr) {
        return false;
    }
    const bool favourable = position.direction == core::Direction::Long
        ? candle.close >= position.first_entry_price + *atr
        : candle.close <= position.first_entry_price - *atr;
    if (!favourable) {
        return false;
    }

    const int side = core::toInt(position.direction);
    const double fill = ledger_.applySlippage(candle.close, side);
    const double allocation = sizing_policy_->addOnAllocation(position.base_allocation, position.pyramid_level);
    long long shares = sharesForAllocation(allocation, fill, config_.shares_per_lot);
    if (position.direction == core::Direction::Long) {
        shares = affordableShares(shares, fill, state.cash);
    }
    if (shares <= 0) {
        core::logging::getLogger()->trace("{}: pyramid allocation {:.2f} buys no whole lot",
                                          core::utils::dateToString(candle.timestamp), allocation);
        return false;
    }

    const double commission = ledger_.commissionFor(fill, shares);
    const double slippage = std::fabs(fill - candle.close) * static_cast<double>(shares);
    ledger_.record(candle.timestamp, TransactionKind::Open, fill, shares, commission, slippage);

    if (position.direction == core::Direction::Long) {
        state.cash -= fill * static_cast<double>(shares) + commission;
    } else {
        state.cash -= commission;
    }

    const double old_size = static_cast<double>(position.size);
    position.entry_price = (position.entry_price * old_size + fill * static_cast<double>(shares))
                           / (old_size + static_cast<double>(shares));
    position.size += shares;
    position.commission_paid += commission;
    position.slippage_paid += slippage;
    position.pyramid_level += 1;

    core::logging::getLogger()->debug("{}: pyramid leg {} added {} @ {:.4f}, avg entry {:.4f}",
                                      core::utils::dateToString(candle.timestamp), position.pyramid_level,
                                      shares, fill, position.entry_price);
    return true;
}

bool BacktestEngine::checkStopLoss(SimulationState& state, BacktestResult& result,
                                   const core::Candle& candle, std::optional<double> atr) {
    Position& position = *state.position;
    const auto stop_price = stop_loss_policy_->stopPrice(position, atr);
    position.stop_loss_price = stop_price;

    if (stop_price && stopBreached(position, *stop_price, candle.high, candle.low)) {
        closePosition(state, result, candle.timestamp, *stop_price, CloseType::StopLoss);
        return true;
    }
    return false;
}

void BacktestEngine::closePosition(SimulationState& state, BacktestResult& result, core::Timestamp date,
                                   double price, CloseType close_type) {
    const Position& position = *state.position;
    const int exit_side = -core::toInt(position.direction);
    const double fill = ledger_.applySlippage(price, exit_side);
    const double commission = ledger_.commissionFor(fill, position.size);
    const double slippage = std::fabs(fill - price) * static_cast<double>(position.size);
    ledger_.record(date, TransactionKind::Close, fill, position.size, commission, slippage);

    state.cash += closingCashFlow(position, fill, commission);
    Trade trade = makeTrade(position, date, fill, commission, slippage, close_type);

    core::logging::getLogger()->debug("{}: closed {} {} @ {:.4f} ({}), profit {:.2f}",
                                      core::utils::dateToString(date),
                                      position.direction == core::Direction::Long ? "long" : "short",
                                      position.size, fill, toString(close_type), trade.profit);
    result.trades.push_back(trade);
    state.position.reset();
}

} // namespace backtester
