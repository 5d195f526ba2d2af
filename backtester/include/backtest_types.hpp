#pragma once

#include "datatypes.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace backtester {

    // Why a position was closed
    enum class CloseType {
        Signal,
        StopLoss,
        TimeStop,
        EndOfData
    };

    std::string toString(CloseType type);

    // --- Open Position ---
    // Owned by one simulation run; converted into a Trade when closed.
    struct Position {
        core::Timestamp entry_date;
        std::size_t entry_index = 0;        // Bar index of the first leg
        double entry_price = 0.0;           // Average fill price over all legs (cost basis)
        double first_entry_price = 0.0;     // Fill price of the first leg, pyramid trigger reference
        core::Direction direction = core::Direction::Flat;
        long long size = 0;                 // Unsigned share count over all legs
        std::optional<double> stop_loss_price;
        double commission_paid = 0.0;       // Entry legs only
        double slippage_paid = 0.0;         // Entry legs only
        int pyramid_level = 0;              // 1 after the initial entry
        double base_allocation = 0.0;       // Capital committed by the initial leg
        double watermark = 0.0;             // Most favourable price since entry: entry open, then every held bar's high (long) or low (short)
    };

    // --- Completed Round Trip ---
    struct Trade {
        core::Timestamp entry_date;
        double entry_price = 0.0;
        core::Timestamp exit_date;
        double exit_price = 0.0;
        core::Direction direction = core::Direction::Flat;
        long long size = 0;
        double profit = 0.0;       // Net of both legs' commission and slippage
        double profit_pct = 0.0;   // profit / (entry_price * size)
        double commission = 0.0;   // Both legs
        double slippage = 0.0;     // Both legs
        CloseType close_type = CloseType::Signal;
    };

    // --- Per-bar portfolio snapshot ---
    struct EquityPoint {
        core::Timestamp date;
        double cash = 0.0;
        long long holdings_size = 0; // Signed: negative while short
        double holding_value = 0.0;  // close * size while long, 0 otherwise
        double total_value = 0.0;
        int pyramid_level = 0;
    };

    enum class TransactionKind {
        Open,
        Close
    };

    std::string toString(TransactionKind kind);

    // One fill recorded in the cost ledger
    struct Transaction {
        core::Timestamp date;
        TransactionKind kind = TransactionKind::Open;
        double price = 0.0;   // Fill price after slippage
        long long size = 0;
        double commission = 0.0;
        double slippage = 0.0;
    };

    // --- Cost analysis ---
    struct CostBucket {
        double commission = 0.0;
        double slippage = 0.0;
    };

    struct CostAnalysis {
        double total_commission = 0.0;
        double total_slippage = 0.0;
        double total_cost = 0.0;
        double avg_commission_per_transaction = 0.0;
        double avg_slippage_per_transaction = 0.0;
        std::map<std::string, CostBucket> cost_by_type; // "open" / "close"
        double commission_pct = 0.0;
        double slippage_pct = 0.0;
    };

    struct CostTotals {
        double total_commission = 0.0;
        double total_slippage = 0.0;
        CostAnalysis cost_analysis;
    };

    // --- Performance metrics, grouped as reported ---
    struct SummaryMetrics {
        int total_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;
        double avg_trade_duration_days = 0.0;
        double profit_loss_ratio = 0.0;
    };

    struct ReturnMetrics {
        double total_profit = 0.0;
        double total_profit_pct = 0.0;
        double gross_profit = 0.0;
        double gross_loss = 0.0;
        double profit_factor = 0.0;
        double annual_return = 0.0;
    };

    struct RiskMetricsGroup {
        double max_drawdown = 0.0;
        double avg_drawdown = 0.0;
        int max_drawdown_duration = 0;
        double volatility = 0.0;
        double sharpe_ratio = 0.0;
        double sortino_ratio = 0.0;
    };

    struct EfficiencyMetrics {
        double profit_per_trade = 0.0;
        double avg_win = 0.0;
        double avg_loss = 0.0;
        double largest_win = 0.0;
        double largest_loss = 0.0;
    };

    struct PerformanceMetrics {
        SummaryMetrics summary;
        ReturnMetrics returns;
        RiskMetricsGroup risk;
        EfficiencyMetrics efficiency;
    };

    // Output of one simulation run
    struct BacktestResult {
        std::vector<EquityPoint> equity_curve;
        std::vector<Trade> trades;
        core::SignalSeries pos_data;   // Echo of the input signal series
        PerformanceMetrics metrics;
        CostTotals costs;
        std::vector<Transaction> transactions;
    };

} // namespace backtester
