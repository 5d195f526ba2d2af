#pragma once

#include "backtest_types.hpp"
#include <vector>

namespace backtester {

    // Running commission/slippage totals plus the per-fill transaction log of one run.
    // Totals only grow between resets and always equal the sum of the logged entries.
    class CostLedger {
    public:
        CostLedger(double slippage_rate, double commission_rate);

        // price * (1 + slippage_rate * order_side); order_side is +1 for buys, -1 for sells
        double applySlippage(double price, int order_side) const;

        // fill_price * size * commission_rate
        double commissionFor(double fill_price, long long size) const;

        // Throws std::invalid_argument for a negative commission or slippage
        void record(core::Timestamp date, TransactionKind kind, double fill_price, long long size,
                    double commission, double slippage);

        double totalCommission() const { return total_commission_; }
        double totalSlippage() const { return total_slippage_; }
        const std::vector<Transaction>& transactions() const { return transactions_; }

        // Zeroed analysis for an empty ledger
        CostAnalysis analysis() const;

        void reset();

    private:
        double slippage_rate_;
        double commission_rate_;
        double total_commission_ = 0.0;
        double total_slippage_ = 0.0;
        std::vector<Transaction> transactions_;
    };

} // namespace backtester
