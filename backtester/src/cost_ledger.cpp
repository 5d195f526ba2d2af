#include "cost_ledger.hpp"
#include "logging.hpp"
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace backtester {

CostLedger::CostLedger(double slippage_rate, double commission_rate)
    : slippage_rate_(slippage_rate), commission_rate_(commission_rate) {}

double CostLedger::applySlippage(double price, int order_side) const {
    return price * (1.0 + slippage_rate_ * order_side);
}

double CostLedger::commissionFor(double fill_price, long long size) const {
    return fill_price * static_cast<double>(size) * commission_rate_;
}

void CostLedger::record(core::Timestamp date, TransactionKind kind, double fill_price, long long size,
                        double commission, double slippage) {
    if (commission < 0.0 || slippage < 0.0) {
        throw std::invalid_argument(fmt::format("Negative cost recorded in ledger: commission {}, slippage {}",
                                                commission, slippage));
    }

    total_commission_ += commission;
    total_slippage_ += slippage;
    transactions_.push_back(Transaction{date, kind, fill_price, size, commission, slippage});

    core::logging::getLogger()->trace("Ledger {}: {} @ {:.4f}, commission {:.4f}, slippage {:.4f}",
                                      toString(kind), size, fill_price, commission, slippage);
}

CostAnalysis CostLedger::analysis() const {
    CostAnalysis result;
    if (transactions_.empty()) {
        return result;
    }

    const double count = static_cast<double>(transactions_.size());
    result.total_commission = total_commission_;
    result.total_slippage = total_slippage_;
    result.total_cost = total_commission_ + total_slippage_;
    result.avg_commission_per_transaction = total_commission_ / count;
    result.avg_slippage_per_transaction = total_slippage_ / count;

    for (const auto& tx : transactions_) {
        CostBucket& bucket = result.cost_by_type[toString(tx.kind)];
        bucket.commission += tx.commission;
        bucket.slippage += tx.slippage;
    }

    if (result.total_cost > 0.0) {
        result.commission_pct = total_commission_ / result.total_cost;
        result.slippage_pct = total_slippage_ / result.total_cost;
    }
    return result;
}

void CostLedger::reset() {
    total_commission_ = 0.0;
    total_slippage_ = 0.0;
    transactions_.clear();
}

} // namespace backtester
