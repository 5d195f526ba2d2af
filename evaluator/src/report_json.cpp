#include "report_json.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <fstream>

namespace evaluator {

namespace {
    json toJson(const backtester::EquityPoint& point) {
        return {
            {"date", core::utils::timestampToString(point.date)},
            {"capital", point.cash},
            {"holdings", point.holdings_size},
            {"holding_value", point.holding_value},
            {"total_value", point.total_value},
            {"pyramid_level", point.pyramid_level}
        };
    }

    json toJson(const backtester::Trade& trade) {
        return {
            {"entry_date", core::utils::timestampToString(trade.entry_date)},
            {"entry_price", trade.entry_price},
            {"exit_date", core::utils::timestampToString(trade.exit_date)},
            {"exit_price", trade.exit_price},
            {"direction", core::toInt(trade.direction)},
            {"size", trade.size},
            {"profit", trade.profit},
            {"profit_pct", trade.profit_pct},
            {"commission", trade.commission},
            {"slippage", trade.slippage},
            {"close_type", backtester::toString(trade.close_type)}
        };
    }

    json toJson(const backtester::Transaction& tx) {
        return {
            {"date", core::utils::timestampToString(tx.date)},
            {"type", backtester::toString(tx.kind)},
            {"price", tx.price},
            {"size", tx.size},
            {"commission", tx.commission},
            {"slippage", tx.slippage}
        };
    }

    json toJson(const regime::RegimeTradeStats& stats) {
        return {
            {"trade_count", stats.trade_count},
            {"win_count", stats.win_count},
            {"win_rate", stats.win_rate},
            {"total_profit", stats.total_profit},
            {"avg_profit", stats.avg_profit},
            {"max_profit", stats.max_profit},
            {"max_loss", stats.max_loss},
            {"profit_std", stats.profit_std},
            {"avg_holding_days", stats.avg_holding_days}
        };
    }
} // anonymous namespace

json toJson(const backtester::PerformanceMetrics& metrics) {
    const auto& s = metrics.summary;
    const auto& r = metrics.returns;
    const auto& k = metrics.risk;
    const auto& e = metrics.efficiency;
    return {
        {"summary", {
            {"total_trades", s.total_trades},
            {"winning_trades", s.winning_trades},
            {"losing_trades", s.losing_trades},
            {"win_rate", s.win_rate},
            {"avg_trade_duration", s.avg_trade_duration_days},
            {"profit_loss_ratio", s.profit_loss_ratio}
        }},
        {"returns", {
            {"total_profit", r.total_profit},
            {"total_profit_pct", r.total_profit_pct},
            {"gross_profit", r.gross_profit},
            {"gross_loss", r.gross_loss},
            {"profit_factor", r.profit_factor},
            {"annual_return", r.annual_return}
        }},
        {"risk", {
            {"max_drawdown", k.max_drawdown},
            {"avg_drawdown", k.avg_drawdown},
            {"max_drawdown_duration", k.max_drawdown_duration},
            {"volatility", k.volatility},
            {"sharpe_ratio", k.sharpe_ratio},
            {"sortino_ratio", k.sortino_ratio}
        }},
        {"efficiency", {
            {"profit_per_trade", e.profit_per_trade},
            {"avg_win", e.avg_win},
            {"avg_loss", e.avg_loss},
            {"largest_win", e.largest_win},
            {"largest_loss", e.largest_loss}
        }}
    };
}

json toJson(const backtester::CostAnalysis& analysis) {
    json by_type = json::object();
    for (const auto& entry : analysis.cost_by_type) {
        by_type[entry.first] = {{"commission", entry.second.commission}, {"slippage", entry.second.slippage}};
    }
    return {
        {"cost_summary", {
            {"total_commission", analysis.total_commission},
            {"total_slippage", analysis.total_slippage},
            {"total_cost", analysis.total_cost},
            {"avg_commission_per_transaction", analysis.avg_commission_per_transaction},
            {"avg_slippage_per_transaction", analysis.avg_slippage_per_transaction}
        }},
        {"cost_by_type", by_type},
        {"cost_distribution", {
            {"commission_pct", analysis.commission_pct},
            {"slippage_pct", analysis.slippage_pct}
        }}
    };
}

json toJson(const backtester::BacktestResult& result) {
    json equity = json::array();
    for (const auto& point : result.equity_curve) {
        equity.push_back(toJson(point));
    }
    json trades = json::array();
    for (const auto& trade : result.trades) {
        trades.push_back(toJson(trade));
    }
    json transactions = json::array();
    for (const auto& tx : result.transactions) {
        transactions.push_back(toJson(tx));
    }
    return {
        {"equity_curve", equity},
        {"trades", trades},
        {"pos_data", result.pos_data},
        {"metrics", toJson(result.metrics)},
        {"costs", {
            {"total_commission", result.costs.total_commission},
            {"total_slippage", result.costs.total_slippage},
            {"cost_analysis", toJson(result.costs.cost_analysis)}
        }},
        {"transactions", transactions}
    };
}

json toJson(const regime::RegimeAnalysis& analysis) {
    json j = json::object();
    for (const auto& entry : analysis.by_regime) {
        j[regime::toString(entry.first)] = toJson(entry.second);
    }
    json counts = json::object();
    for (const auto& entry : analysis.regime_counts) {
        counts[regime::toString(entry.first)] = entry.second;
    }
    j["regime_stats"] = counts;
    return j;
}

json toJson(const PeriodPerformance& performance) {
    return {
        {"monthly_returns", performance.monthly_returns},
        {"quarterly_returns", performance.quarterly_returns},
        {"yearly_returns", performance.yearly_returns},
        {"best_month", performance.best_month},
        {"worst_month", performance.worst_month},
        {"best_quarter", performance.best_quarter},
        {"worst_quarter", performance.worst_quarter},
        {"best_year", performance.best_year},
        {"worst_year", performance.worst_year}
    };
}

json toJson(const RiskMetrics& risk) {
    return {
        {"max_drawdown", risk.max_drawdown},
        {"max_drawdown_duration", risk.max_drawdown_duration},
        {"volatility", risk.volatility},
        {"downside_risk", risk.downside_risk},
        {"sharpe_ratio", risk.sharpe_ratio},
        {"sortino_ratio", risk.sortino_ratio},
        {"annual_return", risk.annual_return},
        {"total_return", risk.total_return}
    };
}

json toJson(const StrategyRating& rating) {
    return {
        {"performance_score", rating.performance_score},
        {"risk_score", rating.risk_score},
        {"stability_score", rating.stability_score},
        {"total_score", rating.total_score},
        {"letter_grade", rating.letter_grade}
    };
}

json toJson(const StrategyEvaluation& evaluation) {
    return {
        {"strategy_name", evaluation.strategy_name},
        {"backtest_result", toJson(evaluation.backtest_result)},
        {"regime_analysis", toJson(evaluation.regime_analysis)},
        {"period_performance", toJson(evaluation.period_performance)},
        {"risk_metrics", toJson(evaluation.risk_metrics)},
        {"rating", toJson(evaluation.rating)}
    };
}

json toJson(const EvaluationReport& report) {
    json evaluations = json::object();
    for (const auto& entry : report.evaluations) {
        evaluations[entry.first] = toJson(entry.second);
    }
    json ranking = json::array();
    for (const auto& name : report.ranking) {
        const auto& rating = report.evaluations.at(name).rating;
        ranking.push_back(json{{"strategy_name", name},
                           {"total_score", rating.total_score},
                           {"letter_grade", rating.letter_grade}});
    }
    return {{"evaluations", evaluations}, {"ranking", ranking}};
}

void writeJsonFile(const std::string& path, const json& document) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw core::PlatformException("Failed to open report file for writing: " + path);
    }
    ofs << document.dump(2) << '\n';
    if (!ofs) {
        throw core::PlatformException("Failed to write report file: " + path);
    }
    core::logging::getLogger()->info("Report written to {}", path);
}

} // namespace evaluator
