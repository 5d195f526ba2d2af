#include "backtest_types.hpp"

namespace backtester {

std::string toString(CloseType type) {
    switch (type) {
        case CloseType::Signal:    return "signal";
        case CloseType::StopLoss:  return "stop_loss";
        case CloseType::TimeStop:  return "time_stop";
        case CloseType::EndOfData: return "end_of_data";
    }
    return "unknown";
}

std::string toString(TransactionKind kind) {
    return kind == TransactionKind::Open ? "open" : "close";
}

} // namespace backtester
