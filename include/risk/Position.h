#pragma once

#include "common/Types.h"
#include <string>

namespace spotbot {
namespace risk {

enum class PositionState {
    PENDING,        // entry order submitted, not filled
    OPEN,           // entry filled, monitored for exit
    EXIT_PENDING,   // exit order submitted
    CLOSED,         // exit filled
    CANCELLED       // entry withdrawn without fill
};

inline const char* positionStateToString(PositionState state) {
    switch (state) {
        case PositionState::PENDING: return "PENDING";
        case PositionState::OPEN: return "OPEN";
        case PositionState::EXIT_PENDING: return "EXIT_PENDING";
        case PositionState::CLOSED: return "CLOSED";
        case PositionState::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

inline bool isTerminal(PositionState state) {
    return state == PositionState::CLOSED || state == PositionState::CANCELLED;
}

// One long trade. Stop and target are set once, from the entry fill price.
struct Position {
    std::string id;                 // entry client order id
    TradingPair pair;
    OrderSide side = OrderSide::BUY;
    PositionState state = PositionState::PENDING;

    double entry_price = 0.0;
    double quantity = 0.0;
    double stop_loss_price = 0.0;
    double profit_target_price = 0.0;
    Timestamp created_at;
    Timestamp entry_time;

    std::string entry_order_id;
    std::string entry_client_id;
    std::string exit_order_id;
    std::string exit_client_id;
    Timestamp exit_requested_at;
    std::string exit_reason;
    double exit_price = 0.0;

    // Quote-asset amount held in the balance ledger under `id`
    double reserved_amount = 0.0;

    bool isTerminal() const { return risk::isTerminal(state); }

    double realizedPnl(double fee_rate) const {
        const double gross = (exit_price - entry_price) * quantity;
        return gross - (entry_price + exit_price) * quantity * fee_rate;
    }
};

} // namespace risk
} // namespace spotbot
