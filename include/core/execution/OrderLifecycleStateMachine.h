#pragma once

#include <string>

#include "common/Types.h"

namespace spotbot {
namespace core {
namespace execution {

struct OrderLifecycleTransitionResult {
    OrderStatus status = OrderStatus::SUBMITTED;
    double filled_volume = 0.0;
    bool terminal = false;
};

// Binance order status -> normalized order status
class OrderLifecycleStateMachine {
public:
    static OrderLifecycleTransitionResult transition(
        const std::string& exchange_status,
        double current_filled_volume,
        double order_volume,
        double executed_volume = 0.0
    );
};

} // namespace execution
} // namespace core
} // namespace spotbot
