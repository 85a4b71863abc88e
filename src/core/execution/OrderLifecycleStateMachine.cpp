#include "core/execution/OrderLifecycleStateMachine.h"

#include <algorithm>
#include <cctype>

namespace spotbot {
namespace core {
namespace execution {

namespace {
std::string normalizeStatus(std::string status) {
    std::transform(status.begin(), status.end(), status.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return status;
}
} // namespace

OrderLifecycleTransitionResult OrderLifecycleStateMachine::transition(
    const std::string& exchange_status,
    double current_filled_volume,
    double order_volume,
    double executed_volume
) {
    OrderLifecycleTransitionResult result;
    result.filled_volume = std::max(current_filled_volume, executed_volume);

    const std::string status = normalizeStatus(exchange_status);

    if (status == "FILLED") {
        result.status = OrderStatus::FILLED;
        result.filled_volume = (result.filled_volume > 0.0) ? result.filled_volume : order_volume;
        result.terminal = true;
        return result;
    }

    // EXPIRED_IN_MATCH: self-trade prevention expired the order
    if (status == "CANCELED" || status == "CANCELLED" ||
        status == "EXPIRED" || status == "EXPIRED_IN_MATCH") {
        result.status = OrderStatus::CANCELLED;
        result.terminal = true;
        return result;
    }

    if (status == "REJECTED") {
        result.status = OrderStatus::REJECTED;
        result.terminal = true;
        return result;
    }

    if (status == "PARTIALLY_FILLED") {
        if (order_volume > 0.0 && result.filled_volume >= order_volume - 1e-8) {
            result.status = OrderStatus::FILLED;
            result.terminal = true;
        } else {
            result.status = (result.filled_volume > 0.0) ? OrderStatus::PARTIALLY_FILLED : OrderStatus::SUBMITTED;
        }
        return result;
    }

    if (status == "PENDING_NEW") {
        result.status = OrderStatus::PENDING;
        return result;
    }

    // NEW, PENDING_CANCEL and anything unrecognized: still live
    result.status = (result.filled_volume > 0.0) ? OrderStatus::PARTIALLY_FILLED : OrderStatus::SUBMITTED;
    return result;
}

} // namespace execution
} // namespace core
} // namespace spotbot
