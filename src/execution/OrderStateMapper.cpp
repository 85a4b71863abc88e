#include "execution/OrderStateMapper.h"

#include "core/execution/OrderLifecycleStateMachine.h"

namespace spotbot {
namespace execution {

ExchangeOrderStateResult OrderStateMapper::map(
    const std::string& exchange_state,
    double current_filled_volume,
    double order_volume,
    double executed_volume
) {
    const auto transitioned = core::execution::OrderLifecycleStateMachine::transition(
        exchange_state,
        current_filled_volume,
        order_volume,
        executed_volume
    );

    ExchangeOrderStateResult result;
    result.status = transitioned.status;
    result.filled_volume = transitioned.filled_volume;
    result.terminal = transitioned.terminal;
    return result;
}

ExchangeOrderStateResult OrderStateMapper::map(const ExchangeOrder& order) {
    auto result = map(order.exchange_status, 0.0, order.orig_qty, order.executed_qty);
    result.average_price = order.averageFillPrice();
    return result;
}

} // namespace execution
} // namespace spotbot
