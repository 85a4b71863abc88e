#pragma once

#include "strategy/StrategyConfig.h"
#include "strategy/StrategyTypes.h"
#include <vector>

namespace spotbot {
namespace strategy {

// One position at a time per pair: market buy sized from the balance, then
// hold until the stop-loss or profit target is crossed.
class ScalpingStrategy {
public:
    std::vector<OrderAction> evaluate(const TickContext& ctx, const StrategyConfig& config);
};

} // namespace strategy
} // namespace spotbot
