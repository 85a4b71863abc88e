#pragma once

#include "strategy/StrategyConfig.h"
#include "strategy/StrategyTypes.h"
#include <optional>
#include <vector>

namespace spotbot {
namespace strategy {

// EMA trend filter. Enters on an upward cross of the EMA, exits on stop/target
// and, with downtrend protection, when price falls below the EMA.
// Keeps the previous price/EMA relation, so one instance serves one pair.
class TrendFollowingStrategy {
public:
    std::vector<OrderAction> evaluate(const TickContext& ctx, const StrategyConfig& config);

private:
    std::optional<bool> was_above_;

    static bool downtrendExitAllowed(const StrategyConfig& config);
};

} // namespace strategy
} // namespace spotbot
