#pragma once

#include "strategy/MarketMakingStrategy.h"
#include "strategy/ScalpingStrategy.h"
#include "strategy/StrategyConfig.h"
#include "strategy/StrategyTypes.h"
#include "strategy/TrendFollowingStrategy.h"
#include <variant>
#include <vector>

namespace spotbot {
namespace strategy {

// Closed set of strategies, picked once from configuration
using StrategyVariant = std::variant<ScalpingStrategy, MarketMakingStrategy, TrendFollowingStrategy>;

// Per-pair decision maker. evaluate() is synchronous and does no I/O.
class StrategyEngine {
public:
    explicit StrategyEngine(const StrategyConfig& config);

    // Throws StaleDataError when the snapshot is older than 2 x trade interval,
    // InvariantViolation when the open orders break a strategy invariant.
    std::vector<OrderAction> evaluate(const TickContext& ctx);

    StrategyKind kind() const { return config_.kind; }
    const StrategyConfig& config() const { return config_; }

    // Whether ticks must maintain the EMA in the snapshot
    bool needsEma() const;

    std::chrono::milliseconds stalenessLimit() const;

private:
    StrategyConfig config_;
    StrategyVariant strategy_;

    static StrategyVariant makeStrategy(StrategyKind kind);
};

} // namespace strategy
} // namespace spotbot
