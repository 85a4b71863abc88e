#pragma once

#include "strategy/StrategyConfig.h"
#include "strategy/StrategyTypes.h"
#include <optional>
#include <vector>

namespace spotbot {
namespace strategy {

struct QuotePrices {
    double bid = 0.0;
    double ask = 0.0;
};

// Keeps at most one bot-owned bid and one bot-owned ask around the mid.
//
// Stateless: live quotes are read from the exchange's open orders every tick,
// so a restart picks up where the previous process left off. Without an atomic
// cancel-replace there is a short window between Cancel and Place in which the
// side is unquoted.
class MarketMakingStrategy {
public:
    std::vector<OrderAction> evaluate(const TickContext& ctx, const StrategyConfig& config);

    // bid = mid * (1 - spread/2), ask = mid * (1 + spread/2), rounded to the
    // tick away from mid and never touching it
    static QuotePrices quotePrices(double mid, double spread_pct, double tick_size);

private:
    void handleSide(const TickContext& ctx,
                    const StrategyConfig& config,
                    OrderSide side,
                    const std::optional<ExchangeOrder>& live,
                    double desired_price,
                    bool enabled,
                    std::vector<OrderAction>& actions);
};

} // namespace strategy
} // namespace spotbot
