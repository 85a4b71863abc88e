#include "strategy/StrategyEngine.h"
#include "common/Errors.h"
#include "common/Logger.h"

namespace spotbot {
namespace strategy {

StrategyEngine::StrategyEngine(const StrategyConfig& config)
    : config_(config)
    , strategy_(makeStrategy(config.kind)) {}

StrategyVariant StrategyEngine::makeStrategy(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::SCALPING: return ScalpingStrategy{};
        case StrategyKind::MARKET_MAKING: return MarketMakingStrategy{};
        case StrategyKind::TREND_FOLLOWING: return TrendFollowingStrategy{};
    }
    throw ConfigError("unknown strategy kind");
}

bool StrategyEngine::needsEma() const {
    return config_.kind == StrategyKind::TREND_FOLLOWING ||
           (config_.kind == StrategyKind::MARKET_MAKING && config_.downtrend_protect);
}

std::chrono::milliseconds StrategyEngine::stalenessLimit() const {
    return std::chrono::milliseconds(2000LL * config_.trade_interval_seconds);
}

std::vector<OrderAction> StrategyEngine::evaluate(const TickContext& ctx) {
    const auto age = ctx.snapshot.age(ctx.now);
    if (age > stalenessLimit()) {
        throw StaleDataError(ctx.pair.toString() + ": snapshot age " + std::to_string(age.count()) +
                             " ms exceeds " + std::to_string(stalenessLimit().count()) + " ms");
    }

    auto actions = std::visit(
        [&](auto& strategy) { return strategy.evaluate(ctx, config_); },
        strategy_);

    if (!actions.empty()) {
        LOG_DEBUG("[{}] {} produced {} action(s)", ctx.pair.toString(),
                  strategyKindToString(config_.kind), actions.size());
    }
    return actions;
}

} // namespace strategy
} // namespace spotbot
