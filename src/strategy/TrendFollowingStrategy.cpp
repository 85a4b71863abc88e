#include "strategy/TrendFollowingStrategy.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "risk/RiskSizer.h"

namespace spotbot {
namespace strategy {

bool TrendFollowingStrategy::downtrendExitAllowed(const StrategyConfig& config) {
    if (!config.downtrend_protect) {
        return false;
    }
    // BUY_ONLY never sells on a strategy signal unless told to
    if (config.buy_only) {
        return config.downtrend_exit_policy == DowntrendExitPolicy::FORCE_EXIT;
    }
    return true;
}

std::vector<OrderAction> TrendFollowingStrategy::evaluate(const TickContext& ctx, const StrategyConfig& config) {
    std::vector<OrderAction> actions;
    const double price = ctx.snapshot.ticker.last;
    const auto& ema = ctx.snapshot.ema;

    bool crossed_up = false;
    bool below_ema = false;
    if (ema) {
        const bool above = price > *ema;
        below_ema = price < *ema;
        // First observation only sets the baseline
        crossed_up = was_above_.has_value() && !*was_above_ && above;
        was_above_ = above;
    } else {
        LOG_DEBUG("[{}] EMA not ready, entries disabled", ctx.pair.toString());
    }

    for (const auto& position : ctx.positions) {
        if (position.state != risk::PositionState::OPEN) {
            continue;
        }
        if (risk::RiskSizer::isDust(position, ctx.base_free, ctx.snapshot.ticker.bid, ctx.rules)) {
            LOG_WARN("[{}] position {} ({} units) is under the exchange minimums at {}, closing as dust",
                     ctx.pair.toString(), position.id, position.quantity, ctx.snapshot.ticker.bid);
            actions.push_back(CloseDustAction{position.id, ctx.snapshot.ticker.bid});
            continue;
        }

        std::string reason;
        if (auto signal = risk::RiskSizer::checkExit(position, price)) {
            reason = risk::exitSignalToString(*signal);
        } else if (below_ema && downtrendExitAllowed(config)) {
            reason = "DOWNTREND";
        } else {
            continue;
        }

        try {
            PlaceAction exit;
            exit.side = OrderSide::SELL;
            exit.type = OrderType::MARKET;
            exit.reference_price = ctx.snapshot.ticker.bid;
            exit.quantity = risk::RiskSizer::sizeExit(position, ctx.base_free, exit.reference_price, ctx.rules);
            exit.purpose = ActionPurpose::EXIT;
            exit.position_id = position.id;
            exit.reason = reason;
            LOG_INFO("[{}] {} exit at {} (EMA {})", ctx.pair.toString(), reason, price,
                     ema ? *ema : 0.0);
            actions.push_back(exit);
        } catch (const InsufficientBalance& e) {
            LOG_WARN("[{}] cannot exit position {}, base balance not available: {}",
                     ctx.pair.toString(), position.id, e.what());
        }
    }

    if (!ctx.positions.empty() || !crossed_up) {
        return actions;
    }

    try {
        PlaceAction entry;
        entry.side = OrderSide::BUY;
        entry.type = OrderType::MARKET;
        entry.reference_price = ctx.snapshot.ticker.ask;
        entry.quantity = risk::RiskSizer::size(ctx.quote_available, config.percentage_of_balance,
                                               entry.reference_price, ctx.rules, config.stop_loss_pct);
        entry.purpose = ActionPurpose::ENTRY;
        entry.reason = "EMA cross up";
        LOG_INFO("[{}] price {} crossed above EMA {}", ctx.pair.toString(), price, *ema);
        actions.push_back(entry);
    } catch (const InsufficientBalance& e) {
        LOG_WARN("[{}] entry skipped: {}", ctx.pair.toString(), e.what());
    }

    return actions;
}

} // namespace strategy
} // namespace spotbot
