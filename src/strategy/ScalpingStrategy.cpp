#include "strategy/ScalpingStrategy.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "risk/RiskSizer.h"

namespace spotbot {
namespace strategy {

std::vector<OrderAction> ScalpingStrategy::evaluate(const TickContext& ctx, const StrategyConfig& config) {
    std::vector<OrderAction> actions;
    const double price = ctx.snapshot.ticker.last;

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
        auto signal = risk::RiskSizer::checkExit(position, price);
        if (!signal) {
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
            exit.reason = risk::exitSignalToString(*signal);
            LOG_INFO("[{}] {} hit at {} (entry {}, stop {}, target {})",
                     ctx.pair.toString(), exit.reason, price, position.entry_price,
                     position.stop_loss_price, position.profit_target_price);
            actions.push_back(exit);
        } catch (const InsufficientBalance& e) {
            LOG_WARN("[{}] cannot exit position {}, base balance not available: {}",
                     ctx.pair.toString(), position.id, e.what());
        }
    }

    // Pending, open or exiting: one at a time
    if (!ctx.positions.empty()) {
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
        entry.reason = "scalp entry";
        actions.push_back(entry);
    } catch (const InsufficientBalance& e) {
        LOG_WARN("[{}] entry skipped: {}", ctx.pair.toString(), e.what());
    }

    return actions;
}

} // namespace strategy
} // namespace spotbot
