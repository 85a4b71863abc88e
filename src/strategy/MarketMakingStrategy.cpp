#include "strategy/MarketMakingStrategy.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PrecisionHelper.h"
#include "risk/RiskSizer.h"
#include <algorithm>
#include <cmath>

namespace spotbot {
namespace strategy {

QuotePrices MarketMakingStrategy::quotePrices(double mid, double spread_pct, double tick_size) {
    const double half = spread_pct / 2.0;
    QuotePrices quotes;
    quotes.bid = common::roundDownToTick(mid * (1.0 - half), tick_size);
    quotes.ask = common::roundUpToTick(mid * (1.0 + half), tick_size);

    if (tick_size > 0.0) {
        if (quotes.bid >= mid) quotes.bid = common::roundDownToTick(mid - tick_size, tick_size);
        if (quotes.ask <= mid) quotes.ask = common::roundUpToTick(mid + tick_size, tick_size);
    }
    return quotes;
}

std::vector<OrderAction> MarketMakingStrategy::evaluate(const TickContext& ctx, const StrategyConfig& config) {
    std::optional<ExchangeOrder> live_bid;
    std::optional<ExchangeOrder> live_ask;

    for (const auto& order : ctx.open_orders) {
        if (!isBotOrder(order)) {
            continue;
        }
        auto& slot = (order.side == OrderSide::BUY) ? live_bid : live_ask;
        if (slot) {
            // Never guess which one is authoritative
            throw InvariantViolation(ctx.pair.toString() + ": more than one live " +
                                     orderSideToString(order.side) + " quote (" +
                                     slot->order_id + ", " + order.order_id + ")");
        }
        slot = order;
    }

    const double mid = ctx.snapshot.mid();
    const auto quotes = quotePrices(mid, config.mm_spread_pct, ctx.rules.tick_size);

    bool ask_enabled = !config.buy_only;
    if (ask_enabled && config.downtrend_protect && ctx.snapshot.ema &&
        ctx.snapshot.ticker.last < *ctx.snapshot.ema) {
        LOG_DEBUG("[{}] price {} below EMA {}, quoting bid only",
                  ctx.pair.toString(), ctx.snapshot.ticker.last, *ctx.snapshot.ema);
        ask_enabled = false;
    }

    std::vector<OrderAction> actions;
    handleSide(ctx, config, OrderSide::BUY, live_bid, quotes.bid, true, actions);
    handleSide(ctx, config, OrderSide::SELL, live_ask, quotes.ask, ask_enabled, actions);
    return actions;
}

void MarketMakingStrategy::handleSide(const TickContext& ctx,
                                      const StrategyConfig& config,
                                      OrderSide side,
                                      const std::optional<ExchangeOrder>& live,
                                      double desired_price,
                                      bool enabled,
                                      std::vector<OrderAction>& actions) {
    const char* side_name = orderSideToString(side);

    if (!enabled) {
        if (live) {
            actions.push_back(CancelAction{live->order_id, std::string(side_name) + " side disabled"});
        }
        return;
    }

    if (live) {
        const double threshold = config.requote_threshold_ratio * config.mm_spread_pct * ctx.snapshot.mid();
        const double drift = std::fabs(live->price - desired_price);
        const auto age = std::chrono::duration_cast<std::chrono::seconds>(
            ctx.now - fromEpochMs(live->update_time_ms));
        const bool drifted = drift > threshold;
        const bool expired = age.count() > config.trade_interval_seconds;

        if (!drifted && !expired) {
            return;
        }

        LOG_INFO("[{}] requote {} {} -> {} ({})", ctx.pair.toString(), side_name, live->price,
                 desired_price, drifted ? "mid drift" : "quote age");

        const double remaining = live->orig_qty - live->executed_qty;
        if (ctx.atomic_replace && remaining > 0.0) {
            try {
                ModifyAction modify;
                modify.order_id = live->order_id;
                modify.side = side;
                modify.quantity = risk::RiskSizer::sizeFixed(remaining, desired_price, ctx.rules);
                modify.new_price = desired_price;
                actions.push_back(modify);
                return;
            } catch (const InsufficientBalance& e) {
                // Remainder of a partial fill is below the minimum: withdraw it
                LOG_INFO("[{}] {} remainder not requotable: {}", ctx.pair.toString(), side_name, e.what());
            }
        }
        actions.push_back(CancelAction{live->order_id, drifted ? "mid drift" : "quote age"});
    }

    // Fresh quote, issued right after any cancel for this side
    double quantity = config.mm_order_size;
    if (side == OrderSide::SELL) {
        // The cancel just issued unlocks the old ask's remainder
        const double unlocked = live ? std::max(0.0, live->orig_qty - live->executed_qty) : 0.0;
        quantity = std::min(quantity, ctx.base_free + unlocked);
    }

    try {
        PlaceAction place;
        place.side = side;
        place.type = OrderType::LIMIT;
        place.price = desired_price;
        place.reference_price = desired_price;
        place.quantity = risk::RiskSizer::sizeFixed(quantity, desired_price, ctx.rules);
        place.purpose = ActionPurpose::QUOTE;
        place.reason = std::string(side_name) + " quote";
        actions.push_back(place);
    } catch (const InsufficientBalance& e) {
        LOG_DEBUG("[{}] no {} quote: {}", ctx.pair.toString(), side_name, e.what());
    }
}

} // namespace strategy
} // namespace spotbot
