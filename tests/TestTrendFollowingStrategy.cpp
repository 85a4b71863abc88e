#include "strategy/StrategyEngine.h"
#include "TestHelpers.h"

#include <cassert>
#include <iostream>

using namespace spotbot;
using namespace spotbot::strategy;
using spotbot::testing::actionsOf;
using spotbot::testing::makeContext;
using spotbot::testing::openPosition;

namespace {

StrategyConfig trendConfig() {
    StrategyConfig config;
    config.kind = StrategyKind::TREND_FOLLOWING;
    config.percentage_of_balance = 0.05;
    config.stop_loss_pct = 0.015;
    config.profit_target_pct = 0.05;
    return config;
}

TickContext at(double price, double ema) {
    auto ctx = makeContext(price - 0.0001, price + 0.0001, price, 1000.0, 125.0);
    ctx.snapshot.ema = ema;
    return ctx;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting TrendFollowingStrategy Test..." << std::endl;

    // Starting above the EMA is not a cross; a fall and a recovery is
    {
        StrategyEngine engine(trendConfig());
        assert(engine.needsEma());
        assert(engine.evaluate(at(0.41, 0.40)).empty());
        assert(engine.evaluate(at(0.42, 0.40)).empty());
        assert(engine.evaluate(at(0.39, 0.40)).empty());

        auto places = actionsOf<PlaceAction>(engine.evaluate(at(0.405, 0.40)));
        assert(places.size() == 1);
        assert(places[0].side == OrderSide::BUY);
        assert(places[0].purpose == ActionPurpose::ENTRY);
        assert(places[0].quantity * places[0].reference_price <= 1000.0 * 0.05 + 1e-9);
    }

    // No EMA yet: no entries
    {
        StrategyEngine engine(trendConfig());
        auto ctx = makeContext(0.3999, 0.4001, 0.40);
        assert(engine.evaluate(ctx).empty());
        assert(engine.evaluate(at(0.39, 0.40)).empty());
        assert(actionsOf<PlaceAction>(engine.evaluate(at(0.41, 0.40))).size() == 1);
    }

    // Cross up while holding: no second entry
    {
        StrategyEngine engine(trendConfig());
        auto below = at(0.39, 0.40);
        below.positions.push_back(openPosition("sb-ADAUSDT-a", 0.395, 125.0, trendConfig()));
        engine.evaluate(below);
        auto above = at(0.401, 0.40);
        above.positions = below.positions;
        assert(engine.evaluate(above).empty());
    }

    // Downtrend exit only with protection enabled
    {
        auto config = trendConfig();
        StrategyEngine plain(config);
        auto ctx = at(0.398, 0.40);
        ctx.positions.push_back(openPosition("sb-ADAUSDT-a", 0.40, 125.0, config));
        assert(plain.evaluate(ctx).empty());

        config.downtrend_protect = true;
        StrategyEngine protect(config);
        auto places = actionsOf<PlaceAction>(protect.evaluate(ctx));
        assert(places.size() == 1);
        assert(places[0].side == OrderSide::SELL);
        assert(places[0].reason == "DOWNTREND");
        assert(places[0].position_id == "sb-ADAUSDT-a");
    }

    // Protection plus buy-only follows the configured policy
    {
        auto config = trendConfig();
        config.downtrend_protect = true;
        config.buy_only = true;
        config.downtrend_exit_policy = DowntrendExitPolicy::HOLD;
        auto ctx = at(0.398, 0.40);
        ctx.positions.push_back(openPosition("sb-ADAUSDT-a", 0.40, 125.0, config));

        StrategyEngine hold(config);
        assert(hold.evaluate(ctx).empty());

        config.downtrend_exit_policy = DowntrendExitPolicy::FORCE_EXIT;
        StrategyEngine force(config);
        assert(actionsOf<PlaceAction>(force.evaluate(ctx)).size() == 1);
    }

    // Buy-only never suppresses the stop loss
    {
        auto config = trendConfig();
        config.downtrend_protect = true;
        config.buy_only = true;
        config.downtrend_exit_policy = DowntrendExitPolicy::HOLD;
        StrategyEngine engine(config);
        auto ctx = at(0.393, 0.40);
        ctx.positions.push_back(openPosition("sb-ADAUSDT-a", 0.40, 125.0, config));
        auto places = actionsOf<PlaceAction>(engine.evaluate(ctx));
        assert(places.size() == 1);
        assert(places[0].reason == "STOP_LOSS");
    }

    // Unsellable position below the EMA is closed as dust, not left open
    {
        auto config = trendConfig();
        config.downtrend_protect = true;
        StrategyEngine engine(config);
        auto ctx = at(0.30, 0.40);
        ctx.base_free = 10.0;
        ctx.positions.push_back(openPosition("sb-ADAUSDT-a", 0.40, 10.0, config));
        auto actions = engine.evaluate(ctx);
        assert(actionsOf<CloseDustAction>(actions).size() == 1);
        assert(actionsOf<PlaceAction>(actions).empty());
    }

    // Profit target hit above the EMA
    {
        StrategyEngine engine(trendConfig());
        auto ctx = at(0.421, 0.41);
        ctx.positions.push_back(openPosition("sb-ADAUSDT-a", 0.40, 125.0, trendConfig()));
        auto places = actionsOf<PlaceAction>(engine.evaluate(ctx));
        assert(places.size() == 1);
        assert(places[0].reason == "PROFIT_TARGET");
    }

    std::cout << "[TEST] TrendFollowingStrategy PASSED" << std::endl;
    return 0;
}
