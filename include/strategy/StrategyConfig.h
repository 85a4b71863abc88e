#pragma once

#include <string>

namespace spotbot {
namespace strategy {

enum class StrategyKind {
    SCALPING,
    MARKET_MAKING,
    TREND_FOLLOWING
};

// What trend following does with an open position on a downtrend cross when
// DOWNTREND_PROTECT and BUY_ONLY are both enabled. No default: must be set.
enum class DowntrendExitPolicy {
    UNSET,
    FORCE_EXIT,
    HOLD
};

inline const char* strategyKindToString(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::SCALPING: return "scalping";
        case StrategyKind::MARKET_MAKING: return "market_making";
        case StrategyKind::TREND_FOLLOWING: return "trend_following";
    }
    return "unknown";
}

struct StrategyConfig {
    StrategyKind kind = StrategyKind::SCALPING;

    int trade_interval_seconds = 30;
    int entry_timeout_multiple = 3;       // pending entry expires after interval * multiple

    // Risk
    double stop_loss_pct = 0.015;
    double profit_target_pct = 0.005;
    double percentage_of_balance = 0.05;
    double trading_fee = 0.001;

    // Market making
    double mm_spread_pct = 0.025;
    double mm_order_size = 0.0;           // base units per quote
    double requote_threshold_ratio = 0.5; // requote when mid drifts > ratio * spread

    // Trend filter
    std::string ema_timeframe = "5m";
    int ema_timeframe_seconds = 300;
    int ema_period = 5;
    bool downtrend_protect = false;
    bool buy_only = false;
    DowntrendExitPolicy downtrend_exit_policy = DowntrendExitPolicy::UNSET;
};

} // namespace strategy
} // namespace spotbot
