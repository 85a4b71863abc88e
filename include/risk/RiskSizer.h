#pragma once

#include "common/Types.h"
#include "risk/Position.h"
#include <optional>

namespace spotbot {
namespace risk {

enum class ExitSignal { STOP_LOSS, PROFIT_TARGET };

inline const char* exitSignalToString(ExitSignal signal) {
    return signal == ExitSignal::STOP_LOSS ? "STOP_LOSS" : "PROFIT_TARGET";
}

// Pure sizing and exit-threshold math. No I/O, no state.
class RiskSizer {
public:
    // (balance * allocation_pct) / price, before lot flooring.
    // Throws std::invalid_argument for price <= 0 or allocation outside (0, 1].
    static double rawQuantity(double balance, double allocation_pct, double price);

    // rawQuantity floored to the lot step. Throws InsufficientBalance when the
    // result is under the minimum quantity, or when its notional at the stop
    // price (price * (1 - stop_loss_pct)) is under the minimum notional.
    static double size(double balance, double allocation_pct, double price, const SymbolRules& rules,
                       double stop_loss_pct = 0.0);

    // Fixed quantity (market-making size, exit size) floored and checked the same way
    static double sizeFixed(double quantity, double price, const SymbolRules& rules);

    // Sell size for closing `position`: its quantity capped by what is actually free
    // (fees charged in the base asset shrink the holding).
    static double sizeExit(const Position& position, double base_free, double price,
                           const SymbolRules& rules);

    // The holding can no longer be sold at `price`: what is sellable (the
    // position, capped by a non-zero free base balance) is under the minimums.
    static bool isDust(const Position& position, double base_free, double price,
                       const SymbolRules& rules);

    static double stopLossPrice(double entry_price, double stop_loss_pct);
    static double profitTargetPrice(double entry_price, double profit_target_pct);

    // StopLoss wins when both thresholds are crossed in one evaluation
    static std::optional<ExitSignal> checkExit(const Position& position, double current_price);
};

} // namespace risk
} // namespace spotbot
