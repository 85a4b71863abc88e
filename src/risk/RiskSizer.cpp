#include "risk/RiskSizer.h"
#include "common/Errors.h"
#include "common/PrecisionHelper.h"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace spotbot {
namespace risk {

namespace {
// Tolerance for thresholds computed in floating point (0.40 * 0.985 != 0.394 exactly)
constexpr double kPriceEpsilon = 1e-12;

bool meetsMinimums(double quantity, double price, const SymbolRules& rules) {
    if (quantity <= 0.0 || quantity + kPriceEpsilon < rules.min_qty) {
        return false;
    }
    return rules.min_notional <= 0.0 || quantity * price + kPriceEpsilon >= rules.min_notional;
}

double checkMinimums(double quantity, double price, const SymbolRules& rules) {
    if (quantity <= 0.0 || quantity + kPriceEpsilon < rules.min_qty) {
        std::ostringstream oss;
        oss << "quantity " << quantity << " below minimum " << rules.min_qty;
        throw InsufficientBalance(oss.str());
    }
    if (rules.min_notional > 0.0 && quantity * price + kPriceEpsilon < rules.min_notional) {
        std::ostringstream oss;
        oss << "notional " << quantity * price << " below minimum " << rules.min_notional;
        throw InsufficientBalance(oss.str());
    }
    return quantity;
}
} // namespace

double RiskSizer::rawQuantity(double balance, double allocation_pct, double price) {
    if (price <= 0.0) {
        throw std::invalid_argument("price must be positive");
    }
    if (allocation_pct <= 0.0 || allocation_pct > 1.0) {
        throw std::invalid_argument("allocation must be in (0, 1]");
    }
    if (balance <= 0.0) {
        return 0.0;
    }
    return (balance * allocation_pct) / price;
}

double RiskSizer::size(double balance, double allocation_pct, double price, const SymbolRules& rules,
                       double stop_loss_pct) {
    const double raw = rawQuantity(balance, allocation_pct, price);
    double quantity = common::floorToStep(raw, rules.step_size);

    // Step-grid snapping can land a hair above the budget
    const double budget = balance * allocation_pct;
    if (rules.step_size > 0.0 && quantity * price > budget * (1.0 + 1e-9)) {
        quantity = common::floorToStep(quantity - rules.step_size, rules.step_size);
    }

    checkMinimums(quantity, price, rules);

    // The stop-loss sell has to clear the minimum notional too
    const double stop_price = price * (1.0 - stop_loss_pct);
    if (rules.min_notional > 0.0 && quantity * stop_price + kPriceEpsilon < rules.min_notional) {
        std::ostringstream oss;
        oss << "notional at stop " << quantity * stop_price << " below minimum " << rules.min_notional;
        throw InsufficientBalance(oss.str());
    }
    return quantity;
}

double RiskSizer::sizeFixed(double quantity, double price, const SymbolRules& rules) {
    return checkMinimums(common::floorToStep(quantity, rules.step_size), price, rules);
}

double RiskSizer::sizeExit(const Position& position, double base_free, double price,
                           const SymbolRules& rules) {
    return sizeFixed(std::min(position.quantity, base_free), price, rules);
}

bool RiskSizer::isDust(const Position& position, double base_free, double price,
                       const SymbolRules& rules) {
    // Zero free base means the holding is not visible yet, not that it is small
    const double sellable = base_free > 0.0 ? std::min(position.quantity, base_free) : position.quantity;
    return !meetsMinimums(common::floorToStep(sellable, rules.step_size), price, rules);
}

double RiskSizer::stopLossPrice(double entry_price, double stop_loss_pct) {
    return entry_price * (1.0 - stop_loss_pct);
}

double RiskSizer::profitTargetPrice(double entry_price, double profit_target_pct) {
    return entry_price * (1.0 + profit_target_pct);
}

std::optional<ExitSignal> RiskSizer::checkExit(const Position& position, double current_price) {
    if (current_price <= position.stop_loss_price + kPriceEpsilon) {
        return ExitSignal::STOP_LOSS;
    }
    if (current_price + kPriceEpsilon >= position.profit_target_price) {
        return ExitSignal::PROFIT_TARGET;
    }
    return std::nullopt;
}

} // namespace risk
} // namespace spotbot
