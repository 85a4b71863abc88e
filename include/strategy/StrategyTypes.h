#pragma once

#include "analytics/MarketDataCache.h"
#include "common/Types.h"
#include "risk/Position.h"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace spotbot {
namespace strategy {

// Prefix of every client order id this bot assigns. Open orders without it
// belong to someone else and are never touched.
constexpr const char* kClientOrderPrefix = "sb-";

inline bool isBotOrder(const ExchangeOrder& order) {
    return order.client_order_id.rfind(kClientOrderPrefix, 0) == 0;
}

enum class ActionPurpose {
    ENTRY,      // opens a position
    EXIT,       // closes `position_id`
    QUOTE       // market-making quote, no position
};

inline const char* actionPurposeToString(ActionPurpose purpose) {
    switch (purpose) {
        case ActionPurpose::ENTRY: return "ENTRY";
        case ActionPurpose::EXIT: return "EXIT";
        case ActionPurpose::QUOTE: return "QUOTE";
    }
    return "UNKNOWN";
}

struct PlaceAction {
    OrderSide side = OrderSide::BUY;
    OrderType type = OrderType::MARKET;
    double quantity = 0.0;
    std::optional<double> price;        // limit price; empty for MARKET
    double reference_price = 0.0;       // price the quantity was sized at
    ActionPurpose purpose = ActionPurpose::ENTRY;
    std::string position_id;            // EXIT only
    std::string reason;
};

struct CancelAction {
    std::string order_id;
    std::string reason;
};

// Re-price a live limit order in place (cancel-replace)
struct ModifyAction {
    std::string order_id;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    double new_price = 0.0;
};

// Close an open position without an order: what is left cannot be sold under
// the exchange minimums. The holding stays in the wallet.
struct CloseDustAction {
    std::string position_id;
    double mark_price = 0.0;
};

using OrderAction = std::variant<PlaceAction, CancelAction, ModifyAction, CloseDustAction>;

// Everything a strategy may look at for one tick of one pair
struct TickContext {
    TradingPair pair;
    analytics::MarketSnapshot snapshot;
    std::vector<risk::Position> positions;     // non-terminal only
    std::vector<ExchangeOrder> open_orders;
    SymbolRules rules;
    double quote_available = 0.0;              // ledger view, in-flight reservations removed
    double base_free = 0.0;
    bool atomic_replace = false;               // gateway supports cancel-replace
    Timestamp now;
};

} // namespace strategy
} // namespace spotbot
