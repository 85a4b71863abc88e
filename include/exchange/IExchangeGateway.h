#pragma once

#include "common/Types.h"
#include <optional>
#include <string>
#include <vector>

namespace spotbot {
namespace exchange {

struct OrderRequest {
    TradingPair pair;
    OrderSide side = OrderSide::BUY;
    OrderType type = OrderType::MARKET;
    Volume quantity = 0.0;
    std::optional<Price> price;         // required for LIMIT
    std::string client_order_id;        // idempotency token, must be unique per placement
};

// Market and account truth. Implementations throw GatewayError on transport or
// API failure; `uncertain()` is set when a mutating call may have taken effect.
class IExchangeGateway {
public:
    virtual ~IExchangeGateway() = default;

    virtual Ticker getTicker(const TradingPair& pair) = 0;

    // Free (unlocked) balance of one asset
    virtual double getBalance(const std::string& asset) = 0;

    virtual SymbolRules getSymbolRules(const TradingPair& pair) = 0;

    // Oldest first. The last candle may still be open.
    virtual std::vector<Candle> getCandles(const TradingPair& pair,
                                           const std::string& interval,
                                           int limit) = 0;

    virtual ExchangeOrder placeOrder(const OrderRequest& request) = 0;

    virtual ExchangeOrder cancelOrder(const TradingPair& pair, const std::string& order_id) = 0;

    // Atomic cancel + new LIMIT order. Only valid when supportsAtomicReplace().
    virtual bool supportsAtomicReplace() const { return false; }
    virtual ExchangeOrder replaceOrder(const std::string& order_id, const OrderRequest& replacement) = 0;

    // nullopt when the exchange does not know the order
    virtual std::optional<ExchangeOrder> getOrder(const TradingPair& pair,
                                                  const std::string& order_id) = 0;
    virtual std::optional<ExchangeOrder> getOrderByClientId(const TradingPair& pair,
                                                            const std::string& client_order_id) = 0;

    virtual std::vector<ExchangeOrder> getOpenOrders(const TradingPair& pair) = 0;
};

} // namespace exchange
} // namespace spotbot
