#pragma once

#include "exchange/IExchangeGateway.h"
#include "network/IHttpClient.h"
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>

namespace spotbot {
namespace exchange {

class BinanceGateway : public IExchangeGateway {
public:
    explicit BinanceGateway(std::shared_ptr<network::IHttpClient> http_client);

    Ticker getTicker(const TradingPair& pair) override;
    double getBalance(const std::string& asset) override;
    SymbolRules getSymbolRules(const TradingPair& pair) override;
    std::vector<Candle> getCandles(const TradingPair& pair,
                                   const std::string& interval,
                                   int limit) override;

    ExchangeOrder placeOrder(const OrderRequest& request) override;
    ExchangeOrder cancelOrder(const TradingPair& pair, const std::string& order_id) override;

    bool supportsAtomicReplace() const override { return true; }
    ExchangeOrder replaceOrder(const std::string& order_id, const OrderRequest& replacement) override;

    std::optional<ExchangeOrder> getOrder(const TradingPair& pair,
                                          const std::string& order_id) override;
    std::optional<ExchangeOrder> getOrderByClientId(const TradingPair& pair,
                                                    const std::string& client_order_id) override;

    std::vector<ExchangeOrder> getOpenOrders(const TradingPair& pair) override;

    // Exposed for tests: Binance order JSON -> ExchangeOrder
    static ExchangeOrder parseOrder(const nlohmann::json& j);
    static SymbolRules parseSymbolRules(const nlohmann::json& symbol_info);

private:
    std::shared_ptr<network::IHttpClient> http_;
    std::map<std::string, SymbolRules> rules_cache_;
    std::mutex rules_mutex_;

    network::QueryParams orderParams(const OrderRequest& request) const;
    std::optional<ExchangeOrder> queryOrder(const TradingPair& pair,
                                            const network::QueryParams& id_param);

    // Throws GatewayError carrying HTTP status, Binance code and uncertainty
    [[noreturn]] void raise(const network::HttpResponse& response,
                            const std::string& operation,
                            bool mutating) const;
    nlohmann::json parseBody(const network::HttpResponse& response,
                             const std::string& operation) const;
};

} // namespace exchange
} // namespace spotbot
