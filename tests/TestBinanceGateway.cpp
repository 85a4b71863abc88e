#include "common/Errors.h"
#include "exchange/BinanceGateway.h"
#include "network/BinanceHttpClient.h"
#include "network/RequestSigner.h"

#include <cassert>
#include <cmath>
#include <deque>
#include <iostream>
#include <map>
#include <memory>
#include <string>

using namespace spotbot;
using exchange::BinanceGateway;
using network::HttpResponse;
using network::QueryParams;

namespace {

struct RecordedRequest {
    std::string method;
    std::string endpoint;
    QueryParams params;
    bool signed_request = false;
};

// Replies from a per-endpoint queue; unscripted calls get a 500
class ScriptedHttpClient : public network::IHttpClient {
public:
    std::vector<RecordedRequest> requests;

    void script(const std::string& endpoint, int status, const std::string& body) {
        HttpResponse response;
        response.status_code = status;
        response.body = body;
        replies_[endpoint].push_back(response);
    }

    HttpResponse get(const std::string& endpoint, const QueryParams& params, bool signed_request) override {
        return reply("GET", endpoint, params, signed_request);
    }
    HttpResponse post(const std::string& endpoint, const QueryParams& params, bool signed_request) override {
        return reply("POST", endpoint, params, signed_request);
    }
    HttpResponse del(const std::string& endpoint, const QueryParams& params, bool signed_request) override {
        return reply("DELETE", endpoint, params, signed_request);
    }

private:
    std::map<std::string, std::deque<HttpResponse>> replies_;

    HttpResponse reply(const std::string& method, const std::string& endpoint,
                       const QueryParams& params, bool signed_request) {
        requests.push_back({method, endpoint, params, signed_request});
        auto& queue = replies_[endpoint];
        if (queue.empty()) {
            HttpResponse unscripted;
            unscripted.status_code = 500;
            unscripted.body = "unscripted";
            return unscripted;
        }
        HttpResponse response = queue.front();
        queue.pop_front();
        return response;
    }
};

const TradingPair kAda("ADA", "USDT");

} // namespace

int main() {
    std::cout << "[TEST] Starting BinanceGateway Test..." << std::endl;

    // Signing example from the Binance API documentation
    {
        const std::string secret = "NhqPtmdSJYdKjVHjA7PZj4Mge3R5YNiP1e3UZjInClVN65XAbvqqM6A7H5fATj0j";
        const std::string payload =
            "symbol=LTCBTC&side=BUY&type=LIMIT&timeInForce=GTC&quantity=1&price=0.1"
            "&recvWindow=5000&timestamp=1499827319559";
        assert(network::RequestSigner::sign(secret, payload) ==
               "c8db56825ae71d6d79447849e617115f4a920fa2acdcab2b053c4b2838bd6b71");

        QueryParams params{{"symbol", "ADAUSDT"}, {"newClientOrderId", "sb-ADA/x y"}};
        assert(network::RequestSigner::buildQueryString(params) ==
               "newClientOrderId=sb-ADA%2Fx%20y&symbol=ADAUSDT");

        const auto id1 = network::RequestSigner::generateClientOrderId("ADAUSDT");
        const auto id2 = network::RequestSigner::generateClientOrderId("ADAUSDT");
        assert(id1 != id2);
        assert(id1.rfind("sb-ADAUSDT-", 0) == 0);
        assert(id1.size() <= 36);
        assert(network::RequestSigner::generateClientOrderId("VERYLONGTOKENNAMEUSDT").size() <= 36);
    }

    // Secrets never reach the log
    {
        auto masked = network::sanitizeForLog(R"({"apiKey":"abc","nested":{"signature":"def"},"ok":1})");
        assert(masked.find("abc") == std::string::npos);
        assert(masked.find("def") == std::string::npos);
        assert(masked.find("\"ok\":1") != std::string::npos);

        masked = network::sanitizeForLog("symbol=ADAUSDT&timestamp=1&signature=deadbeef01");
        assert(masked.find("deadbeef01") == std::string::npos);
        assert(masked.find("symbol=ADAUSDT") != std::string::npos);
    }

    // Order JSON
    {
        auto order = BinanceGateway::parseOrder(nlohmann::json::parse(R"({
            "symbol": "ADAUSDT", "orderId": 28, "clientOrderId": "sb-ADAUSDT-1",
            "transactTime": 1507725176595, "price": "0.00000000", "origQty": "125.00000000",
            "executedQty": "125.00000000", "cummulativeQuoteQty": "50.00000000",
            "status": "FILLED", "type": "MARKET", "side": "BUY"
        })"));
        assert(order.order_id == "28");
        assert(order.client_order_id == "sb-ADAUSDT-1");
        assert(order.side == OrderSide::BUY);
        assert(order.type == OrderType::MARKET);
        assert(order.exchange_status == "FILLED");
        assert(std::abs(order.averageFillPrice() - 0.40) < 1e-12);
        assert(order.update_time_ms == 1507725176595LL);

        // Cancel response: the original id is the one that matters
        auto cancelled = BinanceGateway::parseOrder(nlohmann::json::parse(R"({
            "symbol": "ADAUSDT", "origClientOrderId": "sb-ADAUSDT-2", "orderId": 29,
            "clientOrderId": "cancelMe123", "price": "0.39800000", "origQty": "100.00000000",
            "executedQty": "0.00000000", "cummulativeQuoteQty": "0.00000000",
            "status": "CANCELED", "type": "LIMIT", "side": "SELL"
        })"));
        assert(cancelled.client_order_id == "sb-ADAUSDT-2");
        assert(cancelled.side == OrderSide::SELL);
        assert(cancelled.price == 0.398);
    }

    // exchangeInfo filters
    {
        auto rules = BinanceGateway::parseSymbolRules(nlohmann::json::parse(R"({
            "symbol": "ADAUSDT",
            "filters": [
                {"filterType": "PRICE_FILTER", "minPrice": "0.00010000", "maxPrice": "1000.00000000", "tickSize": "0.00010000"},
                {"filterType": "LOT_SIZE", "minQty": "0.10000000", "maxQty": "900000.00000000", "stepSize": "0.10000000"},
                {"filterType": "NOTIONAL", "minNotional": "5.00000000", "applyMinToMarket": true}
            ]
        })"));
        assert(rules.tick_size == 0.0001);
        assert(rules.step_size == 0.1);
        assert(rules.min_qty == 0.1);
        assert(rules.min_notional == 5.0);
    }

    // Ticker: book + last price, public endpoints
    {
        auto http = std::make_shared<ScriptedHttpClient>();
        BinanceGateway gateway(http);
        http->script("/api/v3/ticker/bookTicker", 200,
                     R"({"symbol":"ADAUSDT","bidPrice":"0.39990000","bidQty":"10","askPrice":"0.40010000","askQty":"5"})");
        http->script("/api/v3/ticker/price", 200, R"({"symbol":"ADAUSDT","price":"0.40000000"})");
        auto ticker = gateway.getTicker(kAda);
        assert(ticker.bid == 0.3999 && ticker.ask == 0.4001 && ticker.last == 0.4);
        assert(http->requests.size() == 2);
        assert(!http->requests[0].signed_request);
        assert(http->requests[0].params.at("symbol") == "ADAUSDT");
    }

    // Balance: free amount of the asset, signed
    {
        auto http = std::make_shared<ScriptedHttpClient>();
        BinanceGateway gateway(http);
        http->script("/api/v3/account", 200,
                     R"({"balances":[{"asset":"USDT","free":"1000.50","locked":"10"},{"asset":"ADA","free":"3","locked":"0"}]})");
        assert(gateway.getBalance("USDT") == 1000.5);
        assert(http->requests.back().signed_request);
        http->script("/api/v3/account", 200, R"({"balances":[]})");
        assert(gateway.getBalance("BTC") == 0.0);
    }

    // Symbol rules are fetched once
    {
        auto http = std::make_shared<ScriptedHttpClient>();
        BinanceGateway gateway(http);
        http->script("/api/v3/exchangeInfo", 200, R"({"symbols":[{"symbol":"ADAUSDT","filters":[
            {"filterType":"LOT_SIZE","minQty":"0.1","maxQty":"9000","stepSize":"0.1"}]}]})");
        assert(gateway.getSymbolRules(kAda).step_size == 0.1);
        assert(gateway.getSymbolRules(kAda).step_size == 0.1);
        assert(http->requests.size() == 1);
    }

    // Klines: [openTime, open, high, low, close, volume, ...]
    {
        auto http = std::make_shared<ScriptedHttpClient>();
        BinanceGateway gateway(http);
        http->script("/api/v3/klines", 200, R"([
            [1700000000000,"0.40","0.41","0.39","0.405","1000",1700000299999,"0",1,"0","0","0"],
            [1700000300000,"0.405","0.42","0.40","0.415","800",1700000599999,"0",1,"0","0","0"]
        ])");
        auto candles = gateway.getCandles(kAda, "5m", 2);
        assert(candles.size() == 2);
        assert(candles[1].close == 0.415);
        assert(candles[1].timestamp == 1700000300000LL);
        assert(http->requests[0].params.at("interval") == "5m");
        assert(http->requests[0].params.at("limit") == "2");
    }

    // Placement carries the idempotency token and exchange-formatted numbers
    {
        auto http = std::make_shared<ScriptedHttpClient>();
        BinanceGateway gateway(http);
        http->script("/api/v3/order", 200, R"({"symbol":"ADAUSDT","orderId":5,"clientOrderId":"sb-ADAUSDT-q",
            "price":"0.39800000","origQty":"100.00000000","executedQty":"0","cummulativeQuoteQty":"0",
            "status":"NEW","type":"LIMIT","side":"BUY","transactTime":1})");

        exchange::OrderRequest request;
        request.pair = kAda;
        request.side = OrderSide::BUY;
        request.type = OrderType::LIMIT;
        request.quantity = 100.0;
        request.price = 0.398;
        request.client_order_id = "sb-ADAUSDT-q";
        auto order = gateway.placeOrder(request);
        assert(order.order_id == "5");

        const auto& sent = http->requests.back();
        assert(sent.method == "POST");
        assert(sent.signed_request);
        assert(sent.params.at("newClientOrderId") == "sb-ADAUSDT-q");
        assert(sent.params.at("quantity") == "100");
        assert(sent.params.at("price") == "0.398");
        assert(sent.params.at("timeInForce") == "GTC");
        assert(sent.params.at("type") == "LIMIT");
    }

    // 5xx on a placement: outcome unknown; 4xx: definitive
    {
        auto http = std::make_shared<ScriptedHttpClient>();
        BinanceGateway gateway(http);
        exchange::OrderRequest request;
        request.pair = kAda;
        request.quantity = 125.0;
        request.client_order_id = "sb-ADAUSDT-m";

        http->script("/api/v3/order", 503, R"({"code":-1001,"msg":"Internal error; unable to process your request."})");
        bool uncertain = false;
        try {
            gateway.placeOrder(request);
        } catch (const GatewayError& e) {
            uncertain = e.uncertain();
            assert(e.httpStatus() == 503);
        }
        assert(uncertain);

        http->script("/api/v3/order", 400, R"({"code":-1013,"msg":"Filter failure: LOT_SIZE"})");
        bool definitive = false;
        try {
            gateway.placeOrder(request);
        } catch (const GatewayError& e) {
            definitive = !e.uncertain();
            assert(e.exchangeCode() == -1013);
            assert(std::string(e.what()).find("LOT_SIZE") != std::string::npos);
        }
        assert(definitive);

        // Reads are never uncertain
        http->script("/api/v3/openOrders", 502, "Bad Gateway");
        bool read_uncertain = true;
        try {
            gateway.getOpenOrders(kAda);
        } catch (const GatewayError& e) {
            read_uncertain = e.uncertain();
        }
        assert(!read_uncertain);
    }

    // Unknown order lookups are empty, not errors
    {
        auto http = std::make_shared<ScriptedHttpClient>();
        BinanceGateway gateway(http);
        http->script("/api/v3/order", 400, R"({"code":-2013,"msg":"Order does not exist."})");
        assert(!gateway.getOrderByClientId(kAda, "sb-ADAUSDT-gone").has_value());
        assert(http->requests.back().params.at("origClientOrderId") == "sb-ADAUSDT-gone");

        http->script("/api/v3/order", 400, R"({"code":-2011,"msg":"Unknown order sent."})");
        bool unknown = false;
        try {
            gateway.cancelOrder(kAda, "42");
        } catch (const GatewayError& e) {
            unknown = e.isUnknownOrder();
        }
        assert(unknown);
    }

    // Cancel-replace returns the new order
    {
        auto http = std::make_shared<ScriptedHttpClient>();
        BinanceGateway gateway(http);
        assert(gateway.supportsAtomicReplace());
        http->script("/api/v3/order/cancelReplace", 200, R"({
            "cancelResult":"SUCCESS","newOrderResult":"SUCCESS",
            "cancelResponse":{"symbol":"ADAUSDT","orderId":5,"status":"CANCELED"},
            "newOrderResponse":{"symbol":"ADAUSDT","orderId":6,"clientOrderId":"sb-ADAUSDT-r",
                "price":"0.41790000","origQty":"100","executedQty":"0","cummulativeQuoteQty":"0",
                "status":"NEW","type":"LIMIT","side":"BUY","transactTime":2}})");
        exchange::OrderRequest request;
        request.pair = kAda;
        request.type = OrderType::LIMIT;
        request.quantity = 100.0;
        request.price = 0.4179;
        request.client_order_id = "sb-ADAUSDT-r";
        auto order = gateway.replaceOrder("5", request);
        assert(order.order_id == "6");
        assert(http->requests.back().params.at("cancelOrderId") == "5");
        assert(http->requests.back().params.at("cancelReplaceMode") == "STOP_ON_FAILURE");
    }

    std::cout << "[TEST] BinanceGateway PASSED" << std::endl;
    return 0;
}
