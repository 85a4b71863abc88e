#include "exchange/BinanceGateway.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <sstream>
#include <stdexcept>

namespace spotbot {
namespace exchange {

namespace {
// Binance sends decimals as strings ("0.40000000") and ids as integers
double toDouble(const nlohmann::json& value) {
    if (value.is_string()) {
        return std::stod(value.get<std::string>());
    }
    if (value.is_number()) {
        return value.get<double>();
    }
    return 0.0;
}

std::string toIdString(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    return "";
}

std::string formatQuantity(double quantity) {
    std::ostringstream oss;
    oss.precision(8);
    oss << std::fixed << quantity;
    std::string text = oss.str();
    text.erase(text.find_last_not_of('0') + 1);
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text;
}
} // namespace

BinanceGateway::BinanceGateway(std::shared_ptr<network::IHttpClient> http_client)
    : http_(std::move(http_client)) {}

nlohmann::json BinanceGateway::parseBody(const network::HttpResponse& response,
                                         const std::string& operation) const {
    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (parsed.is_discarded()) {
        throw GatewayError(operation + ": malformed response body", response.status_code);
    }
    return parsed;
}

void BinanceGateway::raise(const network::HttpResponse& response,
                           const std::string& operation,
                           bool mutating) const {
    int code = 0;
    std::string message = "HTTP " + std::to_string(response.status_code);
    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        code = parsed.value("code", 0);
        message = parsed.value("msg", message);
    }

    // 5xx on a mutating call: execution status unknown
    const bool uncertain = mutating && response.isServerError();
    throw GatewayError(operation + " failed: " + message, response.status_code, code, uncertain);
}

Ticker BinanceGateway::getTicker(const TradingPair& pair) {
    network::QueryParams params{{"symbol", pair.symbol()}};

    auto book = http_->get("/api/v3/ticker/bookTicker", params);
    if (!book.isSuccess()) {
        raise(book, "bookTicker " + pair.toString(), false);
    }
    auto last = http_->get("/api/v3/ticker/price", params);
    if (!last.isSuccess()) {
        raise(last, "ticker/price " + pair.toString(), false);
    }

    auto book_json = parseBody(book, "bookTicker");
    auto last_json = parseBody(last, "ticker/price");

    Ticker ticker;
    try {
        ticker.bid = toDouble(book_json.at("bidPrice"));
        ticker.ask = toDouble(book_json.at("askPrice"));
        ticker.last = toDouble(last_json.at("price"));
    } catch (const std::exception& e) {
        throw GatewayError("ticker " + pair.toString() + ": " + e.what());
    }
    return ticker;
}

double BinanceGateway::getBalance(const std::string& asset) {
    auto response = http_->get("/api/v3/account", {{"omitZeroBalances", "true"}}, true);
    if (!response.isSuccess()) {
        raise(response, "account", false);
    }

    auto account = parseBody(response, "account");
    if (!account.contains("balances") || !account["balances"].is_array()) {
        throw GatewayError("account: missing balances");
    }
    for (const auto& balance : account["balances"]) {
        if (balance.value("asset", "") == asset) {
            return toDouble(balance.at("free"));
        }
    }
    return 0.0;
}

SymbolRules BinanceGateway::parseSymbolRules(const nlohmann::json& symbol_info) {
    SymbolRules rules;
    if (!symbol_info.contains("filters")) {
        return rules;
    }
    for (const auto& filter : symbol_info["filters"]) {
        const std::string type = filter.value("filterType", "");
        if (type == "LOT_SIZE") {
            rules.step_size = toDouble(filter.at("stepSize"));
            rules.min_qty = toDouble(filter.at("minQty"));
        } else if (type == "PRICE_FILTER") {
            rules.tick_size = toDouble(filter.at("tickSize"));
        } else if (type == "NOTIONAL" || type == "MIN_NOTIONAL") {
            rules.min_notional = toDouble(filter.at("minNotional"));
        }
    }
    return rules;
}

SymbolRules BinanceGateway::getSymbolRules(const TradingPair& pair) {
    {
        std::lock_guard<std::mutex> lock(rules_mutex_);
        auto it = rules_cache_.find(pair.symbol());
        if (it != rules_cache_.end()) {
            return it->second;
        }
    }

    auto response = http_->get("/api/v3/exchangeInfo", {{"symbol", pair.symbol()}});
    if (!response.isSuccess()) {
        raise(response, "exchangeInfo " + pair.toString(), false);
    }

    auto info = parseBody(response, "exchangeInfo");
    if (!info.contains("symbols") || info["symbols"].empty()) {
        throw GatewayError("exchangeInfo: unknown symbol " + pair.symbol());
    }

    SymbolRules rules;
    try {
        rules = parseSymbolRules(info["symbols"][0]);
    } catch (const std::exception& e) {
        throw GatewayError("exchangeInfo " + pair.symbol() + ": " + e.what());
    }

    LOG_INFO("{} rules: step={} min_qty={} tick={} min_notional={}",
             pair.toString(), rules.step_size, rules.min_qty, rules.tick_size, rules.min_notional);

    std::lock_guard<std::mutex> lock(rules_mutex_);
    rules_cache_[pair.symbol()] = rules;
    return rules;
}

std::vector<Candle> BinanceGateway::getCandles(const TradingPair& pair,
                                               const std::string& interval,
                                               int limit) {
    auto response = http_->get("/api/v3/klines", {
        {"symbol", pair.symbol()},
        {"interval", interval},
        {"limit", std::to_string(limit)}
    });
    if (!response.isSuccess()) {
        raise(response, "klines " + pair.toString(), false);
    }

    auto rows = parseBody(response, "klines");
    std::vector<Candle> candles;
    candles.reserve(rows.size());
    try {
        // [openTime, open, high, low, close, volume, closeTime, ...]
        for (const auto& row : rows) {
            candles.emplace_back(
                toDouble(row.at(1)),
                toDouble(row.at(2)),
                toDouble(row.at(3)),
                toDouble(row.at(4)),
                toDouble(row.at(5)),
                row.at(0).get<long long>()
            );
        }
    } catch (const std::exception& e) {
        throw GatewayError("klines " + pair.toString() + ": " + e.what());
    }
    return candles;
}

ExchangeOrder BinanceGateway::parseOrder(const nlohmann::json& j) {
    ExchangeOrder order;
    if (j.contains("orderId")) order.order_id = toIdString(j["orderId"]);
    // Cancel responses carry the new cancel id in clientOrderId
    if (j.contains("origClientOrderId")) {
        order.client_order_id = j["origClientOrderId"].get<std::string>();
    } else {
        order.client_order_id = j.value("clientOrderId", "");
    }
    order.symbol = j.value("symbol", "");
    order.side = j.value("side", "BUY") == "SELL" ? OrderSide::SELL : OrderSide::BUY;
    order.type = j.value("type", "LIMIT") == "MARKET" ? OrderType::MARKET : OrderType::LIMIT;
    order.exchange_status = j.value("status", "");
    if (j.contains("price")) order.price = toDouble(j["price"]);
    if (j.contains("origQty")) order.orig_qty = toDouble(j["origQty"]);
    if (j.contains("executedQty")) order.executed_qty = toDouble(j["executedQty"]);
    if (j.contains("cummulativeQuoteQty")) order.cumulative_quote_qty = toDouble(j["cummulativeQuoteQty"]);
    if (j.contains("updateTime")) {
        order.update_time_ms = j["updateTime"].get<long long>();
    } else if (j.contains("transactTime")) {
        order.update_time_ms = j["transactTime"].get<long long>();
    } else if (j.contains("time")) {
        order.update_time_ms = j["time"].get<long long>();
    }
    return order;
}

network::QueryParams BinanceGateway::orderParams(const OrderRequest& request) const {
    network::QueryParams params;
    params["symbol"] = request.pair.symbol();
    params["side"] = orderSideToString(request.side);
    params["type"] = orderTypeToString(request.type);
    params["quantity"] = formatQuantity(request.quantity);
    params["newClientOrderId"] = request.client_order_id;
    params["newOrderRespType"] = "RESULT";
    if (request.type == OrderType::LIMIT) {
        if (!request.price) {
            throw std::invalid_argument("LIMIT order without price");
        }
        params["price"] = formatQuantity(*request.price);
        params["timeInForce"] = "GTC";
    }
    return params;
}

ExchangeOrder BinanceGateway::placeOrder(const OrderRequest& request) {
    auto response = http_->post("/api/v3/order", orderParams(request));
    if (!response.isSuccess()) {
        raise(response, "place " + request.client_order_id, true);
    }

    auto order = parseOrder(parseBody(response, "place"));
    LOG_INFO("Order accepted: {} {} {} qty={} id={} status={}",
             request.pair.toString(), orderSideToString(request.side),
             orderTypeToString(request.type), request.quantity,
             order.order_id, order.exchange_status);
    return order;
}

ExchangeOrder BinanceGateway::cancelOrder(const TradingPair& pair, const std::string& order_id) {
    auto response = http_->del("/api/v3/order", {
        {"symbol", pair.symbol()},
        {"orderId", order_id}
    });
    if (!response.isSuccess()) {
        raise(response, "cancel " + order_id, true);
    }
    return parseOrder(parseBody(response, "cancel"));
}

ExchangeOrder BinanceGateway::replaceOrder(const std::string& order_id, const OrderRequest& replacement) {
    auto params = orderParams(replacement);
    params["cancelReplaceMode"] = "STOP_ON_FAILURE";
    params["cancelOrderId"] = order_id;

    auto response = http_->post("/api/v3/order/cancelReplace", params);
    if (!response.isSuccess()) {
        // -2021: cancel or new order leg failed, details under "data"
        raise(response, "cancelReplace " + order_id, true);
    }

    auto body = parseBody(response, "cancelReplace");
    if (!body.contains("newOrderResponse")) {
        throw GatewayError("cancelReplace " + order_id + ": missing newOrderResponse",
                           response.status_code, 0, true);
    }
    return parseOrder(body["newOrderResponse"]);
}

std::optional<ExchangeOrder> BinanceGateway::queryOrder(const TradingPair& pair,
                                                        const network::QueryParams& id_param) {
    network::QueryParams params = id_param;
    params["symbol"] = pair.symbol();

    auto response = http_->get("/api/v3/order", params, true);
    if (!response.isSuccess()) {
        auto error = nlohmann::json::parse(response.body, nullptr, false);
        if (!error.is_discarded() && error.is_object() && error.value("code", 0) == -2013) {
            return std::nullopt;
        }
        raise(response, "order status " + pair.toString(), false);
    }
    return parseOrder(parseBody(response, "order status"));
}

std::optional<ExchangeOrder> BinanceGateway::getOrder(const TradingPair& pair,
                                                      const std::string& order_id) {
    return queryOrder(pair, {{"orderId", order_id}});
}

std::optional<ExchangeOrder> BinanceGateway::getOrderByClientId(const TradingPair& pair,
                                                                const std::string& client_order_id) {
    return queryOrder(pair, {{"origClientOrderId", client_order_id}});
}

std::vector<ExchangeOrder> BinanceGateway::getOpenOrders(const TradingPair& pair) {
    auto response = http_->get("/api/v3/openOrders", {{"symbol", pair.symbol()}}, true);
    if (!response.isSuccess()) {
        raise(response, "openOrders " + pair.toString(), false);
    }

    auto rows = parseBody(response, "openOrders");
    std::vector<ExchangeOrder> orders;
    for (const auto& row : rows) {
        orders.push_back(parseOrder(row));
    }
    return orders;
}

} // namespace exchange
} // namespace spotbot
