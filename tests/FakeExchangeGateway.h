#pragma once

#include "common/Errors.h"
#include "core/contracts/IEventJournal.h"
#include "exchange/IExchangeGateway.h"

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace spotbot {
namespace testing {

// In-memory exchange for one or more pairs. Market orders fill at the touch,
// limit orders rest until fillOrder(). Failures are injected per call.
class FakeExchangeGateway : public exchange::IExchangeGateway {
public:
    // Every call fails with a 503 while this is positive
    int failing_calls = 0;

    // Every call for these symbols fails with a 503
    std::set<std::string> failing_symbols;

    // Next placeOrder throws this; `place_reaches_exchange` decides whether the
    // order was nevertheless accepted (a timeout after the exchange saw it)
    std::optional<GatewayError> place_failure;
    bool place_reaches_exchange = false;

    bool fill_market_orders = true;
    bool atomic_replace = false;

    int place_calls = 0;
    int cancel_calls = 0;

    void setTicker(const TradingPair& pair, double bid, double ask, double last) {
        std::lock_guard<std::mutex> lock(mutex_);
        tickers_[pair.symbol()] = Ticker{bid, ask, last};
    }

    void setBalance(const std::string& asset, double free_balance) {
        std::lock_guard<std::mutex> lock(mutex_);
        balances_[asset] = free_balance;
    }

    void setRules(const TradingPair& pair, const SymbolRules& rules) {
        std::lock_guard<std::mutex> lock(mutex_);
        rules_[pair.symbol()] = rules;
    }

    void setCandles(const TradingPair& pair, std::vector<Candle> candles) {
        std::lock_guard<std::mutex> lock(mutex_);
        candles_[pair.symbol()] = std::move(candles);
    }

    // Fills a resting order completely at its limit price
    void fillOrder(const std::string& order_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& order = orders_.at(order_id);
        order.executed_qty = order.orig_qty;
        order.cumulative_quote_qty = order.orig_qty * order.price;
        order.exchange_status = "FILLED";
    }

    // Adds an order placed outside this process (previous run or manual)
    void injectOrder(const ExchangeOrder& order) {
        std::lock_guard<std::mutex> lock(mutex_);
        orders_[order.order_id] = order;
    }

    std::optional<ExchangeOrder> orderByClientId(const std::string& client_order_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, order] : orders_) {
            if (order.client_order_id == client_order_id) {
                return order;
            }
        }
        return std::nullopt;
    }

    size_t orderCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return orders_.size();
    }

    Ticker getTicker(const TradingPair& pair) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybeFail(pair.symbol());
        return tickers_.at(pair.symbol());
    }

    double getBalance(const std::string& asset) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybeFail();
        auto it = balances_.find(asset);
        return it != balances_.end() ? it->second : 0.0;
    }

    SymbolRules getSymbolRules(const TradingPair& pair) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybeFail(pair.symbol());
        auto it = rules_.find(pair.symbol());
        return it != rules_.end() ? it->second : SymbolRules{};
    }

    std::vector<Candle> getCandles(const TradingPair& pair, const std::string&, int limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybeFail(pair.symbol());
        auto candles = candles_[pair.symbol()];
        if (static_cast<int>(candles.size()) > limit) {
            candles.erase(candles.begin(), candles.end() - limit);
        }
        return candles;
    }

    ExchangeOrder placeOrder(const exchange::OrderRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybeFail(request.pair.symbol());
        ++place_calls;
        if (place_failure) {
            GatewayError error = *place_failure;
            place_failure.reset();
            if (place_reaches_exchange) {
                acceptLocked(request);
            }
            throw error;
        }
        return acceptLocked(request);
    }

    ExchangeOrder cancelOrder(const TradingPair&, const std::string& order_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybeFail();
        ++cancel_calls;
        return cancelLocked(order_id);
    }

    bool supportsAtomicReplace() const override { return atomic_replace; }

    ExchangeOrder replaceOrder(const std::string& order_id, const exchange::OrderRequest& replacement) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybeFail();
        cancelLocked(order_id);
        ++place_calls;
        return acceptLocked(replacement);
    }

    std::optional<ExchangeOrder> getOrder(const TradingPair&, const std::string& order_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybeFail();
        auto it = orders_.find(order_id);
        if (it == orders_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<ExchangeOrder> getOrderByClientId(const TradingPair&, const std::string& client_order_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybeFail();
        for (const auto& [id, order] : orders_) {
            if (order.client_order_id == client_order_id) {
                return order;
            }
        }
        return std::nullopt;
    }

    std::vector<ExchangeOrder> getOpenOrders(const TradingPair& pair) override {
        std::lock_guard<std::mutex> lock(mutex_);
        maybeFail(pair.symbol());
        std::vector<ExchangeOrder> open;
        for (const auto& [id, order] : orders_) {
            if (order.symbol == pair.symbol() &&
                (order.exchange_status == "NEW" || order.exchange_status == "PARTIALLY_FILLED")) {
                open.push_back(order);
            }
        }
        return open;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Ticker> tickers_;
    std::map<std::string, double> balances_;
    std::map<std::string, SymbolRules> rules_;
    std::map<std::string, std::vector<Candle>> candles_;
    std::map<std::string, ExchangeOrder> orders_;
    long long next_order_id_ = 1000;
    long long clock_ms_ = 1700000000000LL;

    void maybeFail(const std::string& symbol = std::string()) {
        if (!symbol.empty() && failing_symbols.count(symbol) > 0) {
            throw GatewayError("simulated outage for " + symbol, 503);
        }
        if (failing_calls > 0) {
            --failing_calls;
            throw GatewayError("simulated outage", 503);
        }
    }

    ExchangeOrder acceptLocked(const exchange::OrderRequest& request) {
        ExchangeOrder order;
        order.order_id = std::to_string(next_order_id_++);
        order.client_order_id = request.client_order_id;
        order.symbol = request.pair.symbol();
        order.side = request.side;
        order.type = request.type;
        order.orig_qty = request.quantity;
        order.update_time_ms = clock_ms_;
        order.exchange_status = "NEW";

        if (request.type == OrderType::LIMIT) {
            order.price = request.price.value_or(0.0);
        } else if (fill_market_orders) {
            const auto& ticker = tickers_.at(order.symbol);
            const double fill = request.side == OrderSide::BUY ? ticker.ask : ticker.bid;
            order.executed_qty = request.quantity;
            order.cumulative_quote_qty = request.quantity * fill;
            order.exchange_status = "FILLED";
        }
        orders_[order.order_id] = order;
        return order;
    }

    ExchangeOrder cancelLocked(const std::string& order_id) {
        auto it = orders_.find(order_id);
        if (it == orders_.end() ||
            (it->second.exchange_status != "NEW" && it->second.exchange_status != "PARTIALLY_FILLED")) {
            throw GatewayError("Unknown order sent.", 400, -2011);
        }
        it->second.exchange_status = "CANCELED";
        return it->second;
    }
};

// Journal kept in memory
class MemoryJournal : public core::IEventJournal {
public:
    bool append(const core::JournalEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        core::JournalEvent stored = event;
        stored.seq = ++last_seq_;
        events_.push_back(stored);
        return true;
    }

    std::vector<core::JournalEvent> readFrom(std::uint64_t seq_inclusive) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<core::JournalEvent> out;
        for (const auto& event : events_) {
            if (event.seq >= seq_inclusive) {
                out.push_back(event);
            }
        }
        return out;
    }

    std::uint64_t lastSeq() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_seq_;
    }

    size_t count(core::JournalEventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& event : events_) {
            if (event.type == type) ++n;
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<core::JournalEvent> events_;
    std::uint64_t last_seq_ = 0;
};

} // namespace testing
} // namespace spotbot
