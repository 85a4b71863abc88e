#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <functional>

namespace spotbot {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Volume = double;
using Amount = double;

enum class OrderSide { BUY, SELL };
enum class OrderType { LIMIT, MARKET };
enum class OrderStatus { PENDING, SUBMITTED, PARTIALLY_FILLED, FILLED, CANCELLED, REJECTED };

// Base/quote asset combination, e.g. ADA/USDT.
class TradingPair {
public:
    TradingPair() = default;
    TradingPair(std::string base, std::string quote);

    // "ADA/USDT" -> {ADA, USDT}. Throws std::invalid_argument on malformed input.
    static TradingPair parse(const std::string& text);

    const std::string& base() const { return base_; }
    const std::string& quote() const { return quote_; }

    std::string toString() const { return base_ + "/" + quote_; }
    std::string symbol() const { return base_ + quote_; }

    bool operator==(const TradingPair& other) const {
        return base_ == other.base_ && quote_ == other.quote_;
    }
    bool operator!=(const TradingPair& other) const { return !(*this == other); }
    bool operator<(const TradingPair& other) const {
        return base_ != other.base_ ? base_ < other.base_ : quote_ < other.quote_;
    }

private:
    std::string base_;
    std::string quote_;
};

struct Ticker {
    Price bid = 0.0;
    Price ask = 0.0;
    Price last = 0.0;
};

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// Exchange trading rules for one symbol (LOT_SIZE, PRICE_FILTER, NOTIONAL).
struct SymbolRules {
    double step_size = 0.0;      // quantity increment, 0 = unrestricted
    double min_qty = 0.0;
    double tick_size = 0.0;      // price increment, 0 = unrestricted
    double min_notional = 0.0;
};

// Order as reported by the exchange.
struct ExchangeOrder {
    std::string order_id;
    std::string client_order_id;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    OrderType type = OrderType::LIMIT;
    std::string exchange_status;
    Price price = 0.0;
    Volume orig_qty = 0.0;
    Volume executed_qty = 0.0;
    Amount cumulative_quote_qty = 0.0;
    long long update_time_ms = 0;

    double averageFillPrice() const {
        return executed_qty > 0.0 ? cumulative_quote_qty / executed_qty : price;
    }
};

inline const char* orderSideToString(OrderSide side) {
    return (side == OrderSide::BUY) ? "BUY" : "SELL";
}

inline const char* orderTypeToString(OrderType type) {
    return (type == OrderType::MARKET) ? "MARKET" : "LIMIT";
}

inline const char* orderStatusToString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "PENDING";
        case OrderStatus::SUBMITTED: return "SUBMITTED";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::CANCELLED: return "CANCELLED";
        case OrderStatus::REJECTED: return "REJECTED";
    }
    return "UNKNOWN";
}

inline long long toEpochMs(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp fromEpochMs(long long ms) {
    return Timestamp(std::chrono::milliseconds(ms));
}

} // namespace spotbot

namespace std {
template<>
struct hash<spotbot::TradingPair> {
    size_t operator()(const spotbot::TradingPair& pair) const {
        return std::hash<std::string>()(pair.toString());
    }
};
} // namespace std
