#pragma once

#include <stdexcept>
#include <string>

namespace spotbot {

class TradingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Invalid or missing configuration. Fatal at startup.
class ConfigError : public TradingError {
public:
    using TradingError::TradingError;
};

// Sizing produced less than the exchange minimum. Skip this tick's entry.
class InsufficientBalance : public TradingError {
public:
    using TradingError::TradingError;
};

// Market snapshot is older than the staleness threshold.
class StaleDataError : public TradingError {
public:
    using TradingError::TradingError;
};

// Broken engine invariant (e.g. two live bids on one pair). Halts the pair.
class InvariantViolation : public TradingError {
public:
    using TradingError::TradingError;
};

// Transient network/API failure. `uncertain` means a mutating request may have
// reached the exchange, so the outcome must be confirmed before retrying.
class GatewayError : public TradingError {
public:
    explicit GatewayError(const std::string& message,
                          int http_status = 0,
                          int exchange_code = 0,
                          bool uncertain = false)
        : TradingError(message)
        , http_status_(http_status)
        , exchange_code_(exchange_code)
        , uncertain_(uncertain) {}

    int httpStatus() const { return http_status_; }
    int exchangeCode() const { return exchange_code_; }
    bool uncertain() const { return uncertain_; }

    // Binance -2013 "Order does not exist"
    bool isUnknownOrder() const { return exchange_code_ == -2013 || exchange_code_ == -2011; }

private:
    int http_status_;
    int exchange_code_;
    bool uncertain_;
};

} // namespace spotbot
