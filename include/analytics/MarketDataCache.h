#pragma once

#include "common/Types.h"
#include <chrono>
#include <optional>
#include <vector>

namespace spotbot {
namespace analytics {

// Last observation of one pair. `observed_at` is the local time of the poll.
struct MarketSnapshot {
    TradingPair pair;
    Ticker ticker;
    Timestamp observed_at;
    std::optional<double> ema;

    double mid() const { return (ticker.bid + ticker.ask) / 2.0; }

    std::chrono::milliseconds age(Timestamp now) const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - observed_at);
    }
};

// Per-pair market cache owned by that pair's worker. Not thread-safe.
class MarketDataCache {
public:
    MarketDataCache(TradingPair pair, std::chrono::milliseconds staleness_limit);

    // Throws StaleDataError and keeps the previous snapshot when the quote is unusable
    void update(const Ticker& ticker, Timestamp observed_at);

    // Seeds the closed-bar EMA from klines. Candles still open at `now` are ignored.
    void seedEma(const std::vector<Candle>& candles,
                 int period,
                 int timeframe_seconds,
                 Timestamp now);

    // True before the first seed and once a newer bar has closed
    bool emaNeedsRefresh(Timestamp now) const;

    bool hasSnapshot() const { return snapshot_.has_value(); }

    // Throws StaleDataError if nothing was observed yet or the data is too old
    MarketSnapshot freshSnapshot(Timestamp now) const;

    std::chrono::milliseconds stalenessLimit() const { return staleness_limit_; }

private:
    TradingPair pair_;
    std::chrono::milliseconds staleness_limit_;
    std::optional<MarketSnapshot> snapshot_;

    std::optional<double> closed_ema_;
    int ema_period_ = 0;
    long long timeframe_ms_ = 0;
    long long last_closed_open_ms_ = 0;

    std::optional<double> liveEma(double price) const;
};

} // namespace analytics
} // namespace spotbot
