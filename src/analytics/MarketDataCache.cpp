#include "analytics/MarketDataCache.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"

namespace spotbot {
namespace analytics {

MarketDataCache::MarketDataCache(TradingPair pair, std::chrono::milliseconds staleness_limit)
    : pair_(std::move(pair))
    , staleness_limit_(staleness_limit) {}

void MarketDataCache::update(const Ticker& ticker, Timestamp observed_at) {
    if (ticker.bid <= 0.0 || ticker.ask <= 0.0 || ticker.ask < ticker.bid || ticker.last <= 0.0) {
        throw StaleDataError(pair_.toString() + ": unusable quote bid=" + std::to_string(ticker.bid) +
                             " ask=" + std::to_string(ticker.ask));
    }

    MarketSnapshot snapshot;
    snapshot.pair = pair_;
    snapshot.ticker = ticker;
    snapshot.observed_at = observed_at;
    snapshot.ema = liveEma(ticker.last);
    snapshot_ = snapshot;
}

void MarketDataCache::seedEma(const std::vector<Candle>& candles,
                              int period,
                              int timeframe_seconds,
                              Timestamp now) {
    ema_period_ = period;
    timeframe_ms_ = static_cast<long long>(timeframe_seconds) * 1000;

    auto closed = TechnicalIndicators::closedCandles(candles, timeframe_ms_, toEpochMs(now));
    if (closed.size() < static_cast<size_t>(period)) {
        LOG_WARN("{}: only {} closed candles, EMA({}) unavailable",
                 pair_.toString(), closed.size(), period);
        closed_ema_.reset();
        return;
    }

    closed_ema_ = TechnicalIndicators::calculateEMA(
        TechnicalIndicators::extractClosePrices(closed), period);
    last_closed_open_ms_ = closed.back().timestamp;

    if (snapshot_) {
        snapshot_->ema = liveEma(snapshot_->ticker.last);
    }
    LOG_DEBUG("{}: EMA({}) seeded at {:.8f}", pair_.toString(), period, *closed_ema_);
}

bool MarketDataCache::emaNeedsRefresh(Timestamp now) const {
    if (!closed_ema_) {
        return true;
    }
    // The bar after the last closed one has itself closed
    return toEpochMs(now) >= last_closed_open_ms_ + 2 * timeframe_ms_;
}

MarketSnapshot MarketDataCache::freshSnapshot(Timestamp now) const {
    if (!snapshot_) {
        throw StaleDataError(pair_.toString() + ": no market data yet");
    }
    auto age = snapshot_->age(now);
    if (age > staleness_limit_) {
        throw StaleDataError(pair_.toString() + ": snapshot is " + std::to_string(age.count()) +
                             " ms old (limit " + std::to_string(staleness_limit_.count()) + " ms)");
    }
    return *snapshot_;
}

std::optional<double> MarketDataCache::liveEma(double price) const {
    if (!closed_ema_) {
        return std::nullopt;
    }
    // Current bar's EMA treats the live price as its provisional close
    const double alpha = TechnicalIndicators::emaAlpha(ema_period_);
    return alpha * price + (1.0 - alpha) * *closed_ema_;
}

} // namespace analytics
} // namespace spotbot
