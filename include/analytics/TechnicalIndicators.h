#pragma once

#include <vector>
#include "common/Types.h"

namespace spotbot {
namespace analytics {

class TechnicalIndicators {
public:
    // Smoothing factor 2 / (period + 1)
    static double emaAlpha(int period);

    // SMA-seeded EMA over the whole series, latest value.
    // Fewer than `period` prices: returns the last price (0 when empty).
    static double calculateEMA(const std::vector<double>& prices, int period);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);

    // Drops candles whose interval has not ended at `now_ms`
    static std::vector<Candle> closedCandles(const std::vector<Candle>& candles,
                                             long long interval_ms,
                                             long long now_ms);
};

} // namespace analytics
} // namespace spotbot
