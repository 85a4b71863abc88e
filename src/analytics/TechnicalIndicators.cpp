#include "analytics/TechnicalIndicators.h"

namespace spotbot {
namespace analytics {

double TechnicalIndicators::emaAlpha(int period) {
    return 2.0 / (period + 1.0);
}

double TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    if (prices.empty()) return 0.0;
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return prices.back();

    const double multiplier = emaAlpha(period);

    double ema = 0.0;
    for (int i = 0; i < period; ++i) {
        ema += prices[i];
    }
    ema /= period;

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
    }

    return ema;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> closes;
    closes.reserve(candles.size());
    for (const auto& candle : candles) {
        closes.push_back(candle.close);
    }
    return closes;
}

std::vector<Candle> TechnicalIndicators::closedCandles(const std::vector<Candle>& candles,
                                                       long long interval_ms,
                                                       long long now_ms) {
    std::vector<Candle> closed;
    closed.reserve(candles.size());
    for (const auto& candle : candles) {
        if (candle.timestamp + interval_ms <= now_ms) {
            closed.push_back(candle);
        }
    }
    return closed;
}

} // namespace analytics
} // namespace spotbot
