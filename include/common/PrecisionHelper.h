#pragma once
// ===================================================================
// Exchange precision helpers
//
// Binance spot symbols carry LOT_SIZE.stepSize and PRICE_FILTER.tickSize.
// Orders whose quantity/price are not multiples of these are rejected
// (-1013 Filter failure), so every outgoing number passes through here.
// ===================================================================

#include <cmath>

namespace spotbot {
namespace common {

// Number of decimals needed to print a multiple of `increment`.
inline int decimalsForIncrement(double increment) {
    if (increment <= 0.0) return 8;
    int decimals = 0;
    double t = increment;
    while (t < 1.0 - 1e-12 && decimals < 8) {
        t *= 10.0;
        decimals++;
    }
    return decimals;
}

// Quantity floored to step. The result sits on the step's decimal grid
// (125.0, not 125.00000000000001) and never exceeds `value` by more than
// float noise.
inline double floorToStep(double value, double step) {
    if (step <= 0.0 || value <= 0.0) {
        return value > 0.0 ? value : 0.0;
    }
    const double steps = std::floor(value / step + 1e-9);
    const double scale = std::pow(10.0, decimalsForIncrement(step));
    const double floored = std::round(steps * step * scale) / scale;
    return floored > 0.0 ? floored : 0.0;
}

// Bid side: round down to tick.
inline double roundDownToTick(double price, double tick) {
    if (tick <= 0.0) return price;
    const double scale = std::pow(10.0, decimalsForIncrement(tick));
    return std::round(std::floor(price / tick + 1e-9) * tick * scale) / scale;
}

// Ask side: round up to tick.
inline double roundUpToTick(double price, double tick) {
    if (tick <= 0.0) return price;
    const double scale = std::pow(10.0, decimalsForIncrement(tick));
    return std::round(std::ceil(price / tick - 1e-9) * tick * scale) / scale;
}

} // namespace common
} // namespace spotbot
