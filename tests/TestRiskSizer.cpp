#include "common/Errors.h"
#include "common/PrecisionHelper.h"
#include "risk/RiskSizer.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace spotbot;
using risk::ExitSignal;
using risk::RiskSizer;

namespace {

risk::Position openPosition(double entry, double stop_pct, double target_pct) {
    risk::Position p;
    p.id = "sb-ADAUSDT-test";
    p.pair = TradingPair("ADA", "USDT");
    p.state = risk::PositionState::OPEN;
    p.entry_price = entry;
    p.quantity = 125.0;
    p.stop_loss_price = RiskSizer::stopLossPrice(entry, stop_pct);
    p.profit_target_price = RiskSizer::profitTargetPrice(entry, target_pct);
    return p;
}

bool throwsInsufficient(double balance, double pct, double price, const SymbolRules& rules) {
    try {
        RiskSizer::size(balance, pct, price, rules);
    } catch (const InsufficientBalance&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting RiskSizer Test..." << std::endl;

    // 1000 USDT * 5% at 0.40 -> 125 ADA
    {
        const double raw = RiskSizer::rawQuantity(1000.0, 0.05, 0.40);
        assert(std::abs(raw - 125.0) < 1e-9);

        SymbolRules rules;
        rules.step_size = 0.1;
        rules.min_qty = 0.1;
        rules.min_notional = 5.0;
        const double qty = RiskSizer::size(1000.0, 0.05, 0.40, rules);
        assert(std::abs(qty - 125.0) < 1e-9);

        rules.step_size = 1.0;
        assert(std::abs(RiskSizer::size(1000.0, 0.05, 0.40, rules) - 125.0) < 1e-9);
    }

    // Never over-allocates
    {
        SymbolRules rules;
        rules.step_size = 0.001;
        const double balances[] = {10.0, 99.99, 1000.0, 1234.567, 50000.0};
        const double allocations[] = {0.01, 0.05, 0.3333, 0.5, 1.0};
        const double prices[] = {0.0123, 0.4, 1.7, 97.31, 64000.0};
        for (double b : balances) {
            for (double a : allocations) {
                for (double price : prices) {
                    double qty = 0.0;
                    try {
                        qty = RiskSizer::size(b, a, price, rules);
                    } catch (const InsufficientBalance&) {
                        continue;
                    }
                    assert(qty > 0.0);
                    assert(qty * price <= b * a * (1.0 + 1e-9));
                }
            }
        }
    }

    // Lot flooring and minimums
    {
        SymbolRules rules;
        rules.step_size = 1.0;
        rules.min_qty = 1.0;
        assert(std::abs(RiskSizer::size(100.0, 0.05, 0.7, rules) - 7.0) < 1e-9);

        rules.min_qty = 10.0;
        assert(throwsInsufficient(100.0, 0.05, 0.7, rules));

        rules.min_qty = 1.0;
        rules.min_notional = 10.0;
        assert(throwsInsufficient(100.0, 0.05, 0.7, rules));

        assert(throwsInsufficient(0.0, 0.05, 0.7, rules));
    }

    // An entry whose stop-loss sell would fall under the minimum notional is refused
    {
        SymbolRules rules;
        rules.step_size = 0.1;
        rules.min_qty = 0.1;
        rules.min_notional = 5.0;

        // 5.0 @ 1.0 clears the minimum at entry but not at the 0.985 stop
        assert(std::abs(RiskSizer::size(101.0, 0.05, 1.0, rules) - 5.0) < 1e-9);
        bool thrown = false;
        try {
            RiskSizer::size(101.0, 0.05, 1.0, rules, 0.015);
        } catch (const InsufficientBalance&) {
            thrown = true;
        }
        assert(thrown);

        const double qty = RiskSizer::size(120.0, 0.05, 1.0, rules, 0.015);
        assert(std::abs(qty - 6.0) < 1e-9);
        assert(qty * RiskSizer::stopLossPrice(1.0, 0.015) >= rules.min_notional);
    }

    // Dust: what can be sold is under the exchange minimums
    {
        SymbolRules rules;
        rules.step_size = 0.1;
        rules.min_qty = 0.1;
        rules.min_notional = 5.0;

        auto p = openPosition(1.0, 0.015, 0.005);
        p.quantity = 5.5;
        assert(!RiskSizer::isDust(p, 5.5, 0.95, rules));
        // Price gapped through the stop
        assert(RiskSizer::isDust(p, 5.5, 0.90, rules));

        // Remainder of a partial exit under the lot minimum
        p.quantity = 0.05;
        assert(RiskSizer::isDust(p, 0.05, 100.0, rules));

        // Holding shrunk below the minimums
        p.quantity = 125.0;
        assert(RiskSizer::isDust(p, 4.0, 1.0, rules));

        // No free base reported: judged on the position alone
        assert(!RiskSizer::isDust(p, 0.0, 1.0, rules));
    }

    // Invalid inputs
    {
        bool thrown = false;
        try {
            RiskSizer::rawQuantity(1000.0, 0.05, 0.0);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try {
            RiskSizer::rawQuantity(1000.0, 1.5, 0.4);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
    }

    // Entry 0.40, stop 1.5% -> 0.394; a tick at 0.393 is a stop loss
    {
        auto p = openPosition(0.40, 0.015, 0.005);
        assert(std::abs(p.stop_loss_price - 0.394) < 1e-12);
        assert(std::abs(p.profit_target_price - 0.402) < 1e-12);

        auto signal = RiskSizer::checkExit(p, 0.393);
        assert(signal.has_value() && *signal == ExitSignal::STOP_LOSS);

        signal = RiskSizer::checkExit(p, 0.394);
        assert(signal.has_value() && *signal == ExitSignal::STOP_LOSS);

        signal = RiskSizer::checkExit(p, 0.402);
        assert(signal.has_value() && *signal == ExitSignal::PROFIT_TARGET);

        assert(!RiskSizer::checkExit(p, 0.40).has_value());
    }

    // Both thresholds crossed at once: stop loss wins
    {
        auto p = openPosition(0.40, 0.015, 0.005);
        p.profit_target_price = 0.39;
        auto signal = RiskSizer::checkExit(p, 0.392);
        assert(signal.has_value() && *signal == ExitSignal::STOP_LOSS);
    }

    // Exit size is capped by the free base balance
    {
        SymbolRules rules;
        rules.step_size = 0.1;
        auto p = openPosition(0.40, 0.015, 0.005);
        assert(std::abs(RiskSizer::sizeExit(p, 124.875, 0.40, rules) - 124.8) < 1e-9);
        assert(std::abs(RiskSizer::sizeExit(p, 500.0, 0.40, rules) - 125.0) < 1e-9);
    }

    // Precision helpers stay on the decimal grid
    {
        assert(common::floorToStep(125.0, 0.1) == 125.0);
        assert(std::abs(common::floorToStep(0.123456, 0.001) - 0.123) < 1e-12);
        assert(std::abs(common::roundDownToTick(99.95, 0.1) - 99.9) < 1e-12);
        assert(std::abs(common::roundUpToTick(100.05, 0.1) - 100.1) < 1e-12);
    }

    std::cout << "[TEST] RiskSizer PASSED" << std::endl;
    return 0;
}
