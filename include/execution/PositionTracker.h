#pragma once

#include "common/Types.h"
#include "core/execution/PositionStateMachine.h"
#include "risk/Position.h"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace spotbot {
namespace execution {

// Positions of one pair. Every state change goes through PositionStateMachine;
// the tracker is the only place that decides whether capital is still committed.
class PositionTracker {
public:
    explicit PositionTracker(TradingPair pair);

    const TradingPair& pair() const { return pair_; }

    // Throws std::invalid_argument on a duplicate id or a foreign pair
    void add(const risk::Position& position);

    std::optional<risk::Position> find(const std::string& id) const;

    // Non-terminal positions, oldest first
    std::vector<risk::Position> active() const;
    bool hasActive() const;

    // Stop and target are derived here from the fill price and never touched again.
    bool fillEntry(const std::string& id,
                   double fill_price,
                   double quantity,
                   double stop_loss_pct,
                   double profit_target_pct,
                   Timestamp filled_at);
    bool cancelEntry(const std::string& id);
    bool requestExit(const std::string& id,
                     const std::string& exit_client_id,
                     const std::string& reason,
                     Timestamp requested_at);
    bool fillExit(const std::string& id, double exit_price);
    bool failExit(const std::string& id);

    bool setEntryOrderId(const std::string& id, const std::string& order_id);
    bool setExitOrderId(const std::string& id, const std::string& order_id);

    // Partial exit fill: the remainder stays monitored
    bool reduceQuantity(const std::string& id, double filled_quantity);

    // Drops Closed/Cancelled positions; returns how many were removed
    size_t purgeTerminal();

    int closedCount() const;

private:
    TradingPair pair_;
    mutable std::mutex mutex_;
    std::map<std::string, risk::Position> positions_;
    std::vector<std::string> order_;
    int closed_count_ = 0;

    bool applyLocked(risk::Position& position, core::execution::PositionEvent event);
};

} // namespace execution
} // namespace spotbot
