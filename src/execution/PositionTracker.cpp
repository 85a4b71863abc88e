#include "execution/PositionTracker.h"
#include "common/Logger.h"
#include "risk/RiskSizer.h"
#include <algorithm>
#include <stdexcept>

namespace spotbot {
namespace execution {

using core::execution::PositionEvent;
using core::execution::PositionStateMachine;

PositionTracker::PositionTracker(TradingPair pair)
    : pair_(std::move(pair)) {}

void PositionTracker::add(const risk::Position& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (position.pair != pair_) {
        throw std::invalid_argument("position " + position.id + " belongs to " + position.pair.toString());
    }
    if (positions_.count(position.id) > 0) {
        throw std::invalid_argument("duplicate position id " + position.id);
    }
    positions_.emplace(position.id, position);
    order_.push_back(position.id);
}

std::optional<risk::Position> PositionTracker::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<risk::Position> PositionTracker::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<risk::Position> out;
    for (const auto& id : order_) {
        const auto& position = positions_.at(id);
        if (!position.isTerminal()) {
            out.push_back(position);
        }
    }
    return out;
}

bool PositionTracker::hasActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(positions_.begin(), positions_.end(),
                       [](const auto& entry) { return !entry.second.isTerminal(); });
}

bool PositionTracker::applyLocked(risk::Position& position, PositionEvent event) {
    const auto result = PositionStateMachine::transition(position.state, event);
    if (!result.accepted) {
        LOG_WARN("[{}] position {} rejected {} in state {}",
                 pair_.toString(), position.id,
                 core::execution::positionEventToString(event),
                 risk::positionStateToString(position.state));
        return false;
    }
    LOG_DEBUG("[{}] position {} {} -> {}", pair_.toString(), position.id,
              risk::positionStateToString(position.state),
              risk::positionStateToString(result.state));
    position.state = result.state;
    if (position.state == risk::PositionState::CLOSED) {
        ++closed_count_;
    }
    return true;
}

bool PositionTracker::fillEntry(const std::string& id,
                                double fill_price,
                                double quantity,
                                double stop_loss_pct,
                                double profit_target_pct,
                                Timestamp filled_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end() || !applyLocked(it->second, PositionEvent::ENTRY_FILLED)) {
        return false;
    }
    auto& position = it->second;
    position.entry_price = fill_price;
    position.quantity = quantity;
    position.entry_time = filled_at;
    position.stop_loss_price = risk::RiskSizer::stopLossPrice(fill_price, stop_loss_pct);
    position.profit_target_price = risk::RiskSizer::profitTargetPrice(fill_price, profit_target_pct);
    return true;
}

bool PositionTracker::cancelEntry(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    return it != positions_.end() && applyLocked(it->second, PositionEvent::ENTRY_CANCELLED);
}

bool PositionTracker::requestExit(const std::string& id,
                                  const std::string& exit_client_id,
                                  const std::string& reason,
                                  Timestamp requested_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end() || !applyLocked(it->second, PositionEvent::EXIT_REQUESTED)) {
        return false;
    }
    it->second.exit_client_id = exit_client_id;
    it->second.exit_order_id.clear();
    it->second.exit_reason = reason;
    it->second.exit_requested_at = requested_at;
    return true;
}

bool PositionTracker::fillExit(const std::string& id, double exit_price) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end() || !applyLocked(it->second, PositionEvent::EXIT_FILLED)) {
        return false;
    }
    it->second.exit_price = exit_price;
    return true;
}

bool PositionTracker::failExit(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end() || !applyLocked(it->second, PositionEvent::EXIT_FAILED)) {
        return false;
    }
    it->second.exit_client_id.clear();
    it->second.exit_order_id.clear();
    it->second.exit_reason.clear();
    return true;
}

bool PositionTracker::setEntryOrderId(const std::string& id, const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        return false;
    }
    it->second.entry_order_id = order_id;
    return true;
}

bool PositionTracker::setExitOrderId(const std::string& id, const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        return false;
    }
    it->second.exit_order_id = order_id;
    return true;
}

bool PositionTracker::reduceQuantity(const std::string& id, double filled_quantity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end() || it->second.isTerminal()) {
        return false;
    }
    it->second.quantity = std::max(0.0, it->second.quantity - filled_quantity);
    return true;
}

size_t PositionTracker::purgeTerminal() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = positions_.begin(); it != positions_.end();) {
        if (it->second.isTerminal()) {
            order_.erase(std::remove(order_.begin(), order_.end(), it->first), order_.end());
            it = positions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

int PositionTracker::closedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_count_;
}

} // namespace execution
} // namespace spotbot
