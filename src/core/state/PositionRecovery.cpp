#include "core/state/PositionRecovery.h"
#include "common/Logger.h"

#include <set>
#include <stdexcept>

namespace spotbot {
namespace core {

namespace {
const std::set<std::string> kExitEndedStatuses = {
    "REJECTED", "NOT_FOUND", "CANCELED", "EXPIRED", "EXPIRED_IN_MATCH"
};
}

PositionRecovery::PositionRecovery(std::shared_ptr<IEventJournal> journal)
    : journal_(std::move(journal)) {}

std::map<TradingPair, std::vector<risk::Position>> PositionRecovery::recover() const {
    std::map<std::string, risk::Position> live;
    std::vector<std::string> order;

    for (const auto& event : journal_->readFrom(0)) {
        const auto& payload = event.payload;

        switch (event.type) {
            case JournalEventType::ORDER_SUBMITTED: {
                if (payload.value("purpose", std::string()) != "ENTRY") {
                    break;
                }
                TradingPair pair;
                try {
                    pair = TradingPair::parse(event.pair);
                } catch (const std::invalid_argument& e) {
                    LOG_WARN("Journal seq {}: bad pair '{}': {}", event.seq, event.pair, e.what());
                    break;
                }
                risk::Position position;
                position.id = payload.value("position_id", event.entity_id);
                position.pair = pair;
                position.state = risk::PositionState::PENDING;
                position.quantity = payload.value("quantity", 0.0);
                position.reserved_amount = payload.value("reserved_amount", 0.0);
                position.created_at = fromEpochMs(payload.value("created_ms", event.ts_ms));
                position.entry_client_id = event.entity_id;
                if (live.count(position.id) == 0) {
                    order.push_back(position.id);
                }
                live[position.id] = position;
                break;
            }
            case JournalEventType::ORDER_UPDATED: {
                for (auto& [id, position] : live) {
                    if (event.entity_id == position.entry_client_id && payload.contains("order_id")) {
                        position.entry_order_id = payload["order_id"].get<std::string>();
                    } else if (!position.exit_client_id.empty() && event.entity_id == position.exit_client_id) {
                        const std::string status = payload.value("status", std::string());
                        if (kExitEndedStatuses.count(status) > 0) {
                            position.quantity -= payload.value("executed_qty", 0.0);
                            position.state = risk::PositionState::OPEN;
                            position.exit_client_id.clear();
                            position.exit_order_id.clear();
                        } else if (payload.contains("order_id")) {
                            position.exit_order_id = payload["order_id"].get<std::string>();
                        }
                    }
                }
                break;
            }
            case JournalEventType::POSITION_OPENED: {
                auto it = live.find(event.entity_id);
                if (it == live.end()) {
                    break;
                }
                auto& position = it->second;
                position.state = risk::PositionState::OPEN;
                position.entry_price = payload.value("entry_price", 0.0);
                position.quantity = payload.value("quantity", 0.0);
                position.stop_loss_price = payload.value("stop_loss_price", 0.0);
                position.profit_target_price = payload.value("profit_target_price", 0.0);
                position.entry_order_id = payload.value("entry_order_id", position.entry_order_id);
                position.entry_time = fromEpochMs(payload.value("entry_time_ms", event.ts_ms));
                position.reserved_amount = payload.value("reserved_amount", position.reserved_amount);
                break;
            }
            case JournalEventType::POSITION_EXIT_REQUESTED: {
                auto it = live.find(event.entity_id);
                if (it == live.end()) {
                    break;
                }
                it->second.state = risk::PositionState::EXIT_PENDING;
                it->second.exit_client_id = payload.value("exit_client_id", std::string());
                it->second.exit_order_id.clear();
                it->second.exit_reason = payload.value("reason", std::string());
                it->second.exit_requested_at = fromEpochMs(event.ts_ms);
                break;
            }
            case JournalEventType::POSITION_CLOSED:
            case JournalEventType::POSITION_CANCELLED:
                live.erase(event.entity_id);
                break;
            case JournalEventType::PAIR_SUSPENDED:
                break;
        }
    }

    std::map<TradingPair, std::vector<risk::Position>> by_pair;
    for (const auto& id : order) {
        auto it = live.find(id);
        if (it == live.end()) {
            continue;
        }
        by_pair[it->second.pair].push_back(it->second);
    }

    size_t total = 0;
    for (const auto& [pair, positions] : by_pair) {
        total += positions.size();
    }
    if (total > 0) {
        LOG_INFO("Recovered {} live position(s) from the journal", total);
    }
    return by_pair;
}

} // namespace core
} // namespace spotbot
