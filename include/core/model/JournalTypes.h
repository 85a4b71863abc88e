#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace spotbot {
namespace core {

enum class JournalEventType {
    ORDER_SUBMITTED,
    ORDER_UPDATED,
    POSITION_OPENED,
    POSITION_EXIT_REQUESTED,
    POSITION_CLOSED,
    POSITION_CANCELLED,
    PAIR_SUSPENDED
};

struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::ORDER_UPDATED;
    std::string pair;           // "ADA/USDT"
    std::string entity_id;      // position id or client order id
    nlohmann::json payload;
};

} // namespace core
} // namespace spotbot
