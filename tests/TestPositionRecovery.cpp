#include "core/state/EventJournalJsonl.h"
#include "core/state/PositionRecovery.h"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>

using namespace spotbot;
using core::JournalEvent;
using core::JournalEventType;

namespace {

JournalEvent makeEvent(long long ts, JournalEventType type, const std::string& pair,
                       const std::string& entity, nlohmann::json payload) {
    JournalEvent event;
    event.ts_ms = ts;
    event.type = type;
    event.pair = pair;
    event.entity_id = entity;
    event.payload = std::move(payload);
    return event;
}

void submitEntry(core::IEventJournal& journal, long long ts, const std::string& pair,
                 const std::string& position_id, const std::string& client_id,
                 double quantity, double reserved) {
    assert(journal.append(makeEvent(ts, JournalEventType::ORDER_SUBMITTED, pair, client_id, {
        {"purpose", "ENTRY"},
        {"position_id", position_id},
        {"quantity", quantity},
        {"reserved_amount", reserved},
        {"created_ms", ts}
    })));
}

void openPosition(core::IEventJournal& journal, long long ts, const std::string& pair,
                  const std::string& position_id, double entry, double quantity) {
    assert(journal.append(makeEvent(ts, JournalEventType::POSITION_OPENED, pair, position_id, {
        {"entry_price", entry},
        {"quantity", quantity},
        {"stop_loss_price", entry * 0.985},
        {"profit_target_price", entry * 1.02},
        {"entry_order_id", "9001"},
        {"entry_time_ms", ts},
        {"reserved_amount", entry * quantity}
    })));
}

const risk::Position* findPosition(const std::vector<risk::Position>& positions, const std::string& id) {
    for (const auto& position : positions) {
        if (position.id == id) {
            return &position;
        }
    }
    return nullptr;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting PositionRecovery Test..." << std::endl;

    const auto path = std::filesystem::temp_directory_path() / "spotbot_test" / "test_position_recovery.jsonl";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    auto journal = std::make_shared<core::EventJournalJsonl>(path);

    // p1: entry still pending, exchange id known
    submitEntry(*journal, 1000, "ADA/USDT", "p1", "sb-ADAUSDT-a1", 125.0, 50.0);
    assert(journal->append(makeEvent(1001, JournalEventType::ORDER_UPDATED, "ADA/USDT", "sb-ADAUSDT-a1",
                                     {{"order_id", "7001"}, {"status", "NEW"}})));

    // p2: open
    submitEntry(*journal, 2000, "ADA/USDT", "p2", "sb-ADAUSDT-a2", 100.0, 40.0);
    openPosition(*journal, 2100, "ADA/USDT", "p2", 0.40, 100.0);

    // p3: exit requested and still working
    submitEntry(*journal, 3000, "CKB/USDT", "p3", "sb-CKBUSDT-a3", 5000.0, 50.0);
    openPosition(*journal, 3100, "CKB/USDT", "p3", 0.01, 5000.0);
    assert(journal->append(makeEvent(3200, JournalEventType::POSITION_EXIT_REQUESTED, "CKB/USDT", "p3",
                                     {{"exit_client_id", "sb-CKBUSDT-x3"}, {"reason", "stop_loss"}})));

    // p4: exit rejected after a partial fill, back to open with the remainder
    submitEntry(*journal, 4000, "CKB/USDT", "p4", "sb-CKBUSDT-a4", 1000.0, 10.0);
    openPosition(*journal, 4100, "CKB/USDT", "p4", 0.01, 1000.0);
    assert(journal->append(makeEvent(4200, JournalEventType::POSITION_EXIT_REQUESTED, "CKB/USDT", "p4",
                                     {{"exit_client_id", "sb-CKBUSDT-x4"}, {"reason", "profit_target"}})));
    assert(journal->append(makeEvent(4300, JournalEventType::ORDER_UPDATED, "CKB/USDT", "sb-CKBUSDT-x4",
                                     {{"status", "EXPIRED"}, {"executed_qty", 400.0}})));

    // p5 closed, p6 cancelled: gone
    submitEntry(*journal, 5000, "ADA/USDT", "p5", "sb-ADAUSDT-a5", 10.0, 4.0);
    openPosition(*journal, 5100, "ADA/USDT", "p5", 0.40, 10.0);
    assert(journal->append(makeEvent(5200, JournalEventType::POSITION_CLOSED, "ADA/USDT", "p5",
                                     {{"exit_price", 0.41}, {"pnl", 0.1}})));
    submitEntry(*journal, 6000, "ADA/USDT", "p6", "sb-ADAUSDT-a6", 10.0, 4.0);
    assert(journal->append(makeEvent(6100, JournalEventType::POSITION_CANCELLED, "ADA/USDT", "p6",
                                     {{"reason", "REJECTED"}})));

    // Quote orders and suspension markers do not create positions
    assert(journal->append(makeEvent(7000, JournalEventType::ORDER_SUBMITTED, "ADA/USDT", "sb-ADAUSDT-q1",
                                     {{"purpose", "QUOTE"}, {"price", 0.399}})));
    assert(journal->append(makeEvent(7100, JournalEventType::PAIR_SUSPENDED, "CKB/USDT", "CKB/USDT",
                                     {{"reason", "5 consecutive failures"}})));

    // Recovery reads from a fresh instance, as after a restart
    auto reopened = std::make_shared<core::EventJournalJsonl>(path);
    core::PositionRecovery recovery(reopened);
    auto by_pair = recovery.recover();

    assert(by_pair.size() == 2);
    const auto& ada = by_pair[TradingPair("ADA", "USDT")];
    const auto& ckb = by_pair[TradingPair("CKB", "USDT")];
    assert(ada.size() == 2);
    assert(ckb.size() == 2);

    // Journal order preserved
    assert(ada[0].id == "p1");
    assert(ada[1].id == "p2");

    const auto* p1 = findPosition(ada, "p1");
    assert(p1 && p1->state == risk::PositionState::PENDING);
    assert(p1->entry_client_id == "sb-ADAUSDT-a1");
    assert(p1->entry_order_id == "7001");
    assert(p1->reserved_amount == 50.0);

    const auto* p2 = findPosition(ada, "p2");
    assert(p2 && p2->state == risk::PositionState::OPEN);
    assert(p2->entry_price == 0.40);
    assert(p2->quantity == 100.0);
    assert(p2->stop_loss_price == 0.40 * 0.985);
    assert(p2->profit_target_price == 0.40 * 1.02);

    const auto* p3 = findPosition(ckb, "p3");
    assert(p3 && p3->state == risk::PositionState::EXIT_PENDING);
    assert(p3->exit_client_id == "sb-CKBUSDT-x3");
    assert(p3->exit_reason == "stop_loss");

    const auto* p4 = findPosition(ckb, "p4");
    assert(p4 && p4->state == risk::PositionState::OPEN);
    assert(p4->quantity == 600.0);
    assert(p4->exit_client_id.empty());

    assert(!findPosition(ada, "p5"));
    assert(!findPosition(ada, "p6"));

    // Empty journal: nothing to restore
    {
        const auto empty_path = std::filesystem::temp_directory_path() / "spotbot_test" / "test_position_recovery_empty.jsonl";
        std::filesystem::remove(empty_path, ec);
        core::PositionRecovery empty(std::make_shared<core::EventJournalJsonl>(empty_path));
        assert(empty.recover().empty());
    }

    std::filesystem::remove(path, ec);
    std::cout << "[TEST] PositionRecovery PASSED" << std::endl;
    return 0;
}
