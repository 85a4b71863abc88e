#include "core/state/EventJournalJsonl.h"

#include <filesystem>
#include <fstream>
#include <iostream>

int main() {
    const auto path = std::filesystem::temp_directory_path() / "spotbot_test" / "test_event_journal.jsonl";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    {
        spotbot::core::EventJournalJsonl journal(path);

        spotbot::core::JournalEvent first;
        first.ts_ms = 1000;
        first.type = spotbot::core::JournalEventType::ORDER_SUBMITTED;
        first.pair = "ADA/USDT";
        first.entity_id = "sb-ADAUSDT-1";
        first.payload["price"] = 0.40;

        spotbot::core::JournalEvent second;
        second.ts_ms = 2000;
        second.type = spotbot::core::JournalEventType::POSITION_OPENED;
        second.pair = "ADA/USDT";
        second.entity_id = "sb-ADAUSDT-1";
        second.payload["quantity"] = 125.0;

        if (!journal.append(first)) {
            std::cerr << "[TEST] append(first) failed\n";
            return 1;
        }
        if (!journal.append(second)) {
            std::cerr << "[TEST] append(second) failed\n";
            return 1;
        }

        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }

        const auto rows = journal.readFrom(2);
        if (rows.size() != 1) {
            std::cerr << "[TEST] readFrom(2) should return one row, got " << rows.size() << "\n";
            return 1;
        }
        if (rows.front().pair != "ADA/USDT" ||
            rows.front().type != spotbot::core::JournalEventType::POSITION_OPENED ||
            rows.front().payload.value("quantity", 0.0) != 125.0) {
            std::cerr << "[TEST] unexpected row: " << rows.front().pair << "\n";
            return 1;
        }
    }

    // A torn line from a crash is skipped; sequence numbers continue after restart
    {
        std::ofstream out(path, std::ios::app);
        out << "{\"seq\":3,\"type\":\"POSITION_CL\n";
    }
    {
        spotbot::core::EventJournalJsonl reopened(path);
        if (reopened.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq after reopen should be 2, got " << reopened.lastSeq() << "\n";
            return 1;
        }

        spotbot::core::JournalEvent third;
        third.ts_ms = 3000;
        third.type = spotbot::core::JournalEventType::PAIR_SUSPENDED;
        third.pair = "CKB/USDT";
        third.entity_id = "CKB/USDT";
        if (!reopened.append(third) || reopened.lastSeq() != 3) {
            std::cerr << "[TEST] append after reopen failed\n";
            return 1;
        }

        const auto all = reopened.readFrom(0);
        if (all.size() != 3 || all.back().type != spotbot::core::JournalEventType::PAIR_SUSPENDED) {
            std::cerr << "[TEST] readFrom(0) should return 3 rows, got " << all.size() << "\n";
            return 1;
        }
    }

    if (spotbot::core::EventJournalJsonl::fromString(
            spotbot::core::EventJournalJsonl::toString(
                spotbot::core::JournalEventType::POSITION_EXIT_REQUESTED)) !=
        spotbot::core::JournalEventType::POSITION_EXIT_REQUESTED) {
        std::cerr << "[TEST] event type names do not round-trip\n";
        return 1;
    }

    std::filesystem::remove(path, ec);
    std::cout << "[TEST] EventJournal PASSED\n";
    return 0;
}
