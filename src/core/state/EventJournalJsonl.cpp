#include "core/state/EventJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>

namespace spotbot {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}
}

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    size_t line_no = 0;
    while (std::getline(in, row)) {
        ++line_no;
        if (row.empty()) {
            continue;
        }
        auto line = nlohmann::json::parse(row, nullptr, false);
        if (line.is_discarded() || !line.is_object()) {
            LOG_WARN("Journal {}: skipping malformed line {}", file_path_.string(), line_no);
            continue;
        }
        last_seq_ = (std::max)(last_seq_, parseSeq(line));
    }
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Journal directory {} unavailable: {}", file_path_.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Journal {} cannot be opened for append", file_path_.string());
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = event.ts_ms;
    line["type"] = toString(event.type);
    line["pair"] = event.pair;
    line["entity_id"] = event.entity_id;
    line["payload"] = event.payload.is_null() ? nlohmann::json::object() : event.payload;

    out << line.dump() << "\n";
    out.flush();
    if (!out) {
        LOG_ERROR("Journal {} write failed", file_path_.string());
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        auto line = nlohmann::json::parse(row, nullptr, false);
        if (line.is_discarded() || !line.is_object()) {
            continue;
        }

        const auto seq = parseSeq(line);
        if (seq < seq_inclusive) {
            continue;
        }

        JournalEvent event;
        event.seq = seq;
        event.ts_ms = line.value("ts_ms", 0LL);
        event.type = fromString(line.value("type", std::string("ORDER_UPDATED")));
        event.pair = line.value("pair", std::string());
        event.entity_id = line.value("entity_id", std::string());
        event.payload = line.value("payload", nlohmann::json::object());
        out.push_back(std::move(event));
    }

    return out;
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::string EventJournalJsonl::toString(JournalEventType type) {
    switch (type) {
        case JournalEventType::ORDER_SUBMITTED: return "ORDER_SUBMITTED";
        case JournalEventType::ORDER_UPDATED: return "ORDER_UPDATED";
        case JournalEventType::POSITION_OPENED: return "POSITION_OPENED";
        case JournalEventType::POSITION_EXIT_REQUESTED: return "POSITION_EXIT_REQUESTED";
        case JournalEventType::POSITION_CLOSED: return "POSITION_CLOSED";
        case JournalEventType::POSITION_CANCELLED: return "POSITION_CANCELLED";
        case JournalEventType::PAIR_SUSPENDED: return "PAIR_SUSPENDED";
    }
    return "ORDER_UPDATED";
}

JournalEventType EventJournalJsonl::fromString(const std::string& value) {
    if (value == "ORDER_SUBMITTED") return JournalEventType::ORDER_SUBMITTED;
    if (value == "ORDER_UPDATED") return JournalEventType::ORDER_UPDATED;
    if (value == "POSITION_OPENED") return JournalEventType::POSITION_OPENED;
    if (value == "POSITION_EXIT_REQUESTED") return JournalEventType::POSITION_EXIT_REQUESTED;
    if (value == "POSITION_CLOSED") return JournalEventType::POSITION_CLOSED;
    if (value == "POSITION_CANCELLED") return JournalEventType::POSITION_CANCELLED;
    if (value == "PAIR_SUSPENDED") return JournalEventType::PAIR_SUSPENDED;
    return JournalEventType::ORDER_UPDATED;
}

} // namespace core
} // namespace spotbot
