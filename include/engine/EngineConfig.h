#pragma once

#include <string>
#include <vector>

#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace spotbot {
namespace engine {

struct EngineConfig {
    bool sandbox_mode = true;
    std::vector<TradingPair> trading_pairs;
    strategy::StrategyConfig strategy;

    // Scheduler / failure policy
    int max_consecutive_failures = 5;
    int startup_stagger_seconds = 5;
    bool cancel_quotes_on_shutdown = true;

    // Persistence / logging
    std::string journal_path = "logs/journal.jsonl";
    std::string log_dir = "logs";
    std::string log_level = "info";
};

} // namespace engine
} // namespace spotbot
