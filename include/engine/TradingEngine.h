#pragma once

#include "common/Types.h"
#include "core/contracts/IEventJournal.h"
#include "engine/EngineConfig.h"
#include "engine/PairTrader.h"
#include "exchange/IExchangeGateway.h"
#include "risk/BalanceLedger.h"
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace spotbot {
namespace engine {

// Runs one independent PairTrader per configured pair. The pairs share only the
// gateway (and its rate limiter), the balance ledger and the journal.
class TradingEngine {
public:
    TradingEngine(const EngineConfig& config,
                  std::shared_ptr<exchange::IExchangeGateway> gateway,
                  std::shared_ptr<core::IEventJournal> journal,
                  PairTrader::Clock clock = [] { return std::chrono::system_clock::now(); });

    ~TradingEngine();

    // Replays the journal and hands live positions back to their pairs.
    // Returns the number of positions restored. Call before start().
    size_t recoverPositions();

    // Pair i starts after i * STARTUP_STAGGER_SECONDS
    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // False for an unknown pair
    bool pausePair(const TradingPair& pair);
    bool resumePair(const TradingPair& pair);
    bool isSuspended(const TradingPair& pair) const;

    // True once every pair worker has suspended
    bool allSuspended() const;

    std::vector<PairStatus> status() const;

    // Null for an unknown pair
    PairTrader* trader(const TradingPair& pair);

    risk::BalanceLedger& ledger() { return *ledger_; }

private:
    EngineConfig config_;
    std::shared_ptr<exchange::IExchangeGateway> gateway_;
    std::shared_ptr<core::IEventJournal> journal_;
    std::shared_ptr<risk::BalanceLedger> ledger_;
    std::map<TradingPair, std::unique_ptr<PairTrader>> traders_;
    std::atomic<bool> running_{false};

    void logSummary() const;
};

} // namespace engine
} // namespace spotbot
