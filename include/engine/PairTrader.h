#pragma once

#include "analytics/MarketDataCache.h"
#include "common/Types.h"
#include "core/contracts/IEventJournal.h"
#include "engine/EngineConfig.h"
#include "exchange/IExchangeGateway.h"
#include "execution/OrderExecutor.h"
#include "execution/PositionTracker.h"
#include "risk/BalanceLedger.h"
#include "strategy/StrategyEngine.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace spotbot {
namespace engine {

struct PairStatus {
    TradingPair pair;
    bool paused = false;
    bool suspended = false;
    std::string suspend_reason;
    int consecutive_failures = 0;
    long long ticks = 0;
    long long last_tick_ms = 0;
    size_t active_positions = 0;
    size_t live_quotes = 0;
    double realized_pnl = 0.0;
    std::string last_error;
};

// Tick loop for one pair on its own thread.
//
// Ticks are strictly sequential: a tick's actions are submitted before the next
// tick can start. Errors never leave the pair; MAX_CONSECUTIVE_FAILURES gateway
// failures in a row, or a broken invariant, suspend it for good.
class PairTrader {
public:
    using Clock = std::function<Timestamp()>;

    PairTrader(TradingPair pair,
               const EngineConfig& config,
               std::shared_ptr<exchange::IExchangeGateway> gateway,
               std::shared_ptr<risk::BalanceLedger> ledger,
               std::shared_ptr<core::IEventJournal> journal,
               Clock clock = [] { return std::chrono::system_clock::now(); });
    ~PairTrader();

    PairTrader(const PairTrader&) = delete;
    PairTrader& operator=(const PairTrader&) = delete;

    // Journal-recovered positions; their capital is re-reserved
    void restorePositions(const std::vector<risk::Position>& positions);

    // Runs one tick unless paused or suspended. True when the tick completed.
    bool tick();

    // Starts the worker thread; the first tick waits `initial_delay`
    void start(std::chrono::milliseconds initial_delay);

    // Wakes the worker from its sleep and joins it. Idempotent.
    void stop();

    // Takes effect between ticks
    void pause();
    void resume();

    bool isPaused() const { return paused_; }
    bool isSuspended() const { return suspended_; }
    bool isRunning() const { return running_; }
    const TradingPair& pair() const { return pair_; }

    PairStatus status() const;

private:
    TradingPair pair_;
    EngineConfig config_;
    std::shared_ptr<exchange::IExchangeGateway> gateway_;
    std::shared_ptr<risk::BalanceLedger> ledger_;
    Clock clock_;

    strategy::StrategyEngine strategy_;
    execution::PositionTracker tracker_;
    execution::OrderExecutor executor_;
    analytics::MarketDataCache market_;
    std::optional<SymbolRules> rules_;

    std::atomic<bool> running_{false};
    std::atomic<bool> paused_{false};
    std::atomic<bool> suspended_{false};
    int consecutive_failures_ = 0;
    long long ticks_ = 0;

    std::thread worker_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    mutable std::mutex status_mutex_;
    PairStatus status_;

    void run(std::chrono::milliseconds initial_delay);
    void runTick();
    void suspend(const std::string& reason);
    void recordFailure(const std::string& error);
    void publishStatus(const std::string& last_error);

    // False when stop() was requested during the wait
    bool sleepFor(std::chrono::milliseconds duration);
};

} // namespace engine
} // namespace spotbot
