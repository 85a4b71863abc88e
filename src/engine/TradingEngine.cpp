#include "engine/TradingEngine.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "core/state/PositionRecovery.h"
#include <chrono>

namespace spotbot {
namespace engine {

TradingEngine::TradingEngine(const EngineConfig& config,
                             std::shared_ptr<exchange::IExchangeGateway> gateway,
                             std::shared_ptr<core::IEventJournal> journal,
                             PairTrader::Clock clock)
    : config_(config)
    , gateway_(std::move(gateway))
    , journal_(std::move(journal))
    , ledger_(std::make_shared<risk::BalanceLedger>())
{
    if (config_.trading_pairs.empty()) {
        throw ConfigError("no trading pairs configured");
    }

    LOG_INFO("TradingEngine init");
    LOG_INFO("Mode: {}", config_.sandbox_mode ? "TESTNET" : "PRODUCTION");
    LOG_INFO("Strategy: {} (interval {}s)",
             strategy::strategyKindToString(config_.strategy.kind),
             config_.strategy.trade_interval_seconds);

    for (const auto& pair : config_.trading_pairs) {
        if (traders_.count(pair) > 0) {
            throw ConfigError("duplicate trading pair: " + pair.toString());
        }
        traders_.emplace(pair, std::make_unique<PairTrader>(
            pair, config_, gateway_, ledger_, journal_, clock));
        LOG_INFO("  pair {}", pair.toString());
    }
}

TradingEngine::~TradingEngine() {
    stop();
}

size_t TradingEngine::recoverPositions() {
    if (!journal_) {
        return 0;
    }

    core::PositionRecovery recovery(journal_);
    size_t restored = 0;
    for (const auto& [pair, positions] : recovery.recover()) {
        auto it = traders_.find(pair);
        if (it == traders_.end()) {
            LOG_WARN("Journal holds {} live position(s) for unconfigured pair {}, not managed",
                     positions.size(), pair.toString());
            continue;
        }
        it->second->restorePositions(positions);
        restored += positions.size();
    }
    LOG_INFO("Restored {} position(s) into {} pair worker(s)", restored, traders_.size());
    return restored;
}

bool TradingEngine::start() {
    if (running_) {
        LOG_WARN("Engine already running");
        return false;
    }

    LOG_INFO("========================================");
    LOG_INFO("Trading engine start ({} pairs)", traders_.size());
    LOG_INFO("========================================");

    running_ = true;
    int index = 0;
    for (auto& [pair, trader] : traders_) {
        trader->start(std::chrono::seconds(index * config_.startup_stagger_seconds));
        ++index;
    }
    return true;
}

void TradingEngine::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("========================================");
    LOG_INFO("Trading engine stop");
    LOG_INFO("========================================");

    for (auto& [pair, trader] : traders_) {
        trader->stop();
    }
    logSummary();
    Logger::getInstance().flush();
}

bool TradingEngine::pausePair(const TradingPair& pair) {
    auto* target = trader(pair);
    if (!target) {
        return false;
    }
    target->pause();
    return true;
}

bool TradingEngine::resumePair(const TradingPair& pair) {
    auto* target = trader(pair);
    if (!target) {
        return false;
    }
    target->resume();
    return true;
}

bool TradingEngine::isSuspended(const TradingPair& pair) const {
    auto it = traders_.find(pair);
    return it != traders_.end() && it->second->isSuspended();
}

bool TradingEngine::allSuspended() const {
    for (const auto& [pair, trader] : traders_) {
        if (!trader->isSuspended()) {
            return false;
        }
    }
    return true;
}

std::vector<PairStatus> TradingEngine::status() const {
    std::vector<PairStatus> result;
    result.reserve(traders_.size());
    for (const auto& [pair, trader] : traders_) {
        result.push_back(trader->status());
    }
    return result;
}

PairTrader* TradingEngine::trader(const TradingPair& pair) {
    auto it = traders_.find(pair);
    return it != traders_.end() ? it->second.get() : nullptr;
}

void TradingEngine::logSummary() const {
    for (const auto& s : status()) {
        LOG_INFO("[{}] ticks={} positions={} quotes={} pnl={:.8f}{}",
                 s.pair.toString(), s.ticks, s.active_positions, s.live_quotes, s.realized_pnl,
                 s.suspended ? " SUSPENDED (" + s.suspend_reason + ")" : std::string());
    }
}

} // namespace engine
} // namespace spotbot
