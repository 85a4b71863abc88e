#include "engine/PairTrader.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <utility>

namespace spotbot {
namespace engine {

PairTrader::PairTrader(TradingPair pair,
                       const EngineConfig& config,
                       std::shared_ptr<exchange::IExchangeGateway> gateway,
                       std::shared_ptr<risk::BalanceLedger> ledger,
                       std::shared_ptr<core::IEventJournal> journal,
                       Clock clock)
    : pair_(pair)
    , config_(config)
    , gateway_(std::move(gateway))
    , ledger_(std::move(ledger))
    , clock_(std::move(clock))
    , strategy_(config.strategy)
    , tracker_(pair)
    , executor_(pair, gateway_, ledger_, std::move(journal), config.strategy, tracker_)
    , market_(pair, strategy_.stalenessLimit())
{
    status_.pair = pair_;
}

PairTrader::~PairTrader() {
    stop();
}

void PairTrader::restorePositions(const std::vector<risk::Position>& positions) {
    for (const auto& position : positions) {
        tracker_.add(position);
        if (position.reserved_amount > 0.0) {
            const auto state = position.state == risk::PositionState::PENDING
                ? risk::BalanceLedger::ReservationState::IN_FLIGHT
                : risk::BalanceLedger::ReservationState::COMMITTED;
            ledger_->restore(pair_, position.id, pair_.quote(), position.reserved_amount, state);
        }
        LOG_INFO("[{}] restored position {} ({}, qty {:.8f})",
                 pair_.toString(), position.id,
                 risk::positionStateToString(position.state), position.quantity);
    }
    publishStatus("");
}

bool PairTrader::tick() {
    if (suspended_ || paused_) {
        return false;
    }

    try {
        runTick();
        consecutive_failures_ = 0;
        ++ticks_;
        publishStatus("");
        return true;
    } catch (const InvariantViolation& e) {
        LOG_ERROR("[{}] INVARIANT VIOLATION: {}", pair_.toString(), e.what());
        suspend(std::string("invariant violation: ") + e.what());
        publishStatus(e.what());
    } catch (const GatewayError& e) {
        LOG_WARN("[{}] gateway error (http {}, code {}): {}",
                 pair_.toString(), e.httpStatus(), e.exchangeCode(), e.what());
        recordFailure(e.what());
    } catch (const StaleDataError& e) {
        LOG_WARN("[{}] skipping tick, stale market data: {}", pair_.toString(), e.what());
        publishStatus(e.what());
    } catch (const InsufficientBalance& e) {
        LOG_WARN("[{}] skipping tick, insufficient balance: {}", pair_.toString(), e.what());
        publishStatus(e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("[{}] tick failed: {}", pair_.toString(), e.what());
        recordFailure(e.what());
    }
    return false;
}

void PairTrader::runTick() {
    if (!rules_) {
        rules_ = gateway_->getSymbolRules(pair_);
    }

    // Earlier in-doubt or pending orders are settled before anything new is decided
    executor_.reconcilePositions(clock_());

    market_.update(gateway_->getTicker(pair_), clock_());

    const auto& cfg = config_.strategy;
    if (strategy_.needsEma() && market_.emaNeedsRefresh(clock_())) {
        const int limit = std::max(cfg.ema_period * 3, 50);
        auto candles = gateway_->getCandles(pair_, cfg.ema_timeframe, limit);
        market_.seedEma(candles, cfg.ema_period, cfg.ema_timeframe_seconds, clock_());
    }

    // Other workers keep committing fills while these requests are in flight
    const auto balance_epoch = ledger_->balanceEpoch();
    const double quote_free = gateway_->getBalance(pair_.quote());
    const double base_free = gateway_->getBalance(pair_.base());
    for (const auto& [asset, reading] : {std::make_pair(pair_.quote(), quote_free),
                                         std::make_pair(pair_.base(), base_free)}) {
        if (!ledger_->syncBalance(asset, reading, balance_epoch)) {
            LOG_DEBUG("[{}] {} balance reading superseded by a newer one", pair_.toString(), asset);
        }
    }

    auto open_orders = gateway_->getOpenOrders(pair_);
    if (strategy_.kind() == strategy::StrategyKind::MARKET_MAKING) {
        executor_.reconcileQuotes(open_orders);
    }

    strategy::TickContext ctx;
    ctx.pair = pair_;
    ctx.now = clock_();
    ctx.snapshot = market_.freshSnapshot(ctx.now);
    ctx.positions = tracker_.active();
    ctx.open_orders = std::move(open_orders);
    ctx.rules = *rules_;
    ctx.quote_available = ledger_->available(pair_.quote());
    ctx.base_free = base_free;
    ctx.atomic_replace = gateway_->supportsAtomicReplace();

    auto actions = strategy_.evaluate(ctx);
    if (!actions.empty()) {
        LOG_DEBUG("[{}] {} action(s) this tick", pair_.toString(), actions.size());
    }
    executor_.execute(actions, ctx);
}

void PairTrader::recordFailure(const std::string& error) {
    ++consecutive_failures_;
    LOG_WARN("[{}] consecutive failures: {}/{}",
             pair_.toString(), consecutive_failures_, config_.max_consecutive_failures);
    if (consecutive_failures_ >= config_.max_consecutive_failures) {
        suspend("too many consecutive failures: " + error);
    }
    publishStatus(error);
}

void PairTrader::suspend(const std::string& reason) {
    if (suspended_.exchange(true)) {
        return;
    }
    LOG_ERROR("[{}] pair suspended: {}", pair_.toString(), reason);
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.suspend_reason = reason;
    }
    executor_.record(core::JournalEventType::PAIR_SUSPENDED, pair_.toString(),
                     {{"reason", reason}, {"consecutive_failures", consecutive_failures_}});
    wake_cv_.notify_all();
}

void PairTrader::publishStatus(const std::string& last_error) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_.paused = paused_;
    status_.suspended = suspended_;
    status_.consecutive_failures = consecutive_failures_;
    status_.ticks = ticks_;
    status_.last_tick_ms = toEpochMs(clock_());
    status_.active_positions = tracker_.active().size();
    status_.live_quotes = executor_.trackedQuoteCount();
    status_.realized_pnl = executor_.realizedPnl();
    status_.last_error = last_error;
}

PairStatus PairTrader::status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    PairStatus copy = status_;
    copy.paused = paused_;
    copy.suspended = suspended_;
    return copy;
}

void PairTrader::pause() {
    if (!paused_.exchange(true)) {
        LOG_INFO("[{}] paused", pair_.toString());
    }
}

void PairTrader::resume() {
    if (paused_.exchange(false)) {
        LOG_INFO("[{}] resumed", pair_.toString());
    }
}

void PairTrader::start(std::chrono::milliseconds initial_delay) {
    if (running_.exchange(true)) {
        LOG_WARN("[{}] already running", pair_.toString());
        return;
    }
    LOG_INFO("[{}] starting {} worker (first tick in {} ms)",
             pair_.toString(), strategy::strategyKindToString(strategy_.kind()),
             initial_delay.count());
    worker_ = std::thread(&PairTrader::run, this, initial_delay);
}

void PairTrader::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_ = false;
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool PairTrader::sleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_cv_.wait_for(lock, duration, [this] { return !running_ || suspended_; });
    return running_ && !suspended_;
}

void PairTrader::run(std::chrono::milliseconds initial_delay) {
    const auto interval = std::chrono::seconds(config_.strategy.trade_interval_seconds);

    if (sleepFor(initial_delay)) {
        while (running_ && !suspended_) {
            tick();
            if (!sleepFor(interval)) {
                break;
            }
        }
    }

    if (config_.cancel_quotes_on_shutdown &&
        strategy_.kind() == strategy::StrategyKind::MARKET_MAKING) {
        executor_.cancelAllQuotes();
    }
    LOG_INFO("[{}] worker stopped", pair_.toString());
}

} // namespace engine
} // namespace spotbot
