#include "execution/OrderExecutor.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "execution/OrderStateMapper.h"
#include "network/RequestSigner.h"
#include <algorithm>
#include <chrono>
#include <set>

namespace spotbot {
namespace execution {

namespace {
long long nowMs() {
    return toEpochMs(std::chrono::system_clock::now());
}

constexpr double kQtyEpsilon = 1e-12;
}

OrderExecutor::OrderExecutor(TradingPair pair,
                             std::shared_ptr<exchange::IExchangeGateway> gateway,
                             std::shared_ptr<risk::BalanceLedger> ledger,
                             std::shared_ptr<core::IEventJournal> journal,
                             strategy::StrategyConfig config,
                             PositionTracker& tracker)
    : pair_(std::move(pair))
    , gateway_(std::move(gateway))
    , ledger_(std::move(ledger))
    , journal_(std::move(journal))
    , config_(std::move(config))
    , tracker_(tracker) {}

std::string OrderExecutor::nextClientOrderId() const {
    return network::RequestSigner::generateClientOrderId(pair_.symbol());
}

void OrderExecutor::record(core::JournalEventType type,
                           const std::string& entity_id,
                           const nlohmann::json& payload) {
    if (!journal_) {
        return;
    }
    core::JournalEvent event;
    event.ts_ms = nowMs();
    event.type = type;
    event.pair = pair_.toString();
    event.entity_id = entity_id;
    event.payload = payload;
    if (!journal_->append(event)) {
        LOG_ERROR("[{}] journal append failed for {}", pair_.toString(), entity_id);
    }
}

// ===== Action dispatch =====

void OrderExecutor::execute(const std::vector<strategy::OrderAction>& actions,
                            const strategy::TickContext& ctx) {
    for (const auto& action : actions) {
        std::visit([&](const auto& concrete) { executeAction(concrete, ctx); }, action);
    }
    tracker_.purgeTerminal();
}

void OrderExecutor::executeAction(const strategy::PlaceAction& action, const strategy::TickContext& ctx) {
    switch (action.purpose) {
        case strategy::ActionPurpose::ENTRY:
            placeEntry(action, ctx);
            break;
        case strategy::ActionPurpose::EXIT:
            placeExit(action, ctx);
            break;
        case strategy::ActionPurpose::QUOTE:
            placeQuote(action, ctx);
            break;
    }
}

void OrderExecutor::executeAction(const strategy::CancelAction& action, const strategy::TickContext& ctx) {
    (void)ctx;
    LOG_INFO("[{}] cancel {} ({})", pair_.toString(), action.order_id, action.reason);

    ExchangeOrder cancelled;
    try {
        cancelled = gateway_->cancelOrder(pair_, action.order_id);
    } catch (const GatewayError& e) {
        if (!e.isUnknownOrder()) {
            LOG_ERROR("[{}] cancel {} failed: {}", pair_.toString(), action.order_id, e.what());
            throw;
        }
        // Filled or cancelled in the meantime: read its final state
        LOG_WARN("[{}] cancel {}: order no longer open", pair_.toString(), action.order_id);
        auto final_state = gateway_->getOrder(pair_, action.order_id);
        if (final_state) {
            resolveQuote(*final_state);
        } else {
            dropQuote(action.order_id, "unknown to exchange");
        }
        return;
    }
    resolveQuote(cancelled);
}

void OrderExecutor::executeAction(const strategy::ModifyAction& action, const strategy::TickContext& ctx) {
    (void)ctx;
    const std::string new_client_id = nextClientOrderId();
    const std::string& quote_asset = pair_.quote();

    auto tracked = quotes_.find(action.order_id);
    std::optional<QuoteRecord> old_record;
    if (tracked != quotes_.end()) {
        old_record = tracked->second;
    }

    // Move the bid's reservation to the new price
    if (action.side == OrderSide::BUY) {
        if (old_record) {
            ledger_->release(old_record->client_order_id);
        }
        try {
            ledger_->reserve(pair_, new_client_id, quote_asset, action.quantity * action.new_price, 0.0);
        } catch (const InsufficientBalance& e) {
            if (old_record) {
                ledger_->restore(pair_, old_record->client_order_id, quote_asset,
                                 (old_record->quantity - old_record->executed_qty) * old_record->price,
                                 risk::BalanceLedger::ReservationState::IN_FLIGHT);
            }
            LOG_WARN("[{}] requote of {} skipped: {}", pair_.toString(), action.order_id, e.what());
            return;
        }
    }

    exchange::OrderRequest request;
    request.pair = pair_;
    request.side = action.side;
    request.type = OrderType::LIMIT;
    request.quantity = action.quantity;
    request.price = action.new_price;
    request.client_order_id = new_client_id;

    record(core::JournalEventType::ORDER_SUBMITTED, new_client_id, {
        {"purpose", "QUOTE"},
        {"side", orderSideToString(action.side)},
        {"quantity", action.quantity},
        {"price", action.new_price},
        {"replaces", action.order_id}
    });

    ExchangeOrder replacement;
    try {
        replacement = gateway_->replaceOrder(action.order_id, request);
    } catch (const GatewayError& e) {
        if (e.uncertain()) {
            LOG_ERROR("[{}] cancel-replace of {} outcome unknown ({}), confirming next tick",
                      pair_.toString(), action.order_id, e.what());
            QuoteRecord pending;
            pending.client_order_id = new_client_id;
            pending.side = action.side;
            pending.quantity = action.quantity;
            pending.price = action.new_price;
            quotes_in_doubt_[new_client_id] = pending;
            throw;
        }

        LOG_ERROR("[{}] cancel-replace of {} rejected: {}", pair_.toString(), action.order_id, e.what());
        if (action.side == OrderSide::BUY) {
            ledger_->release(new_client_id);
            if (old_record) {
                ledger_->restore(pair_, old_record->client_order_id, quote_asset,
                                 (old_record->quantity - old_record->executed_qty) * old_record->price,
                                 risk::BalanceLedger::ReservationState::IN_FLIGHT);
            }
        }
        // Either leg may have gone through; settle the old order from its real state
        auto old_state = gateway_->getOrder(pair_, action.order_id);
        if (old_state) {
            resolveQuote(*old_state);
        } else {
            dropQuote(action.order_id, "unknown to exchange");
        }
        throw;
    }

    if (old_record) {
        quotes_.erase(action.order_id);
    }
    LOG_INFO("[{}] requoted {} {} -> {} @ {}", pair_.toString(), orderSideToString(action.side),
             action.order_id, replacement.order_id, action.new_price);
    trackQuote(replacement, new_client_id, action.side, action.quantity, action.new_price);
}

// ===== Entries =====

void OrderExecutor::placeEntry(const strategy::PlaceAction& action, const strategy::TickContext& ctx) {
    const std::string client_id = nextClientOrderId();
    const double price = action.price ? *action.price : action.reference_price;
    const double amount = action.quantity * price;

    try {
        ledger_->reserve(pair_, client_id, pair_.quote(), amount, config_.percentage_of_balance);
    } catch (const InsufficientBalance& e) {
        LOG_WARN("[{}] entry skipped: {}", pair_.toString(), e.what());
        return;
    }

    risk::Position position;
    position.id = client_id;
    position.pair = pair_;
    position.side = OrderSide::BUY;
    position.state = risk::PositionState::PENDING;
    position.quantity = action.quantity;
    position.created_at = ctx.now;
    position.entry_client_id = client_id;
    position.reserved_amount = amount;
    tracker_.add(position);

    record(core::JournalEventType::ORDER_SUBMITTED, client_id, {
        {"purpose", "ENTRY"},
        {"position_id", client_id},
        {"side", "BUY"},
        {"type", orderTypeToString(action.type)},
        {"quantity", action.quantity},
        {"price", price},
        {"reserved_amount", amount},
        {"created_ms", toEpochMs(ctx.now)},
        {"reason", action.reason}
    });

    exchange::OrderRequest request;
    request.pair = pair_;
    request.side = OrderSide::BUY;
    request.type = action.type;
    request.quantity = action.quantity;
    request.price = action.price;
    request.client_order_id = client_id;

    LOG_INFO("[{}] entry {} {} qty={} ~{} ({})", pair_.toString(), orderTypeToString(action.type),
             client_id, action.quantity, price, action.reason);

    ExchangeOrder order;
    try {
        order = gateway_->placeOrder(request);
    } catch (const GatewayError& e) {
        if (e.uncertain()) {
            LOG_ERROR("[{}] entry {} outcome unknown ({}), confirming next tick",
                      pair_.toString(), client_id, e.what());
        } else {
            LOG_ERROR("[{}] entry {} rejected: {}", pair_.toString(), client_id, e.what());
            onEntryCancelled(client_id, std::string("rejected: ") + e.what());
        }
        throw;
    }

    tracker_.setEntryOrderId(client_id, order.order_id);
    applyEntryStatus(client_id, order, ctx.now);
}

void OrderExecutor::applyEntryStatus(const std::string& position_id, const ExchangeOrder& order, Timestamp now) {
    const auto state = OrderStateMapper::map(order);

    record(core::JournalEventType::ORDER_UPDATED, order.client_order_id, {
        {"order_id", order.order_id},
        {"status", order.exchange_status},
        {"executed_qty", order.executed_qty}
    });

    const bool filled = state.status == OrderStatus::FILLED;
    const bool ended_partial = state.terminal && !filled && state.filled_volume > kQtyEpsilon;
    if (!filled && !ended_partial) {
        if (state.terminal) {
            onEntryCancelled(position_id, std::string("exchange status ") + order.exchange_status);
        }
        return;
    }

    const double fill_price = state.average_price;
    const double quantity = state.filled_volume;
    if (!tracker_.fillEntry(position_id, fill_price, quantity,
                            config_.stop_loss_pct, config_.profit_target_pct, now)) {
        return;
    }

    const double spent = order.cumulative_quote_qty > 0.0 ? order.cumulative_quote_qty : fill_price * quantity;
    ledger_->commit(position_id, spent);

    auto position = tracker_.find(position_id);
    if (!position) {
        return;
    }

    LOG_INFO("[{}] position {} open: {} @ {} stop={} target={}", pair_.toString(), position_id,
             quantity, fill_price, position->stop_loss_price, position->profit_target_price);
    Logger::getInstance().logTrade(pair_.toString(), "BUY", fill_price, quantity, 0.0);

    record(core::JournalEventType::POSITION_OPENED, position_id, {
        {"entry_price", fill_price},
        {"quantity", quantity},
        {"stop_loss_price", position->stop_loss_price},
        {"profit_target_price", position->profit_target_price},
        {"entry_order_id", order.order_id},
        {"entry_time_ms", toEpochMs(now)},
        {"reserved_amount", spent}
    });
}

void OrderExecutor::onEntryCancelled(const std::string& position_id, const std::string& reason) {
    if (!tracker_.cancelEntry(position_id)) {
        return;
    }
    ledger_->release(position_id);
    LOG_INFO("[{}] position {} cancelled: {}", pair_.toString(), position_id, reason);
    record(core::JournalEventType::POSITION_CANCELLED, position_id, {{"reason", reason}});
}

// ===== Exits =====

void OrderExecutor::placeExit(const strategy::PlaceAction& action, const strategy::TickContext& ctx) {
    auto position = tracker_.find(action.position_id);
    if (!position || position->state != risk::PositionState::OPEN) {
        LOG_WARN("[{}] exit for {} ignored: position not open", pair_.toString(), action.position_id);
        return;
    }

    const std::string client_id = nextClientOrderId();
    if (!tracker_.requestExit(position->id, client_id, action.reason, ctx.now)) {
        return;
    }

    record(core::JournalEventType::POSITION_EXIT_REQUESTED, position->id, {
        {"exit_client_id", client_id},
        {"reason", action.reason},
        {"quantity", action.quantity}
    });

    exchange::OrderRequest request;
    request.pair = pair_;
    request.side = OrderSide::SELL;
    request.type = action.type;
    request.quantity = action.quantity;
    request.price = action.price;
    request.client_order_id = client_id;

    ExchangeOrder order;
    try {
        order = gateway_->placeOrder(request);
    } catch (const GatewayError& e) {
        if (e.uncertain()) {
            LOG_ERROR("[{}] exit {} outcome unknown ({}), confirming next tick",
                      pair_.toString(), client_id, e.what());
        } else {
            LOG_ERROR("[{}] exit {} rejected: {}", pair_.toString(), client_id, e.what());
            tracker_.failExit(position->id);
            record(core::JournalEventType::ORDER_UPDATED, client_id, {
                {"status", "REJECTED"},
                {"position_id", position->id},
                {"error", e.what()}
            });
        }
        throw;
    }

    tracker_.setExitOrderId(position->id, order.order_id);
    applyExitStatus(position->id, order);
}

void OrderExecutor::applyExitStatus(const std::string& position_id, const ExchangeOrder& order) {
    const auto state = OrderStateMapper::map(order);

    record(core::JournalEventType::ORDER_UPDATED, order.client_order_id, {
        {"order_id", order.order_id},
        {"status", order.exchange_status},
        {"executed_qty", order.executed_qty},
        {"position_id", position_id}
    });

    auto position = tracker_.find(position_id);
    if (!position) {
        return;
    }

    if (state.status == OrderStatus::FILLED) {
        const double exit_price = state.average_price;
        const double quantity = state.filled_volume;
        if (!tracker_.fillExit(position_id, exit_price)) {
            return;
        }
        const double pnl = (exit_price - position->entry_price) * quantity
                         - (position->entry_price + exit_price) * quantity * config_.trading_fee;
        realized_pnl_ += pnl;
        ledger_->release(position_id);

        LOG_INFO("[{}] position {} closed ({}): {} @ {} -> {}, pnl {:.8f}", pair_.toString(), position_id,
                 position->exit_reason, quantity, position->entry_price, exit_price, pnl);
        Logger::getInstance().logTrade(pair_.toString(), "SELL", exit_price, quantity, pnl);

        record(core::JournalEventType::POSITION_CLOSED, position_id, {
            {"exit_price", exit_price},
            {"quantity", quantity},
            {"pnl", pnl},
            {"reason", position->exit_reason}
        });
        return;
    }

    if (!state.terminal) {
        return;
    }

    // Exit ended without a full fill: keep monitoring what is left
    if (state.filled_volume > kQtyEpsilon) {
        const double exit_price = state.average_price;
        const double pnl = (exit_price - position->entry_price) * state.filled_volume
                         - (position->entry_price + exit_price) * state.filled_volume * config_.trading_fee;
        realized_pnl_ += pnl;
        tracker_.reduceQuantity(position_id, state.filled_volume);
        Logger::getInstance().logTrade(pair_.toString(), "SELL", exit_price, state.filled_volume, pnl);
        LOG_WARN("[{}] exit of {} partially filled ({} of {})", pair_.toString(), position_id,
                 state.filled_volume, position->quantity);
    }
    LOG_WARN("[{}] exit of {} ended {}, back to monitoring", pair_.toString(), position_id,
             order.exchange_status);
    tracker_.failExit(position_id);
}

void OrderExecutor::executeAction(const strategy::CloseDustAction& action, const strategy::TickContext& ctx) {
    auto position = tracker_.find(action.position_id);
    if (!position || position->state != risk::PositionState::OPEN) {
        LOG_WARN("[{}] dust close for {} ignored: position not open", pair_.toString(), action.position_id);
        return;
    }

    // Open -> ExitPending -> Closed with no order behind it
    if (!tracker_.requestExit(position->id, "", "DUST", ctx.now) ||
        !tracker_.fillExit(position->id, action.mark_price)) {
        return;
    }

    // Marked at the current price; only the entry fee was actually paid
    const double pnl = (action.mark_price - position->entry_price) * position->quantity
                     - position->entry_price * position->quantity * config_.trading_fee;
    realized_pnl_ += pnl;
    ledger_->release(position->id);

    LOG_WARN("[{}] position {} closed as dust: {} left in the wallet, marked @ {}, pnl {:.8f}",
             pair_.toString(), position->id, position->quantity, action.mark_price, pnl);

    record(core::JournalEventType::POSITION_CLOSED, position->id, {
        {"exit_price", action.mark_price},
        {"quantity", position->quantity},
        {"pnl", pnl},
        {"reason", "DUST"}
    });
}

// ===== Quotes =====

void OrderExecutor::placeQuote(const strategy::PlaceAction& action, const strategy::TickContext& ctx) {
    (void)ctx;
    const std::string client_id = nextClientOrderId();
    const double price = action.price ? *action.price : action.reference_price;

    if (action.side == OrderSide::BUY) {
        try {
            ledger_->reserve(pair_, client_id, pair_.quote(), action.quantity * price, 0.0);
        } catch (const InsufficientBalance& e) {
            LOG_WARN("[{}] bid quote skipped: {}", pair_.toString(), e.what());
            return;
        }
    }

    record(core::JournalEventType::ORDER_SUBMITTED, client_id, {
        {"purpose", "QUOTE"},
        {"side", orderSideToString(action.side)},
        {"quantity", action.quantity},
        {"price", price}
    });

    exchange::OrderRequest request;
    request.pair = pair_;
    request.side = action.side;
    request.type = OrderType::LIMIT;
    request.quantity = action.quantity;
    request.price = price;
    request.client_order_id = client_id;

    ExchangeOrder order;
    try {
        order = gateway_->placeOrder(request);
    } catch (const GatewayError& e) {
        if (e.uncertain()) {
            LOG_ERROR("[{}] quote {} outcome unknown ({}), confirming next tick",
                      pair_.toString(), client_id, e.what());
            QuoteRecord pending;
            pending.client_order_id = client_id;
            pending.side = action.side;
            pending.quantity = action.quantity;
            pending.price = price;
            quotes_in_doubt_[client_id] = pending;
        } else {
            LOG_ERROR("[{}] quote {} rejected: {}", pair_.toString(), client_id, e.what());
            ledger_->release(client_id);
        }
        throw;
    }

    LOG_INFO("[{}] quoted {} {} @ {} ({})", pair_.toString(), orderSideToString(action.side),
             action.quantity, price, order.order_id);
    trackQuote(order, client_id, action.side, action.quantity, price);
}

void OrderExecutor::trackQuote(const ExchangeOrder& order, const std::string& client_order_id,
                               OrderSide side, double quantity, double price) {
    QuoteRecord quote;
    quote.order_id = order.order_id;
    quote.client_order_id = client_order_id;
    quote.side = side;
    quote.quantity = quantity;
    quote.price = price;
    quotes_[order.order_id] = quote;

    // A crossing limit order can fill on arrival
    resolveQuote(order);
}

void OrderExecutor::resolveQuote(const ExchangeOrder& order) {
    auto it = quotes_.find(order.order_id);
    if (it == quotes_.end()) {
        return;
    }
    auto& quote = it->second;
    const auto state = OrderStateMapper::map(order);

    if (state.filled_volume > quote.executed_qty + kQtyEpsilon) {
        const double delta = state.filled_volume - quote.executed_qty;
        quote.executed_qty = state.filled_volume;
        LOG_INFO("[{}] quote {} {} filled {} @ {}", pair_.toString(), orderSideToString(quote.side),
                 quote.order_id, delta, quote.price);
        Logger::getInstance().logTrade(pair_.toString(), orderSideToString(quote.side),
                                       quote.price, delta, 0.0);
        record(core::JournalEventType::ORDER_UPDATED, quote.client_order_id, {
            {"order_id", quote.order_id},
            {"status", order.exchange_status},
            {"executed_qty", state.filled_volume}
        });
    }

    if (state.terminal) {
        dropQuote(order.order_id, order.exchange_status);
    }
}

void OrderExecutor::dropQuote(const std::string& order_id, const std::string& reason) {
    auto it = quotes_.find(order_id);
    if (it == quotes_.end()) {
        return;
    }
    if (it->second.side == OrderSide::BUY) {
        ledger_->release(it->second.client_order_id);
    }
    LOG_DEBUG("[{}] quote {} done ({})", pair_.toString(), order_id, reason);
    quotes_.erase(it);
}

void OrderExecutor::reconcileQuotes(const std::vector<ExchangeOrder>& open_orders) {
    // Placements whose outcome was unknown
    for (auto it = quotes_in_doubt_.begin(); it != quotes_in_doubt_.end();) {
        const QuoteRecord pending = it->second;
        auto found = gateway_->getOrderByClientId(pair_, pending.client_order_id);
        it = quotes_in_doubt_.erase(it);
        if (found) {
            LOG_INFO("[{}] quote {} confirmed on exchange as {}", pair_.toString(),
                     pending.client_order_id, found->order_id);
            trackQuote(*found, pending.client_order_id, pending.side, pending.quantity, pending.price);
        } else {
            LOG_INFO("[{}] quote {} never reached the exchange", pair_.toString(), pending.client_order_id);
            if (pending.side == OrderSide::BUY) {
                ledger_->release(pending.client_order_id);
            }
        }
    }

    std::set<std::string> open_ids;
    for (const auto& order : open_orders) {
        if (!strategy::isBotOrder(order)) {
            continue;
        }
        open_ids.insert(order.order_id);

        auto tracked = quotes_.find(order.order_id);
        if (tracked != quotes_.end()) {
            resolveQuote(order);
            continue;
        }

        // Left over from a previous run
        const double remaining = std::max(0.0, order.orig_qty - order.executed_qty);
        QuoteRecord adopted;
        adopted.order_id = order.order_id;
        adopted.client_order_id = order.client_order_id;
        adopted.side = order.side;
        adopted.quantity = order.orig_qty;
        adopted.price = order.price;
        adopted.executed_qty = order.executed_qty;
        quotes_[order.order_id] = adopted;
        if (order.side == OrderSide::BUY && !ledger_->hasReservation(order.client_order_id)) {
            ledger_->restore(pair_, order.client_order_id, pair_.quote(), remaining * order.price,
                             risk::BalanceLedger::ReservationState::IN_FLIGHT);
        }
        LOG_INFO("[{}] adopted open {} quote {} @ {}", pair_.toString(),
                 orderSideToString(order.side), order.order_id, order.price);
    }

    std::vector<std::string> vanished;
    for (const auto& [order_id, quote] : quotes_) {
        if (open_ids.count(order_id) == 0) {
            vanished.push_back(order_id);
        }
    }
    for (const auto& order_id : vanished) {
        auto final_state = gateway_->getOrder(pair_, order_id);
        if (final_state) {
            resolveQuote(*final_state);
        } else {
            dropQuote(order_id, "unknown to exchange");
        }
    }
}

void OrderExecutor::cancelAllQuotes() {
    std::vector<std::string> ids;
    for (const auto& [order_id, quote] : quotes_) {
        ids.push_back(order_id);
    }
    for (const auto& order_id : ids) {
        try {
            auto cancelled = gateway_->cancelOrder(pair_, order_id);
            resolveQuote(cancelled);
            LOG_INFO("[{}] quote {} cancelled on shutdown", pair_.toString(), order_id);
        } catch (const GatewayError& e) {
            LOG_ERROR("[{}] quote {} not cancelled on shutdown: {}", pair_.toString(), order_id, e.what());
        }
    }
    if (!quotes_in_doubt_.empty()) {
        LOG_WARN("[{}] {} quote placement(s) still unconfirmed at shutdown",
                 pair_.toString(), quotes_in_doubt_.size());
    }
}

// ===== Reconciliation of positions =====

void OrderExecutor::reconcilePositions(Timestamp now) {
    for (const auto& position : tracker_.active()) {
        if (position.state == risk::PositionState::PENDING) {
            reconcilePending(position, now);
        } else if (position.state == risk::PositionState::EXIT_PENDING) {
            reconcileExiting(position);
        }
    }
    tracker_.purgeTerminal();
}

void OrderExecutor::reconcilePending(const risk::Position& position, Timestamp now) {
    std::optional<ExchangeOrder> order;
    if (position.entry_order_id.empty()) {
        order = gateway_->getOrderByClientId(pair_, position.entry_client_id);
        if (!order) {
            onEntryCancelled(position.id, "entry never reached the exchange");
            return;
        }
        LOG_INFO("[{}] entry {} confirmed on exchange as {}", pair_.toString(),
                 position.entry_client_id, order->order_id);
        tracker_.setEntryOrderId(position.id, order->order_id);
    } else {
        order = gateway_->getOrder(pair_, position.entry_order_id);
        if (!order) {
            onEntryCancelled(position.id, "entry order unknown to exchange");
            return;
        }
    }

    applyEntryStatus(position.id, *order, now);

    auto current = tracker_.find(position.id);
    if (!current || current->state != risk::PositionState::PENDING) {
        return;
    }

    const auto timeout = std::chrono::seconds(
        static_cast<long long>(config_.trade_interval_seconds) * config_.entry_timeout_multiple);
    if (now - position.created_at <= timeout) {
        return;
    }

    LOG_INFO("[{}] entry {} unfilled after {}s, cancelling", pair_.toString(), position.id, timeout.count());
    try {
        auto cancelled = gateway_->cancelOrder(pair_, order->order_id);
        applyEntryStatus(position.id, cancelled, now);
    } catch (const GatewayError& e) {
        if (!e.isUnknownOrder()) {
            throw;
        }
        // Raced with a fill; the next poll reads the final state
        LOG_WARN("[{}] entry {} cancel raced: {}", pair_.toString(), position.id, e.what());
    }
}

void OrderExecutor::reconcileExiting(const risk::Position& position) {
    std::optional<ExchangeOrder> order;
    if (position.exit_order_id.empty()) {
        order = gateway_->getOrderByClientId(pair_, position.exit_client_id);
        if (!order) {
            LOG_WARN("[{}] exit {} never reached the exchange, back to monitoring",
                     pair_.toString(), position.exit_client_id);
            tracker_.failExit(position.id);
            record(core::JournalEventType::ORDER_UPDATED, position.exit_client_id, {
                {"status", "NOT_FOUND"},
                {"position_id", position.id}
            });
            return;
        }
        tracker_.setExitOrderId(position.id, order->order_id);
    } else {
        order = gateway_->getOrder(pair_, position.exit_order_id);
        if (!order) {
            tracker_.failExit(position.id);
            return;
        }
    }
    applyExitStatus(position.id, *order);
}

} // namespace execution
} // namespace spotbot
