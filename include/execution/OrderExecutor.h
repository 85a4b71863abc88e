#pragma once

#include "common/Types.h"
#include "core/contracts/IEventJournal.h"
#include "exchange/IExchangeGateway.h"
#include "execution/PositionTracker.h"
#include "risk/BalanceLedger.h"
#include "strategy/StrategyConfig.h"
#include "strategy/StrategyTypes.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace spotbot {
namespace execution {

// Live market-making quote placed by this bot
struct QuoteRecord {
    std::string order_id;
    std::string client_order_id;     // also the ledger reservation key for bids
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    double price = 0.0;
    double executed_qty = 0.0;
};

// Turns strategy actions into gateway calls for one pair and feeds the results
// back into the position tracker, the balance ledger and the journal.
//
// Placement is never blindly retried. When a placement outcome is unknown the
// position keeps its Pending/ExitPending state with the client order id, and
// the next reconcile looks the order up by that id before anything new is sent.
class OrderExecutor {
public:
    OrderExecutor(TradingPair pair,
                  std::shared_ptr<exchange::IExchangeGateway> gateway,
                  std::shared_ptr<risk::BalanceLedger> ledger,
                  std::shared_ptr<core::IEventJournal> journal,
                  strategy::StrategyConfig config,
                  PositionTracker& tracker);

    // Resolves in-doubt placements, polls pending entries/exits and cancels
    // entries that outlived interval * ENTRY_TIMEOUT_MULTIPLE.
    // Throws GatewayError; state already applied stays applied.
    void reconcilePositions(Timestamp now);

    // Resolves quotes that left the open-order list and adopts bot-owned
    // orders left by a previous run. Throws GatewayError.
    void reconcileQuotes(const std::vector<ExchangeOrder>& open_orders);

    // Submits actions in order. Stops at the first GatewayError and rethrows it
    // after recording the failure; sizing failures skip only that action.
    void execute(const std::vector<strategy::OrderAction>& actions, const strategy::TickContext& ctx);

    // Shutdown path: cancel every tracked quote, logging failures
    void cancelAllQuotes();

    size_t trackedQuoteCount() const { return quotes_.size(); }
    size_t inDoubtQuoteCount() const { return quotes_in_doubt_.size(); }
    double realizedPnl() const { return realized_pnl_; }

    void record(core::JournalEventType type, const std::string& entity_id, const nlohmann::json& payload);

private:
    TradingPair pair_;
    std::shared_ptr<exchange::IExchangeGateway> gateway_;
    std::shared_ptr<risk::BalanceLedger> ledger_;
    std::shared_ptr<core::IEventJournal> journal_;
    strategy::StrategyConfig config_;
    PositionTracker& tracker_;

    std::map<std::string, QuoteRecord> quotes_;           // by exchange order id
    std::map<std::string, QuoteRecord> quotes_in_doubt_;  // by client order id
    double realized_pnl_ = 0.0;

    void executeAction(const strategy::PlaceAction& action, const strategy::TickContext& ctx);
    void executeAction(const strategy::CancelAction& action, const strategy::TickContext& ctx);
    void executeAction(const strategy::ModifyAction& action, const strategy::TickContext& ctx);
    void executeAction(const strategy::CloseDustAction& action, const strategy::TickContext& ctx);

    void placeEntry(const strategy::PlaceAction& action, const strategy::TickContext& ctx);
    void placeExit(const strategy::PlaceAction& action, const strategy::TickContext& ctx);
    void placeQuote(const strategy::PlaceAction& action, const strategy::TickContext& ctx);

    void applyEntryStatus(const std::string& position_id, const ExchangeOrder& order, Timestamp now);
    void applyExitStatus(const std::string& position_id, const ExchangeOrder& order);
    void onEntryCancelled(const std::string& position_id, const std::string& reason);

    void trackQuote(const ExchangeOrder& order, const std::string& client_order_id,
                    OrderSide side, double quantity, double price);
    void resolveQuote(const ExchangeOrder& order);
    void dropQuote(const std::string& order_id, const std::string& reason);

    void reconcilePending(const risk::Position& position, Timestamp now);
    void reconcileExiting(const risk::Position& position);

    std::string nextClientOrderId() const;
};

} // namespace execution
} // namespace spotbot
