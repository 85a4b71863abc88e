#pragma once

#include <map>
#include <memory>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IEventJournal.h"
#include "risk/Position.h"

namespace spotbot {
namespace core {

// Rebuilds the positions that were still live when the process stopped, so
// risk tracking resumes with the original stop/target prices.
class PositionRecovery {
public:
    explicit PositionRecovery(std::shared_ptr<IEventJournal> journal);

    // Pending, Open and ExitPending positions keyed by pair
    std::map<TradingPair, std::vector<risk::Position>> recover() const;

private:
    std::shared_ptr<IEventJournal> journal_;
};

} // namespace core
} // namespace spotbot
