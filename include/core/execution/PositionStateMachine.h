#pragma once

#include "risk/Position.h"

namespace spotbot {
namespace core {
namespace execution {

enum class PositionEvent {
    ENTRY_FILLED,       // Pending -> Open
    ENTRY_CANCELLED,    // Pending -> Cancelled (cancelled, expired, rejected, timed out)
    EXIT_REQUESTED,     // Open -> ExitPending
    EXIT_FILLED,        // ExitPending -> Closed
    EXIT_FAILED         // ExitPending -> Open (exit cancelled/rejected without fill)
};

const char* positionEventToString(PositionEvent event);

struct PositionTransitionResult {
    risk::PositionState state = risk::PositionState::PENDING;
    bool accepted = false;
};

// Transition table for one position. Terminal states accept nothing.
class PositionStateMachine {
public:
    static PositionTransitionResult transition(risk::PositionState current, PositionEvent event);
};

} // namespace execution
} // namespace core
} // namespace spotbot
