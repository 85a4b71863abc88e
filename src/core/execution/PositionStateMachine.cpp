#include "core/execution/PositionStateMachine.h"

namespace spotbot {
namespace core {
namespace execution {

const char* positionEventToString(PositionEvent event) {
    switch (event) {
        case PositionEvent::ENTRY_FILLED: return "ENTRY_FILLED";
        case PositionEvent::ENTRY_CANCELLED: return "ENTRY_CANCELLED";
        case PositionEvent::EXIT_REQUESTED: return "EXIT_REQUESTED";
        case PositionEvent::EXIT_FILLED: return "EXIT_FILLED";
        case PositionEvent::EXIT_FAILED: return "EXIT_FAILED";
    }
    return "UNKNOWN";
}

PositionTransitionResult PositionStateMachine::transition(risk::PositionState current, PositionEvent event) {
    using risk::PositionState;

    PositionTransitionResult result;
    result.state = current;

    switch (current) {
        case PositionState::PENDING:
            if (event == PositionEvent::ENTRY_FILLED) {
                result.state = PositionState::OPEN;
                result.accepted = true;
            } else if (event == PositionEvent::ENTRY_CANCELLED) {
                result.state = PositionState::CANCELLED;
                result.accepted = true;
            }
            break;
        case PositionState::OPEN:
            if (event == PositionEvent::EXIT_REQUESTED) {
                result.state = PositionState::EXIT_PENDING;
                result.accepted = true;
            }
            break;
        case PositionState::EXIT_PENDING:
            if (event == PositionEvent::EXIT_FILLED) {
                result.state = PositionState::CLOSED;
                result.accepted = true;
            } else if (event == PositionEvent::EXIT_FAILED) {
                result.state = PositionState::OPEN;
                result.accepted = true;
            }
            break;
        case PositionState::CLOSED:
        case PositionState::CANCELLED:
            break;
    }

    return result;
}

} // namespace execution
} // namespace core
} // namespace spotbot
