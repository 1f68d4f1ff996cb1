#pragma once

#include "common/Types.h"

namespace cyclebt {
namespace execution {

enum class OrderEvent {
    FILL,
    CANCEL
};

inline const char* orderEventToString(OrderEvent event) {
    return (event == OrderEvent::FILL) ? "fill" : "cancel";
}

struct OrderLifecycleTransitionResult {
    OrderStatus status = OrderStatus::PENDING;
    bool accepted = false;  // false when the order was already terminal
    bool terminal = false;
};

// PENDING -> FILLED | CANCELLED. Terminal orders never change again.
class OrderLifecycleStateMachine {
public:
    static OrderLifecycleTransitionResult transition(OrderStatus current, OrderEvent event);

    static bool isTerminal(OrderStatus status) {
        return status == OrderStatus::FILLED || status == OrderStatus::CANCELLED;
    }
};

} // namespace execution
} // namespace cyclebt
