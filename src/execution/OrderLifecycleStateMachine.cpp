#include "execution/OrderLifecycleStateMachine.h"

namespace cyclebt {
namespace execution {

OrderLifecycleTransitionResult OrderLifecycleStateMachine::transition(OrderStatus current,
                                                                      OrderEvent event) {
    OrderLifecycleTransitionResult result;
    result.status = current;

    if (isTerminal(current)) {
        result.accepted = false;
        result.terminal = true;
        return result;
    }

    switch (event) {
        case OrderEvent::FILL:
            result.status = OrderStatus::FILLED;
            break;
        case OrderEvent::CANCEL:
            result.status = OrderStatus::CANCELLED;
            break;
    }
    result.accepted = true;
    result.terminal = true;
    return result;
}

} // namespace execution
} // namespace cyclebt
