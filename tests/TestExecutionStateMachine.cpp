#include "execution/OrderLifecycleStateMachine.h"

#include <cassert>
#include <iostream>

using cyclebt::OrderStatus;
using cyclebt::execution::OrderEvent;
using cyclebt::execution::OrderLifecycleStateMachine;

int main() {
    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::PENDING, OrderEvent::FILL);
        assert(r.accepted);
        assert(r.status == OrderStatus::FILLED);
        assert(r.terminal);
    }

    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::PENDING, OrderEvent::CANCEL);
        assert(r.accepted);
        assert(r.status == OrderStatus::CANCELLED);
        assert(r.terminal);
    }

    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::FILLED, OrderEvent::CANCEL);
        assert(!r.accepted);
        assert(r.status == OrderStatus::FILLED);
        assert(r.terminal);
    }

    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::CANCELLED, OrderEvent::FILL);
        assert(!r.accepted);
        assert(r.status == OrderStatus::CANCELLED);
    }

    {
        auto r = OrderLifecycleStateMachine::transition(OrderStatus::CANCELLED, OrderEvent::CANCEL);
        assert(!r.accepted);
        assert(r.status == OrderStatus::CANCELLED);
    }

    assert(!OrderLifecycleStateMachine::isTerminal(OrderStatus::PENDING));
    assert(OrderLifecycleStateMachine::isTerminal(OrderStatus::FILLED));

    std::cout << "[TEST] ExecutionStateMachine PASSED\n";
    return 0;
}
