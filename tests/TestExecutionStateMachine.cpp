#include "core/execution/OrderLifecycleStateMachine.h"

#include <cassert>
#include <iostream>

using tradeagent::OrderStatus;
using tradeagent::core::execution::OrderLifecycleStateMachine;

int main() {
    {
        auto r = OrderLifecycleStateMachine::transition("new", 10.0, 0.0);
        assert(r.status == OrderStatus::SUBMITTED);
        assert(!r.terminal);
        assert(r.filled_qty == 0.0);
    }

    {
        auto r = OrderLifecycleStateMachine::transition("accepted", 10.0);
        assert(r.status == OrderStatus::SUBMITTED);
        assert(!r.terminal);
    }

    {
        auto r = OrderLifecycleStateMachine::transition("pending_new", 10.0);
        assert(r.status == OrderStatus::PENDING);
        assert(!r.terminal);
    }

    {
        auto r = OrderLifecycleStateMachine::transition("partially_filled", 10.0, 4.0);
        assert(r.status == OrderStatus::PARTIALLY_FILLED);
        assert(!r.terminal);
        assert(r.filled_qty > 3.99 && r.filled_qty < 4.01);
    }

    {
        // 보고된 체결 수량이 주문 수량에 도달하면 완료로 본다
        auto r = OrderLifecycleStateMachine::transition("partially_filled", 10.0, 10.0);
        assert(r.status == OrderStatus::FILLED);
        assert(r.terminal);
    }

    {
        auto r = OrderLifecycleStateMachine::transition("FILLED", 10.0, 0.0);
        assert(r.status == OrderStatus::FILLED);
        assert(r.terminal);
        assert(r.filled_qty == 10.0);
    }

    {
        auto r = OrderLifecycleStateMachine::transition("canceled", 10.0, 0.0);
        assert(r.status == OrderStatus::CANCELLED);
        assert(r.terminal);
    }

    {
        auto r = OrderLifecycleStateMachine::transition("canceled", 10.0, 3.0);
        assert(r.status == OrderStatus::PARTIALLY_FILLED);
        assert(r.terminal);
        assert(r.filled_qty == 3.0);
    }

    {
        auto r = OrderLifecycleStateMachine::transition("expired", 10.0, 0.0);
        assert(r.status == OrderStatus::EXPIRED);
        assert(r.terminal);
    }

    {
        auto r = OrderLifecycleStateMachine::transition("rejected", 10.0, 0.0);
        assert(r.status == OrderStatus::REJECTED);
        assert(r.terminal);
    }

    assert(OrderLifecycleStateMachine::isTerminal(OrderStatus::FILLED));
    assert(OrderLifecycleStateMachine::isTerminal(OrderStatus::EXPIRED));
    assert(!OrderLifecycleStateMachine::isTerminal(OrderStatus::PARTIALLY_FILLED));
    assert(!OrderLifecycleStateMachine::isTerminal(OrderStatus::SUBMITTED));

    std::cout << "[TEST] ExecutionStateMachine PASSED\n";
    return 0;
}
