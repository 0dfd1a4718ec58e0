#pragma once

#include <string>

#include "common/Types.h"

namespace tradeagent {
namespace core {
namespace execution {

struct OrderLifecycleTransitionResult {
    OrderStatus status = OrderStatus::SUBMITTED;
    double filled_qty = 0.0;
    bool terminal = false;
};

// Maps a venue order status string plus fill quantities to the internal lifecycle state.
class OrderLifecycleStateMachine {
public:
    static OrderLifecycleTransitionResult transition(
        const std::string& venue_status,
        double order_qty,
        double filled_qty = 0.0
    );

    static bool isTerminal(OrderStatus status);
};

} // namespace execution
} // namespace core
} // namespace tradeagent
