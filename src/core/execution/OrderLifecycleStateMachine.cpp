#include "core/execution/OrderLifecycleStateMachine.h"

#include <algorithm>
#include <cctype>

namespace tradeagent {
namespace core {
namespace execution {

namespace {
std::string normalizeStatus(std::string status) {
    std::transform(status.begin(), status.end(), status.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return status;
}
} // namespace

bool OrderLifecycleStateMachine::isTerminal(OrderStatus status) {
    return status == OrderStatus::FILLED ||
           status == OrderStatus::CANCELLED ||
           status == OrderStatus::REJECTED ||
           status == OrderStatus::EXPIRED;
}

OrderLifecycleTransitionResult OrderLifecycleStateMachine::transition(
    const std::string& venue_status,
    double order_qty,
    double filled_qty
) {
    OrderLifecycleTransitionResult result;
    result.filled_qty = std::max(0.0, filled_qty);

    const std::string status = normalizeStatus(venue_status);

    if (status == "filled") {
        result.status = OrderStatus::FILLED;
        result.filled_qty = (result.filled_qty > 0.0) ? result.filled_qty : order_qty;
        result.terminal = true;
        return result;
    }

    if (status == "canceled" || status == "cancelled" || status == "done_for_day") {
        // a partially filled order that was cancelled still leaves the fill behind
        result.status = (result.filled_qty > 0.0) ? OrderStatus::PARTIALLY_FILLED : OrderStatus::CANCELLED;
        result.terminal = true;
        return result;
    }

    if (status == "expired") {
        result.status = (result.filled_qty > 0.0) ? OrderStatus::PARTIALLY_FILLED : OrderStatus::EXPIRED;
        result.terminal = true;
        return result;
    }

    if (status == "rejected" || status == "suspended" || status == "stopped") {
        result.status = OrderStatus::REJECTED;
        result.terminal = true;
        return result;
    }

    if (status == "partially_filled") {
        if (order_qty > 0.0 && result.filled_qty >= order_qty - 1e-8) {
            result.status = OrderStatus::FILLED;
            result.terminal = true;
        } else {
            result.status = OrderStatus::PARTIALLY_FILLED;
        }
        return result;
    }

    if (status == "pending_new") {
        result.status = OrderStatus::PENDING;
        return result;
    }

    // new, accepted, pending_cancel, pending_replace, replaced, calculated ...
    result.status = (result.filled_qty > 0.0) ? OrderStatus::PARTIALLY_FILLED : OrderStatus::SUBMITTED;
    return result;
}

} // namespace execution
} // namespace core
} // namespace tradeagent
