#pragma once

#include <string>

#include "core/model/TradingTypes.h"

namespace tradeagent {
namespace core {

// Brokerage venue. Implementations throw std::runtime_error on transport or API failure.
class IExecutionVenue {
public:
    virtual ~IExecutionVenue() = default;

    virtual OrderAck placeOrder(const OrderRequest& request) = 0;
    virtual OrderSnapshot getOrder(const std::string& order_id) = 0;
    virtual AccountSnapshot getAccount() = 0;
    virtual void cancelAllOrders() = 0;

    // false: fills are immediate and confirmed in the placeOrder ack
    virtual bool isLive() const = 0;
};

} // namespace core
} // namespace tradeagent
