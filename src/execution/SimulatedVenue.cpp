#include "execution/SimulatedVenue.h"
#include "common/Logger.h"
#include <stdexcept>

namespace tradeagent {
namespace execution {

SimulatedVenue::SimulatedVenue(double starting_cash)
    : next_order_seq_(1)
    , cash_(starting_cash)
{
}

core::OrderAck SimulatedVenue::placeOrder(const core::OrderRequest& request) {
    if (request.quantity <= 0.0) {
        throw std::runtime_error("Invalid order quantity for " + request.symbol);
    }
    const double price = request.limit_price ? *request.limit_price : request.reference_price;
    if (price <= 0.0) {
        throw std::runtime_error("No reference price for simulated order on " + request.symbol);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    core::OrderSnapshot snapshot;
    snapshot.order_id = "SIM-" + std::to_string(next_order_seq_++);
    snapshot.status = OrderStatus::FILLED;
    snapshot.filled_price = price;
    snapshot.filled_qty = request.quantity;
    snapshot.filled_at_ms = nowMs();
    snapshot.terminal = true;
    orders_[snapshot.order_id] = snapshot;

    LOG_INFO("[SIM] {} {} {} @ {:.2f} ({})", toString(request.side), request.quantity,
             request.symbol, price, snapshot.order_id);

    core::OrderAck ack;
    ack.order_id = snapshot.order_id;
    ack.status = OrderStatus::FILLED;
    ack.filled_price = price;
    ack.filled_qty = request.quantity;
    return ack;
}

core::OrderSnapshot SimulatedVenue::getOrder(const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        throw std::runtime_error("Unknown simulated order: " + order_id);
    }
    return it->second;
}

core::AccountSnapshot SimulatedVenue::getAccount() {
    std::lock_guard<std::mutex> lock(mutex_);
    core::AccountSnapshot account;
    account.cash = cash_;
    account.equity = cash_;
    account.buying_power = cash_;
    return account;
}

void SimulatedVenue::cancelAllOrders() {
    // 모의 주문은 모두 즉시 체결되므로 미체결 주문이 없음
    LOG_INFO("[SIM] cancel all orders: nothing pending");
}

} // namespace execution
} // namespace tradeagent
