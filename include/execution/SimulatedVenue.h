#pragma once

#include <cstdint>
#include <map>
#include <mutex>

#include "core/contracts/IExecutionVenue.h"

namespace tradeagent {
namespace execution {

// 모의 체결 - 주문 즉시 기준가로 전량 체결
class SimulatedVenue : public core::IExecutionVenue {
public:
    explicit SimulatedVenue(double starting_cash = 10000.0);

    core::OrderAck placeOrder(const core::OrderRequest& request) override;
    core::OrderSnapshot getOrder(const std::string& order_id) override;
    core::AccountSnapshot getAccount() override;
    void cancelAllOrders() override;
    bool isLive() const override { return false; }

private:
    std::mutex mutex_;
    std::map<std::string, core::OrderSnapshot> orders_;
    std::uint64_t next_order_seq_;
    double cash_;
};

} // namespace execution
} // namespace tradeagent
