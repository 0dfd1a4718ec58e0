#include "execution/ExecutionAgent.h"
#include "execution/SimulatedVenue.h"
#include "core/state/InMemoryPositionStore.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace tradeagent;
using namespace tradeagent::execution;

namespace {

// 실주문 흉내: 접수 후 getOrder 로 지정한 상태를 돌려준다
class ScriptedLiveVenue : public core::IExecutionVenue {
public:
    OrderStatus next_status = OrderStatus::SUBMITTED;
    double fill_price = 0.0;
    bool fail_place = false;
    double partial_qty = 0.0;           // PARTIALLY_FILLED 일 때 체결 수량
    bool partial_terminal = false;      // 부분 체결 후 취소/만료
    int place_calls = 0;
    int get_calls = 0;
    std::vector<core::OrderRequest> placed;

    core::OrderAck placeOrder(const core::OrderRequest& request) override {
        place_calls++;
        if (fail_place) {
            throw std::runtime_error("broker unavailable");
        }
        last_qty_ = request.quantity;
        placed.push_back(request);
        core::OrderAck ack;
        ack.order_id = "LIVE-" + std::to_string(place_calls);
        ack.status = OrderStatus::SUBMITTED;
        return ack;
    }

    core::OrderSnapshot getOrder(const std::string& order_id) override {
        get_calls++;
        core::OrderSnapshot snapshot;
        snapshot.order_id = order_id;
        snapshot.status = next_status;
        snapshot.terminal = next_status == OrderStatus::FILLED ||
                            next_status == OrderStatus::CANCELLED ||
                            next_status == OrderStatus::REJECTED ||
                            next_status == OrderStatus::EXPIRED;
        if (next_status == OrderStatus::FILLED) {
            snapshot.filled_price = fill_price;
            snapshot.filled_qty = last_qty_;
        } else if (next_status == OrderStatus::PARTIALLY_FILLED) {
            snapshot.filled_price = fill_price;
            snapshot.filled_qty = partial_qty;
            snapshot.terminal = partial_terminal;
        }
        return snapshot;
    }

    core::AccountSnapshot getAccount() override { return core::AccountSnapshot(); }
    void cancelAllOrders() override { throw std::runtime_error("cancel failed"); }
    bool isLive() const override { return true; }

private:
    double last_qty_ = 0.0;
};

TradeRequest request(const std::string& symbol, OrderSide side, double qty, double price, double stop) {
    TradeRequest r;
    r.symbol = symbol;
    r.side = side;
    r.quantity = qty;
    r.price = price;
    r.stop_loss = stop;
    r.strategy = "multi_strategy";
    return r;
}

void testLongAndShortPnl() {
    auto store = std::make_shared<core::InMemoryPositionStore>();
    ExecutionAgent agent(std::make_shared<SimulatedVenue>(), store);

    auto buy = agent.executeTrade(request("AAPL", OrderSide::BUY, 10, 100.0, 98.0));
    assert(buy.success && !buy.unconfirmed);
    assert(buy.fill_price && std::abs(*buy.fill_price - 100.0) < 1e-9);
    auto pos = store->getPosition("AAPL");
    assert(pos && std::abs(pos->quantity - 10.0) < 1e-9);
    assert(std::abs(pos->stop_loss - 98.0) < 1e-9);

    auto sell = agent.executeTrade(request("TSLA", OrderSide::SELL, 5, 200.0, 204.0));
    assert(sell.success);
    auto short_pos = store->getPosition("TSLA");
    assert(short_pos && std::abs(short_pos->quantity + 5.0) < 1e-9);

    assert(agent.markToMarket("TSLA", 190.0));
    assert(std::abs(store->getPosition("TSLA")->unrealized_pnl - 50.0) < 1e-9);
    assert(!agent.markToMarket("NVDA", 10.0));

    auto long_close = agent.closePosition("AAPL", 110.0, "test");
    assert(long_close.success);
    assert(std::abs(long_close.pnl - 100.0) < 1e-9);
    assert(std::abs(long_close.pnl_percent - 10.0) < 1e-9);
    assert(long_close.trade_id == buy.trade_id);

    // 숏: (진입 - 청산) x 수량
    auto short_close = agent.closePosition("TSLA", 190.0, "test");
    assert(short_close.success);
    assert(std::abs(short_close.pnl - 50.0) < 1e-9);
    assert(std::abs(short_close.pnl_percent - 5.0) < 1e-9);

    assert(store->getOpenPositions().empty());
    assert(store->getOpenTrades().empty());

    auto summary = store->getPerformanceSummary();
    assert(summary.total_trades == 2);
    assert(summary.winning_trades == 2);
    assert(std::abs(summary.total_pnl - 150.0) < 1e-9);

    // 이미 청산된 종목
    auto again = agent.closePosition("AAPL", 110.0);
    assert(!again.success);
    assert(again.error.find("No open position") != std::string::npos);
}

void testCloseDefaultsToCurrentPrice() {
    auto store = std::make_shared<core::InMemoryPositionStore>();
    ExecutionAgent agent(std::make_shared<SimulatedVenue>(), store);

    agent.executeTrade(request("MSFT", OrderSide::BUY, 4, 300.0, 294.0));
    agent.markToMarket("MSFT", 290.0);
    auto closed = agent.closePosition("MSFT");
    assert(closed.success);
    assert(std::abs(closed.exit_price - 290.0) < 1e-9);
    assert(std::abs(closed.pnl + 40.0) < 1e-9);
}

void testInvalidAndFailedOrdersLeaveNoState() {
    auto store = std::make_shared<core::InMemoryPositionStore>();
    auto venue = std::make_shared<ScriptedLiveVenue>();
    venue->fail_place = true;
    ExecutionAgent agent(venue, store, nullptr, engine::FillPollPolicy(), [](int) {});

    auto zero = agent.executeTrade(request("AAPL", OrderSide::BUY, 0, 100.0, 98.0));
    assert(!zero.success);
    assert(venue->place_calls == 0);

    auto failed = agent.executeTrade(request("AAPL", OrderSide::BUY, 10, 100.0, 98.0));
    assert(!failed.success && !failed.unconfirmed);
    assert(failed.error.find("broker unavailable") != std::string::npos);
    assert(store->getOpenPositions().empty());
    assert(store->getTrades().empty());

    assert(!agent.cancelAllOrders());
}

void testLivePollingExhaustedThenReconciled() {
    auto store = std::make_shared<core::InMemoryPositionStore>();
    auto venue = std::make_shared<ScriptedLiveVenue>();

    engine::FillPollPolicy policy;
    policy.max_attempts = 3;
    policy.initial_delay_ms = 100;
    policy.backoff_multiplier = 2.0;
    policy.max_delay_ms = 150;

    std::vector<int> delays;
    ExecutionAgent agent(venue, store, nullptr, policy, [&](int ms) { delays.push_back(ms); });

    // 체결 확인 실패 -> UNCONFIRMED 거래, 포지션 없음
    auto result = agent.executeTrade(request("NVDA", OrderSide::BUY, 3, 500.0, 490.0));
    assert(!result.success);
    assert(result.unconfirmed);
    assert(venue->get_calls == 3);
    assert((delays == std::vector<int>{100, 150, 150}));
    assert(!store->getPosition("NVDA"));
    auto pending = agent.getUnconfirmedTrades();
    assert(pending.size() == 1);
    assert(pending[0].order_id == "LIVE-1");

    // 아직 미체결
    auto still = agent.reconcileUnconfirmed();
    assert(still.checked == 1 && still.pending == 1);

    // 다음 사이클에 체결 확인 -> OPEN + 포지션
    venue->next_status = OrderStatus::FILLED;
    venue->fill_price = 501.0;
    auto promoted = agent.reconcileUnconfirmed();
    assert(promoted.promoted == 1);
    auto pos = store->getPosition("NVDA");
    assert(pos && std::abs(pos->entry_price - 501.0) < 1e-9);
    assert(store->getTrade(result.trade_id)->status == core::TradeStatus::OPEN);
    assert(agent.getUnconfirmedTrades().empty());
}

void testReconcileCancelled() {
    auto store = std::make_shared<core::InMemoryPositionStore>();
    auto venue = std::make_shared<ScriptedLiveVenue>();
    engine::FillPollPolicy policy;
    policy.max_attempts = 1;
    ExecutionAgent agent(venue, store, nullptr, policy, [](int) {});

    auto result = agent.executeTrade(request("AMD", OrderSide::SELL, 2, 150.0, 153.0));
    assert(result.unconfirmed);

    venue->next_status = OrderStatus::CANCELLED;
    auto summary = agent.reconcileUnconfirmed();
    assert(summary.cancelled == 1);
    auto trade = store->getTrade(result.trade_id);
    assert(trade->status == core::TradeStatus::CLOSED);
    assert(!trade->pnl);
    assert(!store->getPosition("AMD"));
    assert(store->getPerformanceSummary().total_trades == 0);
}

void testLiveRejectedAndExitUnconfirmed() {
    auto store = std::make_shared<core::InMemoryPositionStore>();
    auto venue = std::make_shared<ScriptedLiveVenue>();
    engine::FillPollPolicy policy;
    policy.max_attempts = 2;
    ExecutionAgent agent(venue, store, nullptr, policy, [](int) {});

    venue->next_status = OrderStatus::REJECTED;
    auto rejected = agent.executeTrade(request("AAPL", OrderSide::BUY, 1, 100.0, 98.0));
    assert(!rejected.success && !rejected.unconfirmed);
    assert(store->getTrades().empty());

    venue->next_status = OrderStatus::FILLED;
    venue->fill_price = 100.0;
    auto opened = agent.executeTrade(request("AAPL", OrderSide::BUY, 1, 100.0, 98.0));
    assert(opened.success);

    // 청산 주문 미체결 -> 포지션 유지
    venue->next_status = OrderStatus::SUBMITTED;
    auto exit = agent.closePosition("AAPL", 105.0);
    assert(!exit.success);
    assert(exit.unconfirmed);
    assert(store->getPosition("AAPL"));
    assert(store->getOpenTrades().size() == 1);
}

void testPartialExitKeepsRemainder() {
    auto store = std::make_shared<core::InMemoryPositionStore>();
    auto venue = std::make_shared<ScriptedLiveVenue>();
    engine::FillPollPolicy policy;
    policy.max_attempts = 1;
    ExecutionAgent agent(venue, store, nullptr, policy, [](int) {});

    venue->next_status = OrderStatus::FILLED;
    venue->fill_price = 100.0;
    auto opened = agent.executeTrade(request("AAPL", OrderSide::BUY, 10, 100.0, 95.0));
    assert(opened.success);

    // 10주 중 4주만 체결된 뒤 취소
    venue->next_status = OrderStatus::PARTIALLY_FILLED;
    venue->partial_qty = 4;
    venue->partial_terminal = true;
    venue->fill_price = 110.0;
    auto exit = agent.closePosition("AAPL", 110.0, "stop");
    assert(exit.success);
    assert(exit.partial);
    assert(std::abs(exit.quantity - 4.0) < 1e-9);
    assert(std::abs(exit.remaining_quantity - 6.0) < 1e-9);
    assert(std::abs(exit.pnl - 40.0) < 1e-9);

    auto pos = store->getPosition("AAPL");
    assert(pos && std::abs(pos->quantity - 6.0) < 1e-9);
    assert(!pos->hasPendingExit());

    auto open_trades = store->getOpenTrades();
    assert(open_trades.size() == 1);
    assert(open_trades[0].id == opened.trade_id);
    assert(std::abs(open_trades[0].quantity - 6.0) < 1e-9);

    auto slice = store->getTrade(exit.trade_id);
    assert(slice && slice->status == core::TradeStatus::CLOSED);
    assert(std::abs(slice->quantity - 4.0) < 1e-9);
    assert(std::abs(*slice->pnl - 40.0) < 1e-9);

    // 잔량 청산
    venue->next_status = OrderStatus::FILLED;
    venue->fill_price = 105.0;
    auto rest = agent.closePosition("AAPL", 105.0, "stop");
    assert(rest.success && !rest.partial);
    assert(std::abs(venue->placed.back().quantity - 6.0) < 1e-9);
    assert(std::abs(rest.pnl - 30.0) < 1e-9);
    assert(!store->getPosition("AAPL"));
    assert(store->getOpenTrades().empty());
    assert(std::abs(store->getPerformanceSummary().total_pnl - 70.0) < 1e-9);
}

void testPendingExitReconciled() {
    auto store = std::make_shared<core::InMemoryPositionStore>();
    auto venue = std::make_shared<ScriptedLiveVenue>();
    engine::FillPollPolicy policy;
    policy.max_attempts = 1;
    ExecutionAgent agent(venue, store, nullptr, policy, [](int) {});

    venue->next_status = OrderStatus::FILLED;
    venue->fill_price = 100.0;
    assert(agent.executeTrade(request("AAPL", OrderSide::BUY, 10, 100.0, 95.0)).success);

    venue->next_status = OrderStatus::SUBMITTED;
    auto exit = agent.closePosition("AAPL", 94.0, "stop");
    assert(exit.unconfirmed);
    assert(store->getPosition("AAPL")->pending_exit_order_id == exit.order_id);

    // 대기 중인 청산이 있으면 재주문하지 않음
    const int placed_before = venue->place_calls;
    auto again = agent.closePosition("AAPL", 94.0, "stop");
    assert(!again.success && again.unconfirmed);
    assert(venue->place_calls == placed_before);

    auto still = agent.reconcileUnconfirmed();
    assert(still.pending == 1);
    assert(still.exits.empty());

    // 미체결 취소 -> 대기 해제, 포지션 유지
    venue->next_status = OrderStatus::CANCELLED;
    auto cancelled = agent.reconcileUnconfirmed();
    assert(cancelled.cancelled == 1);
    assert(store->getPosition("AAPL") && !store->getPosition("AAPL")->hasPendingExit());

    // 새 청산 주문이 나중에 체결
    venue->next_status = OrderStatus::SUBMITTED;
    auto retry = agent.closePosition("AAPL", 94.0, "stop");
    assert(retry.unconfirmed);
    venue->next_status = OrderStatus::FILLED;
    venue->fill_price = 94.0;
    auto filled = agent.reconcileUnconfirmed();
    assert(filled.exits.size() == 1);
    assert(filled.exits[0].success);
    assert(filled.exits[0].reason == "stop");
    assert(std::abs(filled.exits[0].pnl + 60.0) < 1e-9);
    assert(!store->getPosition("AAPL"));
    assert(store->getOpenTrades().empty());

    int sells = 0;
    for (const auto& order : venue->placed) {
        if (order.side == OrderSide::SELL) {
            sells++;
        }
    }
    assert(sells == 2);
}

} // namespace

int main() {
    std::cout << "[TEST] Starting ExecutionAgent Test..." << std::endl;

    testLongAndShortPnl();
    testCloseDefaultsToCurrentPrice();
    testInvalidAndFailedOrdersLeaveNoState();
    testLivePollingExhaustedThenReconciled();
    testReconcileCancelled();
    testLiveRejectedAndExitUnconfirmed();
    testPartialExitKeepsRemainder();
    testPendingExitReconciled();

    std::cout << "[TEST] ExecutionAgent PASSED\n";
    return 0;
}
