#include "core/orchestration/TradingOrchestrator.h"
#include "core/state/InMemoryPositionStore.h"
#include "execution/SimulatedVenue.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tradeagent;
using namespace tradeagent::core;

namespace {

class FakeDataSource : public IMarketDataSource {
public:
    std::map<std::string, std::vector<Bar>> bars;
    std::map<std::string, double> latest;
    bool fail = false;

    std::map<std::string, std::vector<Bar>> getBars(const std::vector<std::string>& symbols, int) override {
        if (fail) {
            throw std::runtime_error("data feed down");
        }
        std::map<std::string, std::vector<Bar>> out;
        for (const auto& symbol : symbols) {
            auto it = bars.find(symbol);
            if (it != bars.end()) {
                out[symbol] = it->second;
            }
        }
        return out;
    }

    std::optional<double> getLatestPrice(const std::string& symbol) override {
        auto it = latest.find(symbol);
        if (it == latest.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

// AAPL 에만 LONG 을 내는 고정 전략
class AaplLongStrategy : public strategy::IStrategy {
public:
    strategy::StrategyInfo getInfo() const override {
        strategy::StrategyInfo info;
        info.name = "aapl_long";
        return info;
    }
    strategy::StrategyOutput generateSignal(const std::string& symbol, const std::vector<Bar>& bars) override {
        if (symbol != "AAPL") {
            return strategy::StrategyOutput::hold("aapl_long", "not AAPL");
        }
        strategy::StrategyOutput out;
        out.strategy_name = "aapl_long";
        out.action = strategy::Action::LONG;
        out.strength = 0.9;
        out.entry_price = bars.back().close;
        out.stop_loss = 245.0;
        out.reason = "scripted";
        return out;
    }
    void setEnabled(bool) override {}
    bool isEnabled() const override { return true; }
};

class PendingLiveVenue : public IExecutionVenue {
public:
    OrderAck placeOrder(const OrderRequest&) override {
        OrderAck ack;
        ack.order_id = "LIVE-" + std::to_string(++count_);
        return ack;
    }
    OrderSnapshot getOrder(const std::string& order_id) override {
        OrderSnapshot snapshot;
        snapshot.order_id = order_id;
        snapshot.status = OrderStatus::SUBMITTED;
        return snapshot;
    }
    AccountSnapshot getAccount() override { return AccountSnapshot(); }
    void cancelAllOrders() override {}
    bool isLive() const override { return true; }

private:
    int count_ = 0;
};

// 상태를 바꿔가며 체결/미체결을 흉내내는 실주문 venue
class SwitchableLiveVenue : public IExecutionVenue {
public:
    OrderStatus status = OrderStatus::FILLED;
    double fill_price = 250.0;
    std::vector<OrderRequest> orders;

    OrderAck placeOrder(const OrderRequest& request) override {
        orders.push_back(request);
        OrderAck ack;
        ack.order_id = "LIVE-" + std::to_string(orders.size());
        return ack;
    }
    OrderSnapshot getOrder(const std::string& order_id) override {
        OrderSnapshot snapshot;
        snapshot.order_id = order_id;
        snapshot.status = status;
        snapshot.terminal = status == OrderStatus::FILLED;
        if (status == OrderStatus::FILLED) {
            const size_t index = std::stoul(order_id.substr(5)) - 1;
            snapshot.filled_price = fill_price;
            snapshot.filled_qty = orders[index].quantity;
        }
        return snapshot;
    }
    AccountSnapshot getAccount() override { return AccountSnapshot(); }
    void cancelAllOrders() override {}
    bool isLive() const override { return true; }
};

std::vector<Bar> flatBars(double price, int count) {
    std::vector<Bar> bars;
    for (int i = 0; i < count; ++i) {
        bars.emplace_back(price, price, price, price, 1000000.0, 1704067200000LL + i * 86400000LL);
    }
    return bars;
}

struct Harness {
    std::shared_ptr<FakeDataSource> data = std::make_shared<FakeDataSource>();
    std::shared_ptr<InMemoryPositionStore> store = std::make_shared<InMemoryPositionStore>();
    std::shared_ptr<risk::RiskManager> risk = std::make_shared<risk::RiskManager>(risk::RiskConfig{});
    std::shared_ptr<execution::ExecutionAgent> execution;
    std::unique_ptr<TradingOrchestrator> orchestrator;

    explicit Harness(std::shared_ptr<IExecutionVenue> venue) {
        data->bars["AAPL"] = flatBars(250.0, 60);
        data->bars["MSFT"] = flatBars(300.0, 60);

        engine::FillPollPolicy policy;
        policy.max_attempts = 1;
        execution = std::make_shared<execution::ExecutionAgent>(venue, store, nullptr, policy, [](int) {});

        auto agent = std::make_shared<strategy::StrategyAgent>();
        agent->registerStrategy(std::make_shared<AaplLongStrategy>());

        OrchestratorConfig config;
        config.universe = {"AAPL", "MSFT", "NVDA"};
        orchestrator = std::make_unique<TradingOrchestrator>(
            config, data, std::make_shared<analytics::MarketAnalyzer>(), agent, risk, execution, store);
    }
};

void testTradeThenStopOut() {
    Harness h(std::make_shared<execution::SimulatedVenue>());

    auto first = h.orchestrator->runTradingCycle();
    assert(first.ok());
    assert(first.symbols_fetched == 2);
    assert(first.opportunities == 1);
    assert(first.approved == 1);
    assert(first.executed == 1);
    auto position = h.store->getPosition("AAPL");
    assert(position && std::abs(position->quantity - 8.0) < 1e-9);

    // 같은 종목 재진입 거부
    auto second = h.orchestrator->runTradingCycle();
    assert(second.executed == 0);
    assert(second.rejected.size() == 1);
    assert(second.rejected[0].find("already open") != std::string::npos);

    // 손절가 아래로 하락 -> 청산
    h.data->latest["AAPL"] = 240.0;
    auto manage = h.orchestrator->managePositions();
    assert(manage.ok());
    assert(manage.positions_checked == 1);
    assert(manage.positions_closed == 1);
    assert(std::abs(manage.realized_pnl + 80.0) < 1e-9);
    assert(std::abs(h.risk->getState().daily_pnl + 80.0) < 1e-9);
    assert(!h.store->getPosition("AAPL"));

    auto eod = h.orchestrator->endOfDayRoutine();
    assert(eod.ok());
    auto days = h.store->getDailyPerformance();
    assert(days.size() == 1);
    assert(days[0].trades_closed == 1);
    assert(std::abs(days[0].daily_pnl + 80.0) < 1e-9);

    auto morning = h.orchestrator->morningRoutine();
    assert(morning.ok());
    assert(h.risk->getState().daily_pnl == 0.0);
    assert(std::abs(h.risk->getState().portfolio_value - 10000.0) < 1e-9);
}

void testDataFailureIsReported() {
    Harness h(std::make_shared<execution::SimulatedVenue>());
    h.data->fail = true;

    auto report = h.orchestrator->runTradingCycle();
    assert(!report.ok());
    assert(report.errors[0].find("data feed down") != std::string::npos);
    assert(h.store->getOpenPositions().empty());

    h.data->fail = false;
    h.data->bars.clear();
    auto empty = h.orchestrator->runTradingCycle();
    assert(!empty.ok());
    assert(empty.symbols_fetched == 0);
}

void testUnconfirmedOrderBlocksReentry() {
    Harness h(std::make_shared<PendingLiveVenue>());

    auto first = h.orchestrator->runTradingCycle();
    assert(first.unconfirmed == 1);
    assert(first.executed == 0);
    assert(h.store->getOpenPositions().empty());

    auto second = h.orchestrator->runTradingCycle();
    assert(second.approved == 0);
    assert(second.rejected.size() == 1);
    assert(second.rejected[0].find("Unconfirmed") != std::string::npos);

    auto manage = h.orchestrator->managePositions();
    assert(manage.reconcile.checked == 1);
    assert(manage.reconcile.pending == 1);

    auto reports = h.orchestrator->runOnce();
    assert(reports.size() == 4);
    assert(reports[0].routine == "morning");
    assert(reports[3].routine == "eod");
}

void testPendingExitIsNotResubmitted() {
    auto venue = std::make_shared<SwitchableLiveVenue>();
    Harness h(venue);

    auto entry = h.orchestrator->runTradingCycle();
    assert(entry.executed == 1);
    assert(venue->orders.size() == 1);

    // 청산 주문 접수, 체결 미확인
    venue->status = OrderStatus::SUBMITTED;
    h.data->latest["AAPL"] = 240.0;
    auto first = h.orchestrator->managePositions();
    assert(!first.ok());
    assert(venue->orders.size() == 2);
    auto position = h.store->getPosition("AAPL");
    assert(position && position->pending_exit_order_id == "LIVE-2");

    // 대기 중에는 새 청산 주문을 내지 않는다
    auto second = h.orchestrator->managePositions();
    assert(second.ok());
    assert(second.reconcile.pending == 1);
    assert(second.positions_checked == 1);
    assert(second.positions_closed == 0);
    assert(venue->orders.size() == 2);

    // 다음 사이클에 체결 확인 -> 청산 확정, 일일 손익 반영
    venue->status = OrderStatus::FILLED;
    venue->fill_price = 240.0;
    auto third = h.orchestrator->managePositions();
    assert(third.ok());
    assert(third.reconcile.exits.size() == 1);
    assert(third.positions_closed == 1);
    assert(std::abs(third.realized_pnl + 80.0) < 1e-9);
    assert(std::abs(h.risk->getState().daily_pnl + 80.0) < 1e-9);
    assert(!h.store->getPosition("AAPL"));
    assert(venue->orders.size() == 2);
    assert(venue->orders[1].side == OrderSide::SELL);
}

void testPendingEntriesCountTowardMaxPositions() {
    Harness h(std::make_shared<execution::SimulatedVenue>());
    h.risk->setMaxPositions(1);

    TradeRecord pending;
    pending.symbol = "MSFT";
    pending.side = OrderSide::BUY;
    pending.quantity = 5;
    pending.entry_price = 300.0;
    pending.status = TradeStatus::UNCONFIRMED;
    pending.order_id = "LIVE-9";
    h.store->logTrade(pending);

    auto report = h.orchestrator->runTradingCycle();
    assert(report.approved == 0);
    assert(report.executed == 0);
    assert(report.rejected.size() == 1);
    assert(report.rejected[0].find("Max positions reached (1/1)") != std::string::npos);
    assert(!h.store->getPosition("AAPL"));
}

void testSameDayRunKeepsDailyLoss() {
    Harness h(std::make_shared<execution::SimulatedVenue>());

    assert(h.orchestrator->morningRoutine().ok());
    h.risk->updateDailyPnl(-600.0);

    // 같은 날 다시 실행해도 일일 손실 차단 유지
    auto reports = h.orchestrator->runOnce();
    assert(std::abs(h.risk->getState().daily_pnl + 600.0) < 1e-9);
    const auto& trade = reports[2];
    assert(trade.routine == "trade");
    assert(trade.executed == 0);
    assert(trade.rejected.size() == 1);
    assert(trade.rejected[0].find("Daily loss limit") != std::string::npos);
    assert(!h.store->getPosition("AAPL"));
}

} // namespace

int main() {
    std::cout << "[TEST] Starting Orchestrator Test..." << std::endl;

    testTradeThenStopOut();
    testDataFailureIsReported();
    testUnconfirmedOrderBlocksReentry();
    testPendingExitIsNotResubmitted();
    testPendingEntriesCountTowardMaxPositions();
    testSameDayRunKeepsDailyLoss();

    std::cout << "[TEST] Orchestrator PASSED\n";
    return 0;
}
