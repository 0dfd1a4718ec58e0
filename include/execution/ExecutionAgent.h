#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/contracts/IEventJournal.h"
#include "core/contracts/IExecutionVenue.h"
#include "core/contracts/IPositionStore.h"
#include "engine/EngineConfig.h"

namespace tradeagent {
namespace execution {

struct TradeRequest {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    double price = 0.0;             // 기준가 (모의 체결가)
    double stop_loss = 0.0;
    std::string strategy;
};

struct ExecutionResult {
    bool success = false;
    bool unconfirmed = false;       // 주문은 접수됐지만 폴링 한도 내 체결 미확인
    std::string error;
    std::string order_id;
    std::string trade_id;
    std::optional<double> fill_price;
    double quantity = 0.0;
};

struct CloseResult {
    bool success = false;
    bool unconfirmed = false;
    bool partial = false;           // 일부 수량만 체결, 나머지 포지션 유지
    std::string error;
    std::string symbol;
    std::string order_id;
    std::string trade_id;
    std::string reason;
    double exit_price = 0.0;
    double quantity = 0.0;          // 실제 체결된 청산 수량
    double remaining_quantity = 0.0;
    double pnl = 0.0;
    double pnl_percent = 0.0;
};

struct ReconcileSummary {
    int checked = 0;
    int promoted = 0;       // 체결 확인 -> OPEN
    int cancelled = 0;      // 미체결 종료 -> CLOSED (not filled)
    int pending = 0;
    std::vector<CloseResult> exits;     // 대기 중이던 청산 주문의 체결 결과
};

// Execution Agent - 주문 제출, 체결 확인, 포지션/거래 기록
// 체결이 확인된 뒤에만 Position/Trade 를 기록한다.
class ExecutionAgent {
public:
    using Sleeper = std::function<void(int delay_ms)>;

    ExecutionAgent(
        std::shared_ptr<core::IExecutionVenue> venue,
        std::shared_ptr<core::IPositionStore> store,
        std::shared_ptr<core::IEventJournal> journal = nullptr,
        const engine::FillPollPolicy& poll_policy = engine::FillPollPolicy(),
        Sleeper sleeper = nullptr
    );

    ExecutionResult executeTrade(const TradeRequest& request);

    CloseResult closePosition(
        const std::string& symbol,
        std::optional<double> price = std::nullopt,
        const std::string& reason = "manual"
    );

    ReconcileSummary reconcileUnconfirmed();

    bool markToMarket(const std::string& symbol, double price);

    core::AccountSnapshot getAccount();
    std::vector<core::PositionRecord> getPositions() const;
    // 보유 포지션 + 체결 대기 중인 진입 주문 (포지션 수 한도 계산용)
    std::vector<core::PositionRecord> getCommittedPositions() const;
    std::vector<core::TradeRecord> getUnconfirmedTrades() const;
    bool cancelAllOrders();

    bool isLive() const { return venue_->isLive(); }

private:
    std::shared_ptr<core::IExecutionVenue> venue_;
    std::shared_ptr<core::IPositionStore> store_;
    std::shared_ptr<core::IEventJournal> journal_;
    engine::FillPollPolicy poll_policy_;
    Sleeper sleeper_;

    // 제출 직후 체결 확인 (모의 체결은 ack 로 즉시 확정)
    core::OrderSnapshot confirmFill(const core::OrderAck& ack);
    core::OrderSnapshot pollOrder(const std::string& order_id);

    void openPosition(const core::TradeRecord& trade);
    // 체결된 청산 수량만큼 거래/포지션 정리 (부분 체결이면 잔량 유지)
    CloseResult settleExit(
        const core::PositionRecord& position,
        const core::OrderSnapshot& snapshot,
        double reference_price,
        const std::string& reason
    );
    void journal(core::JournalEventType type, const std::string& symbol,
                 const std::string& entity_id, const nlohmann::json& payload);
};

} // namespace execution
} // namespace tradeagent
