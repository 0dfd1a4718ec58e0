#pragma once

#include <memory>
#include <string>
#include <vector>

#include "analytics/MarketAnalyzer.h"
#include "core/contracts/IMarketDataSource.h"
#include "core/contracts/IPositionStore.h"
#include "execution/ExecutionAgent.h"
#include "risk/RiskManager.h"
#include "strategy/StrategyAgent.h"

namespace tradeagent {
namespace core {

struct OrchestratorConfig {
    std::vector<std::string> universe;
    int lookback_days = 60;
    std::string strategy_tag = "multi_strategy";
};

// 루틴 1회 실행 결과 (예외는 errors 에 담기고 해당 루틴만 중단)
struct CycleReport {
    std::string routine;
    long long started_at_ms = 0;

    // trading cycle
    int symbols_fetched = 0;
    int opportunities = 0;
    int approved = 0;
    int executed = 0;
    int unconfirmed = 0;
    std::string market_sentiment;
    std::vector<std::string> rejected;      // "SYMBOL: reason"

    // position management
    int positions_checked = 0;
    int positions_closed = 0;
    double realized_pnl = 0.0;
    execution::ReconcileSummary reconcile;

    std::vector<std::string> errors;

    bool ok() const { return errors.empty(); }
};

class TradingOrchestrator {
public:
    TradingOrchestrator(
        const OrchestratorConfig& config,
        std::shared_ptr<IMarketDataSource> data_source,
        std::shared_ptr<analytics::MarketAnalyzer> analyzer,
        std::shared_ptr<strategy::StrategyAgent> strategy_agent,
        std::shared_ptr<risk::RiskManager> risk_manager,
        std::shared_ptr<execution::ExecutionAgent> execution_agent,
        std::shared_ptr<IPositionStore> store
    );

    // 데이터 -> 시장 분석 -> 유니버스 스캔 -> 리스크 검증 -> 주문
    CycleReport runTradingCycle();

    // 미확인 주문 재확인 후 보유 포지션 청산 조건 점검
    CycleReport managePositions();

    // 거래일이 바뀌었으면 일일 손익 초기화, 계좌 평가액 동기화
    CycleReport morningRoutine();

    // 성과/리스크 요약 로그, 미체결 주문 취소, 일별 성과 기록
    CycleReport endOfDayRoutine();

    // morning -> manage -> trade -> end of day
    std::vector<CycleReport> runOnce();

    static void logReport(const CycleReport& report);

private:
    OrchestratorConfig config_;
    std::shared_ptr<IMarketDataSource> data_source_;
    std::shared_ptr<analytics::MarketAnalyzer> analyzer_;
    std::shared_ptr<strategy::StrategyAgent> strategy_agent_;
    std::shared_ptr<risk::RiskManager> risk_manager_;
    std::shared_ptr<execution::ExecutionAgent> execution_agent_;
    std::shared_ptr<IPositionStore> store_;

    void executeOpportunity(
        const strategy::CombinedSignal& opportunity,
        const analytics::MarketOverview& overview,
        CycleReport& report
    );
    void recordExit(const execution::CloseResult& closed, CycleReport& report);
};

} // namespace core
} // namespace tradeagent
