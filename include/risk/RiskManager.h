#pragma once

#include "risk/RiskConfig.h"
#include "strategy/StrategyAgent.h"
#include "core/model/TradingTypes.h"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tradeagent {
namespace risk {

// 포지션 사이징 결과
struct PositionSizing {
    int quantity;               // 정수 주식 수
    double position_value;
    double risk_per_share;
    double risk_amount;
    double risk_percent;        // 표시용 (x100)
    double position_percent;    // 표시용 (x100)
    bool capped;                // 포지션 비중 상한 적용 여부
    bool volatility_halved;     // 고변동성 절반 축소 여부
    bool approved;
    std::string reason;

    PositionSizing()
        : quantity(0), position_value(0), risk_per_share(0), risk_amount(0)
        , risk_percent(0), position_percent(0)
        , capped(false), volatility_halved(false), approved(false)
    {}
};

// 순서대로 검사 (첫 실패에서 중단)
struct TradeValidation {
    bool approved = false;
    std::string reason;
    std::vector<std::string> validations;
    PositionSizing sizing;
};

enum class ExitType { NONE, STOP_LOSS, SIGNAL };

std::string toString(ExitType type);

struct ExitDecision {
    bool should_exit = false;
    ExitType exit_type = ExitType::NONE;
    std::string reason;
};

struct RiskState {
    double portfolio_value = 0.0;
    double daily_pnl = 0.0;
    std::string trading_day;            // 마지막 일일 손익 리셋 날짜 (YYYY-MM-DD, UTC)
};

struct RiskSummary {
    double portfolio_value = 0.0;
    double daily_pnl = 0.0;
    double daily_loss_limit_amount = 0.0;
    double remaining_daily_risk = 0.0;
    int open_positions = 0;
    int max_positions = 0;
    double total_exposure = 0.0;
    double exposure_fraction = 0.0;
    double total_risk = 0.0;            // 손절가까지의 합산 손실 가능액
    bool circuit_breaker_active = false;
};

// Risk Manager - 포지션 사이징, 진입 검증, 청산 판단, 일일 손실 차단
class RiskManager {
public:
    explicit RiskManager(const RiskConfig& config);

    // ===== 포지션 사이징 =====
    PositionSizing calculatePositionSize(
        double entry_price,
        double stop_loss,
        double volatility_pct = 0.0
    ) const;

    // ===== 진입 검증 =====
    TradeValidation validateTrade(
        const strategy::CombinedSignal& signal,
        const std::vector<core::PositionRecord>& open_positions,
        double volatility_pct = 0.0
    ) const;

    // ===== 청산 판단 (순수 함수) =====
    ExitDecision checkExitConditions(
        const core::PositionRecord& position,
        double current_price,
        const std::optional<strategy::CombinedSignal>& signal = std::nullopt
    ) const;

    // 신호에 손절가가 없을 때 사용하는 기본 손절가
    double defaultStopLoss(double entry_price, strategy::TradeAction action) const;

    // ===== 리스크 상태 =====
    void updatePortfolioValue(double value);
    void updateDailyPnl(double realized_pnl);
    void resetDailyPnl();
    // 날짜가 바뀐 경우에만 리셋, 리셋했으면 true
    bool startTradingDay(const std::string& date);
    bool isDailyLossLimitExceeded() const;

    RiskState getState() const;
    RiskSummary getRiskSummary(const std::vector<core::PositionRecord>& positions) const;
    const RiskConfig& getConfig() const { return config_; }

    void setMaxPositions(int max_positions);
    void setDailyLossLimit(double fraction);

private:
    RiskConfig config_;
    RiskState state_;
    mutable std::recursive_mutex mutex_;
};

} // namespace risk
} // namespace tradeagent
