#pragma once

#include "strategy/IStrategy.h"
#include "analytics/MarketAnalyzer.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace tradeagent {
namespace strategy {

// 통합 신호 방향 (전략 어휘 LONG/SHORT 를 BUY/SELL 로 정규화)
enum class TradeAction {
    BUY,
    SELL,
    CLOSE,
    HOLD
};

std::string toString(TradeAction action);

struct CombinedSignal {
    std::string symbol;
    TradeAction action = TradeAction::HOLD;
    double confidence = 0.0;            // 0.0 ~ 1.0
    std::string reasoning;
    std::optional<double> entry_price;
    std::optional<double> stop_loss;
    std::optional<double> target_price;
    std::vector<StrategyOutput> strategy_outputs;
    int buy_votes = 0;
    int sell_votes = 0;
    int close_votes = 0;
    int hold_votes = 0;
    bool regime_discounted = false;
};

struct StrategyAgentConfig {
    int min_bars = 50;
    double high_volatility_pct = 3.0;
    double high_volatility_discount = 0.7;
    double min_scan_confidence = 0.3;
};

// Runs every registered strategy per symbol and fuses their votes.
class StrategyAgent {
public:
    StrategyAgent() = default;
    explicit StrategyAgent(const StrategyAgentConfig& config) : config_(config) {}

    void registerStrategy(std::shared_ptr<IStrategy> strategy);
    std::shared_ptr<IStrategy> getStrategy(const std::string& name) const;
    std::vector<std::shared_ptr<IStrategy>> getStrategies() const;
    void enableStrategy(const std::string& name, bool enabled);
    std::vector<std::string> getActiveStrategies() const;

    // 전략 출력 수집 (예외는 HOLD 표로 변환)
    std::vector<StrategyOutput> collectSignals(
        const std::string& symbol,
        const std::vector<Bar>& bars
    );

    // 투표 결과 병합 (순수 함수)
    CombinedSignal fuse(
        const std::string& symbol,
        const std::vector<StrategyOutput>& outputs,
        const analytics::MarketRegime* regime
    ) const;

    CombinedSignal generateCombinedSignal(
        const std::string& symbol,
        const std::vector<Bar>& bars,
        const analytics::MarketRegime* regime = nullptr
    );

    // BUY/SELL 이면서 confidence > 0.3 인 종목만, confidence 내림차순
    std::vector<CombinedSignal> scanUniverse(
        const std::map<std::string, std::vector<Bar>>& bars_by_symbol,
        const std::map<std::string, analytics::MarketRegime>& regimes
    );

private:
    StrategyAgentConfig config_;
    std::vector<std::shared_ptr<IStrategy>> strategies_;
    mutable std::mutex mutex_;
};

} // namespace strategy
} // namespace tradeagent
