#pragma once

#include <string>
#include <vector>
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "strategy/IStrategy.h"

namespace tradeagent {
namespace backtest {

struct BacktestTrade {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    int quantity = 0;
    size_t entry_index = 0;
    size_t exit_index = 0;
    long long entry_timestamp = 0;
    long long exit_timestamp = 0;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double stop_loss = 0.0;
    double pnl = 0.0;
    double pnl_percent = 0.0;
    std::string exit_reason;        // close_signal, opposite_signal, stop_loss, end_of_data
};

struct BacktestResult {
    std::string strategy_name;
    std::string symbol;
    size_t bars_processed = 0;
    std::vector<BacktestTrade> trades;
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;              // 0..1
    double total_return = 0.0;
    double total_return_percent = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double profit_factor = 0.0;
    double max_drawdown = 0.0;          // 0..1
    double initial_capital = 0.0;
    double final_capital = 0.0;
};

// 단일 전략 워크포워드 재생 (i 번째 단계는 bars[0..i] 만 참조, 동시 포지션 최대 1개)
class Backtester {
public:
    explicit Backtester(const engine::BacktestSettings& settings = engine::BacktestSettings());

    BacktestResult run(const std::string& symbol,
                       const std::vector<Bar>& bars,
                       strategy::IStrategy& strategy) const;

    static void logResult(const BacktestResult& result);

private:
    engine::BacktestSettings settings_;
};

} // namespace backtest
} // namespace tradeagent
