#include "backtest/Backtester.h"
#include "strategy/MeanReversionStrategy.h"
#include "strategy/MomentumStrategy.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <vector>

using namespace tradeagent;
using namespace tradeagent::backtest;

namespace {

std::vector<Bar> barsFromCloses(const std::vector<double>& closes) {
    std::vector<Bar> bars;
    long long ts = 1704067200000LL;
    for (double c : closes) {
        bars.emplace_back(c, c, c, c, 1000000.0, ts);
        ts += 86400000LL;
    }
    return bars;
}

// 창 크기에 따라 정해진 신호를 내고, 전달된 봉이 미래를 포함하지 않는지 기록
class ScriptedRecorder : public strategy::IStrategy {
public:
    explicit ScriptedRecorder(const std::vector<Bar>& all) : all_(all) {}

    std::vector<size_t> seen_sizes;
    bool saw_future = false;

    strategy::StrategyInfo getInfo() const override {
        strategy::StrategyInfo info;
        info.name = "recorder";
        return info;
    }

    strategy::StrategyOutput generateSignal(const std::string&, const std::vector<Bar>& window) override {
        seen_sizes.push_back(window.size());
        if (window.back().timestamp != all_[window.size() - 1].timestamp) {
            saw_future = true;
        }

        strategy::StrategyOutput out;
        out.strategy_name = "recorder";
        switch (window.size()) {
            case 3: out.action = strategy::Action::LONG; out.strength = 1.0; break;
            case 6: out.action = strategy::Action::CLOSE; out.strength = 0.5; break;
            case 7: out.action = strategy::Action::SHORT; out.strength = 1.0; break;
            default: break;
        }
        return out;
    }
    void setEnabled(bool) override {}
    bool isEnabled() const override { return true; }

private:
    const std::vector<Bar>& all_;
};

class AlwaysLong : public strategy::IStrategy {
public:
    strategy::StrategyInfo getInfo() const override {
        strategy::StrategyInfo info;
        info.name = "always_long";
        return info;
    }
    strategy::StrategyOutput generateSignal(const std::string&, const std::vector<Bar>& window) override {
        strategy::StrategyOutput out;
        out.strategy_name = "always_long";
        out.action = strategy::Action::LONG;
        out.strength = 1.0;
        out.stop_loss = window.back().close * 0.95;
        return out;
    }
    void setEnabled(bool) override {}
    bool isEnabled() const override { return true; }
};

engine::BacktestSettings settings(int warmup) {
    engine::BacktestSettings s;
    s.initial_capital = 10000.0;
    s.warmup_bars = warmup;
    s.position_fraction = 0.2;
    s.stop_loss_fraction = 0.02;
    return s;
}

void testScriptedWalkForward() {
    const auto bars = barsFromCloses({100, 100, 100, 102, 104, 110, 108, 109});
    ScriptedRecorder recorder(bars);
    Backtester backtester(settings(2));

    auto result = backtester.run("AAPL", bars, recorder);
    assert(!recorder.saw_future);
    assert((recorder.seen_sizes == std::vector<size_t>{3, 4, 5, 6, 7, 8}));
    assert(result.bars_processed == 6);

    assert(result.total_trades == 2);
    const auto& first = result.trades[0];
    assert(first.side == OrderSide::BUY);
    assert(first.quantity == 20);
    assert(std::abs(first.stop_loss - 98.0) < 1e-9);
    assert(first.exit_reason == "close_signal");
    assert(std::abs(first.pnl - 200.0) < 1e-9);

    const auto& second = result.trades[1];
    assert(second.side == OrderSide::SELL);
    assert(second.quantity == 18);
    assert(second.exit_reason == "end_of_data");
    assert(std::abs(second.pnl + 18.0) < 1e-9);

    assert(result.winning_trades == 1 && result.losing_trades == 1);
    assert(std::abs(result.win_rate - 0.5) < 1e-9);
    assert(std::abs(result.final_capital - 10182.0) < 1e-9);
    assert(std::abs(result.total_return_percent - 1.82) < 1e-9);
    assert(std::abs(result.profit_factor - 200.0 / 18.0) < 1e-9);
    assert(std::abs(result.max_drawdown - 18.0 / 10200.0) < 1e-9);
}

void testStopLossExit() {
    const auto bars = barsFromCloses({100, 100, 97, 94, 96});
    AlwaysLong strategy;
    Backtester backtester(settings(1));

    auto result = backtester.run("MSFT", bars, strategy);
    assert(result.total_trades >= 1);
    assert(result.trades[0].exit_reason == "stop_loss");
    assert(result.trades[0].exit_index == 3);
    assert(std::abs(result.trades[0].exit_price - 94.0) < 1e-9);
}

void testDeterminism() {
    std::vector<double> closes;
    for (int i = 0; i < 250; ++i) {
        closes.push_back(100.0 + 8.0 * std::sin(i / 6.0) + 0.05 * i);
    }
    const auto bars = barsFromCloses(closes);
    Backtester backtester(settings(50));

    strategy::MeanReversionStrategy mean_reversion;
    auto a = backtester.run("AAPL", bars, mean_reversion);
    auto b = backtester.run("AAPL", bars, mean_reversion);
    assert(a.total_trades == b.total_trades);
    assert(a.final_capital == b.final_capital);
    assert(a.max_drawdown == b.max_drawdown);
    for (size_t i = 0; i < a.trades.size(); ++i) {
        assert(a.trades[i].entry_index == b.trades[i].entry_index);
        assert(a.trades[i].exit_index == b.trades[i].exit_index);
        assert(a.trades[i].pnl == b.trades[i].pnl);
    }

    strategy::MomentumStrategy momentum;
    auto c = backtester.run("AAPL", bars, momentum);
    auto d = backtester.run("AAPL", bars, momentum);
    assert(c.total_trades == d.total_trades);
    assert(c.final_capital == d.final_capital);
    assert(c.strategy_name == "momentum");
}

void testShortHistory() {
    AlwaysLong strategy;
    Backtester backtester(settings(50));
    auto result = backtester.run("NVDA", barsFromCloses({100, 101, 102}), strategy);
    assert(result.bars_processed == 0);
    assert(result.total_trades == 0);
    assert(result.final_capital == result.initial_capital);
}

} // namespace

int main() {
    std::cout << "[TEST] Starting Backtester Test..." << std::endl;

    testScriptedWalkForward();
    testStopLossExit();
    testDeterminism();
    testShortHistory();

    std::cout << "[TEST] Backtester PASSED\n";
    return 0;
}
