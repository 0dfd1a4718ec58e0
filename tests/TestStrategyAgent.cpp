#include "strategy/StrategyAgent.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <map>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace tradeagent;
using namespace tradeagent::strategy;

namespace {

// 종목별로 정해진 출력을 돌려주는 테스트용 전략
class ScriptedStrategy : public IStrategy {
public:
    ScriptedStrategy(std::string name, std::map<std::string, StrategyOutput> script)
        : name_(std::move(name)), script_(std::move(script)), enabled_(true) {}

    StrategyInfo getInfo() const override {
        StrategyInfo info;
        info.name = name_;
        return info;
    }

    StrategyOutput generateSignal(const std::string& symbol, const std::vector<Bar>&) override {
        auto it = script_.find(symbol);
        if (it == script_.end()) {
            return StrategyOutput::hold(name_, "unscripted");
        }
        StrategyOutput out = it->second;
        out.strategy_name = name_;
        return out;
    }

    void setEnabled(bool enabled) override { enabled_ = enabled; }
    bool isEnabled() const override { return enabled_; }

private:
    std::string name_;
    std::map<std::string, StrategyOutput> script_;
    bool enabled_;
};

class ThrowingStrategy : public IStrategy {
public:
    StrategyInfo getInfo() const override {
        StrategyInfo info;
        info.name = "throwing";
        return info;
    }
    StrategyOutput generateSignal(const std::string&, const std::vector<Bar>&) override {
        throw std::runtime_error("boom");
    }
    void setEnabled(bool) override {}
    bool isEnabled() const override { return true; }
};

StrategyOutput vote(Action action, double strength, std::optional<double> entry = std::nullopt,
                    std::optional<double> stop = std::nullopt) {
    StrategyOutput out;
    out.action = action;
    out.strength = strength;
    out.entry_price = entry;
    out.stop_loss = stop;
    out.reason = toString(action);
    return out;
}

std::vector<Bar> flatBars(int count) {
    std::vector<Bar> bars;
    for (int i = 0; i < count; ++i) {
        bars.emplace_back(100, 100, 100, 100, 1000, 1704067200000LL + i * 86400000LL);
    }
    return bars;
}

void testFuseRules() {
    StrategyAgent agent;

    // 동률 -> HOLD, confidence 0
    {
        auto c = agent.fuse("AAPL", {vote(Action::LONG, 0.9), vote(Action::SHORT, 0.9)}, nullptr);
        assert(c.action == TradeAction::HOLD);
        assert(c.confidence == 0.0);
        assert(c.buy_votes == 1 && c.sell_votes == 1);
    }
    {
        auto c = agent.fuse("AAPL", {vote(Action::LONG, 0.9), vote(Action::HOLD, 0.0)}, nullptr);
        assert(c.action == TradeAction::HOLD);
    }

    // CLOSE 표가 있으면 우선
    {
        auto c = agent.fuse("AAPL", {vote(Action::LONG, 0.9), vote(Action::LONG, 0.9),
                                     vote(Action::CLOSE, 0.5)}, nullptr);
        assert(c.action == TradeAction::CLOSE);
        assert(std::abs(c.confidence - 0.5 / 3.0) < 1e-9);
    }

    // 만장일치 BUY: (2/2) x 평균 강도, 가장 강한 표의 가격 정보 사용
    {
        auto c = agent.fuse("AAPL", {vote(Action::LONG, 0.6, 100.0, 98.0),
                                     vote(Action::LONG, 0.8, 101.0, 97.0)}, nullptr);
        assert(c.action == TradeAction::BUY);
        assert(std::abs(c.confidence - 0.7) < 1e-9);
        assert(c.entry_price && std::abs(*c.entry_price - 101.0) < 1e-9);
        assert(c.stop_loss && std::abs(*c.stop_loss - 97.0) < 1e-9);
    }

    // 2 SELL vs 1 HOLD
    {
        auto c = agent.fuse("AAPL", {vote(Action::SHORT, 0.9), vote(Action::SHORT, 0.6),
                                     vote(Action::HOLD, 0.0)}, nullptr);
        assert(c.action == TradeAction::SELL);
        assert(std::abs(c.confidence - (2.0 / 3.0) * 0.75) < 1e-9);
    }

    // 고변동성 할인 x0.7
    {
        analytics::MarketRegime regime;
        regime.insufficient_data = false;
        regime.volatility_pct = 4.0;
        auto c = agent.fuse("AAPL", {vote(Action::LONG, 0.8), vote(Action::LONG, 0.8)}, &regime);
        assert(c.regime_discounted);
        assert(std::abs(c.confidence - 0.8 * 0.7) < 1e-9);

        regime.volatility_pct = 3.0;
        auto boundary = agent.fuse("AAPL", {vote(Action::LONG, 0.8)}, &regime);
        assert(!boundary.regime_discounted);
        assert(std::abs(boundary.confidence - 0.8) < 1e-9);
    }

    {
        auto c = agent.fuse("AAPL", {}, nullptr);
        assert(c.action == TradeAction::HOLD);
    }
}

void testStrategyErrorsBecomeHold() {
    StrategyAgent agent;
    agent.registerStrategy(std::make_shared<ThrowingStrategy>());
    agent.registerStrategy(std::make_shared<ScriptedStrategy>(
        "scripted", std::map<std::string, StrategyOutput>{{"AAPL", vote(Action::LONG, 1.0)}}));

    auto outputs = agent.collectSignals("AAPL", flatBars(60));
    assert(outputs.size() == 2);
    assert(outputs[0].action == Action::HOLD);
    assert(outputs[0].strategy_name == "throwing");

    auto c = agent.generateCombinedSignal("AAPL", flatBars(60));
    assert(c.action == TradeAction::HOLD);     // 1 buy vs 1 hold

    auto short_history = agent.generateCombinedSignal("AAPL", flatBars(10));
    assert(short_history.action == TradeAction::HOLD);
    assert(short_history.strategy_outputs.empty());
}

void testScanUniverseRanking() {
    StrategyAgent agent;
    std::map<std::string, StrategyOutput> script_a = {
        {"AAPL", vote(Action::LONG, 0.5)},
        {"MSFT", vote(Action::SHORT, 0.9)},
        {"NVDA", vote(Action::LONG, 0.2)},
        {"AMD", vote(Action::CLOSE, 0.9)},
    };
    agent.registerStrategy(std::make_shared<ScriptedStrategy>("a", script_a));
    agent.registerStrategy(std::make_shared<ScriptedStrategy>("b", script_a));

    std::map<std::string, std::vector<Bar>> universe;
    for (const char* s : {"AAPL", "MSFT", "NVDA", "AMD", "TSLA"}) {
        universe[s] = flatBars(60);
    }

    analytics::MarketRegime volatile_regime;
    volatile_regime.insufficient_data = false;
    volatile_regime.volatility_pct = 5.0;
    std::map<std::string, analytics::MarketRegime> regimes = {{"MSFT", volatile_regime}};

    auto opportunities = agent.scanUniverse(universe, regimes);
    assert(opportunities.size() == 2);
    assert(opportunities[0].symbol == "MSFT");
    assert(opportunities[0].action == TradeAction::SELL);
    assert(std::abs(opportunities[0].confidence - 0.9 * 0.7) < 1e-9);
    assert(opportunities[1].symbol == "AAPL");

    agent.enableStrategy("b", false);
    assert(agent.getActiveStrategies().size() == 1);
    assert(agent.getStrategy("a") != nullptr);
    assert(agent.getStrategy("missing") == nullptr);
}

} // namespace

int main() {
    std::cout << "[TEST] Starting StrategyAgent Test..." << std::endl;

    testFuseRules();
    testStrategyErrorsBecomeHold();
    testScanUniverseRanking();

    std::cout << "[TEST] StrategyAgent PASSED\n";
    return 0;
}
