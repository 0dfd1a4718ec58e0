#include "strategy/StrategyAgent.h"
#include "common/Logger.h"
#include <algorithm>

namespace tradeagent {
namespace strategy {

namespace {
TradeAction normalizeAction(Action action) {
    switch (action) {
        case Action::LONG: return TradeAction::BUY;
        case Action::SHORT: return TradeAction::SELL;
        case Action::CLOSE: return TradeAction::CLOSE;
        case Action::HOLD: return TradeAction::HOLD;
    }
    return TradeAction::HOLD;
}
}

std::string toString(TradeAction action) {
    switch (action) {
        case TradeAction::BUY: return "buy";
        case TradeAction::SELL: return "sell";
        case TradeAction::CLOSE: return "close";
        case TradeAction::HOLD: return "hold";
    }
    return "hold";
}

void StrategyAgent::registerStrategy(std::shared_ptr<IStrategy> strategy) {
    if (!strategy) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    strategies_.push_back(strategy);
    LOG_INFO("Strategy registered: {}", strategy->getInfo().name);
}

std::shared_ptr<IStrategy> StrategyAgent::getStrategy(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& strategy : strategies_) {
        if (strategy->getInfo().name == name) {
            return strategy;
        }
    }
    return nullptr;
}

std::vector<std::shared_ptr<IStrategy>> StrategyAgent::getStrategies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return strategies_;
}

void StrategyAgent::enableStrategy(const std::string& name, bool enabled) {
    auto strategy = getStrategy(name);
    if (strategy) {
        strategy->setEnabled(enabled);
        LOG_INFO("Strategy {}: {}", name, enabled ? "enabled" : "disabled");
    }
}

std::vector<std::string> StrategyAgent::getActiveStrategies() const {
    std::vector<std::string> names;
    for (const auto& strategy : getStrategies()) {
        if (strategy->isEnabled()) {
            names.push_back(strategy->getInfo().name);
        }
    }
    return names;
}

std::vector<StrategyOutput> StrategyAgent::collectSignals(
    const std::string& symbol,
    const std::vector<Bar>& bars
) {
    std::vector<StrategyOutput> outputs;

    // 순차 실행 (전략은 모두 동일한 시그니처로 호출)
    for (const auto& strategy : getStrategies()) {
        if (!strategy->isEnabled()) {
            continue;
        }
        try {
            outputs.push_back(strategy->generateSignal(symbol, bars));
        } catch (const std::exception& e) {
            LOG_ERROR("Strategy execution exception ({}): {}", strategy->getInfo().name, e.what());
            outputs.push_back(StrategyOutput::hold(strategy->getInfo().name,
                                                   std::string("Strategy error: ") + e.what()));
        }
    }
    return outputs;
}

CombinedSignal StrategyAgent::fuse(
    const std::string& symbol,
    const std::vector<StrategyOutput>& outputs,
    const analytics::MarketRegime* regime
) const {
    CombinedSignal combined;
    combined.symbol = symbol;
    combined.strategy_outputs = outputs;

    if (outputs.empty()) {
        combined.reasoning = "No active strategies";
        return combined;
    }

    for (const auto& output : outputs) {
        switch (normalizeAction(output.action)) {
            case TradeAction::BUY: combined.buy_votes++; break;
            case TradeAction::SELL: combined.sell_votes++; break;
            case TradeAction::CLOSE: combined.close_votes++; break;
            case TradeAction::HOLD: combined.hold_votes++; break;
        }
    }

    // 1. CLOSE 표가 하나라도 있으면 우선
    // 2. 나머지는 반대 방향과 HOLD 표를 모두 엄격히 앞서야 채택 (동률은 HOLD)
    TradeAction winner = TradeAction::HOLD;
    int winning_votes = 0;
    if (combined.close_votes > 0) {
        winner = TradeAction::CLOSE;
        winning_votes = combined.close_votes;
    } else if (combined.buy_votes > combined.sell_votes && combined.buy_votes > combined.hold_votes) {
        winner = TradeAction::BUY;
        winning_votes = combined.buy_votes;
    } else if (combined.sell_votes > combined.buy_votes && combined.sell_votes > combined.hold_votes) {
        winner = TradeAction::SELL;
        winning_votes = combined.sell_votes;
    }

    combined.action = winner;
    if (winner == TradeAction::HOLD) {
        combined.confidence = 0.0;
        combined.reasoning = "No consensus (buy " + std::to_string(combined.buy_votes) +
                             ", sell " + std::to_string(combined.sell_votes) +
                             ", hold " + std::to_string(combined.hold_votes) + ")";
        return combined;
    }

    double strength_sum = 0.0;
    const StrategyOutput* strongest = nullptr;
    std::string reasons;
    for (const auto& output : outputs) {
        if (normalizeAction(output.action) != winner) {
            continue;
        }
        strength_sum += output.strength;
        if (!strongest || output.strength > strongest->strength) {
            strongest = &output;
        }
        if (!reasons.empty()) reasons += "; ";
        reasons += output.strategy_name + ": " + output.reason;
    }

    const double total = static_cast<double>(outputs.size());
    const double avg_strength = strength_sum / static_cast<double>(winning_votes);
    combined.confidence = (static_cast<double>(winning_votes) / total) * avg_strength;

    if (regime && !regime->insufficient_data && regime->volatility_pct > config_.high_volatility_pct) {
        combined.confidence *= config_.high_volatility_discount;
        combined.regime_discounted = true;
        reasons += "; high volatility discount";
    }
    combined.confidence = std::clamp(combined.confidence, 0.0, 1.0);

    if (strongest) {
        combined.entry_price = strongest->entry_price;
        combined.stop_loss = strongest->stop_loss;
        combined.target_price = strongest->target_price;
    }
    combined.reasoning = reasons;
    return combined;
}

CombinedSignal StrategyAgent::generateCombinedSignal(
    const std::string& symbol,
    const std::vector<Bar>& bars,
    const analytics::MarketRegime* regime
) {
    if (bars.size() < static_cast<size_t>(config_.min_bars)) {
        CombinedSignal combined;
        combined.symbol = symbol;
        combined.reasoning = "Insufficient data";
        return combined;
    }

    auto outputs = collectSignals(symbol, bars);
    CombinedSignal combined = fuse(symbol, outputs, regime);

    if (combined.action != TradeAction::HOLD) {
        LOG_INFO("{} - combined {} (confidence {:.2f}, votes b{}/s{}/c{}/h{})",
                 symbol, toString(combined.action), combined.confidence,
                 combined.buy_votes, combined.sell_votes, combined.close_votes, combined.hold_votes);
    }
    return combined;
}

std::vector<CombinedSignal> StrategyAgent::scanUniverse(
    const std::map<std::string, std::vector<Bar>>& bars_by_symbol,
    const std::map<std::string, analytics::MarketRegime>& regimes
) {
    std::vector<CombinedSignal> opportunities;

    for (const auto& [symbol, bars] : bars_by_symbol) {
        auto it = regimes.find(symbol);
        const analytics::MarketRegime* regime = (it != regimes.end()) ? &it->second : nullptr;

        CombinedSignal combined = generateCombinedSignal(symbol, bars, regime);
        if ((combined.action == TradeAction::BUY || combined.action == TradeAction::SELL) &&
            combined.confidence > config_.min_scan_confidence) {
            opportunities.push_back(combined);
        }
    }

    std::stable_sort(opportunities.begin(), opportunities.end(),
        [](const CombinedSignal& a, const CombinedSignal& b) {
            return a.confidence > b.confidence;
        });

    LOG_INFO("Universe scan: {} symbols, {} opportunities", bars_by_symbol.size(), opportunities.size());
    return opportunities;
}

} // namespace strategy
} // namespace tradeagent
