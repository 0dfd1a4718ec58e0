#include "strategy/MomentumStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace tradeagent {
namespace strategy {

using analytics::TechnicalIndicators;

MomentumStrategy::MomentumStrategy()
    : MomentumStrategy(MomentumStrategyConfig())
{}

MomentumStrategy::MomentumStrategy(const MomentumStrategyConfig& config)
    : config_(config)
    , enabled_(true)
{}

StrategyInfo MomentumStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "momentum";
    info.description = "fast/slow SMA crossover confirmed by RSI";
    info.timeframe = "1d";
    info.min_bars = config_.slow_period + 1;
    return info;
}

StrategyOutput MomentumStrategy::generateSignal(
    const std::string& symbol,
    const std::vector<Bar>& bars
) {
    const std::string name = getInfo().name;
    if (!enabled_) {
        return StrategyOutput::hold(name, "Disabled");
    }
    if (bars.size() < static_cast<size_t>(config_.slow_period + 1)) {
        return StrategyOutput::hold(name, "Insufficient data");
    }

    const auto closes = TechnicalIndicators::extractClosePrices(bars);
    const std::vector<double> prev_closes(closes.begin(), closes.end() - 1);

    const double fast = TechnicalIndicators::calculateSMA(closes, config_.fast_period).value_or(0.0);
    const double slow = TechnicalIndicators::calculateSMA(closes, config_.slow_period).value_or(0.0);
    const double prev_fast = TechnicalIndicators::calculateSMA(prev_closes, config_.fast_period).value_or(0.0);
    const double prev_slow = TechnicalIndicators::calculateSMA(prev_closes, config_.slow_period).value_or(0.0);
    const double rsi = TechnicalIndicators::calculateRSI(closes, config_.rsi_period).value_or(50.0);
    const double close = closes.back();

    if (slow <= 0.0 || fast <= 0.0 || prev_slow <= 0.0) {
        return StrategyOutput::hold(name, "Invalid moving averages");
    }

    // 추세 강도 (%) -> 강도 [0,1]
    const double trend_strength = (fast - slow) / slow * 100.0;
    const double strength = std::min(std::abs(trend_strength) / config_.strength_scale_pct, 1.0);

    std::ostringstream detail;
    detail << std::fixed << std::setprecision(2)
           << " (fast=" << fast << ", slow=" << slow << ", RSI=" << rsi << ")";

    StrategyOutput out;
    out.strategy_name = name;

    const bool bullish_cross = fast > slow && prev_fast <= prev_slow;
    const bool bearish_cross = fast < slow && prev_fast >= prev_slow;

    if (bullish_cross && rsi < config_.rsi_overbought) {
        out.action = Action::LONG;
        out.strength = strength;
        out.entry_price = close;
        out.stop_loss = slow * (1.0 - config_.stop_loss_fraction);
        out.reason = "Bullish crossover" + detail.str();
    } else if (bearish_cross && rsi > config_.rsi_oversold) {
        out.action = Action::SHORT;
        out.strength = strength;
        out.entry_price = close;
        out.stop_loss = slow * (1.0 + config_.stop_loss_fraction);
        out.reason = "Bearish crossover" + detail.str();
    } else if (fast < slow && rsi > config_.rsi_overbought) {
        out.action = Action::CLOSE;
        out.strength = config_.close_strength;
        out.reason = "Momentum weakening" + detail.str();
    } else {
        out.action = Action::HOLD;
        out.strength = 0.0;
        out.reason = "No crossover" + detail.str();
    }

    if (out.action != Action::HOLD) {
        LOG_INFO("{} - momentum {} (strength {:.2f}): {}",
                 symbol, toString(out.action), out.strength, out.reason);
    }
    return out;
}

} // namespace strategy
} // namespace tradeagent
