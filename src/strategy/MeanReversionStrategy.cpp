#include "strategy/MeanReversionStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace tradeagent {
namespace strategy {

using analytics::TechnicalIndicators;

namespace {
constexpr int kTrendPeriod = 50;
constexpr int kVolumeWindow = 20;
constexpr int kExtraWarmupBars = 20;

std::string formatReason(const std::string& head, const MeanReversionMetrics& m) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << head << " (z=" << m.z_score << ", RSI=" << m.rsi
        << ", vol=" << m.volume_ratio << "x)";
    return oss.str();
}
}

MeanReversionStrategy::MeanReversionStrategy()
    : MeanReversionStrategy(MeanReversionStrategyConfig())
{}

MeanReversionStrategy::MeanReversionStrategy(const MeanReversionStrategyConfig& config)
    : config_(config)
    , enabled_(true)
{}

StrategyInfo MeanReversionStrategy::getInfo() const {
    StrategyInfo info;
    info.name = "mean_reversion";
    info.description = "z-score band reversion with RSI, volume and trend filters";
    info.timeframe = "1d";
    info.min_bars = config_.period + kExtraWarmupBars;
    return info;
}

MajorTrend MeanReversionStrategy::detectMajorTrend(const std::vector<double>& closes) const {
    auto sma50 = TechnicalIndicators::calculateSMA(closes, kTrendPeriod);
    if (!sma50) {
        return MajorTrend::NEUTRAL;
    }

    const double price = closes.back();
    if (price > *sma50 * (1.0 + config_.trend_band)) return MajorTrend::STRONG_UPTREND;
    if (price < *sma50 * (1.0 - config_.trend_band)) return MajorTrend::STRONG_DOWNTREND;
    return MajorTrend::NEUTRAL;
}

std::optional<MeanReversionMetrics> MeanReversionStrategy::computeMetrics(const std::vector<Bar>& bars) const {
    if (bars.size() < static_cast<size_t>(config_.period + kExtraWarmupBars)) {
        return std::nullopt;
    }

    const auto closes = TechnicalIndicators::extractClosePrices(bars);
    const auto volumes = TechnicalIndicators::extractVolumes(bars);

    auto mean = TechnicalIndicators::calculateSMA(closes, config_.period);
    auto std_dev = TechnicalIndicators::calculateStdDev(closes, config_.period);
    if (!mean || !std_dev || *std_dev <= 0.0) {
        return std::nullopt;
    }

    MeanReversionMetrics m;
    m.close = closes.back();
    m.mean = *mean;
    m.std_dev = *std_dev;
    m.z_score = (m.close - m.mean) / m.std_dev;
    m.rsi = TechnicalIndicators::calculateRSI(closes, config_.rsi_period).value_or(50.0);
    m.volume_ratio = TechnicalIndicators::calculateVolumeRatio(volumes, kVolumeWindow).value_or(1.0);
    m.major_trend = detectMajorTrend(closes);
    return m;
}

double MeanReversionStrategy::calculateConfidence(const MeanReversionMetrics& m, Action action) const {
    double confidence = 0.0;
    const double abs_z = std::abs(m.z_score);

    // 1. z-score 크기
    if (abs_z > 2.5) confidence += 0.25;
    else if (abs_z > 2.0) confidence += 0.15;

    // 2. RSI 극단값
    if (action == Action::LONG) {
        if (m.rsi < 30.0) confidence += 0.25;
        else if (m.rsi < 40.0) confidence += 0.15;
    } else {
        if (m.rsi > 70.0) confidence += 0.25;
        else if (m.rsi > 60.0) confidence += 0.15;
    }

    // 3. 거래량 확인
    if (m.volume_ratio >= config_.min_volume_ratio) confidence += 0.25;

    // 4. 추세 정렬 (역추세 감점)
    const bool counter_trend =
        (action == Action::LONG && m.major_trend == MajorTrend::STRONG_DOWNTREND) ||
        (action == Action::SHORT && m.major_trend == MajorTrend::STRONG_UPTREND);
    confidence += counter_trend ? -0.1 : 0.25;

    return std::clamp(confidence, 0.0, 1.0);
}

StrategyOutput MeanReversionStrategy::evaluate(const MeanReversionMetrics& m) const {
    const std::string name = getInfo().name;
    const bool volume_ok = m.volume_ratio >= config_.min_volume_ratio;

    Action action = Action::HOLD;
    if (m.z_score < -config_.std_dev) {
        if (m.rsi > config_.rsi_oversold) {
            return StrategyOutput::hold(name, formatReason("Oversold band but RSI not confirming", m));
        }
        if (m.major_trend == MajorTrend::STRONG_DOWNTREND) {
            return StrategyOutput::hold(name, formatReason("Oversold inside strong downtrend", m));
        }
        if (!volume_ok) {
            return StrategyOutput::hold(name, formatReason("Oversold on thin volume", m));
        }
        action = Action::LONG;
    } else if (m.z_score > config_.std_dev) {
        if (m.rsi < config_.rsi_overbought) {
            return StrategyOutput::hold(name, formatReason("Overbought band but RSI not confirming", m));
        }
        if (m.major_trend == MajorTrend::STRONG_UPTREND) {
            return StrategyOutput::hold(name, formatReason("Overbought inside strong uptrend", m));
        }
        if (!volume_ok) {
            return StrategyOutput::hold(name, formatReason("Overbought on thin volume", m));
        }
        action = Action::SHORT;
    } else if (std::abs(m.z_score) < config_.exit_z_score) {
        StrategyOutput out;
        out.strategy_name = name;
        out.action = Action::CLOSE;
        out.strength = 0.5;
        out.reason = formatReason("Price reverted to mean", m);
        return out;
    } else {
        return StrategyOutput::hold(name, formatReason("Inside bands", m));
    }

    const double confidence = calculateConfidence(m, action);
    if (confidence < config_.min_confidence) {
        return StrategyOutput::hold(name, formatReason("Low confidence", m));
    }

    StrategyOutput out;
    out.strategy_name = name;
    out.action = action;
    out.strength = confidence;
    out.entry_price = m.close;
    if (action == Action::LONG) {
        out.stop_loss = m.close * (1.0 - config_.stop_loss_fraction);
        out.reason = formatReason("Oversold reversion", m);
    } else {
        out.stop_loss = m.close * (1.0 + config_.stop_loss_fraction);
        out.reason = formatReason("Overbought reversion", m);
    }
    out.target_price = m.mean;
    return out;
}

StrategyOutput MeanReversionStrategy::generateSignal(
    const std::string& symbol,
    const std::vector<Bar>& bars
) {
    if (!enabled_) {
        return StrategyOutput::hold(getInfo().name, "Disabled");
    }

    auto metrics = computeMetrics(bars);
    if (!metrics) {
        return StrategyOutput::hold(getInfo().name, "Insufficient data");
    }

    StrategyOutput out = evaluate(*metrics);
    if (out.action != Action::HOLD) {
        LOG_INFO("{} - mean_reversion {} (strength {:.2f}): {}",
                 symbol, toString(out.action), out.strength, out.reason);
    }
    return out;
}

} // namespace strategy
} // namespace tradeagent
