#include "analytics/MarketAnalyzer.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>

namespace tradeagent {
namespace analytics {

std::string toString(Trend trend) {
    switch (trend) {
        case Trend::UP: return "up";
        case Trend::DOWN: return "down";
        case Trend::SIDEWAYS: return "sideways";
    }
    return "sideways";
}

std::string toString(VolatilityRegime regime) {
    switch (regime) {
        case VolatilityRegime::LOW: return "low";
        case VolatilityRegime::MEDIUM: return "medium";
        case VolatilityRegime::HIGH: return "high";
    }
    return "low";
}

std::string toString(Recommendation recommendation) {
    switch (recommendation) {
        case Recommendation::HIGH_RISK: return "high_risk";
        case Recommendation::ACTIVE_TRADING: return "active_trading";
        case Recommendation::NORMAL_TRADING: return "normal_trading";
        case Recommendation::INSUFFICIENT_DATA: return "insufficient_data";
    }
    return "insufficient_data";
}

std::string toString(Sentiment sentiment) {
    switch (sentiment) {
        case Sentiment::BULLISH: return "bullish";
        case Sentiment::BEARISH: return "bearish";
        case Sentiment::NEUTRAL: return "neutral";
    }
    return "neutral";
}

MarketRegime MarketAnalyzer::analyzeSymbol(const std::string& symbol, const std::vector<Bar>& bars) const {
    MarketRegime result;
    result.symbol = symbol;

    if (bars.size() < static_cast<size_t>(config_.min_bars)) {
        result.insufficient_data = true;
        result.recommendation = Recommendation::INSUFFICIENT_DATA;
        return result;
    }

    const auto closes = TechnicalIndicators::extractClosePrices(bars);
    const auto volumes = TechnicalIndicators::extractVolumes(bars);
    const double current_price = closes.back();

    // 1. 변동성: 최근 20개 수익률 표준편차
    const auto returns = TechnicalIndicators::calculateReturns(closes);
    const int window = std::min(config_.volatility_window, static_cast<int>(returns.size()));
    const auto return_std = TechnicalIndicators::calculateStdDev(returns, window);
    result.volatility_pct = return_std.value_or(0.0) * 100.0;

    // 2. 거래량 비율 (평균 0 이면 1.0)
    result.volume_ratio = TechnicalIndicators::calculateVolumeRatio(volumes, config_.volume_window).value_or(1.0);

    // 3. 이동평균 (50봉 미만이면 SMA50 = SMA20)
    result.current_price = current_price;
    result.sma20 = TechnicalIndicators::calculateSMA(closes, 20).value_or(current_price);
    result.sma50 = TechnicalIndicators::calculateSMA(closes, 50).value_or(result.sma20);

    if (current_price > result.sma20 && result.sma20 > result.sma50) {
        result.trend = Trend::UP;
    } else if (current_price < result.sma20 && result.sma20 < result.sma50) {
        result.trend = Trend::DOWN;
    } else {
        result.trend = Trend::SIDEWAYS;
    }

    if (result.volatility_pct > config_.high_volatility_pct) {
        result.volatility_regime = VolatilityRegime::HIGH;
    } else if (result.volatility_pct > config_.medium_volatility_pct) {
        result.volatility_regime = VolatilityRegime::MEDIUM;
    } else {
        result.volatility_regime = VolatilityRegime::LOW;
    }

    if (result.volatility_pct > config_.high_volatility_pct) {
        result.recommendation = Recommendation::HIGH_RISK;
    } else if (result.volume_ratio > config_.active_volume_ratio) {
        result.recommendation = Recommendation::ACTIVE_TRADING;
    } else {
        result.recommendation = Recommendation::NORMAL_TRADING;
    }

    if (result.sma20 > 0.0) {
        result.price_vs_sma20 = (current_price - result.sma20) / result.sma20 * 100.0;
    }
    if (!returns.empty()) {
        result.daily_return = returns.back() * 100.0;
    }

    result.insufficient_data = false;
    return result;
}

MarketOverview MarketAnalyzer::analyzeUniverse(
    const std::map<std::string, std::vector<Bar>>& bars_by_symbol
) const {
    MarketOverview overview;
    double volatility_sum = 0.0;

    for (const auto& [symbol, bars] : bars_by_symbol) {
        MarketRegime regime = analyzeSymbol(symbol, bars);
        if (!regime.insufficient_data) {
            overview.analyzed_count++;
            volatility_sum += regime.volatility_pct;
            if (regime.trend == Trend::UP) overview.uptrend_count++;
            if (regime.trend == Trend::DOWN) overview.downtrend_count++;
            if (regime.recommendation == Recommendation::HIGH_RISK) overview.high_risk_count++;
        } else {
            LOG_WARN("{} - insufficient data for regime ({} bars)", symbol, bars.size());
        }
        overview.regimes[symbol] = regime;
    }

    if (overview.analyzed_count > 0) {
        const double n = static_cast<double>(overview.analyzed_count);
        overview.avg_volatility = volatility_sum / n;
        if (overview.uptrend_count > n * config_.sentiment_threshold) {
            overview.sentiment = Sentiment::BULLISH;
        } else if (overview.downtrend_count > n * config_.sentiment_threshold) {
            overview.sentiment = Sentiment::BEARISH;
        }
    }

    overview.recommendation = getMarketRecommendation(overview);

    LOG_INFO("Market overview: {} analyzed, sentiment {}, avg volatility {:.2f}%, up {}, down {}",
             overview.analyzed_count, toString(overview.sentiment), overview.avg_volatility,
             overview.uptrend_count, overview.downtrend_count);
    return overview;
}

std::string MarketAnalyzer::getMarketRecommendation(const MarketOverview& overview) const {
    if (overview.analyzed_count == 0) {
        return "No usable market data; skip new entries";
    }
    if (overview.avg_volatility > config_.high_volatility_pct) {
        return "High volatility market; reduce position sizes and tighten stops";
    }
    switch (overview.sentiment) {
        case Sentiment::BULLISH: return "Bullish market; favour long setups";
        case Sentiment::BEARISH: return "Bearish market; favour shorts or stay in cash";
        case Sentiment::NEUTRAL: break;
    }
    return "Mixed market; be selective and trade mean reversion setups";
}

} // namespace analytics
} // namespace tradeagent
