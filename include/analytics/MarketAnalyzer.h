#pragma once

#include "common/Types.h"
#include <map>
#include <string>
#include <vector>

namespace tradeagent {
namespace analytics {

enum class Trend { UP, DOWN, SIDEWAYS };
enum class VolatilityRegime { LOW, MEDIUM, HIGH };
enum class Recommendation { HIGH_RISK, ACTIVE_TRADING, NORMAL_TRADING, INSUFFICIENT_DATA };
enum class Sentiment { BULLISH, BEARISH, NEUTRAL };

std::string toString(Trend trend);
std::string toString(VolatilityRegime regime);
std::string toString(Recommendation recommendation);
std::string toString(Sentiment sentiment);

// 종목별 시장 국면 (매 사이클 재계산)
struct MarketRegime {
    std::string symbol;
    bool insufficient_data = true;
    double volatility_pct = 0.0;        // 최근 20개 수익률 표준편차 x100
    VolatilityRegime volatility_regime = VolatilityRegime::LOW;
    Trend trend = Trend::SIDEWAYS;
    double volume_ratio = 1.0;
    double current_price = 0.0;
    double sma20 = 0.0;
    double sma50 = 0.0;
    double price_vs_sma20 = 0.0;        // %
    double daily_return = 0.0;          // %
    Recommendation recommendation = Recommendation::INSUFFICIENT_DATA;
};

struct MarketOverview {
    std::map<std::string, MarketRegime> regimes;
    Sentiment sentiment = Sentiment::NEUTRAL;
    double avg_volatility = 0.0;
    int analyzed_count = 0;
    int uptrend_count = 0;
    int downtrend_count = 0;
    int high_risk_count = 0;
    std::string recommendation;
};

struct MarketAnalyzerConfig {
    int min_bars = 20;
    int volatility_window = 20;
    int volume_window = 20;
    double high_volatility_pct = 3.0;
    double medium_volatility_pct = 1.5;
    double active_volume_ratio = 1.5;
    double sentiment_threshold = 0.6;
};

class MarketAnalyzer {
public:
    MarketAnalyzer() = default;
    explicit MarketAnalyzer(const MarketAnalyzerConfig& config) : config_(config) {}

    MarketRegime analyzeSymbol(const std::string& symbol, const std::vector<Bar>& bars) const;
    MarketOverview analyzeUniverse(const std::map<std::string, std::vector<Bar>>& bars_by_symbol) const;

    // 전체 시장 국면에 대한 운용 가이드 문구
    std::string getMarketRecommendation(const MarketOverview& overview) const;

private:
    MarketAnalyzerConfig config_;
};

} // namespace analytics
} // namespace tradeagent
