#include "analytics/MarketAnalyzer.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <map>
#include <vector>

using namespace tradeagent;
using namespace tradeagent::analytics;

namespace {

std::vector<Bar> series(int count, double start, double step, double volume = 1000.0) {
    std::vector<Bar> bars;
    long long ts = 1704067200000LL;
    for (int i = 0; i < count; ++i) {
        const double c = start + step * i;
        bars.emplace_back(c, c, c, c, volume, ts);
        ts += 86400000LL;
    }
    return bars;
}

std::vector<Bar> choppy(int count) {
    std::vector<Bar> bars;
    long long ts = 1704067200000LL;
    for (int i = 0; i < count; ++i) {
        const double c = (i % 2 == 0) ? 100.0 : 105.0;
        bars.emplace_back(c, c, c, c, 1000.0, ts);
        ts += 86400000LL;
    }
    return bars;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting MarketAnalyzer Test..." << std::endl;

    MarketAnalyzer analyzer;

    // 1. 데이터 부족
    {
        auto regime = analyzer.analyzeSymbol("AAPL", series(10, 100.0, 1.0));
        assert(regime.insufficient_data);
        assert(regime.recommendation == Recommendation::INSUFFICIENT_DATA);
    }

    // 2. 완만한 상승 추세
    {
        auto regime = analyzer.analyzeSymbol("AAPL", series(60, 100.0, 1.0));
        assert(!regime.insufficient_data);
        assert(regime.trend == Trend::UP);
        assert(regime.volatility_regime == VolatilityRegime::LOW);
        assert(regime.recommendation == Recommendation::NORMAL_TRADING);
        assert(std::abs(regime.current_price - 159.0) < 1e-9);
        assert(std::abs(regime.sma20 - 149.5) < 1e-9);
        assert(std::abs(regime.sma50 - 134.5) < 1e-9);
        assert(std::abs(regime.volume_ratio - 1.0) < 1e-9);
    }

    // 3. 하락 추세 + 마지막 봉 거래량 급증
    {
        auto bars = series(60, 200.0, -1.0);
        bars.back().volume = 2000.0;
        auto regime = analyzer.analyzeSymbol("MSFT", bars);
        assert(regime.trend == Trend::DOWN);
        assert(regime.volume_ratio > 1.5);
        assert(regime.recommendation == Recommendation::ACTIVE_TRADING);
    }

    // 4. 고변동성 (+-5% 진동)
    {
        auto regime = analyzer.analyzeSymbol("TSLA", choppy(60));
        assert(regime.volatility_pct > 3.0);
        assert(regime.volatility_regime == VolatilityRegime::HIGH);
        assert(regime.recommendation == Recommendation::HIGH_RISK);
        assert(regime.trend == Trend::SIDEWAYS);
    }

    // 5. 유니버스 심리: 데이터 부족 종목은 집계에서 제외
    {
        std::map<std::string, std::vector<Bar>> universe;
        universe["AAPL"] = series(60, 100.0, 1.0);
        universe["MSFT"] = series(60, 50.0, 0.5);
        universe["NVDA"] = series(60, 10.0, 0.1);
        universe["AMD"] = series(5, 10.0, 0.1);

        auto overview = analyzer.analyzeUniverse(universe);
        assert(overview.regimes.size() == 4);
        assert(overview.analyzed_count == 3);
        assert(overview.uptrend_count == 3);
        assert(overview.sentiment == Sentiment::BULLISH);
        assert(overview.regimes.at("AMD").insufficient_data);
        assert(!overview.recommendation.empty());
    }

    {
        std::map<std::string, std::vector<Bar>> universe;
        universe["AAPL"] = series(60, 100.0, 1.0);
        universe["MSFT"] = series(60, 200.0, -1.0);
        auto overview = analyzer.analyzeUniverse(universe);
        assert(overview.sentiment == Sentiment::NEUTRAL);

        auto empty = analyzer.analyzeUniverse({});
        assert(empty.analyzed_count == 0);
        assert(empty.sentiment == Sentiment::NEUTRAL);
    }

    std::cout << "[TEST] MarketAnalyzer PASSED\n";
    return 0;
}
