#include "analytics/TechnicalIndicators.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <vector>

int main() {
    using tradeagent::analytics::TechnicalIndicators;

    std::cout << "[TEST] Starting TechnicalIndicators Test..." << std::endl;

    const std::vector<double> values = {1, 2, 3, 4, 5};

    // SMA: 마지막 period 개
    {
        auto sma = TechnicalIndicators::calculateSMA(values, 3);
        assert(sma && std::abs(*sma - 4.0) < 1e-9);
        // 정확히 period 개면 계산
        auto full = TechnicalIndicators::calculateSMA(values, 5);
        assert(full && std::abs(*full - 3.0) < 1e-9);
        assert(!TechnicalIndicators::calculateSMA(values, 6));
        assert(!TechnicalIndicators::calculateSMA(values, 0));
        assert(!TechnicalIndicators::calculateSMA({}, 1));
    }

    // 표본 표준편차 (n-1)
    {
        auto sd = TechnicalIndicators::calculateStdDev(values, 5);
        assert(sd && std::abs(*sd - std::sqrt(2.5)) < 1e-9);
        assert(!TechnicalIndicators::calculateStdDev(values, 1));
    }

    // RSI: 상승만 -> 100, 변화 없음 -> 50
    {
        std::vector<double> up;
        for (int i = 0; i < 20; ++i) up.push_back(100.0 + i);
        auto rsi = TechnicalIndicators::calculateRSI(up, 14);
        assert(rsi && std::abs(*rsi - 100.0) < 1e-9);

        std::vector<double> flat(20, 50.0);
        auto flat_rsi = TechnicalIndicators::calculateRSI(flat, 14);
        assert(flat_rsi && std::abs(*flat_rsi - 50.0) < 1e-9);

        std::vector<double> mixed = {10, 11, 10, 11, 10};
        auto mixed_rsi = TechnicalIndicators::calculateRSI(mixed, 4);
        assert(mixed_rsi && std::abs(*mixed_rsi - 50.0) < 1e-9);

        assert(!TechnicalIndicators::calculateRSI(values, 5));
    }

    // Momentum / Z-score / Volume ratio
    {
        auto mom = TechnicalIndicators::calculateMomentum(values, 2);
        assert(mom && std::abs(*mom - 2.0) < 1e-9);
        assert(!TechnicalIndicators::calculateMomentum(values, 5));

        auto z = TechnicalIndicators::calculateZScore(values, 5);
        assert(z && std::abs(*z - 2.0 / std::sqrt(2.5)) < 1e-9);
        assert(!TechnicalIndicators::calculateZScore(std::vector<double>(5, 3.0), 5));

        std::vector<double> volumes = {100, 100, 100, 400};
        auto ratio = TechnicalIndicators::calculateVolumeRatio(volumes, 4);
        assert(ratio && std::abs(*ratio - 400.0 / 175.0) < 1e-9);
        assert(!TechnicalIndicators::calculateVolumeRatio(std::vector<double>(4, 0.0), 4));
    }

    {
        auto returns = TechnicalIndicators::calculateReturns({100, 110, 99});
        assert(returns.size() == 2);
        assert(std::abs(returns[0] - 0.10) < 1e-9);
        assert(std::abs(returns[1] + 0.10) < 1e-9);
        assert(TechnicalIndicators::calculateReturns({100}).empty());
    }

    std::cout << "[TEST] TechnicalIndicators PASSED\n";
    return 0;
}
