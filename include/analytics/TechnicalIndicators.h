#pragma once

#include <vector>
#include <optional>
#include "common/Types.h"

namespace tradeagent {
namespace analytics {

// Technical Indicators - 순수 함수, 데이터 부족 시 std::nullopt 반환 (예외 없음)
class TechnicalIndicators {
public:
    // SMA (Simple Moving Average) - 마지막 period 개 평균
    // 최소 period 개 필요
    static std::optional<double> calculateSMA(const std::vector<double>& values, int period);

    // 표본 표준편차 (n-1) - 마지막 period 개, 최소 period 개 필요 (period >= 2)
    static std::optional<double> calculateStdDev(const std::vector<double>& values, int period);

    // RSI - 마지막 period 개 변화량의 단순 평균 상승폭/하락폭 비율, 최소 period+1 개 필요
    // 70 이상: 과매수, 30 이하: 과매도
    static std::optional<double> calculateRSI(const std::vector<double>& closes, int period = 14);

    // Momentum = close[t] - close[t-n], 최소 n+1 개 필요
    static std::optional<double> calculateMomentum(const std::vector<double>& closes, int n);

    // Volume ratio = volume[t] / SMA(volume, period)
    static std::optional<double> calculateVolumeRatio(const std::vector<double>& volumes, int period = 20);

    // Z-score = (value[t] - SMA) / STD
    static std::optional<double> calculateZScore(const std::vector<double>& values, int period);

    // 단순 수익률 시계열 (길이 n-1)
    static std::vector<double> calculateReturns(const std::vector<double>& closes);

    // Helper: 가격/거래량 배열 추출
    static std::vector<double> extractClosePrices(const std::vector<Bar>& bars);
    static std::vector<double> extractVolumes(const std::vector<Bar>& bars);

private:
    static double calculateMean(const std::vector<double>& values, size_t begin, size_t end);
};

} // namespace analytics
} // namespace tradeagent
