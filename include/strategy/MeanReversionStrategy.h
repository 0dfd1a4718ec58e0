#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"

namespace tradeagent {
namespace strategy {

// SMA50 대비 장기 추세 (평균회귀 진입 필터)
enum class MajorTrend {
    STRONG_UPTREND,
    STRONG_DOWNTREND,
    NEUTRAL
};

// 신호 판단에 쓰이는 지표 묶음 (봉 데이터에서 계산)
struct MeanReversionMetrics {
    double close = 0.0;
    double mean = 0.0;                  // SMA(period)
    double std_dev = 0.0;
    double z_score = 0.0;
    double rsi = 50.0;
    double volume_ratio = 1.0;          // 현재 거래량 / 최근 20봉 평균
    MajorTrend major_trend = MajorTrend::NEUTRAL;
};

// Mean Reversion Strategy - z-score 밴드 이탈 후 평균 복귀를 노림
class MeanReversionStrategy : public IStrategy {
public:
    MeanReversionStrategy();
    explicit MeanReversionStrategy(const MeanReversionStrategyConfig& config);

    StrategyInfo getInfo() const override;

    StrategyOutput generateSignal(
        const std::string& symbol,
        const std::vector<Bar>& bars
    ) override;

    void setEnabled(bool enabled) override { enabled_ = enabled; }
    bool isEnabled() const override { return enabled_; }

    // 지표 계산 (데이터 부족 시 nullopt)
    std::optional<MeanReversionMetrics> computeMetrics(const std::vector<Bar>& bars) const;

    // 계산된 지표만으로 신호 결정 (순수 함수)
    StrategyOutput evaluate(const MeanReversionMetrics& metrics) const;

    const MeanReversionStrategyConfig& getConfig() const { return config_; }

private:
    MajorTrend detectMajorTrend(const std::vector<double>& closes) const;
    double calculateConfidence(const MeanReversionMetrics& metrics, Action action) const;

    MeanReversionStrategyConfig config_;
    bool enabled_;
};

} // namespace strategy
} // namespace tradeagent
