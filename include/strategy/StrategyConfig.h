#pragma once

namespace tradeagent {
namespace strategy {

struct MeanReversionStrategyConfig {
    int period = 20;
    double std_dev = 1.5;               // 진입 z-score 임계값
    int rsi_period = 14;
    double rsi_oversold = 40.0;         // LONG 확인
    double rsi_overbought = 60.0;       // SHORT 확인
    double exit_z_score = 0.5;          // |z| 가 이 값 미만이면 CLOSE
    double min_volume_ratio = 0.8;      // 최근 20봉 평균 대비
    double trend_band = 0.05;           // SMA50 대비 ±5% 밖이면 강한 추세
    double min_confidence = 0.4;
    double stop_loss_fraction = 0.02;
};

struct MomentumStrategyConfig {
    int fast_period = 10;
    int slow_period = 30;
    int rsi_period = 14;
    double rsi_overbought = 60.0;
    double rsi_oversold = 40.0;
    double strength_scale_pct = 5.0;    // |trend_strength| 5% 에서 강도 1.0
    double close_strength = 0.8;
    double stop_loss_fraction = 0.02;
};

} // namespace strategy
} // namespace tradeagent
