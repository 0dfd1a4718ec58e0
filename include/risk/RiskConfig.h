#pragma once

namespace tradeagent {
namespace risk {

// 모든 비율은 [0,1] 분수. high_volatility_threshold 만 % 단위 (MarketRegime::volatility_pct 와 비교)
struct RiskConfig {
    double portfolio_value = 10000.0;
    double max_position_fraction = 0.20;
    double max_risk_fraction = 0.02;
    int max_positions = 5;
    double daily_loss_limit = 0.05;
    double stop_loss_fraction = 0.02;
    double min_confidence = 0.3;
    double capital_usage_limit = 0.9;
    double high_volatility_threshold = 3.0;
};

} // namespace risk
} // namespace tradeagent
