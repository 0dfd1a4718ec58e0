#pragma once

#include "strategy/IStrategy.h"
#include "strategy/StrategyConfig.h"

namespace tradeagent {
namespace strategy {

// Momentum Strategy - 단기/장기 SMA 교차 + RSI 필터
class MomentumStrategy : public IStrategy {
public:
    MomentumStrategy();
    explicit MomentumStrategy(const MomentumStrategyConfig& config);

    StrategyInfo getInfo() const override;

    StrategyOutput generateSignal(
        const std::string& symbol,
        const std::vector<Bar>& bars
    ) override;

    void setEnabled(bool enabled) override { enabled_ = enabled; }
    bool isEnabled() const override { return enabled_; }

    const MomentumStrategyConfig& getConfig() const { return config_; }

private:
    MomentumStrategyConfig config_;
    bool enabled_;
};

} // namespace strategy
} // namespace tradeagent
