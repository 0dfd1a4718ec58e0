#pragma once

#include "common/Types.h"
#include <string>
#include <vector>
#include <optional>

namespace tradeagent {
namespace strategy {

// 개별 전략의 방향 신호
enum class Action {
    LONG,           // 매수 진입
    SHORT,          // 매도 진입
    CLOSE,          // 포지션 청산
    HOLD            // 관망
};

inline std::string toString(Action action) {
    switch (action) {
        case Action::LONG: return "long";
        case Action::SHORT: return "short";
        case Action::CLOSE: return "close";
        case Action::HOLD: return "hold";
    }
    return "hold";
}

// 전략 1개의 출력 (사이클마다 생성 후 폐기)
struct StrategyOutput {
    std::string strategy_name;
    Action action = Action::HOLD;
    double strength = 0.0;                  // 0.0 ~ 1.0
    std::optional<double> entry_price;
    std::optional<double> stop_loss;
    std::optional<double> target_price;
    std::string reason;

    static StrategyOutput hold(const std::string& name, const std::string& reason) {
        StrategyOutput out;
        out.strategy_name = name;
        out.reason = reason;
        return out;
    }
};

// 전략 기본 정보
struct StrategyInfo {
    std::string name;           // 전략 이름 (로그/태그용, 분기 조건으로 사용 금지)
    std::string description;
    std::string timeframe;      // 1d
    int min_bars;               // 신호 생성에 필요한 최소 봉 수

    StrategyInfo() : timeframe("1d"), min_bars(0) {}
};

// 전략 인터페이스 (모든 전략이 동일한 시그니처로 호출됨)
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyInfo getInfo() const = 0;
    virtual std::string getName() const { return getInfo().name; }

    // 신호 생성 (핵심 메서드) - bars 는 오름차순, 마지막 봉이 현재
    virtual StrategyOutput generateSignal(
        const std::string& symbol,
        const std::vector<Bar>& bars
    ) = 0;

    virtual void setEnabled(bool enabled) = 0;
    virtual bool isEnabled() const = 0;
};

} // namespace strategy
} // namespace tradeagent
