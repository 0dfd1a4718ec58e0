#pragma once

#include <string>
#include <vector>

namespace tradeagent {
namespace engine {

// 거래 모드
enum class TradingMode {
    LIVE,           // 브로커 API 로 실주문
    PAPER,          // 시뮬레이션 체결
    BACKTEST        // 과거 데이터 재생
};

inline std::string toString(TradingMode mode) {
    switch (mode) {
        case TradingMode::LIVE: return "LIVE";
        case TradingMode::PAPER: return "PAPER";
        case TradingMode::BACKTEST: return "BACKTEST";
    }
    return "PAPER";
}

// 실주문 체결 확인 폴링 (지수 백오프, 총 대기 시간 상한 있음)
struct FillPollPolicy {
    int max_attempts = 5;
    int initial_delay_ms = 500;
    double backoff_multiplier = 2.0;
    int max_delay_ms = 4000;
};

struct BacktestSettings {
    double initial_capital = 10000.0;
    int warmup_bars = 50;
    double position_fraction = 0.2;
    double stop_loss_fraction = 0.02;
};

// 엔진 설정
struct EngineConfig {
    TradingMode mode;
    std::vector<std::string> universe;
    int lookback_days;
    std::string state_dir;
    std::string data_dir;               // PAPER 모드에서 사용할 과거 봉 디렉토리 (비어 있으면 브로커 데이터 API)
    std::vector<std::string> enabled_strategies;
    FillPollPolicy fill_poll;
    BacktestSettings backtest;

    EngineConfig()
        : mode(TradingMode::PAPER)
        , lookback_days(60)
        , state_dir("state")
        , enabled_strategies({"mean_reversion", "momentum"})
    {}
};

} // namespace engine
} // namespace tradeagent
