#include "common/Config.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>

// Simple manual test runner
int main() {
    using namespace tradeagent;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();
    config.reset();

    // 1. Defaults
    {
        auto risk = config.getRiskConfig();
        assert(std::abs(risk.max_position_fraction - 0.20) < 1e-9);
        assert(std::abs(risk.max_risk_fraction - 0.02) < 1e-9);
        assert(risk.max_positions == 5);
        assert(config.getEngineConfig().mode == engine::TradingMode::PAPER);
        assert(config.getEngineConfig().lookback_days == 60);
        assert(!config.getUniverse().empty());
        assert(config.getAlpacaSettings().feed == "iex");
    }

    // 2. JSON sections
    {
        nlohmann::json j = {
            {"alpaca", {{"api_key", "SHOULD_BE_IGNORED"}, {"feed", "sip"}}},
            {"logging", {{"level", "debug"}}},
            {"trading", {
                {"mode", "live"},
                {"universe", {"aapl", "MSFT", "AAPL", " nvda "}},
                {"lookback_days", 90},
                {"portfolio_value", 25000.0},
                {"max_position_fraction", 0.1},
                {"max_positions", 3},
                {"stop_loss_fraction", 0.03},
                {"daily_loss_limit", 5.0}          // 퍼센트 값 -> 거부, 기본값 유지
            }},
            {"execution", {{"fill_poll_attempts", 7}, {"fill_poll_max_delay_ms", 1000}}},
            {"backtest", {{"initial_capital", 5000.0}, {"warmup_bars", 40}}},
            {"strategies", {
                {"mean_reversion", {{"period", 15}, {"std_dev", 2.0}}},
                {"momentum", {{"fast_period", 5}, {"slow_period", 20}}}
            }}
        };
        config.loadFromJson(j);

        assert(config.getApiKey().empty());
        assert(config.getAlpacaSettings().feed == "sip");
        assert(config.getLogLevel() == "debug");

        auto engine_config = config.getEngineConfig();
        assert(engine_config.mode == engine::TradingMode::LIVE);
        assert(engine_config.lookback_days == 90);
        assert(engine_config.fill_poll.max_attempts == 7);
        assert(engine_config.fill_poll.max_delay_ms == 1000);
        assert(std::abs(engine_config.backtest.initial_capital - 5000.0) < 1e-9);
        assert(engine_config.backtest.warmup_bars == 40);

        auto universe = config.getUniverse();
        assert(universe.size() == 3);
        assert(universe[0] == "AAPL");
        assert(universe[1] == "MSFT");
        assert(universe[2] == "NVDA");

        auto risk = config.getRiskConfig();
        assert(std::abs(risk.portfolio_value - 25000.0) < 1e-9);
        assert(std::abs(risk.max_position_fraction - 0.1) < 1e-9);
        assert(risk.max_positions == 3);
        assert(std::abs(risk.daily_loss_limit - 0.05) < 1e-9);
        assert(std::abs(risk.stop_loss_fraction - 0.03) < 1e-9);

        auto mr = config.getMeanReversionConfig();
        assert(mr.period == 15);
        assert(std::abs(mr.std_dev - 2.0) < 1e-9);
        assert(std::abs(mr.stop_loss_fraction - 0.03) < 1e-9);

        auto momentum = config.getMomentumConfig();
        assert(momentum.fast_period == 5);
        assert(momentum.slow_period == 20);
    }

    // 3. Missing file -> defaults kept
    {
        config.reset();
        config.load("does/not/exist/config.json");
        assert(config.getRiskConfig().max_positions == 5);
    }

    // 4. File on disk
    {
        const auto path = std::filesystem::temp_directory_path() / "tradeagent_test_config.json";
        {
            std::ofstream out(path);
            out << R"({"trading": {"max_positions": 8, "min_confidence": 0.45}})";
        }
        config.reset();
        config.load(path.string());
        assert(config.getRiskConfig().max_positions == 8);
        assert(std::abs(config.getRiskConfig().min_confidence - 0.45) < 1e-9);
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    config.reset();
    std::cout << "[TEST] Config Test PASSED!" << std::endl;

    return 0;
}
