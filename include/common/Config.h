#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"
#include "risk/RiskConfig.h"
#include "strategy/StrategyConfig.h"

namespace tradeagent {

struct AlpacaSettings {
    std::string base_url = "https://paper-api.alpaca.markets";
    std::string data_url = "https://data.alpaca.markets";
    std::string feed = "iex";
    long timeout_seconds = 30;
};

class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);
    // 파싱된 JSON 에서 직접 로드 (load() 와 테스트가 공유)
    void loadFromJson(const nlohmann::json& j);
    void reset();

    std::string getApiKey() const { return api_key_; }
    std::string getSecretKey() const { return secret_key_; }
    bool hasCredentials() const { return !api_key_.empty() && !secret_key_.empty(); }

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    risk::RiskConfig getRiskConfig() const { return risk_config_; }
    AlpacaSettings getAlpacaSettings() const { return alpaca_settings_; }
    std::vector<std::string> getUniverse() const { return engine_config_.universe; }

    strategy::MeanReversionStrategyConfig getMeanReversionConfig() const { return mean_reversion_config_; }
    strategy::MomentumStrategyConfig getMomentumConfig() const { return momentum_config_; }

    static std::vector<std::string> defaultUniverse();

private:
    Config();
    std::string api_key_;
    std::string secret_key_;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";

    engine::EngineConfig engine_config_;
    risk::RiskConfig risk_config_;
    AlpacaSettings alpaca_settings_;
    strategy::MeanReversionStrategyConfig mean_reversion_config_;
    strategy::MomentumStrategyConfig momentum_config_;
};

} // namespace tradeagent
