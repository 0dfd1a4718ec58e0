#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace tradeagent {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeStrategyName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    name = trimCopy(name);

    if (name == "meanreversion" || name == "mean-reversion") {
        return "mean_reversion";
    }
    return name;
}

std::string normalizeSymbol(std::string symbol) {
    symbol = trimCopy(symbol);
    std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return symbol;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

// 분수 설정값이 퍼센트(예: 20)로 들어온 경우 거부하고 기본값 유지
double readFraction(const nlohmann::json& node, const char* key, double fallback) {
    const double value = node.value(key, fallback);
    if (value < 0.0 || value > 1.0) {
        std::cout << "경고: " << key << "=" << value
                  << " 는 [0,1] 범위를 벗어납니다. 기본값 " << fallback << " 사용" << std::endl;
        return fallback;
    }
    return value;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config() {
    engine_config_.universe = defaultUniverse();
}

std::vector<std::string> Config::defaultUniverse() {
    return {
        // EV / clean energy
        "TSLA", "RIVN", "LCID", "ENPH", "SEDG", "FSLR", "CHPT", "BLNK",
        // cybersecurity
        "CRWD", "PANW", "ZS", "S", "OKTA", "NET", "FTNT",
        // semiconductors
        "NVDA", "AMD", "AVGO", "ARM", "SMCI", "MU",
        // software
        "MSFT", "NOW", "DDOG", "SNOW", "MDB", "CRM",
        // fintech
        "COIN", "SQ", "PYPL", "AFRM",
        // speculative growth
        "PLTR", "RKLB", "IONQ"
    };
}

void Config::reset() {
    api_key_.clear();
    secret_key_.clear();
    log_level_ = "info";
    log_dir_ = "logs";
    engine_config_ = engine::EngineConfig();
    engine_config_.universe = defaultUniverse();
    risk_config_ = risk::RiskConfig();
    alpaca_settings_ = AlpacaSettings();
    mean_reversion_config_ = strategy::MeanReversionStrategyConfig();
    momentum_config_ = strategy::MomentumStrategyConfig();
}

void Config::load(const std::string& path) {
    api_key_ = readEnvVar("ALPACA_API_KEY");
    secret_key_ = readEnvVar("ALPACA_SECRET_KEY");
    if (!hasCredentials()) {
        std::cout << "경고: ALPACA_API_KEY 또는 ALPACA_SECRET_KEY 환경 변수가 비어 있습니다. "
                  << "시뮬레이션 모드로 동작합니다." << std::endl;
    }

    try {
        const std::filesystem::path config_path = utils::PathUtils::resolveRelativePath(path);

        std::cout << "설정 파일 경로: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "경고: 설정 파일을 찾을 수 없습니다: " << config_path << std::endl;
            std::cout << "기본값을 사용합니다." << std::endl;
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "경고: 설정 파일을 열 수 없습니다." << std::endl;
            return;
        }

        nlohmann::json j;
        file >> j;
        loadFromJson(j);

        std::cout << "설정 파일 로드 완료" << std::endl;
        std::cout << "Config Loaded: Mode=" << engine::toString(engine_config_.mode)
                  << ", Universe=" << engine_config_.universe.size()
                  << ", Portfolio=" << risk_config_.portfolio_value << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "설정 로드 오류: " << e.what() << std::endl;
    }
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (j.contains("alpaca")) {
        auto& a = j["alpaca"];
        const std::string file_api_key = trimCopy(a.value("api_key", ""));
        const std::string file_secret_key = trimCopy(a.value("secret_key", ""));
        if (!file_api_key.empty() || !file_secret_key.empty()) {
            std::cout << "경고: config alpaca 키 값은 무시됩니다. 환경 변수(ALPACA_API_KEY/ALPACA_SECRET_KEY)를 사용하세요."
                      << std::endl;
        }

        alpaca_settings_.base_url = a.value("base_url", alpaca_settings_.base_url);
        alpaca_settings_.data_url = a.value("data_url", alpaca_settings_.data_url);
        alpaca_settings_.feed = a.value("feed", alpaca_settings_.feed);
        alpaca_settings_.timeout_seconds = a.value("timeout_seconds", alpaca_settings_.timeout_seconds);
    }

    if (j.contains("logging")) {
        auto& l = j["logging"];
        log_level_ = l.value("level", log_level_);
        log_dir_ = l.value("dir", log_dir_);
    }

    if (j.contains("trading")) {
        auto& t = j["trading"];

        std::string mode_str = t.value("mode", "PAPER");
        std::transform(mode_str.begin(), mode_str.end(), mode_str.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        engine_config_.mode = (mode_str == "LIVE") ? engine::TradingMode::LIVE : engine::TradingMode::PAPER;

        if (t.contains("universe")) {
            std::vector<std::string> universe;
            for (const auto& symbol : t["universe"].get<std::vector<std::string>>()) {
                const auto normalized = normalizeSymbol(symbol);
                if (!normalized.empty() &&
                    std::find(universe.begin(), universe.end(), normalized) == universe.end()) {
                    universe.push_back(normalized);
                }
            }
            engine_config_.universe = universe;
        }
        engine_config_.lookback_days = t.value("lookback_days", 60);
        engine_config_.state_dir = t.value("state_dir", std::string("state"));
        engine_config_.data_dir = t.value("data_dir", std::string());

        if (t.contains("enabled_strategies")) {
            engine_config_.enabled_strategies = t["enabled_strategies"].get<std::vector<std::string>>();
            for (auto& strategy_name : engine_config_.enabled_strategies) {
                strategy_name = normalizeStrategyName(strategy_name);
            }
        }

        risk_config_.portfolio_value = t.value("portfolio_value", 10000.0);
        risk_config_.max_position_fraction = readFraction(t, "max_position_fraction", 0.20);
        risk_config_.max_risk_fraction = readFraction(t, "max_risk_fraction", 0.02);
        risk_config_.max_positions = t.value("max_positions", 5);
        risk_config_.daily_loss_limit = readFraction(t, "daily_loss_limit", 0.05);
        risk_config_.stop_loss_fraction = readFraction(t, "stop_loss_fraction", 0.02);
        risk_config_.min_confidence = readFraction(t, "min_confidence", 0.3);
        risk_config_.capital_usage_limit = readFraction(t, "capital_usage_limit", 0.9);
        risk_config_.high_volatility_threshold = t.value("high_volatility_threshold", 3.0);

        // 전략 손절폭은 리스크 설정을 따름
        mean_reversion_config_.stop_loss_fraction = risk_config_.stop_loss_fraction;
        momentum_config_.stop_loss_fraction = risk_config_.stop_loss_fraction;
    }

    if (j.contains("execution")) {
        auto& e = j["execution"];
        engine_config_.fill_poll.max_attempts = std::max(1, e.value("fill_poll_attempts", 5));
        engine_config_.fill_poll.initial_delay_ms = e.value("fill_poll_initial_delay_ms", 500);
        engine_config_.fill_poll.backoff_multiplier = e.value("fill_poll_backoff_multiplier", 2.0);
        engine_config_.fill_poll.max_delay_ms = e.value("fill_poll_max_delay_ms", 4000);
    }

    if (j.contains("backtest")) {
        auto& b = j["backtest"];
        engine_config_.backtest.initial_capital = b.value("initial_capital", 10000.0);
        engine_config_.backtest.warmup_bars = b.value("warmup_bars", 50);
        engine_config_.backtest.position_fraction = readFraction(b, "position_fraction", 0.2);
        engine_config_.backtest.stop_loss_fraction = readFraction(b, "stop_loss_fraction", 0.02);
    }

    if (j.contains("strategies") && j["strategies"].contains("mean_reversion")) {
        auto& s = j["strategies"]["mean_reversion"];
        mean_reversion_config_.period = s.value("period", 20);
        mean_reversion_config_.std_dev = s.value("std_dev", 1.5);
        mean_reversion_config_.rsi_period = s.value("rsi_period", 14);
        mean_reversion_config_.rsi_oversold = s.value("rsi_oversold", 40.0);
        mean_reversion_config_.rsi_overbought = s.value("rsi_overbought", 60.0);
        mean_reversion_config_.exit_z_score = s.value("exit_z_score", 0.5);
        mean_reversion_config_.min_volume_ratio = s.value("min_volume_ratio", 0.8);
        mean_reversion_config_.trend_band = s.value("trend_band", 0.05);
        mean_reversion_config_.min_confidence = s.value("min_confidence", 0.4);
    }

    if (j.contains("strategies") && j["strategies"].contains("momentum")) {
        auto& s = j["strategies"]["momentum"];
        momentum_config_.fast_period = s.value("fast_period", 10);
        momentum_config_.slow_period = s.value("slow_period", 30);
        momentum_config_.rsi_period = s.value("rsi_period", 14);
        momentum_config_.rsi_overbought = s.value("rsi_overbought", 60.0);
        momentum_config_.rsi_oversold = s.value("rsi_oversold", 40.0);
        momentum_config_.strength_scale_pct = s.value("strength_scale_pct", 5.0);
    }
}

} // namespace tradeagent
