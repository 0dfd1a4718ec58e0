#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "common/TimeUtils.h"
#include "analytics/MarketAnalyzer.h"
#include "backtest/Backtester.h"
#include "backtest/DataHistory.h"
#include "core/orchestration/TradingOrchestrator.h"
#include "core/state/EventJournalJsonl.h"
#include "core/state/PositionStoreJson.h"
#include "data/AlpacaMarketDataSource.h"
#include "data/HistoricalDataSource.h"
#include "execution/AlpacaVenue.h"
#include "execution/ExecutionAgent.h"
#include "execution/SimulatedVenue.h"
#include "network/AlpacaHttpClient.h"
#include "risk/RiskManager.h"
#include "strategy/MeanReversionStrategy.h"
#include "strategy/MomentumStrategy.h"
#include "strategy/StrategyAgent.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace tradeagent;

namespace {

struct Runtime {
    std::shared_ptr<core::IMarketDataSource> data_source;
    std::shared_ptr<core::IPositionStore> store;
    std::shared_ptr<core::EventJournalJsonl> journal;
    std::shared_ptr<risk::RiskManager> risk_manager;
    std::shared_ptr<execution::ExecutionAgent> execution_agent;
    std::unique_ptr<core::TradingOrchestrator> orchestrator;
    engine::TradingMode mode = engine::TradingMode::PAPER;
};

void printUsage() {
    std::cout << "사용법: tradeagent [--config <path>] [--json] <command>\n\n";
    std::cout << "  run-once                 morning -> manage -> trade -> eod\n";
    std::cout << "  trade                    유니버스 스캔 후 신규 진입\n";
    std::cout << "  manage                   보유 포지션 청산 조건 점검\n";
    std::cout << "  morning                  일일 손익 초기화, 계좌 동기화\n";
    std::cout << "  eod                      장 마감 요약, 미체결 취소\n";
    std::cout << "  status                   포지션/성과/리스크 요약\n";
    std::cout << "  backtest <bars.csv|json> [mean_reversion|momentum]\n";
}

std::shared_ptr<strategy::IStrategy> createStrategy(const std::string& name, const Config& config) {
    if (name == "mean_reversion") {
        return std::make_shared<strategy::MeanReversionStrategy>(config.getMeanReversionConfig());
    }
    if (name == "momentum") {
        return std::make_shared<strategy::MomentumStrategy>(config.getMomentumConfig());
    }
    return nullptr;
}

std::shared_ptr<strategy::StrategyAgent> buildStrategyAgent(const Config& config) {
    strategy::StrategyAgentConfig agent_config;
    agent_config.high_volatility_pct = config.getRiskConfig().high_volatility_threshold;
    auto agent = std::make_shared<strategy::StrategyAgent>(agent_config);

    for (const auto& name : config.getEngineConfig().enabled_strategies) {
        auto strategy = createStrategy(name, config);
        if (!strategy) {
            LOG_WARN("Unknown strategy in config: {}", name);
            continue;
        }
        agent->registerStrategy(strategy);
    }
    return agent;
}

Runtime buildRuntime(const Config& config) {
    Runtime runtime;
    auto engine_config = config.getEngineConfig();
    auto risk_config = config.getRiskConfig();
    const auto alpaca = config.getAlpacaSettings();

    runtime.mode = engine_config.mode;
    if (runtime.mode == engine::TradingMode::LIVE && !config.hasCredentials()) {
        LOG_WARN("LIVE mode requested without Alpaca credentials, falling back to PAPER");
        runtime.mode = engine::TradingMode::PAPER;
    }

    // 데이터 소스: data_dir 지정 시 로컬 파일, 아니면 Alpaca Market Data
    if (!engine_config.data_dir.empty()) {
        const auto dir = utils::PathUtils::resolveRelativePath(engine_config.data_dir);
        runtime.data_source = std::make_shared<data::HistoricalDataSource>(dir.string());
        LOG_INFO("Market data: local bars in {}", dir.string());
    } else if (config.hasCredentials()) {
        auto data_client = std::make_shared<network::AlpacaHttpClient>(
            alpaca.data_url, config.getApiKey(), config.getSecretKey(), alpaca.timeout_seconds);
        runtime.data_source = std::make_shared<data::AlpacaMarketDataSource>(data_client, alpaca.feed);
        LOG_INFO("Market data: Alpaca ({}, feed {})", alpaca.data_url, alpaca.feed);
    } else {
        throw std::runtime_error("No market data source: set trading.data_dir or Alpaca credentials");
    }

    const auto state_dir = utils::PathUtils::resolveRelativePath(engine_config.state_dir);
    runtime.store = std::make_shared<core::PositionStoreJson>(state_dir / "positions.json");
    runtime.journal = std::make_shared<core::EventJournalJsonl>(state_dir / "execution_journal.jsonl");

    std::shared_ptr<core::IExecutionVenue> venue;
    if (runtime.mode == engine::TradingMode::LIVE) {
        auto trading_client = std::make_shared<network::AlpacaHttpClient>(
            alpaca.base_url, config.getApiKey(), config.getSecretKey(), alpaca.timeout_seconds);
        venue = std::make_shared<execution::AlpacaVenue>(trading_client);
        LOG_INFO("Execution: Alpaca {}", alpaca.base_url);
    } else {
        venue = std::make_shared<execution::SimulatedVenue>(risk_config.portfolio_value);
        LOG_INFO("Execution: simulated fills");
    }

    runtime.risk_manager = std::make_shared<risk::RiskManager>(risk_config);

    // 같은 날 이전 실행에서 실현된 손익 복원 (일일 손실 차단 유지)
    const std::string today = utils::formatDate(nowMs());
    runtime.risk_manager->startTradingDay(today);
    double realized_today = 0.0;
    for (const auto& trade : runtime.store->getTrades(core::TradeStatus::CLOSED)) {
        if (trade.pnl && trade.exit_timestamp && utils::formatDate(*trade.exit_timestamp) == today) {
            realized_today += *trade.pnl;
        }
    }
    if (realized_today != 0.0) {
        runtime.risk_manager->updateDailyPnl(realized_today);
    }
    runtime.execution_agent = std::make_shared<execution::ExecutionAgent>(
        venue, runtime.store, runtime.journal, engine_config.fill_poll);

    analytics::MarketAnalyzerConfig analyzer_config;
    analyzer_config.high_volatility_pct = risk_config.high_volatility_threshold;
    auto analyzer = std::make_shared<analytics::MarketAnalyzer>(analyzer_config);

    core::OrchestratorConfig orchestrator_config;
    orchestrator_config.universe = engine_config.universe;
    orchestrator_config.lookback_days = engine_config.lookback_days;

    runtime.orchestrator = std::make_unique<core::TradingOrchestrator>(
        orchestrator_config,
        runtime.data_source,
        analyzer,
        buildStrategyAgent(config),
        runtime.risk_manager,
        runtime.execution_agent,
        runtime.store
    );
    return runtime;
}

nlohmann::json reportToJson(const core::CycleReport& report) {
    nlohmann::json j;
    j["routine"] = report.routine;
    j["symbols_fetched"] = report.symbols_fetched;
    j["opportunities"] = report.opportunities;
    j["approved"] = report.approved;
    j["executed"] = report.executed;
    j["unconfirmed"] = report.unconfirmed;
    j["market_sentiment"] = report.market_sentiment;
    j["rejected"] = report.rejected;
    j["positions_checked"] = report.positions_checked;
    j["positions_closed"] = report.positions_closed;
    j["realized_pnl"] = report.realized_pnl;
    j["errors"] = report.errors;
    return j;
}

int printReports(const std::vector<core::CycleReport>& reports, bool json_mode) {
    bool ok = true;
    nlohmann::json out = nlohmann::json::array();
    for (const auto& report : reports) {
        ok = ok && report.ok();
        out.push_back(reportToJson(report));
    }
    if (json_mode) {
        std::cout << (reports.size() == 1 ? out[0].dump(2) : out.dump(2)) << "\n";
    }
    return ok ? 0 : 2;
}

int runStatus(Runtime& runtime, bool json_mode) {
    const auto positions = runtime.execution_agent->getPositions();
    const auto performance = runtime.store->getPerformanceSummary();
    const auto risk = runtime.risk_manager->getRiskSummary(positions);
    const auto unconfirmed = runtime.execution_agent->getUnconfirmedTrades();
    const auto open_orders = runtime.journal->unresolvedOrders();

    if (json_mode) {
        nlohmann::json j;
        j["mode"] = engine::toString(runtime.mode);
        j["positions"] = nlohmann::json::array();
        for (const auto& position : positions) {
            j["positions"].push_back(core::toJson(position));
        }
        j["unconfirmed_trades"] = nlohmann::json::array();
        for (const auto& trade : unconfirmed) {
            j["unconfirmed_trades"].push_back(core::toJson(trade));
        }
        j["unresolved_orders"] = nlohmann::json::array();
        for (const auto& trail : open_orders) {
            j["unresolved_orders"].push_back({
                {"order_id", trail.order_id},
                {"symbol", trail.symbol},
                {"side", trail.side},
                {"quantity", trail.quantity},
                {"reason", trail.reason},
                {"submitted_at", utils::formatIso(trail.submitted_ts_ms)},
                {"last_event", core::toString(trail.last_type)}
            });
        }
        j["performance"] = {
            {"total_trades", performance.total_trades},
            {"winning_trades", performance.winning_trades},
            {"losing_trades", performance.losing_trades},
            {"win_rate", performance.win_rate},
            {"total_pnl", performance.total_pnl},
            {"avg_win", performance.avg_win},
            {"avg_loss", performance.avg_loss}
        };
        j["risk"] = {
            {"portfolio_value", risk.portfolio_value},
            {"daily_pnl", risk.daily_pnl},
            {"open_positions", risk.open_positions},
            {"max_positions", risk.max_positions},
            {"exposure_fraction", risk.exposure_fraction},
            {"total_risk", risk.total_risk}
        };
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    std::cout << "\n모드: " << engine::toString(runtime.mode) << "\n";
    std::cout << "---------------------------------------------\n";
    std::cout << "보유 포지션: " << positions.size() << "/" << risk.max_positions << "\n";
    for (const auto& position : positions) {
        std::cout << "  - " << position.symbol
                  << " | qty=" << position.quantity
                  << " | entry=" << std::fixed << std::setprecision(2) << position.entry_price
                  << " | now=" << position.current_price
                  << " | stop=" << position.stop_loss
                  << " | uPnL=" << position.unrealized_pnl << "\n";
    }
    if (!unconfirmed.empty()) {
        std::cout << "체결 미확인 주문: " << unconfirmed.size() << "\n";
        for (const auto& trade : unconfirmed) {
            std::cout << "  - " << trade.symbol << " " << toString(trade.side)
                      << " " << trade.quantity << " (order " << trade.order_id << ")\n";
        }
    }
    if (!open_orders.empty()) {
        std::cout << "저널상 미결 주문: " << open_orders.size() << "\n";
        for (const auto& trail : open_orders) {
            std::cout << "  - " << trail.order_id << " " << trail.symbol << " " << trail.side
                      << " " << trail.quantity
                      << (trail.reason.empty() ? "" : " (" + trail.reason + ")") << "\n";
        }
    }
    std::cout << "총 거래 수:  " << performance.total_trades << "\n";
    std::cout << "승률:        " << std::setprecision(1) << (performance.win_rate * 100.0) << "%\n";
    std::cout << "누적 손익:   " << std::setprecision(2) << performance.total_pnl << "\n";
    std::cout << "노출 비중:   " << std::setprecision(1) << (risk.exposure_fraction * 100.0) << "%\n";
    std::cout << "---------------------------------------------\n";
    return 0;
}

int runBacktest(const Config& config, const std::string& path, const std::string& strategy_name, bool json_mode) {
    if (!std::filesystem::exists(path)) {
        std::cerr << "백테스트 파일을 찾을 수 없습니다: " << path << "\n";
        return 1;
    }
    auto strategy = createStrategy(strategy_name, config);
    if (!strategy) {
        std::cerr << "알 수 없는 전략: " << strategy_name << "\n";
        return 1;
    }

    const auto bars = backtest::DataHistory::load(path);
    if (bars.empty()) {
        std::cerr << "사용 가능한 봉 데이터가 없습니다: " << path << "\n";
        return 1;
    }

    const std::string symbol = std::filesystem::path(path).stem().string();
    backtest::Backtester backtester(config.getEngineConfig().backtest);
    const auto result = backtester.run(symbol, bars, *strategy);

    if (json_mode) {
        nlohmann::json j;
        j["strategy"] = result.strategy_name;
        j["symbol"] = result.symbol;
        j["bars_processed"] = result.bars_processed;
        j["total_trades"] = result.total_trades;
        j["winning_trades"] = result.winning_trades;
        j["losing_trades"] = result.losing_trades;
        j["win_rate"] = result.win_rate;
        j["total_return"] = result.total_return;
        j["total_return_percent"] = result.total_return_percent;
        j["avg_win"] = result.avg_win;
        j["avg_loss"] = result.avg_loss;
        j["profit_factor"] = result.profit_factor;
        j["max_drawdown"] = result.max_drawdown;
        j["final_capital"] = result.final_capital;
        j["trades"] = nlohmann::json::array();
        for (const auto& trade : result.trades) {
            j["trades"].push_back({
                {"side", toString(trade.side)},
                {"quantity", trade.quantity},
                {"entry_timestamp", trade.entry_timestamp},
                {"exit_timestamp", trade.exit_timestamp},
                {"entry_price", trade.entry_price},
                {"exit_price", trade.exit_price},
                {"pnl", trade.pnl},
                {"pnl_percent", trade.pnl_percent},
                {"exit_reason", trade.exit_reason}
            });
        }
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    backtest::Backtester::logResult(result);
    std::cout << "\n백테스트 결과 (" << result.strategy_name << ", " << result.symbol << ")\n";
    std::cout << "---------------------------------------------\n";
    std::cout << "초기 자본:   " << std::fixed << std::setprecision(2) << result.initial_capital << "\n";
    std::cout << "최종 자본:   " << result.final_capital << "\n";
    std::cout << "수익률:      " << result.total_return_percent << "%\n";
    std::cout << "MDD:         " << (result.max_drawdown * 100.0) << "%\n";
    std::cout << "총 거래 수:  " << result.total_trades << "\n";
    std::cout << "승리 거래:   " << result.winning_trades << "\n";
    std::cout << "패배 거래:   " << result.losing_trades << "\n";
    std::cout << "승률:        " << (result.win_rate * 100.0) << "%\n";
    std::cout << "평균 이익:   " << result.avg_win << "\n";
    std::cout << "평균 손실:   " << result.avg_loss << "\n";
    std::cout << "Profit Factor: " << std::setprecision(3) << result.profit_factor << "\n";
    std::cout << "---------------------------------------------\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.json";
    bool json_mode = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--json") {
            json_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        printUsage();
        return 1;
    }
    const std::string command = args[0];

    try {
        Config::getInstance().load(config_path);
        auto& config = Config::getInstance();

        Logger::getInstance().initialize(config.getLogDir());
        Logger::getInstance().setLevel(config.getLogLevel());

        if (command == "backtest") {
            if (args.size() < 2) {
                printUsage();
                return 1;
            }
            const std::string strategy_name = (args.size() > 2) ? args[2] : "mean_reversion";
            LOG_INFO("Starting Backtest Mode with file: {} ({})", args[1], strategy_name);
            return runBacktest(config, args[1], strategy_name, json_mode);
        }

        Runtime runtime = buildRuntime(config);
        LOG_INFO("========================================");
        LOG_INFO("tradeagent - {} mode, {} symbols", engine::toString(runtime.mode),
                 config.getUniverse().size());
        LOG_INFO("========================================");

        if (command == "run-once") {
            return printReports(runtime.orchestrator->runOnce(), json_mode);
        }
        if (command == "trade") {
            return printReports({runtime.orchestrator->runTradingCycle()}, json_mode);
        }
        if (command == "manage") {
            return printReports({runtime.orchestrator->managePositions()}, json_mode);
        }
        if (command == "morning") {
            return printReports({runtime.orchestrator->morningRoutine()}, json_mode);
        }
        if (command == "eod") {
            return printReports({runtime.orchestrator->endOfDayRoutine()}, json_mode);
        }
        if (command == "status") {
            return runStatus(runtime, json_mode);
        }

        std::cerr << "알 수 없는 명령: " << command << "\n";
        printUsage();
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "\n오류가 발생했습니다: " << e.what() << std::endl;
        return 1;
    }
}
