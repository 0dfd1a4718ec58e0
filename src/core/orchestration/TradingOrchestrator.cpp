#include "core/orchestration/TradingOrchestrator.h"

#include <stdexcept>

#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace tradeagent {
namespace core {

TradingOrchestrator::TradingOrchestrator(
    const OrchestratorConfig& config,
    std::shared_ptr<IMarketDataSource> data_source,
    std::shared_ptr<analytics::MarketAnalyzer> analyzer,
    std::shared_ptr<strategy::StrategyAgent> strategy_agent,
    std::shared_ptr<risk::RiskManager> risk_manager,
    std::shared_ptr<execution::ExecutionAgent> execution_agent,
    std::shared_ptr<IPositionStore> store
)
    : config_(config)
    , data_source_(std::move(data_source))
    , analyzer_(std::move(analyzer))
    , strategy_agent_(std::move(strategy_agent))
    , risk_manager_(std::move(risk_manager))
    , execution_agent_(std::move(execution_agent))
    , store_(std::move(store))
{
    if (!data_source_ || !analyzer_ || !strategy_agent_ || !risk_manager_ || !execution_agent_ || !store_) {
        throw std::invalid_argument("TradingOrchestrator requires all collaborators");
    }
}

CycleReport TradingOrchestrator::runTradingCycle() {
    CycleReport report;
    report.routine = "trade";
    report.started_at_ms = nowMs();
    LOG_INFO("===== Trading cycle: {} symbols =====", config_.universe.size());

    try {
        const auto bars = data_source_->getBars(config_.universe, config_.lookback_days);
        report.symbols_fetched = static_cast<int>(bars.size());
        if (bars.empty()) {
            report.errors.push_back("No market data available");
            LOG_ERROR("Trading cycle aborted: no market data");
            return report;
        }

        const auto overview = analyzer_->analyzeUniverse(bars);
        report.market_sentiment = analytics::toString(overview.sentiment);
        LOG_INFO("Market: {} (avg volatility {:.2f}%) - {}",
                 report.market_sentiment, overview.avg_volatility,
                 analyzer_->getMarketRecommendation(overview));

        const auto opportunities = strategy_agent_->scanUniverse(bars, overview.regimes);
        report.opportunities = static_cast<int>(opportunities.size());

        for (const auto& opportunity : opportunities) {
            executeOpportunity(opportunity, overview, report);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Trading cycle aborted: {}", e.what());
        report.errors.push_back(e.what());
    }

    logReport(report);
    return report;
}

void TradingOrchestrator::executeOpportunity(
    const strategy::CombinedSignal& opportunity,
    const analytics::MarketOverview& overview,
    CycleReport& report
) {
    const std::string& symbol = opportunity.symbol;

    // 접수됐지만 체결 미확인 주문이 있는 종목은 재진입 금지
    for (const auto& trade : execution_agent_->getUnconfirmedTrades()) {
        if (trade.symbol == symbol) {
            report.rejected.push_back(symbol + ": Unconfirmed order pending");
            return;
        }
    }

    double volatility_pct = 0.0;
    auto regime = overview.regimes.find(symbol);
    if (regime != overview.regimes.end()) {
        volatility_pct = regime->second.volatility_pct;
    }

    // 체결 대기 중인 진입 주문도 포지션 수 한도에 포함
    const auto positions = execution_agent_->getCommittedPositions();
    const auto validation = risk_manager_->validateTrade(opportunity, positions, volatility_pct);
    if (!validation.approved) {
        report.rejected.push_back(symbol + ": " + validation.reason);
        return;
    }
    report.approved++;

    execution::TradeRequest request;
    request.symbol = symbol;
    request.side = (opportunity.action == strategy::TradeAction::SELL) ? OrderSide::SELL : OrderSide::BUY;
    request.quantity = validation.sizing.quantity;
    request.price = opportunity.entry_price.value_or(0.0);
    request.stop_loss = opportunity.stop_loss
        ? *opportunity.stop_loss
        : risk_manager_->defaultStopLoss(request.price, opportunity.action);
    request.strategy = config_.strategy_tag;

    const auto result = execution_agent_->executeTrade(request);
    if (result.success) {
        report.executed++;
    } else if (result.unconfirmed) {
        report.unconfirmed++;
    } else {
        report.errors.push_back(symbol + ": " + result.error);
    }
}

CycleReport TradingOrchestrator::managePositions() {
    CycleReport report;
    report.routine = "manage";
    report.started_at_ms = nowMs();

    try {
        report.reconcile = execution_agent_->reconcileUnconfirmed();
        for (const auto& exit : report.reconcile.exits) {
            recordExit(exit, report);
        }

        const auto positions = execution_agent_->getPositions();
        LOG_INFO("===== Managing {} open positions =====", positions.size());

        for (auto position : positions) {
            const std::string symbol = position.symbol;
            const auto price = data_source_->getLatestPrice(symbol);
            if (!price) {
                LOG_WARN("{}: no latest price, skipping", symbol);
                continue;
            }
            report.positions_checked++;

            execution_agent_->markToMarket(symbol, *price);
            position.current_price = *price;

            if (position.hasPendingExit()) {
                LOG_INFO("{}: exit order {} pending, no new exit", symbol, position.pending_exit_order_id);
                continue;
            }

            std::optional<strategy::CombinedSignal> signal;
            const auto bars = data_source_->getBars({symbol}, config_.lookback_days);
            auto it = bars.find(symbol);
            if (it != bars.end() && !it->second.empty()) {
                const auto regime = analyzer_->analyzeSymbol(symbol, it->second);
                signal = strategy_agent_->generateCombinedSignal(symbol, it->second, &regime);
            }

            const auto decision = risk_manager_->checkExitConditions(position, *price, signal);
            if (!decision.should_exit) {
                continue;
            }

            LOG_INFO("{}: exit ({}) - {}", symbol, risk::toString(decision.exit_type), decision.reason);
            const auto closed = execution_agent_->closePosition(symbol, *price, decision.reason);
            recordExit(closed, report);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Position management aborted: {}", e.what());
        report.errors.push_back(e.what());
    }

    logReport(report);
    return report;
}

CycleReport TradingOrchestrator::morningRoutine() {
    CycleReport report;
    report.routine = "morning";
    report.started_at_ms = nowMs();
    LOG_INFO("===== Morning routine =====");

    try {
        // 같은 거래일 재실행에서는 일일 손익 유지
        risk_manager_->startTradingDay(utils::formatDate(nowMs()));
        const auto account = execution_agent_->getAccount();
        if (account.equity > 0.0) {
            risk_manager_->updatePortfolioValue(account.equity);
        } else {
            LOG_WARN("Account equity unavailable, keeping portfolio value {:.2f}",
                     risk_manager_->getState().portfolio_value);
        }
        LOG_INFO("Account: cash {:.2f}, equity {:.2f}, buying power {:.2f}",
                 account.cash, account.equity, account.buying_power);
    } catch (const std::exception& e) {
        LOG_ERROR("Morning routine aborted: {}", e.what());
        report.errors.push_back(e.what());
    }

    logReport(report);
    return report;
}

CycleReport TradingOrchestrator::endOfDayRoutine() {
    CycleReport report;
    report.routine = "eod";
    report.started_at_ms = nowMs();
    LOG_INFO("===== End of day =====");

    try {
        const auto performance = store_->getPerformanceSummary();
        LOG_INFO("Performance: {} trades, win rate {:.1f}%, total P&L {:+.2f}, best {:+.2f}, worst {:+.2f}",
                 performance.total_trades, performance.win_rate * 100.0, performance.total_pnl,
                 performance.best_trade, performance.worst_trade);

        const auto positions = execution_agent_->getPositions();
        const auto risk = risk_manager_->getRiskSummary(positions);
        LOG_INFO("Risk: portfolio {:.2f}, daily P&L {:+.2f}, positions {}/{}, exposure {:.1f}%, "
                 "risk to stops {:.2f}{}",
                 risk.portfolio_value, risk.daily_pnl, risk.open_positions, risk.max_positions,
                 risk.exposure_fraction * 100.0, risk.total_risk,
                 risk.circuit_breaker_active ? " [CIRCUIT BREAKER]" : "");

        if (!execution_agent_->cancelAllOrders()) {
            report.errors.push_back("Cancel all orders failed");
        }

        const long long now = nowMs();
        const std::string today = utils::formatDate(now);
        int trades_closed = 0;
        for (const auto& trade : store_->getTrades(TradeStatus::CLOSED)) {
            if (trade.pnl && trade.exit_timestamp && utils::formatDate(*trade.exit_timestamp) == today) {
                trades_closed++;
            }
        }

        DailyPerformance row;
        row.date = today;
        row.portfolio_value = risk.portfolio_value;
        row.daily_pnl = risk.daily_pnl;
        row.trades_closed = trades_closed;
        row.open_positions = risk.open_positions;
        store_->recordDailyPerformance(row);
    } catch (const std::exception& e) {
        LOG_ERROR("End of day routine aborted: {}", e.what());
        report.errors.push_back(e.what());
    }

    logReport(report);
    return report;
}

void TradingOrchestrator::recordExit(const execution::CloseResult& closed, CycleReport& report) {
    if (!closed.success) {
        report.errors.push_back(closed.symbol + ": " + closed.error);
        return;
    }
    if (!closed.partial) {
        report.positions_closed++;
    }
    report.realized_pnl += closed.pnl;
    risk_manager_->updateDailyPnl(closed.pnl);
}

std::vector<CycleReport> TradingOrchestrator::runOnce() {
    std::vector<CycleReport> reports;
    reports.push_back(morningRoutine());
    reports.push_back(managePositions());
    reports.push_back(runTradingCycle());
    reports.push_back(endOfDayRoutine());
    return reports;
}

void TradingOrchestrator::logReport(const CycleReport& report) {
    if (report.routine == "trade") {
        LOG_INFO("[trade] fetched {}, opportunities {}, approved {}, executed {}, unconfirmed {}, rejected {}",
                 report.symbols_fetched, report.opportunities, report.approved, report.executed,
                 report.unconfirmed, report.rejected.size());
        for (const auto& line : report.rejected) {
            LOG_INFO("  rejected {}", line);
        }
    } else if (report.routine == "manage") {
        LOG_INFO("[manage] checked {}, closed {}, realized {:+.2f}, reconciled {} (promoted {}, cancelled {})",
                 report.positions_checked, report.positions_closed, report.realized_pnl,
                 report.reconcile.checked, report.reconcile.promoted, report.reconcile.cancelled);
    }
    for (const auto& error : report.errors) {
        LOG_ERROR("[{}] {}", report.routine, error);
    }
}

} // namespace core
} // namespace tradeagent
