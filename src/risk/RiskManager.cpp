#include "risk/RiskManager.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace tradeagent {
namespace risk {

namespace {
std::string money(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}
}

std::string toString(ExitType type) {
    switch (type) {
        case ExitType::NONE: return "none";
        case ExitType::STOP_LOSS: return "stop_loss";
        case ExitType::SIGNAL: return "signal";
    }
    return "none";
}

RiskManager::RiskManager(const RiskConfig& config)
    : config_(config)
{
    state_.portfolio_value = config.portfolio_value;
    state_.daily_pnl = 0.0;

    LOG_INFO("RiskManager initialized: portfolio {:.2f}, max position {:.0f}%, max risk {:.1f}%, "
             "max positions {}, daily loss limit {:.1f}%",
             config_.portfolio_value, config_.max_position_fraction * 100.0,
             config_.max_risk_fraction * 100.0, config_.max_positions,
             config_.daily_loss_limit * 100.0);
}

PositionSizing RiskManager::calculatePositionSize(
    double entry_price,
    double stop_loss,
    double volatility_pct
) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    PositionSizing sizing;
    const double portfolio = state_.portfolio_value;

    // 1) 주당 위험
    sizing.risk_per_share = std::abs(entry_price - stop_loss);
    if (entry_price <= 0.0 || sizing.risk_per_share <= 0.0) {
        sizing.reason = "Invalid stop loss (zero risk per share)";
        return sizing;
    }
    if (portfolio <= 0.0) {
        sizing.reason = "Portfolio value is not positive";
        return sizing;
    }

    // 2) 최대 위험 금액 기준 수량
    const double max_risk = portfolio * config_.max_risk_fraction;
    long long quantity = static_cast<long long>(std::floor(max_risk / sizing.risk_per_share));

    // 3) 포지션 비중 상한 먼저 적용
    const double max_position_value = portfolio * config_.max_position_fraction;
    if (static_cast<double>(quantity) * entry_price > max_position_value) {
        quantity = static_cast<long long>(std::floor(max_position_value / entry_price));
        sizing.capped = true;
    }

    // 4) 그 다음 고변동성이면 절반
    if (volatility_pct > config_.high_volatility_threshold) {
        quantity = quantity / 2;
        sizing.volatility_halved = true;
    }

    sizing.quantity = static_cast<int>(std::max(0LL, quantity));
    sizing.position_value = sizing.quantity * entry_price;
    sizing.risk_amount = sizing.quantity * sizing.risk_per_share;
    sizing.risk_percent = sizing.risk_amount / portfolio * 100.0;
    sizing.position_percent = sizing.position_value / portfolio * 100.0;

    if (sizing.quantity <= 0) {
        sizing.reason = "Position size too small (risk budget below one share)";
        return sizing;
    }

    sizing.approved = true;
    sizing.reason = "Position sized: " + std::to_string(sizing.quantity) + " shares";
    return sizing;
}

double RiskManager::defaultStopLoss(double entry_price, strategy::TradeAction action) const {
    if (action == strategy::TradeAction::SELL) {
        return entry_price * (1.0 + config_.stop_loss_fraction);
    }
    return entry_price * (1.0 - config_.stop_loss_fraction);
}

TradeValidation RiskManager::validateTrade(
    const strategy::CombinedSignal& signal,
    const std::vector<core::PositionRecord>& open_positions,
    double volatility_pct
) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    TradeValidation result;
    const double portfolio = state_.portfolio_value;

    // 1) 일일 손실 한도 (리셋 전까지 전체 진입 차단)
    const double loss_limit = portfolio * config_.daily_loss_limit;
    if (state_.daily_pnl < -loss_limit) {
        result.reason = "Daily loss limit reached (" + money(state_.daily_pnl) +
                        " < -" + money(loss_limit) + ")";
        LOG_WARN("{} rejected: {}", signal.symbol, result.reason);
        return result;
    }
    result.validations.push_back("daily_loss_ok");

    // 2) 최대 포지션 수
    if (static_cast<int>(open_positions.size()) >= config_.max_positions) {
        result.reason = "Max positions reached (" + std::to_string(open_positions.size()) +
                        "/" + std::to_string(config_.max_positions) + ")";
        LOG_WARN("{} rejected: {}", signal.symbol, result.reason);
        return result;
    }
    result.validations.push_back("position_count_ok");

    // 3) 동일 종목 추가 진입 금지
    for (const auto& position : open_positions) {
        if (position.symbol == signal.symbol) {
            result.reason = "Position already open for " + signal.symbol;
            LOG_WARN("{} rejected: {}", signal.symbol, result.reason);
            return result;
        }
    }
    result.validations.push_back("no_existing_position");

    // 4) 최소 신뢰도
    if (signal.confidence < config_.min_confidence) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2)
            << "Confidence too low (" << signal.confidence << " < " << config_.min_confidence << ")";
        result.reason = oss.str();
        LOG_WARN("{} rejected: {}", signal.symbol, result.reason);
        return result;
    }
    result.validations.push_back("confidence_ok");

    // 5) 사이징 승인
    if (!signal.entry_price || *signal.entry_price <= 0.0) {
        result.reason = "Missing entry price";
        LOG_WARN("{} rejected: {}", signal.symbol, result.reason);
        return result;
    }
    const double entry = *signal.entry_price;
    const double stop = signal.stop_loss ? *signal.stop_loss : defaultStopLoss(entry, signal.action);
    result.sizing = calculatePositionSize(entry, stop, volatility_pct);
    if (!result.sizing.approved) {
        result.reason = result.sizing.reason;
        LOG_WARN("{} rejected: {}", signal.symbol, result.reason);
        return result;
    }
    result.validations.push_back("position_size_ok");

    // 6) 가용 자본
    const double capital_limit = portfolio * config_.capital_usage_limit;
    if (result.sizing.position_value > capital_limit) {
        result.reason = "Insufficient capital (" + money(result.sizing.position_value) +
                        " > " + money(capital_limit) + ")";
        LOG_WARN("{} rejected: {}", signal.symbol, result.reason);
        return result;
    }
    result.validations.push_back("capital_ok");

    result.approved = true;
    result.reason = "All checks passed";
    LOG_INFO("{} approved: {} shares, value {:.2f} ({:.1f}%), risk {:.2f} ({:.2f}%)",
             signal.symbol, result.sizing.quantity, result.sizing.position_value,
             result.sizing.position_percent, result.sizing.risk_amount, result.sizing.risk_percent);
    return result;
}

ExitDecision RiskManager::checkExitConditions(
    const core::PositionRecord& position,
    double current_price,
    const std::optional<strategy::CombinedSignal>& signal
) const {
    ExitDecision decision;
    const bool is_long = position.isLong();

    // 1) 손절 (무조건 우선)
    if (position.stop_loss > 0.0) {
        const bool breached = is_long ? (current_price <= position.stop_loss)
                                      : (current_price >= position.stop_loss);
        if (breached) {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(2)
                << "Stop loss hit (price " << current_price << ", stop " << position.stop_loss << ")";
            decision.should_exit = true;
            decision.exit_type = ExitType::STOP_LOSS;
            decision.reason = oss.str();
            return decision;
        }
    }

    if (!signal) {
        decision.reason = "Hold";
        return decision;
    }

    // 2) 명시적 청산 신호
    if (signal->action == strategy::TradeAction::CLOSE) {
        decision.should_exit = true;
        decision.exit_type = ExitType::SIGNAL;
        decision.reason = "Close signal: " + signal->reasoning;
        return decision;
    }

    // 3) 보유 방향과 반대 신호
    if ((is_long && signal->action == strategy::TradeAction::SELL) ||
        (!is_long && signal->action == strategy::TradeAction::BUY)) {
        decision.should_exit = true;
        decision.exit_type = ExitType::SIGNAL;
        decision.reason = "Opposite signal: " + strategy::toString(signal->action);
        return decision;
    }

    decision.reason = "Hold";
    return decision;
}

void RiskManager::updatePortfolioValue(double value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (value <= 0.0) {
        LOG_WARN("Ignoring non-positive portfolio value {:.2f}", value);
        return;
    }
    state_.portfolio_value = value;
    LOG_INFO("Portfolio value updated: {:.2f}", value);
}

void RiskManager::updateDailyPnl(double realized_pnl) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    state_.daily_pnl += realized_pnl;
    LOG_INFO("Daily P&L: {:.2f} ({:+.2f})", state_.daily_pnl, realized_pnl);

    if (isDailyLossLimitExceeded()) {
        LOG_ERROR("Daily loss limit exceeded ({:.2f}), new entries blocked until reset", state_.daily_pnl);
    }
}

void RiskManager::resetDailyPnl() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    state_.daily_pnl = 0.0;
    LOG_INFO("Daily P&L reset");
}

bool RiskManager::startTradingDay(const std::string& date) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (state_.trading_day == date) {
        LOG_INFO("Trading day {} already started, daily P&L kept at {:.2f}", date, state_.daily_pnl);
        return false;
    }
    state_.trading_day = date;
    resetDailyPnl();
    return true;
}

bool RiskManager::isDailyLossLimitExceeded() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.daily_pnl < -(state_.portfolio_value * config_.daily_loss_limit);
}

RiskState RiskManager::getState() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_;
}

RiskSummary RiskManager::getRiskSummary(const std::vector<core::PositionRecord>& positions) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    RiskSummary summary;
    summary.portfolio_value = state_.portfolio_value;
    summary.daily_pnl = state_.daily_pnl;
    summary.daily_loss_limit_amount = state_.portfolio_value * config_.daily_loss_limit;
    summary.remaining_daily_risk = std::max(0.0, summary.daily_loss_limit_amount + state_.daily_pnl);
    summary.open_positions = static_cast<int>(positions.size());
    summary.max_positions = config_.max_positions;

    for (const auto& position : positions) {
        const double qty = std::abs(position.quantity);
        const double price = position.current_price > 0.0 ? position.current_price : position.entry_price;
        summary.total_exposure += qty * price;
        if (position.stop_loss > 0.0) {
            summary.total_risk += qty * std::abs(position.entry_price - position.stop_loss);
        }
    }
    if (state_.portfolio_value > 0.0) {
        summary.exposure_fraction = summary.total_exposure / state_.portfolio_value;
    }
    summary.circuit_breaker_active = isDailyLossLimitExceeded();
    return summary;
}

void RiskManager::setMaxPositions(int max_positions) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    config_.max_positions = max_positions;
}

void RiskManager::setDailyLossLimit(double fraction) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    config_.daily_loss_limit = fraction;
}

} // namespace risk
} // namespace tradeagent
