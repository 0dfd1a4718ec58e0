#include "core/state/InMemoryPositionStore.h"

#include <algorithm>
#include <stdexcept>

namespace tradeagent {
namespace core {

void InMemoryPositionStore::upsertPosition(const PositionRecord& position) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    positions_[position.symbol] = position;
    onChanged();
}

std::vector<PositionRecord> InMemoryPositionStore::getOpenPositions() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<PositionRecord> out;
    out.reserve(positions_.size());
    for (const auto& [symbol, position] : positions_) {
        out.push_back(position);
    }
    return out;
}

std::optional<PositionRecord> InMemoryPositionStore::getPosition(const std::string& symbol) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryPositionStore::removePosition(const std::string& symbol) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const bool removed = positions_.erase(symbol) > 0;
    if (removed) {
        onChanged();
    }
    return removed;
}

std::string InMemoryPositionStore::logTrade(const TradeRecord& trade) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    TradeRecord stored = trade;
    if (stored.id.empty()) {
        stored.id = "T" + std::to_string(next_trade_seq_);
    }
    next_trade_seq_++;
    trades_.push_back(stored);
    onChanged();
    return stored.id;
}

void InMemoryPositionStore::closeTrade(const std::string& trade_id, double exit_price, long long exit_timestamp) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = std::find_if(trades_.begin(), trades_.end(),
                           [&](const TradeRecord& t) { return t.id == trade_id; });
    if (it == trades_.end()) {
        throw std::runtime_error("Unknown trade: " + trade_id);
    }
    if (it->status == TradeStatus::CLOSED) {
        throw std::runtime_error("Trade already closed: " + trade_id);
    }

    const double pnl = (it->side == OrderSide::BUY)
        ? (exit_price - it->entry_price) * it->quantity
        : (it->entry_price - exit_price) * it->quantity;
    const double cost_basis = it->entry_price * it->quantity;

    it->exit_price = exit_price;
    it->exit_timestamp = exit_timestamp;
    it->pnl = pnl;
    it->pnl_percent = (cost_basis != 0.0) ? pnl / cost_basis * 100.0 : 0.0;
    it->status = TradeStatus::CLOSED;
    onChanged();
}

void InMemoryPositionStore::updateTrade(const TradeRecord& trade) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = std::find_if(trades_.begin(), trades_.end(),
                           [&](const TradeRecord& t) { return t.id == trade.id; });
    if (it == trades_.end()) {
        throw std::runtime_error("Unknown trade: " + trade.id);
    }
    *it = trade;
    onChanged();
}

std::optional<TradeRecord> InMemoryPositionStore::getTrade(const std::string& trade_id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (const auto& trade : trades_) {
        if (trade.id == trade_id) {
            return trade;
        }
    }
    return std::nullopt;
}

std::vector<TradeRecord> InMemoryPositionStore::getOpenTrades() const {
    return getTrades(TradeStatus::OPEN);
}

std::vector<TradeRecord> InMemoryPositionStore::getTrades(std::optional<TradeStatus> status) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<TradeRecord> out;
    for (const auto& trade : trades_) {
        if (!status || trade.status == *status) {
            out.push_back(trade);
        }
    }
    return out;
}

void InMemoryPositionStore::recordDailyPerformance(const DailyPerformance& row) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = std::find_if(daily_performance_.begin(), daily_performance_.end(),
                           [&](const DailyPerformance& d) { return d.date == row.date; });
    if (it != daily_performance_.end()) {
        *it = row;
    } else {
        daily_performance_.push_back(row);
    }
    onChanged();
}

std::vector<DailyPerformance> InMemoryPositionStore::getDailyPerformance() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return daily_performance_;
}

PerformanceSummary InMemoryPositionStore::getPerformanceSummary() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    PerformanceSummary summary;
    double win_sum = 0.0;
    double loss_sum = 0.0;
    bool first = true;

    for (const auto& trade : trades_) {
        if (trade.status != TradeStatus::CLOSED || !trade.pnl) {
            continue;
        }
        const double pnl = *trade.pnl;
        summary.total_trades++;
        summary.total_pnl += pnl;
        if (pnl > 0.0) {
            summary.winning_trades++;
            win_sum += pnl;
        } else {
            summary.losing_trades++;
            loss_sum += pnl;
        }
        if (first) {
            summary.best_trade = pnl;
            summary.worst_trade = pnl;
            first = false;
        } else {
            summary.best_trade = std::max(summary.best_trade, pnl);
            summary.worst_trade = std::min(summary.worst_trade, pnl);
        }
    }

    if (summary.total_trades > 0) {
        summary.win_rate = static_cast<double>(summary.winning_trades) / summary.total_trades;
    }
    if (summary.winning_trades > 0) summary.avg_win = win_sum / summary.winning_trades;
    if (summary.losing_trades > 0) summary.avg_loss = loss_sum / summary.losing_trades;
    return summary;
}

} // namespace core
} // namespace tradeagent
