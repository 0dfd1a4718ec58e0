#include "execution/ExecutionAgent.h"
#include "common/Logger.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <thread>

namespace tradeagent {
namespace execution {

namespace {
// 전량 체결, 또는 부분 체결 후 종료된 주문
bool hasConfirmedFill(const core::OrderSnapshot& snapshot) {
    if (snapshot.status == OrderStatus::FILLED) {
        return true;
    }
    return snapshot.status == OrderStatus::PARTIALLY_FILLED && snapshot.terminal &&
           snapshot.filled_qty && *snapshot.filled_qty > 0.0;
}

core::OrderSnapshot snapshotFromAck(const core::OrderAck& ack) {
    core::OrderSnapshot snapshot;
    snapshot.order_id = ack.order_id;
    snapshot.status = ack.status;
    snapshot.filled_price = ack.filled_price;
    snapshot.filled_qty = ack.filled_qty;
    snapshot.terminal = (ack.status == OrderStatus::FILLED ||
                         ack.status == OrderStatus::CANCELLED ||
                         ack.status == OrderStatus::REJECTED ||
                         ack.status == OrderStatus::EXPIRED);
    return snapshot;
}
}

ExecutionAgent::ExecutionAgent(
    std::shared_ptr<core::IExecutionVenue> venue,
    std::shared_ptr<core::IPositionStore> store,
    std::shared_ptr<core::IEventJournal> journal,
    const engine::FillPollPolicy& poll_policy,
    Sleeper sleeper
)
    : venue_(std::move(venue))
    , store_(std::move(store))
    , journal_(std::move(journal))
    , poll_policy_(poll_policy)
    , sleeper_(std::move(sleeper))
{
    if (!venue_ || !store_) {
        throw std::invalid_argument("ExecutionAgent requires a venue and a position store");
    }
    if (!sleeper_) {
        sleeper_ = [](int delay_ms) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        };
    }
}

void ExecutionAgent::journal(
    core::JournalEventType type,
    const std::string& symbol,
    const std::string& entity_id,
    const nlohmann::json& payload
) {
    if (!journal_) {
        return;
    }
    core::JournalEvent event;
    event.ts_ms = nowMs();
    event.type = type;
    event.symbol = symbol;
    event.entity_id = entity_id;
    event.payload = payload;
    if (!journal_->append(event)) {
        LOG_WARN("Journal append failed: {} {}", symbol, entity_id);
    }
}

core::OrderSnapshot ExecutionAgent::pollOrder(const std::string& order_id) {
    core::OrderSnapshot snapshot;
    snapshot.order_id = order_id;
    snapshot.status = OrderStatus::SUBMITTED;

    int delay_ms = std::max(0, poll_policy_.initial_delay_ms);
    const int attempts = std::max(1, poll_policy_.max_attempts);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        sleeper_(delay_ms);
        try {
            snapshot = venue_->getOrder(order_id);
        } catch (const std::exception& e) {
            LOG_WARN("Order poll {}/{} failed ({}): {}", attempt, attempts, order_id, e.what());
        }

        if (hasConfirmedFill(snapshot) || snapshot.terminal) {
            return snapshot;
        }
        LOG_DEBUG("Order {} still {} after poll {}/{}", order_id, toString(snapshot.status), attempt, attempts);

        const double next = static_cast<double>(delay_ms) * poll_policy_.backoff_multiplier;
        delay_ms = static_cast<int>(std::min(next, static_cast<double>(poll_policy_.max_delay_ms)));
    }
    return snapshot;
}

core::OrderSnapshot ExecutionAgent::confirmFill(const core::OrderAck& ack) {
    core::OrderSnapshot snapshot = snapshotFromAck(ack);
    if (hasConfirmedFill(snapshot) || snapshot.terminal || !venue_->isLive()) {
        return snapshot;
    }
    return pollOrder(ack.order_id);
}

void ExecutionAgent::openPosition(const core::TradeRecord& trade) {
    core::PositionRecord position;
    position.symbol = trade.symbol;
    position.quantity = (trade.side == OrderSide::BUY) ? trade.quantity : -trade.quantity;
    position.entry_price = trade.entry_price;
    position.current_price = trade.entry_price;
    position.stop_loss = trade.stop_loss;
    position.strategy = trade.strategy;
    position.entry_timestamp = trade.entry_timestamp;
    position.unrealized_pnl = 0.0;
    store_->upsertPosition(position);

    journal(core::JournalEventType::POSITION_OPENED, trade.symbol, trade.id, {
        {"side", toString(trade.side)},
        {"quantity", trade.quantity},
        {"entry_price", trade.entry_price},
        {"stop_loss", trade.stop_loss},
        {"strategy", trade.strategy}
    });
}

ExecutionResult ExecutionAgent::executeTrade(const TradeRequest& request) {
    ExecutionResult result;

    if (request.quantity <= 0.0) {
        result.error = "Invalid quantity";
        LOG_WARN("{} order rejected: {}", request.symbol, result.error);
        return result;
    }
    if (request.price <= 0.0) {
        result.error = "Invalid reference price";
        LOG_WARN("{} order rejected: {}", request.symbol, result.error);
        return result;
    }

    core::OrderRequest order;
    order.symbol = request.symbol;
    order.side = request.side;
    order.quantity = request.quantity;
    order.type = OrderType::MARKET;
    order.reference_price = request.price;

    core::OrderAck ack;
    try {
        ack = venue_->placeOrder(order);
    } catch (const std::exception& e) {
        result.error = std::string("Order submission failed: ") + e.what();
        LOG_ERROR("{} {}", request.symbol, result.error);
        journal(core::JournalEventType::ORDER_FAILED, request.symbol, "",
                {{"side", toString(request.side)}, {"quantity", request.quantity}, {"error", e.what()}});
        return result;
    }

    result.order_id = ack.order_id;
    journal(core::JournalEventType::ORDER_SUBMITTED, request.symbol, ack.order_id, {
        {"side", toString(request.side)},
        {"quantity", request.quantity},
        {"reference_price", request.price},
        {"strategy", request.strategy}
    });

    const core::OrderSnapshot snapshot = confirmFill(ack);

    if (hasConfirmedFill(snapshot)) {
        core::TradeRecord trade;
        trade.symbol = request.symbol;
        trade.side = request.side;
        trade.quantity = snapshot.filled_qty.value_or(request.quantity);
        trade.entry_price = snapshot.filled_price.value_or(request.price);
        trade.stop_loss = request.stop_loss;
        trade.strategy = request.strategy;
        trade.status = core::TradeStatus::OPEN;
        trade.entry_timestamp = snapshot.filled_at_ms.value_or(nowMs());
        trade.order_id = ack.order_id;
        if (!snapshot.filled_price) {
            LOG_WARN("{} fill price missing for {}, using reference {:.2f}",
                     request.symbol, ack.order_id, request.price);
        }

        trade.id = store_->logTrade(trade);
        openPosition(trade);
        journal(core::JournalEventType::ORDER_FILLED, request.symbol, ack.order_id, {
            {"trade_id", trade.id},
            {"filled_price", trade.entry_price},
            {"filled_qty", trade.quantity}
        });

        result.success = true;
        result.trade_id = trade.id;
        result.fill_price = trade.entry_price;
        result.quantity = trade.quantity;
        LOG_INFO("{} {} {} @ {:.2f} filled (trade {}, order {})",
                 request.symbol, toString(request.side), trade.quantity, trade.entry_price,
                 trade.id, ack.order_id);
        return result;
    }

    if (snapshot.terminal) {
        result.error = "Order " + toString(snapshot.status);
        LOG_WARN("{} order {} ended without fill: {}", request.symbol, ack.order_id, toString(snapshot.status));
        journal(core::JournalEventType::ORDER_FAILED, request.symbol, ack.order_id,
                {{"status", toString(snapshot.status)}});
        return result;
    }

    // 폴링 한도 초과 - 포지션 없이 UNCONFIRMED 거래만 남기고 다음 사이클에 재확인
    core::TradeRecord trade;
    trade.symbol = request.symbol;
    trade.side = request.side;
    trade.quantity = request.quantity;
    trade.entry_price = request.price;
    trade.stop_loss = request.stop_loss;
    trade.strategy = request.strategy;
    trade.status = core::TradeStatus::UNCONFIRMED;
    trade.entry_timestamp = nowMs();
    trade.order_id = ack.order_id;
    trade.notes = "fill not confirmed";
    trade.id = store_->logTrade(trade);

    journal(core::JournalEventType::ORDER_UNCONFIRMED, request.symbol, ack.order_id,
            {{"trade_id", trade.id}, {"status", toString(snapshot.status)}});

    result.unconfirmed = true;
    result.trade_id = trade.id;
    result.error = "Fill not confirmed (order " + ack.order_id + ", " + toString(snapshot.status) + ")";
    LOG_WARN("{} {}", request.symbol, result.error);
    return result;
}

ReconcileSummary ExecutionAgent::reconcileUnconfirmed() {
    ReconcileSummary summary;

    for (auto trade : store_->getTrades(core::TradeStatus::UNCONFIRMED)) {
        summary.checked++;

        core::OrderSnapshot snapshot;
        try {
            snapshot = venue_->getOrder(trade.order_id);
        } catch (const std::exception& e) {
            LOG_WARN("Reconcile lookup failed for {} ({}): {}", trade.symbol, trade.order_id, e.what());
            summary.pending++;
            continue;
        }

        if (hasConfirmedFill(snapshot)) {
            trade.status = core::TradeStatus::OPEN;
            trade.quantity = snapshot.filled_qty.value_or(trade.quantity);
            trade.entry_price = snapshot.filled_price.value_or(trade.entry_price);
            if (snapshot.filled_at_ms) {
                trade.entry_timestamp = *snapshot.filled_at_ms;
            }
            trade.notes = "fill confirmed on reconcile";
            store_->updateTrade(trade);
            openPosition(trade);
            journal(core::JournalEventType::ORDER_FILLED, trade.symbol, trade.order_id, {
                {"trade_id", trade.id},
                {"filled_price", trade.entry_price},
                {"filled_qty", trade.quantity},
                {"reconciled", true}
            });
            summary.promoted++;
            LOG_INFO("{} unconfirmed trade {} promoted: {} @ {:.2f}",
                     trade.symbol, trade.id, trade.quantity, trade.entry_price);
        } else if (snapshot.terminal) {
            trade.status = core::TradeStatus::CLOSED;
            trade.exit_timestamp = nowMs();
            trade.notes = "not filled (" + toString(snapshot.status) + ")";
            store_->updateTrade(trade);
            journal(core::JournalEventType::ORDER_FAILED, trade.symbol, trade.order_id,
                    {{"trade_id", trade.id}, {"status", toString(snapshot.status)}, {"reconciled", true}});
            summary.cancelled++;
            LOG_WARN("{} unconfirmed trade {} ended without fill: {}",
                     trade.symbol, trade.id, toString(snapshot.status));
        } else {
            summary.pending++;
        }
    }

    for (auto position : store_->getOpenPositions()) {
        if (!position.hasPendingExit()) {
            continue;
        }
        summary.checked++;
        const std::string order_id = position.pending_exit_order_id;

        core::OrderSnapshot snapshot;
        try {
            snapshot = venue_->getOrder(order_id);
        } catch (const std::exception& e) {
            LOG_WARN("Reconcile lookup failed for {} exit ({}): {}", position.symbol, order_id, e.what());
            summary.pending++;
            continue;
        }

        if (hasConfirmedFill(snapshot)) {
            const double reference = position.current_price > 0.0 ? position.current_price : position.entry_price;
            summary.exits.push_back(settleExit(position, snapshot, reference, position.pending_exit_reason));
        } else if (snapshot.terminal) {
            // 미체결 종료 - 포지션 그대로, 다음 판단에서 다시 청산 가능
            position.pending_exit_order_id.clear();
            position.pending_exit_reason.clear();
            store_->upsertPosition(position);
            journal(core::JournalEventType::ORDER_FAILED, position.symbol, order_id,
                    {{"status", toString(snapshot.status)}, {"reconciled", true}, {"exit", true}});
            summary.cancelled++;
            LOG_WARN("{} exit order {} ended without fill: {}", position.symbol, order_id, toString(snapshot.status));
        } else {
            summary.pending++;
        }
    }

    if (summary.checked > 0) {
        LOG_INFO("Reconcile: checked {}, promoted {}, cancelled {}, pending {}",
                 summary.checked, summary.promoted, summary.cancelled, summary.pending);
    }
    return summary;
}

CloseResult ExecutionAgent::closePosition(
    const std::string& symbol,
    std::optional<double> price,
    const std::string& reason
) {
    CloseResult result;
    result.symbol = symbol;
    result.reason = reason;

    auto position = store_->getPosition(symbol);
    if (!position) {
        result.error = "No open position for " + symbol;
        LOG_WARN("{}", result.error);
        return result;
    }
    if (position->hasPendingExit()) {
        result.unconfirmed = true;
        result.order_id = position->pending_exit_order_id;
        result.error = "Exit order " + position->pending_exit_order_id + " already pending";
        LOG_WARN("{} {}", symbol, result.error);
        return result;
    }

    double exit_price = price ? *price : position->current_price;
    if (exit_price <= 0.0) {
        exit_price = position->entry_price;
    }
    const double quantity = std::abs(position->quantity);

    core::OrderRequest order;
    order.symbol = symbol;
    order.side = opposite(position->side());
    order.quantity = quantity;
    order.type = OrderType::MARKET;
    order.reference_price = exit_price;

    core::OrderAck ack;
    try {
        ack = venue_->placeOrder(order);
    } catch (const std::exception& e) {
        result.error = std::string("Exit order failed: ") + e.what();
        LOG_ERROR("{} {}", symbol, result.error);
        journal(core::JournalEventType::ORDER_FAILED, symbol, "",
                {{"side", toString(order.side)}, {"quantity", quantity}, {"error", e.what()}});
        return result;
    }
    result.order_id = ack.order_id;
    journal(core::JournalEventType::ORDER_SUBMITTED, symbol, ack.order_id, {
        {"side", toString(order.side)},
        {"quantity", quantity},
        {"reference_price", exit_price},
        {"reason", reason}
    });

    const core::OrderSnapshot snapshot = confirmFill(ack);
    if (hasConfirmedFill(snapshot)) {
        return settleExit(*position, snapshot, exit_price, reason);
    }

    result.error = "Exit order " + ack.order_id + " not filled (" + toString(snapshot.status) + ")";
    LOG_ERROR("{} {}", symbol, result.error);
    if (snapshot.terminal) {
        journal(core::JournalEventType::ORDER_FAILED, symbol, ack.order_id,
                {{"status", toString(snapshot.status)}, {"reason", reason}});
        return result;
    }

    // 주문은 살아 있음 - 포지션에 기록해두고 다음 사이클 reconcile 에서 정리
    position->pending_exit_order_id = ack.order_id;
    position->pending_exit_reason = reason;
    store_->upsertPosition(*position);
    result.unconfirmed = true;
    journal(core::JournalEventType::ORDER_UNCONFIRMED, symbol, ack.order_id,
            {{"status", toString(snapshot.status)}, {"reason", reason}, {"exit", true}});
    return result;
}

CloseResult ExecutionAgent::settleExit(
    const core::PositionRecord& position,
    const core::OrderSnapshot& snapshot,
    double reference_price,
    const std::string& reason
) {
    CloseResult result;
    result.symbol = position.symbol;
    result.reason = reason;
    result.order_id = snapshot.order_id;

    const std::string& symbol = position.symbol;
    const double held = std::abs(position.quantity);
    double filled = snapshot.filled_qty.value_or(held);
    if (filled <= 0.0 || filled > held) {
        filled = held;
    }
    const bool partial = held - filled > 1e-9;
    const double exit_price = snapshot.filled_price.value_or(reference_price);
    const long long exit_ts = snapshot.filled_at_ms.value_or(nowMs());

    journal(core::JournalEventType::ORDER_FILLED, symbol, snapshot.order_id,
            {{"filled_price", exit_price}, {"filled_qty", filled}, {"partial", partial}});

    // P&L: 롱 (청산 - 진입) x 수량, 숏 (진입 - 청산) x 수량
    double pnl = position.isLong()
        ? (exit_price - position.entry_price) * filled
        : (position.entry_price - exit_price) * filled;
    const double cost_basis = position.entry_price * filled;
    double pnl_percent = (cost_basis != 0.0) ? pnl / cost_basis * 100.0 : 0.0;

    std::optional<core::TradeRecord> open_trade;
    for (const auto& trade : store_->getOpenTrades()) {
        if (trade.symbol == symbol) {
            open_trade = trade;
        }
    }

    if (open_trade) {
        std::string closed_id = open_trade->id;
        try {
            if (partial) {
                // 체결분은 별도 거래로 분리해 청산, 원 거래는 잔량으로 축소
                core::TradeRecord slice = *open_trade;
                slice.id.clear();
                slice.quantity = filled;
                slice.notes = "partial exit of " + open_trade->id;
                closed_id = store_->logTrade(slice);
                store_->closeTrade(closed_id, exit_price, exit_ts);

                open_trade->quantity = held - filled;
                store_->updateTrade(*open_trade);
            } else {
                store_->closeTrade(closed_id, exit_price, exit_ts);
            }
        } catch (const std::exception& e) {
            result.error = std::string("Trade close failed: ") + e.what();
            LOG_ERROR("{} {}", symbol, result.error);
            return result;
        }
        auto closed = store_->getTrade(closed_id);
        if (closed && closed->pnl) {
            pnl = *closed->pnl;
            pnl_percent = closed->pnl_percent.value_or(pnl_percent);
        }
        result.trade_id = closed_id;
    } else {
        LOG_WARN("{} has no open trade record, closing position only", symbol);
    }

    if (partial) {
        core::PositionRecord remaining = position;
        remaining.quantity = position.isLong() ? held - filled : -(held - filled);
        remaining.pending_exit_order_id.clear();
        remaining.pending_exit_reason.clear();
        remaining.unrealized_pnl = (remaining.current_price - remaining.entry_price) * remaining.quantity;
        store_->upsertPosition(remaining);
        LOG_WARN("{} exit partially filled: {} of {}, {} still held", symbol, filled, held, held - filled);
    } else {
        store_->removePosition(symbol);
    }

    result.success = true;
    result.partial = partial;
    result.exit_price = exit_price;
    result.quantity = filled;
    result.remaining_quantity = held - filled;
    result.pnl = pnl;
    result.pnl_percent = pnl_percent;

    Logger::getInstance().logTrade(symbol, toString(opposite(position.side())), exit_price, filled, pnl,
                                   position.strategy);
    journal(core::JournalEventType::POSITION_CLOSED, symbol, result.trade_id, {
        {"exit_price", exit_price},
        {"quantity", filled},
        {"remaining_quantity", result.remaining_quantity},
        {"pnl", pnl},
        {"pnl_percent", pnl_percent},
        {"reason", reason}
    });
    LOG_INFO("{} closed {} @ {:.2f}: P&L {:+.2f} ({:+.2f}%) - {}",
             symbol, filled, exit_price, pnl, pnl_percent, reason);
    return result;
}

bool ExecutionAgent::markToMarket(const std::string& symbol, double price) {
    auto position = store_->getPosition(symbol);
    if (!position || price <= 0.0) {
        return false;
    }
    position->current_price = price;
    // quantity 부호가 방향을 반영 (숏은 음수)
    position->unrealized_pnl = (price - position->entry_price) * position->quantity;
    store_->upsertPosition(*position);
    return true;
}

core::AccountSnapshot ExecutionAgent::getAccount() {
    return venue_->getAccount();
}

std::vector<core::PositionRecord> ExecutionAgent::getPositions() const {
    return store_->getOpenPositions();
}

std::vector<core::PositionRecord> ExecutionAgent::getCommittedPositions() const {
    auto positions = store_->getOpenPositions();
    for (const auto& trade : store_->getTrades(core::TradeStatus::UNCONFIRMED)) {
        core::PositionRecord pending;
        pending.symbol = trade.symbol;
        pending.quantity = (trade.side == OrderSide::BUY) ? trade.quantity : -trade.quantity;
        pending.entry_price = trade.entry_price;
        pending.current_price = trade.entry_price;
        pending.stop_loss = trade.stop_loss;
        pending.strategy = trade.strategy;
        pending.entry_timestamp = trade.entry_timestamp;
        positions.push_back(pending);
    }
    return positions;
}

std::vector<core::TradeRecord> ExecutionAgent::getUnconfirmedTrades() const {
    return store_->getTrades(core::TradeStatus::UNCONFIRMED);
}

bool ExecutionAgent::cancelAllOrders() {
    try {
        venue_->cancelAllOrders();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Cancel all orders failed: {}", e.what());
        return false;
    }
}

} // namespace execution
} // namespace tradeagent
