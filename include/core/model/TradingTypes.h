#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace tradeagent {
namespace core {

enum class JournalEventType {
    ORDER_SUBMITTED,
    ORDER_FILLED,
    ORDER_UNCONFIRMED,
    ORDER_FAILED,
    POSITION_OPENED,
    POSITION_CLOSED
};

struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::ORDER_SUBMITTED;
    std::string symbol;
    std::string entity_id;
    nlohmann::json payload;
};

std::string toString(JournalEventType type);
std::optional<JournalEventType> journalEventTypeFromString(const std::string& value);
nlohmann::json toJson(const JournalEvent& event);
// nullopt for rows that are not an object or carry an unknown type
std::optional<JournalEvent> journalEventFromJson(const nlohmann::json& j);

// ===== Venue contracts =====

struct OrderRequest {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    OrderType type = OrderType::MARKET;
    std::optional<double> limit_price;
    double reference_price = 0.0;       // simulated fills use this price
};

struct OrderAck {
    std::string order_id;
    OrderStatus status = OrderStatus::SUBMITTED;
    std::optional<double> filled_price;
    std::optional<double> filled_qty;
};

struct OrderSnapshot {
    std::string order_id;
    OrderStatus status = OrderStatus::SUBMITTED;
    std::optional<double> filled_price;
    std::optional<double> filled_qty;
    std::optional<long long> filled_at_ms;
    bool terminal = false;
};

struct AccountSnapshot {
    double cash = 0.0;
    double equity = 0.0;
    double buying_power = 0.0;
};

// ===== Bookkeeping =====

enum class TradeStatus {
    OPEN,
    CLOSED,
    UNCONFIRMED     // order submitted but fill not confirmed within the poll budget
};

std::string toString(TradeStatus status);
TradeStatus tradeStatusFromString(const std::string& value);

// One open position per symbol. quantity > 0 long, < 0 short.
struct PositionRecord {
    std::string symbol;
    double quantity = 0.0;
    double entry_price = 0.0;
    double current_price = 0.0;
    double stop_loss = 0.0;
    std::string strategy;
    long long entry_timestamp = 0;
    double unrealized_pnl = 0.0;
    // exit order accepted by the venue but not yet filled; no new exit is sent while set
    std::string pending_exit_order_id;
    std::string pending_exit_reason;

    bool isLong() const { return quantity > 0.0; }
    OrderSide side() const { return quantity >= 0.0 ? OrderSide::BUY : OrderSide::SELL; }
    bool hasPendingExit() const { return !pending_exit_order_id.empty(); }
};

struct TradeRecord {
    std::string id;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    double entry_price = 0.0;
    std::optional<double> exit_price;
    double stop_loss = 0.0;
    std::string strategy;
    TradeStatus status = TradeStatus::OPEN;
    std::optional<double> pnl;
    std::optional<double> pnl_percent;
    long long entry_timestamp = 0;
    std::optional<long long> exit_timestamp;
    std::string order_id;
    std::string notes;
};

struct DailyPerformance {
    std::string date;               // YYYY-MM-DD
    double portfolio_value = 0.0;
    double daily_pnl = 0.0;
    int trades_closed = 0;
    int open_positions = 0;
};

struct PerformanceSummary {
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;
    double total_pnl = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double best_trade = 0.0;
    double worst_trade = 0.0;
};

nlohmann::json toJson(const PositionRecord& position);
PositionRecord positionFromJson(const nlohmann::json& j);
nlohmann::json toJson(const TradeRecord& trade);
TradeRecord tradeFromJson(const nlohmann::json& j);
nlohmann::json toJson(const DailyPerformance& row);
DailyPerformance dailyPerformanceFromJson(const nlohmann::json& j);

} // namespace core
} // namespace tradeagent
