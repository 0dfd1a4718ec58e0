#include "core/model/TradingTypes.h"

namespace tradeagent {
namespace core {

namespace {
void putOptional(nlohmann::json& j, const char* key, const std::optional<double>& value) {
    j[key] = value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<double> getOptionalDouble(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<double>();
}
}

std::string toString(JournalEventType type) {
    switch (type) {
        case JournalEventType::ORDER_SUBMITTED: return "ORDER_SUBMITTED";
        case JournalEventType::ORDER_FILLED: return "ORDER_FILLED";
        case JournalEventType::ORDER_UNCONFIRMED: return "ORDER_UNCONFIRMED";
        case JournalEventType::ORDER_FAILED: return "ORDER_FAILED";
        case JournalEventType::POSITION_OPENED: return "POSITION_OPENED";
        case JournalEventType::POSITION_CLOSED: return "POSITION_CLOSED";
    }
    return "ORDER_SUBMITTED";
}

std::optional<JournalEventType> journalEventTypeFromString(const std::string& value) {
    if (value == "ORDER_SUBMITTED") return JournalEventType::ORDER_SUBMITTED;
    if (value == "ORDER_FILLED") return JournalEventType::ORDER_FILLED;
    if (value == "ORDER_UNCONFIRMED") return JournalEventType::ORDER_UNCONFIRMED;
    if (value == "ORDER_FAILED") return JournalEventType::ORDER_FAILED;
    if (value == "POSITION_OPENED") return JournalEventType::POSITION_OPENED;
    if (value == "POSITION_CLOSED") return JournalEventType::POSITION_CLOSED;
    return std::nullopt;
}

std::string toString(TradeStatus status) {
    switch (status) {
        case TradeStatus::OPEN: return "open";
        case TradeStatus::CLOSED: return "closed";
        case TradeStatus::UNCONFIRMED: return "unconfirmed";
    }
    return "open";
}

TradeStatus tradeStatusFromString(const std::string& value) {
    if (value == "closed") return TradeStatus::CLOSED;
    if (value == "unconfirmed") return TradeStatus::UNCONFIRMED;
    return TradeStatus::OPEN;
}

nlohmann::json toJson(const JournalEvent& event) {
    nlohmann::json j;
    j["seq"] = event.seq;
    j["ts_ms"] = event.ts_ms;
    j["type"] = toString(event.type);
    j["symbol"] = event.symbol;
    j["entity_id"] = event.entity_id;
    j["payload"] = event.payload;
    return j;
}

std::optional<JournalEvent> journalEventFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    const auto type = journalEventTypeFromString(j.value("type", std::string()));
    if (!type) {
        return std::nullopt;
    }
    JournalEvent event;
    event.seq = j.value("seq", static_cast<std::uint64_t>(0));
    event.ts_ms = j.value("ts_ms", 0LL);
    event.type = *type;
    event.symbol = j.value("symbol", std::string());
    event.entity_id = j.value("entity_id", std::string());
    event.payload = j.value("payload", nlohmann::json::object());
    return event;
}

nlohmann::json toJson(const PositionRecord& position) {
    nlohmann::json j;
    j["symbol"] = position.symbol;
    j["quantity"] = position.quantity;
    j["entry_price"] = position.entry_price;
    j["current_price"] = position.current_price;
    j["stop_loss"] = position.stop_loss;
    j["strategy"] = position.strategy;
    j["entry_timestamp"] = position.entry_timestamp;
    j["unrealized_pnl"] = position.unrealized_pnl;
    if (position.hasPendingExit()) {
        j["pending_exit_order_id"] = position.pending_exit_order_id;
        j["pending_exit_reason"] = position.pending_exit_reason;
    }
    return j;
}

PositionRecord positionFromJson(const nlohmann::json& j) {
    PositionRecord position;
    position.symbol = j.value("symbol", std::string());
    position.quantity = j.value("quantity", 0.0);
    position.entry_price = j.value("entry_price", 0.0);
    position.current_price = j.value("current_price", position.entry_price);
    position.stop_loss = j.value("stop_loss", 0.0);
    position.strategy = j.value("strategy", std::string());
    position.entry_timestamp = j.value("entry_timestamp", 0LL);
    position.unrealized_pnl = j.value("unrealized_pnl", 0.0);
    position.pending_exit_order_id = j.value("pending_exit_order_id", std::string());
    position.pending_exit_reason = j.value("pending_exit_reason", std::string());
    return position;
}

nlohmann::json toJson(const TradeRecord& trade) {
    nlohmann::json j;
    j["id"] = trade.id;
    j["symbol"] = trade.symbol;
    j["side"] = toString(trade.side);
    j["quantity"] = trade.quantity;
    j["entry_price"] = trade.entry_price;
    putOptional(j, "exit_price", trade.exit_price);
    j["stop_loss"] = trade.stop_loss;
    j["strategy"] = trade.strategy;
    j["status"] = toString(trade.status);
    putOptional(j, "pnl", trade.pnl);
    putOptional(j, "pnl_percent", trade.pnl_percent);
    j["entry_timestamp"] = trade.entry_timestamp;
    j["exit_timestamp"] = trade.exit_timestamp ? nlohmann::json(*trade.exit_timestamp) : nlohmann::json(nullptr);
    j["order_id"] = trade.order_id;
    j["notes"] = trade.notes;
    return j;
}

TradeRecord tradeFromJson(const nlohmann::json& j) {
    TradeRecord trade;
    trade.id = j.value("id", std::string());
    trade.symbol = j.value("symbol", std::string());
    trade.side = (j.value("side", std::string("buy")) == "sell") ? OrderSide::SELL : OrderSide::BUY;
    trade.quantity = j.value("quantity", 0.0);
    trade.entry_price = j.value("entry_price", 0.0);
    trade.exit_price = getOptionalDouble(j, "exit_price");
    trade.stop_loss = j.value("stop_loss", 0.0);
    trade.strategy = j.value("strategy", std::string());
    trade.status = tradeStatusFromString(j.value("status", std::string("open")));
    trade.pnl = getOptionalDouble(j, "pnl");
    trade.pnl_percent = getOptionalDouble(j, "pnl_percent");
    trade.entry_timestamp = j.value("entry_timestamp", 0LL);
    if (j.contains("exit_timestamp") && !j["exit_timestamp"].is_null()) {
        trade.exit_timestamp = j["exit_timestamp"].get<long long>();
    }
    trade.order_id = j.value("order_id", std::string());
    trade.notes = j.value("notes", std::string());
    return trade;
}

nlohmann::json toJson(const DailyPerformance& row) {
    nlohmann::json j;
    j["date"] = row.date;
    j["portfolio_value"] = row.portfolio_value;
    j["daily_pnl"] = row.daily_pnl;
    j["trades_closed"] = row.trades_closed;
    j["open_positions"] = row.open_positions;
    return j;
}

DailyPerformance dailyPerformanceFromJson(const nlohmann::json& j) {
    DailyPerformance row;
    row.date = j.value("date", std::string());
    row.portfolio_value = j.value("portfolio_value", 0.0);
    row.daily_pnl = j.value("daily_pnl", 0.0);
    row.trades_closed = j.value("trades_closed", 0);
    row.open_positions = j.value("open_positions", 0);
    return row;
}

} // namespace core
} // namespace tradeagent
