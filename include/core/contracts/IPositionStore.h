#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/model/TradingTypes.h"

namespace tradeagent {
namespace core {

class IPositionStore {
public:
    virtual ~IPositionStore() = default;

    virtual void upsertPosition(const PositionRecord& position) = 0;
    virtual std::vector<PositionRecord> getOpenPositions() const = 0;
    virtual std::optional<PositionRecord> getPosition(const std::string& symbol) const = 0;
    virtual bool removePosition(const std::string& symbol) = 0;

    // returns the assigned trade id
    virtual std::string logTrade(const TradeRecord& trade) = 0;
    // throws std::runtime_error when the trade is unknown or already closed
    virtual void closeTrade(const std::string& trade_id, double exit_price, long long exit_timestamp) = 0;
    virtual void updateTrade(const TradeRecord& trade) = 0;
    virtual std::optional<TradeRecord> getTrade(const std::string& trade_id) const = 0;
    virtual std::vector<TradeRecord> getOpenTrades() const = 0;
    virtual std::vector<TradeRecord> getTrades(std::optional<TradeStatus> status = std::nullopt) const = 0;

    virtual void recordDailyPerformance(const DailyPerformance& row) = 0;
    virtual std::vector<DailyPerformance> getDailyPerformance() const = 0;
    virtual PerformanceSummary getPerformanceSummary() const = 0;
};

} // namespace core
} // namespace tradeagent
