#pragma once

#include <map>
#include <mutex>
#include <vector>

#include "core/contracts/IPositionStore.h"

namespace tradeagent {
namespace core {

class InMemoryPositionStore : public IPositionStore {
public:
    InMemoryPositionStore() = default;

    void upsertPosition(const PositionRecord& position) override;
    std::vector<PositionRecord> getOpenPositions() const override;
    std::optional<PositionRecord> getPosition(const std::string& symbol) const override;
    bool removePosition(const std::string& symbol) override;

    std::string logTrade(const TradeRecord& trade) override;
    void closeTrade(const std::string& trade_id, double exit_price, long long exit_timestamp) override;
    void updateTrade(const TradeRecord& trade) override;
    std::optional<TradeRecord> getTrade(const std::string& trade_id) const override;
    std::vector<TradeRecord> getOpenTrades() const override;
    std::vector<TradeRecord> getTrades(std::optional<TradeStatus> status = std::nullopt) const override;

    void recordDailyPerformance(const DailyPerformance& row) override;
    std::vector<DailyPerformance> getDailyPerformance() const override;
    PerformanceSummary getPerformanceSummary() const override;

protected:
    // called with mutex_ held after every mutation
    virtual void onChanged() {}

    mutable std::recursive_mutex mutex_;
    std::map<std::string, PositionRecord> positions_;
    std::vector<TradeRecord> trades_;
    std::vector<DailyPerformance> daily_performance_;
    std::uint64_t next_trade_seq_ = 1;
};

} // namespace core
} // namespace tradeagent
