#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "core/contracts/IEventJournal.h"

namespace tradeagent {
namespace core {

// 주문 하나의 저널 이력 요약 (entity_id = 주문 id)
struct OrderTrail {
    std::string order_id;
    std::string symbol;
    std::string side;
    double quantity = 0.0;
    std::string reason;                 // 청산 주문일 때만
    long long submitted_ts_ms = 0;
    long long last_ts_ms = 0;
    JournalEventType last_type = JournalEventType::ORDER_SUBMITTED;
};

// Append-only execution journal, one JSON object per line with a monotonically increasing seq.
class EventJournalJsonl : public IEventJournal {
public:
    explicit EventJournalJsonl(std::filesystem::path file_path);

    bool append(const JournalEvent& event) override;
    std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

    // 접수 후 체결/실패로 끝나지 않은 주문 (마지막 이벤트가 SUBMITTED 또는 UNCONFIRMED)
    std::vector<OrderTrail> unresolvedOrders() const;

private:
    // 손상된 줄이나 알 수 없는 type 은 건너뜀
    void scan(const std::function<void(const JournalEvent&)>& visit) const;

    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace tradeagent
