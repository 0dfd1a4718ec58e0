#include "core/state/EventJournalJsonl.h"

#include <algorithm>
#include <fstream>
#include <map>
#include <system_error>

namespace tradeagent {
namespace core {

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    scan([this](const JournalEvent& event) {
        last_seq_ = std::max(last_seq_, event.seq);
    });
}

void EventJournalJsonl::scan(const std::function<void(const JournalEvent&)>& visit) const {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        const nlohmann::json line = nlohmann::json::parse(row, nullptr, false);
        if (line.is_discarded()) {
            continue;
        }
        if (auto event = journalEventFromJson(line)) {
            visit(*event);
        }
    }
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    JournalEvent stored = event;
    stored.seq = last_seq_ + 1;
    out << toJson(stored).dump() << "\n";
    out.flush();
    if (!out) {
        return false;
    }
    last_seq_ = stored.seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JournalEvent> out;
    scan([&](const JournalEvent& event) {
        if (event.seq >= seq_inclusive) {
            out.push_back(event);
        }
    });
    return out;
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::vector<OrderTrail> EventJournalJsonl::unresolvedOrders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, OrderTrail> trails;

    scan([&](const JournalEvent& event) {
        // POSITION_* 는 거래 id, 제출 실패는 주문 id 없음
        if (event.entity_id.empty() ||
            event.type == JournalEventType::POSITION_OPENED ||
            event.type == JournalEventType::POSITION_CLOSED) {
            return;
        }
        if (event.type == JournalEventType::ORDER_SUBMITTED) {
            OrderTrail& trail = trails[event.entity_id];
            trail.order_id = event.entity_id;
            trail.symbol = event.symbol;
            trail.side = event.payload.value("side", std::string());
            trail.quantity = event.payload.value("quantity", 0.0);
            trail.reason = event.payload.value("reason", std::string());
            trail.submitted_ts_ms = event.ts_ms;
        }
        auto it = trails.find(event.entity_id);
        if (it == trails.end()) {
            return;
        }
        it->second.last_ts_ms = event.ts_ms;
        it->second.last_type = event.type;
    });

    std::vector<OrderTrail> out;
    for (const auto& [order_id, trail] : trails) {
        if (trail.last_type == JournalEventType::ORDER_SUBMITTED ||
            trail.last_type == JournalEventType::ORDER_UNCONFIRMED) {
            out.push_back(trail);
        }
    }
    std::sort(out.begin(), out.end(), [](const OrderTrail& a, const OrderTrail& b) {
        return a.submitted_ts_ms < b.submitted_ts_ms;
    });
    return out;
}

} // namespace core
} // namespace tradeagent
