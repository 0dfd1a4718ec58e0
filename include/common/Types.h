#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace tradeagent {

enum class OrderSide { BUY, SELL };
enum class OrderType { MARKET, LIMIT };
enum class OrderStatus { PENDING, SUBMITTED, FILLED, PARTIALLY_FILLED, CANCELLED, REJECTED, EXPIRED };

// OHLCV 1개 구간 (timestamp: epoch ms, 오름차순 정렬 전제)
struct Bar {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;

    Bar() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Bar(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

inline std::string toString(OrderSide side) {
    return side == OrderSide::BUY ? "buy" : "sell";
}

inline OrderSide opposite(OrderSide side) {
    return side == OrderSide::BUY ? OrderSide::SELL : OrderSide::BUY;
}

inline std::string toString(OrderType type) {
    return type == OrderType::MARKET ? "market" : "limit";
}

inline std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "pending";
        case OrderStatus::SUBMITTED: return "submitted";
        case OrderStatus::FILLED: return "filled";
        case OrderStatus::PARTIALLY_FILLED: return "partially_filled";
        case OrderStatus::CANCELLED: return "cancelled";
        case OrderStatus::REJECTED: return "rejected";
        case OrderStatus::EXPIRED: return "expired";
    }
    return "pending";
}

inline long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace tradeagent
