#pragma once

#include <string>
#include <vector>
#include <optional>

namespace cyclebt {

using Price = double;
using Volume = double;
using TimestampMs = long long;

enum class OrderSide { BUY, SELL };
enum class OrderStatus { PENDING, FILLED, CANCELLED };

// One OHLCV bar. Timestamps are epoch milliseconds.
struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

inline const char* orderStatusToString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "PENDING";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

} // namespace cyclebt
