#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace microtrend {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Volume = double;

enum class OrderSide { BUY, SELL };
enum class DecisionKind { BUY, SELL, FLAT };

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;  // ms since epoch

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

inline const char* toString(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

inline const char* toString(DecisionKind kind) {
    switch (kind) {
        case DecisionKind::BUY:
            return "BUY";
        case DecisionKind::SELL:
            return "SELL";
        default:
            return "FLAT";
    }
}

} // namespace microtrend
