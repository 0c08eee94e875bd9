#pragma once

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

namespace swingfib {

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;  // epoch milliseconds

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// Ordered bars with strictly increasing timestamps.
// Produced once by a loader and borrowed read-only by every stage.
using CandleSeries = std::vector<Candle>;

enum class PivotType { TROUGH = -1, PEAK = 1 };

struct Pivot {
    std::size_t location;   // bar index
    long long timestamp;
    PivotType type;
    double price;           // high for a peak, low for a trough
};

struct Trade {
    std::size_t entry_index;
    std::size_t exit_index;
    long long entry_time;
    long long exit_time;
    double entry_price;
    double exit_price;

    Trade()
        : entry_index(0), exit_index(0), entry_time(0), exit_time(0),
          entry_price(0.0), exit_price(0.0) {}

    double logReturn() const {
        if (entry_price <= 0.0 || exit_price <= 0.0) {
            return 0.0;
        }
        return std::log(exit_price / entry_price);
    }

    std::size_t holdingBars() const { return exit_index - entry_index; }
};

inline std::vector<double> extractHighs(const CandleSeries& candles) {
    std::vector<double> out;
    out.reserve(candles.size());
    for (const auto& c : candles) {
        out.push_back(c.high);
    }
    return out;
}

inline std::vector<double> extractLows(const CandleSeries& candles) {
    std::vector<double> out;
    out.reserve(candles.size());
    for (const auto& c : candles) {
        out.push_back(c.low);
    }
    return out;
}

inline std::vector<double> extractCloses(const CandleSeries& candles) {
    std::vector<double> out;
    out.reserve(candles.size());
    for (const auto& c : candles) {
        out.push_back(c.close);
    }
    return out;
}

inline std::vector<long long> extractTimestamps(const CandleSeries& candles) {
    std::vector<long long> out;
    out.reserve(candles.size());
    for (const auto& c : candles) {
        out.push_back(c.timestamp);
    }
    return out;
}

} // namespace swingfib
