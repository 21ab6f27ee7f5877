#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

// A single OHLCV bar. History is ordered ascending by timestamp; the
// low <= min(open, close) <= max(open, close) <= high relation is expected
// but not enforced, so drawing code clamps instead of trusting it.
struct Candle {
    int64_t timestamp_ms = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;

    bool isBullish() const { return close > open; }
    double bodyTop() const { return std::max(open, close); }
    double bodyBottom() const { return std::min(open, close); }

    // Effective extremes, covering bars whose high/low disagree with the body.
    double effectiveHigh() const { return std::max({high, low, open, close}); }
    double effectiveLow() const { return std::min({high, low, open, close}); }

    bool isFinite() const {
        return std::isfinite(open) && std::isfinite(high) && std::isfinite(low) &&
               std::isfinite(close) && std::isfinite(volume);
    }
};

struct IndicatorPoint {
    int64_t timestamp_ms = 0;
    double value = 0.0;
};

using IndicatorSeries = std::vector<IndicatorPoint>;

// Latest trade price from the live feed; applied to the last candle only.
struct PriceTick {
    double price = 0.0;
    int64_t timestamp_ms = 0;
};

namespace CandleUtils {
    // Field extraction, used to feed the indicator library.
    inline std::vector<double> closes(const std::vector<Candle>& c) {
        std::vector<double> out; out.reserve(c.size());
        for (const auto& k : c) out.push_back(k.close);
        return out;
    }
    inline std::vector<double> highs(const std::vector<Candle>& c) {
        std::vector<double> out; out.reserve(c.size());
        for (const auto& k : c) out.push_back(k.high);
        return out;
    }
    inline std::vector<double> lows(const std::vector<Candle>& c) {
        std::vector<double> out; out.reserve(c.size());
        for (const auto& k : c) out.push_back(k.low);
        return out;
    }
    inline std::vector<double> volumes(const std::vector<Candle>& c) {
        std::vector<double> out; out.reserve(c.size());
        for (const auto& k : c) out.push_back(k.volume);
        return out;
    }

    // Folds a live price into the bar: close moves, extremes widen.
    inline void applyTick(Candle& candle, const PriceTick& tick) {
        candle.close = tick.price;
        candle.high = std::max(candle.high, tick.price);
        candle.low = std::min(candle.low, tick.price);
        if (tick.timestamp_ms != 0) candle.timestamp_ms = tick.timestamp_ms;
    }
}
