#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <unordered_map>
#include <vector>
#include "Candle.hpp"

// Index window [start, end) into a candle history.
struct VisibleRange {
    std::size_t start = 0;
    std::size_t end = 0;

    std::size_t count() const { return end > start ? end - start : 0; }
    bool operator==(const VisibleRange&) const = default;
};

// 🕯️ CANDLE LOD: turns (history, visible range, zoom, candle width) into the
// slice that actually gets drawn. Narrow candles are merged into wider
// synthetic ones so a zoomed-out chart never draws sub-pixel bodies.
// Results are cached and shared: identical requests return the same pointer.
class ChartDataOptimizer {
public:
    using Slice = std::shared_ptr<const std::vector<Candle>>;

    static constexpr std::size_t DEFAULT_MAX_CACHE_ENTRIES = 100;
    static constexpr double DEFAULT_REDUCTION_THRESHOLD_PX = 3.0;
    // Stand-ins for a non-finite zoom or candle width so the cache key stays comparable.
    static constexpr double FALLBACK_ZOOM_LEVEL = 1.0;
    static constexpr double FALLBACK_CANDLE_WIDTH = 8.0;

    explicit ChartDataOptimizer(std::size_t maxCacheEntries = DEFAULT_MAX_CACHE_ENTRIES,
                                double reductionThresholdPx = DEFAULT_REDUCTION_THRESHOLD_PX);

    // 🔥 MAIN API: never throws; an empty or out-of-range request yields an empty slice.
    // A NaN or infinite zoom/width is treated as the fallback value.
    Slice optimizeForRendering(const std::vector<Candle>& history, VisibleRange range,
                               double zoomLevel, double candleWidth);

    // Groups runs of `factor` candles: first timestamp/open, last close,
    // max high, min low, summed volume. factor <= 1 returns the input unchanged.
    static std::vector<Candle> reduceDataPoints(const std::vector<Candle>& data, int factor);

    // Merge factor for a given on-screen candle width (1 means no reduction).
    int reductionFactorFor(double candleWidth) const;

    // Extra reduction requested by performance adaptation; clears the cache when it changes.
    void setMinimumReductionFactor(int factor);
    int minimumReductionFactor() const { return m_minimumFactor; }

    void setMaxCacheEntries(std::size_t maxEntries);
    std::size_t maxCacheEntries() const { return m_maxEntries; }

    void clearCache();

    // 🎯 STATS
    std::size_t cacheSize() const { return m_cache.size(); }
    uint64_t hitCount() const { return m_hits; }
    uint64_t missCount() const { return m_misses; }

private:
    struct CacheKey {
        const Candle* source = nullptr;
        std::size_t sourceSize = 0;
        std::size_t start = 0;
        std::size_t end = 0;
        double zoomLevel = 0.0;
        double candleWidth = 0.0;
        bool operator==(const CacheKey&) const = default;
    };

    struct CacheKeyHash {
        std::size_t operator()(const CacheKey& k) const noexcept;
    };

    void evictOverflow();

    std::unordered_map<CacheKey, Slice, CacheKeyHash> m_cache;
    std::deque<CacheKey> m_insertionOrder;   // oldest at front
    std::size_t m_maxEntries;
    double m_reductionThresholdPx;
    int m_minimumFactor = 1;
    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
};
