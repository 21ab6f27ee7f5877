#include "DataOptimizer.hpp"
#include "Log.hpp"

#include <algorithm>
#include <cmath>
#include <functional>

static constexpr auto CAT = "DataOptimizer";

namespace {
inline void hashCombine(std::size_t& seed, std::size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}
}

std::size_t ChartDataOptimizer::CacheKeyHash::operator()(const CacheKey& k) const noexcept {
    std::size_t seed = std::hash<const void*>{}(k.source);
    hashCombine(seed, std::hash<std::size_t>{}(k.sourceSize));
    hashCombine(seed, std::hash<std::size_t>{}(k.start));
    hashCombine(seed, std::hash<std::size_t>{}(k.end));
    hashCombine(seed, std::hash<double>{}(k.zoomLevel));
    hashCombine(seed, std::hash<double>{}(k.candleWidth));
    return seed;
}

ChartDataOptimizer::ChartDataOptimizer(std::size_t maxCacheEntries, double reductionThresholdPx)
    : m_maxEntries(std::max<std::size_t>(1, maxCacheEntries))
    , m_reductionThresholdPx(reductionThresholdPx) {
    LOG_D(CAT, "🕯️ data optimizer ready: cache {} entries, reduce below {}px", m_maxEntries, m_reductionThresholdPx);
}

int ChartDataOptimizer::reductionFactorFor(double candleWidth) const {
    int factor = 1;
    if (std::isfinite(candleWidth) && candleWidth > 0.0 && candleWidth < m_reductionThresholdPx) {
        factor = static_cast<int>(std::ceil(m_reductionThresholdPx / candleWidth));
    }
    return std::max(factor, m_minimumFactor);
}

ChartDataOptimizer::Slice ChartDataOptimizer::optimizeForRendering(const std::vector<Candle>& history,
                                                                   VisibleRange range,
                                                                   double zoomLevel, double candleWidth) {
    const std::size_t end = std::min(range.end, history.size());
    const std::size_t start = std::min(range.start, end);

    if (!std::isfinite(zoomLevel)) zoomLevel = FALLBACK_ZOOM_LEVEL;
    if (!std::isfinite(candleWidth)) candleWidth = FALLBACK_CANDLE_WIDTH;

    CacheKey key{history.data(), history.size(), start, end, zoomLevel, candleWidth};
    if (auto it = m_cache.find(key); it != m_cache.end()) {
        ++m_hits;
        return it->second;
    }
    ++m_misses;

    std::vector<Candle> slice(history.begin() + start, history.begin() + end);
    const int factor = reductionFactorFor(candleWidth);
    if (factor > 1) {
        const std::size_t before = slice.size();
        slice = reduceDataPoints(slice, factor);
        LOG_EVERY_N(DEBUG, 50, CAT, "reduced {} -> {} candles (factor {}, width {:.2f}px)",
                    before, slice.size(), factor, candleWidth);
    }

    auto result = std::make_shared<const std::vector<Candle>>(std::move(slice));
    m_cache.emplace(key, result);
    m_insertionOrder.push_back(key);
    evictOverflow();
    return result;
}

std::vector<Candle> ChartDataOptimizer::reduceDataPoints(const std::vector<Candle>& data, int factor) {
    if (factor <= 1 || data.empty()) return data;

    const std::size_t step = static_cast<std::size_t>(factor);
    std::vector<Candle> reduced;
    reduced.reserve((data.size() + step - 1) / step);

    for (std::size_t i = 0; i < data.size(); i += step) {
        const std::size_t groupEnd = std::min(i + step, data.size());
        Candle merged = data[i];
        merged.close = data[groupEnd - 1].close;
        merged.volume = 0.0;
        for (std::size_t j = i; j < groupEnd; ++j) {
            merged.high = std::max(merged.high, data[j].high);
            merged.low = std::min(merged.low, data[j].low);
            merged.volume += data[j].volume;
        }
        reduced.push_back(merged);
    }
    return reduced;
}

void ChartDataOptimizer::setMinimumReductionFactor(int factor) {
    factor = std::max(1, factor);
    if (factor == m_minimumFactor) return;
    m_minimumFactor = factor;
    clearCache();
    LOG_I(CAT, "minimum reduction factor now {}", m_minimumFactor);
}

void ChartDataOptimizer::setMaxCacheEntries(std::size_t maxEntries) {
    m_maxEntries = std::max<std::size_t>(1, maxEntries);
    evictOverflow();
}

void ChartDataOptimizer::clearCache() {
    m_cache.clear();
    m_insertionOrder.clear();
}

void ChartDataOptimizer::evictOverflow() {
    while (m_cache.size() > m_maxEntries && !m_insertionOrder.empty()) {
        m_cache.erase(m_insertionOrder.front());
        m_insertionOrder.pop_front();
    }
}
