/*
Kline — ChartDataOptimizer Tests
Role: Verify visible-slice extraction, candle reduction and the bounded result cache
Testing Strategy: Generated histories; identity checks on shared slices
Coverage: Empty input, range clamping, reduction bounds, cache hits, FIFO eviction, minimum factor
*/
#include <gtest/gtest.h>
#include "DataOptimizer.hpp"
#include "fixtures/SampleCandles.hpp"

#include <limits>

TEST(DataOptimizer, EmptyHistoryYieldsEmptySlice) {
    ChartDataOptimizer optimizer;
    const std::vector<Candle> empty;

    auto slice = optimizer.optimizeForRendering(empty, {0, 50}, 1.0, 8.0);
    ASSERT_NE(slice, nullptr);
    EXPECT_TRUE(slice->empty());

    slice = optimizer.optimizeForRendering(empty, {10, 5}, 0.0, -1.0);
    ASSERT_NE(slice, nullptr);
    EXPECT_TRUE(slice->empty());
}

TEST(DataOptimizer, OutOfRangeRequestIsClamped) {
    ChartDataOptimizer optimizer;
    const auto history = fixtures::waveCandles(20);

    auto slice = optimizer.optimizeForRendering(history, {15, 100}, 1.0, 8.0);
    ASSERT_EQ(slice->size(), 5u);
    EXPECT_EQ(slice->front().timestamp_ms, history[15].timestamp_ms);

    slice = optimizer.optimizeForRendering(history, {40, 60}, 1.0, 8.0);
    EXPECT_TRUE(slice->empty());
}

TEST(DataOptimizer, WideCandlesAreNotReduced) {
    ChartDataOptimizer optimizer;
    const auto history = fixtures::waveCandles(100);
    EXPECT_EQ(optimizer.reductionFactorFor(8.0), 1);

    const auto slice = optimizer.optimizeForRendering(history, {0, 100}, 1.0, 8.0);
    EXPECT_EQ(slice->size(), 100u);
}

TEST(DataOptimizer, NarrowCandlesAreMerged) {
    ChartDataOptimizer optimizer;
    const auto history = fixtures::waveCandles(100);

    // 3px threshold / 1px candles -> groups of 3
    EXPECT_EQ(optimizer.reductionFactorFor(1.0), 3);
    EXPECT_EQ(optimizer.reductionFactorFor(2.0), 2);
    const auto slice = optimizer.optimizeForRendering(history, {0, 100}, 0.125, 1.0);
    EXPECT_EQ(slice->size(), 34u);
}

TEST(DataOptimizer, ReduceDataPointsBounds) {
    const auto data = fixtures::waveCandles(101);

    for (int factor : {2, 3, 7, 200}) {
        const auto reduced = ChartDataOptimizer::reduceDataPoints(data, factor);
        const std::size_t f = static_cast<std::size_t>(factor);
        ASSERT_EQ(reduced.size(), (data.size() + f - 1) / f) << "factor " << factor;

        for (std::size_t g = 0; g < reduced.size(); ++g) {
            const std::size_t begin = g * f;
            const std::size_t end = std::min(begin + f, data.size());
            double volume = 0.0;
            for (std::size_t i = begin; i < end; ++i) {
                EXPECT_GE(reduced[g].high, data[i].high);
                EXPECT_LE(reduced[g].low, data[i].low);
                volume += data[i].volume;
            }
            EXPECT_DOUBLE_EQ(reduced[g].volume, volume);
            EXPECT_EQ(reduced[g].timestamp_ms, data[begin].timestamp_ms);
            EXPECT_DOUBLE_EQ(reduced[g].open, data[begin].open);
            EXPECT_DOUBLE_EQ(reduced[g].close, data[end - 1].close);
        }
    }
}

TEST(DataOptimizer, FactorOneIsIdentity) {
    const auto data = fixtures::fiveCandles();
    EXPECT_EQ(ChartDataOptimizer::reduceDataPoints(data, 1).size(), data.size());
    EXPECT_EQ(ChartDataOptimizer::reduceDataPoints(data, 0).size(), data.size());
}

TEST(DataOptimizer, IdenticalRequestsShareTheCachedSlice) {
    ChartDataOptimizer optimizer;
    const auto history = fixtures::waveCandles(200);

    const auto first = optimizer.optimizeForRendering(history, {50, 150}, 1.0, 8.0);
    const auto second = optimizer.optimizeForRendering(history, {50, 150}, 1.0, 8.0);

    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(optimizer.hitCount(), 1u);
    EXPECT_EQ(optimizer.missCount(), 1u);
    EXPECT_EQ(optimizer.cacheSize(), 1u);

    const auto other = optimizer.optimizeForRendering(history, {50, 150}, 0.9, 7.2);
    EXPECT_NE(first.get(), other.get());
    EXPECT_EQ(optimizer.cacheSize(), 2u);
}

TEST(DataOptimizer, DifferentHistoriesDoNotCollide) {
    ChartDataOptimizer optimizer;
    const auto a = fixtures::waveCandles(50);
    const auto b = fixtures::flatCandles(50);

    const auto sliceA = optimizer.optimizeForRendering(a, {0, 50}, 1.0, 8.0);
    const auto sliceB = optimizer.optimizeForRendering(b, {0, 50}, 1.0, 8.0);
    EXPECT_NE(sliceA.get(), sliceB.get());
    EXPECT_DOUBLE_EQ(sliceB->front().close, 100.0);
}

TEST(DataOptimizer, CacheStaysBounded) {
    ChartDataOptimizer optimizer(10);
    const auto history = fixtures::waveCandles(300);

    const auto oldest = optimizer.optimizeForRendering(history, {0, 100}, 1.0, 8.0);
    for (std::size_t i = 1; i < 250; ++i) {
        optimizer.optimizeForRendering(history, {i, i + 50}, 1.0, 8.0);
        EXPECT_LE(optimizer.cacheSize(), 10u);
    }

    // The first entry was evicted; a new request builds a fresh slice.
    const auto again = optimizer.optimizeForRendering(history, {0, 100}, 1.0, 8.0);
    EXPECT_NE(oldest.get(), again.get());
    // Evicted slices stay valid for whoever still holds them.
    EXPECT_EQ(oldest->size(), 100u);
}

TEST(DataOptimizer, NonFiniteViewParametersStillHitTheCache) {
    ChartDataOptimizer optimizer(4);
    const auto history = fixtures::waveCandles(100);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    const auto first = optimizer.optimizeForRendering(history, {20, 80}, nan, nan);
    for (int i = 0; i < 100; ++i) {
        optimizer.optimizeForRendering(history, {20, 80}, nan, 8.0);
        optimizer.optimizeForRendering(history, {20, 80}, 1.0, inf);
        EXPECT_LE(optimizer.cacheSize(), 4u);
    }
    const auto again = optimizer.optimizeForRendering(history, {20, 80}, nan, nan);
    EXPECT_EQ(first.get(), again.get());
    EXPECT_EQ(optimizer.cacheSize(), 1u);
    EXPECT_EQ(first->size(), 60u);
}

TEST(DataOptimizer, ShrinkingTheBoundEvicts) {
    ChartDataOptimizer optimizer;
    const auto history = fixtures::waveCandles(100);
    for (std::size_t i = 0; i < 20; ++i) optimizer.optimizeForRendering(history, {i, i + 10}, 1.0, 8.0);
    EXPECT_EQ(optimizer.cacheSize(), 20u);

    optimizer.setMaxCacheEntries(5);
    EXPECT_EQ(optimizer.cacheSize(), 5u);
    optimizer.clearCache();
    EXPECT_EQ(optimizer.cacheSize(), 0u);
}

TEST(DataOptimizer, MinimumFactorForcesReductionAndClearsCache) {
    ChartDataOptimizer optimizer;
    const auto history = fixtures::waveCandles(100);
    optimizer.optimizeForRendering(history, {0, 100}, 1.0, 8.0);
    ASSERT_EQ(optimizer.cacheSize(), 1u);

    optimizer.setMinimumReductionFactor(2);
    EXPECT_EQ(optimizer.cacheSize(), 0u);
    EXPECT_EQ(optimizer.reductionFactorFor(8.0), 2);
    EXPECT_EQ(optimizer.optimizeForRendering(history, {0, 100}, 1.0, 8.0)->size(), 50u);
}
