/*
Kline — IndicatorEngine Tests
Role: Verify config parsing, status reporting and timestamp alignment of computed indicators
Testing Strategy: JSON configs against generated candle series
Coverage: Defaults, period lists, disabled entries, insufficient data, invalid and out-of-range parameters, malformed config
*/
#include <gtest/gtest.h>
#include "IndicatorEngine.hpp"
#include "fixtures/SampleCandles.hpp"

using nlohmann::json;

TEST(IndicatorEngine, SmaOnFiveCandlesAlignsToLastBar) {
    const auto candles = fixtures::fiveCandles();
    const auto set = IndicatorEngine::computeAll(candles, json{{"sma", 5}});

    ASSERT_EQ(set.count("sma5"), 1u);
    const auto& out = set.at("sma5");
    ASSERT_TRUE(out.ok());
    const auto* line = out.line("value");
    ASSERT_NE(line, nullptr);
    ASSERT_EQ(line->size(), 1u);
    EXPECT_EQ(line->front().timestamp_ms, candles.back().timestamp_ms);
    EXPECT_DOUBLE_EQ(line->front().value, 153.5);
}

TEST(IndicatorEngine, DefaultConfigProducesEveryIndicator) {
    const auto candles = fixtures::waveCandles(120);
    const auto set = IndicatorEngine::computeAll(candles, IndicatorEngine::defaultConfig());

    for (const char* key : {"sma20", "sma50", "ema12", "ema26", "rsi", "macd", "bollingerBands",
                            "stochastic", "atr", "williamsR", "cci", "mfi", "parabolicSAR",
                            "ichimoku", "vwap", "obv"}) {
        ASSERT_EQ(set.count(key), 1u) << key;
        EXPECT_TRUE(set.at(key).ok()) << key;
    }

    const auto& ichimoku = set.at("ichimoku");
    for (const char* line : {"tenkanSen", "kijunSen", "senkouSpanA", "senkouSpanB", "chikouSpan"}) {
        EXPECT_NE(ichimoku.line(line), nullptr) << line;
    }
    EXPECT_NE(set.at("bollingerBands").line("upper"), nullptr);
    EXPECT_NE(set.at("macd").line("histogram"), nullptr);
    EXPECT_NE(set.at("stochastic").line("d"), nullptr);
}

TEST(IndicatorEngine, PeriodListsExpandToNamedOutputs) {
    const auto candles = fixtures::waveCandles(60);
    const auto set = IndicatorEngine::computeAll(candles, json{{"ema", {5, 10}}, {"wma", {{"period", 7}}}});

    EXPECT_EQ(set.count("ema5"), 1u);
    EXPECT_EQ(set.count("ema10"), 1u);
    EXPECT_EQ(set.count("wma7"), 1u);
    EXPECT_EQ(set.at("wma7").line("value")->size(), candles.size() - 6);
}

TEST(IndicatorEngine, DisabledAndUnknownEntriesAreSkipped) {
    const auto candles = fixtures::waveCandles(60);
    const auto set = IndicatorEngine::computeAll(candles, json{{"rsi", false}, {"obv", nullptr}, {"bogus", 3}});
    EXPECT_TRUE(set.empty());
}

TEST(IndicatorEngine, InsufficientDataIsReportedNotThrown) {
    const auto candles = fixtures::fiveCandles();
    const auto set = IndicatorEngine::computeAll(candles, json{{"sma", 20}, {"rsi", 14}});

    ASSERT_EQ(set.count("sma20"), 1u);
    EXPECT_EQ(set.at("sma20").status, IndicatorStatus::InsufficientData);
    EXPECT_TRUE(set.at("sma20").lines.empty());
    EXPECT_EQ(set.at("rsi").status, IndicatorStatus::InsufficientData);
}

TEST(IndicatorEngine, InvalidParametersAreDistinguished) {
    const auto candles = fixtures::waveCandles(60);
    const auto set = IndicatorEngine::computeAll(candles, json{
        {"macd", {{"fast", 26}, {"slow", 12}, {"signal", 9}}},
        {"rsi", 0},
    });

    EXPECT_EQ(set.at("macd").status, IndicatorStatus::InvalidParameters);
    EXPECT_EQ(set.at("rsi").status, IndicatorStatus::InvalidParameters);
}

TEST(IndicatorEngine, NonIntegralOrHugePeriodsAreInvalid) {
    const auto candles = fixtures::waveCandles(60);
    const auto set = IndicatorEngine::computeAll(candles, json{
        {"rsi", 1e300},
        {"atr", 14.5},
        {"cci", 20.0},
        {"sma", json::array({20, 1e12})},
        {"macd", {{"fast", 1e300}, {"slow", 26}, {"signal", 9}}},
        {"stochastic", {{"k", 3'000'000'000LL}, {"d", 3}}},
    });

    EXPECT_EQ(set.at("rsi").status, IndicatorStatus::InvalidParameters);
    EXPECT_EQ(set.at("atr").status, IndicatorStatus::InvalidParameters);
    EXPECT_EQ(set.at("cci").status, IndicatorStatus::Ok);
    EXPECT_EQ(set.at("sma20").status, IndicatorStatus::Ok);
    EXPECT_EQ(set.at("sma0").status, IndicatorStatus::InvalidParameters);
    EXPECT_EQ(set.at("macd").status, IndicatorStatus::InvalidParameters);
    EXPECT_EQ(set.at("stochastic").status, IndicatorStatus::InvalidParameters);
}

TEST(IndicatorEngine, MalformedConfigYieldsEmptySet) {
    const auto candles = fixtures::waveCandles(60);
    EXPECT_TRUE(IndicatorEngine::computeAll(candles, json{{"rsi", {{"period", "fourteen"}}}}).empty());
    EXPECT_TRUE(IndicatorEngine::computeAll(candles, json::array({1, 2})).empty());
}

TEST(IndicatorEngine, EmptyHistoryYieldsEmptySet) {
    EXPECT_TRUE(IndicatorEngine::computeAll({}, IndicatorEngine::defaultConfig()).empty());
}

TEST(IndicatorEngine, FlatHistoryRsiIsNeutral) {
    const auto candles = fixtures::flatCandles(30);
    const auto set = IndicatorEngine::computeAll(candles, json{{"rsi", 14}});
    const auto* line = set.at("rsi").line("value");
    ASSERT_NE(line, nullptr);
    ASSERT_EQ(line->size(), 16u);
    for (const auto& point : *line) EXPECT_NEAR(point.value, 50.0, 1e-9);
}

TEST(IndicatorEngine, AlignHelpers) {
    const auto candles = fixtures::fiveCandles();

    const auto tail = IndicatorEngine::alignTail(candles, {1.0, 2.0});
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_EQ(tail[0].timestamp_ms, candles[3].timestamp_ms);
    EXPECT_EQ(tail[1].timestamp_ms, candles[4].timestamp_ms);

    const auto head = IndicatorEngine::alignHead(candles, {1.0, 2.0});
    ASSERT_EQ(head.size(), 2u);
    EXPECT_EQ(head[0].timestamp_ms, candles[0].timestamp_ms);

    EXPECT_TRUE(IndicatorEngine::alignTail(candles, std::vector<double>(6, 0.0)).empty());
}
