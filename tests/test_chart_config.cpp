/*
Kline — ChartConfig Tests
Role: Verify JSON loading, defaults, validation and environment overrides
Testing Strategy: In-memory JSON plus temporary files; environment set and restored per test
Coverage: Defaults, per-section parsing, type errors, missing/unparsable files, KLINE_* overrides, toJson
*/
#include <gtest/gtest.h>
#include "ChartConfig.hpp"
#include "IndicatorEngine.hpp"

#include <QTemporaryDir>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using nlohmann::json;

namespace {
std::string writeFile(const QTemporaryDir& dir, const char* name, const std::string& body) {
    const std::string path = dir.filePath(QString::fromLatin1(name)).toStdString();
    std::ofstream out(path);
    out << body;
    return path;
}

class EnvironmentTest : public ::testing::Test {
protected:
    void TearDown() override {
        ::unsetenv("KLINE_REDUCED_MOTION");
        ::unsetenv("KLINE_CACHE_ENTRIES");
        ::unsetenv("KLINE_EXPORT_DIR");
    }
};
}

TEST(ChartConfig, Defaults) {
    const auto cfg = ChartConfig::defaults();
    EXPECT_EQ(cfg.maxCacheEntries, 100u);
    EXPECT_DOUBLE_EQ(cfg.reductionThresholdPx, 3.0);
    EXPECT_EQ(cfg.animationDurationMs, 300);
    EXPECT_EQ(cfg.frameIntervalMs, 16);
    EXPECT_TRUE(cfg.adaptiveQuality);
    EXPECT_TRUE(cfg.showCrosshair);
    EXPECT_FALSE(cfg.reducedMotion);
    EXPECT_DOUBLE_EQ(cfg.panSensitivity, 0.5);
    EXPECT_EQ(cfg.indicators, IndicatorEngine::defaultConfig());
}

TEST(ChartConfig, SectionsOverrideDefaults) {
    const auto cfg = ChartConfig::fromJson(json{
        {"dataOptimizer", {{"maxCacheEntries", 12}, {"reductionThresholdPx", 4.5}}},
        {"performance", {{"memoryBudgetMB", 256}, {"adaptiveQuality", false}}},
        {"animation", {{"durationMs", 150}, {"reducedMotion", true}, {"smoothZoom", false}}},
        {"interaction", {{"panSensitivity", 1.0}}},
        {"render", {{"crosshair", false}, {"exportDirectory", "/tmp/charts"}}},
        {"indicators", {{"sma", 10}}},
    });

    EXPECT_EQ(cfg.maxCacheEntries, 12u);
    EXPECT_DOUBLE_EQ(cfg.reductionThresholdPx, 4.5);
    EXPECT_EQ(cfg.memoryBudgetMB, 256u);
    EXPECT_FALSE(cfg.adaptiveQuality);
    EXPECT_EQ(cfg.animationDurationMs, 150);
    EXPECT_TRUE(cfg.reducedMotion);
    EXPECT_FALSE(cfg.smoothZoom);
    EXPECT_DOUBLE_EQ(cfg.panSensitivity, 1.0);
    EXPECT_FALSE(cfg.showCrosshair);
    EXPECT_EQ(cfg.exportDirectory, "/tmp/charts");
    EXPECT_EQ(cfg.indicators, (json{{"sma", 10}}));

    // Untouched keys keep their defaults
    EXPECT_EQ(cfg.frameIntervalMs, 16);
    EXPECT_EQ(cfg.resizeDebounceMs, 100);
}

TEST(ChartConfig, DegenerateValuesAreNormalized) {
    const auto cfg = ChartConfig::fromJson(json{
        {"dataOptimizer", {{"maxCacheEntries", 0}}},
        {"animation", {{"frameIntervalMs", 0}}},
        {"render", {{"resizeDebounceMs", -20}}},
    });
    EXPECT_EQ(cfg.maxCacheEntries, 1u);
    EXPECT_EQ(cfg.frameIntervalMs, 16);
    EXPECT_EQ(cfg.resizeDebounceMs, 0);
}

TEST(ChartConfig, WrongTypesThrow) {
    EXPECT_THROW(ChartConfig::fromJson(json::array()), std::runtime_error);
    EXPECT_THROW(ChartConfig::fromJson(json{{"animation", 5}}), std::runtime_error);
    EXPECT_THROW(ChartConfig::fromJson(json{{"animation", {{"reducedMotion", "yes"}}}}), std::runtime_error);
    EXPECT_THROW(ChartConfig::fromJson(json{{"indicators", json::array({1})}}), std::runtime_error);
}

TEST(ChartConfig, LoadFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto path = writeFile(dir, "chart.json", R"({"dataOptimizer": {"maxCacheEntries": 7}})");

    const auto cfg = ChartConfig::loadFile(path);
    EXPECT_EQ(cfg.maxCacheEntries, 7u);
}

TEST(ChartConfig, LoadFileFailures) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    EXPECT_THROW(ChartConfig::loadFile(dir.filePath("missing.json").toStdString()), std::runtime_error);

    const auto broken = writeFile(dir, "broken.json", "{ not json");
    EXPECT_THROW(ChartConfig::loadFile(broken), std::runtime_error);
}

TEST(ChartConfig, ToJsonRoundTrips) {
    auto cfg = ChartConfig::defaults();
    cfg.maxCacheEntries = 33;
    cfg.smoothZoom = false;
    cfg.exportDirectory = "out";

    const auto back = ChartConfig::fromJson(cfg.toJson());
    EXPECT_EQ(back.maxCacheEntries, 33u);
    EXPECT_FALSE(back.smoothZoom);
    EXPECT_EQ(back.exportDirectory, "out");
    EXPECT_EQ(back.indicators, cfg.indicators);
}

TEST_F(EnvironmentTest, OverridesApply) {
    ::setenv("KLINE_REDUCED_MOTION", "1", 1);
    ::setenv("KLINE_CACHE_ENTRIES", "42", 1);
    ::setenv("KLINE_EXPORT_DIR", "/var/tmp", 1);

    auto cfg = ChartConfig::defaults();
    cfg.applyEnvironment();
    EXPECT_TRUE(cfg.reducedMotion);
    EXPECT_EQ(cfg.maxCacheEntries, 42u);
    EXPECT_EQ(cfg.exportDirectory, "/var/tmp");
}

TEST_F(EnvironmentTest, InvalidOverridesAreIgnored) {
    ::setenv("KLINE_REDUCED_MOTION", "off", 1);
    ::setenv("KLINE_CACHE_ENTRIES", "-3", 1);
    ::setenv("KLINE_EXPORT_DIR", "", 1);

    auto cfg = ChartConfig::defaults();
    cfg.reducedMotion = true;
    cfg.applyEnvironment();
    EXPECT_FALSE(cfg.reducedMotion);
    EXPECT_EQ(cfg.maxCacheEntries, 100u);
    EXPECT_EQ(cfg.exportDirectory, ".");
}
