/*
Kline — ChartConfig
Role: Tunables for the chart core (cache bounds, performance budgets, animation, interaction, export).
Inputs/Outputs: Reads a JSON document (file or in-memory) plus KLINE_* environment overrides.
Threading: Plain value type; copy it where needed.
Performance: Parsed once at startup.
Integration: Passed to ChartRenderer at construction; the demo app loads it from --config.
Observability: Logs the resolved values via LOG_I.
Related: ChartConfig.cpp, ChartRenderer.h, IndicatorEngine.hpp.
Assumptions: Missing keys keep their defaults; present keys must have the right JSON type.
*/
#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

struct ChartConfig {
    // Data optimizer
    std::size_t maxCacheEntries = 100;
    double reductionThresholdPx = 3.0;

    // Performance monitor
    std::size_t memoryBudgetMB = 1024;
    int memoryPollIntervalMs = 1000;
    bool adaptiveQuality = true;

    // Animation
    int animationDurationMs = 300;
    int frameIntervalMs = 16;
    bool reducedMotion = false;
    bool smoothZoom = true;

    // Interaction
    double panSensitivity = 0.5;

    // Render
    bool showCrosshair = true;
    int resizeDebounceMs = 100;
    std::string exportDirectory = ".";

    // Indicators computed for every history update
    nlohmann::json indicators = nlohmann::json::object();

    static ChartConfig defaults();

    // Throws std::runtime_error on malformed JSON or wrong value types.
    static ChartConfig fromJson(const nlohmann::json& j);
    // Throws std::runtime_error when the file cannot be opened or parsed.
    static ChartConfig loadFile(const std::string& path);

    // KLINE_REDUCED_MOTION, KLINE_CACHE_ENTRIES, KLINE_EXPORT_DIR
    void applyEnvironment();

    nlohmann::json toJson() const;
};
