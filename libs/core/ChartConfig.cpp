#include "ChartConfig.hpp"
#include "IndicatorEngine.hpp"
#include "Log.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string_view>

static constexpr auto CAT = "Config";

namespace {
using nlohmann::json;

template <typename T>
void read(const json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) target = it->get<T>();
}

const json& sectionOf(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end()) return empty;
    if (!it->is_object()) {
        throw std::runtime_error(std::string("⚙️ ChartConfig: section '") + name + "' must be an object");
    }
    return *it;
}

bool envFlag(const char* value) {
    std::string_view v(value);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}
}

ChartConfig ChartConfig::defaults() {
    ChartConfig cfg;
    cfg.indicators = IndicatorEngine::defaultConfig();
    return cfg;
}

ChartConfig ChartConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("⚙️ ChartConfig: root must be a JSON object");
    }

    ChartConfig cfg = defaults();
    try {
        const json& data = sectionOf(j, "dataOptimizer");
        read(data, "maxCacheEntries", cfg.maxCacheEntries);
        read(data, "reductionThresholdPx", cfg.reductionThresholdPx);

        const json& perf = sectionOf(j, "performance");
        read(perf, "memoryBudgetMB", cfg.memoryBudgetMB);
        read(perf, "memoryPollIntervalMs", cfg.memoryPollIntervalMs);
        read(perf, "adaptiveQuality", cfg.adaptiveQuality);

        const json& anim = sectionOf(j, "animation");
        read(anim, "durationMs", cfg.animationDurationMs);
        read(anim, "frameIntervalMs", cfg.frameIntervalMs);
        read(anim, "reducedMotion", cfg.reducedMotion);
        read(anim, "smoothZoom", cfg.smoothZoom);

        const json& interaction = sectionOf(j, "interaction");
        read(interaction, "panSensitivity", cfg.panSensitivity);

        const json& render = sectionOf(j, "render");
        read(render, "crosshair", cfg.showCrosshair);
        read(render, "resizeDebounceMs", cfg.resizeDebounceMs);
        read(render, "exportDirectory", cfg.exportDirectory);

        if (auto it = j.find("indicators"); it != j.end()) {
            if (!it->is_object()) {
                throw std::runtime_error("⚙️ ChartConfig: 'indicators' must be an object");
            }
            cfg.indicators = *it;
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("⚙️ ChartConfig: invalid value: ") + e.what());
    }

    if (cfg.maxCacheEntries == 0) cfg.maxCacheEntries = 1;
    if (cfg.frameIntervalMs <= 0) cfg.frameIntervalMs = 16;
    if (cfg.resizeDebounceMs < 0) cfg.resizeDebounceMs = 0;
    return cfg;
}

ChartConfig ChartConfig::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("⚙️ ChartConfig: failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("⚙️ ChartConfig: failed to parse " + path + ": " + e.what());
    }

    ChartConfig cfg = fromJson(j);
    LOG_I(CAT, "loaded {} (cache {} entries, memory budget {}MB, reduced motion {})",
          path, cfg.maxCacheEntries, cfg.memoryBudgetMB, cfg.reducedMotion);
    return cfg;
}

void ChartConfig::applyEnvironment() {
    if (const char* env = std::getenv("KLINE_REDUCED_MOTION")) {
        reducedMotion = envFlag(env);
    }
    if (const char* env = std::getenv("KLINE_CACHE_ENTRIES")) {
        const long v = std::strtol(env, nullptr, 10);
        if (v > 0) {
            maxCacheEntries = static_cast<std::size_t>(v);
        } else {
            LOG_W(CAT, "ignoring KLINE_CACHE_ENTRIES='{}'", env);
        }
    }
    if (const char* env = std::getenv("KLINE_EXPORT_DIR"); env && *env) {
        exportDirectory = env;
    }
}

nlohmann::json ChartConfig::toJson() const {
    return json{
        {"dataOptimizer", {{"maxCacheEntries", maxCacheEntries}, {"reductionThresholdPx", reductionThresholdPx}}},
        {"performance", {{"memoryBudgetMB", memoryBudgetMB},
                         {"memoryPollIntervalMs", memoryPollIntervalMs},
                         {"adaptiveQuality", adaptiveQuality}}},
        {"animation", {{"durationMs", animationDurationMs},
                       {"frameIntervalMs", frameIntervalMs},
                       {"reducedMotion", reducedMotion},
                       {"smoothZoom", smoothZoom}}},
        {"interaction", {{"panSensitivity", panSensitivity}}},
        {"render", {{"crosshair", showCrosshair},
                    {"resizeDebounceMs", resizeDebounceMs},
                    {"exportDirectory", exportDirectory}}},
        {"indicators", indicators},
    };
}
