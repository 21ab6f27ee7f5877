#include "IndicatorEngine.hpp"
#include "Log.hpp"
#include "TechnicalIndicators.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <type_traits>

namespace {
static constexpr auto CAT = "Indicators";

using nlohmann::json;

bool enabled(const json& node) {
    if (node.is_null()) return false;
    if (node.is_boolean()) return node.get<bool>();
    return true;
}

// Integral JSON numbers within int range convert as-is. Fractional,
// non-finite or out-of-range numbers become 0, which every period check rejects.
int checkedInt(const json& node) {
    if (node.is_number_unsigned()) {
        const auto v = node.get<std::uint64_t>();
        return v > static_cast<std::uint64_t>(std::numeric_limits<int>::max()) ? 0 : static_cast<int>(v);
    }
    if (node.is_number_integer()) {
        const auto v = node.get<std::int64_t>();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return 0;
        return static_cast<int>(v);
    }
    if (node.is_number_float()) {
        const double v = node.get<double>();
        if (!std::isfinite(v) || v != std::trunc(v)) return 0;
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return 0;
        return static_cast<int>(v);
    }
    return node.get<int>();
}

std::vector<int> checkedIntList(const json& node) {
    if (!node.is_array()) return {checkedInt(node)};
    std::vector<int> out;
    out.reserve(node.size());
    for (const auto& v : node) out.push_back(checkedInt(v));
    return out;
}

// Reads a numeric parameter from an object node; a bare number or `true`
// stands for the whole parameter set and falls back to the default.
template <typename T>
T param(const json& node, const char* key, T fallback) {
    if (node.is_object()) {
        auto it = node.find(key);
        if (it != node.end() && !it->is_null()) {
            if constexpr (std::is_same_v<T, int>) return checkedInt(*it);
            else return it->get<T>();
        }
    }
    return fallback;
}

int singlePeriod(const json& node, int fallback) {
    if (node.is_number()) return checkedInt(node);
    return param<int>(node, "period", fallback);
}

std::vector<int> periodList(const json& node, std::initializer_list<int> fallback) {
    if (node.is_number() || node.is_array()) return checkedIntList(node);
    if (node.is_object()) {
        if (node.contains("periods")) return checkedIntList(node.at("periods"));
        if (node.contains("period")) return {checkedInt(node.at("period"))};
    }
    return fallback;
}

IndicatorStatus statusFor(bool paramsValid, bool hasData) {
    if (!paramsValid) return IndicatorStatus::InvalidParameters;
    return hasData ? IndicatorStatus::Ok : IndicatorStatus::InsufficientData;
}

IndicatorOutput singleLine(const std::vector<Candle>& history, const std::vector<double>& values, bool paramsValid) {
    IndicatorOutput out;
    out.status = statusFor(paramsValid, !values.empty());
    if (out.ok()) out.lines.emplace("value", IndicatorEngine::alignTail(history, values));
    return out;
}

} // namespace

IndicatorSeries IndicatorEngine::alignTail(const std::vector<Candle>& history, const std::vector<double>& values) {
    IndicatorSeries series;
    if (values.size() > history.size()) return series;
    const std::size_t offset = history.size() - values.size();
    series.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        series.push_back({history[offset + i].timestamp_ms, values[i]});
    }
    return series;
}

IndicatorSeries IndicatorEngine::alignHead(const std::vector<Candle>& history, const std::vector<double>& values) {
    IndicatorSeries series;
    const std::size_t n = std::min(values.size(), history.size());
    series.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        series.push_back({history[i].timestamp_ms, values[i]});
    }
    return series;
}

json IndicatorEngine::defaultConfig() {
    return json{
        {"sma", json::array({20, 50})},
        {"ema", json::array({12, 26})},
        {"rsi", 14},
        {"macd", {{"fast", 12}, {"slow", 26}, {"signal", 9}}},
        {"bollinger", {{"period", 20}, {"stdDev", 2.0}}},
        {"stochastic", {{"k", 14}, {"d", 3}}},
        {"atr", 14},
        {"williamsR", 14},
        {"cci", 20},
        {"mfi", 14},
        {"parabolicSAR", {{"step", 0.02}, {"max", 0.2}}},
        {"ichimoku", {{"tenkan", 9}, {"kijun", 26}, {"senkouB", 52}}},
        {"vwap", true},
        {"obv", true},
    };
}

IndicatorSet IndicatorEngine::computeAll(const std::vector<Candle>& history, const json& config) {
    if (history.empty() || !config.is_object()) return {};
    try {
        return computeUnchecked(history, config);
    } catch (const json::exception& e) {
        LOG_W(CAT, "indicator config rejected ({} candles): {}", history.size(), e.what());
        return {};
    }
}

IndicatorSet IndicatorEngine::computeUnchecked(const std::vector<Candle>& history, const json& config) {
    namespace TI = TechnicalIndicators;

    const auto closes = CandleUtils::closes(history);
    const auto highs = CandleUtils::highs(history);
    const auto lows = CandleUtils::lows(history);
    const auto volumes = CandleUtils::volumes(history);

    IndicatorSet result;

    auto movingAverages = [&](const char* key, std::initializer_list<int> defaults, auto&& fn) {
        auto it = config.find(key);
        if (it == config.end() || !enabled(*it)) return;
        for (int period : periodList(*it, defaults)) {
            result[std::string(key) + std::to_string(period)] = singleLine(history, fn(closes, period), period > 0);
        }
    };
    movingAverages("sma", {20, 50}, [](const auto& v, int p) { return TI::sma(v, p); });
    movingAverages("ema", {12, 26}, [](const auto& v, int p) { return TI::ema(v, p); });
    movingAverages("wma", {10}, [](const auto& v, int p) { return TI::wma(v, p); });

    auto node = [&](const char* key) -> const json* {
        auto it = config.find(key);
        return (it == config.end() || !enabled(*it)) ? nullptr : &*it;
    };

    if (const json* n = node("rsi")) {
        const int period = singlePeriod(*n, 14);
        result["rsi"] = singleLine(history, TI::rsi(closes, period), period > 0);
    }

    if (const json* n = node("macd")) {
        const int fast = param<int>(*n, "fast", 12);
        const int slow = param<int>(*n, "slow", 26);
        const int signal = param<int>(*n, "signal", 9);
        const auto m = TI::macd(closes, fast, slow, signal);
        IndicatorOutput out;
        out.status = statusFor(fast > 0 && signal > 0 && fast < slow, !m.macd.empty());
        if (out.ok()) {
            out.lines.emplace("macd", alignTail(history, m.macd));
            out.lines.emplace("signal", alignTail(history, m.signal));
            out.lines.emplace("histogram", alignTail(history, m.histogram));
        }
        result["macd"] = std::move(out);
    }

    if (const json* n = node("bollinger")) {
        const int period = singlePeriod(*n, 20);
        const double stdDev = param<double>(*n, "stdDev", 2.0);
        const auto b = TI::bollingerBands(closes, period, stdDev);
        IndicatorOutput out;
        out.status = statusFor(period > 0, !b.middle.empty());
        if (out.ok()) {
            out.lines.emplace("upper", alignTail(history, b.upper));
            out.lines.emplace("middle", alignTail(history, b.middle));
            out.lines.emplace("lower", alignTail(history, b.lower));
        }
        result["bollingerBands"] = std::move(out);
    }

    if (const json* n = node("stochastic")) {
        const int k = param<int>(*n, "k", 14);
        const int d = param<int>(*n, "d", 3);
        const auto s = TI::stochastic(highs, lows, closes, k, d);
        IndicatorOutput out;
        out.status = statusFor(k > 0 && d > 0, !s.k.empty());
        if (out.ok()) {
            out.lines.emplace("k", alignTail(history, s.k));
            out.lines.emplace("d", alignTail(history, s.d));
        }
        result["stochastic"] = std::move(out);
    }

    if (const json* n = node("atr")) {
        const int period = singlePeriod(*n, 14);
        result["atr"] = singleLine(history, TI::atr(highs, lows, closes, period), period > 0);
    }
    if (const json* n = node("williamsR")) {
        const int period = singlePeriod(*n, 14);
        result["williamsR"] = singleLine(history, TI::williamsR(highs, lows, closes, period), period > 0);
    }
    if (const json* n = node("cci")) {
        const int period = singlePeriod(*n, 20);
        result["cci"] = singleLine(history, TI::cci(highs, lows, closes, period), period > 0);
    }
    if (const json* n = node("mfi")) {
        const int period = singlePeriod(*n, 14);
        result["mfi"] = singleLine(history, TI::mfi(highs, lows, closes, volumes, period), period > 0);
    }

    if (const json* n = node("parabolicSAR")) {
        const double step = param<double>(*n, "step", 0.02);
        const double maxStep = param<double>(*n, "max", 0.2);
        result["parabolicSAR"] = singleLine(history, TI::parabolicSar(highs, lows, closes, step, maxStep),
                                            step > 0.0 && maxStep >= step);
    }

    if (const json* n = node("ichimoku")) {
        const int tenkan = param<int>(*n, "tenkan", 9);
        const int kijun = param<int>(*n, "kijun", 26);
        const int senkouB = param<int>(*n, "senkouB", 52);
        const auto ich = TI::ichimoku(highs, lows, closes, tenkan, kijun, senkouB);
        IndicatorOutput out;
        out.status = statusFor(tenkan > 0 && kijun > 0 && senkouB > 0, !ich.tenkanSen.empty());
        if (out.ok()) {
            out.lines.emplace("tenkanSen", alignTail(history, ich.tenkanSen));
            out.lines.emplace("kijunSen", alignTail(history, ich.kijunSen));
            out.lines.emplace("senkouSpanA", alignTail(history, ich.senkouSpanA));
            out.lines.emplace("senkouSpanB", alignTail(history, ich.senkouSpanB));
            out.lines.emplace("chikouSpan", alignHead(history, ich.chikouSpan));
        }
        result["ichimoku"] = std::move(out);
    }

    if (node("vwap")) result["vwap"] = singleLine(history, TI::vwap(highs, lows, closes, volumes), true);
    if (node("obv")) result["obv"] = singleLine(history, TI::obv(closes, volumes), true);

    LOG_D(CAT, "computed {} indicator outputs over {} candles", result.size(), history.size());
    return result;
}
