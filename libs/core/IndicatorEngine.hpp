#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Candle.hpp"

enum class IndicatorStatus {
    Ok,
    InsufficientData,   // Parameters fine, history shorter than the warm-up
    InvalidParameters   // Non-positive period, fast >= slow, ...
};

// One computed indicator: a status plus its named lines, each aligned to
// candle timestamps. Single-line indicators use the line name "value".
struct IndicatorOutput {
    IndicatorStatus status = IndicatorStatus::InsufficientData;
    std::map<std::string, IndicatorSeries> lines;

    bool ok() const { return status == IndicatorStatus::Ok; }

    const IndicatorSeries* line(const std::string& name) const {
        auto it = lines.find(name);
        return it == lines.end() ? nullptr : &it->second;
    }
};

using IndicatorSet = std::map<std::string, IndicatorOutput>;

// 📈 Computes the configured indicators for a candle history.
//
// Config keys (absent, null or false entries are skipped, unknown keys ignored):
//   "sma" / "ema" / "wma"   : period, [periods], {"period": n}, {"periods": [..]} or true
//                             -> outputs "sma20", "ema12", ...
//   "rsi" "atr" "williamsR" "cci" "mfi" : period, {"period": n} or true
//   "macd"                  : {"fast", "slow", "signal"} -> lines macd/signal/histogram
//   "bollinger"             : {"period", "stdDev"}       -> output "bollingerBands", lines upper/middle/lower
//   "stochastic"            : {"k", "d"}                 -> lines k/d
//   "parabolicSAR"          : {"step", "max"}
//   "ichimoku"              : {"tenkan", "kijun", "senkouB"} -> five lines
//   "vwap" "obv"            : true
class IndicatorEngine {
public:
    // Never throws: malformed parameter types are logged and yield an empty set.
    static IndicatorSet computeAll(const std::vector<Candle>& history, const nlohmann::json& config);

    // Defaults matching the common trading-desk presets.
    static nlohmann::json defaultConfig();

    // Maps a tail-aligned raw vector onto the last values.size() candles.
    static IndicatorSeries alignTail(const std::vector<Candle>& history, const std::vector<double>& values);
    // Maps values[i] onto history[i].
    static IndicatorSeries alignHead(const std::vector<Candle>& history, const std::vector<double>& values);

private:
    static IndicatorSet computeUnchecked(const std::vector<Candle>& history, const nlohmann::json& config);
};
