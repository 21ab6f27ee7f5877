/*
Kline — TechnicalIndicators
Role: Pure indicator math over OHLCV field arrays (moving averages, oscillators, bands, volume).
Inputs/Outputs: Takes spans of doubles plus periods; returns raw value vectors.
Threading: Stateless free functions; safe to call from any thread.
Performance: Windowed indicators sum each window directly, O(n * period); periods are small.
Integration: Called by IndicatorEngine, which aligns the raw vectors to candle timestamps.
Observability: No logging; degenerate input yields an empty vector.
Related: TechnicalIndicators.cpp, IndicatorEngine.hpp.
Assumptions: Multi-input indicators use the shortest common input length.
*/
#pragma once

#include <span>
#include <vector>

namespace TechnicalIndicators {

// Warm-up and length contracts:
//   sma/wma/bollinger/stochastic %K/williamsR/cci : len - period + 1
//   rsi/mfi                                       : len - period
//   atr                                           : len - period (true ranges start at bar 1)
//   macd                                          : len - slow + 1
//   ema/parabolicSar/obv/vwap                     : len
// Every output is tail-aligned: its last element belongs to the last input bar.
// Insufficient input or a non-positive period produces an empty result.

struct MacdResult {
    std::vector<double> macd;
    std::vector<double> signal;
    std::vector<double> histogram;
};

struct BollingerResult {
    std::vector<double> upper;
    std::vector<double> middle;
    std::vector<double> lower;
};

struct StochasticResult {
    std::vector<double> k;
    std::vector<double> d;
};

// tenkanSen/kijunSen/senkouSpanA/senkouSpanB are tail-aligned.
// chikouSpan[i] is close[i + kijun], i.e. it belongs to bar i (head-aligned).
struct IchimokuResult {
    std::vector<double> tenkanSen;
    std::vector<double> kijunSen;
    std::vector<double> senkouSpanA;
    std::vector<double> senkouSpanB;
    std::vector<double> chikouSpan;
};

std::vector<double> sma(std::span<const double> values, int period);
std::vector<double> ema(std::span<const double> values, int period);
std::vector<double> wma(std::span<const double> values, int period);
std::vector<double> rsi(std::span<const double> values, int period = 14);

MacdResult macd(std::span<const double> values, int fast = 12, int slow = 26, int signal = 9);
BollingerResult bollingerBands(std::span<const double> values, int period = 20, double stdDevMultiplier = 2.0);

StochasticResult stochastic(std::span<const double> high, std::span<const double> low,
                            std::span<const double> close, int kPeriod = 14, int dPeriod = 3);
std::vector<double> atr(std::span<const double> high, std::span<const double> low,
                        std::span<const double> close, int period = 14);
std::vector<double> williamsR(std::span<const double> high, std::span<const double> low,
                              std::span<const double> close, int period = 14);
std::vector<double> cci(std::span<const double> high, std::span<const double> low,
                        std::span<const double> close, int period = 20);
std::vector<double> mfi(std::span<const double> high, std::span<const double> low,
                        std::span<const double> close, std::span<const double> volume, int period = 14);
std::vector<double> parabolicSar(std::span<const double> high, std::span<const double> low,
                                 std::span<const double> close, double step = 0.02, double maxStep = 0.2);
IchimokuResult ichimoku(std::span<const double> high, std::span<const double> low,
                        std::span<const double> close, int tenkan = 9, int kijun = 26, int senkouB = 52);

std::vector<double> obv(std::span<const double> close, std::span<const double> volume);
std::vector<double> vwap(std::span<const double> high, std::span<const double> low,
                         std::span<const double> close, std::span<const double> volume);

} // namespace TechnicalIndicators
