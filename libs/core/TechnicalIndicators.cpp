#include "TechnicalIndicators.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <initializer_list>

namespace TechnicalIndicators {

namespace {

std::size_t commonLength(std::initializer_list<std::size_t> sizes) {
    return sizes.size() == 0 ? 0 : *std::min_element(sizes.begin(), sizes.end());
}

double windowSum(std::span<const double> v, std::size_t end, int period) {
    double sum = 0.0;
    for (std::size_t j = end + 1 - static_cast<std::size_t>(period); j <= end; ++j) sum += v[j];
    return sum;
}

double highestHigh(std::span<const double> high, std::size_t end, int period) {
    double hh = high[end];
    for (std::size_t j = end + 1 - static_cast<std::size_t>(period); j < end; ++j) hh = std::max(hh, high[j]);
    return hh;
}

double lowestLow(std::span<const double> low, std::size_t end, int period) {
    double ll = low[end];
    for (std::size_t j = end + 1 - static_cast<std::size_t>(period); j < end; ++j) ll = std::min(ll, low[j]);
    return ll;
}

bool insufficient(std::size_t len, int period) {
    return period <= 0 || len < static_cast<std::size_t>(period);
}

// Midpoint of the highest high and lowest low over each trailing window.
std::vector<double> donchianMid(std::span<const double> high, std::span<const double> low,
                                std::size_t len, int period) {
    std::vector<double> out;
    if (insufficient(len, period)) return out;
    out.reserve(len - period + 1);
    for (std::size_t i = period - 1; i < len; ++i) {
        out.push_back((highestHigh(high, i, period) + lowestLow(low, i, period)) / 2.0);
    }
    return out;
}

} // namespace

std::vector<double> sma(std::span<const double> values, int period) {
    std::vector<double> out;
    if (values.empty() || insufficient(values.size(), period)) return out;
    out.reserve(values.size() - period + 1);
    for (std::size_t i = period - 1; i < values.size(); ++i) {
        out.push_back(windowSum(values, i, period) / period);
    }
    return out;
}

std::vector<double> ema(std::span<const double> values, int period) {
    std::vector<double> out;
    if (values.empty() || insufficient(values.size(), period)) return out;
    const double k = 2.0 / (period + 1);
    out.reserve(values.size());
    out.push_back(values[0]);
    for (std::size_t i = 1; i < values.size(); ++i) {
        out.push_back(values[i] * k + out[i - 1] * (1.0 - k));
    }
    return out;
}

std::vector<double> wma(std::span<const double> values, int period) {
    std::vector<double> out;
    if (values.empty() || insufficient(values.size(), period)) return out;
    const double weightSum = period * (period + 1) / 2.0;
    out.reserve(values.size() - period + 1);
    for (std::size_t i = period - 1; i < values.size(); ++i) {
        double sum = 0.0;
        for (int j = 0; j < period; ++j) sum += values[i - j] * (period - j);
        out.push_back(sum / weightSum);
    }
    return out;
}

std::vector<double> rsi(std::span<const double> values, int period) {
    std::vector<double> out;
    if (period <= 0 || values.size() < static_cast<std::size_t>(period) + 1) return out;

    std::vector<double> gains, losses;
    gains.reserve(values.size() - 1);
    losses.reserve(values.size() - 1);
    for (std::size_t i = 1; i < values.size(); ++i) {
        const double change = values[i] - values[i - 1];
        gains.push_back(change > 0 ? change : 0.0);
        losses.push_back(change < 0 ? -change : 0.0);
    }

    const auto avgGain = sma(gains, period);
    const auto avgLoss = sma(losses, period);
    out.reserve(avgGain.size());
    for (std::size_t i = 0; i < avgGain.size(); ++i) {
        if (avgLoss[i] == 0.0) {
            // No movement at all reads as neutral, pure gains as saturated.
            out.push_back(avgGain[i] == 0.0 ? 50.0 : 100.0);
        } else {
            const double rs = avgGain[i] / avgLoss[i];
            out.push_back(100.0 - 100.0 / (1.0 + rs));
        }
    }
    return out;
}

MacdResult macd(std::span<const double> values, int fast, int slow, int signal) {
    MacdResult r;
    if (fast <= 0 || signal <= 0 || fast >= slow || insufficient(values.size(), slow)) return r;

    const auto fastEma = ema(values, fast);
    const auto slowEma = ema(values, slow);
    r.macd.reserve(values.size() - slow + 1);
    for (std::size_t i = slow - 1; i < values.size(); ++i) {
        r.macd.push_back(fastEma[i] - slowEma[i]);
    }

    r.signal = ema(r.macd, signal);
    const std::size_t signalStart = r.macd.size() - r.signal.size();
    r.histogram.reserve(r.signal.size());
    for (std::size_t i = signalStart; i < r.macd.size(); ++i) {
        r.histogram.push_back(r.macd[i] - r.signal[i - signalStart]);
    }
    return r;
}

BollingerResult bollingerBands(std::span<const double> values, int period, double stdDevMultiplier) {
    BollingerResult r;
    r.middle = sma(values, period);
    if (r.middle.empty()) return r;

    r.upper.reserve(r.middle.size());
    r.lower.reserve(r.middle.size());
    for (std::size_t i = period - 1; i < values.size(); ++i) {
        const double mean = r.middle[i - period + 1];
        double variance = 0.0;
        for (std::size_t j = i + 1 - period; j <= i; ++j) {
            variance += (values[j] - mean) * (values[j] - mean);
        }
        const double sd = std::sqrt(variance / period);
        r.upper.push_back(mean + sd * stdDevMultiplier);
        r.lower.push_back(mean - sd * stdDevMultiplier);
    }
    return r;
}

StochasticResult stochastic(std::span<const double> high, std::span<const double> low,
                            std::span<const double> close, int kPeriod, int dPeriod) {
    StochasticResult r;
    const std::size_t len = commonLength({high.size(), low.size(), close.size()});
    if (insufficient(len, kPeriod)) return r;

    r.k.reserve(len - kPeriod + 1);
    for (std::size_t i = kPeriod - 1; i < len; ++i) {
        const double hh = highestHigh(high, i, kPeriod);
        const double ll = lowestLow(low, i, kPeriod);
        r.k.push_back(hh == ll ? 50.0 : (close[i] - ll) / (hh - ll) * 100.0);
    }
    r.d = sma(r.k, dPeriod);
    return r;
}

std::vector<double> atr(std::span<const double> high, std::span<const double> low,
                        std::span<const double> close, int period) {
    const std::size_t len = commonLength({high.size(), low.size(), close.size()});
    if (len < 2) return {};

    std::vector<double> trueRanges;
    trueRanges.reserve(len - 1);
    for (std::size_t i = 1; i < len; ++i) {
        trueRanges.push_back(std::max({high[i] - low[i],
                                       std::abs(high[i] - close[i - 1]),
                                       std::abs(low[i] - close[i - 1])}));
    }
    return sma(trueRanges, period);
}

std::vector<double> williamsR(std::span<const double> high, std::span<const double> low,
                              std::span<const double> close, int period) {
    std::vector<double> out;
    const std::size_t len = commonLength({high.size(), low.size(), close.size()});
    if (insufficient(len, period)) return out;

    out.reserve(len - period + 1);
    for (std::size_t i = period - 1; i < len; ++i) {
        const double hh = highestHigh(high, i, period);
        const double ll = lowestLow(low, i, period);
        out.push_back(hh == ll ? -50.0 : (hh - close[i]) / (hh - ll) * -100.0);
    }
    return out;
}

std::vector<double> cci(std::span<const double> high, std::span<const double> low,
                        std::span<const double> close, int period) {
    std::vector<double> out;
    const std::size_t len = commonLength({high.size(), low.size(), close.size()});
    if (insufficient(len, period)) return out;

    std::vector<double> typical(len);
    for (std::size_t i = 0; i < len; ++i) typical[i] = (high[i] + low[i] + close[i]) / 3.0;

    const auto smaTp = sma(typical, period);
    out.reserve(smaTp.size());
    for (std::size_t i = period - 1; i < len; ++i) {
        const double mean = smaTp[i - period + 1];
        double meanDeviation = 0.0;
        for (std::size_t j = i + 1 - period; j <= i; ++j) meanDeviation += std::abs(typical[j] - mean);
        meanDeviation /= period;
        out.push_back(meanDeviation == 0.0 ? 0.0 : (typical[i] - mean) / (0.015 * meanDeviation));
    }
    return out;
}

std::vector<double> mfi(std::span<const double> high, std::span<const double> low,
                        std::span<const double> close, std::span<const double> volume, int period) {
    std::vector<double> out;
    const std::size_t len = commonLength({high.size(), low.size(), close.size(), volume.size()});
    if (period <= 0 || len < static_cast<std::size_t>(period) + 1) return out;

    std::vector<double> typical(len), rawFlow(len);
    for (std::size_t i = 0; i < len; ++i) {
        typical[i] = (high[i] + low[i] + close[i]) / 3.0;
        rawFlow[i] = typical[i] * volume[i];
    }

    out.reserve(len - period);
    for (std::size_t i = period; i < len; ++i) {
        double positive = 0.0;
        double negative = 0.0;
        for (std::size_t j = i + 1 - period; j <= i; ++j) {
            if (typical[j] > typical[j - 1]) positive += rawFlow[j];
            else if (typical[j] < typical[j - 1]) negative += rawFlow[j];
        }
        out.push_back(negative == 0.0 ? 100.0 : 100.0 - 100.0 / (1.0 + positive / negative));
    }
    return out;
}

std::vector<double> parabolicSar(std::span<const double> high, std::span<const double> low,
                                 std::span<const double> close, double step, double maxStep) {
    std::vector<double> sar;
    const std::size_t len = commonLength({high.size(), low.size(), close.size()});
    if (len < 2 || step <= 0.0 || maxStep < step) return sar;

    sar.reserve(len);
    sar.push_back(close[0]);
    int trend = 1;
    double af = step;
    double ep = high[0];

    for (std::size_t i = 1; i < len; ++i) {
        double next = sar[i - 1] + af * (ep - sar[i - 1]);
        if (trend == 1) {
            if (high[i] > ep) {
                ep = high[i];
                af = std::min(af + step, maxStep);
            }
            if (next > low[i]) {
                trend = -1;
                next = ep;
                ep = low[i];
                af = step;
            }
        } else {
            if (low[i] < ep) {
                ep = low[i];
                af = std::min(af + step, maxStep);
            }
            if (next < high[i]) {
                trend = 1;
                next = ep;
                ep = high[i];
                af = step;
            }
        }
        sar.push_back(next);
    }
    return sar;
}

IchimokuResult ichimoku(std::span<const double> high, std::span<const double> low,
                        std::span<const double> close, int tenkan, int kijun, int senkouB) {
    IchimokuResult r;
    const std::size_t len = commonLength({high.size(), low.size(), close.size()});
    if (tenkan <= 0 || kijun <= 0 || insufficient(len, senkouB) || insufficient(len, std::max(tenkan, kijun))) {
        return r;
    }

    r.tenkanSen = donchianMid(high, low, len, tenkan);
    r.kijunSen = donchianMid(high, low, len, kijun);
    r.senkouSpanB = donchianMid(high, low, len, senkouB);

    // Span A exists where both conversion and base lines exist; pair them on the same bar.
    const std::size_t spanALength = std::min(r.tenkanSen.size(), r.kijunSen.size());
    const std::size_t tenkanOffset = r.tenkanSen.size() - spanALength;
    const std::size_t kijunOffset = r.kijunSen.size() - spanALength;
    r.senkouSpanA.reserve(spanALength);
    for (std::size_t i = 0; i < spanALength; ++i) {
        r.senkouSpanA.push_back((r.tenkanSen[i + tenkanOffset] + r.kijunSen[i + kijunOffset]) / 2.0);
    }

    if (len > static_cast<std::size_t>(kijun)) {
        r.chikouSpan.assign(close.begin() + kijun, close.begin() + len);
    }
    return r;
}

std::vector<double> obv(std::span<const double> close, std::span<const double> volume) {
    std::vector<double> out;
    const std::size_t len = commonLength({close.size(), volume.size()});
    if (len < 2) return out;

    out.reserve(len);
    out.push_back(volume[0]);
    for (std::size_t i = 1; i < len; ++i) {
        if (close[i] > close[i - 1]) out.push_back(out[i - 1] + volume[i]);
        else if (close[i] < close[i - 1]) out.push_back(out[i - 1] - volume[i]);
        else out.push_back(out[i - 1]);
    }
    return out;
}

std::vector<double> vwap(std::span<const double> high, std::span<const double> low,
                         std::span<const double> close, std::span<const double> volume) {
    std::vector<double> out;
    const std::size_t len = commonLength({high.size(), low.size(), close.size(), volume.size()});
    out.reserve(len);

    double cumulativeTpv = 0.0;
    double cumulativeVolume = 0.0;
    for (std::size_t i = 0; i < len; ++i) {
        const double typical = (high[i] + low[i] + close[i]) / 3.0;
        cumulativeTpv += typical * volume[i];
        cumulativeVolume += volume[i];
        out.push_back(cumulativeVolume > 0.0 ? cumulativeTpv / cumulativeVolume : typical);
    }
    return out;
}

} // namespace TechnicalIndicators
