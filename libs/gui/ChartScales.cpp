/*
Kline — ChartScales
Role: Implements the linear price/volume/oscillator mappings and their degenerate-range guards.
Inputs/Outputs: See ChartScales.h.
Threading: Pure functions of the built state.
Performance: O(visible) build, O(1) conversions.
Integration: Used by every ChartRenderer draw pass.
Observability: No internal logging.
Related: ChartScales.h.
Assumptions: A flat or empty price range is widened around its midpoint.
*/
#include "ChartScales.h"
#include <algorithm>
#include <cmath>
#include <limits>

double ChartScales::finiteOr(double v, double fallback) {
    return std::isfinite(v) ? v : fallback;
}

bool ChartScales::validateGeometry(const QSizeF& surfaceSize, const ChartPadding& padding) {
    return surfaceSize.width() - padding.left - padding.right > EPSILON &&
           surfaceSize.height() - padding.top - padding.bottom > EPSILON;
}

ChartScales ChartScales::build(const QSizeF& surfaceSize, const ChartPadding& padding,
                               const std::vector<Candle>& visible, double candleWidth, double candleSpacing) {
    ChartScales s;
    s.m_candleWidth = candleWidth;
    s.m_candleSpacing = candleSpacing;

    const double chartWidth = std::max(0.0, surfaceSize.width() - padding.left - padding.right);
    const double chartHeight = std::max(0.0, surfaceSize.height() - padding.top - padding.bottom);
    s.m_plot = QRectF(padding.left, padding.top, chartWidth, chartHeight);
    s.m_priceRect = QRectF(padding.left, padding.top, chartWidth, chartHeight * PRICE_FRACTION);
    s.m_lowerBand = QRectF(padding.left, padding.top + chartHeight * LOWER_BAND_TOP,
                           chartWidth, chartHeight * LOWER_BAND_FRACTION);
    s.m_rsiRect = s.m_lowerBand;
    s.m_macdRect = s.m_lowerBand;
    s.m_valid = validateGeometry(surfaceSize, padding);

    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();
    double maxVolume = 0.0;
    for (const auto& c : visible) {
        if (!c.isFinite()) continue;
        lo = std::min(lo, c.effectiveLow());
        hi = std::max(hi, c.effectiveHigh());
        maxVolume = std::max(maxVolume, c.volume);
    }

    if (!std::isfinite(lo) || !std::isfinite(hi)) {
        lo = 0.0;
        hi = 1.0;
    }
    s.m_minPrice = lo;
    s.m_maxPrice = hi;

    const double range = hi - lo;
    if (range > EPSILON) {
        s.m_pricePad = range * PRICE_PADDING_RATIO;
    } else {
        // Flat series: centre it with a band proportional to the price itself.
        s.m_pricePad = std::max(std::abs(hi) * 0.01, 1.0);
    }
    s.m_maxVolume = maxVolume;
    return s;
}

void ChartScales::setMacdRange(double minValue, double maxValue) {
    if (!std::isfinite(minValue) || !std::isfinite(maxValue) || maxValue < minValue) return;
    if (maxValue - minValue <= EPSILON) {
        const double pad = std::max(std::abs(maxValue), 1.0);
        minValue -= pad;
        maxValue += pad;
    }
    m_macdMin = minValue;
    m_macdMax = maxValue;
}

void ChartScales::setOscillatorLayout(bool rsiVisible, bool macdVisible) {
    m_rsiRect = m_lowerBand;
    m_macdRect = m_lowerBand;
    if (rsiVisible && macdVisible) {
        const double half = m_lowerBand.height() / 2.0;
        m_rsiRect.setHeight(half);
        m_macdRect.setTop(m_lowerBand.top() + half);
        m_macdRect.setHeight(half);
    }
}

double ChartScales::x(double offset) const {
    return m_plot.left() + finiteOr(offset, 0.0) * slotWidth();
}

int ChartScales::offsetAt(double px) const {
    if (slotWidth() <= EPSILON) return 0;
    return static_cast<int>(std::floor((px - m_plot.left()) / slotWidth()));
}

double ChartScales::y(double price) const {
    const double low = m_minPrice - m_pricePad;
    const double span = (m_maxPrice - m_minPrice) + 2.0 * m_pricePad;
    const double normalized = (finiteOr(price, (m_minPrice + m_maxPrice) / 2.0) - low) / span;
    return m_priceRect.top() + (1.0 - normalized) * m_priceRect.height();
}

double ChartScales::priceAt(double py) const {
    if (m_priceRect.height() <= EPSILON) return m_minPrice;
    const double low = m_minPrice - m_pricePad;
    const double span = (m_maxPrice - m_minPrice) + 2.0 * m_pricePad;
    const double normalized = 1.0 - (py - m_priceRect.top()) / m_priceRect.height();
    return low + normalized * span;
}

double ChartScales::volumeY(double volume) const {
    if (m_maxVolume <= 0.0) return volumeBaseY();
    const double normalized = std::clamp(finiteOr(volume, 0.0) / m_maxVolume, 0.0, 1.0);
    return m_lowerBand.top() + (1.0 - normalized) * m_lowerBand.height();
}

double ChartScales::rsiY(double value) const {
    const double v = std::clamp(finiteOr(value, 50.0), 0.0, 100.0);
    return m_rsiRect.top() + (1.0 - v / 100.0) * m_rsiRect.height();
}

double ChartScales::macdY(double value) const {
    const double normalized = (finiteOr(value, 0.0) - m_macdMin) / (m_macdMax - m_macdMin);
    return m_macdRect.top() + (1.0 - normalized) * m_macdRect.height();
}
