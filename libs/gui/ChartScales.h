/*
Kline — ChartScales
Role: Maps visible-slice offsets and prices/volumes/oscillator values to widget pixels.
Inputs/Outputs: Built from surface size, padding, candle geometry and the visible slice; pure conversion methods.
Threading: Immutable after build(); safe to copy between frames.
Performance: Extremes are scanned once per build; conversions are a few multiplies.
Integration: Rebuilt by ChartRenderer whenever data, view state or size changes.
Observability: No internal logging.
Related: ChartScales.cpp, ChartRenderer.h, render/ChartSession.hpp.
Assumptions: Price increases upward; every output coordinate is finite.
*/
#pragma once
#include <QRectF>
#include <QSizeF>
#include <vector>
#include "Candle.hpp"

struct ChartPadding {
    double top = 20.0;
    double right = 60.0;
    double bottom = 40.0;
    double left = 60.0;
    bool operator==(const ChartPadding&) const = default;
};

class ChartScales {
public:
    // Vertical layout, as fractions of the plotting height
    static constexpr double PRICE_FRACTION = 0.80;
    static constexpr double LOWER_BAND_TOP = 0.85;
    static constexpr double LOWER_BAND_FRACTION = 0.15;
    static constexpr double PRICE_PADDING_RATIO = 0.10;

    ChartScales() = default;

    static ChartScales build(const QSizeF& surfaceSize, const ChartPadding& padding,
                             const std::vector<Candle>& visible, double candleWidth, double candleSpacing);

    // Extends the MACD scale; call once per frame with every visible MACD value.
    void setMacdRange(double minValue, double maxValue);

    // 🎯 X: visible offset (original candle slots from range start) -> left edge of the slot
    double x(double offset) const;
    double xCenter(double offset) const { return x(offset) + m_candleWidth / 2.0; }
    // Inverse of x(); returns the slot under a pixel column, possibly out of range.
    int offsetAt(double px) const;

    // 🎯 Y: price -> pixel (top 80% of the plotting area)
    double y(double price) const;
    double priceAt(double py) const;

    // Volume band (bottom 15%)
    double volumeY(double volume) const;
    double volumeBaseY() const { return m_lowerBand.bottom(); }

    // Oscillator sub-panel. When both are shown RSI takes the upper half.
    void setOscillatorLayout(bool rsiVisible, bool macdVisible);
    double rsiY(double value) const;
    double macdY(double value) const;
    QRectF rsiRect() const { return m_rsiRect; }
    QRectF macdRect() const { return m_macdRect; }

    QRectF plotRect() const { return m_plot; }
    QRectF priceRect() const { return m_priceRect; }
    QRectF lowerBandRect() const { return m_lowerBand; }
    double minPrice() const { return m_minPrice; }
    double maxPrice() const { return m_maxPrice; }
    double maxVolume() const { return m_maxVolume; }
    double candleWidth() const { return m_candleWidth; }
    double slotWidth() const { return m_candleWidth + m_candleSpacing; }
    bool isValid() const { return m_valid; }

    static bool validateGeometry(const QSizeF& surfaceSize, const ChartPadding& padding);

private:
    static double finiteOr(double v, double fallback);

    QRectF m_plot;
    QRectF m_priceRect;
    QRectF m_lowerBand;
    QRectF m_rsiRect;
    QRectF m_macdRect;
    double m_candleWidth = 8.0;
    double m_candleSpacing = 2.0;
    double m_minPrice = 0.0;
    double m_maxPrice = 1.0;
    double m_pricePad = 0.1;
    double m_maxVolume = 0.0;
    double m_macdMin = -1.0;
    double m_macdMax = 1.0;
    bool m_valid = false;

    static constexpr double EPSILON = 1e-10;
};
