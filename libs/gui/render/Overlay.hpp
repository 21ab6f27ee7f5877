#pragma once

#include <QColor>
#include <QPointF>
#include <variant>
#include <vector>

// User drawings on top of the price panel. Caller-owned; the renderer only reads them.
// Points use x = history index, y = price.

struct TrendlineOverlay {
    std::vector<QPointF> points;
    QColor color{0x21, 0x96, 0xF3};
    double width = 1.0;
    bool dashed = false;
};

struct HorizontalLineOverlay {
    double price = 0.0;
    QColor color{0xFF, 0x98, 0x00};
    double width = 1.0;
    bool dashed = true;
    bool showLabel = true;
};

struct RectangleOverlay {
    QPointF topLeft;
    QPointF bottomRight;
    QColor fillColor{0x21, 0x96, 0xF3, 0x33};
    QColor borderColor{0x21, 0x96, 0xF3};
    double borderWidth = 1.0;
    bool dashed = false;
};

using Overlay = std::variant<TrendlineOverlay, HorizontalLineOverlay, RectangleOverlay>;
