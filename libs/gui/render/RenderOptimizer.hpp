/*
Kline — ChartRenderOptimizer
Role: Named off-screen layers with explicit Clean/Dirty state, composited back-to-front onto a primary surface.
Inputs/Outputs: Draw callbacks per layer; produces the composited QImage.
Threading: GUI thread; QImage painting is not shared across threads here.
Performance: Clean layers are reused as-is; only Dirty layers invoke their draw callback.
Integration: Owned by ChartRenderer, which defines the layer order.
Observability: Unknown layer ids and failing batch operations are logged via kLog_RenderWarning.
Related: RenderOptimizer.cpp, ChartRenderer.h.
Assumptions: Layer sizes are logical pixels; surfaces are allocated at size * devicePixelRatio.
*/
#pragma once

#include <QImage>
#include <QPointF>
#include <QSize>
#include <QString>
#include <functional>
#include <map>
#include <optional>
#include <vector>

class QPainter;

enum class LayerState {
    Clean,
    Dirty
};

struct RenderLayer {
    QString id;
    QImage surface;
    LayerState state = LayerState::Dirty;
};

class ChartRenderOptimizer {
public:
    using DrawFn = std::function<void(QPainter&)>;

    ChartRenderOptimizer() = default;

    // Primary (visible) surface
    void setPrimarySize(const QSize& logicalSize, qreal devicePixelRatio = 1.0);
    const QImage& surface() const { return m_primary; }
    bool hasSurface() const { return !m_primary.isNull(); }

    // 🎨 Layer registry
    bool createLayer(const QString& id, const QSize& logicalSize, qreal devicePixelRatio = 1.0);
    bool markDirty(const QString& id);
    void markAllDirty();
    std::optional<LayerState> layerState(const QString& id) const;
    std::vector<QString> layerIds() const;
    std::size_t layerCount() const { return m_layers.size(); }

    // Redraws the layer only when Dirty; returns nullptr for unknown ids.
    const QImage* renderLayer(const QString& id, const DrawFn& drawFn);

    // Clears the primary surface and draws the listed layers in order (back to front).
    bool compositeLayers(const std::vector<QString>& orderedIds);

    // Runs every op on the primary surface inside one save()/restore() bracket.
    // A throwing op is logged and skipped; returns how many ops completed.
    std::size_t batchOperations(const std::vector<DrawFn>& ops);

    // Reallocates every layer and the primary surface; all layers become Dirty.
    void resize(const QSize& logicalSize, qreal devicePixelRatio);

    void destroy();

    // Douglas-Peucker; endpoints are kept exactly and the output never grows.
    static std::vector<QPointF> optimizePath(const std::vector<QPointF>& points, double tolerance);
    static double perpendicularDistance(const QPointF& p, const QPointF& lineStart, const QPointF& lineEnd);

private:
    static QImage allocate(const QSize& logicalSize, qreal devicePixelRatio);

    std::map<QString, RenderLayer> m_layers;
    QImage m_primary;
};
