#include "RenderOptimizer.hpp"
#include "KlineLogging.hpp"
#include <QPainter>
#include <algorithm>
#include <cmath>
#include <exception>
#include <utility>

QImage ChartRenderOptimizer::allocate(const QSize& logicalSize, qreal devicePixelRatio) {
    if (logicalSize.isEmpty()) return {};
    const qreal dpr = devicePixelRatio > 0.0 ? devicePixelRatio : 1.0;
    QImage image(logicalSize * dpr, QImage::Format_ARGB32_Premultiplied);
    if (image.isNull()) return image;
    image.setDevicePixelRatio(dpr);
    image.fill(Qt::transparent);
    return image;
}

void ChartRenderOptimizer::setPrimarySize(const QSize& logicalSize, qreal devicePixelRatio) {
    m_primary = allocate(logicalSize, devicePixelRatio);
}

bool ChartRenderOptimizer::createLayer(const QString& id, const QSize& logicalSize, qreal devicePixelRatio) {
    QImage surface = allocate(logicalSize, devicePixelRatio);
    if (surface.isNull()) {
        kLog_RenderWarning("🚨 Cannot allocate layer" << id << "of size" << logicalSize);
        return false;
    }
    m_layers[id] = RenderLayer{id, std::move(surface), LayerState::Dirty};
    return true;
}

bool ChartRenderOptimizer::markDirty(const QString& id) {
    auto it = m_layers.find(id);
    if (it == m_layers.end()) {
        kLog_RenderWarning("⚠️ markDirty on unknown layer" << id);
        return false;
    }
    it->second.state = LayerState::Dirty;
    return true;
}

void ChartRenderOptimizer::markAllDirty() {
    for (auto& [id, layer] : m_layers) layer.state = LayerState::Dirty;
}

std::optional<LayerState> ChartRenderOptimizer::layerState(const QString& id) const {
    auto it = m_layers.find(id);
    if (it == m_layers.end()) return std::nullopt;
    return it->second.state;
}

std::vector<QString> ChartRenderOptimizer::layerIds() const {
    std::vector<QString> ids;
    ids.reserve(m_layers.size());
    for (const auto& [id, layer] : m_layers) ids.push_back(id);
    return ids;
}

const QImage* ChartRenderOptimizer::renderLayer(const QString& id, const DrawFn& drawFn) {
    auto it = m_layers.find(id);
    if (it == m_layers.end()) {
        kLog_RenderWarning("⚠️ renderLayer on unknown layer" << id);
        return nullptr;
    }

    RenderLayer& layer = it->second;
    if (layer.state == LayerState::Dirty) {
        layer.surface.fill(Qt::transparent);
        if (drawFn) {
            QPainter painter(&layer.surface);
            painter.setRenderHint(QPainter::Antialiasing, true);
            drawFn(painter);
        }
        layer.state = LayerState::Clean;
    }
    return &layer.surface;
}

bool ChartRenderOptimizer::compositeLayers(const std::vector<QString>& orderedIds) {
    if (m_primary.isNull()) return false;

    m_primary.fill(Qt::transparent);
    QPainter painter(&m_primary);
    for (const auto& id : orderedIds) {
        auto it = m_layers.find(id);
        if (it == m_layers.end()) {
            kLog_RenderWarning("⚠️ composite skipped unknown layer" << id);
            continue;
        }
        painter.drawImage(QPointF(0, 0), it->second.surface);
    }
    return true;
}

std::size_t ChartRenderOptimizer::batchOperations(const std::vector<DrawFn>& ops) {
    if (m_primary.isNull()) return 0;

    std::size_t completed = 0;
    QPainter painter(&m_primary);
    painter.save();
    for (const auto& op : ops) {
        if (!op) continue;
        try {
            op(painter);
            ++completed;
        } catch (const std::exception& e) {
            kLog_RenderWarning("🚨 Batch operation failed:" << e.what());
        }
    }
    painter.restore();
    return completed;
}

void ChartRenderOptimizer::resize(const QSize& logicalSize, qreal devicePixelRatio) {
    setPrimarySize(logicalSize, devicePixelRatio);
    for (auto& [id, layer] : m_layers) {
        layer.surface = allocate(logicalSize, devicePixelRatio);
        layer.state = LayerState::Dirty;
    }
}

void ChartRenderOptimizer::destroy() {
    m_layers.clear();
    m_primary = QImage();
}

double ChartRenderOptimizer::perpendicularDistance(const QPointF& p, const QPointF& lineStart, const QPointF& lineEnd) {
    const double dx = lineEnd.x() - lineStart.x();
    const double dy = lineEnd.y() - lineStart.y();
    const double length = std::hypot(dx, dy);
    if (length == 0.0) {
        return std::hypot(p.x() - lineStart.x(), p.y() - lineStart.y());
    }
    return std::abs(dy * p.x() - dx * p.y() + lineEnd.x() * lineStart.y() - lineEnd.y() * lineStart.x()) / length;
}

std::vector<QPointF> ChartRenderOptimizer::optimizePath(const std::vector<QPointF>& points, double tolerance) {
    if (points.size() <= 2) return points;

    std::vector<bool> keep(points.size(), false);
    keep.front() = true;
    keep.back() = true;

    // Explicit stack of [first, last] spans instead of recursion.
    std::vector<std::pair<std::size_t, std::size_t>> spans;
    spans.emplace_back(0, points.size() - 1);
    while (!spans.empty()) {
        const auto [first, last] = spans.back();
        spans.pop_back();
        if (last <= first + 1) continue;

        double maxDistance = 0.0;
        std::size_t index = first;
        for (std::size_t i = first + 1; i < last; ++i) {
            const double d = perpendicularDistance(points[i], points[first], points[last]);
            if (d > maxDistance) {
                maxDistance = d;
                index = i;
            }
        }

        // Rounding noise on a straight chord is not a corner, even at tolerance 0.
        const double chord = std::hypot(points[last].x() - points[first].x(), points[last].y() - points[first].y());
        const double threshold = std::max(tolerance, 1e-9 * std::max(1.0, chord));
        if (index != first && maxDistance > threshold) {
            keep[index] = true;
            spans.emplace_back(first, index);
            spans.emplace_back(index, last);
        }
    }

    std::vector<QPointF> simplified;
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (keep[i]) simplified.push_back(points[i]);
    }
    return simplified;
}
