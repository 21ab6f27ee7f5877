/*
Kline — ChartRenderer
Role: Frame pipeline (grid, volume, candles, indicators, overlays, axes, crosshair) over the layer compositor.
Inputs/Outputs: See ChartRenderer.h.
Threading: GUI thread only.
Performance: Layers are only repainted after markDirty; indicator paths are simplified below Full quality.
Integration: ChartWidget drives it; the demo app feeds it history and ticks.
Observability: kLog_Render per frame (throttled), kLog_Data on history changes.
Related: ChartRenderer.h.
Assumptions: Every pixel coordinate goes through ChartScales, which never yields NaN.
*/
#include "ChartRenderer.h"
#include "KlineLogging.hpp"

#include <QDateTime>
#include <QElapsedTimer>
#include <QPainter>
#include <QPen>
#include <QPolygonF>
#include <QTimeZone>
#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <utility>

namespace {

const QColor BACKGROUND(0, 0, 0);
const QColor GRID(40, 40, 40);
const QColor AXIS_TEXT(200, 200, 200);
const QColor BULL(0x26, 0xA6, 0x9A);
const QColor BEAR(0xEF, 0x53, 0x50);
const QColor CROSSHAIR(150, 150, 150);

QColor seriesColor(const std::string& name) {
    if (name == "sma20") return QColor(0xFF, 0x98, 0x00);
    if (name == "sma50") return QColor(0x21, 0x96, 0xF3);
    if (name == "ema12") return QColor(0xE9, 0x1E, 0x63);
    if (name == "ema26") return QColor(0x9C, 0x27, 0xB0);
    if (name == "vwap") return QColor(0xFF, 0xEB, 0x3B);
    // Remaining moving averages get a stable hue from their name.
    const auto hue = static_cast<int>(std::hash<std::string>{}(name) % 360);
    return QColor::fromHsv(hue, 160, 230);
}

bool isOverlayLine(const std::string& name) {
    return name.rfind("sma", 0) == 0 || name.rfind("ema", 0) == 0 ||
           name.rfind("wma", 0) == 0 || name == "vwap";
}

QPen makePen(const QColor& color, double width, bool dashed) {
    QPen pen(color, std::max(0.5, width));
    if (dashed) pen.setDashPattern({5.0, 5.0});
    return pen;
}

} // namespace

const std::vector<QString>& ChartRenderer::layerOrder() {
    static const std::vector<QString> order = {
        LAYER_BACKGROUND, LAYER_VOLUME, LAYER_CANDLES, LAYER_INDICATORS,
        LAYER_OVERLAYS, LAYER_AXES, LAYER_CROSSHAIR
    };
    return order;
}

ChartRenderer::ChartRenderer(const ChartConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_indicatorConfig(config.indicators.is_object() ? config.indicators : IndicatorEngine::defaultConfig())
    , m_timeframe(QStringLiteral("1m"))
    , m_dataOptimizer(config.maxCacheEntries, config.reductionThresholdPx)
    , m_crosshairEnabled(config.showCrosshair) {
    qRegisterMetaType<PriceTick>("PriceTick");

    m_session.setPanSensitivity(config.panSensitivity);
    connect(&m_session, &ChartSession::viewportChanged, this, &ChartRenderer::onViewportChanged);
    connect(&m_session, &ChartSession::zoomChanged, this, &ChartRenderer::onZoomChanged);

    m_animations.setReducedMotion(config.reducedMotion || ChartAnimationScheduler::environmentPrefersReducedMotion());
    m_animations.setFrameIntervalMs(config.frameIntervalMs);

    m_monitor.setMemoryBudgetBytes(config.memoryBudgetMB * 1024ull * 1024ull);
    m_monitor.setMemoryPollIntervalMs(config.memoryPollIntervalMs);
    if (config.adaptiveQuality) {
        connect(&m_monitor, &ChartPerformanceMonitor::qualityChanged, this, &ChartRenderer::onQualityChanged);
    }
    connect(&m_monitor, &ChartPerformanceMonitor::performanceAlert, this, [](const QString& message) {
        kLog_Warning("⚠️" << message);
    });
    m_monitor.startMonitoring();

    m_renderTimer.setSingleShot(true);
    m_renderTimer.setInterval(0);
    connect(&m_renderTimer, &QTimer::timeout, this, [this]() { render(); });

    m_resizeTimer.setSingleShot(true);
    m_resizeTimer.setInterval(std::max(0, config.resizeDebounceMs));
    connect(&m_resizeTimer, &QTimer::timeout, this, [this]() { handleResize(m_pendingSize, m_pendingDpr); });

    kLog_App("📈 ChartRenderer created, reduced motion" << m_animations.prefersReducedMotion());
}

ChartRenderer::~ChartRenderer() {
    if (!m_destroyed) destroy();
}

bool ChartRenderer::ensureAlive(const char* operation) const {
    if (!m_destroyed) return true;
    kLog_RenderWarning("⚠️" << operation << "called after destroy()");
    return false;
}

// ---------------------------------------------------------------------------
// Data
// ---------------------------------------------------------------------------

void ChartRenderer::setData(std::vector<Candle> history) {
    if (!ensureAlive("setData")) return;
    m_history = std::move(history);
    kLog_Data("📊 History replaced:" << m_history.size() << "candles");
    historyChanged();
}

void ChartRenderer::appendCandle(const Candle& candle) {
    if (!ensureAlive("appendCandle")) return;
    m_history.push_back(candle);
    historyChanged();
}

bool ChartRenderer::applyPriceTick(const PriceTick& tick) {
    if (!ensureAlive("applyPriceTick")) return false;
    if (m_history.empty() || !std::isfinite(tick.price)) return false;

    CandleUtils::applyTick(m_history.back(), tick);
    historyChanged();
    emit realTimeTickForwarded(tick);
    return true;
}

void ChartRenderer::historyChanged() {
    // Cached slices may alias the old contents.
    m_dataOptimizer.clearCache();
    m_session.setDataLength(m_history.size());
    recomputeIndicators();
    m_renderOptimizer.markAllDirty();
    requestRender();
}

void ChartRenderer::recomputeIndicators() {
    QElapsedTimer timer;
    timer.start();
    m_indicators = IndicatorEngine::computeAll(m_history, m_indicatorConfig);
    m_monitor.recordDataProcessingTime(static_cast<double>(timer.nsecsElapsed()) / 1.0e6);
}

void ChartRenderer::setIndicatorConfig(const nlohmann::json& config) {
    if (!ensureAlive("setIndicatorConfig")) return;
    m_indicatorConfig = config.is_object() ? config : nlohmann::json::object();
    recomputeIndicators();
    // The oscillator split changes the lower band, which the volume layer shares.
    m_renderOptimizer.markAllDirty();
    requestRender();
}

void ChartRenderer::setIndicatorEnabled(const QString& name, bool enabled) {
    if (!ensureAlive("setIndicatorEnabled")) return;
    const std::string key = name.toStdString();
    if (enabled) {
        const auto defaults = IndicatorEngine::defaultConfig();
        auto it = defaults.find(key);
        m_indicatorConfig[key] = it != defaults.end() ? *it : nlohmann::json(true);
    } else {
        m_indicatorConfig[key] = false;
    }
    setIndicatorConfig(m_indicatorConfig);
    emit indicatorToggled(name, enabled);
}

void ChartRenderer::setOverlays(std::vector<Overlay> overlays) {
    if (!ensureAlive("setOverlays")) return;
    m_overlays = std::move(overlays);
    invalidateLayer(LAYER_OVERLAYS);
    requestRender();
}

void ChartRenderer::setTimeframe(const QString& timeframe) {
    if (timeframe == m_timeframe) return;
    m_timeframe = timeframe;
    kLog_App("⏱️ Timeframe ->" << timeframe);
    emit timeframeChanged(timeframe);
}

// ---------------------------------------------------------------------------
// Surface
// ---------------------------------------------------------------------------

bool ChartRenderer::handleResize(const QSize& logicalSize, qreal devicePixelRatio) {
    if (!ensureAlive("handleResize")) return false;
    m_resizeTimer.stop();

    const qreal dpr = devicePixelRatio > 0.0 ? devicePixelRatio : 1.0;
    const bool hasLayers = m_renderOptimizer.layerCount() == layerOrder().size();
    if (hasLayers && logicalSize == m_size && dpr == m_dpr) return false;

    m_size = logicalSize;
    m_dpr = dpr;

    if (hasLayers) {
        m_renderOptimizer.resize(logicalSize, dpr);
    } else {
        m_renderOptimizer.setPrimarySize(logicalSize, dpr);
        for (const auto& id : layerOrder()) m_renderOptimizer.createLayer(id, logicalSize, dpr);
    }

    const ChartPadding& padding = m_session.viewState().padding;
    m_session.setChartWidth(logicalSize.width() - padding.left - padding.right);
    kLog_App("📐 Chart surface" << logicalSize << "@" << dpr << "x");

    render();
    return true;
}

void ChartRenderer::scheduleResize(const QSize& logicalSize, qreal devicePixelRatio) {
    if (!ensureAlive("scheduleResize")) return;
    m_pendingSize = logicalSize;
    m_pendingDpr = devicePixelRatio;
    m_resizeTimer.start();
}

void ChartRenderer::invalidateLayer(const QString& id) {
    // Layers exist only after the first resize.
    if (!m_renderOptimizer.layerState(id)) return;
    m_renderOptimizer.markDirty(id);
    requestRender();
}

void ChartRenderer::requestRender() {
    if (m_destroyed || m_renderTimer.isActive()) return;
    m_renderTimer.start();
}

void ChartRenderer::drawEmptyState() {
    m_emptyState = true;
    m_slice.reset();
    m_range = {};
    m_lastDrawnCandles = 0;
    // Everything must be repainted once data arrives.
    m_renderOptimizer.markAllDirty();

    const QRectF bounds(QPointF(0, 0), QSizeF(m_size));
    m_renderOptimizer.batchOperations({
        [bounds](QPainter& p) { p.fillRect(bounds, BACKGROUND); },
        [bounds](QPainter& p) {
            p.setPen(AXIS_TEXT);
            p.drawText(bounds, Qt::AlignCenter, QStringLiteral("No data available"));
        },
    });
}

bool ChartRenderer::render() {
    if (!ensureAlive("render")) return false;
    m_renderTimer.stop();
    if (!m_renderOptimizer.hasSurface()) return false;

    QElapsedTimer timer;
    timer.start();

    if (m_history.empty()) {
        drawEmptyState();
    } else {
        m_emptyState = false;
        const ViewState& view = m_session.viewState();

        QElapsedTimer dataTimer;
        dataTimer.start();
        m_range = view.visibleRange;
        m_slice = m_dataOptimizer.optimizeForRendering(m_history, m_range, view.zoomLevel, view.candleWidth);
        m_lastReductionFactor = m_dataOptimizer.reductionFactorFor(view.candleWidth);
        m_lastDrawnCandles = m_slice ? m_slice->size() : 0;
        m_monitor.recordDataProcessingTime(static_cast<double>(dataTimer.nsecsElapsed()) / 1.0e6);

        static const std::vector<Candle> none;
        m_scales = ChartScales::build(QSizeF(m_size), view.padding, m_slice ? *m_slice : none,
                                      m_displayCandleWidth, view.candleSpacing);

        const IndicatorOutput* rsi = nullptr;
        const IndicatorOutput* macd = nullptr;
        if (auto it = m_indicators.find("rsi"); it != m_indicators.end() && it->second.ok()) rsi = &it->second;
        if (auto it = m_indicators.find("macd"); it != m_indicators.end() && it->second.ok()) macd = &it->second;
        m_scales.setOscillatorLayout(rsi != nullptr, macd != nullptr);
        if (macd) {
            double lo = std::numeric_limits<double>::infinity();
            double hi = -std::numeric_limits<double>::infinity();
            for (const auto& [name, series] : macd->lines) {
                for (std::size_t i = 0; i < series.size(); ++i) {
                    if (!visibleIndexOf(series, i) || !std::isfinite(series[i].value)) continue;
                    lo = std::min(lo, series[i].value);
                    hi = std::max(hi, series[i].value);
                }
            }
            m_scales.setMacdRange(lo, hi);
        }

        m_renderOptimizer.renderLayer(LAYER_BACKGROUND, [this](QPainter& p) { drawBackground(p); });
        m_renderOptimizer.renderLayer(LAYER_VOLUME, [this](QPainter& p) { drawVolume(p); });
        m_renderOptimizer.renderLayer(LAYER_CANDLES, [this](QPainter& p) { drawCandles(p); });
        m_renderOptimizer.renderLayer(LAYER_INDICATORS, [this](QPainter& p) {
            drawIndicators(p);
            drawOscillators(p);
        });
        m_renderOptimizer.renderLayer(LAYER_OVERLAYS, [this](QPainter& p) { drawOverlays(p); });
        m_renderOptimizer.renderLayer(LAYER_AXES, [this](QPainter& p) { drawAxes(p); });
        m_renderOptimizer.renderLayer(LAYER_CROSSHAIR, [this](QPainter& p) { drawCrosshair(p); });
        m_renderOptimizer.compositeLayers(layerOrder());
    }

    const double elapsedMs = static_cast<double>(timer.nsecsElapsed()) / 1.0e6;
    m_monitor.recordRenderTime(elapsedMs);
    m_monitor.recordFrame();
    kLog_Render("🎨 Frame" << m_lastDrawnCandles << "candles, factor" << m_lastReductionFactor
                << "in" << elapsedMs << "ms");

    emit frameRendered();
    return true;
}

// ---------------------------------------------------------------------------
// Layers
// ---------------------------------------------------------------------------

void ChartRenderer::drawBackground(QPainter& p) const {
    p.fillRect(QRectF(QPointF(0, 0), QSizeF(m_size)), BACKGROUND);

    const QRectF plot = m_scales.plotRect();
    p.setPen(QPen(GRID, 1.0));
    for (int i = 0; i <= GRID_ROWS; ++i) {
        const double y = plot.top() + plot.height() * i / GRID_ROWS;
        p.drawLine(QPointF(plot.left(), y), QPointF(plot.right(), y));
    }
    for (int i = 0; i <= GRID_COLUMNS; ++i) {
        const double x = plot.left() + plot.width() * i / GRID_COLUMNS;
        p.drawLine(QPointF(x, plot.top()), QPointF(x, plot.bottom()));
    }
}

void ChartRenderer::drawVolume(QPainter& p) const {
    if (!m_slice) return;
    p.setClipRect(m_scales.plotRect());
    p.setPen(Qt::NoPen);

    const double slot = m_scales.slotWidth();
    const double spacing = slot - m_scales.candleWidth();
    const double width = std::max(1.0, m_lastReductionFactor * slot - spacing);
    const double base = m_scales.volumeBaseY();

    for (std::size_t k = 0; k < m_slice->size(); ++k) {
        const Candle& c = (*m_slice)[k];
        if (!std::isfinite(c.volume) || c.volume <= 0.0) continue;
        QColor color = c.isBullish() ? BULL : BEAR;
        color.setAlpha(90);
        const double top = m_scales.volumeY(c.volume);
        const double x = m_scales.x(static_cast<double>(k * m_lastReductionFactor));
        p.fillRect(QRectF(x, top, width, std::max(1.0, base - top)), color);
    }
}

void ChartRenderer::drawCandles(QPainter& p) const {
    if (!m_slice) return;
    p.setClipRect(m_scales.plotRect());

    // A reduced candle spans `factor` original slots.
    const double slot = m_scales.slotWidth();
    const double spacing = slot - m_scales.candleWidth();
    const double width = std::max(1.0, m_lastReductionFactor * slot - spacing);

    for (std::size_t k = 0; k < m_slice->size(); ++k) {
        const Candle& c = (*m_slice)[k];
        if (!c.isFinite()) continue;

        const QColor color = c.isBullish() ? BULL : BEAR;
        const double x = m_scales.x(static_cast<double>(k * m_lastReductionFactor));
        const double center = x + width / 2.0;

        p.setPen(QPen(color, 1.0));
        p.drawLine(QPointF(center, m_scales.y(c.effectiveHigh())), QPointF(center, m_scales.y(c.effectiveLow())));

        const double top = m_scales.y(c.bodyTop());
        const double bottom = m_scales.y(c.bodyBottom());
        p.fillRect(QRectF(x, top, width, std::max(1.0, bottom - top)), color);
    }
}

std::optional<std::size_t> ChartRenderer::tailAlignedIndex(std::size_t historySize, std::size_t seriesSize,
                                                           std::size_t position, VisibleRange range) {
    if (seriesSize > historySize || position >= seriesSize) return std::nullopt;
    const std::size_t index = historySize - seriesSize + position;
    if (index < range.start || index >= range.end) return std::nullopt;
    return index;
}

std::optional<std::size_t> ChartRenderer::visibleIndexOf(const IndicatorSeries& series, std::size_t position) const {
    return tailAlignedIndex(m_history.size(), series.size(), position, m_range);
}

std::vector<QPointF> ChartRenderer::seriesPoints(const IndicatorSeries& series,
                                                 double (ChartScales::*mapY)(double) const) const {
    std::vector<QPointF> points;
    for (std::size_t i = 0; i < series.size(); ++i) {
        if (!std::isfinite(series[i].value)) continue;
        const auto index = visibleIndexOf(series, i);
        if (!index) continue;
        points.emplace_back(m_scales.xCenter(static_cast<double>(*index - m_range.start)),
                            (m_scales.*mapY)(series[i].value));
    }
    if (m_pathTolerance > 0.0) points = ChartRenderOptimizer::optimizePath(points, m_pathTolerance);
    return points;
}

void ChartRenderer::drawSeries(QPainter& p, const IndicatorSeries& series, const QColor& color, double width) const {
    const auto points = seriesPoints(series, &ChartScales::y);
    if (points.size() < 2) return;
    p.setPen(QPen(color, width));
    p.setBrush(Qt::NoBrush);
    p.drawPolyline(points.data(), static_cast<int>(points.size()));
}

void ChartRenderer::drawIndicators(QPainter& p) const {
    if (!m_slice) return;
    p.save();
    p.setClipRect(m_scales.priceRect());

    if (auto it = m_indicators.find("bollingerBands"); it != m_indicators.end() && it->second.ok()) {
        const IndicatorSeries* upper = it->second.line("upper");
        const IndicatorSeries* lower = it->second.line("lower");
        if (upper && lower) {
            const auto top = seriesPoints(*upper, &ChartScales::y);
            const auto bottom = seriesPoints(*lower, &ChartScales::y);
            if (top.size() >= 2 && bottom.size() >= 2) {
                QPolygonF band;
                for (const auto& pt : top) band << pt;
                for (auto rit = bottom.rbegin(); rit != bottom.rend(); ++rit) band << *rit;
                p.setPen(Qt::NoPen);
                p.setBrush(QColor(0x21, 0x96, 0xF3, 0x1A));
                p.drawPolygon(band);
            }
            drawSeries(p, *upper, QColor(0x21, 0x96, 0xF3, 0x99), 1.0);
            drawSeries(p, *lower, QColor(0x21, 0x96, 0xF3, 0x99), 1.0);
        }
    }

    if (auto it = m_indicators.find("ichimoku"); it != m_indicators.end() && it->second.ok()) {
        if (const auto* tenkan = it->second.line("tenkanSen")) drawSeries(p, *tenkan, QColor(0x00, 0xBC, 0xD4), 1.0);
        if (const auto* kijun = it->second.line("kijunSen")) drawSeries(p, *kijun, QColor(0x79, 0x55, 0x48), 1.0);
        if (const auto* spanA = it->second.line("senkouSpanA")) drawSeries(p, *spanA, QColor(0x4C, 0xAF, 0x50, 0x99), 1.0);
        if (const auto* spanB = it->second.line("senkouSpanB")) drawSeries(p, *spanB, QColor(0xF4, 0x43, 0x36, 0x99), 1.0);
    }

    for (const auto& [name, output] : m_indicators) {
        if (!output.ok() || !isOverlayLine(name)) continue;
        if (const auto* line = output.line("value")) drawSeries(p, *line, seriesColor(name), 1.5);
    }

    if (auto it = m_indicators.find("parabolicSAR"); it != m_indicators.end() && it->second.ok()) {
        if (const auto* sar = it->second.line("value")) {
            p.setPen(Qt::NoPen);
            p.setBrush(QColor(0xFF, 0xFF, 0xFF, 0xB0));
            const double radius = std::clamp(m_scales.candleWidth() / 4.0, 1.0, 3.0);
            for (std::size_t i = 0; i < sar->size(); ++i) {
                const auto index = visibleIndexOf(*sar, i);
                if (!index || !std::isfinite((*sar)[i].value)) continue;
                p.drawEllipse(QPointF(m_scales.xCenter(static_cast<double>(*index - m_range.start)),
                                      m_scales.y((*sar)[i].value)), radius, radius);
            }
        }
    }
    p.restore();
}

void ChartRenderer::drawOscillators(QPainter& p) const {
    if (!m_slice) return;
    p.save();

    if (auto it = m_indicators.find("rsi"); it != m_indicators.end() && it->second.ok()) {
        const QRectF band = m_scales.rsiRect();
        p.setClipRect(band);
        for (double level : {30.0, 50.0, 70.0}) {
            p.setPen(makePen(level == 50.0 ? GRID : QColor(90, 90, 90), 1.0, true));
            const double y = m_scales.rsiY(level);
            p.drawLine(QPointF(band.left(), y), QPointF(band.right(), y));
        }
        if (const auto* line = it->second.line("value")) {
            const auto points = seriesPoints(*line, &ChartScales::rsiY);
            if (points.size() >= 2) {
                p.setPen(QPen(QColor(0xAB, 0x47, 0xBC), 1.5));
                p.drawPolyline(points.data(), static_cast<int>(points.size()));
            }
        }
    }

    if (auto it = m_indicators.find("macd"); it != m_indicators.end() && it->second.ok()) {
        const QRectF band = m_scales.macdRect();
        p.setClipRect(band);
        const double zero = m_scales.macdY(0.0);
        p.setPen(makePen(GRID, 1.0, true));
        p.drawLine(QPointF(band.left(), zero), QPointF(band.right(), zero));

        if (const auto* histogram = it->second.line("histogram")) {
            const double barWidth = std::max(1.0, m_scales.candleWidth() * 0.8);
            p.setPen(Qt::NoPen);
            for (std::size_t i = 0; i < histogram->size(); ++i) {
                const auto& point = (*histogram)[i];
                const auto index = visibleIndexOf(*histogram, i);
                if (!index || !std::isfinite(point.value)) continue;
                const double x = m_scales.xCenter(static_cast<double>(*index - m_range.start)) - barWidth / 2.0;
                const double y = m_scales.macdY(point.value);
                QColor color = point.value >= 0.0 ? BULL : BEAR;
                color.setAlpha(140);
                p.fillRect(QRectF(QPointF(x, std::min(y, zero)), QSizeF(barWidth, std::max(1.0, std::abs(zero - y)))), color);
            }
        }
        const std::pair<const char*, QColor> lines[] = {
            {"macd", QColor(0x21, 0x96, 0xF3)},
            {"signal", QColor(0xFF, 0x98, 0x00)},
        };
        for (const auto& [name, color] : lines) {
            const auto* line = it->second.line(name);
            if (!line) continue;
            const auto points = seriesPoints(*line, &ChartScales::macdY);
            if (points.size() < 2) continue;
            p.setPen(QPen(color, 1.2));
            p.drawPolyline(points.data(), static_cast<int>(points.size()));
        }
    }
    p.restore();
}

void ChartRenderer::drawOverlays(QPainter& p) const {
    if (!m_slice || m_overlays.empty()) return;
    p.setClipRect(m_scales.priceRect());

    const auto px = [this](const QPointF& indexPrice) {
        return QPointF(m_scales.xCenter(indexPrice.x() - static_cast<double>(m_range.start)),
                       m_scales.y(indexPrice.y()));
    };

    for (const auto& overlay : m_overlays) {
        if (const auto* trend = std::get_if<TrendlineOverlay>(&overlay)) {
            if (trend->points.size() < 2) continue;
            QPolygonF line;
            for (const auto& pt : trend->points) line << px(pt);
            p.setPen(makePen(trend->color, trend->width, trend->dashed));
            p.setBrush(Qt::NoBrush);
            p.drawPolyline(line);
        } else if (const auto* horizontal = std::get_if<HorizontalLineOverlay>(&overlay)) {
            if (!std::isfinite(horizontal->price)) continue;
            const QRectF band = m_scales.priceRect();
            const double y = m_scales.y(horizontal->price);
            p.setPen(makePen(horizontal->color, horizontal->width, horizontal->dashed));
            p.drawLine(QPointF(band.left(), y), QPointF(band.right(), y));
            if (horizontal->showLabel) {
                p.setPen(horizontal->color);
                p.drawText(QRectF(band.right() - 70, y - 14, 66, 12), Qt::AlignRight | Qt::AlignVCenter,
                           QString::number(horizontal->price, 'f', 2));
            }
        } else if (const auto* rect = std::get_if<RectangleOverlay>(&overlay)) {
            const QRectF area = QRectF(px(rect->topLeft), px(rect->bottomRight)).normalized();
            p.setPen(rect->borderWidth > 0.0 ? makePen(rect->borderColor, rect->borderWidth, rect->dashed)
                                             : QPen(Qt::NoPen));
            p.setBrush(rect->fillColor);
            p.drawRect(area);
        }
    }
}

void ChartRenderer::drawAxes(QPainter& p) const {
    const QRectF plot = m_scales.plotRect();
    const QRectF price = m_scales.priceRect();
    p.setPen(AXIS_TEXT);

    // Price labels on the right gutter
    for (int i = 0; i < PRICE_LABELS; ++i) {
        const double y = price.top() + price.height() * i / (PRICE_LABELS - 1);
        const double value = m_scales.priceAt(y);
        p.drawText(QRectF(plot.right() + 4, y - 8, m_size.width() - plot.right() - 6, 16),
                   Qt::AlignLeft | Qt::AlignVCenter, QString::number(value, 'f', 2));
    }

    // Time labels along the bottom, UTC
    if (m_range.count() == 0) return;
    const std::size_t step = std::max<std::size_t>(1, m_range.count() / TIME_LABELS);
    for (std::size_t i = m_range.start; i < m_range.end; i += step) {
        const double x = m_scales.xCenter(static_cast<double>(i - m_range.start));
        if (x > plot.right()) break;
        const QString label = QDateTime::fromMSecsSinceEpoch(m_history[i].timestamp_ms, QTimeZone::utc())
                                  .toString(QStringLiteral("HH:mm"));
        p.drawText(QRectF(x - 30, plot.bottom() + 6, 60, 16), Qt::AlignHCenter | Qt::AlignTop, label);
    }
}

void ChartRenderer::drawCrosshair(QPainter& p) const {
    if (!m_crosshairEnabled || !m_pointer) return;
    const QRectF plot = m_scales.plotRect();
    if (!plot.contains(*m_pointer)) return;

    p.setPen(makePen(CROSSHAIR, 1.0, true));
    p.drawLine(QPointF(m_pointer->x(), plot.top()), QPointF(m_pointer->x(), plot.bottom()));
    p.drawLine(QPointF(plot.left(), m_pointer->y()), QPointF(plot.right(), m_pointer->y()));

    if (m_scales.priceRect().contains(*m_pointer)) {
        const QRectF tag(plot.right() + 2, m_pointer->y() - 9, m_size.width() - plot.right() - 4, 18);
        p.fillRect(tag, QColor(60, 60, 60));
        p.setPen(Qt::white);
        p.drawText(tag, Qt::AlignCenter, QString::number(m_scales.priceAt(m_pointer->y()), 'f', 2));
    }
}

// ---------------------------------------------------------------------------
// Interaction
// ---------------------------------------------------------------------------

void ChartRenderer::handleMouseDown(const QPointF& position) {
    if (!ensureAlive("handleMouseDown")) return;
    m_session.handlePanStart(position);
}

void ChartRenderer::handleMouseMove(const QPointF& position) {
    if (!ensureAlive("handleMouseMove")) return;
    m_pointer = position;
    if (m_session.isDragging()) {
        m_session.handlePanMove(position);
    }
    if (m_crosshairEnabled) invalidateLayer(LAYER_CROSSHAIR);
}

void ChartRenderer::handleMouseUp() {
    if (!ensureAlive("handleMouseUp")) return;
    m_session.handlePanEnd();
}

void ChartRenderer::handleMouseLeave() {
    if (!ensureAlive("handleMouseLeave")) return;
    m_session.handlePanEnd();
    m_pointer.reset();
    invalidateLayer(LAYER_CROSSHAIR);
}

bool ChartRenderer::handleWheel(double delta) {
    if (!ensureAlive("handleWheel")) return false;
    return m_session.zoom(delta);
}

void ChartRenderer::handlePinchStart(double fingerDistance) {
    if (!ensureAlive("handlePinchStart")) return;
    m_session.handlePinchStart(fingerDistance);
}

void ChartRenderer::handlePinchUpdate(double fingerDistance) {
    if (!ensureAlive("handlePinchUpdate")) return;
    m_session.handlePinchUpdate(fingerDistance);
}

void ChartRenderer::handlePinchEnd() {
    if (!ensureAlive("handlePinchEnd")) return;
    m_session.handlePinchEnd();
}

void ChartRenderer::resetView() {
    if (!ensureAlive("resetView")) return;
    m_session.resetView();
}

void ChartRenderer::onViewportChanged() {
    m_renderOptimizer.markAllDirty();
    requestRender();
}

void ChartRenderer::onZoomChanged(double zoomLevel, double candleWidth) {
    Q_UNUSED(zoomLevel);
    if (!m_config.smoothZoom) {
        m_displayCandleWidth = candleWidth;
        return;
    }

    AnimationConfig tween;
    tween.durationMs = m_config.animationDurationMs;
    tween.easing = Easing::easeOutQuart;
    tween.from = {{QStringLiteral("candleWidth"), m_displayCandleWidth}};
    tween.to = {{QStringLiteral("candleWidth"), candleWidth}};
    tween.onUpdate = [this](const AnimationValues& values, double) {
        m_displayCandleWidth = values.at(QStringLiteral("candleWidth"));
        m_renderOptimizer.markAllDirty();
        requestRender();
    };
    m_animations.createReducedMotionAnimation(QStringLiteral("zoom"), std::move(tween));
}

// ---------------------------------------------------------------------------
// Quality adaptation
// ---------------------------------------------------------------------------

void ChartRenderer::onQualityChanged(QualityLevel quality) {
    applyQuality(quality);
    m_renderOptimizer.markAllDirty();
    requestRender();
}

void ChartRenderer::applyQuality(QualityLevel quality) {
    switch (quality) {
        case QualityLevel::Full:
            m_pathTolerance = 0.0;
            m_crosshairEnabled = m_config.showCrosshair;
            m_dataOptimizer.setMinimumReductionFactor(1);
            m_animations.setDurationScale(1.0);
            break;
        case QualityLevel::Reduced:
            m_pathTolerance = 0.5;
            m_crosshairEnabled = m_config.showCrosshair;
            m_dataOptimizer.setMinimumReductionFactor(1);
            m_animations.setDurationScale(0.5);
            break;
        case QualityLevel::Minimal:
            m_pathTolerance = 1.5;
            m_crosshairEnabled = false;
            m_dataOptimizer.setMinimumReductionFactor(2);
            m_animations.setDurationScale(0.0);
            break;
    }
    kLog_App("⚡ Quality" << ChartPerformanceMonitor::qualityName(quality)
             << "tolerance" << m_pathTolerance << "crosshair" << m_crosshairEnabled);
}

// ---------------------------------------------------------------------------
// Export
// ---------------------------------------------------------------------------

std::optional<QByteArray> ChartRenderer::exportChart(ExportFormat format, double quality) {
    if (!ensureAlive("exportChart")) return std::nullopt;
    if (!m_renderOptimizer.hasSurface()) {
        kLog_RenderWarning("⚠️ exportChart before the first resize");
        return std::nullopt;
    }
    // Flush a pending frame so the export matches the latest state.
    if (m_renderTimer.isActive()) render();
    return ChartExport::encodeImage(m_renderOptimizer.surface(), format, quality);
}

std::optional<QString> ChartRenderer::exportDataUrl(ExportFormat format, double quality) {
    const auto bytes = exportChart(format, quality);
    if (!bytes) return std::nullopt;
    return ChartExport::toDataUrl(*bytes, format);
}

std::optional<QString> ChartRenderer::downloadChart(const QString& baseName, ExportFormat format, double quality) {
    const auto bytes = exportChart(format, quality);
    if (!bytes) return std::nullopt;
    return ChartExport::writeImageFile(*bytes, QString::fromStdString(m_config.exportDirectory), baseName, format);
}

void ChartRenderer::destroy() {
    if (m_destroyed) return;
    m_destroyed = true;

    m_renderTimer.stop();
    m_resizeTimer.stop();
    m_animations.stopAllAnimations();
    m_monitor.stopMonitoring();
    m_renderOptimizer.destroy();
    m_dataOptimizer.clearCache();
    m_slice.reset();
    kLog_App("🛑 ChartRenderer destroyed");
}
