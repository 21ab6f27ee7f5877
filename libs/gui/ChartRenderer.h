/*
Kline — ChartRenderer
Role: Owns one chart's history, indicators, view session and layers; draws a frame per request.
Inputs/Outputs: setData/appendCandle/applyPriceTick/setIndicatorConfig/setOverlays in; composited QImage, exports and signals out.
Threading: GUI thread. Renders are coalesced through a zero-interval QTimer; resizes are debounced.
Performance: Visible slice comes from ChartDataOptimizer; only Dirty layers are redrawn; quality adapts to ChartPerformanceMonitor.
Integration: Embedded by ChartWidget, which forwards Qt input and paints surface().
Observability: kLog_Data for history updates, kLog_Render per frame (throttled), kLog_RenderWarning after destroy().
Related: ChartRenderer.cpp, ChartScales.h, render/ChartSession.hpp, render/RenderOptimizer.hpp.
Assumptions: History is ascending by timestamp.
*/
#pragma once

#include <QByteArray>
#include <QImage>
#include <QMetaType>
#include <QObject>
#include <QPointF>
#include <QSize>
#include <QString>
#include <QTimer>
#include <memory>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

#include "Candle.hpp"
#include "ChartConfig.hpp"
#include "ChartScales.h"
#include "DataOptimizer.hpp"
#include "IndicatorEngine.hpp"
#include "PerformanceMonitor.hpp"
#include "render/AnimationScheduler.hpp"
#include "render/ChartExport.hpp"
#include "render/ChartSession.hpp"
#include "render/Overlay.hpp"
#include "render/RenderOptimizer.hpp"

class QPainter;

class ChartRenderer : public QObject {
    Q_OBJECT

public:
    // Back-to-front composite order
    static inline const QString LAYER_BACKGROUND = QStringLiteral("background");
    static inline const QString LAYER_VOLUME = QStringLiteral("volume");
    static inline const QString LAYER_CANDLES = QStringLiteral("candles");
    static inline const QString LAYER_INDICATORS = QStringLiteral("indicators");
    static inline const QString LAYER_OVERLAYS = QStringLiteral("overlays");
    static inline const QString LAYER_AXES = QStringLiteral("axes");
    static inline const QString LAYER_CROSSHAIR = QStringLiteral("crosshair");
    static const std::vector<QString>& layerOrder();

    static constexpr int GRID_ROWS = 5;
    static constexpr int GRID_COLUMNS = 8;
    static constexpr int PRICE_LABELS = 6;
    static constexpr int TIME_LABELS = 6;

    explicit ChartRenderer(const ChartConfig& config = ChartConfig::defaults(), QObject* parent = nullptr);
    ~ChartRenderer() override;

    // 📊 Data in
    void setData(std::vector<Candle> history);
    void appendCandle(const Candle& candle);
    bool applyPriceTick(const PriceTick& tick);
    void setIndicatorConfig(const nlohmann::json& config);
    void setIndicatorEnabled(const QString& name, bool enabled);
    void setOverlays(std::vector<Overlay> overlays);
    void setTimeframe(const QString& timeframe);

    const std::vector<Candle>& history() const { return m_history; }
    const IndicatorSet& indicators() const { return m_indicators; }
    const nlohmann::json& indicatorConfig() const { return m_indicatorConfig; }
    const std::vector<Overlay>& overlays() const { return m_overlays; }
    QString timeframe() const { return m_timeframe; }

    // 📐 Surface. handleResize is immediate and returns false when nothing changed;
    // scheduleResize coalesces bursts into one handleResize after the debounce.
    bool handleResize(const QSize& logicalSize, qreal devicePixelRatio = 1.0);
    void scheduleResize(const QSize& logicalSize, qreal devicePixelRatio = 1.0);
    QSize size() const { return m_size; }
    qreal devicePixelRatio() const { return m_dpr; }

    // 🎨 Frames. render() draws now; requestRender() coalesces into the next event loop turn.
    bool render();
    void requestRender();
    bool isRenderPending() const { return m_renderTimer.isActive(); }
    const QImage& surface() const { return m_renderOptimizer.surface(); }
    bool isShowingEmptyState() const { return m_emptyState; }

    // 🖱️ Interaction
    void handleMouseDown(const QPointF& position);
    void handleMouseMove(const QPointF& position);
    void handleMouseUp();
    void handleMouseLeave();
    bool handleWheel(double delta);
    void handlePinchStart(double fingerDistance);
    void handlePinchUpdate(double fingerDistance);
    void handlePinchEnd();
    void resetView();

    // 📸 Export
    std::optional<QByteArray> exportChart(ExportFormat format = ExportFormat::Png, double quality = 0.92);
    std::optional<QString> exportDataUrl(ExportFormat format = ExportFormat::Png, double quality = 0.92);
    std::optional<QString> downloadChart(const QString& baseName, ExportFormat format = ExportFormat::Png,
                                         double quality = 0.92);

    // Stops timers and tweens and releases every layer; later calls are rejected.
    void destroy();
    bool isDestroyed() const { return m_destroyed; }

    const ViewState& viewState() const { return m_session.viewState(); }
    const ChartScales& scales() const { return m_scales; }
    double displayCandleWidth() const { return m_displayCandleWidth; }
    std::size_t lastDrawnCandles() const { return m_lastDrawnCandles; }
    int lastReductionFactor() const { return m_lastReductionFactor; }
    double pathTolerance() const { return m_pathTolerance; }
    bool crosshairEnabled() const { return m_crosshairEnabled; }
    const ChartConfig& config() const { return m_config; }

    // History index of series[position] for a series aligned to the newest candles,
    // or nullopt when it falls outside `range`.
    static std::optional<std::size_t> tailAlignedIndex(std::size_t historySize, std::size_t seriesSize,
                                                       std::size_t position, VisibleRange range);

    ChartSession& session() { return m_session; }
    ChartDataOptimizer& dataOptimizer() { return m_dataOptimizer; }
    ChartRenderOptimizer& renderOptimizer() { return m_renderOptimizer; }
    ChartAnimationScheduler& animationScheduler() { return m_animations; }
    ChartPerformanceMonitor& performanceMonitor() { return m_monitor; }

signals:
    void timeframeChanged(const QString& timeframe);
    void indicatorToggled(const QString& name, bool enabled);
    void realTimeTickForwarded(const PriceTick& tick);
    void frameRendered();

private slots:
    void onViewportChanged();
    void onZoomChanged(double zoomLevel, double candleWidth);
    void onQualityChanged(QualityLevel quality);

private:
    bool ensureAlive(const char* operation) const;
    void recomputeIndicators();
    void historyChanged();
    void applyQuality(QualityLevel quality);
    void drawEmptyState();
    void invalidateLayer(const QString& id);

    // One draw pass per layer
    void drawBackground(QPainter& p) const;
    void drawVolume(QPainter& p) const;
    void drawCandles(QPainter& p) const;
    void drawIndicators(QPainter& p) const;
    void drawOscillators(QPainter& p) const;
    void drawOverlays(QPainter& p) const;
    void drawAxes(QPainter& p) const;
    void drawCrosshair(QPainter& p) const;

    void drawSeries(QPainter& p, const IndicatorSeries& series, const QColor& color, double width) const;
    std::vector<QPointF> seriesPoints(const IndicatorSeries& series, double (ChartScales::*mapY)(double) const) const;
    std::optional<std::size_t> visibleIndexOf(const IndicatorSeries& series, std::size_t position) const;

    ChartConfig m_config;

    std::vector<Candle> m_history;
    nlohmann::json m_indicatorConfig;
    IndicatorSet m_indicators;
    std::vector<Overlay> m_overlays;
    QString m_timeframe;

    ChartSession m_session;
    ChartDataOptimizer m_dataOptimizer;
    ChartRenderOptimizer m_renderOptimizer;
    ChartAnimationScheduler m_animations;
    ChartPerformanceMonitor m_monitor;

    // Per-frame state
    ChartScales m_scales;
    ChartDataOptimizer::Slice m_slice;
    VisibleRange m_range;
    int m_lastReductionFactor = 1;
    std::size_t m_lastDrawnCandles = 0;
    bool m_emptyState = false;

    QSize m_size;
    qreal m_dpr = 1.0;
    QSize m_pendingSize;
    qreal m_pendingDpr = 1.0;

    double m_displayCandleWidth = ChartSession::BASE_CANDLE_WIDTH;
    double m_pathTolerance = 0.0;
    bool m_crosshairEnabled = true;
    std::optional<QPointF> m_pointer;

    QTimer m_renderTimer;
    QTimer m_resizeTimer;
    bool m_destroyed = false;
};

Q_DECLARE_METATYPE(PriceTick)
