/*
Kline — ChartSession
Role: Per-chart view state plus the pan/zoom interaction state machine (Idle <-> Dragging).
Inputs/Outputs: Takes pointer, wheel and pinch input; emits viewportChanged when range/zoom/pan move.
Threading: Lives on the main GUI thread; all methods are executed on this thread.
Performance: O(1) per event.
Integration: Owned by ChartRenderer; its ViewState dictates the visible candle window.
Observability: Logs zoom and pan via kLog_Render.
Related: ChartSession.cpp, ChartRenderer.h, ChartScales.h.
Assumptions: Pan deltas arrive in pixels; a positive wheel delta zooms out.
*/
#pragma once
#include <QObject>
#include <QPointF>
#include <cstddef>
#include "ChartScales.h"
#include "DataOptimizer.hpp"

struct ViewState {
    VisibleRange visibleRange;
    double zoomLevel = 1.0;
    double panOffset = 0.0;      // candles, <= 0; negative scrolls back in history
    double candleWidth = 8.0;
    double candleSpacing = 2.0;
    ChartPadding padding;
};

enum class InteractionState {
    Idle,
    Dragging
};

class ChartSession : public QObject {
    Q_OBJECT

public:
    explicit ChartSession(QObject* parent = nullptr);

    const ViewState& viewState() const { return m_state; }
    InteractionState interactionState() const { return m_interaction; }
    bool isDragging() const { return m_interaction == InteractionState::Dragging; }
    std::size_t dataLength() const { return m_dataLength; }
    double chartWidth() const { return m_chartWidth; }

    // Inputs that reshape the visible window
    void setDataLength(std::size_t length);
    void setChartWidth(double width);
    void setPanSensitivity(double sensitivity) { m_panSensitivity = sensitivity; }
    double panSensitivity() const { return m_panSensitivity; }

    // Interaction handling
    void handlePanStart(const QPointF& position);
    void handlePanMove(const QPointF& position);
    void handlePanEnd();
    void pan(double deltaPx);

    // One discrete step: delta > 0 -> x0.9, delta < 0 -> x1.1, 0 -> no-op.
    bool zoom(double delta);

    // Two-finger gesture; every 10% change in finger distance is one zoom step.
    void handlePinchStart(double fingerDistance);
    void handlePinchUpdate(double fingerDistance);
    void handlePinchEnd();

    void resetView();

    static VisibleRange computeVisibleRange(std::size_t length, double chartWidth,
                                            double candleWidth, double candleSpacing, double panOffset);
    static double clampPan(double panOffset, std::size_t length);
    static double candleWidthForZoom(double zoomLevel);

    static constexpr double MIN_ZOOM = 0.1;
    static constexpr double MAX_ZOOM = 5.0;
    static constexpr double ZOOM_OUT_STEP = 0.9;
    static constexpr double ZOOM_IN_STEP = 1.1;
    static constexpr double BASE_CANDLE_WIDTH = 8.0;
    static constexpr double MIN_CANDLE_WIDTH = 2.0;
    static constexpr double MAX_CANDLE_WIDTH = 20.0;
    static constexpr double DEFAULT_PAN_SENSITIVITY = 0.5;
    static constexpr std::size_t MIN_VISIBLE_CANDLES = 10;
    static constexpr double PINCH_STEP_RATIO = 1.1;

signals:
    void viewportChanged();
    void zoomChanged(double zoomLevel, double candleWidth);
    void interactionStateChanged(InteractionState state);

private:
    void updateVisibleRange();
    void setInteraction(InteractionState state);

    ViewState m_state;
    InteractionState m_interaction = InteractionState::Idle;
    std::size_t m_dataLength = 0;
    double m_chartWidth = 0.0;
    double m_panSensitivity = DEFAULT_PAN_SENSITIVITY;

    // Mouse interaction state
    QPointF m_lastMousePos;
    QPointF m_initialMousePos;

    // Pinch state
    bool m_pinching = false;
    double m_pinchReference = 0.0;
};
