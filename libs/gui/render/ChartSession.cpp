/*
Kline — ChartSession
Role: Implements the visible-window formula and the clamped pan/zoom transitions.
Inputs/Outputs: See ChartSession.hpp.
Threading: GUI thread only.
Performance: Constant-time arithmetic per event.
Integration: The concrete view-state machine behind ChartRenderer.
Observability: Zoom steps and drag transitions are logged via kLog_Render/kLog_Debug.
Related: ChartSession.hpp.
Assumptions: History length changes are pushed in through setDataLength().
*/
#include "ChartSession.hpp"
#include "KlineLogging.hpp"
#include <algorithm>
#include <cmath>

ChartSession::ChartSession(QObject* parent)
    : QObject(parent) {
}

double ChartSession::clampPan(double panOffset, std::size_t length) {
    // Keep at least MIN_VISIBLE_CANDLES on screen; short histories cannot pan.
    const double lower = std::min(0.0, -(static_cast<double>(length) - static_cast<double>(MIN_VISIBLE_CANDLES)));
    if (!std::isfinite(panOffset)) return 0.0;
    return std::clamp(panOffset, lower, 0.0);
}

double ChartSession::candleWidthForZoom(double zoomLevel) {
    return std::clamp(BASE_CANDLE_WIDTH * zoomLevel, MIN_CANDLE_WIDTH, MAX_CANDLE_WIDTH);
}

VisibleRange ChartSession::computeVisibleRange(std::size_t length, double chartWidth,
                                               double candleWidth, double candleSpacing, double panOffset) {
    const double slot = candleWidth + candleSpacing;
    if (length == 0 || chartWidth <= 0.0 || slot <= 0.0) return {};

    const auto len = static_cast<long long>(length);
    const auto maxVisible = static_cast<long long>(std::floor(chartWidth / slot));
    const long long start = std::clamp(len - maxVisible + static_cast<long long>(std::floor(panOffset)), 0LL, len);
    const long long end = std::min(len, start + maxVisible);
    return {static_cast<std::size_t>(start), static_cast<std::size_t>(end)};
}

void ChartSession::setDataLength(std::size_t length) {
    m_dataLength = length;
    m_state.panOffset = clampPan(m_state.panOffset, length);
    updateVisibleRange();
}

void ChartSession::setChartWidth(double width) {
    m_chartWidth = std::max(0.0, width);
    updateVisibleRange();
}

void ChartSession::updateVisibleRange() {
    const VisibleRange range = computeVisibleRange(m_dataLength, m_chartWidth, m_state.candleWidth,
                                                   m_state.candleSpacing, m_state.panOffset);
    if (range == m_state.visibleRange) return;
    m_state.visibleRange = range;
    emit viewportChanged();
}

void ChartSession::setInteraction(InteractionState state) {
    if (m_interaction == state) return;
    m_interaction = state;
    emit interactionStateChanged(state);
}

void ChartSession::handlePanStart(const QPointF& position) {
    if (m_pinching) return;
    m_lastMousePos = position;
    m_initialMousePos = position;
    setInteraction(InteractionState::Dragging);
}

void ChartSession::handlePanMove(const QPointF& position) {
    if (!isDragging()) return;

    const double deltaX = position.x() - m_lastMousePos.x();
    m_lastMousePos = position;
    pan(deltaX);
}

void ChartSession::handlePanEnd() {
    if (!isDragging()) return;
    kLog_Debug("🖐️ Drag ended, moved" << (m_lastMousePos.x() - m_initialMousePos.x()) << "px, pan" << m_state.panOffset);
    setInteraction(InteractionState::Idle);
}

void ChartSession::pan(double deltaPx) {
    if (!std::isfinite(deltaPx) || deltaPx == 0.0) return;

    const double next = clampPan(m_state.panOffset + deltaPx * m_panSensitivity, m_dataLength);
    if (next == m_state.panOffset) return;
    m_state.panOffset = next;

    const VisibleRange before = m_state.visibleRange;
    updateVisibleRange();
    // Sub-candle pan still counts as a view change for the renderer.
    if (before == m_state.visibleRange) emit viewportChanged();
}

bool ChartSession::zoom(double delta) {
    if (!std::isfinite(delta) || delta == 0.0) return false;

    const double factor = delta > 0.0 ? ZOOM_OUT_STEP : ZOOM_IN_STEP;
    const double nextZoom = std::clamp(m_state.zoomLevel * factor, MIN_ZOOM, MAX_ZOOM);
    if (nextZoom == m_state.zoomLevel) return false;

    m_state.zoomLevel = nextZoom;
    m_state.candleWidth = candleWidthForZoom(nextZoom);
    kLog_Render("🔍 Zoom" << m_state.zoomLevel << "candle width" << m_state.candleWidth);

    emit zoomChanged(m_state.zoomLevel, m_state.candleWidth);
    const VisibleRange before = m_state.visibleRange;
    updateVisibleRange();
    if (before == m_state.visibleRange) emit viewportChanged();
    return true;
}

void ChartSession::handlePinchStart(double fingerDistance) {
    if (!(fingerDistance > 0.0)) return;
    // A second finger turns a drag into a pinch.
    setInteraction(InteractionState::Idle);
    m_pinching = true;
    m_pinchReference = fingerDistance;
}

void ChartSession::handlePinchUpdate(double fingerDistance) {
    if (!m_pinching || !(fingerDistance > 0.0)) return;

    const double ratio = fingerDistance / m_pinchReference;
    if (ratio >= PINCH_STEP_RATIO) {
        zoom(-1.0);            // fingers apart -> zoom in
        m_pinchReference = fingerDistance;
    } else if (ratio <= 1.0 / PINCH_STEP_RATIO) {
        zoom(1.0);
        m_pinchReference = fingerDistance;
    }
}

void ChartSession::handlePinchEnd() {
    m_pinching = false;
    m_pinchReference = 0.0;
}

void ChartSession::resetView() {
    const ChartPadding padding = m_state.padding;
    m_state = ViewState{};
    m_state.padding = padding;
    setInteraction(InteractionState::Idle);
    m_pinching = false;
    updateVisibleRange();
    emit zoomChanged(m_state.zoomLevel, m_state.candleWidth);
    emit viewportChanged();
}
