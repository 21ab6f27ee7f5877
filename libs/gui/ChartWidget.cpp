#include "ChartWidget.h"
#include "ChartRenderer.h"

#include <QLineF>
#include <QMouseEvent>
#include <QPaintEvent>
#include <QPainter>
#include <QResizeEvent>
#include <QTouchEvent>
#include <QWheelEvent>

ChartWidget::ChartWidget(const ChartConfig& config, QWidget* parent)
    : QWidget(parent)
    , m_renderer(std::make_unique<ChartRenderer>(config)) {
    setMinimumSize(400, 300);
    setMouseTracking(true);
    setAttribute(Qt::WA_AcceptTouchEvents);
    setAttribute(Qt::WA_OpaquePaintEvent);
    setFocusPolicy(Qt::StrongFocus);

    // Set background to black
    setAutoFillBackground(true);
    QPalette pal = palette();
    pal.setColor(QPalette::Window, Qt::black);
    setPalette(pal);

    connect(m_renderer.get(), &ChartRenderer::frameRendered, this, qOverload<>(&QWidget::update));
}

ChartWidget::~ChartWidget() {
    m_renderer->destroy();
}

void ChartWidget::paintEvent(QPaintEvent* event) {
    Q_UNUSED(event);
    QPainter painter(this);

    const QImage& surface = m_renderer->surface();
    if (surface.isNull()) {
        painter.fillRect(rect(), Qt::black);
        return;
    }
    painter.drawImage(QPointF(0, 0), surface);
}

void ChartWidget::resizeEvent(QResizeEvent* event) {
    QWidget::resizeEvent(event);
    // First size is applied at once so the widget never paints blank; later bursts are debounced.
    if (!m_sizedOnce) {
        m_sizedOnce = true;
        m_renderer->handleResize(event->size(), devicePixelRatioF());
    } else {
        m_renderer->scheduleResize(event->size(), devicePixelRatioF());
    }
}

void ChartWidget::mousePressEvent(QMouseEvent* event) {
    if (event->button() == Qt::LeftButton) {
        m_renderer->handleMouseDown(event->position());
        setCursor(Qt::ClosedHandCursor);
    } else if (event->button() == Qt::RightButton) {
        m_renderer->resetView();
    }
    event->accept();
}

void ChartWidget::mouseMoveEvent(QMouseEvent* event) {
    m_renderer->handleMouseMove(event->position());
    event->accept();
}

void ChartWidget::mouseReleaseEvent(QMouseEvent* event) {
    if (event->button() == Qt::LeftButton) {
        m_renderer->handleMouseUp();
        unsetCursor();
    }
    event->accept();
}

void ChartWidget::leaveEvent(QEvent* event) {
    m_renderer->handleMouseLeave();
    unsetCursor();
    QWidget::leaveEvent(event);
}

void ChartWidget::wheelEvent(QWheelEvent* event) {
    // Scrolling down (negative angle) zooms out, which the session models as a positive delta.
    const double delta = -static_cast<double>(event->angleDelta().y());
    if (delta != 0.0) m_renderer->handleWheel(delta);
    event->accept();
}

bool ChartWidget::event(QEvent* event) {
    switch (event->type()) {
        case QEvent::TouchBegin:
        case QEvent::TouchUpdate:
        case QEvent::TouchEnd:
        case QEvent::TouchCancel:
            handleTouch(static_cast<QTouchEvent*>(event));
            return true;
        default:
            return QWidget::event(event);
    }
}

void ChartWidget::handleTouch(QTouchEvent* event) {
    const auto& points = event->points();

    if (event->type() == QEvent::TouchEnd || event->type() == QEvent::TouchCancel) {
        m_renderer->handlePinchEnd();
        m_renderer->handleMouseUp();
        event->accept();
        return;
    }

    if (points.size() >= 2) {
        const double distance = QLineF(points[0].position(), points[1].position()).length();
        const bool secondFingerDown = points[0].state() == QEventPoint::Pressed ||
                                      points[1].state() == QEventPoint::Pressed;
        if (event->type() == QEvent::TouchBegin || secondFingerDown) {
            m_renderer->handlePinchStart(distance);
        } else {
            m_renderer->handlePinchUpdate(distance);
        }
    } else if (points.size() == 1) {
        const QPointF pos = points[0].position();
        if (event->type() == QEvent::TouchBegin) {
            m_renderer->handleMouseDown(pos);
        } else {
            m_renderer->handleMouseMove(pos);
        }
    }
    event->accept();
}
