#pragma once

#include <QWidget>
#include <memory>
#include "ChartConfig.hpp"

class ChartRenderer;
class QMouseEvent;
class QPaintEvent;
class QResizeEvent;
class QTouchEvent;
class QWheelEvent;

// Thin host for a ChartRenderer: forwards Qt input and paints the composited surface.
class ChartWidget : public QWidget {
    Q_OBJECT

public:
    explicit ChartWidget(const ChartConfig& config = ChartConfig::defaults(), QWidget* parent = nullptr);
    ~ChartWidget() override;

    ChartRenderer* renderer() const { return m_renderer.get(); }

protected:
    bool event(QEvent* event) override;
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void leaveEvent(QEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;

private:
    void handleTouch(QTouchEvent* event);

    std::unique_ptr<ChartRenderer> m_renderer;
    bool m_sizedOnce = false;
};
