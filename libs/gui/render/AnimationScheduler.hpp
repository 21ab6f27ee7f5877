/*
Kline — ChartAnimationScheduler
Role: Cooperative tween scheduler: one frame tick advances every active tween with easing.
Inputs/Outputs: Tweens of named numeric fields; onUpdate(values, progress) each tick, onComplete once.
Threading: GUI thread; the frame loop is a QTimer owned by this object.
Performance: One map walk per frame; the timer only runs while tweens exist.
Integration: Owned by ChartRenderer (smooth zoom); tick() doubles as the host frame hook for tests.
Observability: Start/finish via kLog_Debug.
Related: AnimationScheduler.cpp, ChartRenderer.h.
Assumptions: Callbacks may stop or create tweens while a tick is in progress.
*/
#pragma once

#include <QElapsedTimer>
#include <QObject>
#include <QString>
#include <QTimer>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>

using AnimationValues = std::map<QString, double>;
using EasingFn = std::function<double(double)>;

namespace Easing {
    double linear(double t);
    double easeInOutCubic(double t);
    double easeOutQuart(double t);
    double easeInOutQuart(double t);
}

struct AnimationConfig {
    double durationMs = 300.0;
    EasingFn easing = Easing::easeInOutCubic;
    AnimationValues from;
    AnimationValues to;
    std::function<void(const AnimationValues& values, double progress)> onUpdate;
    std::function<void()> onComplete;
};

class ChartAnimationScheduler : public QObject {
    Q_OBJECT

public:
    explicit ChartAnimationScheduler(QObject* parent = nullptr);
    ~ChartAnimationScheduler() override;

    // Registers (or replaces) a tween and starts the frame loop if idle.
    void createAnimation(const QString& id, AnimationConfig config);

    // Honors the reduced-motion preference: jumps straight to `to` and
    // completes synchronously. Returns true only when a tween was registered.
    bool createReducedMotionAnimation(const QString& id, AnimationConfig config);

    // Removes without calling onComplete.
    void stopAnimation(const QString& id);
    void stopAllAnimations();

    // One frame. The first tick of a tween stamps its start time.
    void tick(double nowMs);

    bool hasAnimation(const QString& id) const { return m_tweens.count(id) > 0; }
    std::size_t activeCount() const { return m_tweens.size(); }
    bool isRunning() const { return m_frameTimer.isActive(); }

    void setReducedMotion(bool reduced) { m_reducedMotion = reduced; }
    bool prefersReducedMotion() const { return m_reducedMotion; }

    // Multiplier applied to the duration of tweens created afterwards (0..1).
    void setDurationScale(double scale);
    double durationScale() const { return m_durationScale; }

    void setFrameIntervalMs(int ms);

    static bool environmentPrefersReducedMotion();

signals:
    void animationFinished(const QString& id);
    void loopStopped();

private slots:
    void onFrame();

private:
    struct Tween {
        QString id;
        std::optional<double> startTime;
        double duration = 0.0;
        EasingFn easing;
        AnimationValues from;
        AnimationValues to;
        std::function<void(const AnimationValues&, double)> onUpdate;
        std::function<void()> onComplete;
        bool isActive = true;
        uint64_t serial = 0;
    };

    void stopLoopIfIdle();

    std::map<QString, Tween> m_tweens;
    uint64_t m_nextSerial = 1;
    bool m_reducedMotion = false;
    double m_durationScale = 1.0;

    QTimer m_frameTimer;
    QElapsedTimer m_clock;
};
