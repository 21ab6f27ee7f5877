#include "AnimationScheduler.hpp"
#include "KlineLogging.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string_view>
#include <utility>
#include <vector>

namespace Easing {

double linear(double t) {
    return std::clamp(t, 0.0, 1.0);
}

double easeInOutCubic(double t) {
    t = std::clamp(t, 0.0, 1.0);
    return t < 0.5 ? 4.0 * t * t * t : 1.0 - std::pow(-2.0 * t + 2.0, 3) / 2.0;
}

double easeOutQuart(double t) {
    t = std::clamp(t, 0.0, 1.0);
    return 1.0 - std::pow(1.0 - t, 4);
}

double easeInOutQuart(double t) {
    t = std::clamp(t, 0.0, 1.0);
    return t < 0.5 ? 8.0 * t * t * t * t : 1.0 - std::pow(-2.0 * t + 2.0, 4) / 2.0;
}

} // namespace Easing

ChartAnimationScheduler::ChartAnimationScheduler(QObject* parent)
    : QObject(parent)
    , m_reducedMotion(environmentPrefersReducedMotion()) {
    m_frameTimer.setInterval(16);
    m_frameTimer.setTimerType(Qt::PreciseTimer);
    connect(&m_frameTimer, &QTimer::timeout, this, &ChartAnimationScheduler::onFrame);
    m_clock.start();
}

ChartAnimationScheduler::~ChartAnimationScheduler() {
    m_frameTimer.stop();
    m_tweens.clear();
}

bool ChartAnimationScheduler::environmentPrefersReducedMotion() {
    const char* env = std::getenv("KLINE_REDUCED_MOTION");
    if (!env) return false;
    std::string_view v(env);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

void ChartAnimationScheduler::setDurationScale(double scale) {
    m_durationScale = std::isfinite(scale) ? std::clamp(scale, 0.0, 1.0) : 1.0;
}

void ChartAnimationScheduler::setFrameIntervalMs(int ms) {
    m_frameTimer.setInterval(std::max(1, ms));
}

void ChartAnimationScheduler::createAnimation(const QString& id, AnimationConfig config) {
    Tween tween;
    tween.id = id;
    tween.duration = std::isfinite(config.durationMs) ? config.durationMs * m_durationScale : 0.0;
    tween.easing = config.easing ? std::move(config.easing) : EasingFn(Easing::linear);
    tween.from = std::move(config.from);
    tween.to = std::move(config.to);
    tween.onUpdate = std::move(config.onUpdate);
    tween.onComplete = std::move(config.onComplete);
    tween.serial = m_nextSerial++;

    m_tweens[id] = std::move(tween);
    kLog_Debug("🎬 Animation" << id << "registered," << m_tweens.size() << "active");

    if (!m_frameTimer.isActive()) m_frameTimer.start();
}

bool ChartAnimationScheduler::createReducedMotionAnimation(const QString& id, AnimationConfig config) {
    if (!m_reducedMotion) {
        createAnimation(id, std::move(config));
        return true;
    }

    stopAnimation(id);
    if (config.onUpdate) config.onUpdate(config.to, 1.0);
    if (config.onComplete) config.onComplete();
    return false;
}

void ChartAnimationScheduler::stopAnimation(const QString& id) {
    m_tweens.erase(id);
    stopLoopIfIdle();
}

void ChartAnimationScheduler::stopAllAnimations() {
    m_tweens.clear();
    stopLoopIfIdle();
}

void ChartAnimationScheduler::onFrame() {
    tick(static_cast<double>(m_clock.nsecsElapsed()) / 1.0e6);
}

void ChartAnimationScheduler::tick(double nowMs) {
    // Snapshot first: callbacks may add, replace or remove tweens.
    std::vector<std::pair<QString, uint64_t>> pending;
    pending.reserve(m_tweens.size());
    for (const auto& [id, tween] : m_tweens) pending.emplace_back(id, tween.serial);

    for (const auto& [id, serial] : pending) {
        auto it = m_tweens.find(id);
        if (it == m_tweens.end() || it->second.serial != serial || !it->second.isActive) continue;

        Tween& tween = it->second;
        if (!tween.startTime) tween.startTime = nowMs;

        const double elapsed = nowMs - *tween.startTime;
        const double progress = tween.duration <= 0.0 ? 1.0 : std::clamp(elapsed / tween.duration, 0.0, 1.0);
        const double eased = tween.easing(progress);

        AnimationValues values;
        for (const auto& [key, start] : tween.from) {
            auto target = tween.to.find(key);
            const double end = target == tween.to.end() ? start : target->second;
            values[key] = start + (end - start) * eased;
        }

        auto onUpdate = tween.onUpdate;
        if (onUpdate) onUpdate(values, progress);

        if (progress < 1.0) continue;

        // The update callback may have stopped or replaced this tween.
        it = m_tweens.find(id);
        if (it == m_tweens.end() || it->second.serial != serial) continue;

        it->second.isActive = false;
        auto onComplete = std::move(it->second.onComplete);
        m_tweens.erase(it);
        if (onComplete) onComplete();
        emit animationFinished(id);
    }

    stopLoopIfIdle();
}

void ChartAnimationScheduler::stopLoopIfIdle() {
    if (!m_tweens.empty() || !m_frameTimer.isActive()) return;
    m_frameTimer.stop();
    emit loopStopped();
}
