/*
Kline — ChartPerformanceMonitor
Role: Rolling frame-rate, render-time, data-processing and memory statistics condensed into a 0-100 score.
Inputs/Outputs: Renderer reports frames and durations; emits fpsChanged/qualityChanged/performanceAlert.
Threading: Lives on the GUI thread; the memory poll runs on a QTimer owned by this object.
Performance: Fixed-size ring buffers, O(window) averages on demand.
Integration: Owned by ChartRenderer; recommendedQuality() drives path simplification, data reduction and animation length.
Observability: Logs quality transitions via kLog_Render, alerts via kLog_Warning.
Related: PerformanceMonitor.cpp, RingBuffer.hpp, ChartRenderer.h.
Assumptions: Memory figures are process-wide, not chart-specific.
*/
#pragma once

#include <QObject>
#include <QElapsedTimer>
#include <QString>
#include <QTimer>
#include <cstddef>
#include <cstdint>
#include <optional>
#include "RingBuffer.hpp"

enum class QualityLevel {
    Full,       // everything on
    Reduced,    // simplified indicator paths, shorter animations
    Minimal     // no crosshair, forced data reduction, no animations
};

struct MemorySample {
    std::size_t usedBytes = 0;
    std::size_t totalBytes = 0;   // peak resident size observed by the OS
    std::size_t limitBytes = 0;   // configured budget

    double percentOfLimit() const {
        return limitBytes == 0 ? 0.0 : 100.0 * static_cast<double>(usedBytes) / static_cast<double>(limitBytes);
    }
};

struct PerformanceReport {
    double averageFps = 0.0;              // 0 when no frames were recorded
    double averageRenderMs = 0.0;
    double averageDataProcessingMs = 0.0;
    std::optional<MemorySample> memory;
    uint64_t totalRenders = 0;
    int score = 100;
    QualityLevel quality = QualityLevel::Full;
};

class ChartPerformanceMonitor : public QObject {
    Q_OBJECT

public:
    explicit ChartPerformanceMonitor(QObject* parent = nullptr);
    ~ChartPerformanceMonitor() override = default;

    // 🎯 Frame cadence: timestamps in ms from any monotonic clock
    void recordFrame(double timestampMs);
    void recordFrame();

    // 🎯 Durations
    void recordRenderTime(double durationMs);
    void recordDataProcessingTime(double durationMs);

    // 💻 Memory
    void recordMemorySample(const MemorySample& sample);
    bool sampleMemory();

    void startMonitoring();
    void stopMonitoring();
    bool isMonitoring() const { return m_pollTimer.isActive(); }

    void setMemoryBudgetBytes(std::size_t bytes) { m_memoryBudgetBytes = bytes; }
    void setMemoryPollIntervalMs(int ms);

    [[nodiscard]] PerformanceReport getPerformanceReport() const;
    [[nodiscard]] QualityLevel recommendedQuality() const { return m_quality; }

    void reset();

    // Score = 100 minus render, frame-rate and memory penalties, clamped to [0, 100].
    static int computeScore(double averageRenderMs, std::optional<double> averageFps,
                            std::optional<double> memoryPercent);
    static QualityLevel qualityForScore(int score);
    static const char* qualityName(QualityLevel quality);

    static std::size_t currentProcessMemory();
    static std::size_t peakProcessMemory();

    static constexpr double RENDER_BUDGET_MS = 16.0;
    static constexpr double MIN_FPS = 30.0;
    static constexpr double MEMORY_WARN_PERCENT = 70.0;
    static constexpr double IDLE_GAP_MS = 250.0;
    static constexpr std::size_t DEFAULT_MEMORY_BUDGET_BYTES = 1024ull * 1024ull * 1024ull;

signals:
    void fpsChanged(double fps);
    void qualityChanged(QualityLevel quality);
    void performanceAlert(const QString& message);

private slots:
    void onPollTimer();

private:
    void reevaluate();
    double averageFps() const;

    RingBuffer<double, 60>  m_frameIntervals;
    RingBuffer<double, 100> m_renderTimes;
    RingBuffer<MemorySample, 100> m_memorySamples;
    RingBuffer<double, 50>  m_dataProcessingTimes;

    std::optional<double> m_lastFrameTimestamp;
    uint64_t m_totalRenders = 0;
    std::size_t m_memoryBudgetBytes = DEFAULT_MEMORY_BUDGET_BYTES;
    QualityLevel m_quality = QualityLevel::Full;

    QTimer m_pollTimer;
    QElapsedTimer m_clock;
};
