#include "PerformanceMonitor.hpp"
#include "KlineLogging.hpp"
#include <algorithm>
#include <cmath>

#ifdef __APPLE__
#include <mach/mach.h>
#include <mach/task_info.h>
#include <mach/mach_init.h>
#elif _WIN32
#include <windows.h>
#include <psapi.h>
#else
#include <sys/resource.h>
#include <unistd.h>
#include <cstdio>
#endif

namespace {
template <typename T, std::size_t N>
double average(const RingBuffer<T, N>& buffer) {
    if (buffer.empty()) return 0.0;
    double sum = 0.0;
    buffer.forEach([&](const T& v) { sum += v; });
    return sum / static_cast<double>(buffer.size());
}
}

ChartPerformanceMonitor::ChartPerformanceMonitor(QObject* parent)
    : QObject(parent) {
    m_pollTimer.setInterval(1000);
    connect(&m_pollTimer, &QTimer::timeout, this, &ChartPerformanceMonitor::onPollTimer);
    m_clock.start();
}

void ChartPerformanceMonitor::recordFrame(double timestampMs) {
    if (m_lastFrameTimestamp) {
        const double interval = timestampMs - *m_lastFrameTimestamp;
        // Frames are drawn on demand; a long gap is idle time, not a slow frame.
        if (interval > 0.0 && interval <= IDLE_GAP_MS) {
            m_frameIntervals.push_back(interval);
            emit fpsChanged(averageFps());
        }
    }
    m_lastFrameTimestamp = timestampMs;
}

void ChartPerformanceMonitor::recordFrame() {
    recordFrame(static_cast<double>(m_clock.nsecsElapsed()) / 1.0e6);
}

void ChartPerformanceMonitor::recordRenderTime(double durationMs) {
    if (!std::isfinite(durationMs) || durationMs < 0.0) return;
    m_renderTimes.push_back(durationMs);
    ++m_totalRenders;
    reevaluate();
}

void ChartPerformanceMonitor::recordDataProcessingTime(double durationMs) {
    if (!std::isfinite(durationMs) || durationMs < 0.0) return;
    m_dataProcessingTimes.push_back(durationMs);
}

void ChartPerformanceMonitor::recordMemorySample(const MemorySample& sample) {
    m_memorySamples.push_back(sample);
    if (sample.percentOfLimit() > MEMORY_WARN_PERCENT) {
        kLog_Render("💾 Memory at" << sample.percentOfLimit() << "% of budget");
    }
    reevaluate();
}

bool ChartPerformanceMonitor::sampleMemory() {
    const std::size_t used = currentProcessMemory();
    if (used == 0) return false;
    recordMemorySample({used, std::max(used, peakProcessMemory()), m_memoryBudgetBytes});
    return true;
}

void ChartPerformanceMonitor::startMonitoring() {
    if (m_pollTimer.isActive()) return;
    sampleMemory();
    m_pollTimer.start();
    kLog_App("📊 Performance monitoring started, poll every" << m_pollTimer.interval() << "ms");
}

void ChartPerformanceMonitor::stopMonitoring() {
    m_pollTimer.stop();
}

void ChartPerformanceMonitor::setMemoryPollIntervalMs(int ms) {
    m_pollTimer.setInterval(std::max(ms, 16));
}

void ChartPerformanceMonitor::onPollTimer() {
    sampleMemory();
}

double ChartPerformanceMonitor::averageFps() const {
    const double interval = average(m_frameIntervals);
    return interval > 0.0 ? 1000.0 / interval : 0.0;
}

PerformanceReport ChartPerformanceMonitor::getPerformanceReport() const {
    PerformanceReport report;
    report.averageFps = averageFps();
    report.averageRenderMs = average(m_renderTimes);
    report.averageDataProcessingMs = average(m_dataProcessingTimes);
    if (!m_memorySamples.empty()) report.memory = m_memorySamples.back();
    report.totalRenders = m_totalRenders;

    std::optional<double> fps;
    if (!m_frameIntervals.empty()) fps = report.averageFps;
    std::optional<double> memoryPercent;
    if (report.memory && report.memory->limitBytes > 0) memoryPercent = report.memory->percentOfLimit();

    report.score = computeScore(report.averageRenderMs, fps, memoryPercent);
    report.quality = qualityForScore(report.score);
    return report;
}

int ChartPerformanceMonitor::computeScore(double averageRenderMs, std::optional<double> averageFps,
                                          std::optional<double> memoryPercent) {
    double score = 100.0;
    if (averageRenderMs > RENDER_BUDGET_MS) {
        score -= std::min(50.0, (averageRenderMs - RENDER_BUDGET_MS) * 2.0);
    }
    if (averageFps && *averageFps < MIN_FPS) {
        score -= std::min(30.0, (MIN_FPS - *averageFps) * 2.0);
    }
    if (memoryPercent && *memoryPercent > MEMORY_WARN_PERCENT) {
        score -= std::min(20.0, (*memoryPercent - MEMORY_WARN_PERCENT) * 2.0 / 3.0);
    }
    return static_cast<int>(std::lround(std::clamp(score, 0.0, 100.0)));
}

QualityLevel ChartPerformanceMonitor::qualityForScore(int score) {
    if (score >= 80) return QualityLevel::Full;
    if (score >= 50) return QualityLevel::Reduced;
    return QualityLevel::Minimal;
}

const char* ChartPerformanceMonitor::qualityName(QualityLevel quality) {
    switch (quality) {
        case QualityLevel::Full:    return "full";
        case QualityLevel::Reduced: return "reduced";
        default:                    return "minimal";
    }
}

void ChartPerformanceMonitor::reevaluate() {
    const auto report = getPerformanceReport();
    if (report.quality == m_quality) return;

    const bool degraded = static_cast<int>(report.quality) > static_cast<int>(m_quality);
    m_quality = report.quality;
    kLog_App("⚡ Render quality ->" << qualityName(m_quality) << "score" << report.score);
    emit qualityChanged(m_quality);
    if (degraded) {
        emit performanceAlert(QString("Performance score %1: avg render %2ms, %3 fps")
                                  .arg(report.score)
                                  .arg(report.averageRenderMs, 0, 'f', 1)
                                  .arg(report.averageFps, 0, 'f', 1));
    }
}

void ChartPerformanceMonitor::reset() {
    m_frameIntervals.clear();
    m_renderTimes.clear();
    m_memorySamples.clear();
    m_dataProcessingTimes.clear();
    m_lastFrameTimestamp.reset();
    m_totalRenders = 0;
    m_quality = QualityLevel::Full;
}

std::size_t ChartPerformanceMonitor::currentProcessMemory() {
#ifdef __APPLE__
    mach_task_basic_info info;
    mach_msg_type_number_t size = MACH_TASK_BASIC_INFO_COUNT;
    if (task_info(mach_task_self(), MACH_TASK_BASIC_INFO, (task_info_t)&info, &size) == KERN_SUCCESS) {
        return info.resident_size;
    }
    return 0;
#elif _WIN32
    PROCESS_MEMORY_COUNTERS pmc;
    if (GetProcessMemoryInfo(GetCurrentProcess(), &pmc, sizeof(pmc))) {
        return pmc.WorkingSetSize;
    }
    return 0;
#else
    // /proc/self/statm: size resident shared ... (in pages)
    std::FILE* f = std::fopen("/proc/self/statm", "r");
    if (!f) return peakProcessMemory();
    unsigned long sizePages = 0, residentPages = 0;
    const int read = std::fscanf(f, "%lu %lu", &sizePages, &residentPages);
    std::fclose(f);
    if (read != 2) return peakProcessMemory();
    return static_cast<std::size_t>(residentPages) * static_cast<std::size_t>(sysconf(_SC_PAGESIZE));
#endif
}

std::size_t ChartPerformanceMonitor::peakProcessMemory() {
#ifdef __APPLE__
    mach_task_basic_info info;
    mach_msg_type_number_t size = MACH_TASK_BASIC_INFO_COUNT;
    if (task_info(mach_task_self(), MACH_TASK_BASIC_INFO, (task_info_t)&info, &size) == KERN_SUCCESS) {
        return info.resident_size_max;
    }
    return 0;
#elif _WIN32
    PROCESS_MEMORY_COUNTERS pmc;
    if (GetProcessMemoryInfo(GetCurrentProcess(), &pmc, sizeof(pmc))) {
        return pmc.PeakWorkingSetSize;
    }
    return 0;
#else
    struct rusage usage;
    if (getrusage(RUSAGE_SELF, &usage) == 0) {
        return static_cast<std::size_t>(usage.ru_maxrss) * 1024; // KB to bytes
    }
    return 0;
#endif
}
