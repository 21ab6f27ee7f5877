#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// KLINE LOGGING CATEGORIES
// =============================================================================
// Four categories; hot-path categories are throttled per call site.

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: init, lifecycle, config, export
Q_DECLARE_LOGGING_CATEGORY(logData)     // Data: history updates, ticks, cache, indicators
Q_DECLARE_LOGGING_CATEGORY(logRender)   // Render: layers, frames, scales, animation
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

namespace kline::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp    = 1;    // Every app event
    inline constexpr int kData   = 20;   // Every 20th data operation
    inline constexpr int kRender = 100;  // Every 100th render operation
    inline constexpr int kDebug  = 10;   // Every 10th debug message
}

// Throttling macro with runtime env var override (KLINE_LOG_<Cat>_INTERVAL)
#define KLOG_THROTTLED(cat, defaultInterval, ...)                                   \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static const uint32_t _interval = []() {                                     \
            const char* env = std::getenv("KLINE_LOG_" #cat "_INTERVAL");            \
            const int v = env ? std::atoi(env) : (defaultInterval);                  \
            return static_cast<uint32_t>(v > 0 ? v : 1);                             \
        }();                                                                         \
        if (_interval == 1 || (++_counter % _interval) == 1) {                       \
            qCDebug(log##cat) << __VA_ARGS__;                                        \
        }                                                                            \
    } while(false)

#define kLog_App(...)     KLOG_THROTTLED(App, kline::log_throttle::kApp, __VA_ARGS__)
#define kLog_Data(...)    KLOG_THROTTLED(Data, kline::log_throttle::kData, __VA_ARGS__)
#define kLog_Render(...)  KLOG_THROTTLED(Render, kline::log_throttle::kRender, __VA_ARGS__)
#define kLog_Debug(...)   KLOG_THROTTLED(Debug, kline::log_throttle::kDebug, __VA_ARGS__)

// Always-on (never throttled)
#define kLog_Warning(...)  qCWarning(logApp) << __VA_ARGS__
#define kLog_Error(...)    qCCritical(logApp) << __VA_ARGS__
#define kLog_RenderWarning(...) qCWarning(logRender) << __VA_ARGS__

// Runtime control:
//   export KLINE_LOG_Render_INTERVAL=1     # every render message
//   export QT_LOGGING_RULES="kline.*.debug=true"
