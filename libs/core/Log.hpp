#pragma once
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <string_view>
#include <utility>

// Logger for the Qt-free code (indicator math, data optimizer, configuration).
// Qt-facing code logs through KlineLogging.hpp instead.
//
//   KLINE_LOG=debug|info|warn|off   threshold, default info (debug in debug builds)
//
// Line shape: [HH:MM:SS.mmm][LEVEL][category] message (file:line)
namespace Kline::Log {

enum class Level { DEBUG = 0, INFO, WARN, OFF };

inline Level threshold() {
    static const Level level = [] {
        const char* env = std::getenv("KLINE_LOG");
        if (!env) {
#ifdef NDEBUG
            return Level::INFO;
#else
            return Level::DEBUG;
#endif
        }
        const std::string_view name(env);
        if (name == "debug") return Level::DEBUG;
        if (name == "warn") return Level::WARN;
        if (name == "off") return Level::OFF;
        return Level::INFO;
    }();
    return level;
}

inline std::string_view fileName(std::string_view path) {
    const auto slash = path.find_last_of("/\\");
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

template <class... Args>
void write(Level level, std::string_view category, const char* file, int line,
           fmt::format_string<Args...> format, Args&&... args) {
    if (level < threshold()) return;

    static constexpr std::string_view names[] = {"DEBUG", "INFO", "WARN"};
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), "[{:%H:%M:%S}.{:03}][{}][{}] ",
                   std::chrono::floor<std::chrono::seconds>(now), ms,
                   names[static_cast<int>(level)], category);
    fmt::format_to(std::back_inserter(out), format, std::forward<Args>(args)...);
    fmt::format_to(std::back_inserter(out), " ({}:{})\n", fileName(file), line);

    std::FILE* stream = level >= Level::WARN ? stderr : stdout;
    std::fwrite(out.data(), 1, out.size(), stream);
}

} // namespace Kline::Log

#define KLINE_LOG_AT(level, cat, fmt, ...) \
    ::Kline::Log::write(::Kline::Log::Level::level, cat, __FILE__, __LINE__, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_D(cat, fmt, ...) KLINE_LOG_AT(DEBUG, cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_I(cat, fmt, ...) KLINE_LOG_AT(INFO, cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_W(cat, fmt, ...) KLINE_LOG_AT(WARN, cat, fmt __VA_OPT__(, ) __VA_ARGS__)

// Logs the Nth, 2Nth, ... pass through this call site.
#define LOG_EVERY_N(level, N, cat, fmt, ...)                                    \
    do {                                                                         \
        static unsigned kline_every_n_ = 0;                                      \
        if (++kline_every_n_ % (N) == 0) KLINE_LOG_AT(level, cat, fmt __VA_OPT__(, ) __VA_ARGS__); \
    } while (0)
