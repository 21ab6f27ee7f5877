/*
Kline — main.cpp
Role: Demo host: one ChartWidget fed with generated history and a simulated tick stream.
*/
#include "ChartRenderer.h"
#include "ChartWidget.h"
#include "KlineLogging.hpp"
#include "Log.hpp"

#include <QApplication>
#include <QCommandLineParser>
#include <QDateTime>
#include <QMainWindow>
#include <QTimer>
#include <algorithm>
#include <random>
#include <stdexcept>
#include <vector>

static constexpr auto CAT = "App";

namespace {

constexpr int64_t MINUTE_MS = 60'000;
constexpr int TICKS_PER_CANDLE = 12;

// --- Random-walk OHLCV history ending at the current minute ---
std::vector<Candle> generateHistory(std::size_t count, std::mt19937& rng) {
    std::normal_distribution<double> step(0.0, 0.35);
    std::uniform_real_distribution<double> wick(0.05, 0.6);
    std::uniform_real_distribution<double> volume(0.6e6, 1.6e6);

    const int64_t now = QDateTime::currentMSecsSinceEpoch() / MINUTE_MS * MINUTE_MS;
    std::vector<Candle> history;
    history.reserve(count);

    double price = 150.0;
    for (std::size_t i = 0; i < count; ++i) {
        Candle c;
        c.timestamp_ms = now - static_cast<int64_t>(count - i) * MINUTE_MS;
        c.open = price;
        c.close = std::max(1.0, price + step(rng));
        c.high = std::max(c.open, c.close) + wick(rng);
        c.low = std::max(0.5, std::min(c.open, c.close) - wick(rng));
        c.volume = volume(rng);
        history.push_back(c);
        price = c.close;
    }
    return history;
}

// --- Configuration: defaults, optional --config file, then environment ---
ChartConfig loadConfig(const QString& path) {
    ChartConfig config = ChartConfig::defaults();
    if (!path.isEmpty()) {
        try {
            config = ChartConfig::loadFile(path.toStdString());
        } catch (const std::runtime_error& e) {
            kLog_Error("🚨 Config rejected, using defaults:" << e.what());
            config = ChartConfig::defaults();
        }
    }
    config.applyEnvironment();
    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    kLog_App("[Kline chart demo starting...]");

    QApplication app(argc, argv);
    QApplication::setApplicationName("kline_gui");

    QCommandLineParser parser;
    parser.setApplicationDescription("Candlestick chart demo");
    parser.addHelpOption();
    QCommandLineOption configOption({"c", "config"}, "Chart configuration JSON.", "file");
    QCommandLineOption candlesOption("candles", "Generated history length.", "count", "500");
    parser.addOption(configOption);
    parser.addOption(candlesOption);
    parser.process(app);

    const ChartConfig config = loadConfig(parser.value(configOption));
    LOG_I(CAT, "config: {}", config.toJson().dump());

    std::mt19937 rng(42);
    bool countOk = false;
    const int requested = parser.value(candlesOption).toInt(&countOk);
    const std::size_t count = countOk && requested >= 0 ? static_cast<std::size_t>(requested) : 500;

    QMainWindow window;
    auto* chart = new ChartWidget(config, &window);
    window.setCentralWidget(chart);
    window.resize(1280, 720);
    window.setWindowTitle("Kline");

    ChartRenderer* renderer = chart->renderer();
    renderer->setData(generateHistory(count, rng));

    QObject::connect(renderer, &ChartRenderer::realTimeTickForwarded, [](const PriceTick& tick) {
        kLog_Data("💹 Tick" << tick.price);
    });
    QObject::connect(&renderer->performanceMonitor(), &ChartPerformanceMonitor::qualityChanged,
                     [](QualityLevel quality) {
        kLog_App("⚡ Quality now" << ChartPerformanceMonitor::qualityName(quality));
    });

    // --- Simulated feed: a tick every 500ms, a fresh candle every TICKS_PER_CANDLE ticks ---
    QTimer feed;
    int tickCount = 0;
    std::normal_distribution<double> move(0.0, 0.08);
    QObject::connect(&feed, &QTimer::timeout, [&]() {
        const auto& history = renderer->history();
        if (history.empty()) return;
        const Candle last = history.back();

        if (++tickCount % TICKS_PER_CANDLE == 0) {
            Candle next;
            next.timestamp_ms = last.timestamp_ms + MINUTE_MS;
            next.open = next.high = next.low = next.close = last.close;
            next.volume = 0.0;
            renderer->appendCandle(next);
            return;
        }
        renderer->applyPriceTick({std::max(0.5, last.close + move(rng)), 0});
    });
    feed.start(500);

    window.show();
    kLog_App("Kline demo ready with" << count << "candles");
    return app.exec();
}
