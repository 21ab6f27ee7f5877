#include <gtest/gtest.h>
#include <QGuiApplication>

// Every suite runs inside an offscreen QGuiApplication so QImage/QPainter/QTimer work headless.
int main(int argc, char** argv) {
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QGuiApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
