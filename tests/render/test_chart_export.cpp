/*
Kline — ChartExport Tests
Role: Verify raster encoding, data URLs and atomic file writes
Testing Strategy: Small solid images; decoded back with QImage::loadFromData; files under QTemporaryDir
Coverage: PNG/JPEG encoding, null images, format parsing, data URL prefix, nested export directories
*/
#include <gtest/gtest.h>
#include "render/ChartExport.hpp"

#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

namespace {
QImage solidImage(const QColor& color, const QSize& size = QSize(32, 24)) {
    QImage image(size, QImage::Format_ARGB32_Premultiplied);
    image.fill(color);
    return image;
}
}

TEST(ChartExport, FormatNames) {
    EXPECT_STREQ(ChartExport::mimeType(ExportFormat::Png), "image/png");
    EXPECT_STREQ(ChartExport::mimeType(ExportFormat::Jpeg), "image/jpeg");
    EXPECT_STREQ(ChartExport::mimeType(ExportFormat::WebP), "image/webp");
    EXPECT_STREQ(ChartExport::extension(ExportFormat::Jpeg), "jpg");

    EXPECT_EQ(ChartExport::parseFormat(" PNG "), ExportFormat::Png);
    EXPECT_EQ(ChartExport::parseFormat("jpeg"), ExportFormat::Jpeg);
    EXPECT_EQ(ChartExport::parseFormat("jpg"), ExportFormat::Jpeg);
    EXPECT_EQ(ChartExport::parseFormat("webp"), ExportFormat::WebP);
    EXPECT_FALSE(ChartExport::parseFormat("gif").has_value());
}

TEST(ChartExport, PngRoundTripsPixels) {
    const auto bytes = ChartExport::encodeImage(solidImage(Qt::red), ExportFormat::Png, 0.92);
    ASSERT_TRUE(bytes.has_value());
    ASSERT_GT(bytes->size(), 8);
    EXPECT_TRUE(bytes->startsWith("\x89PNG"));

    QImage decoded;
    ASSERT_TRUE(decoded.loadFromData(*bytes, "PNG"));
    EXPECT_EQ(decoded.size(), QSize(32, 24));
    EXPECT_EQ(decoded.pixelColor(4, 4), QColor(Qt::red));
}

TEST(ChartExport, JpegFlattensTransparency) {
    const auto bytes = ChartExport::encodeImage(solidImage(Qt::transparent), ExportFormat::Jpeg, 0.9);
    ASSERT_TRUE(bytes.has_value());
    EXPECT_TRUE(bytes->startsWith("\xFF\xD8"));

    QImage decoded;
    ASSERT_TRUE(decoded.loadFromData(*bytes, "JPG"));
    const QColor pixel = decoded.pixelColor(10, 10);
    EXPECT_GT(pixel.red(), 240);
    EXPECT_GT(pixel.green(), 240);
    EXPECT_GT(pixel.blue(), 240);
}

TEST(ChartExport, JpegQualityAffectsSize) {
    QImage noisy(64, 64, QImage::Format_RGB32);
    for (int y = 0; y < 64; ++y) {
        for (int x = 0; x < 64; ++x) noisy.setPixel(x, y, qRgb((x * 37) % 256, (y * 91) % 256, (x * y) % 256));
    }
    const auto low = ChartExport::encodeImage(noisy, ExportFormat::Jpeg, 0.1);
    const auto high = ChartExport::encodeImage(noisy, ExportFormat::Jpeg, 1.0);
    ASSERT_TRUE(low.has_value());
    ASSERT_TRUE(high.has_value());
    EXPECT_LT(low->size(), high->size());
}

TEST(ChartExport, NullImageIsRejected) {
    EXPECT_FALSE(ChartExport::encodeImage(QImage(), ExportFormat::Png, 1.0).has_value());
}

TEST(ChartExport, DataUrlCarriesMimeAndBase64) {
    const QByteArray bytes("abc");
    EXPECT_EQ(ChartExport::toDataUrl(bytes, ExportFormat::Png), "data:image/png;base64,YWJj");
    EXPECT_TRUE(ChartExport::toDataUrl(bytes, ExportFormat::Jpeg).startsWith("data:image/jpeg;base64,"));
}

TEST(ChartExport, WritesIntoNestedDirectory) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QString dir = tmp.filePath("exports/today");
    const QByteArray bytes("payload");

    const auto path = ChartExport::writeImageFile(bytes, dir, "chart", ExportFormat::Png);
    ASSERT_TRUE(path.has_value());
    EXPECT_TRUE(path->endsWith("chart.png"));

    QFile file(*path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    EXPECT_EQ(file.readAll(), bytes);
}

TEST(ChartExport, EmptyBaseNameIsRejected) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    EXPECT_FALSE(ChartExport::writeImageFile("x", tmp.path(), "", ExportFormat::Png).has_value());
}
