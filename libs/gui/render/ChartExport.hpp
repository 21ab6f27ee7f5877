#pragma once

#include <QByteArray>
#include <QImage>
#include <QString>
#include <optional>

enum class ExportFormat {
    Png,    // lossless
    Jpeg,   // lossy, honours quality
    WebP    // lossy, needs the Qt imageformats plugin
};

// 📸 Raster encoding of a rendered chart surface.
namespace ChartExport {
    const char* mimeType(ExportFormat format);
    const char* extension(ExportFormat format);
    std::optional<ExportFormat> parseFormat(const QString& name);

    // Encodes into memory. quality is 0..1 (ignored for PNG).
    // Returns nullopt for a null image or an encoder missing at runtime.
    std::optional<QByteArray> encodeImage(const QImage& image, ExportFormat format, double quality);

    QString toDataUrl(const QByteArray& bytes, ExportFormat format);

    // Atomically writes <directory>/<baseName>.<ext>; returns the path written.
    std::optional<QString> writeImageFile(const QByteArray& bytes, const QString& directory,
                                          const QString& baseName, ExportFormat format);
}
