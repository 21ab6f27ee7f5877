#include "ChartExport.hpp"
#include "KlineLogging.hpp"
#include <QBuffer>
#include <QDir>
#include <QImageWriter>
#include <QPainter>
#include <QSaveFile>
#include <algorithm>
#include <cmath>

namespace ChartExport {

const char* mimeType(ExportFormat format) {
    switch (format) {
        case ExportFormat::Png:  return "image/png";
        case ExportFormat::Jpeg: return "image/jpeg";
        case ExportFormat::WebP: return "image/webp";
    }
    return "application/octet-stream";
}

const char* extension(ExportFormat format) {
    switch (format) {
        case ExportFormat::Png:  return "png";
        case ExportFormat::Jpeg: return "jpg";
        case ExportFormat::WebP: return "webp";
    }
    return "bin";
}

std::optional<ExportFormat> parseFormat(const QString& name) {
    const QString n = name.trimmed().toLower();
    if (n == "png") return ExportFormat::Png;
    if (n == "jpg" || n == "jpeg") return ExportFormat::Jpeg;
    if (n == "webp") return ExportFormat::WebP;
    return std::nullopt;
}

std::optional<QByteArray> encodeImage(const QImage& image, ExportFormat format, double quality) {
    if (image.isNull()) {
        kLog_RenderWarning("⚠️ Export requested without a rendered surface");
        return std::nullopt;
    }

    QByteArray bytes;
    QBuffer buffer(&bytes);
    if (!buffer.open(QIODevice::WriteOnly)) {
        kLog_RenderWarning("🚨 Export buffer could not be opened");
        return std::nullopt;
    }

    QImageWriter writer(&buffer, extension(format));
    if (!writer.canWrite()) {
        kLog_RenderWarning("⚠️ No encoder for" << extension(format) << ":" << writer.errorString());
        return std::nullopt;
    }
    if (format != ExportFormat::Png) {
        const double q = std::isfinite(quality) ? std::clamp(quality, 0.0, 1.0) : 0.92;
        writer.setQuality(static_cast<int>(std::lround(q * 100.0)));
    }

    // JPEG has no alpha; flatten onto white first.
    QImage source = image;
    if (format == ExportFormat::Jpeg && image.hasAlphaChannel()) {
        source = QImage(image.size(), QImage::Format_RGB32);
        source.setDevicePixelRatio(image.devicePixelRatio());
        source.fill(Qt::white);
        QPainter painter(&source);
        painter.drawImage(QPointF(0, 0), image);
    }

    if (!writer.write(source)) {
        kLog_RenderWarning("🚨 Export encode failed:" << writer.errorString());
        return std::nullopt;
    }
    return bytes;
}

QString toDataUrl(const QByteArray& bytes, ExportFormat format) {
    return QStringLiteral("data:%1;base64,%2")
        .arg(QString::fromLatin1(mimeType(format)), QString::fromLatin1(bytes.toBase64()));
}

std::optional<QString> writeImageFile(const QByteArray& bytes, const QString& directory,
                                      const QString& baseName, ExportFormat format) {
    if (baseName.isEmpty()) return std::nullopt;

    QDir dir(directory.isEmpty() ? QStringLiteral(".") : directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        kLog_Warning("🚨 Export directory unavailable:" << dir.absolutePath());
        return std::nullopt;
    }

    const QString path = dir.filePath(baseName + '.' + QString::fromLatin1(extension(format)));
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        kLog_Warning("🚨 Cannot open" << path << ":" << file.errorString());
        return std::nullopt;
    }
    if (file.write(bytes) != bytes.size() || !file.commit()) {
        kLog_Warning("🚨 Writing" << path << "failed:" << file.errorString());
        return std::nullopt;
    }

    kLog_App("💾 Chart exported to" << path << "(" << bytes.size() << "bytes )");
    return path;
}

} // namespace ChartExport
