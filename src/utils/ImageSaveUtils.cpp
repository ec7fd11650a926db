#include "utils/ImageSaveUtils.h"

#include <QFileInfo>
#include <QImageWriter>
#include <QPainter>
#include <QSaveFile>

namespace {

bool report(ImageSaveUtils::Error* error, const char* stage, QString message, const char* fallback)
{
    if (error) {
        message = message.trimmed();
        error->stage = QString::fromLatin1(stage);
        error->message = message.isEmpty() ? QString::fromLatin1(fallback) : message;
    }
    return false;
}

QByteArray bareFormat(const QByteArray& format)
{
    QByteArray bare = format.trimmed().toLower();
    while (bare.startsWith('.')) {
        bare.remove(0, 1);
    }
    return bare;
}

bool writerSupports(const QByteArray& format)
{
    const QList<QByteArray> formats = QImageWriter::supportedImageFormats();
    for (const QByteArray& candidate : formats) {
        if (candidate.toLower() == format) {
            return true;
        }
    }
    return false;
}

} // namespace

QByteArray ImageSaveUtils::writerFormat(const QString& filePath, const QByteArray& requested)
{
    QByteArray format = bareFormat(requested);
    if (format.isEmpty()) {
        format = bareFormat(QFileInfo(filePath).suffix().toLatin1());
    }
    if (format.isEmpty()) {
        return QByteArrayLiteral("png");
    }
    if (format == "jpg") {
        return QByteArrayLiteral("jpeg");
    }
    if (format == "tif") {
        return QByteArrayLiteral("tiff");
    }
    return format;
}

bool ImageSaveUtils::saveImageAtomically(const QImage& image,
                                         const QString& filePath,
                                         const QByteArray& format,
                                         int quality,
                                         Error* error)
{
    if (image.isNull()) {
        return report(error, "write", QString(), "Image is null");
    }

    const QByteArray resolved = writerFormat(filePath, format);
    if (!writerSupports(resolved)) {
        return report(error, "format",
                      QStringLiteral("Unsupported image format '%1'").arg(QString::fromLatin1(resolved)),
                      "Unsupported image format");
    }

    QSaveFile file(filePath);
    // Allow in-place overwrite where the directory forbids a temp sibling
    file.setDirectWriteFallback(true);
    if (!file.open(QIODevice::WriteOnly)) {
        return report(error, "open", file.errorString(), "Failed to open output file");
    }

    QImageWriter writer(&file, resolved);
    if (quality >= 0) {
        writer.setQuality(qBound(1, quality, 100));
    }

    // JPEG has no alpha channel
    const QImage encoded = resolved == "jpeg" ? flattenOntoWhite(image) : image;
    if (!writer.write(encoded)) {
        file.cancelWriting();
        return report(error, "write", writer.errorString(), "Failed to encode image");
    }

    if (!file.commit()) {
        return report(error, "commit", file.errorString(), "Failed to commit output file");
    }
    return true;
}

QImage ImageSaveUtils::flattenOntoWhite(const QImage& image)
{
    if (!image.hasAlphaChannel()) {
        return image;
    }

    QImage opaque(image.size(), QImage::Format_RGB32);
    opaque.setDevicePixelRatio(image.devicePixelRatio());
    opaque.fill(Qt::white);

    QPainter painter(&opaque);
    painter.drawImage(QPoint(0, 0), image);
    painter.end();
    return opaque;
}
