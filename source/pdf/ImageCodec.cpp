// ============================================================================
// ImageCodec - Implementation
// ============================================================================

#include "ImageCodec.h"

#include <QBuffer>
#include <QDebug>
#include <QPainter>

namespace ImageCodec {

QImage toOpaqueRgb(const QImage& image)
{
    if (image.isNull()) {
        return image;
    }

    if (image.hasAlphaChannel()) {
        // JPEG has no alpha: composite on a white background
        QImage rgb(image.size(), QImage::Format_RGB888);
        rgb.fill(Qt::white);
        QPainter painter(&rgb);
        painter.drawImage(0, 0, image);
        painter.end();
        return rgb;
    }

    if (image.format() != QImage::Format_RGB888 && image.format() != QImage::Format_RGB32) {
        return image.convertToFormat(QImage::Format_RGB888);
    }
    return image;
}

QByteArray encodeJpeg(const QImage& image, int quality)
{
    if (image.isNull()) {
        qWarning() << "[ImageCodec] Cannot encode a null image";
        return QByteArray();
    }

    QByteArray result;
    QBuffer buffer(&result);
    buffer.open(QIODevice::WriteOnly);

    if (!toOpaqueRgb(image).save(&buffer, "JPEG", qBound(0, quality, 100))) {
        qWarning() << "[ImageCodec] Failed to encode image as JPEG";
        return QByteArray();
    }
    return result;
}

QByteArray encodePng(const QImage& image)
{
    if (image.isNull()) {
        qWarning() << "[ImageCodec] Cannot encode a null image";
        return QByteArray();
    }

    QByteArray result;
    QBuffer buffer(&result);
    buffer.open(QIODevice::WriteOnly);

    if (!image.save(&buffer, "PNG")) {
        qWarning() << "[ImageCodec] Failed to encode image as PNG";
        return QByteArray();
    }
    return result;
}

QImage decode(const QByteArray& data)
{
    if (data.isEmpty()) {
        return QImage();
    }
    QImage image;
    if (!image.loadFromData(data)) {
        qWarning() << "[ImageCodec] Failed to decode" << data.size() << "bytes";
        return QImage();
    }
    return image;
}

QImage roundTrip(const QImage& image, int quality)
{
    return decode(encodeJpeg(image, quality));
}

} // namespace ImageCodec
