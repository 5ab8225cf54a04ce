// ============================================================================
// EnhancementPipeline - Implementation
// ============================================================================

#include "EnhancementPipeline.h"

#include <QColor>
#include <QDebug>


// ============================================================================
// EnhancementParameters
// ============================================================================

EnhancementParameters EnhancementParameters::clamped() const
{
    EnhancementParameters result = *this;
    result.contrast = qMax<qreal>(0.0, contrast);
    result.brightness = qMax<qreal>(0.0, brightness);
    result.sharpness = qMax<qreal>(0.0, sharpness);
    return result;
}

bool EnhancementParameters::operator==(const EnhancementParameters& other) const
{
    return qFuzzyCompare(1.0 + contrast, 1.0 + other.contrast)
        && qFuzzyCompare(1.0 + brightness, 1.0 + other.brightness)
        && qFuzzyCompare(1.0 + sharpness, 1.0 + other.sharpness)
        && grayscale == other.grayscale;
}

QString EnhancementParameters::toString() const
{
    return QStringLiteral("c=%1 b=%2 s=%3 %4")
        .arg(contrast, 0, 'f', 2)
        .arg(brightness, 0, 'f', 2)
        .arg(sharpness, 0, 'f', 2)
        .arg(grayscale ? QStringLiteral("gray") : QStringLiteral("color"));
}

namespace Enhancement {

// ============================================================================
// Helpers
// ============================================================================

static inline uchar clip8(int value)
{
    return static_cast<uchar>(value < 0 ? 0 : (value > 255 ? 255 : value));
}

// ITU-R 601-2 luma transform in 16.16 fixed point.
static inline int luma(int r, int g, int b)
{
    return (r * 19595 + g * 38470 + b * 7471 + 0x8000) >> 16;
}

static QImage toRgb888(const QImage& image)
{
    if (image.format() == QImage::Format_RGB888) {
        return image.copy();
    }
    return image.convertToFormat(QImage::Format_RGB888);
}

/**
 * Blend @p source towards/away from @p degenerate by @p factor:
 *   out = degenerate + factor * (source - degenerate)
 * The float result is truncated and clipped to 8 bits.
 */
static QImage blend(const QImage& degenerate, const QImage& source, qreal factor)
{
    QImage out(source.size(), QImage::Format_RGB888);
    const float alpha = static_cast<float>(factor);
    const int rowBytes = source.width() * 3;

    for (int y = 0; y < source.height(); ++y) {
        const uchar* d = degenerate.constScanLine(y);
        const uchar* s = source.constScanLine(y);
        uchar* o = out.scanLine(y);
        for (int i = 0; i < rowBytes; ++i) {
            const float v = static_cast<float>(d[i]) + alpha * (static_cast<float>(s[i]) - static_cast<float>(d[i]));
            o[i] = clip8(static_cast<int>(v));
        }
    }
    return out;
}

// ============================================================================
// Stages
// ============================================================================

QImage invert(const QImage& image)
{
    QImage out = toRgb888(image);
    const int rowBytes = out.width() * 3;
    for (int y = 0; y < out.height(); ++y) {
        uchar* line = out.scanLine(y);
        for (int i = 0; i < rowBytes; ++i) {
            line[i] = static_cast<uchar>(255 - line[i]);
        }
    }
    return out;
}

QImage toGrayscale(const QImage& image)
{
    QImage out = toRgb888(image);
    for (int y = 0; y < out.height(); ++y) {
        uchar* line = out.scanLine(y);
        for (int x = 0; x < out.width(); ++x) {
            uchar* px = line + x * 3;
            const uchar l = clip8(luma(px[0], px[1], px[2]));
            px[0] = l;
            px[1] = l;
            px[2] = l;
        }
    }
    return out;
}

int meanLuminance(const QImage& image)
{
    const QImage rgb = toRgb888(image);
    if (rgb.isNull() || rgb.width() == 0 || rgb.height() == 0) {
        return 0;
    }

    // Histogram keeps the sum exact regardless of image size
    quint64 histogram[256] = {0};
    for (int y = 0; y < rgb.height(); ++y) {
        const uchar* line = rgb.constScanLine(y);
        for (int x = 0; x < rgb.width(); ++x) {
            const uchar* px = line + x * 3;
            histogram[clip8(luma(px[0], px[1], px[2]))]++;
        }
    }

    quint64 sum = 0;
    quint64 count = 0;
    for (int i = 0; i < 256; ++i) {
        sum += histogram[i] * static_cast<quint64>(i);
        count += histogram[i];
    }

    const double mean = static_cast<double>(sum) / static_cast<double>(count);
    return static_cast<int>(mean + 0.5);
}

QImage adjustContrast(const QImage& image, qreal factor)
{
    const QImage source = toRgb888(image);
    QImage degenerate(source.size(), QImage::Format_RGB888);
    const int mean = meanLuminance(source);
    degenerate.fill(QColor(mean, mean, mean));
    return blend(degenerate, source, factor);
}

QImage adjustBrightness(const QImage& image, qreal factor)
{
    const QImage source = toRgb888(image);
    QImage degenerate(source.size(), QImage::Format_RGB888);
    degenerate.fill(Qt::black);
    return blend(degenerate, source, factor);
}

QImage adjustSharpness(const QImage& image, qreal factor)
{
    const QImage source = toRgb888(image);
    QImage smooth = source.copy();

    const int w = source.width();
    const int h = source.height();

    // Edge rows/columns keep their source values
    if (w >= 3 && h >= 3) {
        for (int y = 1; y < h - 1; ++y) {
            const uchar* above = source.constScanLine(y - 1);
            const uchar* row = source.constScanLine(y);
            const uchar* below = source.constScanLine(y + 1);
            uchar* out = smooth.scanLine(y);
            for (int x = 1; x < w - 1; ++x) {
                for (int c = 0; c < 3; ++c) {
                    const int l = (x - 1) * 3 + c;
                    const int m = x * 3 + c;
                    const int r = (x + 1) * 3 + c;
                    const int sum = above[l] + above[m] + above[r]
                                  + row[l] + 5 * row[m] + row[r]
                                  + below[l] + below[m] + below[r];
                    out[m] = clip8(static_cast<int>(sum / 13.0f + 0.5f));
                }
            }
        }
    }

    return blend(smooth, source, factor);
}

// ============================================================================
// Full pipeline
// ============================================================================

QImage process(const QImage& original, const EnhancementParameters& params)
{
    if (original.isNull()) {
        qWarning() << "[Enhancement] process() called with a null image";
        return QImage();
    }

    const EnhancementParameters p = params.clamped();

    QImage img = invert(original);
    if (p.grayscale) {
        img = toGrayscale(img);
    }
    img = adjustContrast(img, p.contrast);
    img = adjustBrightness(img, p.brightness);
    img = adjustSharpness(img, p.sharpness);
    return img;
}

} // namespace Enhancement
