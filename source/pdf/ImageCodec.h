#pragma once

// ============================================================================
// ImageCodec - In-memory image encoding for export and size estimation
// ============================================================================
// Thin wrapper over Qt's image I/O plugins. All functions work on byte
// buffers; nothing touches the filesystem.
// ============================================================================

#include <QByteArray>
#include <QImage>

namespace ImageCodec {

/// Lossless quality marker used throughout export options.
constexpr int LOSSLESS = -1;

/**
 * @brief Encode an image as baseline JPEG.
 * @param image Source image. Alpha is composited onto white first.
 * @param quality 0-100 (clamped).
 * @return Encoded bytes, or empty on failure.
 */
QByteArray encodeJpeg(const QImage& image, int quality);

/**
 * @brief Encode an image as PNG (lossless).
 * @return Encoded bytes, or empty on failure.
 */
QByteArray encodePng(const QImage& image);

/**
 * @brief Decode an encoded image buffer.
 * @return Decoded image, or a null image if the data is not a valid image.
 */
QImage decode(const QByteArray& data);

/**
 * @brief Encode as JPEG and decode again.
 * @return The decoded lossy image, or a null image on codec failure.
 */
QImage roundTrip(const QImage& image, int quality);

/// Convert to an opaque RGB888 image, compositing alpha onto white.
QImage toOpaqueRgb(const QImage& image);

} // namespace ImageCodec
