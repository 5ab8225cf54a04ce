#pragma once

// ============================================================================
// EnhancementPipeline - Per-page image enhancement
// ============================================================================
// Turns a rasterized scan (typically light text on a dark background) into a
// print friendly page. The stage order is fixed:
//
//   invert -> optional grayscale -> contrast -> brightness -> sharpness
//
// Every stage is a pure function of its input, so re-running the pipeline on
// an unchanged original always yields the same processed page.
// ============================================================================

#include <QImage>
#include <QString>

/**
 * @brief Tunable enhancement factors for one pipeline run.
 *
 * Factors are multiplicative: 1.0 leaves the image unchanged for that stage.
 */
struct EnhancementParameters {
    qreal contrast = 1.2;       ///< >1 spreads values away from the mean luminance
    qreal brightness = 1.0;     ///< Scales every channel
    qreal sharpness = 1.0;      ///< >1 boosts edges, <1 softens
    bool grayscale = true;      ///< Collapse to luminance after inversion

    /// Parameters that leave every stage except inversion untouched.
    static EnhancementParameters identity()
    {
        EnhancementParameters params;
        params.contrast = 1.0;
        params.brightness = 1.0;
        params.sharpness = 1.0;
        params.grayscale = false;
        return params;
    }

    /// Negative factors are meaningless; clamp them to zero.
    EnhancementParameters clamped() const;

    bool operator==(const EnhancementParameters& other) const;
    bool operator!=(const EnhancementParameters& other) const { return !(*this == other); }

    /// Short description for logs, e.g. "c=1.20 b=1.00 s=1.00 gray".
    QString toString() const;
};

namespace Enhancement {

/**
 * @brief Run the full pipeline on one page.
 * @param original Source page (any format, converted to RGB888 internally).
 * @param params Enhancement factors.
 * @return Processed page in RGB888, same size as @p original.
 *         Returns a null image if @p original is null.
 */
QImage process(const QImage& original, const EnhancementParameters& params);

// ===== Individual stages (exposed for testing) =====

/// Replace every channel value v by 255 - v.
QImage invert(const QImage& image);

/// Collapse to ITU-R 601 luminance and expand back to three equal channels.
QImage toGrayscale(const QImage& image);

/// Blend with a flat image of the rounded mean luminance.
QImage adjustContrast(const QImage& image, qreal factor);

/// Blend with black.
QImage adjustBrightness(const QImage& image, qreal factor);

/// Blend with a 3x3 smoothed copy (kernel 1 1 1 / 1 5 1 / 1 1 1, scale 13).
QImage adjustSharpness(const QImage& image, qreal factor);

/// Mean luminance of the image rounded to the nearest integer.
int meanLuminance(const QImage& image);

} // namespace Enhancement
