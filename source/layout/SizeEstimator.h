#pragma once

// ============================================================================
// SizeEstimator - Approximate compact output size
// ============================================================================
// Samples a few pages, encodes each at cell size with the lossy codec and
// extrapolates. The figure is a heuristic; it only grows with quality and
// with page size.
// ============================================================================

#include "LayoutGeometry.h"

#include <QImage>
#include <QString>
#include <QVector>

/**
 * @brief Output of an estimate.
 */
struct SizeEstimate {
    bool valid = false;         ///< False when there were no pages to sample
    qint64 bytes = 0;
    int sampledPages = 0;

    qreal megabytes() const { return bytes / (1024.0 * 1024.0); }

    /// "~X.XX MB", or "N/A" when invalid.
    QString text() const;
};

namespace SizeEstimator {

/// Default number of sampled pages.
constexpr int SAMPLE_COUNT = 3;

/// Multiplier accounting for container overhead.
constexpr qreal OVERHEAD_FACTOR = 1.15;

/**
 * @brief Sample indices spread evenly across @p pageCount pages.
 *
 * Returns floor(i * n / count) for i in [0, min(sampleCount, n)).
 */
QVector<int> sampleIndices(int pageCount, int sampleCount = SAMPLE_COUNT);

/**
 * @brief Estimate the compact output size for @p pages under @p layout.
 */
SizeEstimate estimate(const QVector<QImage>& pages,
                      const Layout::LayoutParameters& layout,
                      int sampleCount = SAMPLE_COUNT);

} // namespace SizeEstimator
