#pragma once

// ============================================================================
// SheetComposer - N-up sheet composition
// ============================================================================
// Packs processed pages onto sheets according to LayoutParameters. The same
// code path serves both the preview (limited sheet count) and the export.
// ============================================================================

#include "LayoutGeometry.h"
#include "../core/OperationResult.h"

#include <QImage>
#include <QVector>

#include <atomic>

/**
 * @brief One composed sheet.
 *
 * The sheet owns its pixels; it holds copies of the placed pages.
 */
struct Sheet {
    QImage image;               ///< Final sheet (rotated for landscape)
    QVector<int> pageIndices;   ///< Input indices placed on this sheet, in cell order
};

/**
 * @brief Result of a compose run.
 */
struct ComposeResult {
    OperationResult status;
    QVector<Sheet> sheets;

    bool success() const { return status.success; }
};

namespace SheetComposer {

/**
 * @brief Compose pages onto n-up sheets.
 * @param pages Processed pages, in reading order.
 * @param layout Grid, paper, margins, direction and border.
 * @param progress Optional, receives placed/total after each page.
 * @param cancelled Optional flag, checked between pages.
 * @param maxSheets Stop after this many sheets (-1 for all). Used by previews.
 * @return EmptySelection if @p pages is empty, Cancelled if stopped early.
 */
ComposeResult compose(const QVector<QImage>& pages,
                      const Layout::LayoutParameters& layout,
                      const ProgressCallback& progress = nullptr,
                      const std::atomic<bool>* cancelled = nullptr,
                      int maxSheets = -1);

/// Number of sheets needed for @p pageCount pages: ceil(n / cellsPerSheet).
int sheetCount(int pageCount, const Layout::LayoutParameters& layout);

/**
 * @brief Downscale an image to fit inside @p cell, keeping aspect ratio.
 *
 * Images already inside the cell are returned unchanged (never upscaled).
 */
QImage fitToCell(const QImage& image, const QSize& cell);

} // namespace SheetComposer
