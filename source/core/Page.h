#pragma once

// ============================================================================
// Page - One logical page of a loaded document
// ============================================================================
// A page record keeps the rasterized original, the current processed version
// and the export selection flag together, so page edits can never leave them
// out of step.
//
// Page is a pure data class - enhancement and composition live elsewhere.
// ============================================================================

#include "EnhancementPipeline.h"

#include <QImage>
#include <QSize>
#include <QString>

/**
 * @brief A single page record.
 *
 * Invariant: original and processed always have the same size. The processed
 * image can be re-derived from the original at any time.
 */
class Page {
public:
    QImage original;            ///< Rasterized source, never modified after load
    QImage processed;           ///< Current enhanced version (replaceable)
    bool selected = true;       ///< Included in export when true

    Page() = default;

    /**
     * @brief Create a page whose processed image starts as a copy of the original.
     */
    explicit Page(const QImage& source);

    // ===== Factory Methods =====

    /**
     * @brief Create a plain white page.
     * @param size Pixel size of the new page.
     */
    static Page createBlank(const QSize& size);

    /**
     * @brief Create a white page with black text drawn near the top-left corner.
     * @param size Pixel size of the new page.
     * @param text Text to render (multi-line text is allowed).
     */
    static Page createText(const QSize& size, const QString& text);

    // ===== Processing =====

    /**
     * @brief Re-derive the processed image from the original.
     */
    void reprocess(const EnhancementParameters& params);

    /**
     * @brief Discard enhancements: processed becomes a copy of the original.
     */
    void revert();

    // ===== Info =====

    QSize size() const { return original.size(); }
    bool isNull() const { return original.isNull(); }

    /// Anchor of inserted text pages, in pixels from the top-left corner.
    static constexpr int TEXT_ANCHOR = 50;
};
