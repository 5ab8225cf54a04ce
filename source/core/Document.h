#pragma once

// ============================================================================
// Document - The ordered collection of pages being edited
// ============================================================================
// Document owns every Page record of the currently loaded file. All structural
// edits (insert, move, remove) act on the one page vector, so a page's
// original, processed image and selection flag always travel together.
//
// Document is a pure data class - rasterization lives in DocumentLoader,
// composition in SheetComposer and output in MuPdfExporter.
// ============================================================================

#include "Page.h"
#include "OperationResult.h"

#include <QImage>
#include <QString>
#include <QVector>

#include <atomic>
#include <vector>

/**
 * @brief The central data structure for a loaded document.
 *
 * Identity is positional: page N is whatever sits at index N. The caller is
 * responsible for serializing mutating calls.
 */
class Document {
public:
    Document() = default;

    // =========================================================================
    // Loading & Processing
    // =========================================================================

    /**
     * @brief Replace all pages with freshly processed copies of @p originals.
     * @param originals Rasterized source pages, in order.
     * @param params Enhancement applied to every page.
     * @param progress Optional callback, receives (i+1)/n after each page.
     * @param cancelled Optional flag, checked between pages.
     * @return Cancelled if stopped early. The previous pages are then kept.
     *
     * All new pages start selected.
     */
    OperationResult load(const QVector<QImage>& originals,
                         const EnhancementParameters& params,
                         const ProgressCallback& progress = nullptr,
                         const std::atomic<bool>* cancelled = nullptr);

    /**
     * @brief Re-derive the processed image of one page.
     * @return InputError if @p index is out of range.
     */
    OperationResult reprocessCurrent(int index, const EnhancementParameters& params);

    /**
     * @brief Re-derive every processed image.
     *
     * Pages already reprocessed when cancellation is observed keep their new
     * image; the rest keep the old one. Both states are valid.
     */
    OperationResult reprocessAll(const EnhancementParameters& params,
                                 const ProgressCallback& progress = nullptr,
                                 const std::atomic<bool>* cancelled = nullptr);

    /// Reset one page's processed image to its original.
    OperationResult revertCurrent(int index);

    /// Reset every processed image to its original.
    void revertAll();

    // =========================================================================
    // Page Management
    // =========================================================================

    /**
     * @brief Insert a white page sized like page 0.
     * @param index Insert position, 0..pageCount() inclusive.
     * @return InputError if the document is empty or @p index is out of range.
     */
    OperationResult insertBlank(int index);

    /**
     * @brief Insert a white page with black text anchored at (50, 50).
     * @param index Insert position, 0..pageCount() inclusive.
     * @param text Text to render.
     * @return InputError if the document is empty or @p index is out of range.
     */
    OperationResult insertText(int index, const QString& text);

    /**
     * @brief Swap a page with its neighbour.
     * @param index Page to move.
     * @param direction -1 moves towards the front, +1 towards the back.
     * @return True if moved, false (no change) if either index is out of range.
     */
    bool move(int index, int direction);

    /**
     * @brief Remove a page.
     * @return True if removed, false if @p index is out of range.
     */
    bool removePage(int index);

    /// Drop every page.
    void clear() { m_pages.clear(); }

    // =========================================================================
    // Selection
    // =========================================================================

    void setSelected(int index, bool selected);
    void toggleSelected(int index);
    bool isSelected(int index) const;

    /// 0-based indices of all selected pages, in document order.
    QVector<int> selectedIndices() const;

    // =========================================================================
    // Access
    // =========================================================================

    int pageCount() const { return static_cast<int>(m_pages.size()); }
    bool isEmpty() const { return m_pages.empty(); }

    /**
     * @brief Get a page by index.
     * @return Pointer to the page, or nullptr if index is out of range.
     */
    const Page* page(int index) const;

    /// Original image of a page, or a null image if out of range.
    QImage original(int index) const;

    /// Processed image of a page, or a null image if out of range.
    QImage processed(int index) const;

    /**
     * @brief Collect processed images for export or composition.
     * @param indices Pages to collect, in the wanted order. Out of range
     *                entries are skipped. An empty list means every page.
     * @param selectedOnly Skip pages whose selection flag is cleared.
     */
    QVector<QImage> processedPages(const QVector<int>& indices = {},
                                   bool selectedOnly = true) const;

    /// Size used for inserted pages (size of page 0), invalid if empty.
    QSize referenceSize() const;

private:
    bool isValidIndex(int index) const { return index >= 0 && index < pageCount(); }
    OperationResult insertPage(int index, Page&& page);

    std::vector<Page> m_pages;
};
