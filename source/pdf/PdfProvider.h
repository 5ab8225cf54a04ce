#pragma once

// ============================================================================
// PdfProvider - Abstract interface for PDF page rasterization
// ============================================================================
// Document loading only needs page counts, page sizes and raster images, so
// this interface stays that small. Backends:
//   - PopplerPdfProvider (desktop, glibc)
//   - MuPdfProvider (musl, or forced with PAGEFORGE_USE_MUPDF_RASTERIZER)
//
// Design: Uses simple Qt types instead of passing backend-specific types.
// ============================================================================

#include <QImage>
#include <QSizeF>
#include <QString>
#include <memory>

/**
 * @brief Abstract interface for reading and rasterizing PDF files.
 */
class PdfProvider {
public:
    virtual ~PdfProvider() = default;

    // ===== Document Info =====

    /**
     * @brief Check if the PDF was loaded successfully.
     * @return True if a valid, unlocked PDF with at least one page is loaded.
     */
    virtual bool isValid() const = 0;

    /**
     * @brief Check if the PDF is password-protected and locked.
     */
    virtual bool isLocked() const = 0;

    /**
     * @brief Get the total number of pages.
     * @return Page count, or 0 if invalid.
     */
    virtual int pageCount() const = 0;

    /// Short backend identifier for logs ("mupdf", "poppler").
    virtual QString backendName() const = 0;

    // ===== Page Info =====

    /**
     * @brief Get the size of a page in PDF points (1/72 inch).
     * @param pageIndex 0-based page index.
     * @return Page size, or an invalid size if the index is out of range.
     */
    virtual QSizeF pageSize(int pageIndex) const = 0;

    // ===== Rendering =====

    /**
     * @brief Render a page to an image.
     * @param pageIndex 0-based page index.
     * @param dpi Rendering resolution.
     * @return Rendered page on a white background, or a null image on failure.
     */
    virtual QImage renderPageToImage(int pageIndex, qreal dpi) const = 0;

    // ===== Factory =====

    /**
     * @brief Open a PDF with the backend selected for this build.
     * @param pdfPath Path to the PDF file.
     * @return Provider, or nullptr if the file cannot be opened.
     */
    static std::unique_ptr<PdfProvider> create(const QString& pdfPath);
};
