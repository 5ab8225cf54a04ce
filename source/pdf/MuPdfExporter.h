#pragma once

// ============================================================================
// MuPdfExporter - PDF Export Engine using MuPDF
// ============================================================================
// Builds a multi-page PDF from an ordered list of raster images, one page per
// image. Each image is embedded either losslessly (PNG/Flate) or as a JPEG
// stream at a chosen quality. The whole file is assembled in memory and
// committed atomically, so a failed export never leaves a partial file.
// ============================================================================

#include "../core/OperationResult.h"

#include <QImage>
#include <QObject>
#include <QString>
#include <QVector>

#include <atomic>

// Forward declarations for MuPDF types (avoid exposing mupdf headers in public API)
struct fz_context;
struct pdf_document;

/**
 * @brief Export options for PDF generation.
 */
struct PdfExportOptions {
    QString outputPath;             ///< Path to output PDF file
    int quality = -1;               ///< JPEG quality 0-100, or -1 for lossless
    int dpi = 200;                  ///< Resolution the images were rendered at
    QString title;                  ///< Optional /Title metadata
};

/**
 * @brief Result of a PDF export operation.
 */
struct PdfExportResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    QString errorMessage;
    int pagesExported = 0;
    qint64 fileSizeBytes = 0;
};

/**
 * @brief PDF Export Engine using MuPDF.
 *
 * Thread Safety: This class is NOT thread-safe. Export operations should
 * be run from a single thread. Cancellation goes through the flag passed
 * to exportImages(), which may be set from any thread.
 *
 * Usage:
 * @code
 * MuPdfExporter exporter;
 *
 * PdfExportOptions options;
 * options.outputPath = "/path/to/output.pdf";
 * options.quality = 85;
 *
 * PdfExportResult result = exporter.exportImages(images, options);
 * if (!result.success) {
 *     qWarning() << "Export failed:" << result.errorMessage;
 * }
 * @endcode
 */
class MuPdfExporter : public QObject {
    Q_OBJECT

public:
    explicit MuPdfExporter(QObject* parent = nullptr);
    ~MuPdfExporter() override;

    // Disable copy (MuPDF context is not copyable)
    MuPdfExporter(const MuPdfExporter&) = delete;
    MuPdfExporter& operator=(const MuPdfExporter&) = delete;

    /**
     * @brief Export images to a PDF, one page per image, in order.
     * @param images Pages to write. Must not be empty.
     * @param options Output path, quality and source DPI.
     * @param progress Optional, receives exported/total after each page.
     * @param cancelled Optional external flag, checked between pages.
     * @return Result with page count and size, or the failure kind:
     *         EmptySelection (no file written), EncodingError,
     *         ResourceError (output not writable), Cancelled.
     */
    PdfExportResult exportImages(const QVector<QImage>& images,
                                 const PdfExportOptions& options,
                                 const ProgressCallback& progress = nullptr,
                                 const std::atomic<bool>* cancelled = nullptr);

    bool isExporting() const { return m_isExporting; }

    /**
     * @brief Page size in PDF points for an image rendered at @p dpi.
     */
    static QSizeF pageSizePt(const QSize& pixels, int dpi);

signals:
    /**
     * @brief Emitted after each page is added.
     */
    void progressUpdated(int current, int total);

    void exportComplete();
    void exportCancelled();
    void exportFailed(const QString& errorMessage);

private:
    bool initContext();
    void cleanup();

    /**
     * @brief Append one full-page image to the output document.
     * @return False with @p errorMessage set on failure.
     */
    bool addImagePage(const QImage& image, int quality, int dpi, QString* errorMessage);

    /**
     * @brief Serialize the output document into @p data.
     */
    bool writeToBuffer(QByteArray* data);

    void writeMetadata(const QString& title);

    PdfExportResult fail(PdfExportResult result, ErrorKind kind, const QString& message);

    fz_context* m_ctx = nullptr;
    pdf_document* m_outputDoc = nullptr;

    bool m_isExporting = false;
};
