#ifndef BATCHOPERATIONS_H
#define BATCHOPERATIONS_H

/**
 * @file BatchOperations.h
 * @brief Headless conversion of scanned PDFs.
 *
 * This module provides the processing behind the CLI:
 * - Load, enhance and export one PDF (optionally as n-up sheets)
 * - Convert many PDFs in one run, writing <name>_converted.pdf files
 */

#include "../core/Document.h"
#include "../core/EnhancementPipeline.h"
#include "../core/OperationResult.h"
#include "../layout/LayoutGeometry.h"
#include "../pdf/MuPdfExporter.h"

#include <QString>
#include <QStringList>
#include <QList>
#include <QVector>
#include <functional>
#include <atomic>

namespace BatchOps {

// =============================================================================
// Result Types
// =============================================================================

/**
 * @brief Status of a single file operation.
 */
enum class FileStatus {
    Success,        ///< Operation completed successfully
    Skipped,        ///< Skipped (output exists, cancelled)
    Error           ///< Operation failed
};

/**
 * @brief Result for a single file operation.
 */
struct FileResult {
    QString inputPath;              ///< Path to input PDF
    QString outputPath;             ///< Path to output file (empty if error before naming)
    FileStatus status = FileStatus::Error;
    ErrorKind error = ErrorKind::None;
    QString message;                ///< Error message or skip reason
    qint64 outputSize = 0;          ///< Output file size in bytes (0 if not created)
    int pagesProcessed = 0;         ///< Pages written (sheets when compact)
    bool countsSheets = false;      ///< pagesProcessed counts composed sheets
};

/**
 * @brief Summary result for a batch operation.
 */
struct BatchResult {
    QList<FileResult> results;      ///< Per-file results
    int successCount = 0;           ///< Number of successful operations
    int skippedCount = 0;           ///< Number of skipped files
    int errorCount = 0;             ///< Number of failed operations
    qint64 totalOutputSize = 0;     ///< Total size of all output files
    qint64 elapsedMs = 0;           ///< Total elapsed time in milliseconds

    /// @brief Check if any errors occurred.
    bool hasErrors() const { return errorCount > 0; }

    /// @brief Check if all files were processed successfully (no errors or skips).
    bool allSucceeded() const { return errorCount == 0 && skippedCount == 0; }

    /// @brief Get total number of files processed.
    int totalCount() const { return successCount + skippedCount + errorCount; }
};

// =============================================================================
// Callbacks
// =============================================================================

/**
 * @brief Progress callback signature.
 *
 * Called before processing each file to report progress.
 *
 * @param current Current file index (1-based)
 * @param total Total number of files to process
 * @param currentFile Path to file being processed
 * @param status Brief status message (e.g., "Converting...", "Skipped")
 */
using ProgressCallback = std::function<void(int current, int total,
                                            const QString& currentFile,
                                            const QString& status)>;

/**
 * @brief Result callback signature.
 *
 * Called after each file is processed with the result. Return true to
 * continue processing the next file, or false to stop early.
 */
using ResultCallback = std::function<bool(int current, int total,
                                         const FileResult& result)>;

// =============================================================================
// Options
// =============================================================================

/**
 * @brief Options for converting PDFs.
 */
struct ConvertOptions {
    QString outputPath;                     ///< Output file (single) or directory (batch)
    EnhancementParameters params;           ///< Enhancement applied to every page
    QString pageRange;                      ///< Pages to keep (e.g., "1-10,15"), empty for all
    bool compact = false;                   ///< Compose n-up sheets instead of one page per page
    Layout::LayoutParameters layout;        ///< Sheet layout when compact
    int quality = -1;                       ///< Quality for plain export, -1 for lossless
    int maxSheets = -1;                     ///< Compose at most this many sheets (-1 for all)
    bool overwrite = false;                 ///< Overwrite existing output files
    bool dryRun = false;                    ///< Preview only, don't create files
};

/// Suffix appended to the input base name in batch mode.
constexpr const char* CONVERTED_SUFFIX = "_converted.pdf";

// =============================================================================
// Operations
// =============================================================================

/**
 * @brief Export pages of a loaded document.
 *
 * When @p options.compact is set, the pages are composed into sheets and the
 * sheets are exported at the layout quality; otherwise every page is exported
 * at @p options.quality.
 *
 * @param document Loaded, processed document.
 * @param indices Pages to export in order (empty for all). Unselected pages are skipped.
 * @param options Export and layout options.
 * @param outputPath Destination file.
 * @param progress Optional fraction callback.
 * @param cancelled Optional cancellation flag.
 */
PdfExportResult exportDocument(const Document& document,
                               const QVector<int>& indices,
                               const ConvertOptions& options,
                               const QString& outputPath,
                               const ::ProgressCallback& progress = nullptr,
                               const std::atomic<bool>* cancelled = nullptr);

/**
 * @brief Load, enhance and export one PDF.
 * @param inputPath Source PDF.
 * @param outputPath Destination PDF.
 * @param options Conversion options (outputPath in options is ignored).
 */
FileResult convertFile(const QString& inputPath,
                       const QString& outputPath,
                       const ConvertOptions& options,
                       const ::ProgressCallback& progress = nullptr,
                       const std::atomic<bool>* cancelled = nullptr);

/**
 * @brief Convert multiple PDFs.
 *
 * Output path handling:
 * - Single input + file path: writes to that exact file
 * - Otherwise: writes <dir>/<basename>_converted.pdf for each input
 *
 * @param inputPaths List of PDF paths
 * @param options Conversion options
 * @param progress Optional progress callback (called before each file)
 * @param cancelled Optional cancellation flag (checked between files)
 * @param resultCb Optional per-file result callback
 * @return BatchResult with per-file results and summary
 */
BatchResult convertBatch(const QStringList& inputPaths,
                         const ConvertOptions& options,
                         ProgressCallback progress = nullptr,
                         std::atomic<bool>* cancelled = nullptr,
                         ResultCallback resultCb = nullptr);

// =============================================================================
// Utility Functions
// =============================================================================

/**
 * @brief Generate output file path for a converted file.
 *
 * Example: "/scans/notes.pdf" + "/out" + "_converted.pdf" -> "/out/notes_converted.pdf"
 *
 * @param inputPath Input PDF path
 * @param outputDir Output directory
 * @param suffix Appended to the input base name (including extension)
 * @return Full output file path
 */
QString generateOutputPath(const QString& inputPath,
                           const QString& outputDir,
                           const QString& suffix);

/**
 * @brief Determine if output path represents a single file or directory.
 *
 * Heuristics:
 * - Ends with the extension: single file
 * - Ends with / or is existing directory: directory
 * - Otherwise: assumed to be directory
 */
bool isSingleFileOutput(const QString& outputPath, const QString& extension);

} // namespace BatchOps

#endif // BATCHOPERATIONS_H
