#include "BatchOperations.h"

#include "../core/PageRange.h"
#include "../layout/SheetComposer.h"
#include "../pdf/DocumentLoader.h"
#include "../pdf/PdfProvider.h"

#include <QDir>
#include <QFileInfo>
#include <QElapsedTimer>
#include <QFile>
#include <QDebug>

/**
 * @file BatchOperations.cpp
 * @brief Implementation of PDF conversion operations.
 *
 * @see BatchOperations.h for API documentation
 */

namespace BatchOps {

// =============================================================================
// Utility Functions
// =============================================================================

QString generateOutputPath(const QString& inputPath,
                           const QString& outputDir,
                           const QString& suffix)
{
    QFileInfo inputInfo(inputPath);
    QString baseName = inputInfo.completeBaseName();

    // Ensure output directory path ends properly
    QString outDir = outputDir;
    if (!outDir.endsWith('/') && !outDir.endsWith('\\')) {
        outDir += '/';
    }

    return outDir + baseName + suffix;
}

bool isSingleFileOutput(const QString& outputPath, const QString& extension)
{
    if (outputPath.isEmpty()) {
        return false;
    }

    // Check if ends with the expected extension
    if (outputPath.endsWith(extension, Qt::CaseInsensitive)) {
        return true;
    }

    // Check if ends with directory separator
    if (outputPath.endsWith('/') || outputPath.endsWith('\\')) {
        return false;
    }

    // Default: assume directory (safer for batch operations)
    return false;
}

// =============================================================================
// Single Document
// =============================================================================

PdfExportResult exportDocument(const Document& document,
                               const QVector<int>& indices,
                               const ConvertOptions& options,
                               const QString& outputPath,
                               const ::ProgressCallback& progress,
                               const std::atomic<bool>* cancelled)
{
    const QVector<QImage> pages = document.processedPages(indices, true);

    MuPdfExporter exporter;
    PdfExportOptions pdfOpts;
    pdfOpts.outputPath = outputPath;
    pdfOpts.dpi = Layout::RENDER_DPI;
    pdfOpts.title = QFileInfo(outputPath).completeBaseName();

    if (!options.compact) {
        pdfOpts.quality = options.quality;
        return exporter.exportImages(pages, pdfOpts, progress, cancelled);
    }

    // Compact: compose sheets first, then export them at the layout quality
    ::ProgressCallback composeProgress;
    ::ProgressCallback exportProgress;
    if (progress) {
        composeProgress = [&progress](qreal f) { progress(0.5 * f); };
        exportProgress = [&progress](qreal f) { progress(0.5 + 0.5 * f); };
    }

    ComposeResult composed = SheetComposer::compose(pages, options.layout,
                                                    composeProgress, cancelled,
                                                    options.maxSheets);
    if (!composed.success()) {
        PdfExportResult result;
        result.error = composed.status.error;
        result.errorMessage = composed.status.errorMessage;
        return result;
    }

    QVector<QImage> sheets;
    sheets.reserve(composed.sheets.size());
    for (const Sheet& sheet : composed.sheets) {
        sheets.append(sheet.image);
    }

    pdfOpts.quality = options.layout.quality;
    return exporter.exportImages(sheets, pdfOpts, exportProgress, cancelled);
}

FileResult convertFile(const QString& inputPath,
                       const QString& outputPath,
                       const ConvertOptions& options,
                       const ::ProgressCallback& progress,
                       const std::atomic<bool>* cancelled)
{
    FileResult fr;
    fr.inputPath = inputPath;
    fr.outputPath = outputPath;

    ::ProgressCallback loadProgress;
    ::ProgressCallback exportProgress;
    if (progress) {
        loadProgress = [&progress](qreal f) { progress(0.6 * f); };
        exportProgress = [&progress](qreal f) { progress(0.6 + 0.4 * f); };
    }

    Document doc;
    OperationResult loaded = DocumentLoader::loadPdf(inputPath, options.params, doc,
                                                     loadProgress, cancelled);
    if (!loaded.success) {
        fr.status = loaded.wasCancelled() ? FileStatus::Skipped : FileStatus::Error;
        fr.error = loaded.error;
        fr.message = loaded.errorMessage;
        return fr;
    }

    PageRange::ParseResult range = PageRange::parse(options.pageRange, doc.pageCount());
    if (!range.success) {
        fr.status = FileStatus::Error;
        fr.error = range.error;
        fr.message = range.errorMessage;
        return fr;
    }
    if (range.indices.isEmpty()) {
        fr.status = FileStatus::Error;
        fr.error = ErrorKind::EmptySelection;
        fr.message = QObject::tr("Page range selects no pages");
        return fr;
    }

    PdfExportResult exported = exportDocument(doc, range.indices, options, outputPath,
                                              exportProgress, cancelled);
    if (exported.success) {
        fr.status = FileStatus::Success;
        fr.outputSize = exported.fileSizeBytes;
        fr.pagesProcessed = exported.pagesExported;
        fr.countsSheets = options.compact;
    } else {
        fr.status = exported.error == ErrorKind::Cancelled ? FileStatus::Skipped
                                                           : FileStatus::Error;
        fr.error = exported.error;
        fr.message = exported.errorMessage;
    }
    return fr;
}

// =============================================================================
// Batch Conversion
// =============================================================================

BatchResult convertBatch(const QStringList& inputPaths,
                         const ConvertOptions& options,
                         ProgressCallback progress,
                         std::atomic<bool>* cancelled,
                         ResultCallback resultCb)
{
    BatchResult result;
    QElapsedTimer timer;
    timer.start();

    const int total = inputPaths.size();

    if (inputPaths.isEmpty()) {
        result.elapsedMs = timer.elapsed();
        return result;
    }

    if (options.outputPath.isEmpty()) {
        for (const QString& inputPath : inputPaths) {
            FileResult fr;
            fr.inputPath = inputPath;
            fr.status = FileStatus::Error;
            fr.error = ErrorKind::ResourceError;
            fr.message = QObject::tr("No output path specified");
            result.results.append(fr);
            result.errorCount++;
        }
        result.elapsedMs = timer.elapsed();
        return result;
    }

    // Determine single-file vs batch mode
    const bool singleFileMode = (inputPaths.size() == 1) &&
                                isSingleFileOutput(options.outputPath, ".pdf");

    QString outputDir;
    if (!singleFileMode) {
        outputDir = options.outputPath;
        QDir dir(outputDir);
        if (!dir.exists() && !options.dryRun && !dir.mkpath(".")) {
            for (const QString& inputPath : inputPaths) {
                FileResult fr;
                fr.inputPath = inputPath;
                fr.status = FileStatus::Error;
                fr.error = ErrorKind::ResourceError;
                fr.message = QObject::tr("Failed to create output directory: %1").arg(outputDir);
                result.results.append(fr);
                result.errorCount++;
            }
            result.elapsedMs = timer.elapsed();
            return result;
        }
    }

    for (int i = 0; i < total; ++i) {
        const QString& inputPath = inputPaths.at(i);
        FileResult fr;
        fr.inputPath = inputPath;

        const QString outputPath = singleFileMode
            ? options.outputPath
            : generateOutputPath(inputPath, outputDir, QString::fromLatin1(CONVERTED_SUFFIX));
        fr.outputPath = outputPath;

        if (cancelled && cancelled->load()) {
            fr.status = FileStatus::Skipped;
            fr.error = ErrorKind::Cancelled;
            fr.message = QObject::tr("Cancelled");
        } else {
            if (progress) {
                progress(i + 1, total, inputPath, QObject::tr("Converting..."));
            }

            if (QFile::exists(outputPath) && !options.overwrite) {
                fr.status = FileStatus::Skipped;
                fr.message = QObject::tr("Output file already exists");
            } else if (options.dryRun) {
                // Open only; rasterizing is the expensive part
                std::unique_ptr<PdfProvider> provider = PdfProvider::create(inputPath);
                if (provider) {
                    fr.status = FileStatus::Success;
                    fr.pagesProcessed = provider->pageCount();
                    if (options.compact) {
                        fr.pagesProcessed = SheetComposer::sheetCount(fr.pagesProcessed,
                                                                      options.layout);
                        fr.countsSheets = true;
                    }
                    fr.message = QObject::tr("Would convert to: %1").arg(outputPath);
                } else {
                    fr.status = FileStatus::Error;
                    fr.error = ErrorKind::ResourceError;
                    fr.message = QObject::tr("Cannot open PDF");
                }
            } else {
                fr = convertFile(inputPath, outputPath, options, nullptr, cancelled);
            }
        }

        switch (fr.status) {
            case FileStatus::Success:
                result.successCount++;
                result.totalOutputSize += fr.outputSize;
                break;
            case FileStatus::Skipped:
                result.skippedCount++;
                break;
            case FileStatus::Error:
                result.errorCount++;
                break;
        }
        result.results.append(fr);

        if (resultCb && !resultCb(i + 1, total, fr)) {
            break;
        }
    }

    result.elapsedMs = timer.elapsed();

    qDebug() << "[BatchOps] convertBatch complete:"
             << result.successCount << "success,"
             << result.skippedCount << "skipped,"
             << result.errorCount << "errors,"
             << result.elapsedMs << "ms";

    return result;
}

} // namespace BatchOps
