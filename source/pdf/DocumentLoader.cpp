// ============================================================================
// DocumentLoader - Implementation
// ============================================================================

#include "DocumentLoader.h"
#include "PdfProvider.h"

#include <QDebug>
#include <QFileInfo>
#include <QVector>

namespace DocumentLoader {

OperationResult loadPdf(const QString& path,
                        const EnhancementParameters& params,
                        Document& document,
                        const ProgressCallback& progress,
                        const std::atomic<bool>* cancelled,
                        int dpi)
{
    if (!QFileInfo::exists(path)) {
        return OperationResult::failure(ErrorKind::ResourceError,
            QStringLiteral("File not found: %1").arg(path));
    }

    std::unique_ptr<PdfProvider> provider = PdfProvider::create(path);
    if (!provider) {
        return OperationResult::failure(ErrorKind::ResourceError,
            QStringLiteral("Cannot open PDF: %1").arg(path));
    }

    const int total = provider->pageCount();
    qDebug() << "[DocumentLoader] Rasterizing" << total << "pages of" << path
             << "at" << dpi << "DPI via" << provider->backendName();

    QVector<QImage> originals;
    originals.reserve(total);
    for (int i = 0; i < total; ++i) {
        if (isCancelled(cancelled)) {
            return OperationResult::failure(ErrorKind::Cancelled,
                                            QStringLiteral("Load cancelled"));
        }

        QImage image = provider->renderPageToImage(i, dpi);
        if (image.isNull()) {
            return OperationResult::failure(ErrorKind::ResourceError,
                QStringLiteral("Failed to render page %1 of %2").arg(i + 1).arg(path));
        }
        originals.append(image);

        if (progress) {
            progress(0.5 * (i + 1) / total);
        }
    }

    ProgressCallback enhanceProgress;
    if (progress) {
        enhanceProgress = [&progress](qreal fraction) {
            progress(0.5 + 0.5 * fraction);
        };
    }

    return document.load(originals, params, enhanceProgress, cancelled);
}

} // namespace DocumentLoader
