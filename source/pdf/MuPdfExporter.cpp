// ============================================================================
// MuPdfExporter - Implementation
// ============================================================================

#include "MuPdfExporter.h"
#include "ImageCodec.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QFileInfo>
#include <QSaveFile>

// ============================================================================
// Construction / Destruction
// ============================================================================

MuPdfExporter::MuPdfExporter(QObject* parent)
    : QObject(parent)
{
}

MuPdfExporter::~MuPdfExporter()
{
    cleanup();
}

// ============================================================================
// Public API
// ============================================================================

QSizeF MuPdfExporter::pageSizePt(const QSize& pixels, int dpi)
{
    const qreal effectiveDpi = dpi > 0 ? dpi : 72;
    return QSizeF(pixels.width() * 72.0 / effectiveDpi,
                  pixels.height() * 72.0 / effectiveDpi);
}

PdfExportResult MuPdfExporter::fail(PdfExportResult result, ErrorKind kind, const QString& message)
{
    cleanup();
    m_isExporting = false;
    result.success = false;
    result.error = kind;
    result.errorMessage = message;
    if (kind == ErrorKind::Cancelled) {
        emit exportCancelled();
    } else {
        qWarning() << "[MuPdfExporter]" << message;
        emit exportFailed(message);
    }
    return result;
}

PdfExportResult MuPdfExporter::exportImages(const QVector<QImage>& images,
                                            const PdfExportOptions& options,
                                            const ProgressCallback& progress,
                                            const std::atomic<bool>* cancelled)
{
    PdfExportResult result;

    if (images.isEmpty()) {
        return fail(result, ErrorKind::EmptySelection, tr("Nothing selected to export"));
    }
    if (options.outputPath.isEmpty()) {
        return fail(result, ErrorKind::ResourceError, tr("No output path specified"));
    }

    m_isExporting = true;

    qDebug() << "[MuPdfExporter] Starting export:" << images.size() << "pages,"
             << (options.quality < 0 ? QStringLiteral("lossless")
                                     : QStringLiteral("JPEG q=%1").arg(options.quality))
             << "to" << options.outputPath;

    if (!initContext()) {
        return fail(result, ErrorKind::ResourceError, tr("Failed to initialize PDF engine"));
    }

    const int total = images.size();
    for (int i = 0; i < total; ++i) {
        if (isCancelled(cancelled)) {
            return fail(result, ErrorKind::Cancelled, tr("Export cancelled"));
        }

        QString error;
        if (!addImagePage(images.at(i), options.quality, options.dpi, &error)) {
            return fail(result, ErrorKind::EncodingError,
                        tr("Page %1: %2").arg(i + 1).arg(error));
        }

        result.pagesExported++;
        emit progressUpdated(i + 1, total);
        if (progress) {
            progress(static_cast<qreal>(i + 1) / total);
        }
    }

    writeMetadata(options.title);

    QByteArray data;
    if (!writeToBuffer(&data)) {
        return fail(result, ErrorKind::EncodingError, tr("Failed to serialize PDF"));
    }

    // Commit atomically: nothing is left behind if writing fails
    QSaveFile file(options.outputPath);
    if (!file.open(QIODevice::WriteOnly)) {
        return fail(result, ErrorKind::ResourceError,
                    tr("Cannot write %1: %2").arg(options.outputPath, file.errorString()));
    }
    if (file.write(data) != data.size() || !file.commit()) {
        file.cancelWriting();
        return fail(result, ErrorKind::ResourceError,
                    tr("Failed to save %1: %2").arg(options.outputPath, file.errorString()));
    }

    result.fileSizeBytes = QFileInfo(options.outputPath).size();
    result.success = true;

    cleanup();
    m_isExporting = false;

    qDebug() << "[MuPdfExporter] Export complete:"
             << result.pagesExported << "pages,"
             << (result.fileSizeBytes / 1024) << "KB";

    emit exportComplete();
    return result;
}

// ============================================================================
// Initialization
// ============================================================================

bool MuPdfExporter::initContext()
{
    cleanup();

    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "[MuPdfExporter] Failed to create MuPDF context";
        return false;
    }

    fz_try(m_ctx) {
        m_outputDoc = pdf_create_document(m_ctx);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfExporter] Failed to create output PDF:" << fz_caught_message(m_ctx);
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
        return false;
    }

    return true;
}

void MuPdfExporter::cleanup()
{
    if (m_outputDoc) {
        pdf_drop_document(m_ctx, m_outputDoc);
        m_outputDoc = nullptr;
    }
    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

// ============================================================================
// Page Building
// ============================================================================

bool MuPdfExporter::addImagePage(const QImage& image, int quality, int dpi, QString* errorMessage)
{
    if (image.isNull()) {
        *errorMessage = QStringLiteral("image is empty");
        return false;
    }

    // Encode: JPEG with a decode check, or lossless PNG
    QByteArray encoded;
    if (quality >= 0) {
        encoded = ImageCodec::encodeJpeg(image, quality);
        if (encoded.isEmpty()) {
            *errorMessage = QStringLiteral("JPEG encoding failed");
            return false;
        }
        const QImage decoded = ImageCodec::decode(encoded);
        if (decoded.isNull() || decoded.size() != image.size()) {
            *errorMessage = QStringLiteral("JPEG round-trip produced an unreadable image");
            return false;
        }
    } else {
        encoded = ImageCodec::encodePng(image);
        if (encoded.isEmpty()) {
            *errorMessage = QStringLiteral("PNG encoding failed");
            return false;
        }
    }

    const QSizeF sizePt = pageSizePt(image.size(), dpi);
    const float widthPt = static_cast<float>(sizePt.width());
    const float heightPt = static_cast<float>(sizePt.height());

    fz_buffer* imgBuf = nullptr;
    fz_image* fzImage = nullptr;
    fz_buffer* content = nullptr;
    pdf_obj* imgXObj = nullptr;
    pdf_obj* resources = nullptr;
    pdf_obj* xobjectDict = nullptr;
    pdf_obj* pageObj = nullptr;
    bool ok = true;

    fz_try(m_ctx) {
        imgBuf = fz_new_buffer_from_copied_data(m_ctx,
            reinterpret_cast<const unsigned char*>(encoded.constData()),
            static_cast<size_t>(encoded.size()));
        fzImage = fz_new_image_from_buffer(m_ctx, imgBuf);
        imgXObj = pdf_add_image(m_ctx, m_outputDoc, fzImage);

        resources = pdf_new_dict(m_ctx, m_outputDoc, 1);
        xobjectDict = pdf_new_dict(m_ctx, m_outputDoc, 1);
        pdf_dict_puts(m_ctx, xobjectDict, "Img0", imgXObj);
        pdf_dict_put(m_ctx, resources, PDF_NAME(XObject), xobjectDict);

        // Image XObjects are 1x1 unit: scale to the full page
        content = fz_new_buffer(m_ctx, 64);
        fz_append_printf(m_ctx, content, "q %g 0 0 %g 0 0 cm /Img0 Do Q\n", widthPt, heightPt);

        fz_rect mediabox = fz_make_rect(0, 0, widthPt, heightPt);
        pageObj = pdf_add_page(m_ctx, m_outputDoc, mediabox, 0, resources, content);
        pdf_insert_page(m_ctx, m_outputDoc, -1, pageObj);
    }
    fz_always(m_ctx) {
        pdf_drop_obj(m_ctx, pageObj);
        pdf_drop_obj(m_ctx, xobjectDict);
        pdf_drop_obj(m_ctx, resources);
        pdf_drop_obj(m_ctx, imgXObj);
        fz_drop_buffer(m_ctx, content);
        fz_drop_image(m_ctx, fzImage);
        fz_drop_buffer(m_ctx, imgBuf);
    }
    fz_catch(m_ctx) {
        *errorMessage = QString::fromUtf8(fz_caught_message(m_ctx));
        ok = false;
    }

    return ok;
}

void MuPdfExporter::writeMetadata(const QString& title)
{
    if (title.isEmpty()) {
        return;
    }

    QByteArray titleUtf8 = title.toUtf8();
    fz_try(m_ctx) {
        fz_set_metadata(m_ctx, &m_outputDoc->super,
                        FZ_META_INFO_TITLE, titleUtf8.constData());
        fz_set_metadata(m_ctx, &m_outputDoc->super,
                        FZ_META_INFO_PRODUCER, "PageForge");
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfExporter] Failed to write metadata (non-fatal):"
                   << fz_caught_message(m_ctx);
    }
}

// ============================================================================
// Finalization
// ============================================================================

bool MuPdfExporter::writeToBuffer(QByteArray* data)
{
    if (!m_outputDoc || !m_ctx) {
        return false;
    }

    fz_buffer* buffer = nullptr;
    fz_output* out = nullptr;
    bool ok = true;

    fz_try(m_ctx) {
        buffer = fz_new_buffer(m_ctx, 64 * 1024);
        out = fz_new_output_with_buffer(m_ctx, buffer);

        pdf_write_options opts = pdf_default_write_options;
        opts.do_compress = 1;       // Compress streams
        opts.do_compress_images = 1; // Compress lossless images
        opts.do_garbage = 1;
        pdf_write_document(m_ctx, m_outputDoc, out, &opts);
        fz_close_output(m_ctx, out);

        unsigned char* bytes = nullptr;
        size_t length = fz_buffer_storage(m_ctx, buffer, &bytes);
        *data = QByteArray(reinterpret_cast<const char*>(bytes), static_cast<int>(length));
    }
    fz_always(m_ctx) {
        fz_drop_output(m_ctx, out);
        fz_drop_buffer(m_ctx, buffer);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfExporter] Failed to write document:" << fz_caught_message(m_ctx);
        ok = false;
    }

    return ok;
}
