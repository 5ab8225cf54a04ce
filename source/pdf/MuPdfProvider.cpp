// ============================================================================
// MuPdfProvider - MuPDF implementation of PdfProvider
// ============================================================================

#include "MuPdfProvider.h"

#include <mupdf/fitz.h>

#include <QDebug>

#include <cstring>

// ============================================================================
// Construction / Destruction
// ============================================================================

MuPdfProvider::MuPdfProvider(const QString& pdfPath)
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "[MuPdfProvider] Failed to create MuPDF context";
        return;
    }

    // Register document handlers (PDF, XPS, etc.)
    fz_try(m_ctx) {
        fz_register_document_handlers(m_ctx);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Failed to register document handlers";
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
        return;
    }

    QByteArray pathUtf8 = pdfPath.toUtf8();
    fz_try(m_ctx) {
        m_doc = fz_open_document(m_ctx, pathUtf8.constData());
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Failed to open" << pdfPath
                   << "-" << fz_caught_message(m_ctx);
        m_doc = nullptr;
        return;
    }

    if (fz_needs_password(m_ctx, m_doc)) {
        qWarning() << "[MuPdfProvider]" << pdfPath << "is password protected";
        return;
    }

    fz_try(m_ctx) {
        m_pageCount = fz_count_pages(m_ctx, m_doc);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Failed to get page count";
        m_pageCount = 0;
    }

    qDebug() << "[MuPdfProvider] Loaded" << pdfPath << "with" << m_pageCount << "pages";
}

MuPdfProvider::~MuPdfProvider()
{
    if (m_doc) {
        fz_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
    }
    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

// ============================================================================
// Document Info
// ============================================================================

bool MuPdfProvider::isValid() const
{
    return m_ctx != nullptr && m_doc != nullptr && m_pageCount > 0 && !isLocked();
}

bool MuPdfProvider::isLocked() const
{
    if (!m_ctx || !m_doc) return false;
    return fz_needs_password(m_ctx, m_doc) != 0;
}

int MuPdfProvider::pageCount() const
{
    return m_pageCount;
}

// ============================================================================
// Page Info
// ============================================================================

QSizeF MuPdfProvider::pageSize(int pageIndex) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount) {
        return QSizeF();
    }

    fz_rect bounds = fz_empty_rect;
    fz_page* page = nullptr;
    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);
        bounds = fz_bound_page(m_ctx, page);
    }
    fz_always(m_ctx) {
        if (page) fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        return QSizeF();
    }

    return QSizeF(bounds.x1 - bounds.x0, bounds.y1 - bounds.y0);
}

// ============================================================================
// Rendering
// ============================================================================

QImage MuPdfProvider::renderPageToImage(int pageIndex, qreal dpi) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount) {
        return QImage();
    }

    // Scale factor: PDF points are 72 dpi
    float scale = static_cast<float>(dpi / 72.0);

    fz_page* page = nullptr;
    fz_pixmap* pix = nullptr;
    fz_device* dev = nullptr;
    QImage result;

    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);

        fz_matrix ctm = fz_scale(scale, scale);
        fz_rect bounds = fz_bound_page(m_ctx, page);
        fz_irect bbox = fz_round_rect(fz_transform_rect(bounds, ctm));

        // Opaque RGB pixmap on white; scans have no use for alpha
        pix = fz_new_pixmap_with_bbox(m_ctx, fz_device_rgb(m_ctx), bbox, nullptr, 0);
        fz_clear_pixmap_with_value(m_ctx, pix, 255);

        dev = fz_new_draw_device(m_ctx, ctm, pix);
        fz_run_page(m_ctx, page, dev, fz_identity, nullptr);
        fz_close_device(m_ctx, dev);

        int width = fz_pixmap_width(m_ctx, pix);
        int height = fz_pixmap_height(m_ctx, pix);
        int stride = fz_pixmap_stride(m_ctx, pix);
        unsigned char* samples = fz_pixmap_samples(m_ctx, pix);

        // Copy data to QImage (MuPDF pixmap will be freed)
        result = QImage(width, height, QImage::Format_RGB888);
        for (int y = 0; y < height; ++y) {
            memcpy(result.scanLine(y), samples + y * stride, static_cast<size_t>(width) * 3);
        }
    }
    fz_always(m_ctx) {
        if (dev) fz_drop_device(m_ctx, dev);
        if (pix) fz_drop_pixmap(m_ctx, pix);
        if (page) fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Render failed for page" << pageIndex
                   << "-" << fz_caught_message(m_ctx);
        return QImage();
    }

    return result;
}
