// ============================================================================
// PopplerPdfProvider - Implementation
// ============================================================================

#include "PopplerPdfProvider.h"

#include <QDebug>
#include <QPainter>

// ===== Constructor =====

PopplerPdfProvider::PopplerPdfProvider(const QString& pdfPath)
{
    m_document = Poppler::Document::load(pdfPath);

    if (!m_document) {
        qWarning() << "[PopplerPdfProvider] Failed to open" << pdfPath;
        return;
    }

    if (!m_document->isLocked()) {
        // Apply rendering hints for high-quality output
        m_document->setRenderHint(Poppler::Document::Antialiasing, true);
        m_document->setRenderHint(Poppler::Document::TextAntialiasing, true);
        m_document->setRenderHint(Poppler::Document::TextHinting, true);
        m_document->setRenderHint(Poppler::Document::TextSlightHinting, true);
        qDebug() << "[PopplerPdfProvider] Loaded" << pdfPath << "with"
                 << m_document->numPages() << "pages";
    } else {
        qWarning() << "[PopplerPdfProvider]" << pdfPath << "is password protected";
    }
}

// ===== Document Info =====

bool PopplerPdfProvider::isValid() const
{
    return m_document != nullptr && !m_document->isLocked() && m_document->numPages() > 0;
}

bool PopplerPdfProvider::isLocked() const
{
    return m_document != nullptr && m_document->isLocked();
}

int PopplerPdfProvider::pageCount() const
{
    return m_document ? m_document->numPages() : 0;
}

// ===== Page Info =====

QSizeF PopplerPdfProvider::pageSize(int pageIndex) const
{
    auto page = getPage(pageIndex);
    if (!page) {
        return QSizeF();
    }
    return page->pageSizeF();
}

// ===== Rendering =====

QImage PopplerPdfProvider::renderPageToImage(int pageIndex, qreal dpi) const
{
    auto page = getPage(pageIndex);
    if (!page) {
        return QImage();
    }

    QImage image = page->renderToImage(dpi, dpi);
    if (image.isNull()) {
        qWarning() << "[PopplerPdfProvider] Render failed for page" << pageIndex;
        return QImage();
    }

    // Flatten onto white so transparent regions do not invert to black later
    if (image.hasAlphaChannel()) {
        QImage flat(image.size(), QImage::Format_RGB888);
        flat.fill(Qt::white);
        QPainter painter(&flat);
        painter.drawImage(0, 0, image);
        painter.end();
        return flat;
    }
    return image.convertToFormat(QImage::Format_RGB888);
}

// ===== Helpers =====

std::unique_ptr<Poppler::Page> PopplerPdfProvider::getPage(int pageIndex) const
{
    if (!m_document || pageIndex < 0 || pageIndex >= m_document->numPages()) {
        return nullptr;
    }
    return std::unique_ptr<Poppler::Page>(m_document->page(pageIndex));
}
