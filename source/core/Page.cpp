// ============================================================================
// Page - Implementation
// ============================================================================

#include "Page.h"

#include <QColor>
#include <QFont>
#include <QPainter>

Page::Page(const QImage& source)
    : original(source.convertToFormat(QImage::Format_RGB888))
    , processed(original.copy())
{
}

// ===== Factory Methods =====

Page Page::createBlank(const QSize& size)
{
    QImage image(size, QImage::Format_RGB888);
    image.fill(Qt::white);
    return Page(image);
}

Page Page::createText(const QSize& size, const QString& text)
{
    QImage image(size, QImage::Format_RGB888);
    image.fill(Qt::white);

    QPainter painter(&image);
    painter.setPen(Qt::black);
    painter.setFont(QFont());

    // Text flows from the anchor towards the bottom-right corner
    QRect textRect(TEXT_ANCHOR, TEXT_ANCHOR,
                   qMax(1, size.width() - TEXT_ANCHOR),
                   qMax(1, size.height() - TEXT_ANCHOR));
    painter.drawText(textRect, Qt::AlignLeft | Qt::AlignTop | Qt::TextWordWrap, text);
    painter.end();

    return Page(image);
}

// ===== Processing =====

void Page::reprocess(const EnhancementParameters& params)
{
    processed = Enhancement::process(original, params);
}

void Page::revert()
{
    processed = original.copy();
}
