// ============================================================================
// SheetComposer - Implementation
// ============================================================================

#include "SheetComposer.h"

#include <QDebug>
#include <QPainter>
#include <QPen>
#include <QTransform>

namespace SheetComposer {

int sheetCount(int pageCount, const Layout::LayoutParameters& layout)
{
    const int perSheet = layout.cellsPerSheet();
    if (pageCount <= 0 || perSheet <= 0) {
        return 0;
    }
    return (pageCount + perSheet - 1) / perSheet;
}

QImage fitToCell(const QImage& image, const QSize& cell)
{
    if (image.isNull()) {
        return image;
    }
    if (image.width() <= cell.width() && image.height() <= cell.height()) {
        return image;
    }

    QImage scaled = image.scaled(cell, Qt::KeepAspectRatio, Qt::SmoothTransformation);

    // Guard against rounding past the cell or collapsing to zero
    if (scaled.width() > cell.width() || scaled.height() > cell.height()
        || scaled.width() < 1 || scaled.height() < 1) {
        const QSize bounded(qBound(1, scaled.width(), cell.width()),
                            qBound(1, scaled.height(), cell.height()));
        scaled = image.scaled(bounded, Qt::IgnoreAspectRatio, Qt::SmoothTransformation);
    }
    return scaled;
}

ComposeResult compose(const QVector<QImage>& pages,
                      const Layout::LayoutParameters& layout,
                      const ProgressCallback& progress,
                      const std::atomic<bool>* cancelled,
                      int maxSheets)
{
    ComposeResult result;

    if (pages.isEmpty()) {
        result.status = OperationResult::failure(ErrorKind::EmptySelection,
                                                 QStringLiteral("No pages to compose"));
        return result;
    }

    const Layout::SheetGeometry geometry = Layout::computeGeometry(layout);
    const int perSheet = geometry.cellsPerSheet();
    const int total = pages.size();

    int sheets = sheetCount(total, layout);
    if (maxSheets >= 0) {
        sheets = qMin(sheets, maxSheets);
    }

    // Pages actually placed (preview may stop early)
    const int toPlace = qMin(total, sheets * perSheet);

    qDebug() << "[SheetComposer] Composing" << total << "pages onto" << sheets << "sheets,"
             << Layout::gridName(layout.grid) << Layout::paperName(layout.paper)
             << Layout::orientationName(layout.orientation)
             << "cell" << geometry.cellSize;

    QPen borderPen(Qt::black);
    borderPen.setWidth(1);

    int placed = 0;
    for (int s = 0; s < sheets; ++s) {
        Sheet sheet;
        QImage canvas(geometry.sheetSize, QImage::Format_RGB888);
        canvas.fill(Qt::white);

        QPainter painter(&canvas);
        painter.setRenderHint(QPainter::Antialiasing, false);
        painter.setRenderHint(QPainter::SmoothPixmapTransform, false);

        for (int cell = 0; cell < perSheet; ++cell) {
            const int pageIndex = s * perSheet + cell;
            if (pageIndex >= total) {
                break;
            }

            if (isCancelled(cancelled)) {
                painter.end();
                qDebug() << "[SheetComposer] Cancelled after" << placed << "of" << toPlace << "pages";
                result.sheets.clear();
                result.status = OperationResult::failure(ErrorKind::Cancelled,
                                                         QStringLiteral("Composition cancelled"));
                return result;
            }

            const QRect box = geometry.cellRect(cell);
            const QImage fitted = fitToCell(pages.at(pageIndex), box.size());
            const QPoint pastePos(box.x() + (box.width() - fitted.width()) / 2,
                                  box.y() + (box.height() - fitted.height()) / 2);
            painter.drawImage(pastePos, fitted);

            if (layout.border) {
                // Outline covers exactly the cell box pixels
                painter.setPen(borderPen);
                painter.setBrush(Qt::NoBrush);
                painter.drawRect(QRect(box.x(), box.y(), box.width() - 1, box.height() - 1));
            }

            sheet.pageIndices.append(pageIndex);
            ++placed;
            if (progress) {
                progress(static_cast<qreal>(placed) / toPlace);
            }
        }
        painter.end();

        // Rotate once, after every cell of this sheet is in place
        if (layout.orientation == Layout::Orientation::Landscape) {
            canvas = canvas.transformed(QTransform().rotate(90));
        }

        sheet.image = canvas;
        result.sheets.append(sheet);
    }

    return result;
}

} // namespace SheetComposer
