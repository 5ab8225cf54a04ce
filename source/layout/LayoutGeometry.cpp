// ============================================================================
// LayoutGeometry - Implementation
// ============================================================================

#include "LayoutGeometry.h"

#include <QtMath>

namespace Layout {

// ============================================================================
// LayoutParameters
// ============================================================================

int LayoutParameters::columns() const
{
    switch (grid) {
        case GridLayout::Grid3x1: return 1;
        case GridLayout::Grid2x2: return 2;
        case GridLayout::Grid3x2: return 2;
    }
    return 1;
}

int LayoutParameters::rows() const
{
    switch (grid) {
        case GridLayout::Grid3x1: return 3;
        case GridLayout::Grid2x2: return 2;
        case GridLayout::Grid3x2: return 3;
    }
    return 1;
}

// ============================================================================
// Conversions
// ============================================================================

int mmToPx(qreal mm, int dpi)
{
    return qRound(mm * dpi / 25.4);
}

QSizeF paperSizeMm(PaperSize paper)
{
    switch (paper) {
        case PaperSize::A4:     return QSizeF(210.0, 297.0);
        case PaperSize::Letter: return QSizeF(216.0, 279.0);
    }
    return QSizeF(210.0, 297.0);
}

QSizeF sheetSizeMm(PaperSize paper, Orientation orientation)
{
    QSizeF size = paperSizeMm(paper);
    if (orientation == Orientation::Landscape) {
        size.transpose();
    }
    return size;
}

SheetGeometry computeGeometry(const LayoutParameters& params, int dpi)
{
    SheetGeometry geometry;
    geometry.columns = params.columns();
    geometry.rows = params.rows();
    geometry.direction = params.direction;

    const QSizeF mm = sheetSizeMm(params.paper, params.orientation);
    geometry.sheetSize = QSize(mmToPx(mm.width(), dpi), mmToPx(mm.height(), dpi));
    geometry.outerPx = mmToPx(qMax<qreal>(0.0, params.outerMarginMm), dpi);
    geometry.innerPx = mmToPx(qMax<qreal>(0.0, params.innerGapMm), dpi);

    const int usableW = geometry.sheetSize.width() - 2 * geometry.outerPx
                      - (geometry.columns - 1) * geometry.innerPx;
    const int usableH = geometry.sheetSize.height() - 2 * geometry.outerPx
                      - (geometry.rows - 1) * geometry.innerPx;

    // Floor division; negative usable space still clamps to the minimum
    const int cellW = static_cast<int>(qFloor(static_cast<qreal>(usableW) / geometry.columns));
    const int cellH = static_cast<int>(qFloor(static_cast<qreal>(usableH) / geometry.rows));
    geometry.cellSize = QSize(qMax(MIN_CELL_PX, cellW), qMax(MIN_CELL_PX, cellH));

    return geometry;
}

void cellPosition(int cellIndex, int columns, int rows, ReadingDirection direction,
                  int* row, int* column)
{
    int r = 0;
    int c = 0;
    if (direction == ReadingDirection::LeftToRight) {
        r = cellIndex / columns;
        c = cellIndex % columns;
    } else {
        c = cellIndex / rows;
        r = cellIndex % rows;
    }
    if (row) *row = r;
    if (column) *column = c;
}

QRect SheetGeometry::cellRect(int cellIndex) const
{
    int r = 0;
    int c = 0;
    cellPosition(cellIndex, columns, rows, direction, &r, &c);
    const int x = outerPx + c * (cellSize.width() + innerPx);
    const int y = outerPx + r * (cellSize.height() + innerPx);
    return QRect(QPoint(x, y), cellSize);
}

// ============================================================================
// Name lookup
// ============================================================================

template <typename T>
static Lookup<T> found(T value)
{
    Lookup<T> result;
    result.success = true;
    result.value = value;
    return result;
}

template <typename T>
static Lookup<T> unknown(const QString& what, const QString& name, const QStringList& valid)
{
    Lookup<T> result;
    result.errorMessage = QStringLiteral("Unknown %1 \"%2\" (expected one of: %3)")
                              .arg(what, name, valid.join(QStringLiteral(", ")));
    return result;
}

Lookup<PaperSize> paperFromName(const QString& name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("a4")) return found(PaperSize::A4);
    if (key == QLatin1String("letter")) return found(PaperSize::Letter);
    return unknown<PaperSize>(QStringLiteral("paper size"), name, paperNames());
}

Lookup<Orientation> orientationFromName(const QString& name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("portrait")) return found(Orientation::Portrait);
    if (key == QLatin1String("landscape")) return found(Orientation::Landscape);
    return unknown<Orientation>(QStringLiteral("orientation"), name,
                                {QStringLiteral("portrait"), QStringLiteral("landscape")});
}

Lookup<GridLayout> gridFromName(const QString& name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("3x1")) return found(GridLayout::Grid3x1);
    if (key == QLatin1String("2x2")) return found(GridLayout::Grid2x2);
    if (key == QLatin1String("3x2")) return found(GridLayout::Grid3x2);
    return unknown<GridLayout>(QStringLiteral("layout"), name, gridNames());
}

Lookup<ReadingDirection> directionFromName(const QString& name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("ltr")) return found(ReadingDirection::LeftToRight);
    if (key == QLatin1String("ttb")) return found(ReadingDirection::TopToBottom);
    return unknown<ReadingDirection>(QStringLiteral("reading direction"), name,
                                     {QStringLiteral("ltr"), QStringLiteral("ttb")});
}

QString paperName(PaperSize paper)
{
    return paper == PaperSize::Letter ? QStringLiteral("Letter") : QStringLiteral("A4");
}

QString orientationName(Orientation orientation)
{
    return orientation == Orientation::Landscape ? QStringLiteral("landscape")
                                                 : QStringLiteral("portrait");
}

QString gridName(GridLayout grid)
{
    switch (grid) {
        case GridLayout::Grid3x1: return QStringLiteral("3x1");
        case GridLayout::Grid2x2: return QStringLiteral("2x2");
        case GridLayout::Grid3x2: return QStringLiteral("3x2");
    }
    return QStringLiteral("2x2");
}

QString directionName(ReadingDirection direction)
{
    return direction == ReadingDirection::TopToBottom ? QStringLiteral("ttb")
                                                      : QStringLiteral("ltr");
}

QStringList gridNames()
{
    return {QStringLiteral("3x1"), QStringLiteral("2x2"), QStringLiteral("3x2")};
}

QStringList paperNames()
{
    return {QStringLiteral("A4"), QStringLiteral("Letter")};
}

} // namespace Layout
