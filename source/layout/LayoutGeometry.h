#pragma once

// ============================================================================
// LayoutGeometry - N-up sheet geometry
// ============================================================================
// Converts paper size, grid, margins and reading direction into pixel boxes
// on a sheet rendered at RENDER_DPI. Every function is pure; nothing is cached.
// ============================================================================

#include <QRect>
#include <QSize>
#include <QSizeF>
#include <QString>
#include <QStringList>

namespace Layout {

/// Resolution used for rasterizing pages and composing sheets.
constexpr int RENDER_DPI = 200;

/// Smallest allowed cell edge in pixels. Smaller cells are clamped, not rejected.
constexpr int MIN_CELL_PX = 50;

enum class PaperSize {
    A4,         ///< 210 x 297 mm
    Letter      ///< 216 x 279 mm
};

enum class Orientation {
    Portrait,
    Landscape   ///< Sheet built with swapped dimensions, rotated once at the end
};

enum class GridLayout {
    Grid3x1,    ///< 1 column x 3 rows
    Grid2x2,    ///< 2 columns x 2 rows
    Grid3x2     ///< 2 columns x 3 rows
};

enum class ReadingDirection {
    LeftToRight,    ///< Fill rows first
    TopToBottom     ///< Fill columns first
};

/**
 * @brief Everything needed to compose and encode n-up sheets.
 */
struct LayoutParameters {
    GridLayout grid = GridLayout::Grid2x2;
    PaperSize paper = PaperSize::A4;
    Orientation orientation = Orientation::Portrait;
    qreal outerMarginMm = 5.0;
    qreal innerGapMm = 2.0;
    ReadingDirection direction = ReadingDirection::LeftToRight;
    bool border = true;
    int quality = 85;           ///< Lossy codec quality, 0-100

    int columns() const;
    int rows() const;
    int cellsPerSheet() const { return columns() * rows(); }
};

/**
 * @brief Pixel geometry of one sheet, computed from LayoutParameters.
 *
 * The sizes describe the sheet as it is composed (landscape already swapped),
 * before the final rotation.
 */
struct SheetGeometry {
    QSize sheetSize;        ///< Composition canvas in pixels
    QSize cellSize;         ///< Every cell has this size
    int outerPx = 0;
    int innerPx = 0;
    int columns = 1;
    int rows = 1;
    ReadingDirection direction = ReadingDirection::LeftToRight;

    int cellsPerSheet() const { return columns * rows; }

    /**
     * @brief Box of the cell at reading-order position @p cellIndex.
     * @param cellIndex 0 .. cellsPerSheet()-1
     */
    QRect cellRect(int cellIndex) const;
};

// ===== Conversions =====

/// px = round(mm * dpi / 25.4)
int mmToPx(qreal mm, int dpi = RENDER_DPI);

/// Paper dimensions in millimetres (portrait).
QSizeF paperSizeMm(PaperSize paper);

/// Sheet dimensions in millimetres after applying orientation.
QSizeF sheetSizeMm(PaperSize paper, Orientation orientation);

/**
 * @brief Compute the pixel geometry of a sheet.
 * @param params Layout to compute.
 * @param dpi Resolution, RENDER_DPI unless testing.
 */
SheetGeometry computeGeometry(const LayoutParameters& params, int dpi = RENDER_DPI);

/**
 * @brief Row and column of a reading-order cell index.
 */
void cellPosition(int cellIndex, int columns, int rows, ReadingDirection direction,
                  int* row, int* column);

// ===== Name lookup =====

/**
 * @brief Result of a name lookup.
 */
template <typename T>
struct Lookup {
    bool success = false;
    T value{};
    QString errorMessage;
};

Lookup<PaperSize> paperFromName(const QString& name);
Lookup<Orientation> orientationFromName(const QString& name);
Lookup<GridLayout> gridFromName(const QString& name);
Lookup<ReadingDirection> directionFromName(const QString& name);

QString paperName(PaperSize paper);
QString orientationName(Orientation orientation);
QString gridName(GridLayout grid);
QString directionName(ReadingDirection direction);

/// Valid names, for help text.
QStringList gridNames();
QStringList paperNames();

} // namespace Layout
