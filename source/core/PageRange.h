#pragma once

// ============================================================================
// PageRange - Page selection expressions
// ============================================================================
// Parses user supplied page selections such as "1-4,6,8-9" into 0-based
// page indices. Used by the CLI (--pages, --exclude) and by batch export.
// ============================================================================

#include "OperationResult.h"

#include <QString>
#include <QVector>

namespace PageRange {

/**
 * @brief Result of parsing a page range expression.
 */
struct ParseResult {
    bool success = false;
    QVector<int> indices;               ///< 0-based, in input order
    ErrorKind error = ErrorKind::None;
    QString errorMessage;
};

/**
 * @brief Parse a page range expression.
 * @param rangeString Comma separated 1-based pages and inclusive "a-b" ranges.
 *                    Empty, blank or "all" selects every page.
 * @param totalPages Number of pages in the document.
 * @return Indices in the order they were written. Duplicates are kept.
 *         Pages beyond the document are dropped silently. Malformed tokens
 *         (non-numeric, reversed, dangling dash) fail with InputError.
 */
ParseResult parse(const QString& rangeString, int totalPages);

/**
 * @brief All indices in [0, totalPages) that are not in @p excluded.
 */
QVector<int> complement(const QVector<int>& excluded, int totalPages);

} // namespace PageRange
