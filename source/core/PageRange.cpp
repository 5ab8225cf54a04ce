// ============================================================================
// PageRange - Implementation
// ============================================================================

#include "PageRange.h"

#include <QDebug>
#include <QRegularExpression>
#include <QSet>
#include <QStringList>

namespace PageRange {

static ParseResult invalidToken(const QString& token)
{
    ParseResult result;
    result.error = ErrorKind::InputError;
    result.errorMessage = QStringLiteral("Invalid page range part: \"%1\"").arg(token);
    qWarning() << "[PageRange]" << result.errorMessage;
    return result;
}

ParseResult parse(const QString& rangeString, int totalPages)
{
    ParseResult result;
    result.success = true;

    const QString range = rangeString.trimmed().toLower();

    // Empty or "all" means all pages
    if (range.isEmpty() || range == QLatin1String("all")) {
        result.indices.reserve(qMax(0, totalPages));
        for (int i = 0; i < totalPages; ++i) {
            result.indices.append(i);
        }
        return result;
    }

    static const QRegularExpression rangePattern(QStringLiteral("^\\s*(\\d+)\\s*-\\s*(\\d+)\\s*$"));
    static const QRegularExpression singlePattern(QStringLiteral("^\\s*(\\d+)\\s*$"));

    const QStringList parts = range.split(QLatin1Char(','));
    for (const QString& rawPart : parts) {
        const QString part = rawPart.trimmed();
        if (part.isEmpty()) {
            continue;
        }

        // Range (e.g. "1-10")
        QRegularExpressionMatch rangeMatch = rangePattern.match(part);
        if (rangeMatch.hasMatch()) {
            bool startOk = false;
            bool endOk = false;
            const int start = rangeMatch.captured(1).toInt(&startOk);
            const int end = rangeMatch.captured(2).toInt(&endOk);
            if (!startOk || !endOk || start > end) {
                return invalidToken(part);
            }

            // Keep only the part that overlaps the document
            const int first = qMax(1, start);
            const int last = qMin(end, totalPages);
            for (int page = first; page <= last; ++page) {
                result.indices.append(page - 1);
            }
            continue;
        }

        // Single page (e.g. "15")
        QRegularExpressionMatch singleMatch = singlePattern.match(part);
        if (singleMatch.hasMatch()) {
            bool ok = false;
            const int page = singleMatch.captured(1).toInt(&ok);
            if (!ok) {
                return invalidToken(part);
            }
            if (page >= 1 && page <= totalPages) {
                result.indices.append(page - 1);
            }
            continue;
        }

        return invalidToken(part);
    }

    return result;
}

QVector<int> complement(const QVector<int>& excluded, int totalPages)
{
    QSet<int> skip;
    for (int index : excluded) {
        skip.insert(index);
    }

    QVector<int> result;
    for (int i = 0; i < totalPages; ++i) {
        if (!skip.contains(i)) {
            result.append(i);
        }
    }
    return result;
}

} // namespace PageRange
