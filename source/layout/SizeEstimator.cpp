// ============================================================================
// SizeEstimator - Implementation
// ============================================================================

#include "SizeEstimator.h"
#include "SheetComposer.h"
#include "../pdf/ImageCodec.h"

#include <QDebug>

QString SizeEstimate::text() const
{
    if (!valid) {
        return QStringLiteral("N/A");
    }
    return QStringLiteral("~%1 MB").arg(megabytes(), 0, 'f', 2);
}

namespace SizeEstimator {

QVector<int> sampleIndices(int pageCount, int sampleCount)
{
    QVector<int> indices;
    const int count = qMin(qMax(0, sampleCount), qMax(0, pageCount));
    for (int i = 0; i < count; ++i) {
        indices.append(static_cast<int>((static_cast<qint64>(i) * pageCount) / count));
    }
    return indices;
}

SizeEstimate estimate(const QVector<QImage>& pages,
                      const Layout::LayoutParameters& layout,
                      int sampleCount)
{
    SizeEstimate result;

    const QVector<int> samples = sampleIndices(pages.size(), sampleCount);
    if (samples.isEmpty()) {
        return result;
    }

    const QSize cell = Layout::computeGeometry(layout).cellSize;

    qint64 totalBytes = 0;
    int measured = 0;
    for (int index : samples) {
        const QImage fitted = SheetComposer::fitToCell(pages.at(index), cell);
        const QByteArray encoded = ImageCodec::encodeJpeg(fitted, layout.quality);
        if (encoded.isEmpty()) {
            continue;
        }
        totalBytes += encoded.size();
        ++measured;
    }

    if (measured == 0) {
        qWarning() << "[SizeEstimator] No sample could be encoded";
        return result;
    }

    const qreal average = static_cast<qreal>(totalBytes) / measured;
    result.valid = true;
    result.sampledPages = measured;
    result.bytes = static_cast<qint64>(average * pages.size() * OVERHEAD_FACTOR);

    qDebug() << "[SizeEstimator]" << measured << "samples, avg" << average
             << "bytes ->" << result.text();
    return result;
}

} // namespace SizeEstimator
