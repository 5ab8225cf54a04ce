#pragma once

// ============================================================================
// SizeEstimatorTests - Unit tests for compact output size estimation
// ============================================================================

#include "SizeEstimator.h"

#include <QImage>
#include <QObject>
#include <QRandomGenerator>
#include <QTest>

/**
 * Unit tests for SizeEstimator.
 * Run with: pageforge --test-estimator
 */
class SizeEstimatorTests : public QObject {
    Q_OBJECT

private:
    // Noise compresses poorly, which makes size differences visible
    static QVector<QImage> noisyPages(int count, const QSize& size)
    {
        QRandomGenerator rng(42);
        QVector<QImage> pages;
        for (int i = 0; i < count; ++i) {
            QImage image(size, QImage::Format_RGB888);
            for (int y = 0; y < size.height(); ++y) {
                uchar* line = image.scanLine(y);
                for (int x = 0; x < size.width() * 3; ++x) {
                    line[x] = static_cast<uchar>(rng.bounded(256));
                }
            }
            pages.append(image);
        }
        return pages;
    }

private slots:
    void testSampleIndices() {
        QCOMPARE(SizeEstimator::sampleIndices(10, 3), QVector<int>({0, 3, 6}));
        QCOMPARE(SizeEstimator::sampleIndices(2, 3), QVector<int>({0, 1}));
        QCOMPARE(SizeEstimator::sampleIndices(1), QVector<int>({0}));
        QVERIFY(SizeEstimator::sampleIndices(0).isEmpty());
    }

    void testNoPagesIsNotAvailable() {
        SizeEstimate estimate = SizeEstimator::estimate({}, Layout::LayoutParameters());
        QVERIFY(!estimate.valid);
        QCOMPARE(estimate.text(), QString("N/A"));
    }

    void testEstimateText() {
        SizeEstimate estimate;
        estimate.valid = true;
        estimate.bytes = 1572864;      // 1.5 MiB
        QCOMPARE(estimate.text(), QString("~1.50 MB"));
    }

    void testEstimateGrowsWithQuality() {
        const QVector<QImage> pages = noisyPages(4, QSize(400, 300));

        Layout::LayoutParameters low;
        low.quality = 20;
        Layout::LayoutParameters high;
        high.quality = 95;

        SizeEstimate small = SizeEstimator::estimate(pages, low);
        SizeEstimate large = SizeEstimator::estimate(pages, high);
        QVERIFY(small.valid);
        QVERIFY(large.valid);
        QCOMPARE(small.sampledPages, 3);
        QVERIFY(large.bytes > small.bytes);
    }

    void testEstimateGrowsWithPageSize() {
        // Both sizes fit inside a 2x2 A4 cell, so neither is scaled down
        Layout::LayoutParameters params;
        const QSize cell = Layout::computeGeometry(params).cellSize;
        QVERIFY(cell.width() >= 600 && cell.height() >= 450);

        SizeEstimate small = SizeEstimator::estimate(noisyPages(3, QSize(200, 150)), params);
        SizeEstimate large = SizeEstimator::estimate(noisyPages(3, QSize(600, 450)), params);
        QVERIFY(small.valid);
        QVERIFY(large.valid);
        QCOMPARE(small.sampledPages, large.sampledPages);
        QVERIFY(large.bytes > small.bytes);
    }

    void testEstimateGrowsWithPageCount() {
        const QVector<QImage> pages = noisyPages(6, QSize(200, 200));
        Layout::LayoutParameters params;

        SizeEstimate three = SizeEstimator::estimate(pages.mid(0, 3), params);
        SizeEstimate six = SizeEstimator::estimate(pages, params);
        QVERIFY(six.bytes > three.bytes);
        QVERIFY(six.text().startsWith("~"));
        QVERIFY(six.text().endsWith(" MB"));
    }
};
