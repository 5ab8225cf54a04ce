#pragma once

// ============================================================================
// DocumentTests - Unit tests for the Document class
// ============================================================================
// Covers loading, page edits (insert, move, remove), revert and selection.
// Pages are built in memory; no PDF backend is involved.
// ============================================================================

#include "Document.h"
#include "Page.h"

#include <QColor>
#include <QImage>
#include <QObject>
#include <QTest>

#include <atomic>

/**
 * Unit tests for Document and Page.
 * Run with: pageforge --test-document
 */
class DocumentTests : public QObject {
    Q_OBJECT

private:
    // Pages whose top-left pixel encodes their load position
    static QVector<QImage> makePages(int count, const QSize& size = QSize(100, 150))
    {
        QVector<QImage> pages;
        for (int i = 0; i < count; ++i) {
            QImage image(size, QImage::Format_RGB888);
            image.fill(QColor(i * 10, i * 10, i * 10));
            pages.append(image);
        }
        return pages;
    }

    static int marker(const QImage& image)
    {
        return QColor(image.pixel(0, 0)).red();
    }

    static bool isAllWhite(const QImage& image, const QRect& area)
    {
        for (int y = area.top(); y <= area.bottom(); ++y) {
            for (int x = area.left(); x <= area.right(); ++x) {
                if (image.pixel(x, y) != qRgb(255, 255, 255)) {
                    return false;
                }
            }
        }
        return true;
    }

    static Document loaded(int count)
    {
        Document doc;
        doc.load(makePages(count), EnhancementParameters::identity());
        return doc;
    }

private slots:
    void testLoad() {
        QVector<qreal> reported;
        Document doc;
        OperationResult result = doc.load(makePages(3), EnhancementParameters::identity(),
                                          [&reported](qreal f) { reported.append(f); });

        QVERIFY(result.success);
        QCOMPARE(doc.pageCount(), 3);
        QCOMPARE(doc.selectedIndices(), QVector<int>({0, 1, 2}));

        // Originals are kept, processed is the inverted copy
        QCOMPARE(marker(doc.original(1)), 10);
        QCOMPARE(marker(doc.processed(1)), 245);
        QCOMPARE(doc.processed(2).size(), doc.original(2).size());

        QCOMPARE(reported.size(), 3);
        QCOMPARE(reported.last(), 1.0);
    }

    void testLoadCancelledKeepsPreviousPages() {
        Document doc = loaded(2);

        std::atomic<bool> cancelled(true);
        OperationResult result = doc.load(makePages(5), EnhancementParameters(), nullptr, &cancelled);

        QVERIFY(!result.success);
        QVERIFY(result.wasCancelled());
        QCOMPARE(doc.pageCount(), 2);
    }

    void testReprocessAndRevert() {
        Document doc = loaded(3);

        OperationResult reverted = doc.revertCurrent(1);
        QVERIFY(reverted.success);
        QCOMPARE(doc.processed(1), doc.original(1));
        QCOMPARE(marker(doc.processed(0)), 255);

        QVERIFY(doc.reprocessCurrent(1, EnhancementParameters::identity()).success);
        QCOMPARE(marker(doc.processed(1)), 245);

        QCOMPARE(doc.revertCurrent(7).error, ErrorKind::InputError);
        QCOMPARE(doc.reprocessCurrent(-1, EnhancementParameters()).error, ErrorKind::InputError);

        doc.revertAll();
        for (int i = 0; i < doc.pageCount(); ++i) {
            QCOMPARE(doc.processed(i), doc.original(i));
        }

        QVERIFY(doc.reprocessAll(EnhancementParameters::identity()).success);
        QCOMPARE(marker(doc.processed(2)), 235);
    }

    void testReprocessAllCancelled() {
        Document doc = loaded(3);
        doc.revertAll();

        std::atomic<bool> cancelled(true);
        OperationResult result = doc.reprocessAll(EnhancementParameters::identity(),
                                                  nullptr, &cancelled);
        QVERIFY(result.wasCancelled());
        QCOMPARE(doc.processed(0), doc.original(0));
    }

    void testInsertBlank() {
        Document doc = loaded(2);

        QVERIFY(doc.insertBlank(1).success);
        QCOMPARE(doc.pageCount(), 3);
        QCOMPARE(doc.original(1).size(), QSize(100, 150));
        QVERIFY(isAllWhite(doc.processed(1), QRect(0, 0, 100, 150)));
        QVERIFY(doc.isSelected(1));

        // Appending at the end is allowed
        QVERIFY(doc.insertBlank(3).success);
        QCOMPARE(doc.pageCount(), 4);

        QCOMPARE(doc.insertBlank(-1).error, ErrorKind::InputError);
        QCOMPARE(doc.insertBlank(6).error, ErrorKind::InputError);
        QCOMPARE(doc.pageCount(), 4);
    }

    void testInsertIntoEmptyDocumentFails() {
        Document doc;
        QCOMPARE(doc.insertBlank(0).error, ErrorKind::InputError);
        QCOMPARE(doc.insertText(0, "hello").error, ErrorKind::InputError);
        QVERIFY(doc.isEmpty());
    }

    void testInsertText() {
        Document doc = loaded(1);

        QVERIFY(doc.insertText(0, "Chapter 2\nNotes").success);
        QCOMPARE(doc.pageCount(), 2);
        QCOMPARE(doc.original(0).size(), QSize(100, 150));

        // Text starts at the anchor, the margin above and left of it stays white
        const int anchor = Page::TEXT_ANCHOR;
        QVERIFY(isAllWhite(doc.original(0), QRect(0, 0, 100, anchor)));
        QVERIFY(isAllWhite(doc.original(0), QRect(0, 0, anchor, 150)));

        // The loaded page moved back by one
        QCOMPARE(marker(doc.original(1)), 0);
    }

    void testMove() {
        Document doc = loaded(3);

        QVERIFY(doc.move(0, 1));
        QCOMPARE(marker(doc.original(0)), 10);
        QCOMPARE(marker(doc.original(1)), 0);

        QVERIFY(doc.move(2, -1));
        QCOMPARE(marker(doc.original(1)), 20);

        // Moving past either end is a no-op
        QVERIFY(!doc.move(0, -1));
        QVERIFY(!doc.move(2, 1));
        QVERIFY(!doc.move(5, -1));
        QCOMPARE(marker(doc.original(0)), 10);
    }

    void testMoveKeepsPageRecordTogether() {
        Document doc = loaded(2);
        doc.setSelected(0, false);
        doc.revertCurrent(0);

        QVERIFY(doc.move(0, 1));
        QVERIFY(!doc.isSelected(1));
        QVERIFY(doc.isSelected(0));
        QCOMPARE(doc.processed(1), doc.original(1));
        QCOMPARE(marker(doc.processed(0)), 245);
    }

    void testRemovePage() {
        Document doc = loaded(3);

        QVERIFY(doc.removePage(1));
        QCOMPARE(doc.pageCount(), 2);
        QCOMPARE(marker(doc.original(1)), 20);

        QVERIFY(!doc.removePage(2));
        QVERIFY(doc.page(2) == nullptr);

        doc.clear();
        QVERIFY(doc.isEmpty());
    }

    void testSelectionAndProcessedPages() {
        Document doc = loaded(4);

        doc.setSelected(1, false);
        doc.toggleSelected(3);
        QCOMPARE(doc.selectedIndices(), QVector<int>({0, 2}));

        QVector<QImage> pages = doc.processedPages();
        QCOMPARE(pages.size(), 2);

        // Explicit order is kept, out-of-range entries are dropped
        pages = doc.processedPages({2, 0, 9});
        QCOMPARE(pages.size(), 2);
        QCOMPARE(marker(pages.at(0)), 235);
        QCOMPARE(marker(pages.at(1)), 255);

        pages = doc.processedPages({}, false);
        QCOMPARE(pages.size(), 4);

        doc.toggleSelected(3);
        QVERIFY(doc.isSelected(3));
        QVERIFY(!doc.isSelected(10));
    }

    void testEditSequenceKeepsPagesConsistent() {
        Document doc = loaded(3);

        QVERIFY(doc.insertBlank(0).success);
        QVERIFY(doc.insertText(doc.pageCount(), "end").success);
        doc.move(0, 1);
        doc.move(doc.pageCount() - 1, -1);
        doc.move(doc.pageCount() - 1, 1);
        QVERIFY(doc.revertCurrent(0).success);
        QVERIFY(doc.revertCurrent(doc.pageCount() - 1).success);
        QVERIFY(doc.insertBlank(doc.pageCount()).success);
        doc.removePage(2);

        QCOMPARE(doc.pageCount(), 5);
        for (int i = 0; i < doc.pageCount(); ++i) {
            const Page* page = doc.page(i);
            QVERIFY(page != nullptr);
            QCOMPARE(page->processed.size(), page->original.size());
        }
        QCOMPARE(doc.processedPages({}, false).size(), doc.pageCount());
        QCOMPARE(doc.selectedIndices().size(), doc.pageCount());
    }

    void testRevertThenReprocessRestoresPage() {
        Document doc = loaded(2);
        const QImage before = doc.processed(1);

        doc.revertAll();
        QVERIFY(doc.processed(1) != before);

        QVERIFY(doc.reprocessAll(EnhancementParameters::identity()).success);
        QCOMPARE(doc.processed(1), before);
    }

    void testPageFactories() {
        Page blank = Page::createBlank(QSize(30, 40));
        QCOMPARE(blank.size(), QSize(30, 40));
        QCOMPARE(blank.original.format(), QImage::Format_RGB888);
        QVERIFY(blank.selected);
        QCOMPARE(blank.processed, blank.original);

        Page empty;
        QVERIFY(empty.isNull());
    }
};
