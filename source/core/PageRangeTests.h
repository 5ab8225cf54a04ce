#pragma once

// ============================================================================
// PageRangeTests - Unit tests for page range parsing
// ============================================================================

#include "PageRange.h"

#include <QObject>
#include <QTest>

/**
 * Unit tests for PageRange::parse() and PageRange::complement().
 * Run with: pageforge --test-pagerange
 */
class PageRangeTests : public QObject {
    Q_OBJECT

private slots:
    void testAllPages() {
        const QVector<int> all = {0, 1, 2, 3, 4};

        PageRange::ParseResult result = PageRange::parse("", 5);
        QVERIFY(result.success);
        QCOMPARE(result.indices, all);

        QCOMPARE(PageRange::parse("all", 5).indices, all);
        QCOMPARE(PageRange::parse("  ALL ", 5).indices, all);
        QCOMPARE(PageRange::parse("   ", 5).indices, all);
        QVERIFY(PageRange::parse("", 0).indices.isEmpty());
    }

    void testSinglesAndRanges() {
        PageRange::ParseResult result = PageRange::parse("1-3, 5", 10);
        QVERIFY(result.success);
        QCOMPARE(result.indices, QVector<int>({0, 1, 2, 4}));

        result = PageRange::parse(" 2 - 4 ,7", 10);
        QVERIFY(result.success);
        QCOMPARE(result.indices, QVector<int>({1, 2, 3, 6}));

        QCOMPARE(PageRange::parse("4-4", 10).indices, QVector<int>({3}));
    }

    void testOrderAndDuplicatesKept() {
        QCOMPARE(PageRange::parse("3,1", 5).indices, QVector<int>({2, 0}));
        QCOMPARE(PageRange::parse("1,1", 5).indices, QVector<int>({0, 0}));
        QCOMPARE(PageRange::parse("2-3,1-2", 5).indices, QVector<int>({1, 2, 0, 1}));
    }

    void testOutOfRangeDropped() {
        PageRange::ParseResult result = PageRange::parse("4-10", 5);
        QVERIFY(result.success);
        QCOMPARE(result.indices, QVector<int>({3, 4}));

        result = PageRange::parse("20", 5);
        QVERIFY(result.success);
        QVERIFY(result.indices.isEmpty());

        result = PageRange::parse("0,1", 5);
        QVERIFY(result.success);
        QCOMPARE(result.indices, QVector<int>({0}));
    }

    void testEmptyPartsIgnored() {
        PageRange::ParseResult result = PageRange::parse("1,,3,", 5);
        QVERIFY(result.success);
        QCOMPARE(result.indices, QVector<int>({0, 2}));
    }

    void testInvalidInput() {
        PageRange::ParseResult result = PageRange::parse("5-3", 10);
        QVERIFY(!result.success);
        QCOMPARE(result.error, ErrorKind::InputError);
        QVERIFY(result.errorMessage.contains("5-3"));

        result = PageRange::parse("1,abc", 10);
        QVERIFY(!result.success);
        QCOMPARE(result.error, ErrorKind::InputError);
        QVERIFY(result.errorMessage.contains("abc"));

        QVERIFY(!PageRange::parse("1-", 10).success);
        QVERIFY(!PageRange::parse("-2", 10).success);
        QVERIFY(!PageRange::parse("1-2-3", 10).success);
    }

    void testComplement() {
        QCOMPARE(PageRange::complement({1, 3}, 5), QVector<int>({0, 2, 4}));
        QCOMPARE(PageRange::complement({}, 3), QVector<int>({0, 1, 2}));
        QVERIFY(PageRange::complement({0, 1, 9}, 2).isEmpty());
    }
};
