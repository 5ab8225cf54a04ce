#ifndef CLIPROGRESSTESTS_H
#define CLIPROGRESSTESTS_H

/**
 * @file CliProgressTests.h
 * @brief Unit tests for console output and the stop signal.
 *
 * ConsoleProgress writes into QBuffers here so each mode's text can be
 * compared line by line.
 *
 * Run with: pageforge --test-cli
 */

#include "CliProgress.h"
#include "CliSignal.h"

#include <QBuffer>
#include <QJsonDocument>
#include <QJsonObject>
#include <QObject>
#include <QTest>

#include <csignal>

class CliProgressTests : public QObject {
    Q_OBJECT

private:
    QBuffer m_out;
    QBuffer m_err;

    QString out() const { return QString::fromUtf8(m_out.data()); }
    QString err() const { return QString::fromUtf8(m_err.data()); }

    static QJsonObject jsonLine(const QString& text)
    {
        return QJsonDocument::fromJson(text.trimmed().toUtf8()).object();
    }

    static BatchOps::FileResult converted(int count, bool sheets, qint64 bytes)
    {
        BatchOps::FileResult fr;
        fr.inputPath = QStringLiteral("/scans/in/scan.pdf");
        fr.outputPath = QStringLiteral("/scans/out/scan_converted.pdf");
        fr.status = BatchOps::FileStatus::Success;
        fr.pagesProcessed = count;
        fr.countsSheets = sheets;
        fr.outputSize = bytes;
        return fr;
    }

private slots:
    void init() {
        m_out.close();
        m_err.close();
        m_out.setData(QByteArray());
        m_err.setData(QByteArray());
        QVERIFY(m_out.open(QIODevice::ReadWrite));
        QVERIFY(m_err.open(QIODevice::ReadWrite));
    }

    void testDescribeCount() {
        QCOMPARE(Cli::ConsoleProgress::describeCount(1, false), QString("1 page"));
        QCOMPARE(Cli::ConsoleProgress::describeCount(12, false), QString("12 pages"));
        QCOMPARE(Cli::ConsoleProgress::describeCount(1, true), QString("1 sheet"));
        QCOMPARE(Cli::ConsoleProgress::describeCount(3, true), QString("3 sheets"));
    }

    void testFormatBytes() {
        QCOMPARE(Cli::ConsoleProgress::formatBytes(812), QString("812 B"));
        QCOMPARE(Cli::ConsoleProgress::formatBytes(36045), QString("35.2 KB"));
        QCOMPARE(Cli::ConsoleProgress::formatBytes(1468006), QString("1.40 MB"));
    }

    void testSimpleFileLines() {
        Cli::ConsoleProgress progress(Cli::OutputMode::Simple, &m_out, &m_err);

        progress.reportFile(1, 3, converted(12, false, 1468006));
        progress.reportFile(2, 3, converted(3, true, 812));

        BatchOps::FileResult skipped;
        skipped.inputPath = QStringLiteral("/scans/old.pdf");
        skipped.status = BatchOps::FileStatus::Skipped;
        skipped.message = QStringLiteral("Output file already exists");
        progress.reportFile(3, 3, skipped);

        const QStringList lines = out().split('\n', Qt::SkipEmptyParts);
        QCOMPARE(lines.size(), 3);
        QCOMPARE(lines.at(0), QString("[1/3] scan.pdf -> scan_converted.pdf: 12 pages, 1.40 MB"));
        QCOMPARE(lines.at(1), QString("[2/3] scan.pdf -> scan_converted.pdf: 3 sheets, 812 B"));
        QCOMPARE(lines.at(2), QString("[3/3] old.pdf: skipped, Output file already exists"));
        QVERIFY(err().isEmpty());
    }

    void testSummaryLine() {
        BatchOps::BatchResult single;
        single.successCount = 1;

        Cli::ConsoleProgress simple(Cli::OutputMode::Simple, &m_out, &m_err);
        simple.reportSummary(single, false);
        QVERIFY(out().isEmpty());

        BatchOps::BatchResult batch;
        batch.successCount = 2;
        batch.skippedCount = 1;
        batch.errorCount = 1;
        batch.totalOutputSize = 2048;
        batch.elapsedMs = 4200;
        simple.reportSummary(batch, false);
        QCOMPARE(out(), QString("Converted 2 of 4 files, 1 skipped, 1 failed, 2.0 KB in 4.2 s\n"));

        init();
        Cli::ConsoleProgress verbose(Cli::OutputMode::Verbose, &m_out, &m_err);
        verbose.reportSummary(single, true);
        QCOMPARE(out(), QString("Dry run: 1 of 1 files would be converted in 0.0 s\n"));
    }

    void testJsonEvents() {
        Cli::ConsoleProgress progress(Cli::OutputMode::Json, &m_out, &m_err);

        progress.reportFile(2, 5, converted(3, true, 4096));
        QJsonObject file = jsonLine(out());
        QCOMPARE(file.value("event").toString(), QString("file"));
        QCOMPARE(file.value("status").toString(), QString("converted"));
        QCOMPARE(file.value("sheets").toInt(), 3);
        QVERIFY(!file.contains("pages"));
        QCOMPARE(file.value("index").toInt(), 2);
        QCOMPARE(file.value("bytes").toInteger(), qint64(4096));

        progress.reportError(QStringLiteral("Input \"a.pdf\" not found"));
        QJsonObject error = jsonLine(err());
        QCOMPARE(error.value("event").toString(), QString("error"));
        QCOMPARE(error.value("message").toString(), QString("Input \"a.pdf\" not found"));
    }

    void testPageProgressOnlyInVerbose() {
        Cli::ConsoleProgress simple(Cli::OutputMode::Simple, &m_out, &m_err);
        ::ProgressCallback quiet = simple.pageCallback(QStringLiteral("Loading"));
        quiet(0.5);
        quiet(1.0);
        QVERIFY(out().isEmpty());

        Cli::ConsoleProgress verbose(Cli::OutputMode::Verbose, &m_out, &m_err);
        ::ProgressCallback loud = verbose.pageCallback(QStringLiteral("Loading"));
        loud(0.0);
        loud(0.5);
        loud(0.504);    // same percentage, not redrawn
        loud(1.0);
        QCOMPARE(out(), QString("\r  Loading    0%\r  Loading   50%\r  Loading  100%\n"));
    }

    void testInterruptedPageLineIsClosed() {
        Cli::ConsoleProgress verbose(Cli::OutputMode::Verbose, &m_out, &m_err);
        ::ProgressCallback page = verbose.pageCallback(QStringLiteral("Exporting"));
        page(0.25);
        verbose.reportFile(1, 1, converted(1, false, 0));
        QVERIFY(out().startsWith("\r  Exporting   25%\n[1/1] scan.pdf"));
        QVERIFY(out().contains("      to   /scans/out/scan_converted.pdf\n"));
    }

    void testEstimateLine() {
        Cli::ConsoleProgress progress(Cli::OutputMode::Simple, &m_out, &m_err);

        SizeEstimate estimate;
        estimate.valid = true;
        estimate.bytes = 1468006;
        estimate.sampledPages = 3;
        progress.reportEstimate(QStringLiteral("/scans/scan.pdf"), estimate, 10, 3);

        SizeEstimate none;
        progress.reportEstimate(QStringLiteral("/scans/scan.pdf"), none, 0, 0);

        QCOMPARE(out(), QString("Estimated size: ~1.40 MB (10 pages on 3 sheets)\n"
                                "Estimated size: N/A (no pages selected)\n"));
    }

    void testPresetListing() {
        AppSettings settings;
        Cli::ConsoleProgress progress(Cli::OutputMode::Simple, &m_out, &m_err);
        progress.reportPresets(settings);
        QCOMPARE(out(), QString("No presets saved.\n"));

        init();
        settings.savePreset(QStringLiteral("night"), EnhancementParameters());
        settings.savePreset(QStringLiteral("light"), EnhancementParameters::identity());
        settings.lastPreset = QStringLiteral("night");
        progress.reportPresets(settings);

        const QStringList lines = out().split('\n', Qt::SkipEmptyParts);
        QCOMPARE(lines.size(), 2);
        QVERIFY(lines.at(0).startsWith("  light: "));
        QCOMPARE(lines.at(1), QString("* night: c=1.20 b=1.00 s=1.00 gray"));
    }

    void testStopSignalRaisesFlag() {
        QVERIFY(!Cli::stopRequested());
        QVERIFY(Cli::stopSignalName().isEmpty());

        Cli::installSignalHandlers();
        std::raise(SIGTERM);

        QVERIFY(Cli::stopRequested());
        QVERIFY(Cli::stopFlag()->load());
        QCOMPARE(Cli::stopSignalName(), QString("SIGTERM"));

        Cli::ConsoleProgress progress(Cli::OutputMode::Simple, &m_out, &m_err);
        progress.reportStopped(Cli::stopSignalName());
        QCOMPARE(err(), QString("Stopped by SIGTERM. No partial output was written.\n"));
        QVERIFY(out().isEmpty());
    }
};

#endif // CLIPROGRESSTESTS_H
