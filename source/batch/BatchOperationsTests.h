#ifndef BATCHOPERATIONSTESTS_H
#define BATCHOPERATIONSTESTS_H

/**
 * @file BatchOperationsTests.h
 * @brief Unit tests for headless PDF conversion.
 *
 * Input PDFs are generated with MuPdfExporter from in-memory pages, then
 * converted and reopened through PdfProvider.
 *
 * Run with: pageforge --test-batch
 */

#include "BatchOperations.h"
#include "../pdf/MuPdfExporter.h"
#include "../pdf/PdfProvider.h"

#include <QDir>
#include <QFile>
#include <QImage>
#include <QObject>
#include <QTemporaryDir>
#include <QTest>

#include <memory>

class BatchOperationsTests : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_dir;

    // Dark scans: black pages with a white bar
    QString makeInput(const QString& name, int pages)
    {
        QVector<QImage> images;
        for (int i = 0; i < pages; ++i) {
            QImage image(170, 220, QImage::Format_RGB888);
            image.fill(Qt::black);
            for (int y = 100; y < 110; ++y) {
                for (int x = 20; x < 150; ++x) {
                    image.setPixel(x, y, qRgb(255, 255, 255));
                }
            }
            images.append(image);
        }

        PdfExportOptions options;
        options.outputPath = m_dir.filePath(name);
        options.dpi = 72;
        MuPdfExporter exporter;
        const PdfExportResult result = exporter.exportImages(images, options);
        return result.success ? options.outputPath : QString();
    }

    static int pageCountOf(const QString& path)
    {
        std::unique_ptr<PdfProvider> pdf = PdfProvider::create(path);
        return pdf ? pdf->pageCount() : -1;
    }

    QString freshDir(const QString& name)
    {
        const QString path = m_dir.filePath(name);
        QDir(path).removeRecursively();
        return path;
    }

private slots:
    void initTestCase() {
        QVERIFY(m_dir.isValid());
    }

    void testGenerateOutputPath() {
        QCOMPARE(BatchOps::generateOutputPath("/scans/notes.pdf", "/out", "_converted.pdf"),
                 QString("/out/notes_converted.pdf"));
        QCOMPARE(BatchOps::generateOutputPath("/scans/week.1.pdf", "/out/", "_converted.pdf"),
                 QString("/out/week.1_converted.pdf"));
    }

    void testIsSingleFileOutput() {
        QVERIFY(BatchOps::isSingleFileOutput("/out/result.pdf", ".pdf"));
        QVERIFY(BatchOps::isSingleFileOutput("/out/RESULT.PDF", ".pdf"));
        QVERIFY(!BatchOps::isSingleFileOutput("/out/", ".pdf"));
        QVERIFY(!BatchOps::isSingleFileOutput("/out/folder", ".pdf"));
        QVERIFY(!BatchOps::isSingleFileOutput("", ".pdf"));
    }

    void testConvertFile() {
        const QString input = makeInput("single.pdf", 3);
        QVERIFY(!input.isEmpty());
        const QString output = m_dir.filePath("single_out.pdf");

        BatchOps::ConvertOptions options;
        options.params = EnhancementParameters::identity();
        BatchOps::FileResult fr = BatchOps::convertFile(input, output, options);

        QVERIFY2(fr.status == BatchOps::FileStatus::Success, qPrintable(fr.message));
        QCOMPARE(fr.pagesProcessed, 3);
        QVERIFY(fr.outputSize > 0);
        QCOMPARE(pageCountOf(output), 3);

        // Page 1 is inverted: the background turns white
        std::unique_ptr<PdfProvider> pdf = PdfProvider::create(output);
        QImage rendered = pdf->renderPageToImage(0, 72);
        QVERIFY(qGray(rendered.pixel(5, 5)) > 240);
    }

    void testConvertFileWithPageRange() {
        const QString input = makeInput("ranged.pdf", 5);
        const QString output = m_dir.filePath("ranged_out.pdf");

        BatchOps::ConvertOptions options;
        options.pageRange = "2-3";
        BatchOps::FileResult fr = BatchOps::convertFile(input, output, options);
        QCOMPARE(fr.status, BatchOps::FileStatus::Success);
        QCOMPARE(pageCountOf(output), 2);

        options.pageRange = "4-2";
        fr = BatchOps::convertFile(input, m_dir.filePath("bad_range.pdf"), options);
        QCOMPARE(fr.status, BatchOps::FileStatus::Error);
        QCOMPARE(fr.error, ErrorKind::InputError);

        options.pageRange = "9";
        fr = BatchOps::convertFile(input, m_dir.filePath("no_pages.pdf"), options);
        QCOMPARE(fr.status, BatchOps::FileStatus::Error);
        QCOMPARE(fr.error, ErrorKind::EmptySelection);
        QVERIFY(!QFile::exists(m_dir.filePath("no_pages.pdf")));
    }

    void testConvertFileCompact() {
        const QString input = makeInput("compact.pdf", 5);
        const QString output = m_dir.filePath("compact_out.pdf");

        BatchOps::ConvertOptions options;
        options.compact = true;
        options.layout.grid = Layout::GridLayout::Grid2x2;
        options.layout.quality = 70;

        BatchOps::FileResult fr = BatchOps::convertFile(input, output, options);
        QVERIFY2(fr.status == BatchOps::FileStatus::Success, qPrintable(fr.message));
        QCOMPARE(fr.pagesProcessed, 2);

        // Sheets are A4 portrait
        std::unique_ptr<PdfProvider> pdf = PdfProvider::create(output);
        QVERIFY(pdf);
        QCOMPARE(pdf->pageCount(), 2);
        QVERIFY(qAbs(pdf->pageSize(0).width() - 595.4) < 1.0);

        options.maxSheets = 1;
        fr = BatchOps::convertFile(input, m_dir.filePath("compact_preview.pdf"), options);
        QCOMPARE(fr.pagesProcessed, 1);
    }

    void testMissingInput() {
        BatchOps::FileResult fr = BatchOps::convertFile(m_dir.filePath("nope.pdf"),
                                                        m_dir.filePath("nope_out.pdf"),
                                                        BatchOps::ConvertOptions());
        QCOMPARE(fr.status, BatchOps::FileStatus::Error);
        QCOMPARE(fr.error, ErrorKind::ResourceError);
    }

    void testBatchToDirectory() {
        const QString a = makeInput("alpha.pdf", 2);
        const QString b = makeInput("beta.pdf", 1);
        const QString outDir = freshDir("batch_out");

        BatchOps::ConvertOptions options;
        options.outputPath = outDir;

        QStringList progressFiles;
        BatchOps::BatchResult result = BatchOps::convertBatch(
            {a, b}, options,
            [&progressFiles](int, int, const QString& file, const QString&) {
                progressFiles << file;
            });

        QCOMPARE(result.successCount, 2);
        QVERIFY(result.allSucceeded());
        QCOMPARE(progressFiles, QStringList({a, b}));
        QCOMPARE(pageCountOf(outDir + "/alpha_converted.pdf"), 2);
        QCOMPARE(pageCountOf(outDir + "/beta_converted.pdf"), 1);

        // Second run skips existing outputs
        result = BatchOps::convertBatch({a, b}, options);
        QCOMPARE(result.skippedCount, 2);
        QCOMPARE(result.successCount, 0);

        options.overwrite = true;
        result = BatchOps::convertBatch({a, b}, options);
        QCOMPARE(result.successCount, 2);
    }

    void testBatchPartialFailure() {
        const QString good = makeInput("good.pdf", 1);
        const QString outDir = freshDir("partial_out");

        BatchOps::ConvertOptions options;
        options.outputPath = outDir;
        BatchOps::BatchResult result = BatchOps::convertBatch(
            {good, m_dir.filePath("missing.pdf")}, options);

        QCOMPARE(result.successCount, 1);
        QCOMPARE(result.errorCount, 1);
        QVERIFY(result.hasErrors());
        QCOMPARE(result.results.at(1).status, BatchOps::FileStatus::Error);
    }

    void testBatchDryRun() {
        const QString input = makeInput("dry.pdf", 4);
        const QString outDir = freshDir("dry_out");

        BatchOps::ConvertOptions options;
        options.outputPath = outDir;
        options.dryRun = true;
        BatchOps::BatchResult result = BatchOps::convertBatch({input}, options);

        QCOMPARE(result.successCount, 1);
        QCOMPARE(result.results.at(0).pagesProcessed, 4);
        QVERIFY(!QDir(outDir).exists());
    }

    void testBatchSingleFileOutput() {
        const QString input = makeInput("one.pdf", 2);
        const QString output = m_dir.filePath("exact_name.pdf");
        QFile::remove(output);

        BatchOps::ConvertOptions options;
        options.outputPath = output;
        BatchOps::BatchResult result = BatchOps::convertBatch({input}, options);
        QCOMPARE(result.successCount, 1);
        QCOMPARE(result.results.at(0).outputPath, output);
        QCOMPARE(pageCountOf(output), 2);
    }

    void testBatchStopsWhenResultCallbackDeclines() {
        const QString a = makeInput("stop_a.pdf", 1);
        const QString b = makeInput("stop_b.pdf", 1);
        const QString outDir = freshDir("stop_out");

        BatchOps::ConvertOptions options;
        options.outputPath = outDir;
        BatchOps::BatchResult result = BatchOps::convertBatch(
            {m_dir.filePath("missing.pdf"), a, b}, options, nullptr, nullptr,
            [](int, int, const BatchOps::FileResult& fr) {
                return fr.status != BatchOps::FileStatus::Error;
            });

        QCOMPARE(result.totalCount(), 1);
        QCOMPARE(result.errorCount, 1);
        QVERIFY(!QFile::exists(outDir + "/stop_a_converted.pdf"));
    }

    void testBatchCancelled() {
        const QString input = makeInput("cancel.pdf", 1);
        const QString outDir = freshDir("cancel_out");

        std::atomic<bool> cancelled(true);
        BatchOps::ConvertOptions options;
        options.outputPath = outDir;
        BatchOps::BatchResult result = BatchOps::convertBatch({input}, options, nullptr, &cancelled);

        QCOMPARE(result.skippedCount, 1);
        QCOMPARE(result.results.at(0).error, ErrorKind::Cancelled);
    }

    void testExportDocumentEmptySelection() {
        Document doc;
        QVector<QImage> pages;
        QImage page(50, 50, QImage::Format_RGB888);
        page.fill(Qt::black);
        pages << page << page;
        QVERIFY(doc.load(pages, EnhancementParameters()).success);
        doc.setSelected(0, false);
        doc.setSelected(1, false);

        const QString output = m_dir.filePath("nothing.pdf");
        PdfExportResult result = BatchOps::exportDocument(doc, {}, BatchOps::ConvertOptions(),
                                                          output);
        QCOMPARE(result.error, ErrorKind::EmptySelection);
        QVERIFY(!QFile::exists(output));

        BatchOps::ConvertOptions compact;
        compact.compact = true;
        result = BatchOps::exportDocument(doc, {}, compact, output);
        QCOMPARE(result.error, ErrorKind::EmptySelection);
    }
};

#endif // BATCHOPERATIONSTESTS_H
