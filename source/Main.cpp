// ============================================================================
// PageForge - Main Entry Point
// ============================================================================

#include <QGuiApplication>
#include <QTranslator>
#include <QLocale>
#include <QStandardPaths>
#include <QTest>

#include "cli/CliParser.h"

// Test includes
#include "core/EnhancementPipelineTests.h"
#include "core/DocumentTests.h"
#include "core/PageRangeTests.h"
#include "core/AppSettingsTests.h"
#include "layout/LayoutGeometryTests.h"
#include "layout/SheetComposerTests.h"
#include "layout/SizeEstimatorTests.h"
#include "pdf/ImageCodecTests.h"
#include "pdf/MuPdfExporterTests.h"
#include "batch/BatchOperationsTests.h"
#include "cli/CliProgressTests.h"

#include <QDebug>

// ============================================================================
// Translation Loading
// ============================================================================

static void loadTranslations(QGuiApplication& app, QTranslator& translator)
{
    const QString langCode = QLocale::system().name().section('_', 0, 0);

    QStringList translationPaths = {
        QCoreApplication::applicationDirPath(),
        QCoreApplication::applicationDirPath() + "/translations",
        "/usr/share/pageforge/translations",
        "/usr/local/share/pageforge/translations",
        QStandardPaths::locate(QStandardPaths::GenericDataLocation,
                               "pageforge/translations", QStandardPaths::LocateDirectory)
    };

    for (const QString& path : translationPaths) {
        if (translator.load(path + "/app_" + langCode + ".qm")) {
            app.installTranslator(&translator);
            break;
        }
    }
}

// ============================================================================
// Test Runners
// ============================================================================

template <typename T>
static int runSuite()
{
    T tests;
    return QTest::qExec(&tests);
}

static int runTests(const QString& testType)
{
    if (testType == "geometry")    return runSuite<LayoutGeometryTests>();
    if (testType == "enhancement") return runSuite<EnhancementPipelineTests>();
    if (testType == "pagerange")   return runSuite<PageRangeTests>();
    if (testType == "document")    return runSuite<DocumentTests>();
    if (testType == "composer")    return runSuite<SheetComposerTests>();
    if (testType == "estimator")   return runSuite<SizeEstimatorTests>();
    if (testType == "codec")       return runSuite<ImageCodecTests>();
    if (testType == "exporter")    return runSuite<MuPdfExporterTests>();
    if (testType == "settings")    return runSuite<AppSettingsTests>();
    if (testType == "batch")       return runSuite<BatchOperationsTests>();
    if (testType == "cli")         return runSuite<CliProgressTests>();

    if (testType == "all") {
        int failures = 0;
        for (const char* suite : {"geometry", "enhancement", "pagerange", "document",
                                  "composer", "estimator", "codec", "exporter",
                                  "settings", "batch", "cli"}) {
            failures += runTests(QString::fromLatin1(suite)) != 0 ? 1 : 0;
        }
        return failures == 0 ? 0 : 1;
    }

    qWarning() << "[Main] Unknown test suite:" << testType;
    return 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    // Text pages are painted with fonts, which need a platform plugin even
    // without a display
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }

    QGuiApplication app(argc, argv);
    app.setOrganizationName("PageForge");
    app.setApplicationName("PageForge");
#ifdef PAGEFORGE_VERSION
    app.setApplicationVersion(PAGEFORGE_VERSION);
#endif

    QTranslator translator;
    loadTranslations(app, translator);

    // ========== Test Commands ==========
    if (argc >= 2) {
        const QString arg = QString::fromLocal8Bit(argv[1]);
        if (arg.startsWith("--test-")) {
            return runTests(arg.mid(7));
        }
    }

    return Cli::run(app, argc, argv);
}
