#include "CliHandler.h"
#include "CliProgress.h"
#include "CliSignal.h"
#include "../core/AppSettings.h"
#include "../core/Document.h"
#include "../core/PageRange.h"
#include "../layout/LayoutGeometry.h"
#include "../layout/SheetComposer.h"
#include "../layout/SizeEstimator.h"
#include "../pdf/DocumentLoader.h"

#include <QCoreApplication>
#include <QFileInfo>
#include <QFile>
#include <QDir>
#include <QDebug>

/**
 * @file CliHandler.cpp
 * @brief Implementation of CLI command handlers.
 *
 * @see CliHandler.h for API documentation
 */

namespace Cli {

// =============================================================================
// Helper Functions
// =============================================================================

OutputMode getOutputMode(const QCommandLineParser& parser)
{
    if (parser.isSet(QStringLiteral("json"))) {
        return OutputMode::Json;
    }
    if (parser.isSet(QStringLiteral("verbose"))) {
        return OutputMode::Verbose;
    }
    return OutputMode::Simple;
}

int exitCodeFromResult(const BatchOps::BatchResult& result)
{
    if (result.totalCount() == 0) {
        // No files processed - treat as error
        return ExitCode::InvalidArgs;
    }
    if (result.errorCount == 0) {
        return ExitCode::Success;
    }
    if (result.successCount == 0 && result.skippedCount == 0) {
        // All files failed
        return ExitCode::TotalFailure;
    }
    // Some files failed
    return ExitCode::PartialFailure;
}

int exitCodeFromError(ErrorKind error)
{
    switch (error) {
        case ErrorKind::None:          return ExitCode::Success;
        case ErrorKind::InputError:    return ExitCode::InvalidArgs;
        case ErrorKind::ResourceError: return ExitCode::IoError;
        case ErrorKind::Cancelled:     return ExitCode::Cancelled;
        default:                       return ExitCode::TotalFailure;
    }
}

static QString settingsPath(const QCommandLineParser& parser)
{
    const QString path = parser.value(QStringLiteral("settings"));
    return path.isEmpty() ? AppSettings::defaultPath() : path;
}

static QString absolutePath(const QString& path)
{
    return QDir::cleanPath(QDir::current().absoluteFilePath(path));
}

static bool parseFactor(const QCommandLineParser& parser, const QString& name,
                        qreal* value, ConsoleProgress& progress)
{
    if (!parser.isSet(name)) {
        return true;
    }
    bool ok = false;
    const qreal parsed = parser.value(name).toDouble(&ok);
    if (!ok || parsed < 0.0) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Invalid value for --%1: \"%2\"").arg(name, parser.value(name)));
        return false;
    }
    *value = parsed;
    return true;
}

/**
 * Resolve enhancement parameters in order: saved current settings, --preset,
 * --auto-optimize, explicit factors, --color. --save-preset stores the result.
 */
static bool resolveParameters(const QCommandLineParser& parser, AppSettings& settings,
                              EnhancementParameters* params, ConsoleProgress& progress)
{
    EnhancementParameters resolved = settings.current;

    if (parser.isSet(QStringLiteral("preset"))) {
        const QString name = parser.value(QStringLiteral("preset"));
        if (!settings.hasPreset(name)) {
            progress.reportError(QCoreApplication::translate("CLI",
                "Unknown preset: \"%1\". Available: %2")
                .arg(name, settings.presetNames().join(QStringLiteral(", "))));
            return false;
        }
        resolved = settings.preset(name);
        settings.lastPreset = name;
    }

    if (parser.isSet(QStringLiteral("auto-optimize"))) {
        resolved = AppSettings::autoOptimizeParameters();
        settings.lastPreset = AppSettings::AUTO_OPTIMIZE_PRESET;
    }

    if (!parseFactor(parser, QStringLiteral("contrast"), &resolved.contrast, progress) ||
        !parseFactor(parser, QStringLiteral("brightness"), &resolved.brightness, progress) ||
        !parseFactor(parser, QStringLiteral("sharpness"), &resolved.sharpness, progress)) {
        return false;
    }

    if (parser.isSet(QStringLiteral("color"))) {
        resolved.grayscale = false;
    }

    resolved = resolved.clamped();

    if (parser.isSet(QStringLiteral("save-preset"))) {
        const QString name = parser.value(QStringLiteral("save-preset")).trimmed();
        if (name.isEmpty()) {
            progress.reportError(QCoreApplication::translate("CLI", "Preset name is empty."));
            return false;
        }
        settings.savePreset(name, resolved);
        settings.lastPreset = name;
        if (!settings.save(settingsPath(parser))) {
            progress.reportWarning(QCoreApplication::translate("CLI",
                "Could not save preset \"%1\".").arg(name));
        }
    }

    *params = resolved;
    return true;
}

static bool parseQuality(const QCommandLineParser& parser, int* quality,
                         ConsoleProgress& progress)
{
    if (parser.value(QStringLiteral("quality")).isEmpty()) {
        return true;
    }
    bool ok = false;
    const int parsed = parser.value(QStringLiteral("quality")).toInt(&ok);
    if (!ok || parsed < 0 || parsed > 100) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Quality must be between 0 and 100, got \"%1\"")
            .arg(parser.value(QStringLiteral("quality"))));
        return false;
    }
    *quality = parsed;
    return true;
}

static bool resolveLayout(const QCommandLineParser& parser, Layout::LayoutParameters* layout,
                          ConsoleProgress& progress)
{
    Layout::LayoutParameters resolved;

    const auto grid = Layout::gridFromName(parser.value(QStringLiteral("layout")));
    const auto paper = Layout::paperFromName(parser.value(QStringLiteral("paper")));
    const auto orientation = Layout::orientationFromName(parser.value(QStringLiteral("orientation")));
    const auto direction = Layout::directionFromName(parser.value(QStringLiteral("direction")));

    for (const QString& error : {grid.errorMessage, paper.errorMessage,
                                 orientation.errorMessage, direction.errorMessage}) {
        if (!error.isEmpty()) {
            progress.reportError(error);
            return false;
        }
    }
    resolved.grid = grid.value;
    resolved.paper = paper.value;
    resolved.orientation = orientation.value;
    resolved.direction = direction.value;

    bool marginOk = false;
    bool gapOk = false;
    resolved.outerMarginMm = parser.value(QStringLiteral("outer-margin")).toDouble(&marginOk);
    resolved.innerGapMm = parser.value(QStringLiteral("inner-gap")).toDouble(&gapOk);
    if (!marginOk || !gapOk || resolved.outerMarginMm < 0.0 || resolved.innerGapMm < 0.0) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Margins must be non-negative numbers of millimetres."));
        return false;
    }

    resolved.border = !parser.isSet(QStringLiteral("no-border"));

    if (!parseQuality(parser, &resolved.quality, progress)) {
        return false;
    }

    *layout = resolved;
    return true;
}

/**
 * Split "N:rest" into a 1-based position and the rest.
 */
static bool splitPositional(const QString& value, int* position, QString* rest)
{
    const int colon = value.indexOf(QLatin1Char(':'));
    if (colon <= 0) {
        return false;
    }
    bool ok = false;
    *position = value.left(colon).trimmed().toInt(&ok);
    *rest = value.mid(colon + 1);
    return ok;
}

/**
 * Apply page edits in a fixed order: insert-blank, insert-text, move,
 * revert, exclude. Every position is 1-based and refers to the document
 * as it stands when that edit runs.
 */
static OperationResult applyEdits(const QCommandLineParser& parser, Document& document)
{
    if (parser.isSet(QStringLiteral("insert-blank"))) {
        bool ok = false;
        const int position = parser.value(QStringLiteral("insert-blank")).toInt(&ok);
        if (!ok) {
            return OperationResult::failure(ErrorKind::InputError,
                QCoreApplication::translate("CLI", "Invalid --insert-blank position: \"%1\"")
                    .arg(parser.value(QStringLiteral("insert-blank"))));
        }
        OperationResult inserted = document.insertBlank(position - 1);
        if (!inserted.success) {
            return inserted;
        }
    }

    if (parser.isSet(QStringLiteral("insert-text"))) {
        int position = 0;
        QString text;
        if (!splitPositional(parser.value(QStringLiteral("insert-text")), &position, &text)) {
            return OperationResult::failure(ErrorKind::InputError,
                QCoreApplication::translate("CLI", "Expected --insert-text N:text, got \"%1\"")
                    .arg(parser.value(QStringLiteral("insert-text"))));
        }
        text.replace(QStringLiteral("\\n"), QStringLiteral("\n"));
        OperationResult inserted = document.insertText(position - 1, text);
        if (!inserted.success) {
            return inserted;
        }
    }

    if (parser.isSet(QStringLiteral("move"))) {
        int position = 0;
        QString direction;
        if (!splitPositional(parser.value(QStringLiteral("move")), &position, &direction)) {
            return OperationResult::failure(ErrorKind::InputError,
                QCoreApplication::translate("CLI", "Expected --move N:up or N:down, got \"%1\"")
                    .arg(parser.value(QStringLiteral("move"))));
        }
        direction = direction.trimmed().toLower();
        int step = 0;
        if (direction == QLatin1String("up")) {
            step = -1;
        } else if (direction == QLatin1String("down")) {
            step = 1;
        } else {
            return OperationResult::failure(ErrorKind::InputError,
                QCoreApplication::translate("CLI", "Move direction must be up or down, got \"%1\"")
                    .arg(direction));
        }
        // Moving past either end is a no-op, not an error
        if (!document.move(position - 1, step)) {
            qDebug() << "[CLI] Move of page" << position << direction << "ignored";
        }
    }

    if (parser.isSet(QStringLiteral("revert"))) {
        const QString value = parser.value(QStringLiteral("revert"));
        if (value.trimmed().compare(QLatin1String("all"), Qt::CaseInsensitive) == 0) {
            document.revertAll();
        } else {
            PageRange::ParseResult range = PageRange::parse(value, document.pageCount());
            if (!range.success) {
                return OperationResult::failure(range.error, range.errorMessage);
            }
            for (int index : range.indices) {
                document.revertCurrent(index);
            }
        }
    }

    if (parser.isSet(QStringLiteral("exclude"))) {
        PageRange::ParseResult range = PageRange::parse(parser.value(QStringLiteral("exclude")),
                                                        document.pageCount());
        if (!range.success) {
            return OperationResult::failure(range.error, range.errorMessage);
        }
        for (int index : range.indices) {
            document.setSelected(index, false);
        }
    }

    return OperationResult::ok();
}

/**
 * Load the single positional input and resolve the --pages selection.
 * Reports the error and returns a non-zero exit code on failure.
 */
static int loadInput(const QCommandLineParser& parser, const EnhancementParameters& params,
                     bool allowEdits, Document& document, QVector<int>* indices,
                     ConsoleProgress& progress)
{
    const QString inputPath = absolutePath(parser.positionalArguments().constFirst());
    if (!QFileInfo::exists(inputPath)) {
        progress.reportError(QCoreApplication::translate("CLI", "Input file not found: %1")
                                 .arg(inputPath));
        return ExitCode::IoError;
    }

    OperationResult loaded = DocumentLoader::loadPdf(
        inputPath, params, document,
        progress.pageCallback(QCoreApplication::translate("CLI", "Loading")),
        stopFlag());
    if (!loaded.success) {
        if (loaded.wasCancelled()) {
            progress.reportStopped(stopSignalName());
        } else {
            progress.reportError(loaded.errorMessage);
        }
        return exitCodeFromError(loaded.error);
    }

    if (allowEdits) {
        OperationResult edited = applyEdits(parser, document);
        if (!edited.success) {
            progress.reportError(edited.errorMessage);
            return exitCodeFromError(edited.error);
        }
    }

    PageRange::ParseResult range = PageRange::parse(parser.value(QStringLiteral("pages")),
                                                    document.pageCount());
    if (!range.success) {
        progress.reportError(range.errorMessage);
        return ExitCode::InvalidArgs;
    }
    *indices = range.indices;
    return ExitCode::Success;
}

static void rememberRun(AppSettings& settings, const QString& settingsFile,
                        const QString& inputPath, const EnhancementParameters& params)
{
    settings.lastFolder = QFileInfo(inputPath).absolutePath();
    settings.current = params;
    if (!settings.save(settingsFile)) {
        qWarning() << "[CLI] Failed to save settings to" << settingsFile;
    }
}

// =============================================================================
// Enhance / Compact Handlers
// =============================================================================

static int runSingleDocument(const QCommandLineParser& parser, bool compact)
{
    OutputMode outputMode = getOutputMode(parser);
    ConsoleProgress progress(outputMode);
    const QString command = compact ? QStringLiteral("compact") : QStringLiteral("enhance");

    // Get input path
    const QStringList inputPaths = parser.positionalArguments();
    if (inputPaths.size() != 1) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Expected exactly one input file. Use 'pageforge %1 --help' for usage.").arg(command));
        return ExitCode::InvalidArgs;
    }

    // Get output path
    QString outputPath = parser.value(QStringLiteral("output"));
    if (outputPath.isEmpty()) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Output path required. Use -o or --output to specify destination."));
        return ExitCode::InvalidArgs;
    }
    outputPath = absolutePath(outputPath);

    const QString settingsFile = settingsPath(parser);
    AppSettings settings = AppSettings::load(settingsFile);

    BatchOps::ConvertOptions options;
    options.outputPath = outputPath;
    options.compact = compact;
    options.overwrite = parser.isSet(QStringLiteral("overwrite"));
    options.dryRun = parser.isSet(QStringLiteral("dry-run"));

    if (!resolveParameters(parser, settings, &options.params, progress)) {
        return ExitCode::InvalidArgs;
    }
    if (compact) {
        if (!resolveLayout(parser, &options.layout, progress)) {
            return ExitCode::InvalidArgs;
        }
        if (parser.isSet(QStringLiteral("preview"))) {
            bool ok = false;
            options.maxSheets = parser.value(QStringLiteral("preview")).toInt(&ok);
            if (!ok || options.maxSheets < 1) {
                progress.reportError(QCoreApplication::translate("CLI",
                    "--preview needs a positive sheet count."));
                return ExitCode::InvalidArgs;
            }
        }
    } else if (!parseQuality(parser, &options.quality, progress)) {
        return ExitCode::InvalidArgs;
    }

    const QString inputPath = absolutePath(inputPaths.constFirst());
    BatchOps::BatchResult batch;
    BatchOps::FileResult fr;
    fr.inputPath = inputPath;
    fr.outputPath = outputPath;

    // Existing output: skip before doing any work
    if (QFile::exists(outputPath) && !options.overwrite) {
        fr.status = BatchOps::FileStatus::Skipped;
        fr.message = QCoreApplication::translate("CLI", "Output file already exists");
        batch.results.append(fr);
        batch.skippedCount++;
        progress.reportFile(1, 1, fr);
        progress.reportSummary(batch, options.dryRun);
        return exitCodeFromResult(batch);
    }

    Document document;
    QVector<int> indices;
    const int loadCode = loadInput(parser, options.params, true, document, &indices, progress);
    if (loadCode != ExitCode::Success) {
        return loadCode;
    }

    const int pageTotal = document.processedPages(indices, true).size();
    if (pageTotal == 0) {
        progress.reportError(QCoreApplication::translate("CLI", "No pages selected for export."));
        return ExitCode::TotalFailure;
    }

    if (options.dryRun) {
        fr.status = BatchOps::FileStatus::Success;
        fr.countsSheets = compact;
        fr.pagesProcessed = compact ? SheetComposer::sheetCount(pageTotal, options.layout)
                                    : pageTotal;
        if (compact && options.maxSheets > 0) {
            fr.pagesProcessed = qMin(fr.pagesProcessed, options.maxSheets);
        }
        fr.message = QCoreApplication::translate("CLI", "Would write: %1").arg(outputPath);
        batch.results.append(fr);
        batch.successCount++;
        progress.reportFile(1, 1, fr);
        progress.reportSummary(batch, true);
        return ExitCode::Success;
    }

    PdfExportResult exported = BatchOps::exportDocument(
        document, indices, options, outputPath,
        progress.pageCallback(QCoreApplication::translate("CLI", "Exporting")),
        stopFlag());

    if (exported.success) {
        fr.status = BatchOps::FileStatus::Success;
        fr.outputSize = exported.fileSizeBytes;
        fr.pagesProcessed = exported.pagesExported;
        fr.countsSheets = compact;
        batch.successCount++;
        batch.totalOutputSize = exported.fileSizeBytes;
        rememberRun(settings, settingsFile, inputPath, options.params);
    } else {
        fr.status = exported.error == ErrorKind::Cancelled ? BatchOps::FileStatus::Skipped
                                                           : BatchOps::FileStatus::Error;
        fr.error = exported.error;
        fr.message = exported.errorMessage;
        if (fr.status == BatchOps::FileStatus::Skipped) {
            batch.skippedCount++;
        } else {
            batch.errorCount++;
        }
    }
    batch.results.append(fr);

    progress.reportFile(1, 1, fr);
    progress.reportSummary(batch, false);

    if (stopRequested()) {
        progress.reportStopped(stopSignalName());
        return ExitCode::Cancelled;
    }
    return exported.success ? ExitCode::Success : exitCodeFromError(exported.error);
}

int handleEnhance(const QCommandLineParser& parser)
{
    return runSingleDocument(parser, false);
}

int handleCompact(const QCommandLineParser& parser)
{
    return runSingleDocument(parser, true);
}

// =============================================================================
// Estimate Handler
// =============================================================================

int handleEstimate(const QCommandLineParser& parser)
{
    OutputMode outputMode = getOutputMode(parser);
    ConsoleProgress progress(outputMode);

    const QStringList inputPaths = parser.positionalArguments();
    if (inputPaths.size() != 1) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Expected exactly one input file. Use 'pageforge estimate --help' for usage."));
        return ExitCode::InvalidArgs;
    }

    AppSettings settings = AppSettings::load(settingsPath(parser));
    EnhancementParameters params;
    Layout::LayoutParameters layout;
    if (!resolveParameters(parser, settings, &params, progress) ||
        !resolveLayout(parser, &layout, progress)) {
        return ExitCode::InvalidArgs;
    }

    Document document;
    QVector<int> indices;
    const int loadCode = loadInput(parser, params, false, document, &indices, progress);
    if (loadCode != ExitCode::Success) {
        return loadCode;
    }

    const QVector<QImage> pages = document.processedPages(indices, true);
    const SizeEstimate estimate = SizeEstimator::estimate(pages, layout);

    progress.reportEstimate(absolutePath(inputPaths.constFirst()), estimate, pages.size(),
                            SheetComposer::sheetCount(pages.size(), layout));
    return ExitCode::Success;
}

// =============================================================================
// Batch Handler
// =============================================================================

int handleBatch(const QCommandLineParser& parser)
{
    // Get output mode for progress reporting
    OutputMode outputMode = getOutputMode(parser);
    ConsoleProgress progress(outputMode);

    // Get input paths
    const QStringList inputPaths = parser.positionalArguments();
    if (inputPaths.isEmpty()) {
        progress.reportError(QCoreApplication::translate("CLI",
            "No input files specified. Use 'pageforge batch --help' for usage."));
        return ExitCode::InvalidArgs;
    }

    // Get output path
    QString outputPath = parser.value(QStringLiteral("output"));
    if (outputPath.isEmpty()) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Output path required. Use -o or --output to specify destination."));
        return ExitCode::InvalidArgs;
    }
    outputPath = absolutePath(outputPath);

    // Validate: can't convert multiple PDFs to a single file
    const bool outputIsFile = BatchOps::isSingleFileOutput(outputPath, QStringLiteral(".pdf"));
    if (inputPaths.size() > 1 && outputIsFile) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Cannot convert %1 PDFs to a single file.\n"
            "Use a directory as output destination, e.g.: -o ~/Print/")
            .arg(inputPaths.size()));
        return ExitCode::InvalidArgs;
    }

    QStringList inputs;
    for (const QString& path : inputPaths) {
        inputs << absolutePath(path);
    }

    const QString settingsFile = settingsPath(parser);
    AppSettings settings = AppSettings::load(settingsFile);

    BatchOps::ConvertOptions options;
    options.outputPath = outputPath;
    options.pageRange = parser.value(QStringLiteral("pages"));
    options.compact = parser.isSet(QStringLiteral("compact"));
    options.overwrite = parser.isSet(QStringLiteral("overwrite"));
    options.dryRun = parser.isSet(QStringLiteral("dry-run"));

    if (!resolveParameters(parser, settings, &options.params, progress) ||
        !resolveLayout(parser, &options.layout, progress)) {
        return ExitCode::InvalidArgs;
    }
    // --quality feeds both: layout.quality for sheets, quality for plain pages
    options.quality = parser.value(QStringLiteral("quality")).isEmpty() ? -1
                                                                          : options.layout.quality;

    const bool failFast = parser.isSet(QStringLiteral("fail-fast"));

    BatchOps::BatchResult result = BatchOps::convertBatch(
        inputs, options, progress.callback(), stopFlag(), progress.resultCallback(failFast));

    if (failFast && result.results.size() < inputs.size() && result.hasErrors()) {
        progress.reportWarning(QCoreApplication::translate("CLI",
            "Stopping due to --fail-fast flag."));
    }

    // Report summary
    progress.reportSummary(result, options.dryRun);

    if (!options.dryRun && result.successCount > 0) {
        rememberRun(settings, settingsFile, inputs.constLast(), options.params);
    }

    if (stopRequested()) {
        progress.reportStopped(stopSignalName());
        return ExitCode::Cancelled;
    }

    return exitCodeFromResult(result);
}

// =============================================================================
// Presets Handler
// =============================================================================

int handlePresets(const QCommandLineParser& parser)
{
    OutputMode outputMode = getOutputMode(parser);
    ConsoleProgress progress(outputMode);

    const QString settingsFile = settingsPath(parser);
    AppSettings settings = AppSettings::load(settingsFile);

    if (parser.isSet(QStringLiteral("remove"))) {
        const QString name = parser.value(QStringLiteral("remove"));
        if (!settings.removePreset(name)) {
            progress.reportError(QCoreApplication::translate("CLI", "Unknown preset: \"%1\"")
                                     .arg(name));
            return ExitCode::InvalidArgs;
        }
        if (settings.lastPreset == name) {
            settings.lastPreset.clear();
        }
        if (!settings.save(settingsFile)) {
            progress.reportError(QCoreApplication::translate("CLI",
                "Failed to write settings: %1").arg(settingsFile));
            return ExitCode::IoError;
        }
    }

    progress.reportPresets(settings);
    return ExitCode::Success;
}

} // namespace Cli
