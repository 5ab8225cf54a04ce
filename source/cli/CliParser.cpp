#include "CliParser.h"
#include "CliHandler.h"
#include "CliSignal.h"

#include <QCoreApplication>
#include <QTextStream>
#include <cstring>

/**
 * @file CliParser.cpp
 * @brief Implementation of CLI argument parsing.
 *
 * @see CliParser.h for API documentation
 */

namespace Cli {

#ifndef PAGEFORGE_VERSION
#define PAGEFORGE_VERSION "0.0.0"
#endif

// Application version (set from CMakeLists.txt project VERSION)
static const char* APP_VERSION = PAGEFORGE_VERSION;

// =============================================================================
// Command Detection
// =============================================================================

Command parseCommand(int argc, char* argv[])
{
    if (argc < 2) {
        return Command::None;
    }

    const char* arg1 = argv[1];

    if (std::strcmp(arg1, "enhance") == 0)  return Command::Enhance;
    if (std::strcmp(arg1, "compact") == 0)  return Command::Compact;
    if (std::strcmp(arg1, "estimate") == 0) return Command::Estimate;
    if (std::strcmp(arg1, "batch") == 0)    return Command::Batch;
    if (std::strcmp(arg1, "presets") == 0)  return Command::Presets;

    // Check for global flags
    if (std::strcmp(arg1, "--help") == 0 || std::strcmp(arg1, "-h") == 0) {
        return Command::Help;
    }
    if (std::strcmp(arg1, "--version") == 0 || std::strcmp(arg1, "-v") == 0) {
        return Command::Version;
    }

    return Command::None;
}

QString commandName(Command cmd)
{
    switch (cmd) {
        case Command::Enhance:  return QStringLiteral("enhance");
        case Command::Compact:  return QStringLiteral("compact");
        case Command::Estimate: return QStringLiteral("estimate");
        case Command::Batch:    return QStringLiteral("batch");
        case Command::Presets:  return QStringLiteral("presets");
        case Command::Help:     return QStringLiteral("help");
        case Command::Version:  return QStringLiteral("version");
        default:                return QString();
    }
}

// =============================================================================
// Parser Setup
// =============================================================================

static void addOption(QCommandLineParser& parser, const QStringList& names,
                      const char* description, const QString& valueName = QString(),
                      const QString& defaultValue = QString())
{
    parser.addOption(QCommandLineOption(names,
        QCoreApplication::translate("CLI", description), valueName, defaultValue));
}

static void addCommonOptions(QCommandLineParser& parser)
{
    addOption(parser, {QStringLiteral("settings")}, "Settings file (default: user config)",
              QStringLiteral("file"));
    addOption(parser, {QStringLiteral("verbose")}, "Show detailed progress");
    addOption(parser, {QStringLiteral("json")}, "Output results as JSON");
}

static void addOutputOptions(QCommandLineParser& parser, const char* outputDescription)
{
    addOption(parser, {QStringLiteral("o"), QStringLiteral("output")}, outputDescription,
              QStringLiteral("path"));
    addOption(parser, {QStringLiteral("overwrite")}, "Overwrite existing output files");
    addOption(parser, {QStringLiteral("dry-run")}, "Preview without creating files");
}

static void addEnhanceOptions(QCommandLineParser& parser)
{
    addOption(parser, {QStringLiteral("contrast")}, "Contrast factor (1.0 = unchanged)",
              QStringLiteral("F"));
    addOption(parser, {QStringLiteral("brightness")}, "Brightness factor (1.0 = unchanged)",
              QStringLiteral("F"));
    addOption(parser, {QStringLiteral("sharpness")}, "Sharpness factor (1.0 = unchanged)",
              QStringLiteral("F"));
    addOption(parser, {QStringLiteral("color")}, "Keep color (skip grayscale conversion)");
    addOption(parser, {QStringLiteral("preset")}, "Start from a named preset",
              QStringLiteral("name"));
    addOption(parser, {QStringLiteral("auto-optimize")}, "Use the print-optimized settings");
    addOption(parser, {QStringLiteral("save-preset")}, "Save the resulting settings as a preset",
              QStringLiteral("name"));
    addOption(parser, {QStringLiteral("pages")}, "Pages to include, e.g. \"1-10,15\"",
              QStringLiteral("range"));
}

static void addEditOptions(QCommandLineParser& parser)
{
    addOption(parser, {QStringLiteral("exclude")}, "Pages to leave out, e.g. \"2,5-6\"",
              QStringLiteral("range"));
    addOption(parser, {QStringLiteral("revert")}, "Pages to keep unenhanced (\"all\" for every page)",
              QStringLiteral("range"));
    addOption(parser, {QStringLiteral("insert-blank")}, "Insert a blank page at position N",
              QStringLiteral("N"));
    addOption(parser, {QStringLiteral("insert-text")}, "Insert a text page, \"N:text\"",
              QStringLiteral("N:text"));
    addOption(parser, {QStringLiteral("move")}, "Move a page, \"N:up\" or \"N:down\"",
              QStringLiteral("N:dir"));
}

static void addLayoutOptions(QCommandLineParser& parser)
{
    addOption(parser, {QStringLiteral("layout")}, "Grid: 3x1, 2x2 or 3x2 (default: 2x2)",
              QStringLiteral("grid"), QStringLiteral("2x2"));
    addOption(parser, {QStringLiteral("paper")}, "Paper: A4 or Letter (default: A4)",
              QStringLiteral("size"), QStringLiteral("A4"));
    addOption(parser, {QStringLiteral("orientation")}, "portrait or landscape (default: portrait)",
              QStringLiteral("name"), QStringLiteral("portrait"));
    addOption(parser, {QStringLiteral("outer-margin")}, "Outer margin in mm (default: 5)",
              QStringLiteral("mm"), QStringLiteral("5"));
    addOption(parser, {QStringLiteral("inner-gap")}, "Gap between cells in mm (default: 2)",
              QStringLiteral("mm"), QStringLiteral("2"));
    addOption(parser, {QStringLiteral("direction")}, "Reading order: ltr or ttb (default: ltr)",
              QStringLiteral("dir"), QStringLiteral("ltr"));
    addOption(parser, {QStringLiteral("no-border")}, "Don't outline cells");
}

void setupParser(QCommandLineParser& parser, Command cmd)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI", "PageForge - Scanned document enhancer and n-up composer"));

    // Add standard help option (--help, -h)
    parser.addHelpOption();

    // Add version option (--version, -v)
    parser.addVersionOption();

    switch (cmd) {
        case Command::Enhance:
            parser.addPositionalArgument(QStringLiteral("input"),
                QCoreApplication::translate("CLI", "Scanned PDF"), QStringLiteral("<input.pdf>"));
            addOutputOptions(parser, "Output PDF file [required]");
            addEnhanceOptions(parser);
            addEditOptions(parser);
            addOption(parser, {QStringLiteral("quality")}, "JPEG quality 0-100 (default: lossless)",
                      QStringLiteral("N"));
            addCommonOptions(parser);
            break;

        case Command::Compact:
            parser.addPositionalArgument(QStringLiteral("input"),
                QCoreApplication::translate("CLI", "Scanned PDF"), QStringLiteral("<input.pdf>"));
            addOutputOptions(parser, "Output PDF file [required]");
            addEnhanceOptions(parser);
            addEditOptions(parser);
            addLayoutOptions(parser);
            addOption(parser, {QStringLiteral("quality")}, "JPEG quality 0-100 (default: 85)",
                      QStringLiteral("N"), QStringLiteral("85"));
            addOption(parser, {QStringLiteral("preview")}, "Only write the first N sheets",
                      QStringLiteral("N"));
            addCommonOptions(parser);
            break;

        case Command::Estimate:
            parser.addPositionalArgument(QStringLiteral("input"),
                QCoreApplication::translate("CLI", "Scanned PDF"), QStringLiteral("<input.pdf>"));
            addEnhanceOptions(parser);
            addLayoutOptions(parser);
            addOption(parser, {QStringLiteral("quality")}, "JPEG quality 0-100 (default: 85)",
                      QStringLiteral("N"), QStringLiteral("85"));
            addCommonOptions(parser);
            break;

        case Command::Batch:
            parser.addPositionalArgument(QStringLiteral("input"),
                QCoreApplication::translate("CLI", "Scanned PDFs"), QStringLiteral("<input.pdf>..."));
            addOutputOptions(parser, "Output directory (or file for a single input) [required]");
            addEnhanceOptions(parser);
            addOption(parser, {QStringLiteral("compact")}, "Compose n-up sheets");
            addLayoutOptions(parser);
            addOption(parser, {QStringLiteral("quality")},
                      "JPEG quality 0-100 (default: lossless, 85 with --compact)",
                      QStringLiteral("N"));
            addOption(parser, {QStringLiteral("fail-fast")}, "Stop on first error");
            addCommonOptions(parser);
            break;

        case Command::Presets:
            addOption(parser, {QStringLiteral("remove")}, "Remove a preset", QStringLiteral("name"));
            addCommonOptions(parser);
            break;

        default:
            // No command-specific options for Help/Version/None
            break;
    }
}

// =============================================================================
// Help and Version
// =============================================================================

void showHelp(const QCommandLineParser& parser, Command cmd)
{
    QTextStream out(stdout);

    if (cmd == Command::None || cmd == Command::Help) {
        out << QCoreApplication::translate("CLI",
            "Usage: pageforge <command> [options] [files...]\n"
            "\n"
            "PageForge turns dark-background scans into print-friendly PDFs and\n"
            "packs several pages onto one sheet.\n"
            "\n"
            "COMMANDS:\n"
            "  enhance         Enhance a PDF, one output page per input page\n"
            "  compact         Enhance a PDF and compose 3x1, 2x2 or 3x2 sheets\n"
            "  estimate        Estimate the size of a compact PDF\n"
            "  batch           Convert many PDFs to <name>_converted.pdf\n"
            "  presets         List or remove enhancement presets\n"
            "\n"
            "GLOBAL OPTIONS:\n"
            "  -h, --help      Show this help message\n"
            "  -v, --version   Show version information\n"
            "\n"
            "COMMON OPTIONS:\n"
            "  --settings FILE Use FILE instead of the user settings\n"
            "  --verbose       Show detailed progress\n"
            "  --json          Output results as JSON (for scripting)\n"
            "  --dry-run       Preview without creating files\n"
            "  --overwrite     Overwrite existing files\n"
            "\n"
            "QUICK START:\n"
            "  pageforge enhance notes.pdf -o notes_print.pdf --preset \"Print Clear\"\n"
            "  pageforge compact notes.pdf -o notes_2x2.pdf --layout 2x2 --quality 70\n"
            "  pageforge batch ~/Scans/*.pdf -o ~/Print/ --compact\n"
            "\n"
            "EXIT CODES:\n"
            "  0   All operations succeeded\n"
            "  1   Some files failed or were skipped\n"
            "  2   All files failed\n"
            "  3   Invalid arguments\n"
            "  4   Cannot read or write a file\n"
            "  5   Cancelled (Ctrl+C)\n"
            "\n"
            "Run 'pageforge <command> --help' for command-specific options.\n");
    } else {
        out << QCoreApplication::translate("CLI", "Usage: pageforge %1 [options]\n\n")
                   .arg(commandName(cmd));
        out << parser.helpText();
    }
}

void showVersion()
{
    QTextStream out(stdout);
    out << "PageForge " << APP_VERSION << "\n";
}

// =============================================================================
// Main Entry Point
// =============================================================================

int run(QCoreApplication& app, int argc, char* argv[])
{
    Q_UNUSED(app)

    // Install signal handlers for graceful Ctrl+C handling
    installSignalHandlers();

    Command cmd = parseCommand(argc, argv);

    if (cmd == Command::Version) {
        showVersion();
        return ExitCode::Success;
    }

    if (cmd == Command::Help || cmd == Command::None) {
        QCommandLineParser parser;
        setupParser(parser, Command::None);
        showHelp(parser, cmd);
        return (cmd == Command::Help) ? ExitCode::Success : ExitCode::InvalidArgs;
    }

    QCommandLineParser parser;
    setupParser(parser, cmd);

    // Build argument list without the command name
    // (QCommandLineParser doesn't understand subcommands)
    QStringList args;
    args << QString::fromLocal8Bit(argv[0]);
    for (int i = 2; i < argc; ++i) {
        args << QString::fromLocal8Bit(argv[i]);
    }

    if (!parser.parse(args)) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: ")
            << parser.errorText() << "\n\n";
        showHelp(parser, cmd);
        return ExitCode::InvalidArgs;
    }

    if (parser.isSet(QStringLiteral("help"))) {
        showHelp(parser, cmd);
        return ExitCode::Success;
    }

    if (parser.isSet(QStringLiteral("version"))) {
        showVersion();
        return ExitCode::Success;
    }

    switch (cmd) {
        case Command::Enhance:
            return handleEnhance(parser);
        case Command::Compact:
            return handleCompact(parser);
        case Command::Estimate:
            return handleEstimate(parser);
        case Command::Batch:
            return handleBatch(parser);
        case Command::Presets:
            return handlePresets(parser);
        default:
            return ExitCode::InvalidArgs;
    }
}

} // namespace Cli
