#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line argument parsing for PageForge.
 *
 * Supported commands:
 * - enhance: Enhance a scanned PDF page by page
 * - compact: Enhance and pack pages onto n-up sheets
 * - estimate: Estimate the size of a compact output
 * - batch: Convert many PDFs in one run
 * - presets: List or edit enhancement presets
 */

#include <QString>
#include <QStringList>
#include <QCommandLineParser>

class QCoreApplication;

namespace Cli {

// =============================================================================
// CLI Commands
// =============================================================================

/**
 * @brief Known CLI commands.
 */
enum class Command {
    None,           ///< No command given
    Help,           ///< Show help message
    Version,        ///< Show version information
    Enhance,        ///< Enhance one PDF, one output page per input page
    Compact,        ///< Enhance one PDF and compose n-up sheets
    Estimate,       ///< Estimate compact output size
    Batch,          ///< Convert many PDFs
    Presets         ///< List/edit presets
};

/**
 * @brief Output mode for CLI progress/results.
 */
enum class OutputMode {
    Simple,         ///< One line per file (default)
    Verbose,        ///< Detailed per-file info and page progress
    Json            ///< JSON format for scripting
};

// =============================================================================
// Exit Codes
// =============================================================================

/**
 * @brief Exit codes for CLI operations.
 */
namespace ExitCode {
    constexpr int Success = 0;        ///< All operations succeeded
    constexpr int PartialFailure = 1; ///< Some files failed/skipped
    constexpr int TotalFailure = 2;   ///< All files failed
    constexpr int InvalidArgs = 3;    ///< Bad command line arguments
    constexpr int IoError = 4;        ///< Can't read/write files
    constexpr int Cancelled = 5;      ///< Operation cancelled (Ctrl+C)
}

// =============================================================================
// Command Detection
// =============================================================================

/**
 * @brief Parse the command from command-line arguments.
 *
 * Extracts the command keyword from argv[1] if present.
 *
 * @return The detected command, or Command::None if absent/unknown
 */
Command parseCommand(int argc, char* argv[]);

/**
 * @brief Get command name as string.
 * @return Command name string (e.g., "compact")
 */
QString commandName(Command cmd);

// =============================================================================
// Parser Setup
// =============================================================================

/**
 * @brief Configure QCommandLineParser for a specific command.
 */
void setupParser(QCommandLineParser& parser, Command cmd);

/**
 * @brief Show help message for a command.
 *
 * If cmd is Command::None or Help, shows general help with available commands.
 */
void showHelp(const QCommandLineParser& parser, Command cmd);

/**
 * @brief Show version information.
 */
void showVersion();

// =============================================================================
// Main Entry Point
// =============================================================================

/**
 * @brief Run CLI operations.
 *
 * Parses arguments, executes the requested command, and returns an exit code.
 *
 * @return Exit code (see ExitCode namespace)
 */
int run(QCoreApplication& app, int argc, char* argv[]);

} // namespace Cli

#endif // CLIPARSER_H
