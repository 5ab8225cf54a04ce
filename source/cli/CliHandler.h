#ifndef CLIHANDLER_H
#define CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief Command handlers for the PageForge CLI.
 *
 * Provides handler functions for each CLI command:
 * - enhance: Enhance a scanned PDF, one output page per input page
 * - compact: Enhance and compose n-up sheets
 * - estimate: Estimate the size of a compact output
 * - batch: Convert many PDFs
 * - presets: List or remove presets
 *
 * Each handler parses command-specific options, runs the operation,
 * and reports results.
 */

#include "CliParser.h"
#include "../batch/BatchOperations.h"
#include "../core/OperationResult.h"

#include <QCommandLineParser>

namespace Cli {

/**
 * @brief Handle the enhance command.
 *
 * Loads the input, applies page edits and the page range, and writes one
 * output page per remaining page.
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleEnhance(const QCommandLineParser& parser);

/**
 * @brief Handle the compact command.
 *
 * Like enhance, but composes the pages onto sheets (--layout, --paper, ...)
 * and writes the sheets with the lossy codec.
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleCompact(const QCommandLineParser& parser);

/**
 * @brief Handle the estimate command.
 *
 * Loads the input and prints the estimated compact output size.
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleEstimate(const QCommandLineParser& parser);

/**
 * @brief Handle the batch command.
 *
 * Converts every input to <output>/<name>_converted.pdf, or to the output
 * file itself for a single input.
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleBatch(const QCommandLineParser& parser);

/**
 * @brief Handle the presets command.
 *
 * Lists presets, or removes one with --remove.
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handlePresets(const QCommandLineParser& parser);

/**
 * @brief Determine the output mode from parser options.
 *
 * Checks for --verbose and --json flags.
 * Priority: --json > --verbose > Simple
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @return The output mode to use
 */
OutputMode getOutputMode(const QCommandLineParser& parser);

/**
 * @brief Determine exit code from batch result.
 *
 * Maps batch operation results to CLI exit codes:
 * - All succeeded → Success (0)
 * - Some failed → PartialFailure (1)
 * - All failed → TotalFailure (2)
 *
 * @param result The batch operation result
 * @return Exit code
 */
int exitCodeFromResult(const BatchOps::BatchResult& result);

/**
 * @brief Map an operation error to an exit code.
 *
 * - InputError → InvalidArgs (3)
 * - ResourceError → IoError (4)
 * - Cancelled → Cancelled (5)
 * - anything else → TotalFailure (2)
 */
int exitCodeFromError(ErrorKind error);

} // namespace Cli

#endif // CLIHANDLER_H
