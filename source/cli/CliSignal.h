#ifndef CLISIGNAL_H
#define CLISIGNAL_H

/**
 * @file CliSignal.h
 * @brief Ctrl+C / SIGTERM handling for long conversions.
 *
 * The first SIGINT or SIGTERM only raises the stop flag. Page loops in the
 * loader, composer and exporter poll it, so the run ends at the next page
 * boundary and no half-written PDF is committed. The handler is installed
 * with SA_RESETHAND: a second Ctrl+C gets the default action and kills the
 * process at once.
 */

#include <QString>

#include <atomic>

namespace Cli {

/**
 * @brief Route SIGINT and SIGTERM to the stop flag.
 *
 * Called once from Cli::run() before any command is dispatched.
 */
void installSignalHandlers();

/**
 * @brief Stop flag handed to DocumentLoader, BatchOps and the exporter.
 * @return Pointer to a process-wide flag (never null)
 */
std::atomic<bool>* stopFlag();

/// True once a stop signal has arrived.
bool stopRequested();

/**
 * @brief Name of the signal that raised the stop flag.
 * @return "SIGINT", "SIGTERM", or an empty string if none arrived
 */
QString stopSignalName();

} // namespace Cli

#endif // CLISIGNAL_H
