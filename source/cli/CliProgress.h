#ifndef CLIPROGRESS_H
#define CLIPROGRESS_H

/**
 * @file CliProgress.h
 * @brief Console output of the pageforge commands.
 *
 * Three modes:
 * - Simple: one line per converted file, a summary line for batches
 * - Verbose: adds full paths, a per-page percentage while loading and
 *   exporting, and estimate details
 * - Json: one compact JSON object per line, tagged by "event"
 *
 * Results go to stdout; errors, warnings and the stop notice go to stderr.
 */

#include "CliParser.h"
#include "../batch/BatchOperations.h"
#include "../core/AppSettings.h"
#include "../core/OperationResult.h"
#include "../layout/SizeEstimator.h"

#include <QFile>
#include <QJsonObject>
#include <QTextStream>

class QIODevice;

namespace Cli {

/**
 * @brief Writes progress and results of one command invocation.
 *
 * @code
 *   ConsoleProgress progress(OutputMode::Simple);
 *   auto result = BatchOps::convertBatch(inputs, options, progress.callback(),
 *                                        stopFlag(), progress.resultCallback(false));
 *   progress.reportSummary(result, options.dryRun);
 * @endcode
 */
class ConsoleProgress {
public:
    /**
     * @param mode Output mode
     * @param out Device for results (stdout when null)
     * @param err Device for diagnostics (stderr when null)
     */
    explicit ConsoleProgress(OutputMode mode = OutputMode::Simple,
                             QIODevice* out = nullptr, QIODevice* err = nullptr);

    /// Per-file callback for BatchOps::convertBatch(); verbose mode names the file up front.
    BatchOps::ProgressCallback callback();

    /**
     * @brief Result callback that prints each file as it finishes.
     * @param failFast Return false after the first failed file
     */
    BatchOps::ResultCallback resultCallback(bool failFast);

    /**
     * @brief Fraction callback for loading or exporting one document.
     *
     * Verbose mode redraws "  <label>  42%" in place; the other modes are quiet.
     */
    ::ProgressCallback pageCallback(const QString& label);

    void reportFile(int index, int total, const BatchOps::FileResult& result);

    /**
     * @brief Closing line of a run.
     *
     * Simple mode omits it for single-file runs, where the file line
     * already carries everything.
     */
    void reportSummary(const BatchOps::BatchResult& result, bool dryRun);

    void reportEstimate(const QString& inputPath, const SizeEstimate& estimate,
                        int pages, int sheets);

    /// Lists presets in name order, marking the last one applied with '*'.
    void reportPresets(const AppSettings& settings);

    /// Notice that a stop signal ended the run early.
    void reportStopped(const QString& signalName);

    void reportError(const QString& message);
    void reportWarning(const QString& message);

    /// "1 page", "12 pages", "3 sheets".
    static QString describeCount(int count, bool sheets);

    /// Human-readable size: "812 B", "35.2 KB", "1.40 MB".
    static QString formatBytes(qint64 bytes);

private:
    QString fileLine(int index, int total, const BatchOps::FileResult& result) const;
    static QJsonObject fileObject(const BatchOps::FileResult& result);
    void writeJson(QTextStream& stream, QJsonObject object, const QString& event);
    void endPageLine();

    OutputMode m_mode;
    QFile m_stdout;
    QFile m_stderr;
    QTextStream m_out;
    QTextStream m_err;
    int m_lastPercent = -1;     ///< Percentage on the open page line, -1 when none
};

} // namespace Cli

#endif // CLIPROGRESS_H
