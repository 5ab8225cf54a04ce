#include "CliProgress.h"

#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonValue>
#include <QtMath>

/**
 * @file CliProgress.cpp
 * @brief ConsoleProgress implementation.
 */

namespace Cli {

namespace {

QString tr(const char* text)
{
    return QCoreApplication::translate("CLI", text);
}

QString statusKey(BatchOps::FileStatus status)
{
    switch (status) {
        case BatchOps::FileStatus::Success: return QStringLiteral("converted");
        case BatchOps::FileStatus::Skipped: return QStringLiteral("skipped");
        case BatchOps::FileStatus::Error:   return QStringLiteral("failed");
    }
    return QString();
}

QString fileName(const QString& path)
{
    return QFileInfo(path).fileName();
}

} // namespace

ConsoleProgress::ConsoleProgress(OutputMode mode, QIODevice* out, QIODevice* err)
    : m_mode(mode)
{
    if (!out) {
        if (!m_stdout.open(stdout, QIODevice::WriteOnly)) {
            qWarning() << "[CliProgress] Cannot open stdout:" << m_stdout.errorString();
        }
        out = &m_stdout;
    }
    if (!err) {
        if (!m_stderr.open(stderr, QIODevice::WriteOnly)) {
            qWarning() << "[CliProgress] Cannot open stderr:" << m_stderr.errorString();
        }
        err = &m_stderr;
    }
    m_out.setDevice(out);
    m_err.setDevice(err);
}

// =============================================================================
// Callbacks
// =============================================================================

BatchOps::ProgressCallback ConsoleProgress::callback()
{
    return [this](int current, int total, const QString& currentFile, const QString& status) {
        Q_UNUSED(status)
        if (m_mode != OutputMode::Verbose) {
            return;
        }
        m_out << QStringLiteral("[%1/%2] %3 %4\n")
                     .arg(current).arg(total).arg(tr("converting"), currentFile);
        m_out.flush();
    };
}

BatchOps::ResultCallback ConsoleProgress::resultCallback(bool failFast)
{
    return [this, failFast](int current, int total, const BatchOps::FileResult& result) {
        reportFile(current, total, result);
        return !failFast || result.status != BatchOps::FileStatus::Error;
    };
}

::ProgressCallback ConsoleProgress::pageCallback(const QString& label)
{
    endPageLine();
    return [this, label](qreal fraction) {
        if (m_mode != OutputMode::Verbose) {
            return;
        }
        const int percent = qBound(0, qFloor(fraction * 100.0), 100);
        if (percent == m_lastPercent) {
            return;
        }
        m_lastPercent = percent;
        m_out << "\r  " << label << "  " << QString::number(percent).rightJustified(3) << '%';
        if (percent == 100) {
            endPageLine();
        }
        m_out.flush();
    };
}

void ConsoleProgress::endPageLine()
{
    if (m_lastPercent >= 0) {
        m_out << '\n';
        m_out.flush();
        m_lastPercent = -1;
    }
}

// =============================================================================
// Results
// =============================================================================

QString ConsoleProgress::fileLine(int index, int total, const BatchOps::FileResult& result) const
{
    QString line = QStringLiteral("[%1/%2] %3").arg(index).arg(total).arg(fileName(result.inputPath));

    switch (result.status) {
        case BatchOps::FileStatus::Success:
            line += QStringLiteral(" -> %1: %2")
                        .arg(fileName(result.outputPath),
                             describeCount(result.pagesProcessed, result.countsSheets));
            if (result.outputSize > 0) {
                line += QStringLiteral(", ") + formatBytes(result.outputSize);
            }
            break;
        case BatchOps::FileStatus::Skipped:
        case BatchOps::FileStatus::Error:
            line += QStringLiteral(": ") + tr(result.status == BatchOps::FileStatus::Skipped
                                                  ? "skipped" : "failed");
            if (!result.message.isEmpty()) {
                line += QStringLiteral(", ") + result.message;
            }
            break;
    }
    return line;
}

QJsonObject ConsoleProgress::fileObject(const BatchOps::FileResult& result)
{
    QJsonObject object;
    object.insert(QStringLiteral("input"), result.inputPath);
    object.insert(QStringLiteral("output"), result.outputPath);
    object.insert(QStringLiteral("status"), statusKey(result.status));
    if (result.pagesProcessed > 0) {
        object.insert(result.countsSheets ? QStringLiteral("sheets") : QStringLiteral("pages"),
                      result.pagesProcessed);
    }
    if (result.outputSize > 0) {
        object.insert(QStringLiteral("bytes"), QJsonValue(result.outputSize));
    }
    if (!result.message.isEmpty()) {
        object.insert(QStringLiteral("message"), result.message);
    }
    return object;
}

void ConsoleProgress::reportFile(int index, int total, const BatchOps::FileResult& result)
{
    endPageLine();

    if (m_mode == OutputMode::Json) {
        QJsonObject object = fileObject(result);
        object.insert(QStringLiteral("index"), index);
        object.insert(QStringLiteral("total"), total);
        writeJson(m_out, object, QStringLiteral("file"));
        return;
    }

    m_out << fileLine(index, total, result) << '\n';
    if (m_mode == OutputMode::Verbose) {
        m_out << "      " << tr("from") << ' ' << result.inputPath << '\n';
        if (!result.outputPath.isEmpty()) {
            m_out << "      " << tr("to") << "   " << result.outputPath << '\n';
        }
    }
    m_out.flush();
}

void ConsoleProgress::reportSummary(const BatchOps::BatchResult& result, bool dryRun)
{
    endPageLine();

    if (m_mode == OutputMode::Json) {
        QJsonObject object;
        object.insert(QStringLiteral("total"), result.totalCount());
        object.insert(QStringLiteral("converted"), result.successCount);
        object.insert(QStringLiteral("skipped"), result.skippedCount);
        object.insert(QStringLiteral("failed"), result.errorCount);
        object.insert(QStringLiteral("bytes"), QJsonValue(result.totalOutputSize));
        object.insert(QStringLiteral("elapsed_ms"), QJsonValue(result.elapsedMs));
        object.insert(QStringLiteral("dry_run"), dryRun);
        writeJson(m_out, object, QStringLiteral("summary"));
        return;
    }

    if (m_mode == OutputMode::Simple && result.totalCount() <= 1) {
        return;
    }

    QString line = dryRun
        ? tr("Dry run: %1 of %2 files would be converted")
        : tr("Converted %1 of %2 files");
    line = line.arg(result.successCount).arg(result.totalCount());

    if (result.skippedCount > 0) {
        line += QStringLiteral(", %1 %2").arg(result.skippedCount).arg(tr("skipped"));
    }
    if (result.errorCount > 0) {
        line += QStringLiteral(", %1 %2").arg(result.errorCount).arg(tr("failed"));
    }
    if (!dryRun && result.totalOutputSize > 0) {
        line += QStringLiteral(", ") + formatBytes(result.totalOutputSize);
    }
    line += QStringLiteral(" %1 %2 s").arg(tr("in")).arg(result.elapsedMs / 1000.0, 0, 'f', 1);

    m_out << line << '\n';
    m_out.flush();
}

// =============================================================================
// Estimate & Presets
// =============================================================================

void ConsoleProgress::reportEstimate(const QString& inputPath, const SizeEstimate& estimate,
                                     int pages, int sheets)
{
    endPageLine();

    if (m_mode == OutputMode::Json) {
        QJsonObject object;
        object.insert(QStringLiteral("input"), inputPath);
        object.insert(QStringLiteral("pages"), pages);
        object.insert(QStringLiteral("sheets"), sheets);
        object.insert(QStringLiteral("sampled"), estimate.sampledPages);
        object.insert(QStringLiteral("bytes"), estimate.valid ? QJsonValue(estimate.bytes)
                                                              : QJsonValue());
        object.insert(QStringLiteral("text"), estimate.text());
        writeJson(m_out, object, QStringLiteral("estimate"));
        return;
    }

    m_out << tr("Estimated size:") << ' ' << estimate.text();
    if (estimate.valid) {
        m_out << " (" << describeCount(pages, false) << ' ' << tr("on") << ' '
              << describeCount(sheets, true) << ')';
    } else {
        m_out << " (" << tr("no pages selected") << ')';
    }
    m_out << '\n';

    if (m_mode == OutputMode::Verbose && estimate.valid) {
        m_out << "      " << tr("sampled") << ' ' << estimate.sampledPages << ' '
              << tr("of") << ' ' << pages << ", " << inputPath << '\n';
    }
    m_out.flush();
}

void ConsoleProgress::reportPresets(const AppSettings& settings)
{
    const QStringList names = settings.presetNames();

    for (const QString& name : names) {
        const EnhancementParameters p = settings.preset(name);
        const bool last = (name == settings.lastPreset);

        if (m_mode == OutputMode::Json) {
            QJsonObject object;
            object.insert(QStringLiteral("name"), name);
            object.insert(QStringLiteral("contrast"), p.contrast);
            object.insert(QStringLiteral("brightness"), p.brightness);
            object.insert(QStringLiteral("sharpness"), p.sharpness);
            object.insert(QStringLiteral("grayscale"), p.grayscale);
            object.insert(QStringLiteral("last"), last);
            writeJson(m_out, object, QStringLiteral("preset"));
        } else {
            m_out << (last ? "* " : "  ") << name << ": " << p.toString() << '\n';
        }
    }

    if (names.isEmpty() && m_mode != OutputMode::Json) {
        m_out << tr("No presets saved.") << '\n';
    }
    m_out.flush();
}

// =============================================================================
// Diagnostics
// =============================================================================

void ConsoleProgress::reportStopped(const QString& signalName)
{
    endPageLine();

    if (m_mode == OutputMode::Json) {
        QJsonObject object;
        object.insert(QStringLiteral("signal"), signalName);
        writeJson(m_err, object, QStringLiteral("stopped"));
        return;
    }

    m_err << (signalName.isEmpty() ? tr("Stopped.")
                                   : tr("Stopped by %1.").arg(signalName))
          << ' ' << tr("No partial output was written.") << '\n';
    m_err.flush();
}

void ConsoleProgress::reportError(const QString& message)
{
    endPageLine();

    if (m_mode == OutputMode::Json) {
        QJsonObject object;
        object.insert(QStringLiteral("message"), message);
        writeJson(m_err, object, QStringLiteral("error"));
        return;
    }
    m_err << tr("Error:") << ' ' << message << '\n';
    m_err.flush();
}

void ConsoleProgress::reportWarning(const QString& message)
{
    endPageLine();

    if (m_mode == OutputMode::Json) {
        QJsonObject object;
        object.insert(QStringLiteral("message"), message);
        writeJson(m_err, object, QStringLiteral("warning"));
        return;
    }
    m_err << tr("Warning:") << ' ' << message << '\n';
    m_err.flush();
}

void ConsoleProgress::writeJson(QTextStream& stream, QJsonObject object, const QString& event)
{
    object.insert(QStringLiteral("event"), event);
    stream << QJsonDocument(object).toJson(QJsonDocument::Compact) << '\n';
    stream.flush();
}

// =============================================================================
// Formatting
// =============================================================================

QString ConsoleProgress::describeCount(int count, bool sheets)
{
    if (sheets) {
        return count == 1 ? tr("1 sheet") : tr("%1 sheets").arg(count);
    }
    return count == 1 ? tr("1 page") : tr("%1 pages").arg(count);
}

QString ConsoleProgress::formatBytes(qint64 bytes)
{
    if (bytes < 1024) {
        return QStringLiteral("%1 B").arg(bytes);
    }
    if (bytes < 1024 * 1024) {
        return QStringLiteral("%1 KB").arg(bytes / 1024.0, 0, 'f', 1);
    }
    return QStringLiteral("%1 MB").arg(bytes / (1024.0 * 1024.0), 0, 'f', 2);
}

} // namespace Cli
