#pragma once

// ============================================================================
// OperationResult - Shared result and progress types for core operations
// ============================================================================
// Long-running and editing operations on the document, composer and exporter
// report their outcome through these plain structs instead of throwing.
// ============================================================================

#include <QString>
#include <QtGlobal>

#include <atomic>
#include <functional>

/**
 * @brief Category of a failed operation.
 */
enum class ErrorKind {
    None,           ///< Operation succeeded
    InputError,     ///< Bad user input (page range syntax, unknown name, empty document)
    ResourceError,  ///< Source unreadable or destination unwritable
    EmptySelection, ///< Nothing to compose or export
    EncodingError,  ///< Codec failure while building output
    Cancelled       ///< Stopped early through the cancellation flag
};

/**
 * @brief Progress callback invoked with a fraction in [0, 1].
 *
 * Values are monotonically non-decreasing within one operation.
 */
using ProgressCallback = std::function<void(qreal fraction)>;

/**
 * @brief Outcome of a core operation.
 */
struct OperationResult {
    bool success = true;
    ErrorKind error = ErrorKind::None;
    QString errorMessage;

    static OperationResult ok() { return OperationResult(); }

    static OperationResult failure(ErrorKind kind, const QString& message)
    {
        OperationResult result;
        result.success = false;
        result.error = kind;
        result.errorMessage = message;
        return result;
    }

    bool wasCancelled() const { return error == ErrorKind::Cancelled; }
};

/**
 * @brief Human readable name of an error kind (used in CLI/JSON output).
 */
inline QString errorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::None:           return QStringLiteral("none");
        case ErrorKind::InputError:     return QStringLiteral("input");
        case ErrorKind::ResourceError:  return QStringLiteral("resource");
        case ErrorKind::EmptySelection: return QStringLiteral("empty-selection");
        case ErrorKind::EncodingError:  return QStringLiteral("encoding");
        case ErrorKind::Cancelled:      return QStringLiteral("cancelled");
    }
    return QStringLiteral("unknown");
}

/// Helper: true if the optional cancellation flag has been raised.
inline bool isCancelled(const std::atomic<bool>* cancelled)
{
    return cancelled && cancelled->load();
}
