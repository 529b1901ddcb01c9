#ifndef TRIMFITERROR_H
#define TRIMFITERROR_H

/**
 * @file TrimFitError.h
 * @brief Error kinds and the common result type shared by all TrimFit operations.
 *
 * Every operation that can fail returns a struct derived from OperationResult.
 * Errors are terminal for a run: callers propagate the first failure upwards
 * unchanged and never retry.
 */

#include <QString>

namespace TrimFit {

/**
 * @brief Failure categories reported to the user.
 */
enum class ErrorKind {
    None,               ///< No error
    InvalidSize,        ///< Size string is not WIDTHxHEIGHT with positive numbers
    ConflictingOptions, ///< Mutually exclusive options combined
    UnknownPaperSize,   ///< Paper name not in the registry
    FileNotFound,       ///< Input missing or output directory uncreatable
    InvalidInput,       ///< Input is not a .pdf file
    MarginTooLarge,     ///< Margin leaves no room for content
    InvalidMargin,      ///< Margin is negative or not a number
    MissingTool,        ///< External layout tool not on PATH
    ExternalToolError,  ///< External layout tool failed
    IOError,            ///< PDF open/save or temporary directory failure
    UsageError          ///< Malformed command line (missing input, extra arguments)
};

/**
 * @brief Stable machine-readable name of an error kind (used in JSON output).
 */
inline QString errorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::None:               return QStringLiteral("None");
        case ErrorKind::InvalidSize:        return QStringLiteral("InvalidSize");
        case ErrorKind::ConflictingOptions: return QStringLiteral("ConflictingOptions");
        case ErrorKind::UnknownPaperSize:   return QStringLiteral("UnknownPaperSize");
        case ErrorKind::FileNotFound:       return QStringLiteral("FileNotFound");
        case ErrorKind::InvalidInput:       return QStringLiteral("InvalidInput");
        case ErrorKind::MarginTooLarge:     return QStringLiteral("MarginTooLarge");
        case ErrorKind::InvalidMargin:      return QStringLiteral("InvalidMargin");
        case ErrorKind::MissingTool:        return QStringLiteral("MissingTool");
        case ErrorKind::ExternalToolError:  return QStringLiteral("ExternalToolError");
        case ErrorKind::IOError:            return QStringLiteral("IOError");
        case ErrorKind::UsageError:         return QStringLiteral("UsageError");
    }
    return QStringLiteral("Unknown");
}

/**
 * @brief Outcome of an operation.
 *
 * Operation-specific results derive from this and add their own payload.
 */
struct OperationResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    QString errorMessage;

    /// @brief Mark this result as failed.
    void fail(ErrorKind kind, const QString& message)
    {
        success = false;
        error = kind;
        errorMessage = message;
    }

    /// @brief Copy the failure of another result into this one.
    void failWith(const OperationResult& other)
    {
        fail(other.error, other.errorMessage);
    }
};

} // namespace TrimFit

#endif // TRIMFITERROR_H
