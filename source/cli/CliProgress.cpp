#include "CliProgress.h"

#include <QCoreApplication>

/**
 * @file CliProgress.cpp
 * @brief Implementation of console progress reporter.
 *
 * @see CliProgress.h for API documentation
 */

namespace Cli {

// =============================================================================
// Constructor
// =============================================================================

ConsoleProgress::ConsoleProgress(OutputMode mode)
    : m_mode(mode)
    , m_out(stdout)
    , m_err(stderr)
{
}

ConsoleProgress::ConsoleProgress(OutputMode mode, QIODevice* out, QIODevice* err)
    : m_mode(mode)
    , m_out(out)
    , m_err(err)
{
}

// =============================================================================
// Progress Callback
// =============================================================================

TrimFit::ProgressCallback ConsoleProgress::callback()
{
    return [this](int current, int total, const QString& status) {
        if (m_mode != OutputMode::Verbose) {
            return;
        }

        if (total > 0) {
            m_out << QStringLiteral("[%1/%2] %3\n").arg(current).arg(total).arg(status);
        } else {
            m_out << status << "\n";
        }
        m_out.flush();
    };
}

// =============================================================================
// Result Reporting
// =============================================================================

void ConsoleProgress::reportSummary(const TrimFit::PipelineResult& result,
                                    const TrimFit::TrimFitOptions& options)
{
    if (m_mode == OutputMode::Json) {
        // {"status":"success","mode":"trimfit","input":"...","output":"...","pages":12,"size":245000,"elapsed_ms":812}
        m_out << "{\"status\":\"success\""
              << ",\"mode\":\"" << TrimFit::modeName(options.mode) << "\""
              << ",\"input\":\"" << jsonEscape(result.inputPath) << "\""
              << ",\"output\":\"" << jsonEscape(result.outputPath) << "\""
              << ",\"pages\":" << result.pagesProcessed
              << ",\"size\":" << result.outputSize
              << ",\"elapsed_ms\":" << result.elapsedMs
              << "}\n";
        m_out.flush();
        return;
    }

    if (m_mode == OutputMode::Quiet) {
        return;
    }

    m_out << "\n";
    m_out << QCoreApplication::translate("CLI", "=== Summary ===\n");
    m_out << QCoreApplication::translate("CLI", "Mode:     ") << TrimFit::modeName(options.mode) << "\n";
    m_out << QCoreApplication::translate("CLI", "Input:    ") << result.inputPath << "\n";
    m_out << QCoreApplication::translate("CLI", "Output:   ") << result.outputPath << "\n";
    if (options.mode != TrimFit::Mode::Trim) {
        m_out << QCoreApplication::translate("CLI", "Page:     ")
              << QStringLiteral("%1 x %2 in, margin %3 in")
                     .arg(options.sizeInches.width())
                     .arg(options.sizeInches.height())
                     .arg(options.marginInches)
              << "\n";
    }
    m_out << QCoreApplication::translate("CLI", "Pages:    ") << result.pagesProcessed << "\n";
    if (result.outputSize > 0) {
        m_out << QCoreApplication::translate("CLI", "Size:     ")
              << formatSize(result.outputSize) << "\n";
    }
    m_out << QCoreApplication::translate("CLI", "Time:     ")
          << formatDuration(result.elapsedMs) << "\n";
    m_out.flush();
}

void ConsoleProgress::reportError(const TrimFit::OperationResult& error)
{
    if (m_mode == OutputMode::Json) {
        m_err << "{\"status\":\"error\""
              << ",\"error\":\"" << TrimFit::errorKindName(error.error) << "\""
              << ",\"message\":\"" << jsonEscape(error.errorMessage) << "\"}\n";
        m_err.flush();
        return;
    }

    m_err << QCoreApplication::translate("CLI", "Error: ") << error.errorMessage;
    if (!error.errorMessage.endsWith(QLatin1Char('\n'))) {
        m_err << "\n";
    }
    m_err.flush();
}

// =============================================================================
// Utility Functions
// =============================================================================

QString ConsoleProgress::formatSize(qint64 bytes)
{
    if (bytes < 1024) {
        return QStringLiteral("%1 B").arg(bytes);
    }
    if (bytes < 1024 * 1024) {
        return QStringLiteral("%1 KB").arg(bytes / 1024.0, 0, 'f', 1);
    }
    if (bytes < 1024 * 1024 * 1024) {
        return QStringLiteral("%1 MB").arg(bytes / (1024.0 * 1024.0), 0, 'f', 1);
    }
    return QStringLiteral("%1 GB").arg(bytes / (1024.0 * 1024.0 * 1024.0), 0, 'f', 2);
}

QString ConsoleProgress::formatDuration(qint64 ms)
{
    if (ms < 1000) {
        return QStringLiteral("%1 ms").arg(ms);
    }
    if (ms < 60 * 1000) {
        return QStringLiteral("%1 s").arg(ms / 1000.0, 0, 'f', 1);
    }
    qint64 minutes = ms / (60 * 1000);
    qint64 seconds = (ms % (60 * 1000)) / 1000;
    return QStringLiteral("%1m %2s").arg(minutes).arg(seconds);
}

QString ConsoleProgress::jsonEscape(const QString& str)
{
    QString result;
    result.reserve(str.size() + 10);

    for (const QChar& c : str) {
        switch (c.unicode()) {
            case '"':  result += QStringLiteral("\\\""); break;
            case '\\': result += QStringLiteral("\\\\"); break;
            case '\n': result += QStringLiteral("\\n"); break;
            case '\r': result += QStringLiteral("\\r"); break;
            case '\t': result += QStringLiteral("\\t"); break;
            default:
                if (c.unicode() < 32) {
                    result += QStringLiteral("\\u%1").arg(static_cast<uint>(c.unicode()), 4, 16, QLatin1Char('0'));
                } else {
                    result += c;
                }
                break;
        }
    }

    return result;
}

} // namespace Cli
