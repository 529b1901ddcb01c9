#ifndef CLIPROGRESS_H
#define CLIPROGRESS_H

/**
 * @file CliProgress.h
 * @brief Console progress reporter for the pdftrimfit CLI.
 *
 * Formats progress updates and results for terminal display.
 * Supports three output modes:
 * - Quiet: nothing on success, "Error: ..." on failure
 * - Verbose: one line per pipeline step (`[2/10] Scaling page...`) and a summary
 * - JSON: a single result object for scripting
 */

#include "CliParser.h"
#include "../batch/TrimFitPipeline.h"

#include <QIODevice>
#include <QTextStream>

namespace Cli {

/**
 * @brief Progress reporter for console output.
 *
 * Usage:
 * @code
 *   ConsoleProgress progress(OutputMode::Verbose);
 *   auto result = TrimFit::normalizePdf(options, progress.callback());
 *   if (result.success) {
 *       progress.reportSummary(result, options);
 *   } else {
 *       progress.reportError(result);
 *   }
 * @endcode
 */
class ConsoleProgress {
public:
    /**
     * @brief Construct a progress reporter.
     * @param mode Output mode (Quiet, Verbose, or Json)
     */
    explicit ConsoleProgress(OutputMode mode = OutputMode::Quiet);

    /**
     * @brief Construct a progress reporter writing to the given devices.
     * @param mode Output mode
     * @param out Device receiving progress and summaries
     * @param err Device receiving errors
     */
    ConsoleProgress(OutputMode mode, QIODevice* out, QIODevice* err);

    /**
     * @brief Get progress callback for the pipeline.
     *
     * Only Verbose mode prints progress lines.
     *
     * @return Progress callback function
     */
    TrimFit::ProgressCallback callback();

    /**
     * @brief Report a successful run.
     *
     * Verbose prints a summary block, Json prints the result object, Quiet
     * prints nothing.
     *
     * @param result The pipeline result
     * @param options The options the pipeline ran with
     */
    void reportSummary(const TrimFit::PipelineResult& result,
                       const TrimFit::TrimFitOptions& options);

    /**
     * @brief Report a failed run.
     *
     * Text modes write "Error: <message>" to stderr. Json mode writes
     * {"status":"error","error":"<kind>","message":"..."} to stderr.
     *
     * @param error The failure
     */
    void reportError(const TrimFit::OperationResult& error);

    // Format file size for display (e.g., "1.5 MB")
    static QString formatSize(qint64 bytes);

    // Format duration for display (e.g., "1.5 s" or "125 ms")
    static QString formatDuration(qint64 ms);

    // Escape string for JSON output
    static QString jsonEscape(const QString& str);

private:
    OutputMode m_mode;
    QTextStream m_out;      ///< Progress and results (stdout by default)
    QTextStream m_err;      ///< Errors (stderr by default)
};

} // namespace Cli

#endif // CLIPROGRESS_H
