#ifndef CLIHANDLER_H
#define CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief Command handler for the pdftrimfit CLI.
 *
 * Translates parsed options into TrimFitOptions, runs the pipeline, and
 * reports the result.
 */

#include "CliParser.h"
#include "../batch/TrimFitPipeline.h"

#include <QCommandLineParser>

namespace Cli {

/**
 * @brief Run the trim/fit pipeline with the parsed options.
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleTrimFit(const QCommandLineParser& parser);

/**
 * @brief Build pipeline options from parsed arguments.
 *
 * Checks mutually exclusive flags and the positional argument count, and
 * resolves --size (with --landscape/--portrait) for the fit modes only.
 * Paths are made absolute.
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @param options Receives the pipeline options
 * @param error Receives the failure (ConflictingOptions, UsageError,
 *        InvalidMargin, InvalidSize, UnknownPaperSize)
 * @return true if options are complete
 */
bool buildOptions(const QCommandLineParser& parser,
                  TrimFit::TrimFitOptions& options,
                  TrimFit::OperationResult& error);

/**
 * @brief Determine the output mode from parser options.
 *
 * Checks for --verbose and --json flags.
 * Priority: --json > --verbose > Quiet
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @return The output mode to use
 */
OutputMode getOutputMode(const QCommandLineParser& parser);

} // namespace Cli

#endif // CLIHANDLER_H
