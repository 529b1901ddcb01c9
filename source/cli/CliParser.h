#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line argument parsing for pdftrimfit.
 *
 * Usage:
 *   pdftrimfit [--trim | --fit] [--size SIZE] [--landscape | --portrait]
 *              [--margin INCHES] [--verbose | --json] input.pdf [output.pdf]
 *
 * Without --trim or --fit the document is trimmed and then fitted.
 */

#include <QString>
#include <QStringList>
#include <QCommandLineParser>

class QCoreApplication;

namespace Cli {

/**
 * @brief Output mode for CLI progress/results.
 */
enum class OutputMode {
    Quiet,          ///< Errors only (default)
    Verbose,        ///< Per-page progress and a summary
    Json            ///< One JSON result object for scripting
};

// =============================================================================
// Exit Codes
// =============================================================================

/**
 * @brief Exit codes for CLI operations.
 */
namespace ExitCode {
    constexpr int Success = 0;        ///< Document written
    constexpr int Failure = 1;        ///< Any handled failure, including bad arguments
}

// =============================================================================
// Parser Setup
// =============================================================================

/**
 * @brief Configure QCommandLineParser with all pdftrimfit options.
 * @param parser The parser to configure
 */
void setupParser(QCommandLineParser& parser);

/**
 * @brief Print the help message to stdout.
 */
void showHelp();

/**
 * @brief "PAPER NAMES:" help section listing every accepted paper name.
 */
QString paperNamesHelp();

/**
 * @brief Print version information to stdout.
 */
void showVersion();

/**
 * @brief Application version string (set by the build system).
 */
QString versionString();

// =============================================================================
// Main Entry Point
// =============================================================================

/**
 * @brief Run the command line tool.
 *
 * Parses arguments, runs the pipeline and reports the outcome.
 *
 * @param app The QCoreApplication instance
 * @param argc Argument count
 * @param argv Argument vector
 * @return Exit code (see ExitCode namespace)
 */
int run(QCoreApplication& app, int argc, char* argv[]);

} // namespace Cli

#endif // CLIPARSER_H
