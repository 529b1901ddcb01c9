#ifndef EXTERNALCOMMAND_H
#define EXTERNALCOMMAND_H

/**
 * @file ExternalCommand.h
 * @brief Synchronous execution of an external program.
 *
 * Runs a program to completion (no timeout), capturing its exit status and
 * both output streams. Used by layout tools that shell out to command-line
 * utilities.
 */

#include <QString>
#include <QStringList>

namespace ExternalCommand {

/**
 * @brief Outcome of running a program.
 */
struct CommandResult {
    QString program;        ///< Program as given to run()
    QStringList arguments;  ///< Arguments as given to run()
    bool started = false;   ///< false if the program could not be launched
    bool crashed = false;   ///< true if the program terminated abnormally
    int exitCode = -1;      ///< Exit code (valid when started && !crashed)
    QString standardOutput;
    QString standardError;
    QString launchError;    ///< QProcess error string when not started

    /// @brief true if the program started, exited normally, and returned 0.
    bool succeeded() const { return started && !crashed && exitCode == 0; }
};

/**
 * @brief Run a program and wait for it to finish.
 * @param program Program name or path
 * @param arguments Arguments, passed without shell interpretation
 * @return CommandResult
 */
CommandResult run(const QString& program, const QStringList& arguments);

/**
 * @brief Human-readable command line, shell-quoting arguments that need it.
 *
 * Example: pdfjam --papersize '{7.5in,10in}' in.pdf
 */
QString commandLine(const QString& program, const QStringList& arguments);

/**
 * @brief Full diagnostic for a failed command.
 *
 * Format:
 * @code
 * Command failed:
 *   <command line>
 *
 * STDOUT:
 * <stdout>
 *
 * STDERR:
 * <stderr>
 * @endcode
 * Each stream section is present only when that stream is not blank.
 */
QString failureMessage(const CommandResult& result);

} // namespace ExternalCommand

#endif // EXTERNALCOMMAND_H
