#include "ExternalCommand.h"

#include <QDebug>
#include <QProcess>
#include <QRegularExpression>

/**
 * @file ExternalCommand.cpp
 * @brief Implementation of synchronous program execution.
 *
 * @see ExternalCommand.h for API documentation
 */

namespace ExternalCommand {

CommandResult run(const QString& program, const QStringList& arguments)
{
    CommandResult result;
    result.program = program;
    result.arguments = arguments;

    QProcess process;

    qDebug() << "[ExternalCommand] Running:" << commandLine(program, arguments);

    process.start(program, arguments);
    if (!process.waitForStarted(-1)) {
        result.launchError = process.errorString();
        qWarning() << "[ExternalCommand] Failed to start" << program << ":" << result.launchError;
        return result;
    }
    result.started = true;

    // Blocks until the program exits; no timeout.
    process.waitForFinished(-1);

    result.crashed = (process.exitStatus() == QProcess::CrashExit);
    result.exitCode = process.exitCode();
    result.standardOutput = QString::fromLocal8Bit(process.readAllStandardOutput());
    result.standardError = QString::fromLocal8Bit(process.readAllStandardError());

    qDebug() << "[ExternalCommand]" << program << "exited with" << result.exitCode
             << (result.crashed ? "(crashed)" : "");
    return result;
}

QString commandLine(const QString& program, const QStringList& arguments)
{
    static const QRegularExpression needsQuoting(QStringLiteral("[^A-Za-z0-9_@%+=:,./-]"));

    QStringList parts;
    parts << program;
    for (const QString& arg : arguments) {
        if (arg.isEmpty()) {
            parts << QStringLiteral("''");
        } else if (arg.contains(needsQuoting)) {
            QString quoted = arg;
            quoted.replace(QLatin1Char('\''), QStringLiteral("'\"'\"'"));
            parts << QLatin1Char('\'') + quoted + QLatin1Char('\'');
        } else {
            parts << arg;
        }
    }
    return parts.join(QLatin1Char(' '));
}

QString failureMessage(const CommandResult& result)
{
    QString message = QStringLiteral("Command failed:\n  ")
                      + commandLine(result.program, result.arguments)
                      + QStringLiteral("\n\n");

    if (!result.started) {
        message += QStringLiteral("The program could not be started: ")
                   + result.launchError + QLatin1Char('\n');
        return message;
    }
    if (result.crashed) {
        message += QStringLiteral("The program terminated abnormally.\n");
    }

    // Streams are reported verbatim; blank ones are left out.
    if (!result.standardOutput.trimmed().isEmpty()) {
        message += QStringLiteral("STDOUT:\n") + result.standardOutput + QLatin1Char('\n');
    }
    if (!result.standardError.trimmed().isEmpty()) {
        message += QStringLiteral("STDERR:\n") + result.standardError + QLatin1Char('\n');
    }
    return message;
}

} // namespace ExternalCommand
