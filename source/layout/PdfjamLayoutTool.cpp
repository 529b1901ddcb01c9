#include "PdfjamLayoutTool.h"
#include "ExternalCommand.h"

#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>
#include <QStandardPaths>

static QString tr(const char* text)
{
    return QCoreApplication::translate("PdfjamLayoutTool", text);
}

PdfjamLayoutTool::PdfjamLayoutTool(const QString& program)
    : m_program(program)
{
}

QString PdfjamLayoutTool::executablePath() const
{
    QFileInfo info(m_program);
    if (info.isAbsolute()) {
        return (info.exists() && info.isExecutable()) ? info.absoluteFilePath() : QString();
    }
    return QStandardPaths::findExecutable(m_program);
}

QString PdfjamLayoutTool::getInstallationInstructions()
{
#ifdef Q_OS_MACOS
    return tr("pdfjam is part of TeX Live. Install MacTeX, or with Homebrew:\n"
              "  brew install --cask mactex-no-gui\n");
#else
    return tr("On Ubuntu/WSL you can install dependencies with:\n"
              "  sudo apt update && sudo apt install -y texlive-extra-utils\n");
#endif
}

TrimFit::OperationResult PdfjamLayoutTool::checkAvailable() const
{
    TrimFit::OperationResult result;

    const QString path = executablePath();
    if (path.isEmpty()) {
        result.fail(TrimFit::ErrorKind::MissingTool,
                    tr("Required tool not found on PATH: %1\n\n").arg(m_program)
                        + getInstallationInstructions());
        return result;
    }

    qDebug() << "[PdfjamLayoutTool] Using" << path;
    result.success = true;
    return result;
}

QString PdfjamLayoutTool::paperSizeArgument(const QSizeF& sizeInches)
{
    return QStringLiteral("{%1in,%2in}")
        .arg(QString::number(sizeInches.width(), 'g', 10),
             QString::number(sizeInches.height(), 'g', 10));
}

QStringList PdfjamLayoutTool::buildArguments(const QString& inputPath,
                                             const QString& outputPath,
                                             const QSizeF& sizeInches,
                                             bool autoScale)
{
    QStringList args;
    args << QStringLiteral("--quiet")
         << QStringLiteral("--papersize") << paperSizeArgument(sizeInches);
    if (!autoScale) {
        args << QStringLiteral("--noautoscale") << QStringLiteral("true");
    }
    args << inputPath
         << QStringLiteral("--outfile") << outputPath;
    return args;
}

TrimFit::OperationResult PdfjamLayoutTool::scaleToFit(const QString& inputPath,
                                                      const QString& outputPath,
                                                      const QSizeF& sizeInches)
{
    return runLayout(inputPath, outputPath, sizeInches, true);
}

TrimFit::OperationResult PdfjamLayoutTool::padToSize(const QString& inputPath,
                                                     const QString& outputPath,
                                                     const QSizeF& sizeInches)
{
    return runLayout(inputPath, outputPath, sizeInches, false);
}

TrimFit::OperationResult PdfjamLayoutTool::runLayout(const QString& inputPath,
                                                     const QString& outputPath,
                                                     const QSizeF& sizeInches,
                                                     bool autoScale)
{
    TrimFit::OperationResult result;

    const QStringList args = buildArguments(inputPath, outputPath, sizeInches, autoScale);
    const ExternalCommand::CommandResult run = ExternalCommand::run(m_program, args);

    if (!run.succeeded()) {
        result.fail(TrimFit::ErrorKind::ExternalToolError, ExternalCommand::failureMessage(run));
        qWarning() << "[PdfjamLayoutTool]" << m_program << "failed with exit code" << run.exitCode;
        return result;
    }

    // pdfjam reports some LaTeX failures only on stderr and still exits 0.
    if (!QFileInfo::exists(outputPath)) {
        result.fail(TrimFit::ErrorKind::ExternalToolError,
                    ExternalCommand::failureMessage(run)
                        + tr("\nThe command exited successfully but did not create %1\n")
                              .arg(outputPath));
        return result;
    }

    result.success = true;
    return result;
}
