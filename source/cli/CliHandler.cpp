#include "CliHandler.h"
#include "CliProgress.h"
#include "../core/PaperSize.h"

#include <QCoreApplication>
#include <QDir>

/**
 * @file CliHandler.cpp
 * @brief Implementation of the CLI command handler.
 *
 * @see CliHandler.h for API documentation
 */

namespace Cli {

// =============================================================================
// Helper Functions
// =============================================================================

OutputMode getOutputMode(const QCommandLineParser& parser)
{
    if (parser.isSet(QStringLiteral("json"))) {
        return OutputMode::Json;
    }
    if (parser.isSet(QStringLiteral("verbose"))) {
        return OutputMode::Verbose;
    }
    return OutputMode::Quiet;
}

bool buildOptions(const QCommandLineParser& parser,
                  TrimFit::TrimFitOptions& options,
                  TrimFit::OperationResult& error)
{
    using TrimFit::ErrorKind;

    options = TrimFit::TrimFitOptions();

    // Mode
    const bool trim = parser.isSet(QStringLiteral("trim"));
    const bool fit = parser.isSet(QStringLiteral("fit"));
    if (trim && fit) {
        error.fail(ErrorKind::ConflictingOptions,
                   QCoreApplication::translate("CLI", "--trim and --fit cannot be used together"));
        return false;
    }
    options.mode = trim ? TrimFit::Mode::Trim
                 : fit  ? TrimFit::Mode::Fit
                        : TrimFit::Mode::TrimFit;

    const bool landscape = parser.isSet(QStringLiteral("landscape"));
    const bool portrait = parser.isSet(QStringLiteral("portrait"));
    if (landscape && portrait) {
        error.fail(ErrorKind::ConflictingOptions,
                   QCoreApplication::translate("CLI", "--landscape and --portrait cannot be used together"));
        return false;
    }

    // Positional arguments
    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        error.fail(ErrorKind::UsageError,
                   QCoreApplication::translate("CLI",
                       "No input file specified. Use 'pdftrimfit --help' for usage."));
        return false;
    }
    if (positional.size() > 2) {
        error.fail(ErrorKind::UsageError,
                   QCoreApplication::translate("CLI", "Unexpected argument: %1")
                       .arg(positional.at(2)));
        return false;
    }

    // Expand paths to absolute
    options.inputPath = QDir::cleanPath(QDir::current().absoluteFilePath(positional.at(0)));
    const QString output = positional.size() > 1 ? positional.at(1)
                                                 : QString::fromLatin1(TrimFit::DefaultOutputPath);
    options.outputPath = QDir::cleanPath(QDir::current().absoluteFilePath(output));

    // Margin
    bool marginOk = false;
    const QString marginText = parser.value(QStringLiteral("margin"));
    const qreal margin = marginText.toDouble(&marginOk);
    if (!marginOk) {
        error.fail(ErrorKind::InvalidMargin,
                   QCoreApplication::translate("CLI", "Invalid margin '%1': expected inches")
                       .arg(marginText));
        return false;
    }
    options.marginInches = margin;

    // Size is irrelevant when only trimming
    if (options.mode != TrimFit::Mode::Trim) {
        const PaperSize::SizeResult size =
            PaperSize::resolve(parser.value(QStringLiteral("size")), landscape, portrait);
        if (!size.success) {
            error.failWith(size);
            return false;
        }
        options.sizeInches = size.inches;
    }

    error.success = true;
    return true;
}

// =============================================================================
// Trim/Fit Handler
// =============================================================================

int handleTrimFit(const QCommandLineParser& parser)
{
    // Get output mode for progress reporting
    OutputMode outputMode = getOutputMode(parser);
    ConsoleProgress progress(outputMode);

    TrimFit::TrimFitOptions options;
    TrimFit::OperationResult error;
    if (!buildOptions(parser, options, error)) {
        progress.reportError(error);
        return ExitCode::Failure;
    }

    TrimFit::PipelineResult result = TrimFit::normalizePdf(options, progress.callback());
    if (!result.success) {
        progress.reportError(result);
        return ExitCode::Failure;
    }

    progress.reportSummary(result, options);
    return ExitCode::Success;
}

} // namespace Cli
