#include "CliParser.h"
#include "CliHandler.h"
#include "../core/PaperSize.h"

#include <QCoreApplication>
#include <QLoggingCategory>
#include <QTextStream>

#ifndef TRIMFIT_VERSION
#define TRIMFIT_VERSION "0.0.0"
#endif

/**
 * @file CliParser.cpp
 * @brief Implementation of CLI argument parsing.
 *
 * @see CliParser.h for API documentation
 */

namespace Cli {

// =============================================================================
// Parser Setup
// =============================================================================

void setupParser(QCommandLineParser& parser)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI",
            "Auto-trim whitespace and normalize PDF to specified size with minimum margins."));

    // Add standard help option (--help, -h)
    parser.addHelpOption();

    // Add version option (--version, -v)
    parser.addVersionOption();

    parser.addPositionalArgument(
        QStringLiteral("input"),
        QCoreApplication::translate("CLI", "Input PDF file"));

    parser.addPositionalArgument(
        QStringLiteral("output"),
        QCoreApplication::translate("CLI", "Output PDF file (default: \"output.pdf\")"),
        QStringLiteral("[output]"));

    parser.addOption(QCommandLineOption(
        QStringLiteral("trim"),
        QCoreApplication::translate("CLI", "Trim whitespace only, do not fit to page")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("fit"),
        QCoreApplication::translate("CLI", "Fit to page only, do not trim whitespace")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("size"),
        QCoreApplication::translate("CLI",
            "Output page size: WIDTHxHEIGHT in inches or paper name (default: \"letter\")"),
        QStringLiteral("SIZE"),
        QStringLiteral("letter")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("landscape"),
        QCoreApplication::translate("CLI", "Landscape orientation (paper names only)")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("portrait"),
        QCoreApplication::translate("CLI", "Portrait orientation (paper names only)")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("margin"),
        QCoreApplication::translate("CLI", "Minimum internal margin in inches (default: 0.5)"),
        QStringLiteral("INCHES"),
        QStringLiteral("0.5")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("verbose"),
        QCoreApplication::translate("CLI", "Show per-page progress and debug output")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("json"),
        QCoreApplication::translate("CLI", "Output the result as JSON")));
}

QString paperNamesHelp()
{
    // Registry names plus the alias, wrapped to the help text width
    QStringList names = PaperSize::knownNames();
    names << QStringLiteral("tabloid");
    names.sort();

    QString text = QCoreApplication::translate("CLI", "PAPER NAMES:\n");
    QString line = QStringLiteral("  ");
    for (int i = 0; i < names.size(); ++i) {
        const QString item = names.at(i) + (i + 1 < names.size() ? QStringLiteral(", ") : QString());
        if (line.size() + item.size() > 78 && line.size() > 2) {
            text += QStringLiteral("  ") + line.trimmed() + QLatin1Char('\n');
            line = QStringLiteral("  ");
        }
        line += item;
    }
    text += line + QLatin1Char('\n');
    return text;
}

void showHelp()
{
    QTextStream out(stdout);
    out << QCoreApplication::translate("CLI",
        "Usage: pdftrimfit [OPTIONS] <input.pdf> [output.pdf]\n"
        "\n"
        "Auto-trim whitespace and normalize PDF to specified size with minimum margins.\n"
        "\n"
        "ARGUMENTS:\n"
        "  <input.pdf>             Input PDF file\n"
        "  [output.pdf]            Output PDF file (default: output.pdf)\n"
        "\n"
        "MODE OPTIONS (default: trim, then fit):\n"
        "  --trim                  Trim whitespace only, do not fit to page\n"
        "  --fit                   Fit to page only, do not trim whitespace\n"
        "\n"
        "PAGE OPTIONS:\n"
        "  --size <SIZE>           WIDTHxHEIGHT in inches or paper name (default: letter)\n"
        "                          e.g. 8.5x11, a4, legal, tabloid\n"
        "  --landscape             Landscape orientation (paper names only)\n"
        "  --portrait              Portrait orientation (paper names only)\n"
        "  --margin <INCHES>       Minimum internal margin (default: 0.5)\n"
        "\n"
        "COMMON OPTIONS:\n"
        "  --verbose               Show per-page progress and debug output\n"
        "  --json                  Output the result as JSON\n"
        "  -h, --help              Show this help\n"
        "  -v, --version           Show version\n"
        "\n"
        "EXAMPLES:\n"
        "  # Trim and fit to letter with 0.5in margins\n"
        "  pdftrimfit scan.pdf clean.pdf\n"
        "\n"
        "  # Fit slides to landscape A4 with a 1in margin\n"
        "  pdftrimfit --fit --size a4 --landscape --margin 1 slides.pdf handout.pdf\n"
        "\n"
        "  # Only remove whitespace (pdfjam not required)\n"
        "  pdftrimfit --trim figure.pdf figure-cropped.pdf\n"
        "\n"
        "NOTE: --fit and the default mode need pdfjam (TeX Live) on PATH.\n")
        << "\n" << paperNamesHelp();
}

QString versionString()
{
    return QStringLiteral(TRIMFIT_VERSION);
}

void showVersion()
{
    QTextStream out(stdout);
    out << "pdftrimfit " << versionString() << "\n";
}

// =============================================================================
// Main Entry Point
// =============================================================================

int run(QCoreApplication& app, int argc, char* argv[])
{
    QCoreApplication::setApplicationName(QStringLiteral("pdftrimfit"));
    QCoreApplication::setApplicationVersion(versionString());

    QStringList args;
    for (int i = 0; i < argc; ++i) {
        args << QString::fromLocal8Bit(argv[i]);
    }
    if (args.isEmpty()) {
        args = app.arguments();
    }

    QCommandLineParser parser;
    setupParser(parser);

    // Parse arguments
    if (!parser.parse(args)) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: ")
            << parser.errorText() << "\n\n";
        err.flush();
        showHelp();
        return ExitCode::Failure;
    }

    if (parser.isSet(QStringLiteral("help"))) {
        showHelp();
        return ExitCode::Success;
    }

    if (parser.isSet(QStringLiteral("version"))) {
        showVersion();
        return ExitCode::Success;
    }

    // Debug output only with --verbose; warnings always reach stderr
    if (!parser.isSet(QStringLiteral("verbose"))) {
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false"));
    }

    return handleTrimFit(parser);
}

} // namespace Cli
