// ============================================================================
// pdftrimfit - Main Entry Point
// ============================================================================

#include <QCoreApplication>

#include "cli/CliParser.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("pdftrimfit");

    return Cli::run(app, argc, argv);
}
