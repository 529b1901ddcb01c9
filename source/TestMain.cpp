// ============================================================================
// Test runner for pdftrimfit
// ============================================================================
// Usage: trimfit_tests --test-<suite>
// Suites: papersize, visibleregion, mupdfdocument, cropper, layouttool,
//         pipeline, cli, all
// ============================================================================

#include "batch/TrimFitPipelineTests.h"
#include "cli/CliParserTests.h"
#include "core/PaperSizeTests.h"
#include "layout/PdfjamLayoutToolTests.h"
#include "pdf/CropperTests.h"
#include "pdf/MuPdfDocumentTests.h"
#include "pdf/VisibleRegionTests.h"

#include <QCoreApplication>
#include <QTest>
#include <QTextStream>

static int runTests(const QString& testType)
{
    bool success = false;

    if (testType == "papersize") {
        success = PaperSizeTests::runAllTests();
    } else if (testType == "visibleregion") {
        success = VisibleRegionTests::runAllTests();
    } else if (testType == "mupdfdocument") {
        success = MuPdfDocumentTests::runAllTests();
    } else if (testType == "cropper") {
        success = CropperTests::runAllTests();
    } else if (testType == "layouttool") {
        success = PdfjamLayoutToolTests::runAllTests();
    } else if (testType == "pipeline") {
        success = TrimFitPipelineTests::runAllTests();
    } else if (testType == "cli") {
        CliParserTests tests;
        return QTest::qExec(&tests);
    } else if (testType == "all") {
        success = PaperSizeTests::runAllTests();
        success &= VisibleRegionTests::runAllTests();
        success &= MuPdfDocumentTests::runAllTests();
        success &= CropperTests::runAllTests();
        success &= PdfjamLayoutToolTests::runAllTests();
        success &= TrimFitPipelineTests::runAllTests();
        CliParserTests tests;
        success &= (QTest::qExec(&tests) == 0);
    } else {
        QTextStream(stderr) << "Unknown test suite: " << testType << "\n";
        return 2;
    }

    return success ? 0 : 1;
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("pdftrimfit");
    app.setApplicationName("trimfit_tests");

    QString testToRun = QStringLiteral("all");
    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg.startsWith("--test-")) {
            testToRun = arg.mid(7);
        }
    }

    return runTests(testToRun);
}
