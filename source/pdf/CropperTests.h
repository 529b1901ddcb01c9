#pragma once

// ============================================================================
// CropperTests - Unit tests for whole-document cropping
// ============================================================================

#include "Cropper.h"
#include "MuPdfDocument.h"
#include "MuPdfEngine.h"
#include "TestPdfFactory.h"

#include <QDebug>
#include <QDir>
#include <QTemporaryDir>

namespace CropperTests {

inline bool nearlyEqual(const QRectF& a, const QRectF& b, qreal eps = 0.01)
{
    return qAbs(a.left() - b.left()) <= eps && qAbs(a.top() - b.top()) <= eps &&
           qAbs(a.right() - b.right()) <= eps && qAbs(a.bottom() - b.bottom()) <= eps;
}

/**
 * @brief Every page gets its own content crop; blank pages keep the media box.
 */
inline bool testCropToContent()
{
    qDebug() << "=== Test: Crop To Content ===";
    bool success = true;

    QTemporaryDir dir;
    const QString inputPath = QDir(dir.path()).filePath("in.pdf");
    const QString outputPath = QDir(dir.path()).filePath("out.pdf");

    // Page 1: white background + black square at display (50,40 60x30)
    TestPdfFactory::FixturePage square;
    square.size = QSizeF(300, 400);
    square.content += TestPdfFactory::fillRect(QRectF(0, 0, 300, 400), 400, {1, 1, 1});
    square.content += TestPdfFactory::fillRect(QRectF(50, 40, 60, 30), 400, {0, 0, 0});

    // Page 2: blank
    TestPdfFactory::FixturePage blank;
    blank.size = QSizeF(300, 400);

    // Page 3: only near-white ink
    TestPdfFactory::FixturePage faint;
    faint.size = QSizeF(300, 400);
    faint.content += TestPdfFactory::strokeRect(QRectF(10, 10, 100, 100), 400, {0.97f, 0.97f, 0.97f});

    if (!TestPdfFactory::writePdf(inputPath, {square, blank, faint})) {
        qDebug() << "FAIL: could not write fixture";
        return false;
    }

    Cropper::CropResult result = Cropper::cropToContent(inputPath, outputPath);
    if (!result.success) {
        qDebug() << "FAIL: cropToContent failed:" << result.errorMessage;
        return false;
    }
    if (result.pageCount != 3) {
        qDebug() << "FAIL: pageCount should be 3, got" << result.pageCount;
        success = false;
    }

    MuPdfEngine engine;
    auto doc = engine.openDocument(outputPath);
    if (!doc || doc->pageCount() != 3) {
        qDebug() << "FAIL: output should open with 3 pages";
        return false;
    }

    QRectF media;
    QRectF crop;

    // Display (49,39)-(111,71) on a 400pt-high page is PDF (49,329)-(111,361)
    if (!doc->pageBoxes(0, media, crop) ||
        !nearlyEqual(crop, QRectF(QPointF(49, 329), QPointF(111, 361)))) {
        qDebug() << "FAIL: page 1 CropBox should hug the square, got" << crop;
        success = false;
    } else {
        qDebug() << "  - Content page cropped: OK";
    }

    if (!doc->pageBoxes(1, media, crop) || !nearlyEqual(crop, QRectF(0, 0, 300, 400))) {
        qDebug() << "FAIL: blank page should keep its media box, got" << crop;
        success = false;
    } else {
        qDebug() << "  - Blank page untouched: OK";
    }

    if (!doc->pageBoxes(2, media, crop) || !nearlyEqual(crop, QRectF(0, 0, 300, 400))) {
        qDebug() << "FAIL: near-white page should keep its media box, got" << crop;
        success = false;
    } else {
        qDebug() << "  - Near-white page untouched: OK";
    }

    // MediaBox is never modified
    if (!nearlyEqual(media, QRectF(0, 0, 300, 400))) {
        qDebug() << "FAIL: MediaBox changed:" << media;
        success = false;
    }

    return success;
}

/**
 * @brief Unreadable input and unwritable output are IOError.
 */
inline bool testIoErrors()
{
    qDebug() << "=== Test: Cropper I/O Errors ===";
    bool success = true;

    QTemporaryDir dir;

    Cropper::CropResult missing = Cropper::cropToContent(
        QDir(dir.path()).filePath("missing.pdf"), QDir(dir.path()).filePath("out.pdf"));
    if (missing.success || missing.error != TrimFit::ErrorKind::IOError) {
        qDebug() << "FAIL: missing input should be IOError";
        success = false;
    } else {
        qDebug() << "  - Missing input:" << missing.errorMessage;
    }

    const QString inputPath = QDir(dir.path()).filePath("in.pdf");
    if (!TestPdfFactory::writeNumberedPages(inputPath, 1)) {
        qDebug() << "FAIL: could not write fixture";
        return false;
    }
    Cropper::CropResult unwritable = Cropper::cropToContent(
        inputPath, QDir(dir.path()).filePath("no/such/dir/out.pdf"));
    if (unwritable.success || unwritable.error != TrimFit::ErrorKind::IOError) {
        qDebug() << "FAIL: unwritable output should be IOError";
        success = false;
    } else {
        qDebug() << "  - Unwritable output:" << unwritable.errorMessage;
    }

    return success;
}

/**
 * @brief Text placed entirely off the page does not widen the crop.
 */
inline bool testOffPageTextIgnored()
{
    qDebug() << "=== Test: Off-Page Text Ignored ===";
    bool success = true;

    QTemporaryDir dir;
    const QString inputPath = QDir(dir.path()).filePath("in.pdf");
    const QString outputPath = QDir(dir.path()).filePath("out.pdf");

    TestPdfFactory::FixturePage page;
    page.size = QSizeF(200, 200);
    page.content += TestPdfFactory::fillRect(QRectF(100, 100, 20, 20), 200, {0, 0, 0});
    page.content += TestPdfFactory::text(QPointF(-80, 60), 200, "Slug");

    if (!TestPdfFactory::writePdf(inputPath, {page})) {
        qDebug() << "FAIL: could not write fixture";
        return false;
    }

    Cropper::CropResult result = Cropper::cropToContent(inputPath, outputPath);
    if (!result.success) {
        qDebug() << "FAIL: cropToContent failed:" << result.errorMessage;
        return false;
    }

    MuPdfEngine engine;
    auto doc = engine.openDocument(outputPath);
    QRectF media;
    QRectF crop;

    // Display (99,99)-(121,121) on a 200pt-high page is PDF (99,79)-(121,101)
    if (!doc || !doc->pageBoxes(0, media, crop) ||
        !nearlyEqual(crop, QRectF(QPointF(99, 79), QPointF(121, 101)))) {
        qDebug() << "FAIL: CropBox should hug the square, got" << crop;
        success = false;
    } else {
        qDebug() << "  - Crop hugs on-page content: OK";
    }

    return success;
}

/**
 * @brief Run all cropper tests.
 * @return true if all tests pass
 */
inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Cropper Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testCropToContent();
    qDebug() << "";

    allPass &= testOffPageTextIgnored();
    qDebug() << "";

    allPass &= testIoErrors();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace CropperTests
