#pragma once

// ============================================================================
// VisibleRegionTests - Unit tests for content bounding box detection
// ============================================================================
// Pure geometry tests on hand-built PageContent snapshots (no PDF files):
// - Blank pages and white-only drawings keep the media box
// - Text, image and visible drawing union with 1pt padding
// - Clipping to the media box
// ============================================================================

#include "VisibleRegion.h"
#include <QDebug>

namespace VisibleRegionTests {

inline PageContent makePage(qreal width, qreal height)
{
    PageContent page;
    page.pageIndex = 0;
    page.mediaBox = QRectF(0, 0, width, height);
    page.cropBox = page.mediaBox;
    return page;
}

inline PdfDrawing filled(const QRectF& rect, const RgbColor& color)
{
    PdfDrawing d;
    d.rect = rect;
    d.hasFill = true;
    d.fillColor = color;
    return d;
}

inline PdfDrawing stroked(const QRectF& rect, const RgbColor& color)
{
    PdfDrawing d;
    d.rect = rect;
    d.hasStroke = true;
    d.strokeColor = color;
    return d;
}

inline bool expectRect(const char* what, const QRectF& got, const QRectF& expected)
{
    const qreal eps = 1e-6;
    if (qAbs(got.left() - expected.left()) > eps || qAbs(got.top() - expected.top()) > eps ||
        qAbs(got.right() - expected.right()) > eps || qAbs(got.bottom() - expected.bottom()) > eps) {
        qDebug() << "FAIL:" << what;
        qDebug() << "  Expected:" << expected;
        qDebug() << "  Got:" << got;
        return false;
    }
    qDebug() << "  -" << what << ": OK";
    return true;
}

/**
 * @brief Test color classification against the 0.95 threshold.
 */
inline bool testColorThreshold()
{
    qDebug() << "=== Test: Color Threshold ===";
    bool success = true;

    if (VisibleRegion::isVisibleColor({1.0f, 1.0f, 1.0f})) {
        qDebug() << "FAIL: white should be invisible";
        success = false;
    }
    if (VisibleRegion::isVisibleColor({0.96f, 0.97f, 0.99f})) {
        qDebug() << "FAIL: near-white (all > 0.95) should be invisible";
        success = false;
    }
    // Exactly at the threshold is not "above" it
    if (!VisibleRegion::isVisibleColor({0.95f, 1.0f, 1.0f})) {
        qDebug() << "FAIL: a channel at 0.95 should make the color visible";
        success = false;
    }
    if (!VisibleRegion::isVisibleColor({1.0f, 1.0f, 0.0f})) {
        qDebug() << "FAIL: yellow should be visible";
        success = false;
    }

    // Drawing without any paint
    PdfDrawing unpainted;
    unpainted.rect = QRectF(0, 0, 10, 10);
    if (VisibleRegion::isVisible(unpainted)) {
        qDebug() << "FAIL: drawing without stroke or fill should be invisible";
        success = false;
    }

    // White fill with a dark stroke is visible
    PdfDrawing mixed = filled(QRectF(0, 0, 10, 10), {1, 1, 1});
    mixed.hasStroke = true;
    mixed.strokeColor = {0.2f, 0.2f, 0.2f};
    if (!VisibleRegion::isVisible(mixed)) {
        qDebug() << "FAIL: dark stroke should make the drawing visible";
        success = false;
    }

    if (success) {
        qDebug() << "  - Threshold classification: OK";
    }
    return success;
}

/**
 * @brief Pages with nothing visible keep their full media box.
 */
inline bool testBlankPages()
{
    qDebug() << "=== Test: Blank Pages ===";
    bool success = true;

    PageContent blank = makePage(612, 792);
    success &= expectRect("Empty page -> media box", VisibleRegion::detect(blank), blank.mediaBox);

    PageContent whiteOnly = makePage(612, 792);
    whiteOnly.drawings.append(filled(QRectF(0, 0, 612, 792), {1, 1, 1}));
    whiteOnly.drawings.append(stroked(QRectF(50, 50, 100, 100), {0.98f, 0.98f, 0.98f}));
    success &= expectRect("White-only drawings -> media box",
                          VisibleRegion::detect(whiteOnly), whiteOnly.mediaBox);

    return success;
}

/**
 * @brief Union of visible content padded by 1pt.
 */
inline bool testPaddedUnion()
{
    qDebug() << "=== Test: Padded Union ===";
    bool success = true;

    // Single text block
    {
        PageContent page = makePage(200, 200);
        page.textBlocks.append(QRectF(QPointF(10, 10), QPointF(50, 50)));
        success &= expectRect("Text block padded by 1pt", VisibleRegion::detect(page),
                              QRectF(QPointF(9, 9), QPointF(51, 51)));
    }

    // Text + visible drawing + image; the white background does not count
    {
        PageContent page = makePage(612, 792);
        page.drawings.append(filled(QRectF(0, 0, 612, 792), {1, 1, 1}));
        page.drawings.append(stroked(QRectF(QPointF(100, 300), QPointF(400, 310)), {0, 0, 1}));
        page.textBlocks.append(QRectF(QPointF(120, 100), QPointF(300, 140)));
        page.imageBlocks.append(QRectF(QPointF(200, 500), QPointF(450, 600)));
        success &= expectRect("Mixed content union", VisibleRegion::detect(page),
                              QRectF(QPointF(99, 99), QPointF(451, 601)));
    }

    // Zero-height hairline still contributes
    {
        PageContent page = makePage(200, 200);
        page.drawings.append(stroked(QRectF(QPointF(30, 80), QPointF(170, 80)), {0, 0, 0}));
        success &= expectRect("Hairline union", VisibleRegion::detect(page),
                              QRectF(QPointF(29, 79), QPointF(171, 81)));
    }

    return success;
}

/**
 * @brief Results never extend beyond the media box.
 */
inline bool testClipToMedia()
{
    qDebug() << "=== Test: Clip to Media Box ===";
    bool success = true;

    // Content touching the page edge
    {
        PageContent page = makePage(200, 200);
        page.drawings.append(filled(QRectF(QPointF(0, 0), QPointF(200, 20)), {0, 0, 0}));
        page.textBlocks.append(QRectF(QPointF(150, 150), QPointF(200, 200)));
        success &= expectRect("Edge content clipped", VisibleRegion::detect(page),
                              QRectF(0, 0, 200, 200));
    }

    // Content partially off-page
    {
        PageContent page = makePage(200, 200);
        page.textBlocks.append(QRectF(QPointF(-40, 60), QPointF(80, 90)));
        success &= expectRect("Off-page part clipped", VisibleRegion::detect(page),
                              QRectF(QPointF(0, 59), QPointF(81, 91)));
    }

    // Content entirely off-page behaves like a blank page
    {
        PageContent page = makePage(200, 200);
        page.textBlocks.append(QRectF(QPointF(300, 300), QPointF(350, 320)));
        success &= expectRect("Off-page content -> media box", VisibleRegion::detect(page),
                              page.mediaBox);
    }

    // Media box not at the origin
    {
        PageContent page = makePage(100, 100);
        page.mediaBox = QRectF(QPointF(50, 50), QPointF(150, 150));
        page.textBlocks.append(QRectF(QPointF(40, 100), QPointF(60, 120)));
        success &= expectRect("Offset media box", VisibleRegion::detect(page),
                              QRectF(QPointF(50, 99), QPointF(61, 121)));
    }

    return success;
}

/**
 * @brief Run all visible region tests.
 * @return true if all tests pass
 */
inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running VisibleRegion Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testColorThreshold();
    qDebug() << "";

    allPass &= testBlankPages();
    qDebug() << "";

    allPass &= testPaddedUnion();
    qDebug() << "";

    allPass &= testClipToMedia();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace VisibleRegionTests
