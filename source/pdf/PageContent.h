#pragma once

// ============================================================================
// PageContent - Geometry snapshot of one PDF page
// ============================================================================
// Filled by MuPdfDocument::extractPageContent() and consumed by the
// visible-region detector. All rectangles are in page display space:
// PDF points, origin at the top-left of the page, y growing downwards.
// ============================================================================

#include <QRectF>
#include <QVector>

/**
 * @brief An RGB color with channels in [0, 1].
 */
struct RgbColor {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
};

/**
 * @brief A vector drawing (filled and/or stroked path) found on a page.
 */
struct PdfDrawing {
    QRectF rect;                ///< Bounding box of the painted path
    bool hasStroke = false;     ///< True if the path is stroked
    RgbColor strokeColor;       ///< Stroke color (valid if hasStroke)
    bool hasFill = false;       ///< True if the path is filled
    RgbColor fillColor;         ///< Fill color (valid if hasFill)
};

/**
 * @brief Everything the visible-region detector needs to know about a page.
 */
struct PageContent {
    int pageIndex = -1;             ///< 0-based page index in its document
    QRectF mediaBox;                ///< Full physical page extent
    QRectF cropBox;                 ///< Current crop region
    QVector<PdfDrawing> drawings;   ///< Filled/stroked paths
    QVector<QRectF> textBlocks;     ///< Bounding boxes of text blocks
    QVector<QRectF> imageBlocks;    ///< Bounding boxes of placed images
};
