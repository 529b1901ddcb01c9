#pragma once

// ============================================================================
// VisibleRegion - Content bounding box of a page
// ============================================================================
// Computes the smallest rectangle enclosing everything that is visibly
// printed on a page: non-white vector drawings, all text and all images.
// The result is padded by 1pt and clipped to the page's media extent, and
// is what the cropper installs as the page's CropBox.
// ============================================================================

#include "PageContent.h"

namespace VisibleRegion {

/// Channel value above which a color component counts as white.
constexpr float WhiteThreshold = 0.95f;

/// Outward padding applied to the content union, in points.
constexpr qreal PaddingPt = 1.0;

/**
 * @brief Check whether a color is visibly non-white.
 * @return false if every channel exceeds WhiteThreshold
 */
bool isVisibleColor(const RgbColor& color);

/**
 * @brief Check whether a drawing has a visible stroke or fill.
 */
bool isVisible(const PdfDrawing& drawing);

/**
 * @brief Compute the content-trimmed crop box of a page.
 * @param page Page geometry snapshot (not modified)
 * @return The padded content union clipped to the media box, or the media
 *         box itself for pages without visible content
 */
QRectF detect(const PageContent& page);

} // namespace VisibleRegion
