// ============================================================================
// VisibleRegion - Content bounding box of a page
// ============================================================================

#include "VisibleRegion.h"

#include <QDebug>

#include <algorithm>

namespace VisibleRegion {

// QRectF::united() drops zero-area rectangles, which would lose hairlines,
// so the union is kept as plain edges.
namespace {

struct Edges {
    qreal x0 = 0.0;
    qreal y0 = 0.0;
    qreal x1 = 0.0;
    qreal y1 = 0.0;
    bool empty = true;

    void add(const QRectF& r)
    {
        const QRectF n = r.normalized();
        if (empty) {
            x0 = n.left();
            y0 = n.top();
            x1 = n.right();
            y1 = n.bottom();
            empty = false;
            return;
        }
        x0 = std::min(x0, n.left());
        y0 = std::min(y0, n.top());
        x1 = std::max(x1, n.right());
        y1 = std::max(y1, n.bottom());
    }
};

} // namespace

bool isVisibleColor(const RgbColor& color)
{
    return !(color.r > WhiteThreshold &&
             color.g > WhiteThreshold &&
             color.b > WhiteThreshold);
}

bool isVisible(const PdfDrawing& drawing)
{
    const bool visibleStroke = drawing.hasStroke && isVisibleColor(drawing.strokeColor);
    const bool visibleFill = drawing.hasFill && isVisibleColor(drawing.fillColor);
    return visibleStroke || visibleFill;
}

QRectF detect(const PageContent& page)
{
    Edges content;

    for (const PdfDrawing& drawing : page.drawings) {
        if (isVisible(drawing)) {
            content.add(drawing.rect);
        }
    }

    // Text color is not inspected; text always counts as printed.
    for (const QRectF& block : page.textBlocks) {
        content.add(block);
    }
    for (const QRectF& block : page.imageBlocks) {
        content.add(block);
    }

    if (content.empty) {
        return page.mediaBox;
    }

    const QRectF padded(QPointF(content.x0 - PaddingPt, content.y0 - PaddingPt),
                        QPointF(content.x1 + PaddingPt, content.y1 + PaddingPt));

    const QRectF media = page.mediaBox.normalized();
    const qreal left = std::max(padded.left(), media.left());
    const qreal top = std::max(padded.top(), media.top());
    const qreal right = std::min(padded.right(), media.right());
    const qreal bottom = std::min(padded.bottom(), media.bottom());

    if (left >= right || top >= bottom) {
        // Everything was painted outside the page.
        qDebug() << "[VisibleRegion] Page" << page.pageIndex
                 << "has no content inside its media box";
        return page.mediaBox;
    }

    return QRectF(QPointF(left, top), QPointF(right, bottom));
}

} // namespace VisibleRegion
