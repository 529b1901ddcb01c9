// ============================================================================
// MuPdfDocument - PDF document wrapper used by the trim/fit pipeline
// ============================================================================

#include "MuPdfDocument.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QVector>

// ============================================================================
// Helpers
// ============================================================================

static QRectF toQRectF(const fz_rect& r)
{
    return QRectF(QPointF(r.x0, r.y0), QPointF(r.x1, r.y1));
}

static fz_rect toFzRect(const QRectF& r)
{
    const QRectF n = r.normalized();
    return fz_make_rect(static_cast<float>(n.left()), static_cast<float>(n.top()),
                        static_cast<float>(n.right()), static_cast<float>(n.bottom()));
}

// ============================================================================
// Drawing collector device
// ============================================================================
// A minimal fz_device that records the bounding box and color of every
// filled or stroked path. Clip paths, text and images are ignored here;
// text and images are taken from the structured text page instead.

struct DrawingCollector {
    fz_device super;
    QVector<PdfDrawing>* drawings;
};

static bool convertToRgb(fz_context* ctx, fz_colorspace* colorspace, const float* color,
                         fz_color_params params, RgbColor& out)
{
    if (!colorspace || !color) {
        return false;
    }

    float rgb[3] = {0.0f, 0.0f, 0.0f};
    fz_convert_color(ctx, colorspace, color, fz_device_rgb(ctx), rgb, nullptr, params);
    out.r = rgb[0];
    out.g = rgb[1];
    out.b = rgb[2];
    return true;
}

static void collectorFillPath(fz_context* ctx, fz_device* dev, const fz_path* path,
                              int evenOdd, fz_matrix ctm, fz_colorspace* colorspace,
                              const float* color, float alpha, fz_color_params params)
{
    Q_UNUSED(evenOdd)
    Q_UNUSED(alpha)

    auto* collector = reinterpret_cast<DrawingCollector*>(dev);

    PdfDrawing drawing;
    drawing.rect = toQRectF(fz_bound_path(ctx, path, nullptr, ctm));
    drawing.hasFill = convertToRgb(ctx, colorspace, color, params, drawing.fillColor);
    collector->drawings->append(drawing);
}

static void collectorStrokePath(fz_context* ctx, fz_device* dev, const fz_path* path,
                                const fz_stroke_state* stroke, fz_matrix ctm,
                                fz_colorspace* colorspace, const float* color,
                                float alpha, fz_color_params params)
{
    Q_UNUSED(alpha)

    auto* collector = reinterpret_cast<DrawingCollector*>(dev);

    PdfDrawing drawing;
    drawing.rect = toQRectF(fz_bound_path(ctx, path, stroke, ctm));
    drawing.hasStroke = convertToRgb(ctx, colorspace, color, params, drawing.strokeColor);
    collector->drawings->append(drawing);
}

// fz_new_derived_device() expands to code that refers to a variable named ctx.
static fz_device* newDrawingCollector(fz_context* ctx, QVector<PdfDrawing>* drawings)
{
    DrawingCollector* dev = fz_new_derived_device(ctx, DrawingCollector);
    dev->super.fill_path = collectorFillPath;
    dev->super.stroke_path = collectorStrokePath;
    dev->drawings = drawings;
    return &dev->super;
}

// ============================================================================
// Construction / Destruction
// ============================================================================

MuPdfDocument::MuPdfDocument(fz_context* ctx, pdf_document* doc, const QString& path)
    : m_ctx(ctx)
    , m_doc(doc)
    , m_path(path)
{
}

MuPdfDocument::~MuPdfDocument()
{
    if (m_doc) {
        pdf_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
    }
}

// ============================================================================
// Page Info
// ============================================================================

int MuPdfDocument::pageCount() const
{
    int count = -1;

    fz_try(m_ctx) {
        count = pdf_count_pages(m_ctx, m_doc);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfDocument] Failed to count pages:" << fz_caught_message(m_ctx);
        count = -1;
    }

    return count;
}

bool MuPdfDocument::pageBoxes(int pageIndex, QRectF& mediaBox, QRectF& cropBox)
{
    fz_rect media = fz_empty_rect;
    fz_rect crop = fz_empty_rect;
    bool ok = true;

    fz_try(m_ctx) {
        pdf_obj* pageObj = pdf_lookup_page_obj(m_ctx, m_doc, pageIndex);
        media = pdf_to_rect(m_ctx, pdf_dict_get_inheritable(m_ctx, pageObj, PDF_NAME(MediaBox)));

        pdf_obj* cropObj = pdf_dict_get_inheritable(m_ctx, pageObj, PDF_NAME(CropBox));
        crop = cropObj ? pdf_to_rect(m_ctx, cropObj) : media;
    }
    fz_catch(m_ctx) {
        m_lastError = QString::fromUtf8(fz_caught_message(m_ctx));
        ok = false;
    }

    if (!ok) {
        qWarning() << "[MuPdfDocument] Failed to read boxes of page" << pageIndex
                   << ":" << m_lastError;
        return false;
    }

    mediaBox = toQRectF(media);
    cropBox = toQRectF(crop);
    return true;
}

bool MuPdfDocument::extractPageContent(int pageIndex, PageContent& content)
{
    content = PageContent();
    content.pageIndex = pageIndex;

    QVector<PdfDrawing> drawings;
    QVector<QRectF> textBlocks;
    QVector<QRectF> imageBlocks;
    fz_rect mediaDisplay = fz_empty_rect;
    fz_rect cropDisplay = fz_empty_rect;

    pdf_page* page = nullptr;
    fz_device* dev = nullptr;
    fz_stext_page* textPage = nullptr;
    bool ok = true;

    fz_var(page);
    fz_var(dev);
    fz_var(textPage);

    fz_try(m_ctx) {
        page = pdf_load_page(m_ctx, m_doc, pageIndex);

        // ctm maps PDF user space to display space for this page.
        fz_rect cropPdf;
        fz_matrix ctm;
        pdf_page_transform(m_ctx, page, &cropPdf, &ctm);

        fz_rect mediaPdf = pdf_to_rect(m_ctx,
            pdf_dict_get_inheritable(m_ctx, page->obj, PDF_NAME(MediaBox)));
        if (fz_is_empty_rect(mediaPdf)) {
            mediaPdf = cropPdf;
        }
        mediaDisplay = fz_transform_rect(mediaPdf, ctm);
        cropDisplay = fz_transform_rect(cropPdf, ctm);

        // Vector drawings with their colors
        dev = newDrawingCollector(m_ctx, &drawings);
        fz_run_page(m_ctx, &page->super, dev, fz_identity, nullptr);
        fz_close_device(m_ctx, dev);

        // Text and image blocks; characters entirely off the media box are dropped
        fz_stext_options opts = {0};
        opts.flags = FZ_STEXT_PRESERVE_IMAGES | FZ_STEXT_MEDIABOX_CLIP;
        textPage = fz_new_stext_page_from_page(m_ctx, &page->super, &opts);

        for (fz_stext_block* block = textPage->first_block; block; block = block->next) {
            if (block->type == FZ_STEXT_BLOCK_TEXT) {
                textBlocks.append(toQRectF(block->bbox));
            } else if (block->type == FZ_STEXT_BLOCK_IMAGE) {
                imageBlocks.append(toQRectF(block->bbox));
            }
        }
    }
    fz_always(m_ctx) {
        fz_drop_stext_page(m_ctx, textPage);
        fz_drop_device(m_ctx, dev);
        if (page) {
            fz_drop_page(m_ctx, &page->super);
        }
    }
    fz_catch(m_ctx) {
        m_lastError = QString::fromUtf8(fz_caught_message(m_ctx));
        ok = false;
    }

    if (!ok) {
        qWarning() << "[MuPdfDocument] Failed to read page" << pageIndex << ":" << m_lastError;
        return false;
    }

    content.mediaBox = toQRectF(mediaDisplay);
    content.cropBox = toQRectF(cropDisplay);
    content.drawings = drawings;
    content.textBlocks = textBlocks;
    content.imageBlocks = imageBlocks;
    return true;
}

// ============================================================================
// Modification
// ============================================================================

bool MuPdfDocument::setCropBox(int pageIndex, const QRectF& displayRect)
{
    const fz_rect target = toFzRect(displayRect);
    pdf_page* page = nullptr;
    bool ok = true;

    fz_var(page);

    fz_try(m_ctx) {
        page = pdf_load_page(m_ctx, m_doc, pageIndex);

        fz_rect cropPdf;
        fz_matrix ctm;
        pdf_page_transform(m_ctx, page, &cropPdf, &ctm);

        // Back from display space to PDF user space
        fz_rect box = fz_transform_rect(target, fz_invert_matrix(ctm));
        pdf_dict_put_rect(m_ctx, page->obj, PDF_NAME(CropBox), box);
    }
    fz_always(m_ctx) {
        if (page) {
            fz_drop_page(m_ctx, &page->super);
        }
    }
    fz_catch(m_ctx) {
        m_lastError = QString::fromUtf8(fz_caught_message(m_ctx));
        ok = false;
    }

    if (!ok) {
        qWarning() << "[MuPdfDocument] Failed to set CropBox of page" << pageIndex
                   << ":" << m_lastError;
    }
    return ok;
}

bool MuPdfDocument::appendPages(const MuPdfDocument& source, int firstPage, int lastPage)
{
    if (source.m_ctx != m_ctx) {
        m_lastError = QStringLiteral("Source document belongs to a different PDF engine");
        qWarning() << "[MuPdfDocument]" << m_lastError;
        return false;
    }

    pdf_graft_map* graftMap = nullptr;
    bool ok = true;

    fz_var(graftMap);

    fz_try(m_ctx) {
        // Shared resources (fonts, images) are copied only once per map.
        graftMap = pdf_new_graft_map(m_ctx, m_doc);
        for (int i = firstPage; i <= lastPage; ++i) {
            pdf_graft_mapped_page(m_ctx, graftMap, -1, source.m_doc, i);
        }
    }
    fz_always(m_ctx) {
        pdf_drop_graft_map(m_ctx, graftMap);
    }
    fz_catch(m_ctx) {
        m_lastError = QString::fromUtf8(fz_caught_message(m_ctx));
        ok = false;
    }

    if (!ok) {
        qWarning() << "[MuPdfDocument] Failed to graft pages" << firstPage << "-" << lastPage
                   << "from" << source.filePath() << ":" << m_lastError;
    }
    return ok;
}

// ============================================================================
// Finalization
// ============================================================================

bool MuPdfDocument::save(const QString& path)
{
    QByteArray pathUtf8 = path.toUtf8();
    bool ok = true;

    fz_try(m_ctx) {
        pdf_write_options opts = pdf_default_write_options;
        opts.do_compress = 1;        // Compress streams
        opts.do_compress_images = 1; // Compress images
        opts.do_compress_fonts = 1;  // Compress fonts

        pdf_save_document(m_ctx, m_doc, pathUtf8.constData(), &opts);
    }
    fz_catch(m_ctx) {
        m_lastError = QString::fromUtf8(fz_caught_message(m_ctx));
        ok = false;
    }

    if (!ok) {
        qWarning() << "[MuPdfDocument] Failed to save" << path << ":" << m_lastError;
        return false;
    }

    qDebug() << "[MuPdfDocument] Saved to" << path;
    return true;
}
