#pragma once

// ============================================================================
// TestPdfFactory - Fixture PDFs for unit tests
// ============================================================================
// Builds small PDF files with MuPDF so tests do not depend on binary files
// checked into the repository. Geometry is given in display space
// (points, top-left origin) and converted to PDF user space here.
// ============================================================================

#include "PageContent.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QByteArray>
#include <QDebug>
#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QVector>

namespace TestPdfFactory {

/**
 * @brief One page of a fixture document.
 */
struct FixturePage {
    QSizeF size{200, 200};  ///< MediaBox size in points
    int rotate = 0;         ///< /Rotate value
    QByteArray content;     ///< Content stream (use the helpers below)
    bool hasImage = false;  ///< Page content uses the /Im1 image
};

// ----------------------------------------------------------------------------
// Content stream helpers (display-space rectangles on a page of pageHeight)
// ----------------------------------------------------------------------------

inline QByteArray num(qreal v)
{
    return QByteArray::number(v, 'f', 3);
}

inline QByteArray pdfRect(const QRectF& r, qreal pageHeight)
{
    return num(r.x()) + ' ' + num(pageHeight - r.y() - r.height()) + ' '
         + num(r.width()) + ' ' + num(r.height()) + " re";
}

inline QByteArray fillRect(const QRectF& r, qreal pageHeight, const RgbColor& color)
{
    return num(color.r) + ' ' + num(color.g) + ' ' + num(color.b) + " rg "
         + pdfRect(r, pageHeight) + " f\n";
}

inline QByteArray strokeRect(const QRectF& r, qreal pageHeight, const RgbColor& color,
                             qreal lineWidth = 1.0)
{
    return num(color.r) + ' ' + num(color.g) + ' ' + num(color.b) + " RG "
         + num(lineWidth) + " w " + pdfRect(r, pageHeight) + " S\n";
}

/// Helvetica text with its baseline starting at the display-space point.
inline QByteArray text(const QPointF& baseline, qreal pageHeight, const QByteArray& str,
                       qreal fontSize = 12)
{
    return "0 0 0 rg BT /F1 " + num(fontSize) + " Tf "
         + num(baseline.x()) + ' ' + num(pageHeight - baseline.y())
         + " Td (" + str + ") Tj ET\n";
}

/// Draw the /Im1 image into r; set FixturePage::hasImage.
inline QByteArray image(const QRectF& r, qreal pageHeight)
{
    return "q " + num(r.width()) + " 0 0 " + num(r.height()) + ' '
         + num(r.x()) + ' ' + num(pageHeight - r.y() - r.height()) + " cm /Im1 Do Q\n";
}

// ----------------------------------------------------------------------------
// Document writer
// ----------------------------------------------------------------------------

/**
 * @brief Write a fixture PDF.
 * @param path Output file
 * @param pages Pages in order
 * @return true on success
 */
inline bool writePdf(const QString& path, const QVector<FixturePage>& pages)
{
    fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!ctx) {
        return false;
    }

    QByteArray pathUtf8 = path.toUtf8();
    pdf_document* doc = nullptr;
    fz_font* helvetica = nullptr;
    fz_pixmap* pixmap = nullptr;
    fz_image* img = nullptr;
    fz_buffer* contents = nullptr;
    pdf_obj* resources = nullptr;
    pdf_obj* font = nullptr;
    pdf_obj* imageRef = nullptr;
    bool ok = true;

    fz_var(doc);
    fz_var(helvetica);
    fz_var(pixmap);
    fz_var(img);
    fz_var(contents);
    fz_var(resources);
    fz_var(font);
    fz_var(imageRef);

    fz_try(ctx) {
        doc = pdf_create_document(ctx);

        helvetica = fz_new_base14_font(ctx, "Helvetica");
        font = pdf_add_simple_font(ctx, doc, helvetica, PDF_SIMPLE_ENCODING_LATIN);

        // 2x2 mid-gray image shared by all pages
        pixmap = fz_new_pixmap(ctx, fz_device_rgb(ctx), 2, 2, nullptr, 0);
        fz_clear_pixmap_with_value(ctx, pixmap, 0x80);
        img = fz_new_image_from_pixmap(ctx, pixmap, nullptr);
        imageRef = pdf_add_image(ctx, doc, img);

        for (int i = 0; i < pages.size(); ++i) {
            const FixturePage& page = pages[i];

            resources = pdf_new_dict(ctx, doc, 2);
            pdf_obj* fonts = pdf_dict_put_dict(ctx, resources, PDF_NAME(Font), 1);
            pdf_dict_puts(ctx, fonts, "F1", font);
            if (page.hasImage) {
                pdf_obj* xobjects = pdf_dict_put_dict(ctx, resources, PDF_NAME(XObject), 1);
                pdf_dict_puts(ctx, xobjects, "Im1", imageRef);
            }

            contents = fz_new_buffer_from_copied_data(ctx,
                reinterpret_cast<const unsigned char*>(page.content.constData()),
                static_cast<size_t>(page.content.size()));

            fz_rect mediabox = fz_make_rect(0, 0,
                                            static_cast<float>(page.size.width()),
                                            static_cast<float>(page.size.height()));
            pdf_obj* pageObj = pdf_add_page(ctx, doc, mediabox, page.rotate, resources, contents);
            pdf_insert_page(ctx, doc, -1, pageObj);
            pdf_drop_obj(ctx, pageObj);

            fz_drop_buffer(ctx, contents);
            contents = nullptr;
            pdf_drop_obj(ctx, resources);
            resources = nullptr;
        }

        pdf_save_document(ctx, doc, pathUtf8.constData(), nullptr);
    }
    fz_always(ctx) {
        pdf_drop_obj(ctx, imageRef);
        pdf_drop_obj(ctx, font);
        pdf_drop_obj(ctx, resources);
        fz_drop_buffer(ctx, contents);
        fz_drop_image(ctx, img);
        fz_drop_pixmap(ctx, pixmap);
        fz_drop_font(ctx, helvetica);
        pdf_drop_document(ctx, doc);
    }
    fz_catch(ctx) {
        qDebug() << "[TestPdfFactory] Failed to write" << path << ":" << fz_caught_message(ctx);
        ok = false;
    }

    fz_drop_context(ctx);
    return ok;
}

/**
 * @brief Write a document of count pages, page i holding i+1 black squares.
 *
 * Lets tests recognise pages (and their order) by their drawing count.
 */
inline bool writeNumberedPages(const QString& path, int count, const QSizeF& size = QSizeF(200, 200))
{
    QVector<FixturePage> pages;
    for (int i = 0; i < count; ++i) {
        FixturePage page;
        page.size = size;
        for (int k = 0; k <= i; ++k) {
            page.content += fillRect(QRectF(20 + 15 * k, 40, 10, 10), size.height(), {0, 0, 0});
        }
        pages.append(page);
    }
    return writePdf(path, pages);
}

} // namespace TestPdfFactory
