#pragma once

// ============================================================================
// MuPdfDocument - PDF document wrapper used by the trim/fit pipeline
// ============================================================================
// Wraps a MuPDF pdf_document and exposes exactly what the pipeline needs:
// - Page content snapshot (vector drawings with colors, text and image blocks)
// - Reading and writing a page's CropBox
// - Page grafting from another document (extraction and merging)
// - Saving to disk
//
// Documents are created by MuPdfEngine and share its fz_context.
// ============================================================================

#include "PageContent.h"

#include <QRectF>
#include <QString>

// Forward declarations for MuPDF types (avoid exposing mupdf headers)
struct fz_context;
struct pdf_document;

/**
 * @brief A PDF document loaded in (or created by) a MuPdfEngine.
 *
 * Every operation returns false on failure and records the MuPDF error in
 * lastError(). The document must not outlive the engine that created it.
 */
class MuPdfDocument {
public:
    ~MuPdfDocument();

    // Disable copy (owns a MuPDF document handle)
    MuPdfDocument(const MuPdfDocument&) = delete;
    MuPdfDocument& operator=(const MuPdfDocument&) = delete;

    /**
     * @brief Path the document was opened from (empty for new documents).
     */
    QString filePath() const { return m_path; }

    /**
     * @brief Number of pages, or -1 if the page tree cannot be read.
     */
    int pageCount() const;

    /**
     * @brief Snapshot the geometry of a page.
     * @param pageIndex 0-based page index
     * @param content Receives media box, crop box, drawings, text and image blocks
     * @return true on success
     *
     * Rectangles are in page display space (points, top-left origin) as
     * defined by the page's current CropBox and rotation.
     */
    bool extractPageContent(int pageIndex, PageContent& content);

    /**
     * @brief Set a page's CropBox.
     * @param pageIndex 0-based page index
     * @param displayRect Crop region in the page display space used by
     *        extractPageContent() for the same page
     * @return true on success
     */
    bool setCropBox(int pageIndex, const QRectF& displayRect);

    /**
     * @brief Read a page's raw MediaBox and effective CropBox in PDF user space.
     * @param pageIndex 0-based page index
     * @param mediaBox Receives the inherited MediaBox
     * @param cropBox Receives the inherited CropBox (MediaBox if absent)
     * @return true on success
     *
     * Not used by the pipeline; lets callers check the boxes written by
     * setCropBox() in the file's own coordinates.
     */
    bool pageBoxes(int pageIndex, QRectF& mediaBox, QRectF& cropBox);

    /**
     * @brief Append a range of pages from another document.
     * @param source Source document (must come from the same engine)
     * @param firstPage First 0-based source page
     * @param lastPage Last 0-based source page (inclusive)
     * @return true on success
     *
     * Pages are grafted with a shared graft map, so resources used by several
     * pages are copied once.
     */
    bool appendPages(const MuPdfDocument& source, int firstPage, int lastPage);

    /**
     * @brief Write the document to disk.
     * @param path Output path
     * @return true on success
     */
    bool save(const QString& path);

    /**
     * @brief Last MuPDF error message.
     */
    QString lastError() const { return m_lastError; }

    /// @brief MuPDF context the document lives in.
    fz_context* context() const { return m_ctx; }

    /// @brief Raw MuPDF document handle.
    pdf_document* handle() const { return m_doc; }

private:
    friend class MuPdfEngine;

    MuPdfDocument(fz_context* ctx, pdf_document* doc, const QString& path);

    fz_context* m_ctx = nullptr;    ///< Context owned by the engine
    pdf_document* m_doc = nullptr;  ///< Owned document handle
    QString m_path;                 ///< Source path (empty for new documents)
    QString m_lastError;            ///< Last MuPDF error
};
