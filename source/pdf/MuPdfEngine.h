#pragma once

// ============================================================================
// MuPdfEngine - Owner of the MuPDF context
// ============================================================================
// All documents that exchange pages (page extraction, merging) must live in
// the same fz_context, so documents are created through one engine and must
// not outlive it.
// ============================================================================

#include <QString>

#include <memory>

class MuPdfDocument;

// Forward declarations for MuPDF types (avoid exposing mupdf headers)
struct fz_context;

/**
 * @brief Creates and opens MuPdfDocuments sharing one MuPDF context.
 *
 * Usage:
 * @code
 * MuPdfEngine engine;
 * QString error;
 * auto doc = engine.openDocument("/path/in.pdf", &error);
 * if (!doc) {
 *     qWarning() << "Open failed:" << error;
 * }
 * @endcode
 */
class MuPdfEngine {
public:
    MuPdfEngine();
    ~MuPdfEngine();

    // Disable copy (MuPDF context is not copyable)
    MuPdfEngine(const MuPdfEngine&) = delete;
    MuPdfEngine& operator=(const MuPdfEngine&) = delete;

    /**
     * @brief Check that the MuPDF context was created.
     */
    bool isValid() const { return m_ctx != nullptr; }

    /**
     * @brief Open an existing PDF file.
     * @param path Path to the PDF
     * @param errorMessage Receives the MuPDF error on failure (optional)
     * @return The document, or nullptr on failure
     */
    std::unique_ptr<MuPdfDocument> openDocument(const QString& path,
                                                QString* errorMessage = nullptr);

    /**
     * @brief Create a new empty PDF document.
     * @param errorMessage Receives the MuPDF error on failure (optional)
     * @return The document, or nullptr on failure
     */
    std::unique_ptr<MuPdfDocument> createDocument(QString* errorMessage = nullptr);

    /**
     * @brief The underlying MuPDF context (owned by the engine).
     */
    fz_context* context() const { return m_ctx; }

private:
    fz_context* m_ctx = nullptr;    ///< MuPDF context (owns all allocations)
};
