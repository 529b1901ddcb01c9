// ============================================================================
// MuPdfEngine - Owner of the MuPDF context
// ============================================================================

#include "MuPdfEngine.h"
#include "MuPdfDocument.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>

// MuPDF prints warnings and errors to stderr by default. Route them through
// Qt's logging so they follow the application's debug filter.
static void mupdfWarningCallback(void* user, const char* message)
{
    Q_UNUSED(user)
    qDebug() << "[MuPDF] warning:" << message;
}

static void mupdfErrorCallback(void* user, const char* message)
{
    Q_UNUSED(user)
    qDebug() << "[MuPDF] error:" << message;
}

// ============================================================================
// Construction / Destruction
// ============================================================================

MuPdfEngine::MuPdfEngine()
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "[MuPdfEngine] Failed to create MuPDF context";
        return;
    }

    fz_set_warning_callback(m_ctx, mupdfWarningCallback, nullptr);
    fz_set_error_callback(m_ctx, mupdfErrorCallback, nullptr);

    fz_try(m_ctx) {
        fz_register_document_handlers(m_ctx);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfEngine] Failed to register handlers:" << fz_caught_message(m_ctx);
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

MuPdfEngine::~MuPdfEngine()
{
    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

// ============================================================================
// Document Factory
// ============================================================================

std::unique_ptr<MuPdfDocument> MuPdfEngine::openDocument(const QString& path,
                                                         QString* errorMessage)
{
    if (!m_ctx) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("PDF engine is not initialized");
        }
        return nullptr;
    }

    QByteArray pathUtf8 = path.toUtf8();
    pdf_document* doc = nullptr;
    int pageCount = 0;
    QString failure;

    fz_var(doc);
    fz_try(m_ctx) {
        doc = pdf_open_document(m_ctx, pathUtf8.constData());
        pageCount = pdf_count_pages(m_ctx, doc);
    }
    fz_catch(m_ctx) {
        failure = QString::fromUtf8(fz_caught_message(m_ctx));
    }

    if (!failure.isEmpty()) {
        if (doc) {
            pdf_drop_document(m_ctx, doc);
        }
        qWarning() << "[MuPdfEngine] Failed to open" << path << "-" << failure;
        if (errorMessage) {
            *errorMessage = failure;
        }
        return nullptr;
    }

    qDebug() << "[MuPdfEngine] Opened" << path << "with" << pageCount << "pages";
    return std::unique_ptr<MuPdfDocument>(new MuPdfDocument(m_ctx, doc, path));
}

std::unique_ptr<MuPdfDocument> MuPdfEngine::createDocument(QString* errorMessage)
{
    if (!m_ctx) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("PDF engine is not initialized");
        }
        return nullptr;
    }

    pdf_document* doc = nullptr;
    QString failure;

    fz_var(doc);
    fz_try(m_ctx) {
        doc = pdf_create_document(m_ctx);
    }
    fz_catch(m_ctx) {
        failure = QString::fromUtf8(fz_caught_message(m_ctx));
    }

    if (!doc) {
        qWarning() << "[MuPdfEngine] Failed to create PDF:" << failure;
        if (errorMessage) {
            *errorMessage = failure;
        }
        return nullptr;
    }

    return std::unique_ptr<MuPdfDocument>(new MuPdfDocument(m_ctx, doc, QString()));
}
