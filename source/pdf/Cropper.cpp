// ============================================================================
// Cropper - Trims every page of a PDF to its visible content
// ============================================================================

#include "Cropper.h"
#include "MuPdfDocument.h"
#include "MuPdfEngine.h"
#include "PageContent.h"
#include "VisibleRegion.h"

#include <QCoreApplication>
#include <QDebug>

namespace Cropper {

static QString tr(const char* text)
{
    return QCoreApplication::translate("Cropper", text);
}

CropResult cropDocument(MuPdfDocument& document)
{
    CropResult result;

    const int pages = document.pageCount();
    if (pages < 0) {
        result.fail(TrimFit::ErrorKind::IOError,
                    tr("Cannot read the page tree of %1: %2")
                        .arg(document.filePath(), document.lastError()));
        return result;
    }

    for (int i = 0; i < pages; ++i) {
        PageContent content;
        if (!document.extractPageContent(i, content)) {
            result.fail(TrimFit::ErrorKind::IOError,
                        tr("Cannot read page %1 of %2: %3")
                            .arg(i + 1).arg(document.filePath(), document.lastError()));
            return result;
        }

        const QRectF box = VisibleRegion::detect(content);
        qDebug() << "[Cropper] Page" << (i + 1) << "media" << content.mediaBox
                 << "-> crop" << box;

        if (!document.setCropBox(i, box)) {
            result.fail(TrimFit::ErrorKind::IOError,
                        tr("Cannot set the crop box of page %1: %2")
                            .arg(i + 1).arg(document.lastError()));
            return result;
        }
    }

    result.pageCount = pages;
    result.success = true;
    return result;
}

CropResult cropToContent(const QString& inputPath, const QString& outputPath)
{
    CropResult result;

    MuPdfEngine engine;
    if (!engine.isValid()) {
        result.fail(TrimFit::ErrorKind::IOError, tr("Failed to initialize the PDF engine"));
        return result;
    }

    QString openError;
    auto document = engine.openDocument(inputPath, &openError);
    if (!document) {
        result.fail(TrimFit::ErrorKind::IOError,
                    tr("Cannot open PDF %1: %2").arg(inputPath, openError));
        return result;
    }

    result = cropDocument(*document);
    if (!result.success) {
        return result;
    }

    if (!document->save(outputPath)) {
        result.fail(TrimFit::ErrorKind::IOError,
                    tr("Cannot write PDF %1: %2").arg(outputPath, document->lastError()));
        return result;
    }

    qDebug() << "[Cropper] Cropped" << result.pageCount << "pages into" << outputPath;
    return result;
}

} // namespace Cropper
