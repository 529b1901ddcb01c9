#include "TrimFitPipeline.h"

#include "../layout/LayoutTool.h"
#include "../layout/PdfjamLayoutTool.h"
#include "../pdf/Cropper.h"
#include "../pdf/MuPdfDocument.h"
#include "../pdf/MuPdfEngine.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QTemporaryDir>

#include <cmath>

/**
 * @file TrimFitPipeline.cpp
 * @brief Implementation of the trim/fit pipeline.
 *
 * @see TrimFitPipeline.h for API documentation
 */

namespace TrimFit {

static QString tr(const char* text)
{
    return QCoreApplication::translate("TrimFitPipeline", text);
}

// =============================================================================
// Utility Functions
// =============================================================================

QString modeName(Mode mode)
{
    switch (mode) {
        case Mode::Trim:    return QStringLiteral("trim");
        case Mode::Fit:     return QStringLiteral("fit");
        case Mode::TrimFit: return QStringLiteral("trimfit");
    }
    return QStringLiteral("trimfit");
}

QSizeF innerCanvas(const QSizeF& sizeInches, qreal marginInches)
{
    return QSizeF(sizeInches.width() - 2 * marginInches,
                  sizeInches.height() - 2 * marginInches);
}

OperationResult validateGeometry(const QSizeF& sizeInches, qreal marginInches)
{
    OperationResult result;

    const qreal w = sizeInches.width();
    const qreal h = sizeInches.height();
    if (!std::isfinite(w) || !std::isfinite(h) || w <= 0 || h <= 0) {
        result.fail(ErrorKind::InvalidSize,
                    tr("Page size must be positive: %1x%2").arg(w).arg(h));
        return result;
    }

    if (!std::isfinite(marginInches) || marginInches < 0) {
        result.fail(ErrorKind::InvalidMargin,
                    tr("Margin must be a non-negative number: %1").arg(marginInches));
        return result;
    }

    const QSizeF inner = innerCanvas(sizeInches, marginInches);
    if (inner.width() <= 0 || inner.height() <= 0) {
        result.fail(ErrorKind::MarginTooLarge,
                    tr("Margin %1 is too large for size %2x%3")
                        .arg(marginInches).arg(w).arg(h));
        return result;
    }

    result.success = true;
    return result;
}

OperationResult validatePaths(const QString& inputPath, const QString& outputPath)
{
    OperationResult result;

    QFileInfo inputInfo(inputPath);
    if (!inputInfo.exists()) {
        result.fail(ErrorKind::FileNotFound, tr("Input PDF not found: %1").arg(inputPath));
        return result;
    }

    if (inputInfo.suffix().compare(QLatin1String("pdf"), Qt::CaseInsensitive) != 0) {
        result.fail(ErrorKind::InvalidInput, tr("Input must be a .pdf file: %1").arg(inputPath));
        return result;
    }

    // The input stays open while the output is written.
    if (QFileInfo(outputPath) == inputInfo) {
        result.fail(ErrorKind::InvalidInput,
                    tr("Output must not overwrite the input: %1").arg(outputPath));
        return result;
    }

    const QString outputDir = QFileInfo(outputPath).absolutePath();
    if (!QDir().mkpath(outputDir)) {
        result.fail(ErrorKind::FileNotFound,
                    tr("Failed to create output directory: %1").arg(outputDir));
        return result;
    }

    result.success = true;
    return result;
}

// =============================================================================
// Fit
// =============================================================================

/**
 * @brief Scale and pad every page of sourcePath, writing outputPath.
 *
 * Scratch files go to workDir: p{i}.pdf (extracted page), p{i}_fit.pdf
 * (scaled to the inner canvas), p{i}_pad.pdf (padded to the outer size).
 */
static PipelineResult fitPages(const QString& sourcePath,
                               const QString& outputPath,
                               const QString& workDir,
                               const TrimFitOptions& options,
                               LayoutTool* tool,
                               const ProgressCallback& progress)
{
    PipelineResult result;

    const QSizeF outer = options.sizeInches;
    const QSizeF inner = innerCanvas(outer, options.marginInches);

    MuPdfEngine engine;
    if (!engine.isValid()) {
        result.fail(ErrorKind::IOError, tr("Failed to initialize the PDF engine"));
        return result;
    }

    QString error;
    auto source = engine.openDocument(sourcePath, &error);
    if (!source) {
        result.fail(ErrorKind::IOError, tr("Cannot open PDF %1: %2").arg(sourcePath, error));
        return result;
    }

    auto output = engine.createDocument(&error);
    if (!output) {
        result.fail(ErrorKind::IOError, tr("Cannot create output PDF: %1").arg(error));
        return result;
    }

    const int total = source->pageCount();
    if (total < 0) {
        result.fail(ErrorKind::IOError,
                    tr("Cannot read the page tree of %1: %2").arg(sourcePath, source->lastError()));
        return result;
    }

    const QDir dir(workDir);
    for (int i = 0; i < total; ++i) {
        const QString pagePath = dir.filePath(QStringLiteral("p%1.pdf").arg(i));
        const QString fitPath = dir.filePath(QStringLiteral("p%1_fit.pdf").arg(i));
        const QString padPath = dir.filePath(QStringLiteral("p%1_pad.pdf").arg(i));

        // Extract single page
        if (progress) {
            progress(i + 1, total, tr("Extracting page..."));
        }
        {
            auto single = engine.createDocument(&error);
            if (!single) {
                result.fail(ErrorKind::IOError, tr("Cannot create page PDF: %1").arg(error));
                return result;
            }
            if (!single->appendPages(*source, i, i) || !single->save(pagePath)) {
                result.fail(ErrorKind::IOError,
                            tr("Cannot extract page %1: %2").arg(i + 1).arg(single->lastError()));
                return result;
            }
        }

        // Scale to fit inner canvas
        if (progress) {
            progress(i + 1, total, tr("Scaling page..."));
        }
        OperationResult step = tool->scaleToFit(pagePath, fitPath, inner);
        if (!step.success) {
            result.failWith(step);
            return result;
        }

        // Pad to outer page size (enforces the minimum margin)
        if (progress) {
            progress(i + 1, total, tr("Padding page..."));
        }
        step = tool->padToSize(fitPath, padPath, outer);
        if (!step.success) {
            result.failWith(step);
            return result;
        }

        // Append to result
        auto padded = engine.openDocument(padPath, &error);
        if (!padded) {
            result.fail(ErrorKind::IOError, tr("Cannot open PDF %1: %2").arg(padPath, error));
            return result;
        }
        const int paddedPages = padded->pageCount();
        if (paddedPages < 1 || !output->appendPages(*padded, 0, paddedPages - 1)) {
            result.fail(ErrorKind::IOError,
                        tr("Cannot append page %1: %2").arg(i + 1).arg(output->lastError()));
            return result;
        }

        qDebug() << "[TrimFitPipeline] Page" << (i + 1) << "of" << total << "fitted";
    }

    if (!output->save(outputPath)) {
        result.fail(ErrorKind::IOError,
                    tr("Cannot write PDF %1: %2").arg(outputPath, output->lastError()));
        return result;
    }

    result.pagesProcessed = total;
    result.success = true;
    return result;
}

// =============================================================================
// Pipeline
// =============================================================================

PipelineResult normalizePdf(const TrimFitOptions& options,
                            LayoutTool* tool,
                            ProgressCallback progress)
{
    PipelineResult result;
    QElapsedTimer timer;
    timer.start();

    result.inputPath = QFileInfo(options.inputPath).absoluteFilePath();
    result.outputPath = QFileInfo(options.outputPath).absoluteFilePath();

    const bool fitting = (options.mode != Mode::Trim);

    // Validate everything before touching any page
    if (fitting) {
        const OperationResult geometry = validateGeometry(options.sizeInches, options.marginInches);
        if (!geometry.success) {
            result.failWith(geometry);
            result.elapsedMs = timer.elapsed();
            return result;
        }
    }

    const OperationResult paths = validatePaths(result.inputPath, result.outputPath);
    if (!paths.success) {
        result.failWith(paths);
        result.elapsedMs = timer.elapsed();
        return result;
    }

    // Trim only: crop straight into the output
    if (!fitting) {
        if (progress) {
            progress(0, 0, tr("Cropping..."));
        }
        const Cropper::CropResult crop = Cropper::cropToContent(result.inputPath, result.outputPath);
        if (!crop.success) {
            result.failWith(crop);
        } else {
            result.success = true;
            result.pagesProcessed = crop.pageCount;
            result.outputSize = QFileInfo(result.outputPath).size();
        }
        result.elapsedMs = timer.elapsed();
        return result;
    }

    if (!tool) {
        result.fail(ErrorKind::MissingTool, tr("No layout tool configured"));
        result.elapsedMs = timer.elapsed();
        return result;
    }

    const OperationResult available = tool->checkAvailable();
    if (!available.success) {
        result.failWith(available);
        result.elapsedMs = timer.elapsed();
        return result;
    }

    // Removed with all its contents on every return path below
    QTemporaryDir workDir(QDir::tempPath() + QStringLiteral("/pdf-trimfit-XXXXXX"));
    if (!workDir.isValid()) {
        result.fail(ErrorKind::IOError,
                    tr("Failed to create temporary directory: %1").arg(workDir.errorString()));
        result.elapsedMs = timer.elapsed();
        return result;
    }
    qDebug() << "[TrimFitPipeline] Scratch directory:" << workDir.path();

    QString source = result.inputPath;
    if (options.mode == Mode::TrimFit) {
        if (progress) {
            progress(0, 0, tr("Cropping..."));
        }
        source = workDir.filePath(QStringLiteral("cropped.pdf"));
        const Cropper::CropResult crop = Cropper::cropToContent(result.inputPath, source);
        if (!crop.success) {
            result.failWith(crop);
            result.elapsedMs = timer.elapsed();
            return result;
        }
    }

    const PipelineResult fitted = fitPages(source, result.outputPath, workDir.path(),
                                           options, tool, progress);
    if (!fitted.success) {
        result.failWith(fitted);
    } else {
        result.success = true;
        result.pagesProcessed = fitted.pagesProcessed;
        result.outputSize = QFileInfo(result.outputPath).size();
    }

    result.elapsedMs = timer.elapsed();
    return result;
}

PipelineResult normalizePdf(const TrimFitOptions& options, ProgressCallback progress)
{
    PdfjamLayoutTool tool(options.layoutProgram);
    return normalizePdf(options, &tool, progress);
}

} // namespace TrimFit
