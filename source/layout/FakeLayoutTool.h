#ifndef FAKELAYOUTTOOL_H
#define FAKELAYOUTTOOL_H

/**
 * @file FakeLayoutTool.h
 * @brief In-process LayoutTool for pipeline tests.
 *
 * Records every call and produces real PDFs: the single input page is
 * grafted into a new document whose MediaBox is set to the requested size
 * (any CropBox is dropped). Content is not rescaled. Can be told to report
 * the tool as missing, or to fail on the Nth call.
 */

#include "LayoutTool.h"
#include "ExternalCommand.h"
#include "../pdf/MuPdfDocument.h"
#include "../pdf/MuPdfEngine.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QFileInfo>
#include <QList>

class FakeLayoutTool : public LayoutTool {
public:
    struct Call {
        QString operation;      ///< "scale" or "pad"
        QString inputPath;
        QString outputPath;
        QSizeF sizeInches;
    };

    QString name() const override { return QStringLiteral("fake-layout"); }

    TrimFit::OperationResult checkAvailable() const override
    {
        TrimFit::OperationResult result;
        ++availabilityChecks;
        if (!available) {
            result.fail(TrimFit::ErrorKind::MissingTool,
                        QStringLiteral("Required tool not found on PATH: fake-layout"));
            return result;
        }
        result.success = true;
        return result;
    }

    TrimFit::OperationResult scaleToFit(const QString& inputPath,
                                        const QString& outputPath,
                                        const QSizeF& sizeInches) override
    {
        return record(QStringLiteral("scale"), inputPath, outputPath, sizeInches);
    }

    TrimFit::OperationResult padToSize(const QString& inputPath,
                                       const QString& outputPath,
                                       const QSizeF& sizeInches) override
    {
        return record(QStringLiteral("pad"), inputPath, outputPath, sizeInches);
    }

    bool available = true;          ///< false: checkAvailable() reports MissingTool
    int failOnCall = -1;            ///< 0-based call index that fails, -1 = never
    mutable int availabilityChecks = 0;
    QList<Call> calls;

private:
    TrimFit::OperationResult record(const QString& operation, const QString& inputPath,
                                    const QString& outputPath, const QSizeF& sizeInches)
    {
        TrimFit::OperationResult result;
        const int index = calls.size();
        calls.append({operation, inputPath, outputPath, sizeInches});

        if (index == failOnCall) {
            ExternalCommand::CommandResult run;
            run.program = name();
            run.arguments = QStringList() << operation << inputPath;
            run.started = true;
            run.exitCode = 2;
            run.standardError = QStringLiteral("simulated failure\n");
            result.fail(TrimFit::ErrorKind::ExternalToolError, ExternalCommand::failureMessage(run));
            return result;
        }

        if (!QFileInfo::exists(inputPath)) {
            result.fail(TrimFit::ErrorKind::ExternalToolError,
                        QStringLiteral("fake-layout: missing input ") + inputPath);
            return result;
        }

        MuPdfEngine engine;
        auto source = engine.openDocument(inputPath);
        auto output = engine.createDocument();
        if (!source || !output || !output->appendPages(*source, 0, source->pageCount() - 1)) {
            result.fail(TrimFit::ErrorKind::ExternalToolError,
                        QStringLiteral("fake-layout: cannot copy ") + inputPath);
            return result;
        }

        // Resize every page to the requested paper size
        fz_context* ctx = output->context();
        bool resized = true;
        fz_try(ctx) {
            const fz_rect box = fz_make_rect(0, 0,
                                             static_cast<float>(sizeInches.width() * 72.0),
                                             static_cast<float>(sizeInches.height() * 72.0));
            const int pages = pdf_count_pages(ctx, output->handle());
            for (int i = 0; i < pages; ++i) {
                pdf_obj* page = pdf_lookup_page_obj(ctx, output->handle(), i);
                pdf_dict_put_rect(ctx, page, PDF_NAME(MediaBox), box);
                pdf_dict_del(ctx, page, PDF_NAME(CropBox));
            }
        }
        fz_catch(ctx) {
            resized = false;
        }

        if (!resized || !output->save(outputPath)) {
            result.fail(TrimFit::ErrorKind::ExternalToolError,
                        QStringLiteral("fake-layout: cannot write ") + outputPath);
            return result;
        }

        result.success = true;
        return result;
    }
};

#endif // FAKELAYOUTTOOL_H
