#ifndef LAYOUTTOOL_H
#define LAYOUTTOOL_H

/**
 * @file LayoutTool.h
 * @brief Interface of the page layout collaborator used by the fit step.
 *
 * A layout tool performs the two physical page-size operations the pipeline
 * needs on a single-page PDF:
 * - scaleToFit: proportionally scale the content to fill a page of the given size
 * - padToSize:  center the content on a larger page without scaling
 *
 * The pipeline only talks to this interface, so the external program can be
 * replaced (or faked in tests).
 */

#include "../core/TrimFitError.h"

#include <QSizeF>
#include <QString>

class LayoutTool {
public:
    virtual ~LayoutTool() = default;

    /**
     * @brief Short name used in messages (e.g. "pdfjam").
     */
    virtual QString name() const = 0;

    /**
     * @brief Verify the tool can be used.
     * @return Success, or MissingTool with installation guidance
     */
    virtual TrimFit::OperationResult checkAvailable() const = 0;

    /**
     * @brief Scale a page to fit the given page size.
     * @param inputPath Single-page PDF
     * @param outputPath PDF to create, with page size == sizeInches
     * @param sizeInches Target page size in inches
     * @return Success, or ExternalToolError with diagnostics
     */
    virtual TrimFit::OperationResult scaleToFit(const QString& inputPath,
                                                const QString& outputPath,
                                                const QSizeF& sizeInches) = 0;

    /**
     * @brief Place a page centered on a page of the given size, without scaling.
     * @param inputPath Single-page PDF
     * @param outputPath PDF to create, with page size == sizeInches
     * @param sizeInches Target page size in inches
     * @return Success, or ExternalToolError with diagnostics
     */
    virtual TrimFit::OperationResult padToSize(const QString& inputPath,
                                               const QString& outputPath,
                                               const QSizeF& sizeInches) = 0;
};

#endif // LAYOUTTOOL_H
