#ifndef PDFJAMLAYOUTTOOL_H
#define PDFJAMLAYOUTTOOL_H

/**
 * @file PdfjamLayoutTool.h
 * @brief LayoutTool implemented with the pdfjam command-line utility.
 *
 * pdfjam ships with TeX Live (texlive-extra-utils on Debian/Ubuntu). Both
 * operations are a single synchronous pdfjam run:
 * @code
 * pdfjam --quiet --papersize '{Win,Hin}' in.pdf --outfile out.pdf
 * pdfjam --quiet --papersize '{Win,Hin}' --noautoscale true in.pdf --outfile out.pdf
 * @endcode
 */

#include "LayoutTool.h"

#include <QStringList>

class PdfjamLayoutTool : public LayoutTool {
public:
    /**
     * @param program Program name looked up on PATH, or an absolute path
     */
    explicit PdfjamLayoutTool(const QString& program = QStringLiteral("pdfjam"));

    QString name() const override { return m_program; }

    TrimFit::OperationResult checkAvailable() const override;

    TrimFit::OperationResult scaleToFit(const QString& inputPath,
                                        const QString& outputPath,
                                        const QSizeF& sizeInches) override;

    TrimFit::OperationResult padToSize(const QString& inputPath,
                                       const QString& outputPath,
                                       const QSizeF& sizeInches) override;

    /**
     * @brief Full path of the program, or empty if it cannot be found.
     */
    QString executablePath() const;

    /**
     * @brief pdfjam paper size argument, e.g. "{7.5in,10in}".
     */
    static QString paperSizeArgument(const QSizeF& sizeInches);

    /**
     * @brief Arguments of the scale (autoScale) or pad (!autoScale) run.
     */
    static QStringList buildArguments(const QString& inputPath,
                                      const QString& outputPath,
                                      const QSizeF& sizeInches,
                                      bool autoScale);

    /**
     * @brief Installation instructions shown when the program is missing.
     */
    static QString getInstallationInstructions();

private:
    TrimFit::OperationResult runLayout(const QString& inputPath,
                                       const QString& outputPath,
                                       const QSizeF& sizeInches,
                                       bool autoScale);

    QString m_program;
};

#endif // PDFJAMLAYOUTTOOL_H
