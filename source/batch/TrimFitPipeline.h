#ifndef TRIMFITPIPELINE_H
#define TRIMFITPIPELINE_H

/**
 * @file TrimFitPipeline.h
 * @brief Orchestration of the trim and fit operations on a whole PDF.
 *
 * Modes:
 * - Trim:    crop every page to its visible content, nothing else
 * - Fit:     scale every page into (size - 2*margin), then pad it to size
 * - TrimFit: crop first, then fit
 *
 * Fitting works page by page: each page is extracted into its own PDF in a
 * scratch directory, handed to the LayoutTool twice (scale, then pad), and the
 * padded page is appended to the output document. Page order and count are
 * preserved.
 *
 * Used by:
 * - CLI (pdftrimfit)
 */

#include "../core/TrimFitError.h"

#include <QSizeF>
#include <QString>

#include <functional>

class LayoutTool;

namespace TrimFit {

// =============================================================================
// Options
// =============================================================================

enum class Mode {
    Trim,       ///< Crop to visible content only
    Fit,        ///< Scale and pad only
    TrimFit     ///< Crop, then scale and pad (default)
};

constexpr qreal DefaultWidthInches = 8.5;
constexpr qreal DefaultHeightInches = 11.0;
constexpr qreal DefaultMarginInches = 0.5;
constexpr const char* DefaultSizeName = "letter";
constexpr const char* DefaultOutputPath = "output.pdf";

/**
 * @brief Parameters of one normalization run.
 */
struct TrimFitOptions {
    QString inputPath;                                  ///< Source PDF
    QString outputPath = QLatin1String(DefaultOutputPath); ///< Destination PDF
    Mode mode = Mode::TrimFit;
    QSizeF sizeInches{DefaultWidthInches, DefaultHeightInches}; ///< Output page size (fit modes)
    qreal marginInches = DefaultMarginInches;           ///< Minimum margin (fit modes)
    QString layoutProgram = QStringLiteral("pdfjam");   ///< Layout tool program
};

// =============================================================================
// Result Types
// =============================================================================

/**
 * @brief Result of a normalization run.
 */
struct PipelineResult : OperationResult {
    QString inputPath;          ///< Absolute input path
    QString outputPath;         ///< Absolute output path
    int pagesProcessed = 0;     ///< Pages written to the output
    qint64 outputSize = 0;      ///< Output file size in bytes
    qint64 elapsedMs = 0;       ///< Total elapsed time in milliseconds
};

// =============================================================================
// Progress Callback
// =============================================================================

/**
 * @brief Progress callback signature.
 *
 * Called before each step of a run.
 *
 * @param current Current page (1-based), 0 for document-level steps
 * @param total Total number of pages (0 while unknown)
 * @param status Brief status message (e.g. "Cropping...", "Scaling page...")
 */
using ProgressCallback = std::function<void(int current, int total, const QString& status)>;

// =============================================================================
// Functions
// =============================================================================

/**
 * @brief Machine-readable mode name ("trim", "fit", "trimfit").
 */
QString modeName(Mode mode);

/**
 * @brief Inner canvas left for content: size minus a margin on each side.
 */
QSizeF innerCanvas(const QSizeF& sizeInches, qreal marginInches);

/**
 * @brief Validate the size and margin of a fit run.
 * @return Success, or InvalidSize, InvalidMargin, MarginTooLarge
 */
OperationResult validateGeometry(const QSizeF& sizeInches, qreal marginInches);

/**
 * @brief Validate the input and output paths of a run.
 *
 * Creates the output's parent directory if needed.
 *
 * @param inputPath Absolute input path
 * @param outputPath Absolute output path
 * @return Success, or FileNotFound, InvalidInput
 */
OperationResult validatePaths(const QString& inputPath, const QString& outputPath);

/**
 * @brief Normalize a PDF according to options.
 *
 * All validation happens before any page is touched: geometry (fit modes),
 * input/output paths, then layout tool availability (fit modes). Scratch files
 * live in a temporary directory removed when the run ends, whatever the
 * outcome.
 *
 * @param options Run parameters
 * @param tool Layout tool for fit modes (may be nullptr in Trim mode)
 * @param progress Optional progress callback
 * @return PipelineResult; the first error aborts the run
 */
PipelineResult normalizePdf(const TrimFitOptions& options,
                            LayoutTool* tool,
                            ProgressCallback progress = nullptr);

/**
 * @brief Normalize a PDF using a PdfjamLayoutTool for options.layoutProgram.
 */
PipelineResult normalizePdf(const TrimFitOptions& options,
                            ProgressCallback progress = nullptr);

} // namespace TrimFit

#endif // TRIMFITPIPELINE_H
