#pragma once

// ============================================================================
// Cropper - Trims every page of a PDF to its visible content
// ============================================================================
// For each page the visible region is detected and written as the page's
// CropBox. Page content streams, resources and MediaBox are left untouched,
// so the operation is lossless and reversible by removing the CropBox.
// ============================================================================

#include "../core/TrimFitError.h"

#include <QString>

class MuPdfDocument;

namespace Cropper {

/**
 * @brief Result of a crop operation.
 */
struct CropResult : TrimFit::OperationResult {
    int pageCount = 0;  ///< Number of pages cropped
};

/**
 * @brief Set the CropBox of every page of an open document.
 * @param document Document to modify in place
 * @return CropResult; IOError if a page cannot be read or modified
 */
CropResult cropDocument(MuPdfDocument& document);

/**
 * @brief Crop every page of a PDF file and save the result.
 * @param inputPath Source PDF
 * @param outputPath Destination PDF (must differ from inputPath)
 * @return CropResult; IOError if the input cannot be opened or the output
 *         cannot be written
 */
CropResult cropToContent(const QString& inputPath, const QString& outputPath);

} // namespace Cropper
