#ifndef PAPERSIZE_H
#define PAPERSIZE_H

/**
 * @file PaperSize.h
 * @brief Resolution of output page size strings.
 *
 * A size string is either explicit dimensions in inches
 * ("8.5x11") or a paper name ("letter", "A4", "tabloid") with an optional
 * orientation. Named sizes come from a fixed registry in PDF points.
 */

#include "TrimFitError.h"

#include <QSizeF>
#include <QString>
#include <QStringList>

namespace PaperSize {

/// PDF points per inch.
constexpr qreal PointsPerInch = 72.0;

/**
 * @brief Result of resolving a size string.
 */
struct SizeResult : TrimFit::OperationResult {
    QSizeF inches;  ///< Resolved (width, height) in inches
};

/**
 * @brief Resolve a size string to (width, height) in inches.
 *
 * Rules:
 * - A registry name (case-insensitive, "tabloid" aliases "ledger") resolves to
 *   its registry size. landscape forces width > height, portrait forces
 *   height > width, neither keeps the registry orientation.
 * - Otherwise a string containing 'x' is parsed as WIDTHxHEIGHT inches.
 *   Orientation flags are rejected with explicit dimensions.
 *
 * @param spec Size string, e.g. "letter", "a4", "8.5x11"
 * @param landscape Force landscape orientation (names only)
 * @param portrait Force portrait orientation (names only)
 * @return SizeResult with inches on success; InvalidSize, ConflictingOptions
 *         or UnknownPaperSize on failure
 */
SizeResult resolve(const QString& spec, bool landscape = false, bool portrait = false);

/**
 * @brief Look up a paper name in the registry.
 * @param name Lower-case registry name (aliases are not applied)
 * @param points Receives the registry size in points
 * @return true if the name is known
 */
bool lookupPoints(const QString& name, QSizeF& points);

/**
 * @brief All registry names, sorted.
 */
QStringList knownNames();

} // namespace PaperSize

#endif // PAPERSIZE_H
