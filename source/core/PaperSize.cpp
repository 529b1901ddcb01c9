#include "PaperSize.h"

#include <QCoreApplication>
#include <QDebug>

#include <cmath>

/**
 * @file PaperSize.cpp
 * @brief Implementation of size string resolution.
 *
 * @see PaperSize.h for API documentation
 */

namespace PaperSize {

namespace {

struct PaperEntry {
    const char* name;
    qreal widthPt;
    qreal heightPt;
};

// Native orientation of each entry is as listed (ledger is landscape).
const PaperEntry kRegistry[] = {
    {"a0", 2384, 3370},  {"a1", 1684, 2384},  {"a2", 1191, 1684},
    {"a3", 842, 1191},   {"a4", 595, 842},    {"a5", 420, 595},
    {"a6", 298, 420},    {"a7", 210, 298},    {"a8", 147, 210},
    {"a9", 105, 147},    {"a10", 74, 105},
    {"b0", 2835, 4008},  {"b1", 2004, 2835},  {"b2", 1417, 2004},
    {"b3", 1001, 1417},  {"b4", 709, 1001},   {"b5", 499, 709},
    {"b6", 354, 499},    {"b7", 249, 354},    {"b8", 176, 249},
    {"b9", 125, 176},    {"b10", 88, 125},
    {"c0", 2599, 3677},  {"c1", 1837, 2599},  {"c2", 1298, 1837},
    {"c3", 918, 1298},   {"c4", 649, 918},    {"c5", 459, 649},
    {"c6", 323, 459},    {"c7", 230, 323},    {"c8", 162, 230},
    {"c9", 113, 162},    {"c10", 79, 113},
    {"card-4x6", 288, 432},
    {"card-5x7", 360, 504},
    {"commercial", 297, 684},
    {"executive", 522, 756},
    {"invoice", 396, 612},
    {"ledger", 1224, 792},
    {"legal", 612, 1008},
    {"legal-13", 612, 936},
    {"letter", 612, 792},
    {"monarch", 279, 540},
    {"tabloid-extra", 864, 1296},
};

QString tr(const char* text)
{
    return QCoreApplication::translate("PaperSize", text);
}

QString canonicalName(const QString& lowerName)
{
    if (lowerName == QLatin1String("tabloid")) {
        return QStringLiteral("ledger");
    }
    return lowerName;
}

} // namespace

bool lookupPoints(const QString& name, QSizeF& points)
{
    for (const PaperEntry& entry : kRegistry) {
        if (name == QLatin1String(entry.name)) {
            points = QSizeF(entry.widthPt, entry.heightPt);
            return true;
        }
    }
    return false;
}

QStringList knownNames()
{
    QStringList names;
    for (const PaperEntry& entry : kRegistry) {
        names << QString::fromLatin1(entry.name);
    }
    names.sort();
    return names;
}

SizeResult resolve(const QString& spec, bool landscape, bool portrait)
{
    SizeResult result;

    if (landscape && portrait) {
        result.fail(TrimFit::ErrorKind::ConflictingOptions,
                    tr("--landscape and --portrait are mutually exclusive"));
        return result;
    }

    const QString low = spec.trimmed().toLower();
    const QString name = canonicalName(low);

    // Registry names win over the WxH rule so "card-4x6" stays a name.
    QSizeF points;
    if (lookupPoints(name, points)) {
        qreal longSide = qMax(points.width(), points.height());
        qreal shortSide = qMin(points.width(), points.height());
        if (landscape) {
            points = QSizeF(longSide, shortSide);
        } else if (portrait) {
            points = QSizeF(shortSide, longSide);
        }

        result.inches = QSizeF(points.width() / PointsPerInch,
                               points.height() / PointsPerInch);
        result.success = true;
        qDebug() << "[PaperSize] Resolved" << spec << "to" << result.inches << "inches";
        return result;
    }

    if (low.contains(QLatin1Char('x'))) {
        const QStringList parts = low.split(QLatin1Char('x'));
        bool widthOk = false;
        bool heightOk = false;
        double width = 0.0;
        double height = 0.0;
        if (parts.size() == 2) {
            width = parts[0].trimmed().toDouble(&widthOk);
            height = parts[1].trimmed().toDouble(&heightOk);
        }

        if (!widthOk || !heightOk || !std::isfinite(width) || !std::isfinite(height)) {
            result.fail(TrimFit::ErrorKind::InvalidSize,
                        tr("Invalid size '%1'. Expected WIDTHxHEIGHT (e.g., '8.5x11') "
                           "or a paper name (e.g., 'letter')").arg(spec));
            return result;
        }

        if (width <= 0.0 || height <= 0.0) {
            result.fail(TrimFit::ErrorKind::InvalidSize,
                        tr("Invalid size '%1'. Width and height must be positive").arg(spec));
            return result;
        }

        if (landscape || portrait) {
            result.fail(TrimFit::ErrorKind::ConflictingOptions,
                        tr("--landscape/--portrait cannot be used with explicit WxH dimensions"));
            return result;
        }

        result.inches = QSizeF(width, height);
        result.success = true;
        return result;
    }

    result.fail(TrimFit::ErrorKind::UnknownPaperSize,
                tr("Unknown paper size '%1'. Use WIDTHxHEIGHT or a paper name "
                   "(e.g., 'letter', 'a4')").arg(spec));
    return result;
}

} // namespace PaperSize
