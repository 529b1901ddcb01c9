#pragma once

// ============================================================================
// PaperSizeTests - Unit tests for size string resolution
// ============================================================================
// Tests:
// - Named sizes and orientation
// - tabloid alias
// - Explicit WIDTHxHEIGHT parsing and rejection
// - Names containing 'x'
// ============================================================================

#include "PaperSize.h"
#include <QDebug>

#include <cmath>

namespace PaperSizeTests {

inline bool sameSize(const QSizeF& a, const QSizeF& b)
{
    return std::abs(a.width() - b.width()) < 1e-9 && std::abs(a.height() - b.height()) < 1e-9;
}

/**
 * @brief Test named sizes with and without orientation flags.
 */
inline bool testNamedSizes()
{
    qDebug() << "=== Test: Named Sizes ===";
    bool success = true;

    // letter is 612x792 pt = 8.5x11 in
    {
        PaperSize::SizeResult r = PaperSize::resolve("letter");
        if (!r.success || !sameSize(r.inches, QSizeF(8.5, 11))) {
            qDebug() << "FAIL: letter should be 8.5x11, got" << r.inches << r.errorMessage;
            success = false;
        } else {
            qDebug() << "  - letter: OK";
        }
    }

    // Case-insensitive
    {
        PaperSize::SizeResult r = PaperSize::resolve("LeTtEr");
        if (!r.success || !sameSize(r.inches, QSizeF(8.5, 11))) {
            qDebug() << "FAIL: names should be case-insensitive";
            success = false;
        } else {
            qDebug() << "  - Case insensitivity: OK";
        }
    }

    // Landscape swaps a portrait size
    {
        PaperSize::SizeResult r = PaperSize::resolve("letter", true, false);
        if (!r.success || !sameSize(r.inches, QSizeF(11, 8.5))) {
            qDebug() << "FAIL: letter landscape should be 11x8.5, got" << r.inches;
            success = false;
        } else {
            qDebug() << "  - letter landscape: OK";
        }
    }

    // Portrait keeps a portrait size
    {
        PaperSize::SizeResult r = PaperSize::resolve("letter", false, true);
        if (!r.success || !sameSize(r.inches, QSizeF(8.5, 11))) {
            qDebug() << "FAIL: letter portrait should be 8.5x11";
            success = false;
        } else {
            qDebug() << "  - letter portrait: OK";
        }
    }

    // a4 is 595x842 pt
    {
        PaperSize::SizeResult r = PaperSize::resolve("a4");
        if (!r.success || !sameSize(r.inches, QSizeF(595 / 72.0, 842 / 72.0))) {
            qDebug() << "FAIL: a4 should be 595x842 pt, got" << r.inches;
            success = false;
        } else {
            qDebug() << "  - a4: OK";
        }
    }

    // ledger is natively landscape; portrait turns it upright
    {
        PaperSize::SizeResult native = PaperSize::resolve("ledger");
        PaperSize::SizeResult upright = PaperSize::resolve("ledger", false, true);
        if (!native.success || !sameSize(native.inches, QSizeF(17, 11))) {
            qDebug() << "FAIL: ledger should be 17x11, got" << native.inches;
            success = false;
        } else if (!upright.success || !sameSize(upright.inches, QSizeF(11, 17))) {
            qDebug() << "FAIL: ledger portrait should be 11x17, got" << upright.inches;
            success = false;
        } else {
            qDebug() << "  - ledger orientation: OK";
        }
    }

    // Unknown name
    {
        PaperSize::SizeResult r = PaperSize::resolve("foolscap-royal");
        if (r.success || r.error != TrimFit::ErrorKind::UnknownPaperSize) {
            qDebug() << "FAIL: unknown name should fail with UnknownPaperSize";
            success = false;
        } else {
            qDebug() << "  - Unknown name rejected: OK";
        }
    }

    return success;
}

/**
 * @brief tabloid resolves exactly like ledger, with any orientation.
 */
inline bool testTabloidAlias()
{
    qDebug() << "=== Test: tabloid Alias ===";
    bool success = true;

    const bool flags[3][2] = {{false, false}, {true, false}, {false, true}};
    for (const auto& f : flags) {
        PaperSize::SizeResult tabloid = PaperSize::resolve("Tabloid", f[0], f[1]);
        PaperSize::SizeResult ledger = PaperSize::resolve("ledger", f[0], f[1]);
        if (!tabloid.success || !ledger.success || !sameSize(tabloid.inches, ledger.inches)) {
            qDebug() << "FAIL: tabloid != ledger for landscape" << f[0] << "portrait" << f[1];
            success = false;
        }
    }

    if (success) {
        qDebug() << "  - tabloid == ledger: OK";
    }
    return success;
}

/**
 * @brief Test explicit WIDTHxHEIGHT strings.
 */
inline bool testExplicitDimensions()
{
    qDebug() << "=== Test: Explicit Dimensions ===";
    bool success = true;

    {
        PaperSize::SizeResult r = PaperSize::resolve("8.5x11");
        if (!r.success || !sameSize(r.inches, QSizeF(8.5, 11))) {
            qDebug() << "FAIL: 8.5x11 should parse";
            success = false;
        } else {
            qDebug() << "  - 8.5x11: OK";
        }
    }

    {
        PaperSize::SizeResult r = PaperSize::resolve("6X4");
        if (!r.success || !sameSize(r.inches, QSizeF(6, 4))) {
            qDebug() << "FAIL: upper-case separator should parse, got" << r.errorMessage;
            success = false;
        } else {
            qDebug() << "  - 6X4 (dimensions kept as given): OK";
        }
    }

    // Orientation flags conflict with explicit dimensions
    {
        PaperSize::SizeResult l = PaperSize::resolve("8.5x11", true, false);
        PaperSize::SizeResult p = PaperSize::resolve("8.5x11", false, true);
        if (l.error != TrimFit::ErrorKind::ConflictingOptions ||
            p.error != TrimFit::ErrorKind::ConflictingOptions) {
            qDebug() << "FAIL: orientation with WxH should be ConflictingOptions";
            success = false;
        } else {
            qDebug() << "  - WxH + orientation rejected: OK";
        }
    }

    // Malformed or non-positive dimensions
    const char* invalid[] = {"axb", "8.5x", "x11", "1x2x3", "0x11", "-8.5x11", "infx11", "nanx2"};
    for (const char* spec : invalid) {
        PaperSize::SizeResult r = PaperSize::resolve(spec);
        if (r.success || r.error != TrimFit::ErrorKind::InvalidSize) {
            qDebug() << "FAIL:" << spec << "should fail with InvalidSize";
            success = false;
        }
    }
    if (success) {
        qDebug() << "  - Malformed dimensions rejected: OK";
    }

    // Both flags at once
    {
        PaperSize::SizeResult r = PaperSize::resolve("letter", true, true);
        if (r.error != TrimFit::ErrorKind::ConflictingOptions) {
            qDebug() << "FAIL: landscape + portrait should be ConflictingOptions";
            success = false;
        } else {
            qDebug() << "  - landscape + portrait rejected: OK";
        }
    }

    return success;
}

/**
 * @brief Registry names that contain 'x' are names, not dimensions.
 */
inline bool testNamesContainingX()
{
    qDebug() << "=== Test: Names Containing 'x' ===";
    bool success = true;

    {
        PaperSize::SizeResult r = PaperSize::resolve("tabloid-extra");
        if (!r.success || !sameSize(r.inches, QSizeF(12, 18))) {
            qDebug() << "FAIL: tabloid-extra should be 12x18, got" << r.inches << r.errorMessage;
            success = false;
        } else {
            qDebug() << "  - tabloid-extra: OK";
        }
    }

    {
        PaperSize::SizeResult r = PaperSize::resolve("card-4x6", true, false);
        if (!r.success || !sameSize(r.inches, QSizeF(6, 4))) {
            qDebug() << "FAIL: card-4x6 landscape should be 6x4, got" << r.inches;
            success = false;
        } else {
            qDebug() << "  - card-4x6 landscape: OK";
        }
    }

    if (!PaperSize::knownNames().contains("card-5x7")) {
        qDebug() << "FAIL: knownNames() should list card-5x7";
        success = false;
    }

    return success;
}

/**
 * @brief Run all paper size tests.
 * @return true if all tests pass
 */
inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running PaperSize Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testNamedSizes();
    qDebug() << "";

    allPass &= testTabloidAlias();
    qDebug() << "";

    allPass &= testExplicitDimensions();
    qDebug() << "";

    allPass &= testNamesContainingX();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace PaperSizeTests
