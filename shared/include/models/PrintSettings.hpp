/**
 * @file PrintSettings.hpp
 * User-facing print parameters in physical units. Defaults produce 3x3 sheets of
 * standard 63.5 x 88.9 mm cards on US Letter paper at 1200 DPI.
 */
#pragma once

struct PrintSettings
{
    // Card and paper geometry
    double cardWidthMm {63.5};
    double cardHeightMm {88.9};
    double paperWidthIn {8.5};
    double paperHeightIn {11.0};
    int dpi {1200};

    // Desired printed black border per side
    double borderTopMm {3.0};
    double borderLeftMm {3.0};
    double borderRightMm {3.0};
    double borderBottomMm {4.1};

    // Extended art: offset below the content top where side content is measured
    double extendedArtScanOffsetMm {3.0};

    // Pixels trimmed from the bottom of borderless art; 0 = no trim
    int fullArtBottomCropPx {80};

    // Detection
    int blackThreshold {50};   // B, G, R all <= this is border
    int edgeCheckWidthPx {10};
    bool forceStandard {false};

    // Enhancement (1.0 = unchanged)
    double brightness {1.0};
    double saturation {1.0};

    // Cut guides
    int lineWidthPx {4};
    int lineColorR {255};
    int lineColorG {51};
    int lineColorB {153};
};
