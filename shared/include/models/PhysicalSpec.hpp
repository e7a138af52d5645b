/**
 * @file PhysicalSpec.hpp
 * Pixel constants derived once from PrintSettings. Every component receives this by
 * const reference; nothing reads ambient configuration.
 */
#pragma once
#include "models/PrintSettings.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

struct PhysicalSpec
{
    int dpi {0};

    int cardWidthPx {0};
    int cardHeightPx {0};

    int borderTopPx {0};
    int borderLeftPx {0};
    int borderRightPx {0};
    int borderBottomPx {0};

    int extendedArtScanOffsetPx {0};
    int fullArtBottomCropPx {0};

    int paperWidthPx {0};
    int paperHeightPx {0};
    int marginX {0};
    int marginY {0};

    int blackThreshold {50};
    int edgeCheckWidthPx {10};
    bool forceStandard {false};
    double brightness {1.0};
    double saturation {1.0};

    int lineWidthPx {4};
    int lineColorR {255};
    int lineColorG {51};
    int lineColorB {153};

    // Top-left pixel of a grid cell on the page.
    int cellX(int col) const { return marginX + col * cardWidthPx; }
    int cellY(int row) const { return marginY + row * cardHeightPx; }
};

inline int mmToPx(double mm, int dpi)
{
    return static_cast<int>(std::lround(mm / 25.4 * dpi));
}

inline PhysicalSpec makePhysicalSpec(const PrintSettings& s)
{
    PhysicalSpec p;
    p.dpi = s.dpi;
    p.cardWidthPx = mmToPx(s.cardWidthMm, s.dpi);
    p.cardHeightPx = mmToPx(s.cardHeightMm, s.dpi);
    p.borderTopPx = mmToPx(s.borderTopMm, s.dpi);
    p.borderLeftPx = mmToPx(s.borderLeftMm, s.dpi);
    p.borderRightPx = mmToPx(s.borderRightMm, s.dpi);
    p.borderBottomPx = mmToPx(s.borderBottomMm, s.dpi);
    p.extendedArtScanOffsetPx = mmToPx(s.extendedArtScanOffsetMm, s.dpi);
    p.fullArtBottomCropPx = s.fullArtBottomCropPx;

    p.paperWidthPx = static_cast<int>(std::lround(s.paperWidthIn * s.dpi));
    p.paperHeightPx = static_cast<int>(std::lround(s.paperHeightIn * s.dpi));
    p.marginX = (p.paperWidthPx - 3 * p.cardWidthPx) / 2;
    p.marginY = (p.paperHeightPx - 3 * p.cardHeightPx) / 2;
    if (p.marginX < 0 || p.marginY < 0)
    {
        std::cerr << "[makePhysicalSpec] WARNING: card grid exceeds paper size at "
                  << s.dpi << " DPI, clamping margins to 0\n";
        p.marginX = std::max(0, p.marginX);
        p.marginY = std::max(0, p.marginY);
    }

    p.blackThreshold = s.blackThreshold;
    p.edgeCheckWidthPx = s.edgeCheckWidthPx;
    p.forceStandard = s.forceStandard;
    p.brightness = s.brightness;
    p.saturation = s.saturation;
    p.lineWidthPx = s.lineWidthPx;
    p.lineColorR = s.lineColorR;
    p.lineColorG = s.lineColorG;
    p.lineColorB = s.lineColorB;
    return p;
}
