/**
 * @file RenderReport.hpp
 * Outcome tags for one card render, so callers can tell which detection and
 * fallback paths were taken.
 */
#pragma once
#include "models/FrameType.hpp"

enum class SideScan
{
    NotApplicable = 0,      // not extended art
    RowExtent = 1,          // side extent measured on the scan row
    RowEmptyFallback = 2,   // scan row had no content, overall box used
    OutOfBoundsFallback = 3,// scan row below the image, overall box used
    NoContentBox = 4,       // no overall content, full image used
};

enum class CropPath
{
    Proportional = 0,
    ContentBoxFallback = 1,
    FullImageFallback = 2,
    BottomTrim = 3,
    BottomTrimClamped = 4,
    Untrimmed = 5,
    OriginalResizeFallback = 6,
};

struct CropRect
{
    int x {0};
    int y {0};
    int width {0};
    int height {0};
};

struct RenderReport
{
    FrameType frameType {FrameType::Standard};
    bool forcedStandard {false};
    bool contentFound {false};
    SideScan sideScan {SideScan::NotApplicable};
    CropPath cropPath {CropPath::Proportional};
    CropRect crop;
    int preResizeWidth {0};
    int preResizeHeight {0};
};
