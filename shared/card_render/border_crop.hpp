/*========================  border_crop.hpp  ========================

   Crop planning for the card renderer.
   --------------------------------------------------------------------
   • resolve the artwork extent (overall content box, or the side scan
     row for extended art)
   • expand it by back-projected target borders (kept fractional) so
     the resize to the card size yields the configured border on every side
   • fixed bottom trim for borderless (full-bleed) art

=====================================================================*/
#pragma once
#include "models/FrameType.hpp"
#include "models/PhysicalSpec.hpp"
#include "models/RenderReport.hpp"

#include <opencv2/core.hpp>

struct CropPlan
{
    cv::Rect rect;                 // whole source pixels covering `exact`
    cv::Rect2d exact;              // fractional crop, used by the proportional path
    CropPath path {CropPath::Proportional};
};

/**
 * @brief Effective artwork extent of a card image (half-open box).
 *
 * Starts from the overall content box, or the full image when no content pixel exists.
 * For ExtendedArt the horizontal extent is re-measured on the row
 * `contentTop + spec.extendedArtScanOffsetPx`; an empty or out-of-range row keeps the
 * overall box.
 *
 * @param contentFound  set to whether an overall content box was found.
 * @param scan          set to the side scan path taken.
 */
cv::Rect resolveContentExtents(const cv::Mat& img, FrameType type, const PhysicalSpec& spec,
                               bool& contentFound, SideScan& scan);

/**
 * @brief Crop rectangle that, once resized to the card size, leaves exactly the target
 *        border widths around the content box.
 *
 * Falls back to the raw content box, then to the full image, when the expanded rectangle
 * is degenerate.
 */
CropPlan planBorderCrop(const cv::Size& imgSize, const cv::Rect& content, const PhysicalSpec& spec);

// Fallback when the proportional crop is degenerate: the content box if it lies inside
// the image, otherwise the full image.
CropPlan planContentFallback(const cv::Size& imgSize, const cv::Rect& content);

// Remove trimPx rows from the bottom; never less than one row remains.
CropPlan planBottomTrim(const cv::Size& imgSize, int trimPx);

/**
 * @brief Crops img by plan and resizes the result to target.
 *
 * The proportional path maps `plan.exact` onto the card with sub-pixel precision; the
 * other paths crop `plan.rect` and resize. If the crop cannot be applied the untouched
 * image is resized instead and `plan` is rewritten to OriginalResizeFallback.
 */
cv::Mat applyCropPlan(const cv::Mat& img, CropPlan& plan, const cv::Size& target);
