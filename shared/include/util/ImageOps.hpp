#pragma once
#include <opencv2/opencv.hpp>

namespace util {

// Convert any loaded image to the canonical 8-bit BGRA layout used by every component
cv::Mat toCanonical(const cv::Mat& img);

// 8-bit mask, 255 where any of B, G, R exceeds the threshold (alpha ignored)
cv::Mat contentMask(const cv::Mat& img, int threshold);

// Tightest half-open box around content pixels; false if there are none
bool findContentBounds(const cv::Mat& img, int threshold, cv::Rect& box);

// First/last content column on one row (both inclusive); false if the row has none.
// Throws std::out_of_range when rowY is outside the image.
bool findRowExtent(const cv::Mat& img, int rowY, int threshold, int& startX, int& endX);

// True when the leftmost and rightmost edgeWidth columns are background over the whole strip
bool isSolidLRBorder(const cv::Mat& strip, int edgeWidth, int threshold);

// Resize to an exact size: INTER_AREA on shrinking axes, Lanczos on growing ones
cv::Mat resizeTo(const cv::Mat& img, const cv::Size& size);

// Map a fractional source region exactly onto an image of the given size.
// Throws std::invalid_argument when the region does not overlap the image.
cv::Mat cropResizeExact(const cv::Mat& img, const cv::Rect2d& region, const cv::Size& size);

// Scale colour channels by factor; alpha untouched
cv::Mat adjustBrightness(const cv::Mat& img, double factor);

// Blend colour channels with their luma by factor; alpha untouched
cv::Mat adjustSaturation(const cv::Mat& img, double factor);

// Alpha-composite src onto dst at origin, clipped to dst bounds
void alphaPaste(cv::Mat& dst, const cv::Mat& src, const cv::Point& origin);

}
