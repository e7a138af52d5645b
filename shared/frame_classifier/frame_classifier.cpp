#include "frame_classifier.hpp"
#include "util/ImageOps.hpp"

#include <opencv2/opencv.hpp>
#include <algorithm>

FrameZones describeZones(int imageHeight, int edgeWidth)
{
    FrameZones z;
    int h = std::max(0, imageHeight);
    int minZone = std::max(1, edgeWidth > 0 ? edgeWidth / 2 : 1);

    z.topHeight = std::min(h, std::max(minZone, static_cast<int>(h * 0.05)));

    int midTop = static_cast<int>(h * 0.50);
    int midBot = static_cast<int>(h * 0.60);
    z.middleHeight = std::min(h, std::max(minZone, midBot - midTop));
    if (midTop + z.middleHeight > h)
        midTop = std::max(0, h - z.middleHeight);
    z.middleTop = midTop;
    return z;
}

FrameType classifyFrame(const cv::Mat& img, int threshold, int edgeWidth)
{
    if (img.empty() || img.rows < kMinClassifiableHeight) return FrameType::Borderless;

    FrameZones z = describeZones(img.rows, edgeWidth);
    cv::Mat topZone = img.rowRange(0, z.topHeight);
    cv::Mat middleZone = img.rowRange(z.middleTop, z.middleTop + z.middleHeight);

    bool topSolid = util::isSolidLRBorder(topZone, edgeWidth, threshold);
    if (!topSolid) return FrameType::Borderless;

    bool middleSolid = util::isSolidLRBorder(middleZone, edgeWidth, threshold);
    return middleSolid ? FrameType::Standard : FrameType::ExtendedArt;
}
